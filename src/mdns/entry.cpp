/*
 *    Copyright (c) 2026, The OpenThread Authors.
 *    All rights reserved.
 *
 *    Redistribution and use in source and binary forms, with or without
 *    modification, are permitted provided that the following conditions are met:
 *    1. Redistributions of source code must retain the above copyright
 *       notice, this list of conditions and the following disclaimer.
 *    2. Redistributions in binary form must reproduce the above copyright
 *       notice, this list of conditions and the following disclaimer in the
 *       documentation and/or other materials provided with the distribution.
 *    3. Neither the name of the copyright holder nor the
 *       names of its contributors may be used to endorse or promote products
 *       derived from this software without specific prior written permission.
 *
 *    THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 *    AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 *    IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 *    ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 *    LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 *    CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 *    SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 *    INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 *    CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 *    ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 *    POSSIBILITY OF SUCH DAMAGE.
 */

#include "mdns/entry.hpp"

#include <sstream>

#include "utils/dns_utils.hpp"

namespace zc {

namespace Mdns {

Entry::Entry(void)
    : mPublish(false)
{
}

Entry::Entry(Dns::ResourceRecord aRecord, bool aPublish, Timepoint aExpires, const SocketAddress &aSource)
    : mExpires(aExpires)
    , mPublish(aPublish)
    , mRecord(std::move(aRecord))
    , mSource(aSource)
{
}

std::string Entry::GetName(void) const
{
    return GetFullName().substr(0, GetFullName().find('.'));
}

std::string Entry::GetDomain(void) const
{
    return DnsUtils::SplitFullDnsName(GetFullName()).mDomain;
}

std::string Entry::GetType(void) const
{
    return DnsUtils::SplitFullDnsName(GetFullName()).mServiceName;
}

bool Entry::IsSameRecord(const Entry &aOther) const
{
    return GetFullName() == aOther.GetFullName() && mRecord.HasSameData(aOther.mRecord);
}

bool Entry::Covers(const Entry &aOther) const
{
    return GetFullName() == aOther.GetFullName() &&
           (mRecord.mType == Dns::kTypeAny || mRecord.HasSameData(aOther.mRecord));
}

std::string Entry::ToString(void) const
{
    std::ostringstream stream;

    stream << (mPublish ? "published " : "learned ") << mRecord.ToString();

    if (mSource.IsValid())
    {
        stream << " from " << mSource.ToString();
    }

    return stream.str();
}

Query::Query(Dns::Question aQuestion, std::shared_ptr<EntrySink> aResult)
    : mQuestion(std::move(aQuestion))
    , mResult(std::move(aResult))
{
}

bool Query::Matches(const Entry &aEntry) const
{
    bool typeMatches = (mQuestion.mType == Dns::kTypeAny || mQuestion.mType == aEntry.mRecord.mType);
    bool nameMatches = (mQuestion.mName.empty() || mQuestion.mName == aEntry.GetFullName());

    return typeMatches && nameMatches;
}

} // namespace Mdns

} // namespace zc
