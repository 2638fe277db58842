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

#define ZC_LOG_TAG "RESPONDER"

#include "mdns/responder.hpp"

#include <algorithm>
#include <sstream>

#include "common/logging.hpp"

namespace zc {

namespace Mdns {

namespace {

/**
 * This function appends the published entries of @p aEntries which are in neither @p aList nor @p aExcluded.
 */
void AppendPublished(const EntryList &aEntries, const EntryList &aExcluded, EntryList &aList)
{
    for (const EntryPtr &entry : aEntries)
    {
        auto isSame = [&entry](const EntryPtr &aOther) { return aOther->IsSameRecord(*entry); };

        if (!entry->mPublish || std::any_of(aList.begin(), aList.end(), isSame) ||
            std::any_of(aExcluded.begin(), aExcluded.end(), isSame))
        {
            continue;
        }

        aList.push_back(entry);
    }
}

} // namespace

Counters::Counters(void)
    : mQuestionsReceived(0)
    , mResponsesBuilt(0)
    , mAnswersIngested(0)
    , mDecodeFailures(0)
    , mEncodeFailures(0)
    , mSocketErrors(0)
    , mRestarts(0)
{
}

std::string Counters::ToString(void) const
{
    std::ostringstream stream;

    stream << "questions=" << mQuestionsReceived.load() << " responses=" << mResponsesBuilt.load()
           << " answers=" << mAnswersIngested.load() << " decode-failures=" << mDecodeFailures.load()
           << " encode-failures=" << mEncodeFailures.load() << " socket-errors=" << mSocketErrors.load()
           << " restarts=" << mRestarts.load();

    return stream.str();
}

Responder::Responder(Zone &aZone)
    : mZone(aZone)
{
}

zcError Responder::HandleMessage(const Dns::Message &aMessage, const SocketAddress &aSource, Dns::Message &aResponse)
{
    zcError error = ZC_ERROR_NOT_FOUND;

    if (aMessage.IsQuestion())
    {
        mCounters.mQuestionsReceived++;
        error = HandleQuestion(aMessage, aResponse);
        zcLogDebug("Question from %s: %s", aSource.ToString().c_str(), zcErrorString(error));
    }
    else
    {
        HandleAnswer(aMessage, aSource);
    }

    return error;
}

zcError Responder::HandleQuestion(const Dns::Message &aQuery, Dns::Message &aResponse)
{
    zcError   error = ZC_ERROR_NONE;
    EntryList answers;
    EntryList additionals;

    aResponse.Clear();

    for (const Dns::Question &question : aQuery.mQuestions)
    {
        EntryList found;
        EntryList foundAdditionals;

        mZone.QueryAdditional(question, found, foundAdditionals);
        AppendPublished(found, EntryList(), answers);
        AppendPublished(foundAdditionals, answers, additionals);
    }

    VerifyOrExit(!answers.empty(), error = ZC_ERROR_NOT_FOUND);

    // A later question may have answered a record collected as additional.
    additionals.erase(std::remove_if(additionals.begin(), additionals.end(),
                                     [&answers](const EntryPtr &aAdditional) {
                                         return std::any_of(answers.begin(), answers.end(),
                                                            [&aAdditional](const EntryPtr &aAnswer) {
                                                                return aAnswer->IsSameRecord(*aAdditional);
                                                            });
                                     }),
                      additionals.end());

    aResponse.mId            = aQuery.mId;
    aResponse.mResponse      = true;
    aResponse.mAuthoritative = true;

    for (const EntryPtr &entry : answers)
    {
        aResponse.mAnswers.push_back(entry->mRecord);
    }

    for (const EntryPtr &entry : additionals)
    {
        aResponse.mAdditionals.push_back(entry->mRecord);
    }

    mCounters.mResponsesBuilt++;

exit:
    return error;
}

void Responder::HandleAnswer(const Dns::Message &aMessage, const SocketAddress &aSource)
{
    Timepoint now = Clock::now();

    for (const Dns::ResourceRecord &record : aMessage.mAnswers)
    {
        mZone.Add(std::make_shared<Entry>(record, /* aPublish */ false, GetExpiry(now, record.mTtl), aSource));
        mCounters.mAnswersIngested++;
    }

    zcLogDebug("Ingested %zu answers from %s", aMessage.mAnswers.size(), aSource.ToString().c_str());
}

} // namespace Mdns

} // namespace zc
