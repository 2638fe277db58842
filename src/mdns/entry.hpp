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

/**
 * @file
 *   This file includes definitions for zone entries and the queries matching them.
 */

#ifndef ZC_MDNS_ENTRY_HPP_
#define ZC_MDNS_ENTRY_HPP_

#include "zeroconf/config.h"

#include <memory>
#include <string>
#include <vector>

#include "common/time.hpp"
#include "common/types.hpp"
#include "dns/dns_message.hpp"
#include "utils/concurrent_queue.hpp"

namespace zc {

namespace Mdns {

/**
 * This class represents a resource record held by a zone.
 *
 * An entry is either published (answered on behalf of this node) or learned from an answer seen on the wire.
 * Entries are immutable once handed to a zone.
 */
class Entry
{
public:
    Entry(void);

    /**
     * Constructor.
     *
     * @param[in] aRecord   The resource record.
     * @param[in] aPublish  Whether the record is answered on behalf of this node.
     * @param[in] aExpires  The time point at which the record expires.
     * @param[in] aSource   The sender of a learned record.
     */
    Entry(Dns::ResourceRecord aRecord, bool aPublish, Timepoint aExpires, const SocketAddress &aSource = SocketAddress());

    /**
     * This method returns the owner name of the record, e.g. `foo._ssh._tcp.local.`.
     */
    const std::string &GetFullName(void) const { return mRecord.mName; }

    /**
     * This method returns the first label of the owner name, e.g. `foo`.
     */
    std::string GetName(void) const;

    /**
     * This method returns the domain of the owner name, e.g. `local.`.
     */
    std::string GetDomain(void) const;

    /**
     * This method returns the service type of the owner name, e.g. `_ssh._tcp`, or an empty string for a host name.
     */
    std::string GetType(void) const;

    /**
     * This method indicates whether @p aOther holds the same record: same owner name, type and data.
     */
    bool IsSameRecord(const Entry &aOther) const;

    /**
     * This method indicates whether this entry designates @p aOther, either as the same record or, for an entry of
     * type ANY, as any record with the same owner name.
     */
    bool Covers(const Entry &aOther) const;

    /**
     * This method indicates whether a learned entry has expired at @p aNow. Published entries never expire.
     */
    bool IsExpired(Timepoint aNow) const { return !mPublish && mExpires <= aNow; }

    std::string ToString(void) const;

    Timepoint           mExpires;
    bool                mPublish;
    Dns::ResourceRecord mRecord;
    SocketAddress       mSource;
};

typedef std::shared_ptr<const Entry>     EntryPtr;
typedef std::vector<EntryPtr>            EntryList;
typedef Utils::ConcurrentQueue<EntryPtr> EntrySink;

/**
 * This class represents a question paired with the sink receiving its matching entries.
 */
class Query
{
public:
    /**
     * Constructor.
     *
     * @param[in] aQuestion  The question, an empty name matches every name.
     * @param[in] aResult    The sink receiving the matching entries.
     */
    Query(Dns::Question aQuestion, std::shared_ptr<EntrySink> aResult);

    /**
     * This method indicates whether @p aEntry answers the question.
     *
     * @returns TRUE if the question type is ANY or the entry's type, and the question name is empty or the entry's
     *          full name.
     */
    bool Matches(const Entry &aEntry) const;

    Dns::Question              mQuestion;
    std::shared_ptr<EntrySink> mResult;
};

/**
 * A subscription is a persistent query, its sink stays open until unsubscribed.
 */
typedef std::shared_ptr<Query> SubscriptionPtr;

} // namespace Mdns

} // namespace zc

#endif // ZC_MDNS_ENTRY_HPP_
