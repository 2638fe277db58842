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
 *   This file includes definitions for the record store shared by publishers and responders.
 */

#ifndef ZC_MDNS_ZONE_HPP_
#define ZC_MDNS_ZONE_HPP_

#include "zeroconf/config.h"

#include <functional>
#include <map>
#include <string>
#include <thread>
#include <vector>

#include "common/code_utils.hpp"
#include "common/time.hpp"
#include "dns/dns_message.hpp"
#include "mdns/entry.hpp"
#include "utils/concurrent_queue.hpp"

namespace zc {

namespace Mdns {

/**
 * This interface defines the functionality of a record store.
 */
class Zone
{
public:
    virtual ~Zone(void) = default;

    /**
     * This method stores @p aEntry unless the same record is already stored, and forwards it to every
     * matching subscription.
     *
     * A learned entry with a zero TTL is a goodbye: it removes the learned entries it covers and is not stored.
     *
     * @param[in] aEntry  The entry to add.
     */
    virtual void Add(EntryPtr aEntry) = 0;

    /**
     * This method returns the stored entries answering @p aQuestion, in insertion order.
     *
     * @param[in] aQuestion  The question, an empty name matches every name.
     */
    virtual EntryList Query(const Dns::Question &aQuestion) = 0;

    /**
     * This method answers @p aQuestion like `Query()` and also collects the records a responder adds to the
     * additional section: the SRV and TXT records of a PTR target, and the addresses of an SRV target.
     *
     * @param[in]  aQuestion     The question.
     * @param[out] aAnswers      The entries answering the question.
     * @param[out] aAdditionals  The additional entries, none of which is in @p aAnswers.
     */
    virtual void QueryAdditional(const Dns::Question &aQuestion, EntryList &aAnswers, EntryList &aAdditionals) = 0;

    /**
     * This method subscribes to every entry of @p aType added from now on.
     *
     * @param[in] aType  The record type, ANY for every type.
     *
     * @returns The subscription, whose sink stays open until `Unsubscribe()`.
     */
    virtual SubscriptionPtr Subscribe(uint16_t aType) = 0;

    /**
     * This method removes @p aSubscription and closes its sink.
     */
    virtual void Unsubscribe(const SubscriptionPtr &aSubscription) = 0;
};

/**
 * This class implements a zone as an actor.
 *
 * A single worker thread owns the entries and the subscriptions. Every public method posts a task to the
 * worker's mailbox, so operations from one caller are applied in order.
 */
class LocalZone : public Zone, private NonCopyable
{
public:
    /**
     * Constructor, starts the worker.
     *
     * @param[in] aDomain  The domain of the zone.
     */
    explicit LocalZone(std::string aDomain = "local.");

    /**
     * Destructor, completes the pending tasks, stops the worker and closes every subscription.
     */
    ~LocalZone(void) override;

    void            Add(EntryPtr aEntry) override;
    EntryList       Query(const Dns::Question &aQuestion) override;
    void            QueryAdditional(const Dns::Question &aQuestion,
                                    EntryList           &aAnswers,
                                    EntryList           &aAdditionals) override;
    SubscriptionPtr Subscribe(uint16_t aType) override;
    void            Unsubscribe(const SubscriptionPtr &aSubscription) override;

    /**
     * This method removes the learned entries which have expired at @p aNow.
     *
     * @param[in] aNow  The current time.
     *
     * @returns The number of removed entries.
     */
    size_t Purge(Timepoint aNow);

    /**
     * This method returns the domain of the zone.
     */
    const std::string &GetDomain(void) const { return mDomain; }

private:
    typedef std::map<std::string, EntryList> EntryMap;

    bool Post(std::function<void(void)> aTask);
    void Process(void);

    void      HandleAdd(const EntryPtr &aEntry);
    void      HandleGoodbye(const EntryPtr &aEntry);
    EntryList Lookup(const Dns::Question &aQuestion) const;
    EntryList LookupAdditional(const EntryList &aAnswers) const;
    size_t    HandlePurge(Timepoint aNow);

    std::string                  mDomain;
    Utils::TaskQueue             mMailbox;
    EntryMap                     mEntries;
    std::vector<SubscriptionPtr> mSubscriptions;
    std::thread                  mWorker;
};

} // namespace Mdns

} // namespace zc

#endif // ZC_MDNS_ZONE_HPP_
