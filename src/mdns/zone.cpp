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

#define ZC_LOG_TAG "ZONE"

#include "mdns/zone.hpp"

#include <algorithm>
#include <future>
#include <iterator>

#include "common/logging.hpp"

namespace zc {

namespace Mdns {

namespace {

bool Contains(const EntryList &aEntries, const Entry &aEntry)
{
    return std::any_of(aEntries.begin(), aEntries.end(),
                       [&aEntry](const EntryPtr &aStored) { return aStored->IsSameRecord(aEntry); });
}

void Drain(EntrySink &aSink, EntryList &aEntries)
{
    EntryPtr entry;

    while (aSink.Pop(entry))
    {
        aEntries.push_back(std::move(entry));
    }
}

} // namespace

LocalZone::LocalZone(std::string aDomain)
    : mDomain(std::move(aDomain))
    , mMailbox(ZC_CONFIG_ZONE_MAILBOX_CAPACITY)
{
    mWorker = std::thread(&LocalZone::Process, this);
}

LocalZone::~LocalZone(void)
{
    mMailbox.Close();
    mWorker.join();

    for (const SubscriptionPtr &subscription : mSubscriptions)
    {
        subscription->mResult->Close();
    }

    mSubscriptions.clear();
}

bool LocalZone::Post(std::function<void(void)> aTask)
{
    return mMailbox.Push(std::move(aTask));
}

void LocalZone::Process(void)
{
    std::function<void(void)> task;

    while (mMailbox.Pop(task))
    {
        task();
    }

    zcLogDebug("Zone %s stopped", mDomain.c_str());
}

void LocalZone::Add(EntryPtr aEntry)
{
    if (!Post([this, aEntry]() { HandleAdd(aEntry); }))
    {
        zcLogWarning("Zone is closed, dropped %s", aEntry->ToString().c_str());
    }
}

EntryList LocalZone::Query(const Dns::Question &aQuestion)
{
    EntryList                  entries;
    std::shared_ptr<EntrySink> sink = std::make_shared<EntrySink>();

    if (!Post([this, aQuestion, sink]() {
            for (EntryPtr &entry : Lookup(aQuestion))
            {
                sink->Push(std::move(entry));
            }

            sink->Close();
        }))
    {
        zcLogWarning("Zone is closed, query for %s not answered", aQuestion.mName.c_str());
        ExitNow();
    }

    Drain(*sink, entries);

exit:
    return entries;
}

void LocalZone::QueryAdditional(const Dns::Question &aQuestion, EntryList &aAnswers, EntryList &aAdditionals)
{
    std::shared_ptr<EntrySink> answers     = std::make_shared<EntrySink>();
    std::shared_ptr<EntrySink> additionals = std::make_shared<EntrySink>();

    aAnswers.clear();
    aAdditionals.clear();

    if (!Post([this, aQuestion, answers, additionals]() {
            EntryList found = Lookup(aQuestion);

            for (EntryPtr &entry : LookupAdditional(found))
            {
                additionals->Push(std::move(entry));
            }

            for (EntryPtr &entry : found)
            {
                answers->Push(std::move(entry));
            }

            answers->Close();
            additionals->Close();
        }))
    {
        zcLogWarning("Zone is closed, query for %s not answered", aQuestion.mName.c_str());
        ExitNow();
    }

    Drain(*answers, aAnswers);
    Drain(*additionals, aAdditionals);

exit:
    return;
}

SubscriptionPtr LocalZone::Subscribe(uint16_t aType)
{
    SubscriptionPtr subscription =
        std::make_shared<Mdns::Query>(Dns::Question("", aType), std::make_shared<EntrySink>());

    if (!Post([this, subscription]() { mSubscriptions.push_back(subscription); }))
    {
        zcLogWarning("Zone is closed, subscription for %s closed", Dns::TypeToString(aType).c_str());
        subscription->mResult->Close();
    }

    return subscription;
}

void LocalZone::Unsubscribe(const SubscriptionPtr &aSubscription)
{
    SubscriptionPtr subscription = aSubscription;

    VerifyOrExit(subscription != nullptr);

    if (!Post([this, subscription]() {
            mSubscriptions.erase(std::remove(mSubscriptions.begin(), mSubscriptions.end(), subscription),
                                 mSubscriptions.end());
            subscription->mResult->Close();
        }))
    {
        subscription->mResult->Close();
    }

exit:
    return;
}

size_t LocalZone::Purge(Timepoint aNow)
{
    size_t                                count  = 0;
    std::shared_ptr<std::promise<size_t>> result = std::make_shared<std::promise<size_t>>();
    std::future<size_t>                   future = result->get_future();

    VerifyOrExit(Post([this, aNow, result]() { result->set_value(HandlePurge(aNow)); }));
    count = future.get();

exit:
    return count;
}

void LocalZone::HandleAdd(const EntryPtr &aEntry)
{
    EntryList *entries;

    if (!aEntry->mPublish && aEntry->mRecord.mTtl == 0)
    {
        HandleGoodbye(aEntry);
        ExitNow();
    }

    entries = &mEntries[aEntry->GetFullName()];

    for (EntryPtr &stored : *entries)
    {
        if (!stored->IsSameRecord(*aEntry))
        {
            continue;
        }

        // A learned record is refreshed by the latest announcement, a published one is never overridden.
        if (!stored->mPublish)
        {
            stored = aEntry;
        }

        ExitNow();
    }

    entries->push_back(aEntry);
    zcLogDebug("Added %s", aEntry->ToString().c_str());

    for (const SubscriptionPtr &subscription : mSubscriptions)
    {
        if (subscription->Matches(*aEntry))
        {
            subscription->mResult->Push(aEntry);
        }
    }

exit:
    return;
}

void LocalZone::HandleGoodbye(const EntryPtr &aEntry)
{
    EntryMap::iterator it = mEntries.find(aEntry->GetFullName());
    size_t             before;

    VerifyOrExit(it != mEntries.end());

    before = it->second.size();
    it->second.erase(std::remove_if(it->second.begin(), it->second.end(),
                                    [&aEntry](const EntryPtr &aStored) {
                                        return !aStored->mPublish && aEntry->Covers(*aStored);
                                    }),
                     it->second.end());
    zcLogDebug("Goodbye %s removed %zu entries", aEntry->ToString().c_str(), before - it->second.size());

    if (it->second.empty())
    {
        mEntries.erase(it);
    }

exit:
    return;
}

EntryList LocalZone::Lookup(const Dns::Question &aQuestion) const
{
    EntryList   entries;
    Mdns::Query query(aQuestion, nullptr);

    if (aQuestion.mName.empty())
    {
        for (const EntryMap::value_type &names : mEntries)
        {
            std::copy_if(names.second.begin(), names.second.end(), std::back_inserter(entries),
                         [&query](const EntryPtr &aEntry) { return query.Matches(*aEntry); });
        }
    }
    else
    {
        EntryMap::const_iterator it = mEntries.find(aQuestion.mName);

        if (it != mEntries.end())
        {
            std::copy_if(it->second.begin(), it->second.end(), std::back_inserter(entries),
                         [&query](const EntryPtr &aEntry) { return query.Matches(*aEntry); });
        }
    }

    return entries;
}

EntryList LocalZone::LookupAdditional(const EntryList &aAnswers) const
{
    EntryList additionals;
    EntryList pending = aAnswers;

    while (!pending.empty())
    {
        EntryPtr  entry = pending.back();
        EntryList related;

        pending.pop_back();

        switch (entry->mRecord.mType)
        {
        case Dns::kTypePtr:
            for (uint16_t type : {Dns::kTypeSrv, Dns::kTypeTxt})
            {
                EntryList found = Lookup(Dns::Question(entry->mRecord.mTarget, type));

                related.insert(related.end(), found.begin(), found.end());
            }
            break;

        case Dns::kTypeSrv:
            for (uint16_t type : {Dns::kTypeA, Dns::kTypeAaaa})
            {
                EntryList found = Lookup(Dns::Question(entry->mRecord.mTarget, type));

                related.insert(related.end(), found.begin(), found.end());
            }
            break;

        default:
            break;
        }

        for (const EntryPtr &candidate : related)
        {
            if (Contains(aAnswers, *candidate) || Contains(additionals, *candidate))
            {
                continue;
            }

            additionals.push_back(candidate);
            pending.push_back(candidate);
        }
    }

    return additionals;
}

size_t LocalZone::HandlePurge(Timepoint aNow)
{
    size_t count = 0;

    for (EntryMap::iterator it = mEntries.begin(); it != mEntries.end();)
    {
        EntryList &entries = it->second;
        size_t     before  = entries.size();

        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [aNow](const EntryPtr &aEntry) { return aEntry->IsExpired(aNow); }),
                      entries.end());
        count += before - entries.size();

        if (entries.empty())
        {
            it = mEntries.erase(it);
        }
        else
        {
            ++it;
        }
    }

    if (count > 0)
    {
        zcLogInfo("Purged %zu expired entries", count);
    }

    return count;
}

} // namespace Mdns

} // namespace zc
