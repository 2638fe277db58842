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

#include <gtest/gtest.h>

#include "mdns/entry.hpp"

using namespace zc;
using zc::Mdns::Entry;

static Entry MakeEntry(const char *aName, uint16_t aType, const char *aTarget, bool aPublish = true)
{
    Dns::ResourceRecord record(aType);

    record.mName   = aName;
    record.mTtl    = 3600;
    record.mTarget = aTarget;

    return Entry(record, aPublish, Clock::now() + Seconds(3600));
}

TEST(Entry, NameComponents)
{
    Entry instance = MakeEntry("foo._ssh._tcp.local.", Dns::kTypeSrv, "foo.local.");
    Entry host     = MakeEntry("foo.local.", Dns::kTypeA, "");

    EXPECT_EQ(instance.GetFullName(), "foo._ssh._tcp.local.");
    EXPECT_EQ(instance.GetName(), "foo");
    EXPECT_EQ(instance.GetType(), "_ssh._tcp");
    EXPECT_EQ(instance.GetDomain(), "local.");

    EXPECT_EQ(host.GetName(), "foo");
    EXPECT_EQ(host.GetType(), "");
    EXPECT_EQ(host.GetDomain(), "local.");
}

TEST(Entry, IsSameRecord)
{
    Entry ptr       = MakeEntry("_ssh._tcp.local.", Dns::kTypePtr, "foo._ssh._tcp.local.");
    Entry learned   = MakeEntry("_ssh._tcp.local.", Dns::kTypePtr, "foo._ssh._tcp.local.", false);
    Entry other     = MakeEntry("_ssh._tcp.local.", Dns::kTypePtr, "bar._ssh._tcp.local.");
    Entry any       = MakeEntry("_ssh._tcp.local.", Dns::kTypeAny, "");
    Entry elsewhere = MakeEntry("_http._tcp.local.", Dns::kTypePtr, "foo._ssh._tcp.local.");

    learned.mRecord.mTtl = 120;

    EXPECT_TRUE(ptr.IsSameRecord(learned));
    EXPECT_FALSE(ptr.IsSameRecord(other));
    EXPECT_FALSE(ptr.IsSameRecord(any));
    EXPECT_FALSE(any.IsSameRecord(other));
    EXPECT_FALSE(ptr.IsSameRecord(elsewhere));
}

TEST(Entry, Covers)
{
    Entry ptr       = MakeEntry("_ssh._tcp.local.", Dns::kTypePtr, "foo._ssh._tcp.local.");
    Entry other     = MakeEntry("_ssh._tcp.local.", Dns::kTypePtr, "bar._ssh._tcp.local.");
    Entry any       = MakeEntry("_ssh._tcp.local.", Dns::kTypeAny, "");
    Entry elsewhere = MakeEntry("_http._tcp.local.", Dns::kTypeAny, "");

    EXPECT_TRUE(any.Covers(ptr));
    EXPECT_TRUE(any.Covers(other));
    EXPECT_FALSE(elsewhere.Covers(ptr));
    EXPECT_FALSE(ptr.Covers(any));
    EXPECT_FALSE(ptr.Covers(other));
    EXPECT_TRUE(ptr.Covers(ptr));
}

TEST(Entry, IsExpired)
{
    Timepoint now       = Clock::now();
    Entry     published = MakeEntry("foo.local.", Dns::kTypeA, "");
    Entry     learned   = MakeEntry("foo.local.", Dns::kTypeA, "", false);

    published.mExpires = now;
    learned.mExpires   = now;

    EXPECT_FALSE(published.IsExpired(now + Seconds(1)));
    EXPECT_TRUE(learned.IsExpired(now));
    EXPECT_FALSE(learned.IsExpired(now - Seconds(1)));
}

TEST(Query, MatchesTypeAndName)
{
    Entry ptr = MakeEntry("_ssh._tcp.local.", Dns::kTypePtr, "foo._ssh._tcp.local.");

    EXPECT_TRUE(Mdns::Query(Dns::Question("_ssh._tcp.local.", Dns::kTypePtr), nullptr).Matches(ptr));
    EXPECT_TRUE(Mdns::Query(Dns::Question("_ssh._tcp.local.", Dns::kTypeAny), nullptr).Matches(ptr));
    EXPECT_TRUE(Mdns::Query(Dns::Question("", Dns::kTypePtr), nullptr).Matches(ptr));
    EXPECT_TRUE(Mdns::Query(Dns::Question("", Dns::kTypeAny), nullptr).Matches(ptr));

    EXPECT_FALSE(Mdns::Query(Dns::Question("_ssh._tcp.local.", Dns::kTypeSrv), nullptr).Matches(ptr));
    EXPECT_FALSE(Mdns::Query(Dns::Question("_http._tcp.local.", Dns::kTypePtr), nullptr).Matches(ptr));
    EXPECT_FALSE(Mdns::Query(Dns::Question("", Dns::kTypeTxt), nullptr).Matches(ptr));
}
