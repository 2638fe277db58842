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

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "mdns/responder.hpp"
#include "mdns/service.hpp"
#include "mdns/zone.hpp"

using namespace zc;
using namespace zc::Mdns;

static Host MakeHost(const std::vector<const char *> &aAddresses)
{
    Host host;

    host.mName   = "foo";
    host.mDomain = "local.";

    for (const char *text : aAddresses)
    {
        IpAddress address;

        EXPECT_EQ(IpAddress::FromString(text, address), ZC_ERROR_NONE);
        host.mAddresses.push_back(address);
    }

    return host;
}

TEST(ServiceType, FromString)
{
    ServiceType type;

    EXPECT_EQ(ServiceType::FromString("_ssh._tcp", type), ZC_ERROR_NONE);
    EXPECT_EQ(type, ServiceType("_ssh", Protocol::kTcp));
    EXPECT_EQ(type.ToString(), "_ssh._tcp");

    EXPECT_EQ(ServiceType::FromString("_printer._udp.", type), ZC_ERROR_NONE);
    EXPECT_EQ(type, ServiceType("_printer", Protocol::kUdp));

    EXPECT_EQ(ServiceType::FromString("ssh._tcp", type), ZC_ERROR_INVALID_ARGS);
    EXPECT_EQ(ServiceType::FromString("_ssh", type), ZC_ERROR_INVALID_ARGS);
    EXPECT_EQ(ServiceType::FromString("_ssh._sctp", type), ZC_ERROR_INVALID_ARGS);
    EXPECT_EQ(ServiceType::FromString("_a._b._tcp", type), ZC_ERROR_INVALID_ARGS);
    EXPECT_EQ(ServiceType::FromString("", type), ZC_ERROR_INVALID_ARGS);
}

TEST(ServiceTypeRegistry, WellKnownTypes)
{
    ServiceTypeRegistry registry;
    ServiceType         type;

    EXPECT_EQ(registry.Find("ssh", type), ZC_ERROR_NONE);
    EXPECT_EQ(type.ToString(), "_ssh._tcp");
    EXPECT_EQ(registry.Find("http", type), ZC_ERROR_NONE);
    EXPECT_EQ(type.ToString(), "_http._tcp");
    EXPECT_EQ(registry.Find("gopher", type), ZC_ERROR_NOT_FOUND);
}

TEST(ServiceTypeRegistry, Register)
{
    ServiceTypeRegistry registry;
    ServiceType         type;

    EXPECT_EQ(registry.Register("airplay", ServiceType("_airplay", Protocol::kTcp)), ZC_ERROR_NONE);
    EXPECT_EQ(registry.Find("airplay", type), ZC_ERROR_NONE);
    EXPECT_EQ(type, ServiceType("_airplay", Protocol::kTcp));

    EXPECT_EQ(registry.Register("airplay", ServiceType("_airplay", Protocol::kTcp)), ZC_ERROR_NONE);
    EXPECT_EQ(registry.Register("ssh", ServiceType("_ssh", Protocol::kUdp)), ZC_ERROR_DUPLICATED);
    EXPECT_EQ(registry.Register("", ServiceType("_x", Protocol::kTcp)), ZC_ERROR_INVALID_ARGS);

    EXPECT_EQ(registry.Find("ssh", type), ZC_ERROR_NONE);
    EXPECT_EQ(type.GetProtocol(), Protocol::kTcp);
}

TEST(ServiceTypeRegistry, Resolve)
{
    ServiceTypeRegistry registry;
    ServiceType         type;

    EXPECT_EQ(registry.Resolve("ipp", type), ZC_ERROR_NONE);
    EXPECT_EQ(type.ToString(), "_ipp._tcp");
    EXPECT_EQ(registry.Resolve("_matter._udp", type), ZC_ERROR_NONE);
    EXPECT_EQ(type.ToString(), "_matter._udp");
    EXPECT_EQ(registry.Resolve("unknown", type), ZC_ERROR_NOT_FOUND);
}

TEST(TxtData, EncodeAndDecode)
{
    TxtList                         txtList{TxtEntry("path", "/"), TxtEntry("secure")};
    TxtList                         decoded;
    Dns::ResourceRecord::TxtStrings strings;

    ASSERT_EQ(EncodeTxtData(txtList, strings), ZC_ERROR_NONE);
    ASSERT_EQ(strings.size(), 2u);
    EXPECT_EQ(strings[0], "path=/");
    EXPECT_EQ(strings[1], "secure");

    strings.push_back("");
    strings.push_back("=orphan");
    DecodeTxtData(strings, decoded);
    EXPECT_EQ(decoded, txtList);
}

TEST(TxtData, EncodeRejectsInvalidEntries)
{
    Dns::ResourceRecord::TxtStrings strings;
    std::string                     longValue(255, 'v');

    EXPECT_EQ(EncodeTxtData({TxtEntry("")}, strings), ZC_ERROR_INVALID_ARGS);
    EXPECT_EQ(EncodeTxtData({TxtEntry("a=b", "c")}, strings), ZC_ERROR_INVALID_ARGS);
    EXPECT_EQ(EncodeTxtData({TxtEntry("k", longValue.c_str())}, strings), ZC_ERROR_INVALID_ARGS);
    EXPECT_TRUE(strings.empty());

    EXPECT_EQ(EncodeTxtData({TxtEntry("k", longValue.substr(2).c_str())}, strings), ZC_ERROR_NONE);
    ASSERT_EQ(strings.size(), 1u);
    EXPECT_EQ(strings[0].size(), 255u);
}

TEST(TxtData, ParseTxtEntry)
{
    TxtList txtList;

    EXPECT_EQ(ParseTxtEntry("version=1.0", txtList), ZC_ERROR_NONE);
    EXPECT_EQ(ParseTxtEntry("debug", txtList), ZC_ERROR_NONE);
    EXPECT_EQ(ParseTxtEntry("empty=", txtList), ZC_ERROR_NONE);
    EXPECT_EQ(ParseTxtEntry("=value", txtList), ZC_ERROR_INVALID_ARGS);
    EXPECT_EQ(ParseTxtEntry("", txtList), ZC_ERROR_INVALID_ARGS);

    ASSERT_EQ(txtList.size(), 3u);
    EXPECT_EQ(txtList[0], TxtEntry("version", "1.0"));
    EXPECT_EQ(txtList[1], TxtEntry("debug"));
    EXPECT_EQ(txtList[2], TxtEntry("empty", ""));
}

TEST(Service, Names)
{
    Service service(MakeHost({}), ServiceType("_http", Protocol::kTcp), 80);

    EXPECT_EQ(service.GetFullHostName(), "foo.local.");
    EXPECT_EQ(service.GetServiceTypeName(), "_http._tcp.local.");
    EXPECT_EQ(service.GetServiceInstanceName(), "foo._http._tcp.local.");
}

TEST(Service, PublishAddsOneRecordPerAddress)
{
    LocalZone zone;
    Service   service(MakeHost({"192.168.1.10", "fd00::10", "10.0.0.10"}), ServiceType("_http", Protocol::kTcp), 8080,
                      {TxtEntry("path", "/index.html")});
    EntryList entries;

    ASSERT_EQ(Publish(zone, service), ZC_ERROR_NONE);

    EXPECT_EQ(zone.Query(Dns::Question("", Dns::kTypeAny)).size(), 3u + 3u);
    EXPECT_EQ(zone.Query(Dns::Question("foo.local.", Dns::kTypeA)).size(), 2u);
    EXPECT_EQ(zone.Query(Dns::Question("foo.local.", Dns::kTypeAaaa)).size(), 1u);

    entries = zone.Query(Dns::Question("_http._tcp.local.", Dns::kTypePtr));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0]->mRecord.mTarget, "foo._http._tcp.local.");

    entries = zone.Query(Dns::Question("foo._http._tcp.local.", Dns::kTypeSrv));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0]->mRecord.mPort, 8080);
    EXPECT_EQ(entries[0]->mRecord.mTarget, "foo.local.");

    entries = zone.Query(Dns::Question("foo._http._tcp.local.", Dns::kTypeTxt));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0]->mRecord.mTxtStrings, Dns::ResourceRecord::TxtStrings{"path=/index.html"});

    for (const EntryPtr &entry : zone.Query(Dns::Question("", Dns::kTypeAny)))
    {
        EXPECT_TRUE(entry->mPublish);
        EXPECT_EQ(entry->mRecord.mTtl, static_cast<uint32_t>(ZC_CONFIG_PUBLISH_TTL));
    }
}

TEST(Service, PublishWithoutAddresses)
{
    LocalZone zone;

    ASSERT_EQ(Publish(zone, Service(MakeHost({}), ServiceType("_ssh", Protocol::kTcp), 22)), ZC_ERROR_NONE);
    EXPECT_EQ(zone.Query(Dns::Question("", Dns::kTypeAny)).size(), 3u);
}

TEST(Service, InvalidServicePublishesNothing)
{
    LocalZone zone;
    Host      host = MakeHost({"1.2.3.4"});

    host.mAddresses.push_back(IpAddress());
    EXPECT_EQ(Publish(zone, Service(host, ServiceType("_ssh", Protocol::kTcp), 22)), ZC_ERROR_INVALID_ARGS);

    EXPECT_EQ(Publish(zone, Service(MakeHost({"1.2.3.4"}), ServiceType("_ssh", Protocol::kTcp), 22, {TxtEntry("")})),
              ZC_ERROR_INVALID_ARGS);

    EXPECT_TRUE(zone.Query(Dns::Question("", Dns::kTypeAny)).empty());
}

TEST(Service, PublishSshService)
{
    LocalZone   zone;
    ServiceType type;
    EntryList   entries;

    ASSERT_EQ(ServiceTypeRegistry().Resolve("ssh", type), ZC_ERROR_NONE);
    ASSERT_EQ(Publish(zone, Service(MakeHost({"1.2.3.4"}), type, 22)), ZC_ERROR_NONE);

    entries = zone.Query(Dns::Question("", Dns::kTypeAny));
    ASSERT_EQ(entries.size(), 4u);

    entries = zone.Query(Dns::Question("foo.local.", Dns::kTypeAny));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0]->mRecord.mType, Dns::kTypeA);
    EXPECT_EQ(entries[0]->mRecord.mAddress.ToString(), "1.2.3.4");
    EXPECT_EQ(entries[0]->mRecord.mTtl, 3600u);

    entries = zone.Query(Dns::Question("_ssh._tcp.local.", Dns::kTypeAny));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0]->mRecord.mType, Dns::kTypePtr);
    EXPECT_EQ(entries[0]->mRecord.mTarget, "foo._ssh._tcp.local.");
    EXPECT_EQ(entries[0]->mRecord.mTtl, 3600u);

    entries = zone.Query(Dns::Question("foo._ssh._tcp.local.", Dns::kTypeAny));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0]->mRecord.mType, Dns::kTypeSrv);
    EXPECT_EQ(entries[0]->mRecord.mPort, 22);
    EXPECT_EQ(entries[0]->mRecord.mTarget, "foo.local.");
    EXPECT_EQ(entries[0]->mRecord.mTtl, 3600u);
    EXPECT_EQ(entries[1]->mRecord.mType, Dns::kTypeTxt);
    EXPECT_TRUE(entries[1]->mRecord.mTxtStrings.empty());
    EXPECT_EQ(entries[1]->mRecord.mTtl, 3600u);
}

TEST(Service, PublishRejectsMultiLabelHostName)
{
    LocalZone zone;
    Host      host = MakeHost({"1.2.3.4"});

    host.mName = "foo.bar";
    EXPECT_EQ(Publish(zone, Service(host, ServiceType("_ssh", Protocol::kTcp), 22)), ZC_ERROR_INVALID_ARGS);

    host.mName.clear();
    EXPECT_EQ(Publish(zone, Service(host, ServiceType("_ssh", Protocol::kTcp), 22)), ZC_ERROR_INVALID_ARGS);

    EXPECT_TRUE(zone.Query(Dns::Question("", Dns::kTypeAny)).empty());
}

TEST(Service, PublishedServiceAnswersPointerQuestion)
{
    LocalZone    zone;
    Responder    responder(zone);
    Dns::Message query;
    Dns::Message response;

    ASSERT_EQ(Publish(zone, Service(MakeHost({"1.2.3.4"}), ServiceType("_ssh", Protocol::kTcp), 22)), ZC_ERROR_NONE);

    query.mQuestions.emplace_back("_ssh._tcp.local.", Dns::kTypePtr);
    ASSERT_EQ(responder.HandleQuestion(query, response), ZC_ERROR_NONE);

    ASSERT_EQ(response.mAnswers.size(), 1u);
    EXPECT_EQ(response.mAnswers[0].mType, Dns::kTypePtr);
    EXPECT_EQ(response.mAnswers[0].mName, "_ssh._tcp.local.");
    EXPECT_EQ(response.mAnswers[0].mTarget, "foo._ssh._tcp.local.");
}
