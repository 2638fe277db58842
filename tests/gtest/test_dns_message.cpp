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

#include "dns/dns_message.hpp"

using namespace zc;

static Dns::ResourceRecord MakeAddressRecord(const char *aName, const char *aAddress, uint32_t aTtl)
{
    Dns::ResourceRecord record(Dns::kTypeA);

    record.mName = aName;
    record.mTtl  = aTtl;
    EXPECT_EQ(IpAddress::FromString(aAddress, record.mAddress), ZC_ERROR_NONE);

    return record;
}

TEST(DnsMessage, PackAndUnpackAddressResponse)
{
    Dns::Message         response;
    Dns::Message         decoded;
    std::vector<uint8_t> buffer;

    response.mId            = 0x1234;
    response.mResponse      = true;
    response.mAuthoritative = true;
    response.mAnswers.push_back(MakeAddressRecord("foo.local.", "1.2.3.4", 3600));

    ASSERT_EQ(response.Pack(buffer), ZC_ERROR_NONE);
    ASSERT_EQ(decoded.Unpack(buffer.data(), buffer.size()), ZC_ERROR_NONE);

    EXPECT_EQ(decoded.mId, 0x1234);
    EXPECT_FALSE(decoded.IsQuestion());
    EXPECT_TRUE(decoded.mAuthoritative);
    ASSERT_EQ(decoded.mAnswers.size(), 1u);
    EXPECT_EQ(decoded.mAnswers[0], response.mAnswers[0]);
    EXPECT_EQ(decoded.mAnswers[0].mTtl, 3600u);
    EXPECT_STREQ(decoded.mAnswers[0].mAddress.ToString().c_str(), "1.2.3.4");
}

TEST(DnsMessage, PackAndUnpackServiceRecords)
{
    Dns::Message         response;
    Dns::Message         decoded;
    std::vector<uint8_t> buffer;
    Dns::ResourceRecord  ptr(Dns::kTypePtr);
    Dns::ResourceRecord  srv(Dns::kTypeSrv);
    Dns::ResourceRecord  txt(Dns::kTypeTxt);
    Dns::ResourceRecord  aaaa(Dns::kTypeAaaa);
    Dns::ResourceRecord  hinfo(ns_t_hinfo);

    ptr.mName   = "_http._tcp.local.";
    ptr.mTtl    = 4500;
    ptr.mTarget = "web._http._tcp.local.";

    srv.mName     = "web._http._tcp.local.";
    srv.mTtl      = 120;
    srv.mPriority = 1;
    srv.mWeight   = 2;
    srv.mPort     = 8080;
    srv.mTarget   = "server.local.";

    txt.mName       = "web._http._tcp.local.";
    txt.mTtl        = 4500;
    txt.mTxtStrings = {"path=/index.html", "secure"};

    aaaa.mName = "server.local.";
    aaaa.mTtl  = 120;
    ASSERT_EQ(IpAddress::FromString("fd00::1", aaaa.mAddress), ZC_ERROR_NONE);

    hinfo.mName = "server.local.";
    hinfo.mData = {3, 'x', '8', '6', 5, 'L', 'i', 'n', 'u', 'x'};

    response.mResponse = true;
    response.mAnswers  = {ptr};
    response.mAdditionals = {srv, txt, aaaa, hinfo};

    ASSERT_EQ(response.Pack(buffer), ZC_ERROR_NONE);
    ASSERT_EQ(decoded.Unpack(buffer.data(), buffer.size()), ZC_ERROR_NONE);

    ASSERT_EQ(decoded.mAnswers.size(), 1u);
    ASSERT_EQ(decoded.mAdditionals.size(), 4u);
    EXPECT_EQ(decoded.mAnswers[0], ptr);
    EXPECT_EQ(decoded.mAdditionals[0], srv);
    EXPECT_EQ(decoded.mAdditionals[0].mPort, 8080);
    EXPECT_EQ(decoded.mAdditionals[1], txt);
    EXPECT_EQ(decoded.mAdditionals[2], aaaa);
    EXPECT_EQ(decoded.mAdditionals[3], hinfo);
}

TEST(DnsMessage, PackCompressesNames)
{
    Dns::Message         response;
    Dns::ResourceRecord  ptr(Dns::kTypePtr);
    std::vector<uint8_t> buffer;

    ptr.mName   = "_ssh._tcp.local.";
    ptr.mTarget = "foo._ssh._tcp.local.";
    response.mResponse = true;
    response.mAnswers.push_back(ptr);

    ASSERT_EQ(response.Pack(buffer), ZC_ERROR_NONE);

    // Header, owner name, fixed record fields, then `foo` and a pointer to the owner name.
    EXPECT_EQ(buffer.size(), 12u + 17u + 10u + 6u);
}

TEST(DnsMessage, EmptyTxtIsOneEmptyString)
{
    Dns::Message         response;
    Dns::Message         decoded;
    Dns::ResourceRecord  txt(Dns::kTypeTxt);
    std::vector<uint8_t> buffer;

    txt.mName = "foo._ssh._tcp.local.";
    txt.mTtl  = 3600;
    response.mResponse = true;
    response.mAnswers.push_back(txt);

    ASSERT_EQ(response.Pack(buffer), ZC_ERROR_NONE);
    ASSERT_GE(buffer.size(), 3u);

    // RDLENGTH 1 and a zero-length character string.
    EXPECT_EQ(buffer[buffer.size() - 3], 0x00);
    EXPECT_EQ(buffer[buffer.size() - 2], 0x01);
    EXPECT_EQ(buffer[buffer.size() - 1], 0x00);

    ASSERT_EQ(decoded.Unpack(buffer.data(), buffer.size()), ZC_ERROR_NONE);
    ASSERT_EQ(decoded.mAnswers.size(), 1u);
    EXPECT_TRUE(decoded.mAnswers[0].mTxtStrings.empty());
    EXPECT_EQ(decoded.mAnswers[0], txt);
}

TEST(DnsMessage, UnpackQuestionMasksUnicastResponseBit)
{
    const uint8_t kQuery[] = {
        0x12, 0x34, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, // header
        3,    'f',  'o',  'o',  5,    'l',  'o',  'c',  'a',  'l',  0,          // foo.local.
        0x00, 0xff, 0x80, 0x01,                                                 // ANY, QU + IN
    };
    Dns::Message message;

    ASSERT_EQ(message.Unpack(kQuery, sizeof(kQuery)), ZC_ERROR_NONE);

    EXPECT_TRUE(message.IsQuestion());
    EXPECT_EQ(message.mId, 0x1234);
    ASSERT_EQ(message.mQuestions.size(), 1u);
    EXPECT_EQ(message.mQuestions[0], Dns::Question("foo.local.", Dns::kTypeAny, Dns::kClassInternet));
}

TEST(DnsMessage, UnpackAnswerMasksCacheFlushBit)
{
    const uint8_t kResponse[] = {
        0x00, 0x00, 0x84, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, // header
        3,    'f',  'o',  'o',  5,    'l',  'o',  'c',  'a',  'l',  0,          // foo.local.
        0x00, 0x01, 0x80, 0x01, 0x00, 0x00, 0x00, 0x78, 0x00, 0x04,             // A, cache-flush + IN, 120 s
        10,   0,    0,    1,                                                    // 10.0.0.1
    };
    Dns::Message message;

    ASSERT_EQ(message.Unpack(kResponse, sizeof(kResponse)), ZC_ERROR_NONE);

    EXPECT_FALSE(message.IsQuestion());
    EXPECT_TRUE(message.mAuthoritative);
    ASSERT_EQ(message.mAnswers.size(), 1u);
    EXPECT_EQ(message.mAnswers[0].mName, "foo.local.");
    EXPECT_EQ(message.mAnswers[0].mType, Dns::kTypeA);
    EXPECT_EQ(message.mAnswers[0].mClass, Dns::kClassInternet);
    EXPECT_EQ(message.mAnswers[0].mTtl, 120u);
    EXPECT_STREQ(message.mAnswers[0].mAddress.ToString().c_str(), "10.0.0.1");
}

TEST(DnsMessage, UnpackRejectsMalformedMessages)
{
    const uint8_t kBadAddressLength[] = {
        0x00, 0x00, 0x84, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, // header
        3,    'f',  'o',  'o',  0,                                              // foo.
        0x00, 0x01, 0x00, 0x01, 0x00, 0x00, 0x00, 0x78, 0x00, 0x03,             // A, IN, 120 s
        10,   0,    0,                                                          // 3 bytes
    };
    const uint8_t kTruncated[] = {0x00, 0x00, 0x84, 0x00, 0x00, 0x01};
    Dns::Message  message;

    message.mId = 7;
    message.mAnswers.push_back(MakeAddressRecord("foo.local.", "1.2.3.4", 10));

    EXPECT_EQ(message.Unpack(kBadAddressLength, sizeof(kBadAddressLength)), ZC_ERROR_PARSE);
    EXPECT_EQ(message.mId, 0);
    EXPECT_TRUE(message.mAnswers.empty());

    EXPECT_EQ(message.Unpack(kTruncated, sizeof(kTruncated)), ZC_ERROR_PARSE);
    EXPECT_EQ(message.Unpack(nullptr, 0), ZC_ERROR_PARSE);
}

TEST(DnsMessage, PackRejectsInvalidRecords)
{
    Dns::Message         message;
    Dns::ResourceRecord  address = MakeAddressRecord("foo.local.", "fd00::1", 10);
    Dns::ResourceRecord  txt(Dns::kTypeTxt);
    std::vector<uint8_t> buffer = {0xaa};

    message.mAnswers.push_back(address);
    EXPECT_EQ(message.Pack(buffer), ZC_ERROR_INVALID_ARGS);

    txt.mName = "foo.local.";
    txt.mTxtStrings.push_back(std::string(256, 'x'));
    message.mAnswers = {txt};
    EXPECT_EQ(message.Pack(buffer), ZC_ERROR_INVALID_ARGS);

    ASSERT_EQ(buffer.size(), 1u);
    EXPECT_EQ(buffer[0], 0xaa);
}

TEST(DnsMessage, RecordIdentityIgnoresTtl)
{
    Dns::ResourceRecord a = MakeAddressRecord("foo.local.", "1.2.3.4", 10);
    Dns::ResourceRecord b = MakeAddressRecord("foo.local.", "1.2.3.4", 3600);
    Dns::ResourceRecord c = MakeAddressRecord("foo.local.", "1.2.3.5", 10);
    Dns::ResourceRecord d = MakeAddressRecord("bar.local.", "1.2.3.4", 10);

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, d);
    EXPECT_TRUE(a.HasSameData(d));
    EXPECT_FALSE(a.HasSameData(Dns::ResourceRecord(Dns::kTypeAaaa)));
}

TEST(DnsMessage, TypeNames)
{
    uint16_t type;

    EXPECT_EQ(Dns::TypeToString(Dns::kTypePtr), "PTR");
    EXPECT_EQ(Dns::TypeToString(ns_t_hinfo), "TYPE13");

    EXPECT_EQ(Dns::TypeFromString("srv", type), ZC_ERROR_NONE);
    EXPECT_EQ(type, Dns::kTypeSrv);
    EXPECT_EQ(Dns::TypeFromString("Any", type), ZC_ERROR_NONE);
    EXPECT_EQ(type, Dns::kTypeAny);
    EXPECT_EQ(Dns::TypeFromString("mx", type), ZC_ERROR_INVALID_ARGS);
}
