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

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "common/code_utils.hpp"
#include "mdns/connector.hpp"
#include "mdns/service.hpp"
#include "mdns/zone.hpp"

using namespace zc;
using namespace zc::Mdns;

// Returns true when a scratch socket of @p aFamily can join the mDNS group of that family.
static bool CanJoinGroup(int aFamily, std::string &aReason)
{
    bool joined = false;
    int  fd     = socket(aFamily, SOCK_DGRAM, 0);

    if (fd < 0)
    {
        aReason = std::string("socket: ") + strerror(errno);
        ExitNow();
    }

    if (aFamily == AF_INET6)
    {
        ipv6_mreq mreq;

        mreq.ipv6mr_multiaddr = Connector::GetIp6Group().GetAddress().ToIn6();
        mreq.ipv6mr_interface = 0;
        joined                = setsockopt(fd, IPPROTO_IPV6, IPV6_JOIN_GROUP, &mreq, sizeof(mreq)) == 0;
    }
    else
    {
        ip_mreq mreq;

        mreq.imr_multiaddr        = Connector::GetIp4Group().GetAddress().ToIn4();
        mreq.imr_interface.s_addr = htonl(INADDR_ANY);
        joined                    = setsockopt(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) == 0;
    }

    if (!joined)
    {
        aReason = std::string("join group: ") + strerror(errno);
    }

    close(fd);

exit:
    return joined;
}

class ConnectorTest : public ::testing::Test
{
protected:
    explicit ConnectorTest(int aFamily = AF_INET)
        : mFamily(aFamily)
        , mConnector(mZone, aFamily == AF_INET6 ? Connector::GetIp6Group(0) : Connector::GetIp4Group(0))
        , mClient(-1)
    {
    }

    void SetUp(void) override
    {
        SocketAddress local;
        timeval       timeout;
        std::string   reason;

        if (mConnector.Start() != ZC_ERROR_NONE)
        {
            int startErrno = errno;

            // A host that allows joining the group must also allow the connector to start.
            ASSERT_FALSE(CanJoinGroup(mFamily, reason))
                << "Connector failed to start although the group can be joined: " << strerror(startErrno);
            GTEST_SKIP() << "Skipped: " << (mFamily == AF_INET6 ? "IPv6" : "IPv4")
                         << " multicast is not available on this host (" << reason << ")";
        }

        ASSERT_EQ(IpAddress::FromString(GetLoopback(), mLoopback), ZC_ERROR_NONE);
        local = SocketAddress(mLoopback, 0);

        mClient = socket(mFamily, SOCK_DGRAM, 0);
        ASSERT_GE(mClient, 0);
        ASSERT_EQ(bind(mClient, local.AsSockaddr(), local.GetSockaddrLength()), 0) << strerror(errno);

        timeout.tv_sec  = 2;
        timeout.tv_usec = 0;
        ASSERT_EQ(setsockopt(mClient, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)), 0);
    }

    void TearDown(void) override
    {
        if (mClient >= 0)
        {
            close(mClient);
        }

        mConnector.Stop();
    }

    const char *GetLoopback(void) const { return mFamily == AF_INET6 ? "::1" : "127.0.0.1"; }

    void SendToConnector(const std::vector<uint8_t> &aBuffer, uint16_t aPort = 0)
    {
        SocketAddress dest(mLoopback, aPort != 0 ? aPort : mConnector.GetPort());

        ASSERT_EQ(sendto(mClient, aBuffer.data(), aBuffer.size(), 0, dest.AsSockaddr(), dest.GetSockaddrLength()),
                  static_cast<ssize_t>(aBuffer.size()));
    }

    // Replaces the socket of the connector with a stream socket that was never connected, so that the next read
    // fails with ENOTCONN.
    void BreakConnectorSocket(void)
    {
        uint16_t port   = mConnector.GetPort();
        int      stream = socket(mFamily, SOCK_STREAM, 0);

        ASSERT_GE(stream, 0);
        ASSERT_GE(dup2(stream, mConnector.GetFd()), 0) << strerror(errno);
        close(stream);

        // Wakes a receive thread that is still polling the replaced socket.
        SendToConnector({0x00}, port);
    }

    void PublishSshService(void)
    {
        Host      host;
        IpAddress address;

        host.mName   = "foo";
        host.mDomain = "local.";
        ASSERT_EQ(IpAddress::FromString("1.2.3.4", address), ZC_ERROR_NONE);
        host.mAddresses.push_back(address);
        ASSERT_EQ(Publish(mZone, Service(host, ServiceType("_ssh", Protocol::kTcp), 22)), ZC_ERROR_NONE);
    }

    void ExpectPointerAnswer(uint16_t aId)
    {
        Dns::Message         query;
        Dns::Message         response;
        std::vector<uint8_t> buffer;
        uint8_t              received[Dns::kMaxMessageSize];
        ssize_t              length;

        query.mId = aId;
        query.mQuestions.emplace_back("_ssh._tcp.local.", Dns::kTypePtr);
        ASSERT_EQ(query.Pack(buffer), ZC_ERROR_NONE);
        SendToConnector(buffer);

        length = recv(mClient, received, sizeof(received), 0);
        ASSERT_GT(length, 0) << strerror(errno);
        ASSERT_EQ(response.Unpack(received, static_cast<size_t>(length)), ZC_ERROR_NONE);

        EXPECT_EQ(response.mId, aId);
        EXPECT_TRUE(response.mResponse);
        ASSERT_EQ(response.mAnswers.size(), 1u);
        EXPECT_EQ(response.mAnswers[0].mType, Dns::kTypePtr);
        EXPECT_EQ(response.mAnswers[0].mTarget, "foo._ssh._tcp.local.");
        EXPECT_EQ(response.mAdditionals.size(), 3u);
    }

    template <typename Predicate> bool WaitFor(Predicate aPredicate, int aRounds = 200)
    {
        for (int i = 0; i < aRounds; i++)
        {
            if (aPredicate())
            {
                return true;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        return aPredicate();
    }

    int       mFamily;
    LocalZone mZone;
    Connector mConnector;
    IpAddress mLoopback;
    int       mClient;
};

class ConnectorIp6Test : public ConnectorTest
{
protected:
    ConnectorIp6Test(void)
        : ConnectorTest(AF_INET6)
    {
    }
};

TEST_F(ConnectorTest, AnswersUnicastQuestion)
{
    PublishSshService();
    ExpectPointerAnswer(0x0102);
    EXPECT_TRUE(WaitFor([this]() { return mConnector.GetCounters().mResponsesBuilt.load() == 1; }));
}

TEST_F(ConnectorTest, LearnsAnnouncedRecords)
{
    Dns::Message         announcement;
    Dns::ResourceRecord  record(Dns::kTypeA);
    std::vector<uint8_t> buffer;
    EntryList            learned;

    record.mName = "bar.local.";
    record.mTtl  = 120;
    ASSERT_EQ(IpAddress::FromString("10.1.2.3", record.mAddress), ZC_ERROR_NONE);

    announcement.mResponse = true;
    announcement.mAnswers.push_back(record);
    ASSERT_EQ(announcement.Pack(buffer), ZC_ERROR_NONE);
    SendToConnector(buffer);

    ASSERT_TRUE(WaitFor([this, &learned]() {
        learned = mZone.Query(Dns::Question("bar.local.", Dns::kTypeA));
        return !learned.empty();
    }));

    EXPECT_FALSE(learned[0]->mPublish);
    EXPECT_EQ(learned[0]->mRecord, record);
    EXPECT_EQ(learned[0]->mSource.GetAddress().ToString(), GetLoopback());
}

TEST_F(ConnectorTest, DropsMalformedDatagrams)
{
    SendToConnector({0x12, 0x34, 0x00});

    EXPECT_TRUE(WaitFor([this]() { return mConnector.GetCounters().mDecodeFailures.load() == 1; }));
    EXPECT_TRUE(mZone.Query(Dns::Question("", Dns::kTypeAny)).empty());
}

TEST_F(ConnectorTest, StartTwiceFails)
{
    EXPECT_EQ(mConnector.Start(), ZC_ERROR_INVALID_STATE);

    mConnector.Stop();
    mConnector.Stop();
    EXPECT_EQ(mConnector.Start(), ZC_ERROR_INVALID_STATE);
}

TEST_F(ConnectorTest, ReopensSocketAfterReadError)
{
    PublishSshService();
    BreakConnectorSocket();

    ASSERT_TRUE(WaitFor([this]() { return mConnector.GetCounters().mRestarts.load() == 1; }, 500));
    EXPECT_GE(mConnector.GetCounters().mSocketErrors.load(), 1u);
    EXPECT_NE(mConnector.GetPort(), 0);

    ExpectPointerAnswer(0x0304);
}

TEST_F(ConnectorIp6Test, AnswersUnicastQuestion)
{
    EXPECT_EQ(mConnector.GetGroup().GetFamily(), AF_INET6);
    EXPECT_NE(mConnector.GetPort(), 0);

    PublishSshService();
    ExpectPointerAnswer(0x0506);
}

TEST_F(ConnectorIp6Test, ReopensSocketAfterReadError)
{
    PublishSshService();
    BreakConnectorSocket();

    ASSERT_TRUE(WaitFor([this]() { return mConnector.GetCounters().mRestarts.load() == 1; }, 500));
    EXPECT_GE(mConnector.GetCounters().mSocketErrors.load(), 1u);

    ExpectPointerAnswer(0x0708);
}

TEST(Connector, MulticastGroups)
{
    EXPECT_EQ(Connector::GetIp4Group().ToString(), "224.0.0.251:5353");
    EXPECT_EQ(Connector::GetIp6Group().ToString(), "[ff02::fb]:5353");
}
