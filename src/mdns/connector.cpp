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

#define ZC_LOG_TAG "CONNECTOR"

#include "mdns/connector.hpp"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <string.h>
#include <unistd.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <algorithm>
#include <chrono>
#include <vector>

#include "common/logging.hpp"
#include "common/time.hpp"

namespace zc {

namespace Mdns {

Connector::Connector(Zone &aZone, const SocketAddress &aGroup)
    : mGroup(aGroup)
    , mResponder(aZone)
    , mFd(-1)
    , mPort(0)
    , mRunning(false)
    , mQueue(ZC_CONFIG_CONNECTOR_QUEUE_CAPACITY)
{
    mWakeFd[kRead]  = -1;
    mWakeFd[kWrite] = -1;
}

Connector::~Connector(void)
{
    Stop();
}

SocketAddress Connector::GetIp4Group(uint16_t aPort)
{
    in_addr group;

    group.s_addr = htonl(INADDR_ALLHOSTS_GROUP | 0xfb); // 224.0.0.251

    return SocketAddress(IpAddress(group), aPort);
}

SocketAddress Connector::GetIp6Group(uint16_t aPort)
{
    in6_addr group = {};

    group.s6_addr[0]  = 0xff;
    group.s6_addr[1]  = 0x02;
    group.s6_addr[15] = 0xfb; // ff02::fb

    return SocketAddress(IpAddress(group), aPort);
}

zcError Connector::Start(void)
{
    zcError error = ZC_ERROR_NONE;

    VerifyOrExit(!mRunning && !mQueue.IsClosed(), error = ZC_ERROR_INVALID_STATE);
    VerifyOrExit(mGroup.IsValid(), error = ZC_ERROR_INVALID_ARGS);
    VerifyOrExit(pipe2(mWakeFd, O_CLOEXEC) == 0, error = ZC_ERROR_ERRNO);
    SuccessOrExit(error = OpenSocket());

    mRunning   = true;
    mReceiver  = std::thread(&Connector::ReceiveLoop, this);
    mProcessor = std::thread(&Connector::ProcessLoop, this);

exit:
    if (error != ZC_ERROR_NONE && !mRunning)
    {
        for (int &fd : mWakeFd)
        {
            if (fd >= 0)
            {
                close(fd);
                fd = -1;
            }
        }
    }

    zcLogResult(error, "Start connector for %s", mGroup.ToString().c_str());
    return error;
}

void Connector::Stop(void)
{
    static const uint8_t kOne = 1;
    ssize_t              rval;

    VerifyOrExit(mRunning);
    mRunning = false;

    // The byte is never read, so every later poll on the pipe returns at once.
    do
    {
        rval = write(mWakeFd[kWrite], &kOne, sizeof(kOne));
    } while (rval == -1 && errno == EINTR);
    VerifyOrDie(rval == sizeof(kOne), strerror(errno));

    mQueue.Close();
    mReceiver.join();
    mProcessor.join();

    CloseSocket();
    close(mWakeFd[kRead]);
    close(mWakeFd[kWrite]);
    mWakeFd[kRead]  = -1;
    mWakeFd[kWrite] = -1;

    zcLogInfo("Stopped connector for %s: %s", mGroup.ToString().c_str(), GetCounters().ToString().c_str());

exit:
    return;
}

zcError Connector::OpenSocket(void)
{
    zcError          error  = ZC_ERROR_NONE;
    int              family = mGroup.GetFamily();
    int              on     = 1;
    int              hops   = 255;
    int              fd;
    sockaddr_storage bound;
    socklen_t        boundLength = sizeof(bound);
    SocketAddress    local;

    fd = socket(family, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_UDP);
    VerifyOrExit(fd >= 0, error = ZC_ERROR_ERRNO);

    VerifyOrExit(setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) == 0, error = ZC_ERROR_ERRNO);
#ifdef SO_REUSEPORT
    VerifyOrExit(setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &on, sizeof(on)) == 0, error = ZC_ERROR_ERRNO);
#endif

    if (family == AF_INET6)
    {
        ipv6_mreq mreq;

        local = SocketAddress(IpAddress(in6addr_any), mGroup.GetPort());

        VerifyOrExit(setsockopt(fd, IPPROTO_IPV6, IPV6_V6ONLY, &on, sizeof(on)) == 0, error = ZC_ERROR_ERRNO);
        VerifyOrExit(bind(fd, local.AsSockaddr(), local.GetSockaddrLength()) == 0, error = ZC_ERROR_ERRNO);

        mreq.ipv6mr_multiaddr = mGroup.GetAddress().ToIn6();
        mreq.ipv6mr_interface = 0;
        VerifyOrExit(setsockopt(fd, IPPROTO_IPV6, IPV6_JOIN_GROUP, &mreq, sizeof(mreq)) == 0,
                     error = ZC_ERROR_ERRNO);
        VerifyOrExit(setsockopt(fd, IPPROTO_IPV6, IPV6_MULTICAST_HOPS, &hops, sizeof(hops)) == 0,
                     error = ZC_ERROR_ERRNO);
    }
    else
    {
        in_addr any;
        ip_mreq mreq;

        any.s_addr = htonl(INADDR_ANY);
        local      = SocketAddress(IpAddress(any), mGroup.GetPort());

        VerifyOrExit(bind(fd, local.AsSockaddr(), local.GetSockaddrLength()) == 0, error = ZC_ERROR_ERRNO);

        mreq.imr_multiaddr        = mGroup.GetAddress().ToIn4();
        mreq.imr_interface.s_addr = htonl(INADDR_ANY);
        VerifyOrExit(setsockopt(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) == 0, error = ZC_ERROR_ERRNO);
        VerifyOrExit(setsockopt(fd, IPPROTO_IP, IP_MULTICAST_TTL, &hops, sizeof(hops)) == 0, error = ZC_ERROR_ERRNO);
    }

    VerifyOrExit(getsockname(fd, reinterpret_cast<sockaddr *>(&bound), &boundLength) == 0, error = ZC_ERROR_ERRNO);
    SuccessOrExit(error = local.FromSockaddr(reinterpret_cast<sockaddr *>(&bound), boundLength));

    {
        std::lock_guard<std::mutex> lock(mFdMutex);

        mFd   = fd;
        mPort = local.GetPort();
        fd    = -1;
    }

exit:
    if (error != ZC_ERROR_NONE)
    {
        zcLogWarning("Failed to open socket for %s: %s", mGroup.ToString().c_str(), strerror(errno));
    }

    if (fd >= 0)
    {
        close(fd);
    }

    return error;
}

void Connector::CloseSocket(void)
{
    std::lock_guard<std::mutex> lock(mFdMutex);

    if (mFd >= 0)
    {
        close(mFd);
        mFd   = -1;
        mPort = 0;
    }
}

int Connector::GetFd(void)
{
    std::lock_guard<std::mutex> lock(mFdMutex);

    return mFd;
}

void Connector::Restart(void)
{
    Seconds backoff(ZC_CONFIG_RESTART_MIN_BACKOFF);

    CloseSocket();

    while (mRunning)
    {
        pollfd wake = {mWakeFd[kRead], POLLIN, 0};

        zcLogInfo("Reopening socket for %s in %lld s", mGroup.ToString().c_str(),
                  static_cast<long long>(backoff.count()));

        if (poll(&wake, 1, static_cast<int>(std::chrono::duration_cast<Milliseconds>(backoff).count())) > 0)
        {
            break;
        }

        if (OpenSocket() == ZC_ERROR_NONE)
        {
            GetCounters().mRestarts++;
            zcLogNotice("Reopened socket for %s", mGroup.ToString().c_str());
            break;
        }

        backoff = std::min(backoff * 2, Seconds(ZC_CONFIG_RESTART_MAX_BACKOFF));
    }
}

void Connector::ReceiveLoop(void)
{
    std::vector<uint8_t> buffer(ZC_CONFIG_RECEIVE_BUFFER_SIZE);

    while (mRunning)
    {
        int              fd = GetFd();
        pollfd           fds[2];
        sockaddr_storage from;
        socklen_t        fromLength = sizeof(from);
        ssize_t          length;

        fds[0] = {fd, POLLIN, 0};
        fds[1] = {mWakeFd[kRead], POLLIN, 0};

        if (poll(fds, 2, -1) < 0)
        {
            VerifyOrDie(errno == EINTR, strerror(errno));
            continue;
        }

        if (fds[1].revents != 0)
        {
            break;
        }

        length = recvfrom(fd, buffer.data(), buffer.size(), 0, reinterpret_cast<sockaddr *>(&from), &fromLength);

        if (length < 0)
        {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
            {
                continue;
            }

            zcLogWarning("Failed to read from %s: %s", mGroup.ToString().c_str(), strerror(errno));
            GetCounters().mSocketErrors++;
            Restart();
            continue;
        }

        HandleDatagram(buffer.data(), static_cast<size_t>(length), reinterpret_cast<sockaddr *>(&from), fromLength);
    }
}

void Connector::HandleDatagram(const uint8_t *aBuffer, size_t aLength, const sockaddr *aFrom, socklen_t aFromLength)
{
    Incoming incoming;

    SuccessOrExit(incoming.mSource.FromSockaddr(aFrom, aFromLength));

    if (incoming.mMessage.Unpack(aBuffer, aLength) != ZC_ERROR_NONE)
    {
        zcLogWarning("Failed to decode %zu bytes from %s", aLength, incoming.mSource.ToString().c_str());
        zcDump(ZC_LOG_DEBUG, ZC_LOG_TAG, "datagram", aBuffer, aLength);
        GetCounters().mDecodeFailures++;
        ExitNow();
    }

    zcLogDebug("Received from %s\n%s", incoming.mSource.ToString().c_str(), incoming.mMessage.ToString().c_str());

    if (!mQueue.Push(std::move(incoming)))
    {
        zcLogDebug("Connector for %s is stopping, dropped a message", mGroup.ToString().c_str());
    }

exit:
    return;
}

void Connector::ProcessLoop(void)
{
    Incoming incoming;

    while (mQueue.Pop(incoming))
    {
        Dns::Message response;

        if (mResponder.HandleMessage(incoming.mMessage, incoming.mSource, response) == ZC_ERROR_NONE)
        {
            IgnoreError(Send(response, incoming.mSource));
        }
    }
}

zcError Connector::Send(const Dns::Message &aMessage, const SocketAddress &aDestination)
{
    zcError              error = ZC_ERROR_NONE;
    std::vector<uint8_t> buffer;
    ssize_t              sent;

    SuccessOrExit(error = aMessage.Pack(buffer), GetCounters().mEncodeFailures++);

    {
        std::lock_guard<std::mutex> lock(mFdMutex);

        VerifyOrExit(mFd >= 0, error = ZC_ERROR_INVALID_STATE);
        sent = sendto(mFd, buffer.data(), buffer.size(), 0, aDestination.AsSockaddr(),
                      aDestination.GetSockaddrLength());
    }

    VerifyOrExit(sent == static_cast<ssize_t>(buffer.size()), error = ZC_ERROR_ERRNO, GetCounters().mSocketErrors++);
    zcLogDebug("Sent %zu bytes to %s", buffer.size(), aDestination.ToString().c_str());

exit:
    if (error != ZC_ERROR_NONE)
    {
        zcLogWarning("Failed to send to %s: %s", aDestination.ToString().c_str(),
                     error == ZC_ERROR_ERRNO ? strerror(errno) : zcErrorString(error));
    }

    return error;
}

} // namespace Mdns

} // namespace zc
