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

#include "common/types.hpp"

#include <arpa/inet.h>

#include "common/code_utils.hpp"

namespace zc {

IpAddress::IpAddress(const in_addr &aAddress)
    : mFamily(AF_INET)
{
    memset(m8, 0, sizeof(m8));
    memcpy(m8, &aAddress, sizeof(aAddress));
}

IpAddress::IpAddress(const in6_addr &aAddress)
    : mFamily(AF_INET6)
{
    memcpy(m8, &aAddress, sizeof(aAddress));
}

size_t IpAddress::GetLength(void) const
{
    size_t length = 0;

    if (IsIp4())
    {
        length = sizeof(in_addr);
    }
    else if (IsIp6())
    {
        length = sizeof(in6_addr);
    }

    return length;
}

zcError IpAddress::SetBytes(const uint8_t *aBytes, size_t aLength)
{
    zcError error = ZC_ERROR_NONE;

    VerifyOrExit(aLength == sizeof(in_addr) || aLength == sizeof(in6_addr), error = ZC_ERROR_INVALID_ARGS);

    memset(m8, 0, sizeof(m8));
    memcpy(m8, aBytes, aLength);
    mFamily = (aLength == sizeof(in_addr)) ? AF_INET : AF_INET6;

exit:
    return error;
}

in_addr IpAddress::ToIn4(void) const
{
    in_addr addr;

    memcpy(&addr, m8, sizeof(addr));
    return addr;
}

in6_addr IpAddress::ToIn6(void) const
{
    in6_addr addr;

    memcpy(&addr, m8, sizeof(addr));
    return addr;
}

std::string IpAddress::ToString(void) const
{
    char strbuf[INET6_ADDRSTRLEN];

    VerifyOrExit(IsValid(), strbuf[0] = '\0');
    VerifyOrExit(inet_ntop(mFamily, m8, strbuf, sizeof(strbuf)) != nullptr, strbuf[0] = '\0');

exit:
    return std::string(strbuf);
}

zcError IpAddress::FromString(const char *aStr, IpAddress &aAddress)
{
    zcError  error = ZC_ERROR_NONE;
    in_addr  addr4;
    in6_addr addr6;

    VerifyOrExit(aStr != nullptr, error = ZC_ERROR_INVALID_ARGS);

    if (inet_pton(AF_INET, aStr, &addr4) == 1)
    {
        aAddress = IpAddress(addr4);
    }
    else if (inet_pton(AF_INET6, aStr, &addr6) == 1)
    {
        aAddress = IpAddress(addr6);
    }
    else
    {
        error = ZC_ERROR_INVALID_ARGS;
    }

exit:
    return error;
}

bool IpAddress::operator==(const IpAddress &aOther) const
{
    return mFamily == aOther.mFamily && memcmp(m8, aOther.m8, sizeof(m8)) == 0;
}

bool IpAddress::operator<(const IpAddress &aOther) const
{
    return mFamily < aOther.mFamily || (mFamily == aOther.mFamily && memcmp(m8, aOther.m8, sizeof(m8)) < 0);
}

SocketAddress::SocketAddress(void)
{
    memset(&mStorage, 0, sizeof(mStorage));
    mStorage.ss_family = AF_UNSPEC;
}

SocketAddress::SocketAddress(const IpAddress &aAddress, uint16_t aPort)
{
    memset(&mStorage, 0, sizeof(mStorage));

    if (aAddress.IsIp4())
    {
        sockaddr_in &sin = reinterpret_cast<sockaddr_in &>(mStorage);

        sin.sin_family = AF_INET;
        sin.sin_port   = htons(aPort);
        sin.sin_addr   = aAddress.ToIn4();
    }
    else if (aAddress.IsIp6())
    {
        sockaddr_in6 &sin6 = reinterpret_cast<sockaddr_in6 &>(mStorage);

        sin6.sin6_family = AF_INET6;
        sin6.sin6_port   = htons(aPort);
        sin6.sin6_addr   = aAddress.ToIn6();
    }
    else
    {
        mStorage.ss_family = AF_UNSPEC;
    }
}

zcError SocketAddress::FromSockaddr(const sockaddr *aAddr, socklen_t aLength)
{
    zcError error = ZC_ERROR_NONE;

    VerifyOrExit(aAddr != nullptr, error = ZC_ERROR_INVALID_ARGS);
    VerifyOrExit((aAddr->sa_family == AF_INET && aLength >= sizeof(sockaddr_in)) ||
                     (aAddr->sa_family == AF_INET6 && aLength >= sizeof(sockaddr_in6)),
                 error = ZC_ERROR_INVALID_ARGS);

    memset(&mStorage, 0, sizeof(mStorage));
    memcpy(&mStorage, aAddr, aAddr->sa_family == AF_INET ? sizeof(sockaddr_in) : sizeof(sockaddr_in6));

exit:
    return error;
}

socklen_t SocketAddress::GetSockaddrLength(void) const
{
    socklen_t length = 0;

    switch (mStorage.ss_family)
    {
    case AF_INET:
        length = sizeof(sockaddr_in);
        break;
    case AF_INET6:
        length = sizeof(sockaddr_in6);
        break;
    default:
        break;
    }

    return length;
}

IpAddress SocketAddress::GetAddress(void) const
{
    IpAddress address;

    if (mStorage.ss_family == AF_INET)
    {
        address = IpAddress(reinterpret_cast<const sockaddr_in &>(mStorage).sin_addr);
    }
    else if (mStorage.ss_family == AF_INET6)
    {
        address = IpAddress(reinterpret_cast<const sockaddr_in6 &>(mStorage).sin6_addr);
    }

    return address;
}

uint16_t SocketAddress::GetPort(void) const
{
    uint16_t port = 0;

    if (mStorage.ss_family == AF_INET)
    {
        port = ntohs(reinterpret_cast<const sockaddr_in &>(mStorage).sin_port);
    }
    else if (mStorage.ss_family == AF_INET6)
    {
        port = ntohs(reinterpret_cast<const sockaddr_in6 &>(mStorage).sin6_port);
    }

    return port;
}

std::string SocketAddress::ToString(void) const
{
    std::string str;

    VerifyOrExit(IsValid(), str = "<none>");

    if (GetFamily() == AF_INET6)
    {
        str = "[" + GetAddress().ToString() + "]";
    }
    else
    {
        str = GetAddress().ToString();
    }

    str += ":" + std::to_string(GetPort());

exit:
    return str;
}

bool SocketAddress::operator==(const SocketAddress &aOther) const
{
    return GetFamily() == aOther.GetFamily() && GetAddress() == aOther.GetAddress() && GetPort() == aOther.GetPort();
}

} // namespace zc
