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
 *   This file includes definition for data types used by the zeroconf responder.
 */

#ifndef ZC_COMMON_TYPES_HPP_
#define ZC_COMMON_TYPES_HPP_

#include "zeroconf/config.h"

#include <stdint.h>
#include <string.h>
#include <string>
#include <vector>

#include <netinet/in.h>
#include <sys/socket.h>

/**
 * This enumeration represents error codes used throughout the zeroconf responder.
 */
enum zcError
{
    ZC_ERROR_NONE = 0, ///< No error.

    ZC_ERROR_ERRNO           = -1,  ///< Error defined by errno.
    ZC_ERROR_MDNS            = -2,  ///< mDNS error.
    ZC_ERROR_NOT_FOUND       = -3,  ///< Not found.
    ZC_ERROR_PARSE           = -4,  ///< Parse error.
    ZC_ERROR_NOT_IMPLEMENTED = -5,  ///< Not implemented error.
    ZC_ERROR_INVALID_ARGS    = -6,  ///< Invalid arguments error.
    ZC_ERROR_DUPLICATED      = -7,  ///< Duplicated operation, resource or name.
    ZC_ERROR_ABORTED         = -8,  ///< The operation is aborted.
    ZC_ERROR_INVALID_STATE   = -9,  ///< The target isn't in correct state.
    ZC_ERROR_NO_BUFS         = -10, ///< Insufficient buffer space.
};

namespace zc {

/**
 * This class implements an IPv4 or IPv6 address.
 */
class IpAddress
{
public:
    /**
     * Default constructor, the address is unspecified (neither IPv4 nor IPv6).
     */
    IpAddress(void)
        : mFamily(AF_UNSPEC)
    {
        memset(m8, 0, sizeof(m8));
    }

    /**
     * Constructor with an IPv4 address.
     *
     * @param[in] aAddress  The IPv4 address.
     */
    explicit IpAddress(const in_addr &aAddress);

    /**
     * Constructor with an IPv6 address.
     *
     * @param[in] aAddress  The IPv6 address.
     */
    explicit IpAddress(const in6_addr &aAddress);

    /**
     * This method returns the address family, `AF_INET`, `AF_INET6` or `AF_UNSPEC`.
     */
    int GetFamily(void) const { return mFamily; }

    bool IsIp4(void) const { return mFamily == AF_INET; }
    bool IsIp6(void) const { return mFamily == AF_INET6; }
    bool IsValid(void) const { return mFamily != AF_UNSPEC; }

    /**
     * This method returns the address bytes in network order.
     */
    const uint8_t *GetBytes(void) const { return m8; }

    /**
     * This method returns the number of address bytes (4, 16 or 0 if unspecified).
     */
    size_t GetLength(void) const;

    /**
     * This method sets the address from raw network-order bytes.
     *
     * @param[in] aBytes   A pointer to the address bytes.
     * @param[in] aLength  4 for an IPv4 address and 16 for an IPv6 address.
     *
     * @retval ZC_ERROR_NONE          Successfully set the address.
     * @retval ZC_ERROR_INVALID_ARGS  @p aLength is neither 4 nor 16.
     */
    zcError SetBytes(const uint8_t *aBytes, size_t aLength);

    in_addr  ToIn4(void) const;
    in6_addr ToIn6(void) const;

    /**
     * This method returns the string representation of the address.
     *
     * @returns The address in presentation format, or an empty string if unspecified.
     */
    std::string ToString(void) const;

    /**
     * This function converts an address from its presentation format.
     *
     * @param[in]  aStr      The IPv4 or IPv6 address string.
     * @param[out] aAddress  A reference to the address to output.
     *
     * @retval ZC_ERROR_NONE          Successfully converted the string.
     * @retval ZC_ERROR_INVALID_ARGS  @p aStr is not a valid address.
     */
    static zcError FromString(const char *aStr, IpAddress &aAddress);

    bool operator==(const IpAddress &aOther) const;
    bool operator!=(const IpAddress &aOther) const { return !(*this == aOther); }
    bool operator<(const IpAddress &aOther) const;

private:
    int     mFamily;
    uint8_t m8[16];
};

/**
 * This class implements a UDP endpoint, an IP address plus a port.
 */
class SocketAddress
{
public:
    SocketAddress(void);

    /**
     * Constructor with an address and a port.
     *
     * @param[in] aAddress  The IP address.
     * @param[in] aPort     The port in host order.
     */
    SocketAddress(const IpAddress &aAddress, uint16_t aPort);

    /**
     * This method sets the endpoint from a socket address returned by the kernel.
     *
     * @retval ZC_ERROR_NONE          Successfully set the endpoint.
     * @retval ZC_ERROR_INVALID_ARGS  The address family is not supported.
     */
    zcError FromSockaddr(const sockaddr *aAddr, socklen_t aLength);

    const sockaddr *AsSockaddr(void) const { return reinterpret_cast<const sockaddr *>(&mStorage); }
    socklen_t       GetSockaddrLength(void) const;

    IpAddress GetAddress(void) const;
    uint16_t  GetPort(void) const;
    int       GetFamily(void) const { return mStorage.ss_family; }
    bool      IsValid(void) const { return mStorage.ss_family != AF_UNSPEC; }

    /**
     * This method returns the endpoint as `a.b.c.d:port` or `[x::y]:port`.
     */
    std::string ToString(void) const;

    bool operator==(const SocketAddress &aOther) const;
    bool operator!=(const SocketAddress &aOther) const { return !(*this == aOther); }

private:
    sockaddr_storage mStorage;
};

} // namespace zc

#endif // ZC_COMMON_TYPES_HPP_
