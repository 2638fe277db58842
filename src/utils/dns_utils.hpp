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
 *   This file includes DNS name utilities.
 */

#ifndef ZC_UTILS_DNS_UTILS_HPP_
#define ZC_UTILS_DNS_UTILS_HPP_

#include "zeroconf/config.h"

#include <string>

#include "common/types.hpp"

namespace zc {

namespace DnsUtils {

/**
 * This structure holds the components of a full DNS name.
 */
struct DnsNameInfo
{
    std::string mInstanceName; ///< Service instance name (e.g. "foo"), empty if not a service instance.
    std::string mServiceName;  ///< Service type (e.g. "_ssh._tcp"), empty if not a service.
    std::string mHostName;     ///< Host name (e.g. "foo"), empty if not a host.
    std::string mDomain;       ///< Domain with the trailing dot (e.g. "local.").
};

/**
 * This function splits a full DNS name into its components.
 *
 * Names of the form `instance._srv._tcp.domain`, `_srv._tcp.domain` and `host.domain` are recognized.
 *
 * @param[in] aName  The full DNS name, with or without the trailing dot.
 *
 * @returns The name components.
 */
DnsNameInfo SplitFullDnsName(const std::string &aName);

/**
 * This function returns @p aName with a trailing dot.
 */
std::string MakeAbsoluteName(const std::string &aName);

} // namespace DnsUtils

} // namespace zc

#endif // ZC_UTILS_DNS_UTILS_HPP_
