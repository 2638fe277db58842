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
 *   This file includes definitions for services and their publication into a zone.
 */

#ifndef ZC_MDNS_SERVICE_HPP_
#define ZC_MDNS_SERVICE_HPP_

#include "zeroconf/config.h"

#include <stdint.h>
#include <string.h>

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "common/code_utils.hpp"
#include "common/types.hpp"
#include "dns/dns_message.hpp"
#include "mdns/zone.hpp"

namespace zc {

namespace Mdns {

/**
 * This enumeration represents the transport protocol of a service.
 */
enum class Protocol
{
    kTcp, ///< Rendered as `_tcp`.
    kUdp, ///< Rendered as `_udp`.
};

const char *ProtocolToString(Protocol aProtocol);

/**
 * This structure represents a host.
 */
struct Host
{
    std::string            mName;      ///< The host name, also used as the service instance name.
    std::string            mDomain;    ///< The domain, e.g. `local.`.
    std::vector<IpAddress> mAddresses; ///< The IPv4 and IPv6 addresses of the host.
};

/**
 * This class represents a service type, e.g. `_ssh._tcp`.
 */
class ServiceType
{
public:
    ServiceType(void);

    /**
     * Constructor.
     *
     * @param[in] aName      The symbolic service name, e.g. `_ssh`.
     * @param[in] aProtocol  The transport protocol.
     */
    ServiceType(std::string aName, Protocol aProtocol);

    const std::string &GetName(void) const { return mName; }
    Protocol           GetProtocol(void) const { return mProtocol; }

    /**
     * This method returns the type as `<name>.<protocol>`, e.g. `_ssh._tcp`.
     */
    std::string ToString(void) const;

    /**
     * This function parses a type of the form `_name._tcp` or `_name._udp`.
     *
     * @retval ZC_ERROR_NONE          Successfully parsed @p aString.
     * @retval ZC_ERROR_INVALID_ARGS  @p aString is not a service type.
     */
    static zcError FromString(const std::string &aString, ServiceType &aType);

    bool operator==(const ServiceType &aOther) const;
    bool operator!=(const ServiceType &aOther) const { return !(*this == aOther); }

private:
    std::string mName;
    Protocol    mProtocol;
};

/**
 * This class maps symbolic keys such as `ssh` to service types.
 *
 * The registry is seeded with well-known types and may be extended at run time from any thread.
 */
class ServiceTypeRegistry : private NonCopyable
{
public:
    ServiceTypeRegistry(void);

    /**
     * This method registers @p aType under @p aKey.
     *
     * @retval ZC_ERROR_NONE          Successfully registered the type.
     * @retval ZC_ERROR_INVALID_ARGS  @p aKey is empty.
     * @retval ZC_ERROR_DUPLICATED    @p aKey is registered for a different type.
     */
    zcError Register(const std::string &aKey, const ServiceType &aType);

    /**
     * This method finds the type registered under @p aKey.
     *
     * @retval ZC_ERROR_NONE       Successfully found the type.
     * @retval ZC_ERROR_NOT_FOUND  No type is registered under @p aKey.
     */
    zcError Find(const std::string &aKey, ServiceType &aType) const;

    /**
     * This method resolves @p aText, either a registry key or a literal type like `_ssh._tcp`.
     *
     * @retval ZC_ERROR_NONE       Successfully resolved the type.
     * @retval ZC_ERROR_NOT_FOUND  @p aText is neither a key nor a type.
     */
    zcError Resolve(const std::string &aText, ServiceType &aType) const;

private:
    mutable std::mutex                 mMutex;
    std::map<std::string, ServiceType> mTypes;
};

/**
 * This structure represents a key/value pair of the TXT record.
 */
struct TxtEntry
{
    std::string          mKey;                ///< The key of the TXT entry.
    std::vector<uint8_t> mValue;              ///< The value of the TXT entry. Can be empty.
    bool                 mIsBooleanAttribute; ///< This entry is boolean attribute (encoded as `key` without `=`).

    TxtEntry(const char *aKey, const char *aValue)
        : TxtEntry(aKey, strlen(aKey), reinterpret_cast<const uint8_t *>(aValue), strlen(aValue))
    {
    }

    TxtEntry(const char *aKey, size_t aKeyLength, const uint8_t *aValue, size_t aValueLength)
        : mKey(aKey, aKeyLength)
        , mValue(aValue, aValue + aValueLength)
        , mIsBooleanAttribute(false)
    {
    }

    explicit TxtEntry(const char *aKey)
        : TxtEntry(aKey, strlen(aKey))
    {
    }

    TxtEntry(const char *aKey, size_t aKeyLength)
        : mKey(aKey, aKeyLength)
        , mIsBooleanAttribute(true)
    {
    }

    bool operator==(const TxtEntry &aOther) const
    {
        return (mKey == aOther.mKey) && (mValue == aOther.mValue) &&
               (mIsBooleanAttribute == aOther.mIsBooleanAttribute);
    }
};

typedef std::vector<TxtEntry> TxtList;

/**
 * This function encodes a TXT entry list into the character strings of a TXT record.
 *
 * @param[in]  aTxtList     The TXT entries.
 * @param[out] aTxtStrings  The character strings, empty for an empty list.
 *
 * @retval ZC_ERROR_NONE          Successfully encoded the entries.
 * @retval ZC_ERROR_INVALID_ARGS  A key is empty or contains `=`, or an entry exceeds 255 bytes.
 *
 * @sa DecodeTxtData
 */
zcError EncodeTxtData(const TxtList &aTxtList, Dns::ResourceRecord::TxtStrings &aTxtStrings);

/**
 * This function decodes the character strings of a TXT record into a TXT entry list.
 *
 * Empty strings and strings starting with `=` are skipped (RFC 6763, section 6.4).
 *
 * @sa EncodeTxtData
 */
void DecodeTxtData(const Dns::ResourceRecord::TxtStrings &aTxtStrings, TxtList &aTxtList);

/**
 * This function parses `key=value` (or `key` for a boolean attribute) and appends the entry to @p aTxtList.
 *
 * @retval ZC_ERROR_NONE          Successfully parsed @p aString.
 * @retval ZC_ERROR_INVALID_ARGS  The key is empty.
 */
zcError ParseTxtEntry(const std::string &aString, TxtList &aTxtList);

/**
 * This class represents a service offered by a host.
 */
class Service
{
public:
    /**
     * Constructor.
     *
     * @param[in] aHost     The host offering the service.
     * @param[in] aType     The service type.
     * @param[in] aPort     The port of the service.
     * @param[in] aTxtList  The attributes of the service.
     */
    Service(Host aHost, ServiceType aType, uint16_t aPort, TxtList aTxtList = TxtList());

    /**
     * This method returns `<host>.<domain>`, e.g. `foo.local.`.
     */
    std::string GetFullHostName(void) const;

    /**
     * This method returns `<type>.<protocol>.<domain>`, e.g. `_ssh._tcp.local.`.
     */
    std::string GetServiceTypeName(void) const;

    /**
     * This method returns `<host>.<type>.<protocol>.<domain>`, e.g. `foo._ssh._tcp.local.`.
     */
    std::string GetServiceInstanceName(void) const;

    Host        mHost;
    ServiceType mType;
    uint16_t    mPort;
    TxtList     mTxtList;
};

/**
 * This function adds the records of @p aService to @p aZone as published entries.
 *
 * One A or AAAA record per host address, one PTR, one SRV and one TXT record are added, all with a TTL of
 * `ZC_CONFIG_PUBLISH_TTL`. No message is sent.
 *
 * @retval ZC_ERROR_NONE          Successfully published the records.
 * @retval ZC_ERROR_INVALID_ARGS  The host name is empty or is not a single label, a host address is unspecified
 *                                or the attributes cannot be encoded. Nothing is published.
 */
zcError Publish(Zone &aZone, const Service &aService);

/**
 * This function adds @p aRecord to @p aZone as a published entry.
 */
void PublishRecord(Zone &aZone, Dns::ResourceRecord aRecord);

} // namespace Mdns

} // namespace zc

#endif // ZC_MDNS_SERVICE_HPP_
