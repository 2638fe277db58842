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

#define ZC_LOG_TAG "SERVICE"

#include "mdns/service.hpp"

#include "common/logging.hpp"
#include "common/time.hpp"
#include "utils/dns_utils.hpp"

namespace zc {

namespace Mdns {

namespace {

constexpr size_t kMaxTextEntrySize = 255;

const struct
{
    const char *mKey;
    const char *mName;
    Protocol    mProtocol;
} kWellKnownTypes[] = {
    {"ssh", "_ssh", Protocol::kTcp},
    {"sftp-ssh", "_sftp-ssh", Protocol::kTcp},
    {"http", "_http", Protocol::kTcp},
    {"https", "_https", Protocol::kTcp},
    {"ipp", "_ipp", Protocol::kTcp},
    {"printer", "_printer", Protocol::kTcp},
    {"workstation", "_workstation", Protocol::kTcp},
    {"device-info", "_device-info", Protocol::kTcp},
};

} // namespace

const char *ProtocolToString(Protocol aProtocol)
{
    return aProtocol == Protocol::kTcp ? "_tcp" : "_udp";
}

ServiceType::ServiceType(void)
    : mProtocol(Protocol::kTcp)
{
}

ServiceType::ServiceType(std::string aName, Protocol aProtocol)
    : mName(std::move(aName))
    , mProtocol(aProtocol)
{
}

std::string ServiceType::ToString(void) const
{
    return mName + "." + ProtocolToString(mProtocol);
}

zcError ServiceType::FromString(const std::string &aString, ServiceType &aType)
{
    zcError     error = ZC_ERROR_NONE;
    std::string text  = aString;
    size_t      dotPos;
    std::string protocol;

    if (!text.empty() && text.back() == '.')
    {
        text.pop_back();
    }

    dotPos = text.rfind('.');
    VerifyOrExit(dotPos != std::string::npos && dotPos > 1 && text[0] == '_', error = ZC_ERROR_INVALID_ARGS);
    VerifyOrExit(text.find('.') == dotPos, error = ZC_ERROR_INVALID_ARGS);

    protocol = text.substr(dotPos + 1);

    if (protocol == ProtocolToString(Protocol::kTcp))
    {
        aType = ServiceType(text.substr(0, dotPos), Protocol::kTcp);
    }
    else if (protocol == ProtocolToString(Protocol::kUdp))
    {
        aType = ServiceType(text.substr(0, dotPos), Protocol::kUdp);
    }
    else
    {
        error = ZC_ERROR_INVALID_ARGS;
    }

exit:
    return error;
}

bool ServiceType::operator==(const ServiceType &aOther) const
{
    return mName == aOther.mName && mProtocol == aOther.mProtocol;
}

ServiceTypeRegistry::ServiceTypeRegistry(void)
{
    for (const auto &wellKnown : kWellKnownTypes)
    {
        mTypes.emplace(wellKnown.mKey, ServiceType(wellKnown.mName, wellKnown.mProtocol));
    }
}

zcError ServiceTypeRegistry::Register(const std::string &aKey, const ServiceType &aType)
{
    zcError                     error = ZC_ERROR_NONE;
    std::lock_guard<std::mutex> lock(mMutex);

    VerifyOrExit(!aKey.empty(), error = ZC_ERROR_INVALID_ARGS);

    {
        auto result = mTypes.emplace(aKey, aType);

        VerifyOrExit(result.second || result.first->second == aType, error = ZC_ERROR_DUPLICATED);
    }

exit:
    zcLogResult(error, "Register service type %s as %s", aKey.c_str(), aType.ToString().c_str());
    return error;
}

zcError ServiceTypeRegistry::Find(const std::string &aKey, ServiceType &aType) const
{
    zcError                     error = ZC_ERROR_NONE;
    std::lock_guard<std::mutex> lock(mMutex);
    auto                        it = mTypes.find(aKey);

    VerifyOrExit(it != mTypes.end(), error = ZC_ERROR_NOT_FOUND);
    aType = it->second;

exit:
    return error;
}

zcError ServiceTypeRegistry::Resolve(const std::string &aText, ServiceType &aType) const
{
    zcError error = Find(aText, aType);

    if (error == ZC_ERROR_NOT_FOUND && ServiceType::FromString(aText, aType) == ZC_ERROR_NONE)
    {
        error = ZC_ERROR_NONE;
    }

    return error;
}

zcError EncodeTxtData(const TxtList &aTxtList, Dns::ResourceRecord::TxtStrings &aTxtStrings)
{
    zcError error = ZC_ERROR_NONE;

    aTxtStrings.clear();

    for (const TxtEntry &txtEntry : aTxtList)
    {
        std::string entry = txtEntry.mKey;

        VerifyOrExit(!txtEntry.mKey.empty() && txtEntry.mKey.find('=') == std::string::npos,
                     error = ZC_ERROR_INVALID_ARGS);

        if (!txtEntry.mIsBooleanAttribute)
        {
            entry.push_back('=');
            entry.append(txtEntry.mValue.begin(), txtEntry.mValue.end());
        }

        VerifyOrExit(entry.size() <= kMaxTextEntrySize, error = ZC_ERROR_INVALID_ARGS);
        aTxtStrings.push_back(std::move(entry));
    }

exit:
    if (error != ZC_ERROR_NONE)
    {
        aTxtStrings.clear();
    }

    return error;
}

void DecodeTxtData(const Dns::ResourceRecord::TxtStrings &aTxtStrings, TxtList &aTxtList)
{
    aTxtList.clear();

    for (const std::string &string : aTxtStrings)
    {
        size_t keyEnd = string.find('=');

        if (string.empty() || keyEnd == 0)
        {
            continue;
        }

        if (keyEnd == std::string::npos)
        {
            // No `=`, treat as a boolean attribute.
            aTxtList.emplace_back(string.data(), string.size());
        }
        else
        {
            aTxtList.emplace_back(string.data(), keyEnd, reinterpret_cast<const uint8_t *>(string.data()) + keyEnd + 1,
                                  string.size() - keyEnd - 1);
        }
    }
}

zcError ParseTxtEntry(const std::string &aString, TxtList &aTxtList)
{
    zcError error  = ZC_ERROR_NONE;
    size_t  keyEnd = aString.find('=');

    VerifyOrExit(!aString.empty() && keyEnd != 0, error = ZC_ERROR_INVALID_ARGS);

    if (keyEnd == std::string::npos)
    {
        aTxtList.emplace_back(aString.data(), aString.size());
    }
    else
    {
        aTxtList.emplace_back(aString.data(), keyEnd, reinterpret_cast<const uint8_t *>(aString.data()) + keyEnd + 1,
                              aString.size() - keyEnd - 1);
    }

exit:
    return error;
}

Service::Service(Host aHost, ServiceType aType, uint16_t aPort, TxtList aTxtList)
    : mHost(std::move(aHost))
    , mType(std::move(aType))
    , mPort(aPort)
    , mTxtList(std::move(aTxtList))
{
}

std::string Service::GetFullHostName(void) const
{
    return DnsUtils::MakeAbsoluteName(mHost.mName + "." + mHost.mDomain);
}

std::string Service::GetServiceTypeName(void) const
{
    return DnsUtils::MakeAbsoluteName(mType.ToString() + "." + mHost.mDomain);
}

std::string Service::GetServiceInstanceName(void) const
{
    return mHost.mName + "." + GetServiceTypeName();
}

zcError Publish(Zone &aZone, const Service &aService)
{
    zcError                          error = ZC_ERROR_NONE;
    std::vector<Dns::ResourceRecord> records;
    Dns::ResourceRecord              ptr(Dns::kTypePtr);
    Dns::ResourceRecord              srv(Dns::kTypeSrv);
    Dns::ResourceRecord              txt(Dns::kTypeTxt);

    // The host name is also the instance label.
    VerifyOrExit(!aService.mHost.mName.empty() && aService.mHost.mName.find('.') == std::string::npos,
                 error = ZC_ERROR_INVALID_ARGS);

    for (const IpAddress &address : aService.mHost.mAddresses)
    {
        Dns::ResourceRecord record(address.IsIp4() ? Dns::kTypeA : Dns::kTypeAaaa);

        VerifyOrExit(address.IsValid(), error = ZC_ERROR_INVALID_ARGS);

        record.mName    = aService.GetFullHostName();
        record.mTtl     = ZC_CONFIG_PUBLISH_TTL;
        record.mAddress = address;
        records.push_back(std::move(record));
    }

    ptr.mName   = aService.GetServiceTypeName();
    ptr.mTtl    = ZC_CONFIG_PUBLISH_TTL;
    ptr.mTarget = aService.GetServiceInstanceName();
    records.push_back(std::move(ptr));

    srv.mName   = aService.GetServiceInstanceName();
    srv.mTtl    = ZC_CONFIG_PUBLISH_TTL;
    srv.mPort   = aService.mPort;
    srv.mTarget = aService.GetFullHostName();
    records.push_back(std::move(srv));

    txt.mName = aService.GetServiceInstanceName();
    txt.mTtl  = ZC_CONFIG_PUBLISH_TTL;
    SuccessOrExit(error = EncodeTxtData(aService.mTxtList, txt.mTxtStrings));
    records.push_back(std::move(txt));

    for (Dns::ResourceRecord &record : records)
    {
        PublishRecord(aZone, std::move(record));
    }

exit:
    zcLogResult(error, "Publish service %s port %u", aService.GetServiceInstanceName().c_str(), aService.mPort);
    return error;
}

void PublishRecord(Zone &aZone, Dns::ResourceRecord aRecord)
{
    Timepoint expires = GetExpiry(Clock::now(), aRecord.mTtl);

    aZone.Add(std::make_shared<Entry>(std::move(aRecord), /* aPublish */ true, expires));
}

} // namespace Mdns

} // namespace zc
