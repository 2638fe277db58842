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
 *   This file includes definition for the zeroconf daemon application.
 */

#ifndef ZC_AGENT_APPLICATION_HPP_
#define ZC_AGENT_APPLICATION_HPP_

#include "zeroconf/config.h"

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <sys/time.h>

#include "common/code_utils.hpp"
#include "common/types.hpp"
#include "mdns/connector.hpp"
#include "mdns/entry.hpp"
#include "mdns/service.hpp"
#include "mdns/zone.hpp"

namespace zc {

/**
 * @addtogroup zeroconf-agent
 *
 * @brief
 *   This module includes definition for the zeroconf daemon application.
 *
 * @{
 */

/**
 * This class implements the zeroconf daemon application management.
 */
class Application : private NonCopyable
{
public:
    /**
     * This structure represents the configuration of the application.
     */
    struct Config
    {
        std::string            mHostName;                        ///< The host and instance name, no service published if empty.
        std::string            mDomain    = "local.";            ///< The domain of the published service.
        std::vector<IpAddress> mAddresses;                       ///< The addresses of the host.
        std::string            mServiceType;                     ///< A registry key or `_name._tcp`, no service published if empty.
        uint16_t               mPort = 0;                        ///< The port of the service.
        Mdns::TxtList          mTxtList;                         ///< The attributes of the service.
        std::vector<uint16_t>  mBrowseTypes;                     ///< The record types whose entries are logged.
        bool                   mEnableIp4 = true;                ///< Whether to listen on the IPv4 group.
        bool                   mEnableIp6 = true;                ///< Whether to listen on the IPv6 group.
        uint16_t               mMdnsPort  = ZC_CONFIG_MDNS_PORT; ///< The port of the mDNS groups.
    };

    /**
     * This constructor initializes the Application instance.
     *
     * @param[in] aConfig  The configuration.
     */
    explicit Application(const Config &aConfig);

    /**
     * This method initializes the Application instance.
     *
     * The connectors are started and the configured service is published. Any failure terminates the process.
     */
    void Init(void);

    /**
     * This method de-initializes the Application instance.
     */
    void Deinit(void);

    /**
     * This method runs the application until SIGTERM or SIGINT.
     *
     * @retval ZC_ERROR_NONE   The application exited without any error.
     * @retval ZC_ERROR_ERRNO  The application exited with some system error.
     */
    zcError Run(void);

    /**
     * Get the zone the application is using.
     *
     * @returns The zone.
     */
    Mdns::LocalZone &GetZone(void) { return mZone; }

    /**
     * Get the service type registry the application is using.
     *
     * @returns The service type registry.
     */
    Mdns::ServiceTypeRegistry &GetRegistry(void) { return mRegistry; }

private:
    // Default poll timeout.
    static const struct timeval kPollTimeout;

    static void HandleSignal(int aSignal);

    void StartConnector(const SocketAddress &aGroup);
    void PublishService(void);
    void StartBrowser(uint16_t aType);

    Config                                        mConfig;
    Mdns::ServiceTypeRegistry                     mRegistry;
    Mdns::LocalZone                               mZone;
    std::vector<std::unique_ptr<Mdns::Connector>> mConnectors;
    std::vector<Mdns::SubscriptionPtr>            mBrowsers;
    std::vector<std::thread>                      mBrowserThreads;

    static std::atomic_bool sShouldTerminate;
};

/**
 * @}
 */

} // namespace zc

#endif // ZC_AGENT_APPLICATION_HPP_
