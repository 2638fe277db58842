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
 *   The file implements the zeroconf daemon.
 */

#define ZC_LOG_TAG "APP"

#include "agent/application.hpp"

#include <errno.h>
#include <signal.h>
#include <string.h>

#include <sys/select.h>

#include "common/code_utils.hpp"
#include "common/logging.hpp"
#include "common/time.hpp"

namespace zc {

#ifndef ZC_MAINLOOP_POLL_TIMEOUT_SEC
#define ZC_MAINLOOP_POLL_TIMEOUT_SEC 1
#endif

std::atomic_bool     Application::sShouldTerminate(false);
const struct timeval Application::kPollTimeout = {ZC_MAINLOOP_POLL_TIMEOUT_SEC, 0};

Application::Application(const Config &aConfig)
    : mConfig(aConfig)
    , mZone(aConfig.mDomain)
{
}

void Application::Init(void)
{
    if (mConfig.mEnableIp4)
    {
        StartConnector(Mdns::Connector::GetIp4Group(mConfig.mMdnsPort));
    }

    if (mConfig.mEnableIp6)
    {
        StartConnector(Mdns::Connector::GetIp6Group(mConfig.mMdnsPort));
    }

    VerifyOrDie(!mConnectors.empty(), "No multicast group is enabled");

    for (uint16_t type : mConfig.mBrowseTypes)
    {
        StartBrowser(type);
    }

    PublishService();
}

void Application::Deinit(void)
{
    for (std::unique_ptr<Mdns::Connector> &connector : mConnectors)
    {
        connector->Stop();
    }

    for (const Mdns::SubscriptionPtr &browser : mBrowsers)
    {
        mZone.Unsubscribe(browser);
    }

    for (std::thread &thread : mBrowserThreads)
    {
        thread.join();
    }

    for (std::unique_ptr<Mdns::Connector> &connector : mConnectors)
    {
        zcLogNotice("Connector %s: %s", connector->GetGroup().ToString().c_str(),
                    connector->GetCounters().ToString().c_str());
    }

    mConnectors.clear();
    mBrowsers.clear();
    mBrowserThreads.clear();
}

zcError Application::Run(void)
{
    zcError   error     = ZC_ERROR_NONE;
    Timepoint nextPurge = Clock::now() + Seconds(ZC_CONFIG_PURGE_INTERVAL);

    // allow quitting elegantly
    signal(SIGTERM, HandleSignal);
    signal(SIGINT, HandleSignal);

    while (!sShouldTerminate)
    {
        struct timeval timeout = kPollTimeout;
        Timepoint      now;

        if (select(0, nullptr, nullptr, nullptr, &timeout) < 0 && errno != EINTR)
        {
            error = ZC_ERROR_ERRNO;
            zcLogErr("select() failed: %s", strerror(errno));
            break;
        }

        now = Clock::now();

        if (now >= nextPurge)
        {
            mZone.Purge(now);
            nextPurge = now + Seconds(ZC_CONFIG_PURGE_INTERVAL);
        }
    }

    return error;
}

void Application::HandleSignal(int aSignal)
{
    sShouldTerminate = true;
    signal(aSignal, SIG_DFL);
}

void Application::StartConnector(const SocketAddress &aGroup)
{
    std::unique_ptr<Mdns::Connector> connector = MakeUnique<Mdns::Connector>(mZone, aGroup);

    SuccessOrDie(connector->Start(), "Failed to start the mDNS connector");
    mConnectors.push_back(std::move(connector));
}

void Application::PublishService(void)
{
    Mdns::ServiceType type;
    Mdns::Host        host;

    if (mConfig.mHostName.empty() || mConfig.mServiceType.empty())
    {
        zcLogNotice("No service to publish");
        ExitNow();
    }

    SuccessOrDie(mRegistry.Resolve(mConfig.mServiceType, type), "Unknown service type");

    host.mName      = mConfig.mHostName;
    host.mDomain    = mConfig.mDomain;
    host.mAddresses = mConfig.mAddresses;

    SuccessOrDie(Mdns::Publish(mZone, Mdns::Service(host, type, mConfig.mPort, mConfig.mTxtList)),
                 "Failed to publish the service");

exit:
    return;
}

void Application::StartBrowser(uint16_t aType)
{
    Mdns::SubscriptionPtr subscription = mZone.Subscribe(aType);

    zcLogInfo("Browsing %s records", Dns::TypeToString(aType).c_str());

    mBrowsers.push_back(subscription);
    mBrowserThreads.emplace_back([subscription]() {
        Mdns::EntryPtr entry;

        while (subscription->mResult->Pop(entry))
        {
            zcLogNotice("Discovered %s", entry->ToString().c_str());
        }
    });
}

} // namespace zc
