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

#define ZC_LOG_TAG "AGENT"

#include "zeroconf/config.h"

#include <errno.h>
#include <getopt.h>
#include <limits.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <new>
#include <string>

#include "agent/application.hpp"
#include "common/code_utils.hpp"
#include "common/logging.hpp"
#include "common/types.hpp"
#include "dns/dns_message.hpp"
#include "mdns/service.hpp"

enum
{
    ZC_OPT_ADDRESS        = 'a',
    ZC_OPT_BROWSE         = 'b',
    ZC_OPT_DEBUG_LEVEL    = 'd',
    ZC_OPT_DOMAIN         = 'D',
    ZC_OPT_HELP           = 'h',
    ZC_OPT_HOST_NAME      = 'n',
    ZC_OPT_PORT           = 'p',
    ZC_OPT_SYSLOG_DISABLE = 's',
    ZC_OPT_SERVICE_TYPE   = 't',
    ZC_OPT_TXT            = 'T',
    ZC_OPT_VERBOSE        = 'v',
    ZC_OPT_VERSION        = 'V',
    ZC_OPT_SHORTMAX       = 128,
    ZC_OPT_IPV4_ONLY,
    ZC_OPT_IPV6_ONLY,
};

static const struct option kOptions[] = {{"address", required_argument, nullptr, ZC_OPT_ADDRESS},
                                         {"browse", required_argument, nullptr, ZC_OPT_BROWSE},
                                         {"debug-level", required_argument, nullptr, ZC_OPT_DEBUG_LEVEL},
                                         {"domain", required_argument, nullptr, ZC_OPT_DOMAIN},
                                         {"help", no_argument, nullptr, ZC_OPT_HELP},
                                         {"host-name", required_argument, nullptr, ZC_OPT_HOST_NAME},
                                         {"port", required_argument, nullptr, ZC_OPT_PORT},
                                         {"syslog-disable", no_argument, nullptr, ZC_OPT_SYSLOG_DISABLE},
                                         {"service-type", required_argument, nullptr, ZC_OPT_SERVICE_TYPE},
                                         {"txt", required_argument, nullptr, ZC_OPT_TXT},
                                         {"verbose", no_argument, nullptr, ZC_OPT_VERBOSE},
                                         {"version", no_argument, nullptr, ZC_OPT_VERSION},
                                         {"ipv4-only", no_argument, nullptr, ZC_OPT_IPV4_ONLY},
                                         {"ipv6-only", no_argument, nullptr, ZC_OPT_IPV6_ONLY},
                                         {0, 0, 0, 0}};

static bool ParseInteger(const char *aStr, long &aOutResult)
{
    bool  successful = true;
    char *strEnd;
    long  result;

    VerifyOrExit(aStr != nullptr, successful = false);
    errno  = 0;
    result = strtol(aStr, &strEnd, 0);
    VerifyOrExit(errno != ERANGE, successful = false);
    VerifyOrExit(aStr != strEnd && *strEnd == '\0', successful = false);

    aOutResult = result;

exit:
    return successful;
}

static void PrintHelp(const char *aProgramName)
{
    fprintf(stderr,
            "Usage: %s [-d DEBUG_LEVEL] [-v] [-s] [-n HOST_NAME] [-D DOMAIN] [-a ADDRESS]... [-t SERVICE_TYPE] "
            "[-p PORT] [-T KEY=VALUE]... [-b RECORD_TYPE]... [--ipv4-only|--ipv6-only]\n"
            "     -d, --debug-level      The log level (EMERG=0, ALERT=1, CRIT=2, ERR=3, WARNING=4, NOTICE=5, INFO=6, "
            "DEBUG=7).\n"
            "     -v, --verbose          Enable verbose logging.\n"
            "     -s, --syslog-disable   Disable syslog and print to standard out.\n"
            "     -h, --help             Show this help text.\n"
            "     -V, --version          Print the application's version and exit.\n"
            "     -n, --host-name        Host and instance name of the published service (default: the system host "
            "name).\n"
            "     -D, --domain           Domain of the published service (default: local.).\n"
            "     -a, --address          IPv4 or IPv6 address of the host (can be specified multiple times).\n"
            "     -t, --service-type     Type of the published service, a known name such as `ssh` or `_name._tcp`.\n"
            "     -p, --port             Port of the published service.\n"
            "     -T, --txt              Attribute of the published service (can be specified multiple times).\n"
            "     -b, --browse           Log the entries of a record type: a, aaaa, ptr, srv, txt or any (can be "
            "specified multiple times).\n"
            "     --ipv4-only            Listen on the IPv4 group only.\n"
            "     --ipv6-only            Listen on the IPv6 group only.\n"
            "\n",
            aProgramName);
}

static void PrintVersion(void)
{
    printf("%s\n", ZC_PACKAGE_VERSION);
}

static void OnAllocateFailed(void)
{
    zcLogCrit("Allocate failure, exiting...");
    exit(1);
}

static std::string GetDefaultHostName(void)
{
    char        name[HOST_NAME_MAX + 1];
    std::string hostName;

    VerifyOrExit(gethostname(name, sizeof(name)) == 0);
    name[sizeof(name) - 1] = '\0';
    hostName               = name;
    hostName               = hostName.substr(0, hostName.find('.'));

exit:
    return hostName;
}

static int realmain(int argc, char *argv[])
{
    zcLogLevel              logLevel      = ZC_LOG_INFO;
    int                     opt;
    int                     ret           = EXIT_SUCCESS;
    bool                    verbose       = false;
    bool                    syslogDisable = false;
    long                    parseResult;
    zc::IpAddress           address;
    uint16_t                type;
    zc::Application::Config config;

    std::set_new_handler(OnAllocateFailed);

    while ((opt = getopt_long(argc, argv, "a:b:d:D:hn:p:st:T:vV", kOptions, nullptr)) != -1)
    {
        switch (opt)
        {
        case ZC_OPT_ADDRESS:
            if (zc::IpAddress::FromString(optarg, address) != ZC_ERROR_NONE)
            {
                fprintf(stderr, "Invalid address: %s\n", optarg);
                ExitNow(ret = EXIT_FAILURE);
            }
            config.mAddresses.push_back(address);
            break;

        case ZC_OPT_BROWSE:
            if (zc::Dns::TypeFromString(optarg, type) != ZC_ERROR_NONE)
            {
                fprintf(stderr, "Invalid record type: %s\n", optarg);
                ExitNow(ret = EXIT_FAILURE);
            }
            config.mBrowseTypes.push_back(type);
            break;

        case ZC_OPT_DEBUG_LEVEL:
            VerifyOrExit(ParseInteger(optarg, parseResult), ret = EXIT_FAILURE);
            VerifyOrExit(ZC_LOG_EMERG <= parseResult && parseResult <= ZC_LOG_DEBUG, ret = EXIT_FAILURE);
            logLevel = static_cast<zcLogLevel>(parseResult);
            break;

        case ZC_OPT_DOMAIN:
            config.mDomain = optarg;
            break;

        case ZC_OPT_HOST_NAME:
            config.mHostName = optarg;
            break;

        case ZC_OPT_PORT:
            VerifyOrExit(ParseInteger(optarg, parseResult), ret = EXIT_FAILURE);
            VerifyOrExit(0 < parseResult && parseResult <= UINT16_MAX, ret = EXIT_FAILURE);
            config.mPort = static_cast<uint16_t>(parseResult);
            break;

        case ZC_OPT_SERVICE_TYPE:
            config.mServiceType = optarg;
            break;

        case ZC_OPT_TXT:
            if (zc::Mdns::ParseTxtEntry(optarg, config.mTxtList) != ZC_ERROR_NONE)
            {
                fprintf(stderr, "Invalid attribute: %s\n", optarg);
                ExitNow(ret = EXIT_FAILURE);
            }
            break;

        case ZC_OPT_VERBOSE:
            verbose = true;
            break;

        case ZC_OPT_SYSLOG_DISABLE:
            syslogDisable = true;
            break;

        case ZC_OPT_VERSION:
            PrintVersion();
            ExitNow();
            break;

        case ZC_OPT_HELP:
            PrintHelp(argv[0]);
            ExitNow(ret = EXIT_SUCCESS);
            break;

        case ZC_OPT_IPV4_ONLY:
            config.mEnableIp6 = false;
            break;

        case ZC_OPT_IPV6_ONLY:
            config.mEnableIp4 = false;
            break;

        default:
            PrintHelp(argv[0]);
            ExitNow(ret = EXIT_FAILURE);
            break;
        }
    }

    if (!config.mEnableIp4 && !config.mEnableIp6)
    {
        fprintf(stderr, "--ipv4-only and --ipv6-only are exclusive\n");
        ExitNow(ret = EXIT_FAILURE);
    }

    if (!config.mServiceType.empty() && config.mPort == 0)
    {
        fprintf(stderr, "A port is required to publish a service\n");
        ExitNow(ret = EXIT_FAILURE);
    }

    if (config.mHostName.empty())
    {
        config.mHostName = GetDefaultHostName();
    }
    else if (config.mHostName.find('.') != std::string::npos)
    {
        fprintf(stderr, "The host name must be a single label: %s\n", config.mHostName.c_str());
        ExitNow(ret = EXIT_FAILURE);
    }

    zcLogInit(argv[0], logLevel, verbose, syslogDisable);
    zcLogNotice("Running %s", ZC_PACKAGE_VERSION);
    zcLogNotice("Host name: %s, domain: %s", config.mHostName.c_str(), config.mDomain.c_str());

    {
        zc::Application app(config);

        app.Init();
        ret = app.Run() == ZC_ERROR_NONE ? EXIT_SUCCESS : EXIT_FAILURE;
        app.Deinit();
    }

    zcLogDeinit();

exit:
    return ret;
}

int main(int argc, char *argv[])
{
    return realmain(argc, argv);
}
