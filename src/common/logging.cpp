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

#define ZC_LOG_TAG "LOG"

#include "common/logging.hpp"

#include <assert.h>
#include <errno.h>
#include <stdarg.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/time.h>
#include <syslog.h>

#include <atomic>

#include "common/code_utils.hpp"

static std::atomic<zcLogLevel> sLevel(ZC_LOG_INFO);
static bool                    sSyslogDisabled = false;

static const char kLevelString[][8] = {
    "[EMERG]", // ZC_LOG_EMERG
    "[ALERT]", // ZC_LOG_ALERT
    "[CRIT]",  // ZC_LOG_CRIT
    "[ERR]",   // ZC_LOG_ERR
    "[WARN]",  // ZC_LOG_WARNING
    "[NOTE]",  // ZC_LOG_NOTICE
    "[INFO]",  // ZC_LOG_INFO
    "[DEBG]",  // ZC_LOG_DEBUG
};

static int LevelToSyslogPriority(zcLogLevel aLevel)
{
    static_assert(ZC_LOG_EMERG == LOG_EMERG, "ZC_LOG_EMERG value is incorrect");
    static_assert(ZC_LOG_ALERT == LOG_ALERT, "ZC_LOG_ALERT value is incorrect");
    static_assert(ZC_LOG_CRIT == LOG_CRIT, "ZC_LOG_CRIT value is incorrect");
    static_assert(ZC_LOG_ERR == LOG_ERR, "ZC_LOG_ERR value is incorrect");
    static_assert(ZC_LOG_WARNING == LOG_WARNING, "ZC_LOG_WARNING value is incorrect");
    static_assert(ZC_LOG_NOTICE == LOG_NOTICE, "ZC_LOG_NOTICE value is incorrect");
    static_assert(ZC_LOG_INFO == LOG_INFO, "ZC_LOG_INFO value is incorrect");
    static_assert(ZC_LOG_DEBUG == LOG_DEBUG, "ZC_LOG_DEBUG value is incorrect");

    return static_cast<int>(aLevel);
}

/** Get the current debug log level */
zcLogLevel zcLogGetLevel(void)
{
    return sLevel;
}

void zcLogSetLevel(zcLogLevel aLevel)
{
    assert(aLevel >= ZC_LOG_EMERG && aLevel <= ZC_LOG_DEBUG);
    sLevel = aLevel;
}

/** Initialize logging */
void zcLogInit(const char *aProgramName, zcLogLevel aLevel, bool aPrintStderr, bool aSyslogDisable)
{
    const char *ident;

    assert(aProgramName != nullptr);
    assert(aLevel >= ZC_LOG_EMERG && aLevel <= ZC_LOG_DEBUG);

    ident = strrchr(aProgramName, '/');
    ident = (ident != nullptr) ? ident + 1 : aProgramName;

    sSyslogDisabled = aSyslogDisable;

    if (!sSyslogDisabled)
    {
        openlog(ident, (LOG_CONS | LOG_PID) | (aPrintStderr ? LOG_PERROR : 0), LOG_USER);
    }

    sLevel = aLevel;
}

/** log to the syslog or standard out */
void zcLog(zcLogLevel aLevel, const char *aLogTag, const char *aFormat, ...)
{
    va_list ap;

    va_start(ap, aFormat);
    zcLogv(aLevel, aLogTag, aFormat, ap);
    va_end(ap);
}

/** log to the syslog or standard out */
void zcLogv(zcLogLevel aLevel, const char *aLogTag, const char *aFormat, va_list aArgList)
{
    char buffer[1024];

    assert(aFormat);

    VerifyOrExit(aLevel <= sLevel);

    vsnprintf(buffer, sizeof(buffer), aFormat, aArgList);

    if (sSyslogDisabled)
    {
        printf("%s%s: %s\n", kLevelString[aLevel], aLogTag, buffer);
        fflush(stdout);
    }
    else
    {
        syslog(LevelToSyslogPriority(aLevel), "%s-%s: %s", kLevelString[aLevel], aLogTag, buffer);
    }

exit:
    return;
}

/** Hex dump data to the log */
void zcDump(zcLogLevel aLevel, const char *aLogTag, const char *aPrefix, const void *aMemory, size_t aSize)
{
    static const char kHexChars[] = "0123456789abcdef";
    const uint8_t    *pEnd;
    const uint8_t    *p8;
    int               addr;

    assert(aPrefix && (aMemory || aSize == 0));

    VerifyOrExit(aLevel <= sLevel);

    /* break hex dumps into 16byte lines
     * In the form ADDR: XX XX XX XX ...
     */

    // we pre-increment... so subtract
    addr = -16;

    while (aSize > 0)
    {
        size_t this_size;
        char   hex[16 * 3 + 1];

        addr = addr + 16;
        p8   = static_cast<const uint8_t *>(aMemory) + addr;

        /* truncate line to max 16 bytes */
        this_size = aSize;
        if (this_size > 16)
        {
            this_size = 16;
        }
        aSize = aSize - this_size;

        char *ch = hex - 1;

        for (pEnd = p8 + this_size; p8 < pEnd; p8++)
        {
            *++ch = kHexChars[(*p8) >> 4];
            *++ch = kHexChars[(*p8) & 0x0f];
            *++ch = ' ';
        }
        *ch = 0;

        zcLog(aLevel, aLogTag, "%s: %04x: %s", aPrefix, addr, hex);
    }

exit:
    return;
}

const char *zcErrorString(zcError aError)
{
    const char *error;

    switch (aError)
    {
    case ZC_ERROR_NONE:
        error = "OK";
        break;

    case ZC_ERROR_ERRNO:
        error = strerror(errno);
        break;

    case ZC_ERROR_MDNS:
        error = "MDNS error";
        break;

    case ZC_ERROR_NOT_FOUND:
        error = "Not found";
        break;

    case ZC_ERROR_PARSE:
        error = "Parse error";
        break;

    case ZC_ERROR_NOT_IMPLEMENTED:
        error = "Not implemented";
        break;

    case ZC_ERROR_INVALID_ARGS:
        error = "Invalid arguments";
        break;

    case ZC_ERROR_DUPLICATED:
        error = "Duplicated";
        break;

    case ZC_ERROR_ABORTED:
        error = "Aborted";
        break;

    case ZC_ERROR_INVALID_STATE:
        error = "Invalid state";
        break;

    case ZC_ERROR_NO_BUFS:
        error = "No buffers";
        break;

    default:
        error = "Unknown";
    }

    return error;
}

void zcLogDeinit(void)
{
    if (!sSyslogDisabled)
    {
        closelog();
    }
}
