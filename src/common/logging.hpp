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
 * This file define logging interface.
 */
#ifndef ZC_COMMON_LOGGING_HPP_
#define ZC_COMMON_LOGGING_HPP_

#include "zeroconf/config.h"

#include <stdarg.h>
#include <stddef.h>

#include "common/types.hpp"

#ifndef ZC_LOG_TAG
#define ZC_LOG_TAG ""
#endif

/**
 * Logging level.
 */
typedef enum
{
    ZC_LOG_EMERG,   ///< System is unusable.
    ZC_LOG_ALERT,   ///< Action must be taken immediately.
    ZC_LOG_CRIT,    ///< Critical conditions.
    ZC_LOG_ERR,     ///< Error conditions.
    ZC_LOG_WARNING, ///< Warning conditions.
    ZC_LOG_NOTICE,  ///< Normal but significant condition.
    ZC_LOG_INFO,    ///< Informational.
    ZC_LOG_DEBUG,   ///< Debug level messages.
} zcLogLevel;

/**
 * Get current log level.
 */
zcLogLevel zcLogGetLevel(void);

/**
 * Set current log level.
 */
void zcLogSetLevel(zcLogLevel aLevel);

/**
 * This function initialize the logging service.
 *
 * @param[in] aProgramName    The name of this runnable program.
 * @param[in] aLevel          Log level of the logger.
 * @param[in] aPrintStderr    Whether to log to stderr.
 * @param[in] aSyslogDisable  Whether to disable logging to syslog.
 */
void zcLogInit(const char *aProgramName, zcLogLevel aLevel, bool aPrintStderr, bool aSyslogDisable);

/**
 * This function log at level @p aLevel.
 *
 * @param[in] aLevel   Log level of the logger.
 * @param[in] aLogTag  Log tag.
 * @param[in] aFormat  Format string as in printf.
 */
void zcLog(zcLogLevel aLevel, const char *aLogTag, const char *aFormat, ...)
    __attribute__((format(printf, 3, 4)));

/**
 * This function log at level @p aLevel.
 *
 * @param[in] aLevel   Log level of the logger.
 * @param[in] aLogTag  Log tag.
 * @param[in] aFormat  Format string as in printf.
 */
void zcLogv(zcLogLevel aLevel, const char *aLogTag, const char *aFormat, va_list aArgList);

/**
 * This function dump memory as hex string at level @p aLevel.
 *
 * @param[in] aLevel   Log level of the logger.
 * @param[in] aLogTag  Log tag.
 * @param[in] aPrefix  String before dumping memory.
 * @param[in] aMemory  The pointer to the memory to be dumped.
 * @param[in] aSize    The size of memory in bytes to be dumped.
 */
void zcDump(zcLogLevel aLevel, const char *aLogTag, const char *aPrefix, const void *aMemory, size_t aSize);

/**
 * This function converts error code to string.
 *
 * @param[in] aError  The error code.
 *
 * @returns The string information of error.
 */
const char *zcErrorString(zcError aError);

/**
 * This function deinitializes the logging service.
 */
void zcLogDeinit(void);

/**
 * This macro log a action result according to @p aError.
 *
 * If @p aError is ZC_ERROR_NONE, the log level will be ZC_LOG_INFO,
 * otherwise ZC_LOG_WARNING.
 *
 * @param[in] aError   The action result.
 * @param[in] aFormat  Format string as in printf.
 * @param[in] ...      Arguments for the format specification.
 */
#define zcLogResult(aError, aFormat, ...)                                                               \
    do                                                                                                  \
    {                                                                                                   \
        zcError _err = (aError);                                                                        \
        zcLog(_err == ZC_ERROR_NONE ? ZC_LOG_INFO : ZC_LOG_WARNING, ZC_LOG_TAG, aFormat ": %s",         \
              ##__VA_ARGS__, zcErrorString(_err));                                                      \
    } while (0)

/**
 * @def zcLogEmerg
 *
 * Log at level emergency.
 *
 * @param[in] ...  Arguments for the format specification.
 */

/**
 * @def zcLogAlert
 *
 * Log at level alert.
 *
 * @param[in] ...  Arguments for the format specification.
 */

/**
 * @def zcLogCrit
 *
 * Log at level critical.
 *
 * @param[in] ...  Arguments for the format specification.
 */

/**
 * @def zcLogErr
 *
 * Log at level error.
 *
 * @param[in] ...  Arguments for the format specification.
 */

/**
 * @def zcLogWarning
 *
 * Log at level warning.
 *
 * @param[in] ...  Arguments for the format specification.
 */

/**
 * @def zcLogNotice
 *
 * Log at level notice.
 *
 * @param[in] ...  Arguments for the format specification.
 */

/**
 * @def zcLogInfo
 *
 * Log at level information.
 *
 * @param[in] ...  Arguments for the format specification.
 */

/**
 * @def zcLogDebug
 *
 * Log at level debug.
 *
 * @param[in] ...  Arguments for the format specification.
 */
#define zcLogEmerg(...) zcLog(ZC_LOG_EMERG, ZC_LOG_TAG, __VA_ARGS__)
#define zcLogAlert(...) zcLog(ZC_LOG_ALERT, ZC_LOG_TAG, __VA_ARGS__)
#define zcLogCrit(...) zcLog(ZC_LOG_CRIT, ZC_LOG_TAG, __VA_ARGS__)
#define zcLogErr(...) zcLog(ZC_LOG_ERR, ZC_LOG_TAG, __VA_ARGS__)
#define zcLogWarning(...) zcLog(ZC_LOG_WARNING, ZC_LOG_TAG, __VA_ARGS__)
#define zcLogNotice(...) zcLog(ZC_LOG_NOTICE, ZC_LOG_TAG, __VA_ARGS__)
#define zcLogInfo(...) zcLog(ZC_LOG_INFO, ZC_LOG_TAG, __VA_ARGS__)
#define zcLogDebug(...) zcLog(ZC_LOG_DEBUG, ZC_LOG_TAG, __VA_ARGS__)

#endif // ZC_COMMON_LOGGING_HPP_
