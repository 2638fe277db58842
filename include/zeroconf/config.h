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
 *   This file includes the compile-time configuration of the zeroconf responder.
 *
 *   Every value can be overridden from the build system with `-D<NAME>=<VALUE>`.
 */

#ifndef ZEROCONF_CONFIG_H_
#define ZEROCONF_CONFIG_H_

#ifndef ZC_PACKAGE_NAME
#define ZC_PACKAGE_NAME "zeroconf"
#endif

#ifndef ZC_PACKAGE_VERSION
#define ZC_PACKAGE_VERSION "0.1.0"
#endif

/**
 * The TTL in seconds of the records synthesized when a service is published.
 */
#ifndef ZC_CONFIG_PUBLISH_TTL
#define ZC_CONFIG_PUBLISH_TTL 3600
#endif

/**
 * The UDP port of the mDNS multicast groups.
 */
#ifndef ZC_CONFIG_MDNS_PORT
#define ZC_CONFIG_MDNS_PORT 5353
#endif

/**
 * The number of pending requests the zone mailbox holds before `Add` blocks.
 */
#ifndef ZC_CONFIG_ZONE_MAILBOX_CAPACITY
#define ZC_CONFIG_ZONE_MAILBOX_CAPACITY 16
#endif

/**
 * The number of decoded messages a connector buffers between its receive and processing threads.
 */
#ifndef ZC_CONFIG_CONNECTOR_QUEUE_CAPACITY
#define ZC_CONFIG_CONNECTOR_QUEUE_CAPACITY 32
#endif

/**
 * The size of the inbound datagram buffer (at least one Ethernet MTU).
 */
#ifndef ZC_CONFIG_RECEIVE_BUFFER_SIZE
#define ZC_CONFIG_RECEIVE_BUFFER_SIZE 9000
#endif

/**
 * The bounds in seconds of the backoff used when a connector re-opens its socket after a read failure.
 */
#ifndef ZC_CONFIG_RESTART_MIN_BACKOFF
#define ZC_CONFIG_RESTART_MIN_BACKOFF 1
#endif

#ifndef ZC_CONFIG_RESTART_MAX_BACKOFF
#define ZC_CONFIG_RESTART_MAX_BACKOFF 32
#endif

/**
 * The interval in seconds between two purges of expired learned entries.
 */
#ifndef ZC_CONFIG_PURGE_INTERVAL
#define ZC_CONFIG_PURGE_INTERVAL 60
#endif

#endif // ZEROCONF_CONFIG_H_
