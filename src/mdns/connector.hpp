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
 *   This file includes definitions for the per multicast group mDNS socket loop.
 */

#ifndef ZC_MDNS_CONNECTOR_HPP_
#define ZC_MDNS_CONNECTOR_HPP_

#include "zeroconf/config.h"

#include <atomic>
#include <mutex>
#include <thread>

#include "common/code_utils.hpp"
#include "common/types.hpp"
#include "dns/dns_message.hpp"
#include "mdns/responder.hpp"
#include "mdns/zone.hpp"
#include "utils/concurrent_queue.hpp"

class ConnectorTest;

namespace zc {

namespace Mdns {

/**
 * This class listens on one multicast group and drives a responder with the messages received.
 *
 * A receive thread decodes datagrams and hands them to a processing thread through a bounded queue, so that
 * answering a question never delays the next receive. A socket read failure closes and re-opens the socket of this
 * connector only, with an exponential backoff.
 */
class Connector : private NonCopyable
{
public:
    /**
     * Constructor.
     *
     * @param[in] aZone   The zone to answer from and to add learned records to.
     * @param[in] aGroup  The multicast group and port to listen on. Port 0 binds an ephemeral port.
     */
    Connector(Zone &aZone, const SocketAddress &aGroup);

    ~Connector(void);

    /**
     * This method opens the socket, joins the group and starts the threads.
     *
     * A stopped connector cannot be started again.
     *
     * @retval ZC_ERROR_NONE           Successfully started.
     * @retval ZC_ERROR_ERRNO          Failed to open, bind or join, see errno.
     * @retval ZC_ERROR_INVALID_STATE  The connector was already started.
     */
    zcError Start(void);

    /**
     * This method stops the threads and closes the socket.
     */
    void Stop(void);

    /**
     * This method packs @p aMessage and sends it to @p aDestination over the socket of this connector.
     *
     * @retval ZC_ERROR_NONE           Successfully sent the message.
     * @retval ZC_ERROR_INVALID_ARGS   The message cannot be encoded.
     * @retval ZC_ERROR_NO_BUFS        The message is too large.
     * @retval ZC_ERROR_INVALID_STATE  The socket is not open.
     * @retval ZC_ERROR_ERRNO          Failed to send, see errno.
     */
    zcError Send(const Dns::Message &aMessage, const SocketAddress &aDestination);

    /**
     * This method returns the port the socket is bound to, 0 if it is not open.
     */
    uint16_t GetPort(void) const { return mPort; }

    const SocketAddress &GetGroup(void) const { return mGroup; }
    Counters            &GetCounters(void) { return mResponder.GetCounters(); }

    /**
     * This function returns the IPv4 mDNS group, `224.0.0.251`.
     */
    static SocketAddress GetIp4Group(uint16_t aPort = ZC_CONFIG_MDNS_PORT);

    /**
     * This function returns the IPv6 mDNS group, `ff02::fb`.
     */
    static SocketAddress GetIp6Group(uint16_t aPort = ZC_CONFIG_MDNS_PORT);

private:
    friend class ::ConnectorTest;

    enum
    {
        kRead  = 0,
        kWrite = 1,
    };

    struct Incoming
    {
        Dns::Message  mMessage;
        SocketAddress mSource;
    };

    zcError OpenSocket(void);
    void    CloseSocket(void);
    int     GetFd(void);
    void    Restart(void);
    void    ReceiveLoop(void);
    void    ProcessLoop(void);
    void    HandleDatagram(const uint8_t *aBuffer, size_t aLength, const sockaddr *aFrom, socklen_t aFromLength);

    SocketAddress                    mGroup;
    Responder                        mResponder;
    std::mutex                       mFdMutex;
    int                              mFd;
    int                              mWakeFd[2];
    std::atomic<uint16_t>            mPort;
    std::atomic<bool>                mRunning;
    Utils::ConcurrentQueue<Incoming> mQueue;
    std::thread                      mReceiver;
    std::thread                      mProcessor;
};

} // namespace Mdns

} // namespace zc

#endif // ZC_MDNS_CONNECTOR_HPP_
