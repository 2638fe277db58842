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
 *   This file includes definitions for the mDNS responder decision procedure.
 */

#ifndef ZC_MDNS_RESPONDER_HPP_
#define ZC_MDNS_RESPONDER_HPP_

#include "zeroconf/config.h"

#include <atomic>
#include <string>

#include "common/code_utils.hpp"
#include "common/time.hpp"
#include "common/types.hpp"
#include "dns/dns_message.hpp"
#include "mdns/zone.hpp"

namespace zc {

namespace Mdns {

/**
 * This structure represents the counters of a responder and of the connector driving it.
 */
struct Counters
{
    Counters(void);

    std::string ToString(void) const;

    std::atomic<uint64_t> mQuestionsReceived; ///< Number of question messages received.
    std::atomic<uint64_t> mResponsesBuilt;    ///< Number of responses built.
    std::atomic<uint64_t> mAnswersIngested;   ///< Number of answer records added to the zone.
    std::atomic<uint64_t> mDecodeFailures;    ///< Number of datagrams which failed to decode.
    std::atomic<uint64_t> mEncodeFailures;    ///< Number of responses which failed to encode.
    std::atomic<uint64_t> mSocketErrors;      ///< Number of socket read and send errors.
    std::atomic<uint64_t> mRestarts;          ///< Number of socket restarts.
};

/**
 * This class answers questions from a zone and ingests answers into it.
 *
 * The responder does no I/O, its owner receives messages and sends the responses.
 */
class Responder : private NonCopyable
{
public:
    /**
     * Constructor.
     *
     * @param[in] aZone  The zone to answer from and to add learned records to.
     */
    explicit Responder(Zone &aZone);

    /**
     * This method handles an inbound message.
     *
     * @param[in]  aMessage   The decoded message.
     * @param[in]  aSource    The sender of the message.
     * @param[out] aResponse  The response to send, valid only on success.
     *
     * @retval ZC_ERROR_NONE       @p aResponse must be sent to @p aSource.
     * @retval ZC_ERROR_NOT_FOUND  Nothing to send, the message was an answer or matched no published record.
     */
    zcError HandleMessage(const Dns::Message &aMessage, const SocketAddress &aSource, Dns::Message &aResponse);

    /**
     * This method builds the response to a question message from the published entries of the zone.
     *
     * @retval ZC_ERROR_NONE       Successfully built @p aResponse.
     * @retval ZC_ERROR_NOT_FOUND  No published entry answers the questions.
     */
    zcError HandleQuestion(const Dns::Message &aQuery, Dns::Message &aResponse);

    /**
     * This method adds every answer record of @p aMessage to the zone as a learned entry.
     */
    void HandleAnswer(const Dns::Message &aMessage, const SocketAddress &aSource);

    Counters &GetCounters(void) { return mCounters; }

private:
    Zone    &mZone;
    Counters mCounters;
};

} // namespace Mdns

} // namespace zc

#endif // ZC_MDNS_RESPONDER_HPP_
