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
 *   This file includes definitions for typed DNS messages and their wire encoding.
 *
 *   Encoding and decoding are delegated to the system resolver library (libresolv).
 */

#ifndef ZC_DNS_DNS_MESSAGE_HPP_
#define ZC_DNS_DNS_MESSAGE_HPP_

#include "zeroconf/config.h"

#include <stdint.h>

#include <string>
#include <vector>

#include <arpa/nameser.h>

#include "common/types.hpp"

namespace zc {

namespace Dns {

/**
 * @addtogroup zeroconf-dns
 *
 * @brief
 *   This module includes definitions for typed DNS questions, records and messages.
 *
 * @{
 */

constexpr uint16_t kTypeA    = ns_t_a;    ///< IPv4 address record.
constexpr uint16_t kTypePtr  = ns_t_ptr;  ///< Pointer record.
constexpr uint16_t kTypeTxt  = ns_t_txt;  ///< Text (attribute) record.
constexpr uint16_t kTypeAaaa = ns_t_aaaa; ///< IPv6 address record.
constexpr uint16_t kTypeSrv  = ns_t_srv;  ///< Service location record.
constexpr uint16_t kTypeAny  = ns_t_any;  ///< Any type (questions and housekeeping only).

constexpr uint16_t kClassInternet = ns_c_in;

constexpr size_t kMaxMessageSize = 9000; ///< The largest mDNS message (RFC 6762, section 17).

/**
 * This function returns the mnemonic of a record type ("A", "PTR"...), or "TYPE<n>" for other types.
 */
std::string TypeToString(uint16_t aType);

/**
 * This function parses a record type mnemonic, case-insensitively.
 *
 * @retval ZC_ERROR_NONE          Successfully parsed @p aString.
 * @retval ZC_ERROR_INVALID_ARGS  @p aString is not a known mnemonic.
 */
zcError TypeFromString(const char *aString, uint16_t &aType);

/**
 * This class represents an entry of the question section.
 */
class Question
{
public:
    Question(void);

    /**
     * Constructor.
     *
     * @param[in] aName   The target name, with the trailing dot.
     * @param[in] aType   The desired record type.
     * @param[in] aClass  The class.
     */
    Question(std::string aName, uint16_t aType, uint16_t aClass = kClassInternet);

    bool operator==(const Question &aOther) const;

    std::string mName;
    uint16_t    mType;
    uint16_t    mClass;
};

/**
 * This class represents a typed resource record.
 *
 * Only the data members of the record's type are meaningful: `mAddress` for A and AAAA, `mTarget` for PTR,
 * `mPriority`, `mWeight`, `mPort` and `mTarget` for SRV, `mTxtStrings` for TXT and `mData` for every other type.
 */
class ResourceRecord
{
public:
    typedef std::vector<std::string> TxtStrings;

    /**
     * This constructor creates an empty record of @p aType, in class IN with a zero TTL.
     *
     * @param[in] aType  The record type.
     */
    explicit ResourceRecord(uint16_t aType = kTypeAny);

    /**
     * This method indicates whether this record carries the same type and data as @p aOther.
     */
    bool HasSameData(const ResourceRecord &aOther) const;

    /**
     * This method compares name, type, class and data. The TTL is ignored.
     */
    bool operator==(const ResourceRecord &aOther) const;
    bool operator!=(const ResourceRecord &aOther) const { return !(*this == aOther); }

    /**
     * This method returns the record in zone file presentation format.
     */
    std::string ToString(void) const;

    std::string          mName;
    uint16_t             mType;
    uint16_t             mClass;
    uint32_t             mTtl;
    IpAddress            mAddress;
    std::string          mTarget;
    uint16_t             mPriority;
    uint16_t             mWeight;
    uint16_t             mPort;
    TxtStrings           mTxtStrings;
    std::vector<uint8_t> mData;
};

/**
 * This class represents a DNS message.
 */
class Message
{
public:
    Message(void);

    /**
     * This method indicates whether the message is a question (the QR bit is clear).
     */
    bool IsQuestion(void) const { return !mResponse; }

    /**
     * This method resets the header and empties every section.
     */
    void Clear(void);

    /**
     * This method encodes the message.
     *
     * @param[out] aBuffer  The wire format of the message. Untouched on failure.
     *
     * @retval ZC_ERROR_NONE          Successfully encoded the message.
     * @retval ZC_ERROR_INVALID_ARGS  A name or record cannot be encoded.
     * @retval ZC_ERROR_NO_BUFS       The message exceeds `kMaxMessageSize`.
     */
    zcError Pack(std::vector<uint8_t> &aBuffer) const;

    /**
     * This method decodes a message.
     *
     * On failure the message is left empty, there is no partial result.
     *
     * @param[in] aBuffer  A pointer to the wire format.
     * @param[in] aLength  The length of @p aBuffer.
     *
     * @retval ZC_ERROR_NONE   Successfully decoded the message.
     * @retval ZC_ERROR_PARSE  The buffer is not a valid DNS message.
     */
    zcError Unpack(const uint8_t *aBuffer, size_t aLength);

    /**
     * This method returns a multi-line description of the message for logging.
     */
    std::string ToString(void) const;

    uint16_t                    mId;
    bool                        mResponse;
    uint8_t                     mOpcode;
    bool                        mAuthoritative;
    bool                        mTruncated;
    uint8_t                     mRcode;
    std::vector<Question>       mQuestions;
    std::vector<ResourceRecord> mAnswers;
    std::vector<ResourceRecord> mAuthorities;
    std::vector<ResourceRecord> mAdditionals;
};

/**
 * @}
 */

} // namespace Dns

} // namespace zc

#endif // ZC_DNS_DNS_MESSAGE_HPP_
