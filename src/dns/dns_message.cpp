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

#define ZC_LOG_TAG "DNS"

#include "dns/dns_message.hpp"

#include <limits.h>
#include <stdio.h>
#include <strings.h>

#include <resolv.h>

#include <sstream>

#include "common/code_utils.hpp"
#include "common/logging.hpp"
#include "utils/dns_utils.hpp"

namespace zc {

namespace Dns {

namespace {

constexpr uint16_t kClassMask           = 0x7fff; // The top bit is the mDNS unicast-response/cache-flush bit.
constexpr size_t   kHeaderSize          = NS_HFIXEDSZ;
constexpr size_t   kMaxCompressPointers = 128;
constexpr size_t   kMaxCharacterString  = 255;

struct TypeName
{
    uint16_t    mType;
    const char *mName;
};

const TypeName kTypeNames[] = {
    {kTypeA, "A"}, {kTypePtr, "PTR"}, {kTypeTxt, "TXT"}, {kTypeAaaa, "AAAA"}, {kTypeSrv, "SRV"}, {kTypeAny, "ANY"},
};

class Writer
{
public:
    Writer(uint8_t *aBuffer, size_t aSize)
        : mBegin(aBuffer)
        , mCursor(aBuffer)
        , mEnd(aBuffer + aSize)
    {
        mDnPtrs[0] = mBegin;
        mDnPtrs[1] = nullptr;
    }

    size_t GetLength(void) const { return static_cast<size_t>(mCursor - mBegin); }

    zcError PutUint8(uint8_t aValue)
    {
        zcError error = ZC_ERROR_NONE;

        VerifyOrExit(mCursor < mEnd, error = ZC_ERROR_NO_BUFS);
        *mCursor++ = aValue;

    exit:
        return error;
    }

    zcError PutUint16(uint16_t aValue)
    {
        zcError error = ZC_ERROR_NONE;

        VerifyOrExit(mEnd - mCursor >= NS_INT16SZ, error = ZC_ERROR_NO_BUFS);
        NS_PUT16(aValue, mCursor);

    exit:
        return error;
    }

    zcError PutUint32(uint32_t aValue)
    {
        zcError error = ZC_ERROR_NONE;

        VerifyOrExit(mEnd - mCursor >= NS_INT32SZ, error = ZC_ERROR_NO_BUFS);
        NS_PUT32(aValue, mCursor);

    exit:
        return error;
    }

    zcError PutBytes(const uint8_t *aBytes, size_t aLength)
    {
        zcError error = ZC_ERROR_NONE;

        VerifyOrExit(static_cast<size_t>(mEnd - mCursor) >= aLength, error = ZC_ERROR_NO_BUFS);
        memcpy(mCursor, aBytes, aLength);
        mCursor += aLength;

    exit:
        return error;
    }

    /**
     * This method writes a domain name, compressed against the names already written when @p aCompress is true.
     */
    zcError PutName(const std::string &aName, bool aCompress)
    {
        zcError error = ZC_ERROR_NONE;
        int     length;

        length = dn_comp(aName.c_str(), mCursor, static_cast<int>(mEnd - mCursor), aCompress ? mDnPtrs : nullptr,
                         aCompress ? mDnPtrs + kMaxCompressPointers : nullptr);
        VerifyOrExit(length >= 0, error = ZC_ERROR_INVALID_ARGS);
        mCursor += length;

    exit:
        return error;
    }

    /**
     * This method reserves the two bytes of a length field and returns its position.
     */
    zcError ReserveUint16(uint8_t *&aField)
    {
        aField = mCursor;

        return PutUint16(0);
    }

    zcError PatchLength(uint8_t *aField)
    {
        zcError error  = ZC_ERROR_NONE;
        size_t  length = static_cast<size_t>(mCursor - aField) - NS_INT16SZ;

        VerifyOrExit(length <= UINT16_MAX, error = ZC_ERROR_NO_BUFS);
        NS_PUT16(length, aField);

    exit:
        return error;
    }

private:
    uint8_t *mBegin;
    uint8_t *mCursor;
    uint8_t *mEnd;
    uint8_t *mDnPtrs[kMaxCompressPointers];
};

zcError PackRecordData(Writer &aWriter, const ResourceRecord &aRecord)
{
    zcError error = ZC_ERROR_NONE;

    switch (aRecord.mType)
    {
    case kTypeA:
        VerifyOrExit(aRecord.mAddress.IsIp4(), error = ZC_ERROR_INVALID_ARGS);
        error = aWriter.PutBytes(aRecord.mAddress.GetBytes(), NS_INADDRSZ);
        break;

    case kTypeAaaa:
        VerifyOrExit(aRecord.mAddress.IsIp6(), error = ZC_ERROR_INVALID_ARGS);
        error = aWriter.PutBytes(aRecord.mAddress.GetBytes(), NS_IN6ADDRSZ);
        break;

    case kTypePtr:
        error = aWriter.PutName(aRecord.mTarget, /* aCompress */ true);
        break;

    case kTypeSrv:
        SuccessOrExit(error = aWriter.PutUint16(aRecord.mPriority));
        SuccessOrExit(error = aWriter.PutUint16(aRecord.mWeight));
        SuccessOrExit(error = aWriter.PutUint16(aRecord.mPort));
        // RFC 2782 forbids compressing the SRV target.
        error = aWriter.PutName(aRecord.mTarget, /* aCompress */ false);
        break;

    case kTypeTxt:
        if (aRecord.mTxtStrings.empty())
        {
            error = aWriter.PutUint8(0);
            break;
        }

        for (const std::string &string : aRecord.mTxtStrings)
        {
            VerifyOrExit(string.size() <= kMaxCharacterString, error = ZC_ERROR_INVALID_ARGS);
            SuccessOrExit(error = aWriter.PutUint8(static_cast<uint8_t>(string.size())));
            SuccessOrExit(error = aWriter.PutBytes(reinterpret_cast<const uint8_t *>(string.data()), string.size()));
        }
        break;

    default:
        error = aWriter.PutBytes(aRecord.mData.data(), aRecord.mData.size());
        break;
    }

exit:
    return error;
}

zcError PackRecord(Writer &aWriter, const ResourceRecord &aRecord)
{
    zcError  error;
    uint8_t *rdlength;

    SuccessOrExit(error = aWriter.PutName(aRecord.mName, /* aCompress */ true));
    SuccessOrExit(error = aWriter.PutUint16(aRecord.mType));
    SuccessOrExit(error = aWriter.PutUint16(aRecord.mClass));
    SuccessOrExit(error = aWriter.PutUint32(aRecord.mTtl));
    SuccessOrExit(error = aWriter.ReserveUint16(rdlength));
    SuccessOrExit(error = PackRecordData(aWriter, aRecord));
    error = aWriter.PatchLength(rdlength);

exit:
    return error;
}

/**
 * This function expands the domain name at @p aCursor, which must end exactly at @p aEnd.
 */
zcError UnpackName(const ns_msg &aHandle, const uint8_t *aCursor, const uint8_t *aEnd, std::string &aName)
{
    zcError error = ZC_ERROR_NONE;
    char    name[NS_MAXDNAME];
    int     length;

    length = dn_expand(ns_msg_base(aHandle), ns_msg_end(aHandle), aCursor, name, sizeof(name));
    VerifyOrExit(length > 0 && aCursor + length == aEnd, error = ZC_ERROR_PARSE);
    aName = DnsUtils::MakeAbsoluteName(name);

exit:
    return error;
}

zcError UnpackRecord(const ns_msg &aHandle, const ns_rr &aRr, ResourceRecord &aRecord)
{
    zcError        error  = ZC_ERROR_NONE;
    const uint8_t *cursor = ns_rr_rdata(aRr);
    const uint8_t *end    = cursor + ns_rr_rdlen(aRr);

    aRecord        = ResourceRecord(ns_rr_type(aRr));
    aRecord.mName  = DnsUtils::MakeAbsoluteName(ns_rr_name(aRr));
    aRecord.mClass = ns_rr_class(aRr) & kClassMask;
    aRecord.mTtl   = ns_rr_ttl(aRr);

    switch (aRecord.mType)
    {
    case kTypeA:
    case kTypeAaaa:
        VerifyOrExit(ns_rr_rdlen(aRr) == (aRecord.mType == kTypeA ? NS_INADDRSZ : NS_IN6ADDRSZ),
                     error = ZC_ERROR_PARSE);
        error = aRecord.mAddress.SetBytes(cursor, ns_rr_rdlen(aRr));
        break;

    case kTypePtr:
        error = UnpackName(aHandle, cursor, end, aRecord.mTarget);
        break;

    case kTypeSrv:
        VerifyOrExit(end - cursor > 3 * NS_INT16SZ, error = ZC_ERROR_PARSE);
        NS_GET16(aRecord.mPriority, cursor);
        NS_GET16(aRecord.mWeight, cursor);
        NS_GET16(aRecord.mPort, cursor);
        error = UnpackName(aHandle, cursor, end, aRecord.mTarget);
        break;

    case kTypeTxt:
        while (cursor < end)
        {
            size_t length = *cursor++;

            VerifyOrExit(static_cast<size_t>(end - cursor) >= length, error = ZC_ERROR_PARSE);
            aRecord.mTxtStrings.emplace_back(reinterpret_cast<const char *>(cursor), length);
            cursor += length;
        }

        // A single empty string is how an empty TXT record goes on the wire.
        if (aRecord.mTxtStrings.size() == 1 && aRecord.mTxtStrings.front().empty())
        {
            aRecord.mTxtStrings.clear();
        }
        break;

    default:
        aRecord.mData.assign(cursor, end);
        break;
    }

exit:
    return error;
}

zcError UnpackSection(ns_msg &aHandle, ns_sect aSection, std::vector<ResourceRecord> &aRecords)
{
    zcError error = ZC_ERROR_NONE;

    for (int i = 0; i < ns_msg_count(aHandle, aSection); i++)
    {
        ns_rr          rr;
        ResourceRecord record;

        VerifyOrExit(ns_parserr(&aHandle, aSection, i, &rr) == 0, error = ZC_ERROR_PARSE);
        SuccessOrExit(error = UnpackRecord(aHandle, rr, record));
        aRecords.push_back(std::move(record));
    }

exit:
    return error;
}

void AppendSection(std::ostringstream &aStream, const char *aTitle, const std::vector<ResourceRecord> &aRecords)
{
    if (aRecords.empty())
    {
        return;
    }

    aStream << ";; " << aTitle << " SECTION:\n";

    for (const ResourceRecord &record : aRecords)
    {
        aStream << record.ToString() << "\n";
    }
}

} // namespace

std::string TypeToString(uint16_t aType)
{
    char buffer[sizeof("TYPE65535")];

    for (const TypeName &typeName : kTypeNames)
    {
        if (typeName.mType == aType)
        {
            return typeName.mName;
        }
    }

    snprintf(buffer, sizeof(buffer), "TYPE%u", aType);

    return buffer;
}

zcError TypeFromString(const char *aString, uint16_t &aType)
{
    zcError error = ZC_ERROR_INVALID_ARGS;

    VerifyOrExit(aString != nullptr);

    for (const TypeName &typeName : kTypeNames)
    {
        if (strcasecmp(typeName.mName, aString) == 0)
        {
            aType = typeName.mType;
            ExitNow(error = ZC_ERROR_NONE);
        }
    }

exit:
    return error;
}

Question::Question(void)
    : mType(kTypeAny)
    , mClass(kClassInternet)
{
}

Question::Question(std::string aName, uint16_t aType, uint16_t aClass)
    : mName(std::move(aName))
    , mType(aType)
    , mClass(aClass)
{
}

bool Question::operator==(const Question &aOther) const
{
    return mName == aOther.mName && mType == aOther.mType && mClass == aOther.mClass;
}

ResourceRecord::ResourceRecord(uint16_t aType)
    : mType(aType)
    , mClass(kClassInternet)
    , mTtl(0)
    , mPriority(0)
    , mWeight(0)
    , mPort(0)
{
}

bool ResourceRecord::HasSameData(const ResourceRecord &aOther) const
{
    bool same = false;

    VerifyOrExit(mType == aOther.mType);

    switch (mType)
    {
    case kTypeA:
    case kTypeAaaa:
        same = (mAddress == aOther.mAddress);
        break;
    case kTypePtr:
        same = (mTarget == aOther.mTarget);
        break;
    case kTypeSrv:
        same = (mPriority == aOther.mPriority && mWeight == aOther.mWeight && mPort == aOther.mPort &&
                mTarget == aOther.mTarget);
        break;
    case kTypeTxt:
        same = (mTxtStrings == aOther.mTxtStrings);
        break;
    default:
        same = (mData == aOther.mData);
        break;
    }

exit:
    return same;
}

bool ResourceRecord::operator==(const ResourceRecord &aOther) const
{
    return mName == aOther.mName && mClass == aOther.mClass && HasSameData(aOther);
}

std::string ResourceRecord::ToString(void) const
{
    std::ostringstream stream;

    stream << mName << " " << mTtl << " " << (mClass == kClassInternet ? "IN" : "CLASS" + std::to_string(mClass))
           << " " << TypeToString(mType);

    switch (mType)
    {
    case kTypeA:
    case kTypeAaaa:
        stream << " " << mAddress.ToString();
        break;
    case kTypePtr:
        stream << " " << mTarget;
        break;
    case kTypeSrv:
        stream << " " << mPriority << " " << mWeight << " " << mPort << " " << mTarget;
        break;
    case kTypeTxt:
        for (const std::string &string : mTxtStrings)
        {
            stream << " \"" << string << "\"";
        }
        break;
    default:
        stream << " \\# " << mData.size();
        break;
    }

    return stream.str();
}

Message::Message(void)
{
    Clear();
}

void Message::Clear(void)
{
    mId            = 0;
    mResponse      = false;
    mOpcode        = ns_o_query;
    mAuthoritative = false;
    mTruncated     = false;
    mRcode         = ns_r_noerror;
    mQuestions.clear();
    mAnswers.clear();
    mAuthorities.clear();
    mAdditionals.clear();
}

zcError Message::Pack(std::vector<uint8_t> &aBuffer) const
{
    zcError  error = ZC_ERROR_NONE;
    uint8_t  buffer[kMaxMessageSize];
    Writer   writer(buffer, sizeof(buffer));
    uint16_t flags;

    VerifyOrExit(mQuestions.size() <= UINT16_MAX && mAnswers.size() <= UINT16_MAX &&
                     mAuthorities.size() <= UINT16_MAX && mAdditionals.size() <= UINT16_MAX,
                 error = ZC_ERROR_NO_BUFS);

    flags = static_cast<uint16_t>((mResponse ? 0x8000 : 0) | ((mOpcode & 0x0f) << 11) | (mAuthoritative ? 0x0400 : 0) |
                                  (mTruncated ? 0x0200 : 0) | (mRcode & 0x0f));

    SuccessOrExit(error = writer.PutUint16(mId));
    SuccessOrExit(error = writer.PutUint16(flags));
    SuccessOrExit(error = writer.PutUint16(static_cast<uint16_t>(mQuestions.size())));
    SuccessOrExit(error = writer.PutUint16(static_cast<uint16_t>(mAnswers.size())));
    SuccessOrExit(error = writer.PutUint16(static_cast<uint16_t>(mAuthorities.size())));
    SuccessOrExit(error = writer.PutUint16(static_cast<uint16_t>(mAdditionals.size())));

    for (const Question &question : mQuestions)
    {
        SuccessOrExit(error = writer.PutName(question.mName, /* aCompress */ true));
        SuccessOrExit(error = writer.PutUint16(question.mType));
        SuccessOrExit(error = writer.PutUint16(question.mClass));
    }

    for (const std::vector<ResourceRecord> *section : {&mAnswers, &mAuthorities, &mAdditionals})
    {
        for (const ResourceRecord &record : *section)
        {
            SuccessOrExit(error = PackRecord(writer, record));
        }
    }

    aBuffer.assign(buffer, buffer + writer.GetLength());

exit:
    return error;
}

zcError Message::Unpack(const uint8_t *aBuffer, size_t aLength)
{
    zcError error = ZC_ERROR_NONE;
    ns_msg  handle;

    Clear();

    VerifyOrExit(aBuffer != nullptr && aLength >= kHeaderSize && aLength <= INT_MAX, error = ZC_ERROR_PARSE);
    VerifyOrExit(ns_initparse(aBuffer, static_cast<int>(aLength), &handle) == 0, error = ZC_ERROR_PARSE);

    mId            = ns_msg_id(handle);
    mResponse      = ns_msg_getflag(handle, ns_f_qr) != 0;
    mOpcode        = static_cast<uint8_t>(ns_msg_getflag(handle, ns_f_opcode));
    mAuthoritative = ns_msg_getflag(handle, ns_f_aa) != 0;
    mTruncated     = ns_msg_getflag(handle, ns_f_tc) != 0;
    mRcode         = static_cast<uint8_t>(ns_msg_getflag(handle, ns_f_rcode));

    for (int i = 0; i < ns_msg_count(handle, ns_s_qd); i++)
    {
        ns_rr rr;

        VerifyOrExit(ns_parserr(&handle, ns_s_qd, i, &rr) == 0, error = ZC_ERROR_PARSE);
        mQuestions.emplace_back(DnsUtils::MakeAbsoluteName(ns_rr_name(rr)), ns_rr_type(rr),
                                ns_rr_class(rr) & kClassMask);
    }

    SuccessOrExit(error = UnpackSection(handle, ns_s_an, mAnswers));
    SuccessOrExit(error = UnpackSection(handle, ns_s_ns, mAuthorities));
    SuccessOrExit(error = UnpackSection(handle, ns_s_ar, mAdditionals));

exit:
    if (error != ZC_ERROR_NONE)
    {
        Clear();
    }

    return error;
}

std::string Message::ToString(void) const
{
    std::ostringstream stream;

    stream << ";; id: " << mId << ", " << (mResponse ? "response" : "query") << ", opcode: " << int{mOpcode}
           << ", rcode: " << int{mRcode} << (mAuthoritative ? ", aa" : "") << (mTruncated ? ", tc" : "") << "\n";

    if (!mQuestions.empty())
    {
        stream << ";; QUESTION SECTION:\n";

        for (const Question &question : mQuestions)
        {
            stream << ";" << question.mName << " IN " << TypeToString(question.mType) << "\n";
        }
    }

    AppendSection(stream, "ANSWER", mAnswers);
    AppendSection(stream, "AUTHORITY", mAuthorities);
    AppendSection(stream, "ADDITIONAL", mAdditionals);

    return stream.str();
}

} // namespace Dns

} // namespace zc
