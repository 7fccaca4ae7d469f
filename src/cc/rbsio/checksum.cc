//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2026/10/18
//
// This file is part of Replicated Block Store (RBS).
//
// Licensed under the Apache License, Version 2.0
// (the "License"); you may not use this file except in compliance with
// the License. You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or
// implied. See the License for the specific language governing
// permissions and limitations under the License.
//
// \brief Adler32 and CRC32 come from zlib, MD5 and SHA256 from OpenSSL EVP.
//
//----------------------------------------------------------------------------

#include "checksum.h"
#include "common/MdDigest.h"

#include <algorithm>
#include <errno.h>
#include <string.h>
#include <strings.h>
#include <zlib.h>

namespace RBS
{

using std::min;

static const char* const kChecksumTypeNames[kChecksumTypeCount] = {
    "NONE",
    "ADLER32",
    "CRC32",
    "MD5",
    "SHA256"
};

const char*
ChecksumTypeToName(ChecksumType type)
{
    if (type < kChecksumTypeNone || kChecksumTypeCount <= type) {
        return "INVALID";
    }
    return kChecksumTypeNames[type];
}

ChecksumType
ChecksumTypeFromName(const char* name)
{
    if (! name) {
        return kChecksumTypeCount;
    }
    for (int i = 0; i < kChecksumTypeCount; i++) {
        if (strcasecmp(name, kChecksumTypeNames[i]) == 0) {
            return ChecksumType(i);
        }
    }
    return kChecksumTypeCount;
}

uint32_t
ComputeAdler32(const char* data, size_t len)
{
    uLong theRet = adler32(0L, Z_NULL, 0);
    while (0 < len) {
        const uInt theLen = (uInt)min(len, size_t(1) << 30);
        theRet = adler32(theRet, reinterpret_cast<const Bytef*>(data), theLen);
        data += theLen;
        len  -= theLen;
    }
    return (uint32_t)theRet;
}

uint32_t
ComputeCrc32(const char* data, size_t len)
{
    uLong theRet = crc32(0L, Z_NULL, 0);
    while (0 < len) {
        const uInt theLen = (uInt)min(len, size_t(1) << 30);
        theRet = crc32(theRet, reinterpret_cast<const Bytef*>(data), theLen);
        data += theLen;
        len  -= theLen;
    }
    return (uint32_t)theRet;
}

static inline string
Uint32ToBytes(uint32_t val)
{
    string theRet(4, char(0));
    theRet[0] = char((val >> 24) & 0xFF);
    theRet[1] = char((val >> 16) & 0xFF);
    theRet[2] = char((val >>  8) & 0xFF);
    theRet[3] = char(val & 0xFF);
    return theRet;
}

static bool
ComputeWindow(
    ChecksumType inType,
    MdDigest*    inDigestPtr,
    const char*  inDataPtr,
    size_t       inLength,
    string&      outSum)
{
    switch (inType) {
        case kChecksumTypeAdler32:
            outSum = Uint32ToBytes(ComputeAdler32(inDataPtr, inLength));
            return true;
        case kChecksumTypeCrc32:
            outSum = Uint32ToBytes(ComputeCrc32(inDataPtr, inLength));
            return true;
        case kChecksumTypeMd5:
        case kChecksumTypeSha256: {
            if (! inDigestPtr || ! inDigestPtr->Update(inDataPtr, inLength)) {
                return false;
            }
            MdDigest::MD theMd;
            const size_t theLen = inDigestPtr->GetMdBin(theMd);
            if (theLen <= 0) {
                return false;
            }
            outSum.assign(reinterpret_cast<const char*>(theMd), theLen);
            return true;
        }
        default:
            break;
    }
    return false;
}

int
Checksum::ComputeChecksum(
    const char*   inDataPtr,
    size_t        inLength,
    ChecksumData& outChecksum) const
{
    outChecksum = ChecksumData(mType, mBytesPerChecksum);
    if (! IsValid()) {
        return -EINVAL;
    }
    if (mType == kChecksumTypeNone) {
        return 0;
    }
    MdDigest* theDigestPtr = 0;
    MdDigest  theMd5("MD5");
    MdDigest  theSha256("SHA256");
    if (mType == kChecksumTypeMd5) {
        theDigestPtr = &theMd5;
    } else if (mType == kChecksumTypeSha256) {
        theDigestPtr = &theSha256;
    }
    for (size_t thePos = 0; thePos < inLength; ) {
        const size_t theLen = min(inLength - thePos, size_t(mBytesPerChecksum));
        string       theSum;
        if (! ComputeWindow(mType, theDigestPtr, inDataPtr + thePos, theLen,
                theSum)) {
            outChecksum.checksums.clear();
            return -EINVAL;
        }
        outChecksum.checksums.push_back(theSum);
        thePos += theLen;
    }
    return 0;
}

/* static */ int
Checksum::VerifyChecksum(
    const char*         inDataPtr,
    size_t              inLength,
    const ChecksumData& inChecksum)
{
    const Checksum theChecksum(inChecksum.type, inChecksum.bytesPerChecksum);
    ChecksumData   theComputed;
    const int      theStatus = theChecksum.ComputeChecksum(
        inDataPtr, inLength, theComputed);
    if (theStatus != 0) {
        return theStatus;
    }
    return (theComputed == inChecksum ? 0 : -EBADMSG);
}

ostream&
ChecksumData::Display(ostream& os) const
{
    os << ChecksumTypeToName(type) << "/" << bytesPerChecksum << "[";
    const char* theSepPtr = "";
    for (vector<string>::const_iterator it = checksums.begin();
            it != checksums.end();
            ++it) {
        os << theSepPtr << MdDigest::ToHex(
            reinterpret_cast<const unsigned char*>(it->data()), it->size());
        theSepPtr = " ";
    }
    return (os << "]");
}

}
