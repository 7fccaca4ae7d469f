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
// \brief Chunk checksums: per bytesPerChecksum window digests carried in
// the chunk descriptor and verified by the replicas.
//
//----------------------------------------------------------------------------

#ifndef RBSIO_CHECKSUM_H
#define RBSIO_CHECKSUM_H

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>
#include <ostream>

namespace RBS
{
using std::string;
using std::vector;
using std::ostream;

enum ChecksumType
{
    kChecksumTypeNone    = 0,
    kChecksumTypeAdler32 = 1,
    kChecksumTypeCrc32   = 2,
    kChecksumTypeMd5     = 3,
    kChecksumTypeSha256  = 4,
    kChecksumTypeCount
};

const uint32_t kDefaultBytesPerChecksum = 1 << 20;

const char* ChecksumTypeToName(ChecksumType type);
// Returns kChecksumTypeCount if the name is not recognized.
ChecksumType ChecksumTypeFromName(const char* name);

struct ChecksumData
{
    ChecksumData(
        ChecksumType t  = kChecksumTypeNone,
        uint32_t     bc = kDefaultBytesPerChecksum)
        : type(t),
          bytesPerChecksum(bc),
          checksums()
        {}
    bool operator==(const ChecksumData& other) const
    {
        return (type == other.type &&
            bytesPerChecksum == other.bytesPerChecksum &&
            checksums == other.checksums);
    }
    bool operator!=(const ChecksumData& other) const
        { return (! (*this == other)); }
    ostream& Display(ostream& os) const;

    ChecksumType   type;
    uint32_t       bytesPerChecksum;
    // One binary digest per window, the last window can be short.
    vector<string> checksums;
};

inline static ostream&
operator<<(ostream& os, const ChecksumData& data)
    { return data.Display(os); }

class Checksum
{
public:
    Checksum(
        ChecksumType inType             = kChecksumTypeNone,
        uint32_t     inBytesPerChecksum = kDefaultBytesPerChecksum)
        : mType(inType),
          mBytesPerChecksum(inBytesPerChecksum)
        {}
    // Returns 0 on success, or -EINVAL for unsupported type / window size.
    int ComputeChecksum(
        const char*   inDataPtr,
        size_t        inLength,
        ChecksumData& outChecksum) const;
    // Returns 0 if the data matches, or -EBADMSG on mismatch.
    static int VerifyChecksum(
        const char*         inDataPtr,
        size_t              inLength,
        const ChecksumData& inChecksum);
    ChecksumType GetType() const
        { return mType; }
    uint32_t GetBytesPerChecksum() const
        { return mBytesPerChecksum; }
    bool IsValid() const
    {
        return (kChecksumTypeNone <= mType && mType < kChecksumTypeCount &&
            0 < mBytesPerChecksum);
    }
private:
    ChecksumType mType;
    uint32_t     mBytesPerChecksum;
};

uint32_t ComputeAdler32(const char* data, size_t len);
uint32_t ComputeCrc32(const char* data, size_t len);

}

#endif // RBSIO_CHECKSUM_H
