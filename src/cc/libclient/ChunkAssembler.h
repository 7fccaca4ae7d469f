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
// \brief Builds chunk descriptors from buffer segments and issues the
// asynchronous chunk writes.
//
//----------------------------------------------------------------------------

#ifndef LIBCLIENT_CHUNK_ASSEMBLER_H
#define LIBCLIENT_CHUNK_ASSEMBLER_H

#include "BlockOps.h"
#include "rbsio/checksum.h"

#include <string>

namespace RBS
{
namespace client
{
using std::string;

class ReplicaSession;
class OpOwner;

class ChunkAssembler
{
public:
    ChunkAssembler(
        const string&   inKey,
        const string&   inStreamId,
        const Checksum& inChecksum);
    ~ChunkAssembler();
    // Assigns the next chunk index and builds the descriptor for the data.
    // Returns 0 or a negative error code if the checksum cannot be computed.
    int BuildChunk(
        const char* inDataPtr,
        int         inLength,
        ChunkInfo&  outChunk);
    // Builds the descriptor and submits the write. On success the op is
    // owned by the session until the owner callback is invoked, and the
    // descriptor is returned in outChunk.
    int WriteChunk(
        ReplicaSession& inSession,
        OpOwner&        inOwner,
        rbsSeq_t        inSeq,
        const BlockId&  inBlockId,
        const char*     inDataPtr,
        int             inLength,
        ChunkInfo&      outChunk);
    string MakeChunkName(
        int64_t inChunkIndex) const;
    string MakeRequestId(
        RbsOp_t       inOpType,
        const string& inSuffix) const;
    int64_t GetChunkIndex() const
        { return mChunkIndex; }
    const string& GetKeyHash() const
        { return mKeyHash; }
    const string& GetStreamId() const
        { return mStreamId; }

private:
    const string   mKeyHash;
    const string   mStreamId;
    const Checksum mChecksum;
    int64_t        mChunkIndex;

    ChunkAssembler(const ChunkAssembler&);
    ChunkAssembler& operator=(const ChunkAssembler&);
};

} // namespace client
} // namespace RBS

#endif // LIBCLIENT_CHUNK_ASSEMBLER_H
