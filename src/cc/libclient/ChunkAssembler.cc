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
//
//----------------------------------------------------------------------------

#include "ChunkAssembler.h"
#include "ReplicaSession.h"

#include "common/MdDigest.h"
#include "common/MsgLogger.h"

#include <sstream>

namespace RBS
{
namespace client
{
using std::ostringstream;

ChunkAssembler::ChunkAssembler(
    const string&   inKey,
    const string&   inStreamId,
    const Checksum& inChecksum)
    : mKeyHash(MdDigest::Md5Hex(inKey)),
      mStreamId(inStreamId),
      mChecksum(inChecksum),
      mChunkIndex(0)
{
}

ChunkAssembler::~ChunkAssembler()
{
}

    string
ChunkAssembler::MakeChunkName(
    int64_t inChunkIndex) const
{
    ostringstream theStream;
    theStream << mKeyHash <<
        "_stream_" << mStreamId <<
        "_chunk_"  << inChunkIndex;
    return theStream.str();
}

    string
ChunkAssembler::MakeRequestId(
    RbsOp_t       inOpType,
    const string& inSuffix) const
{
    ostringstream theStream;
    theStream << mStreamId << OpTypeToName(inOpType) << mChunkIndex <<
        inSuffix;
    return theStream.str();
}

    int
ChunkAssembler::BuildChunk(
    const char* inDataPtr,
    int         inLength,
    ChunkInfo&  outChunk)
{
    ChunkInfo theChunk;
    const int theStatus = mChecksum.ComputeChecksum(
        inDataPtr, inLength, theChunk.checksum);
    if (theStatus != 0) {
        return theStatus;
    }
    theChunk.index  = ++mChunkIndex;
    theChunk.name   = MakeChunkName(theChunk.index);
    theChunk.offset = 0;
    theChunk.len    = inLength;
    outChunk = theChunk;
    return 0;
}

    int
ChunkAssembler::WriteChunk(
    ReplicaSession& inSession,
    OpOwner&        inOwner,
    rbsSeq_t        inSeq,
    const BlockId&  inBlockId,
    const char*     inDataPtr,
    int             inLength,
    ChunkInfo&      outChunk)
{
    WriteChunkOp* const theOpPtr = new WriteChunkOp(inSeq, inBlockId);
    const int theStatus = BuildChunk(inDataPtr, inLength, theOpPtr->chunk);
    if (theStatus != 0) {
        delete theOpPtr;
        return theStatus;
    }
    theOpPtr->data      = inDataPtr;
    theOpPtr->requestId = MakeRequestId(CMD_WRITE_CHUNK, theOpPtr->chunk.name);
    outChunk = theOpPtr->chunk;
    RBS_LOG_STREAM_DEBUG <<
        "BW " << mStreamId << " issue: " << theOpPtr->Show() <<
    RBS_LOG_EOM;
    inSession.WriteChunk(*theOpPtr, inOwner);
    return 0;
}

} // namespace client
} // namespace RBS
