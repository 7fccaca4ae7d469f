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
// \brief Block writer: streams bytes into one block of a replica set. The
// data is sliced into chunks, the chunk list is committed with put-block
// every flush size bytes, and the buffered data is retained until the
// replica set reports the covering put-block quorum committed.
//
// The public methods are meant to be invoked by a single owner thread.
// Asynchronous completions are applied by the writer's response dispatcher
// thread.
//
//----------------------------------------------------------------------------

#ifndef LIBCLIENT_BLOCK_WRITER_H
#define LIBCLIENT_BLOCK_WRITER_H

#include "common/rbstypes.h"
#include "common/rbsdecls.h"
#include "rbsio/checksum.h"

#include <stdint.h>
#include <string>
#include <vector>

namespace RBS
{
class Properties;

namespace client
{
using std::string;
using std::vector;

class BufferPool;
class ReplicaSessionManager;
struct BlockData;

class BlockWriter
{
public:
    typedef int64_t Offset;
    class Impl;

    struct Parameters
    {
        Parameters(
            int          inChunkSize        = 4 << 20,
            int64_t      inFlushSize        = 64 << 20,
            int64_t      inMaxBufferedBytes = 128 << 20,
            int64_t      inWatchTimeoutMs   = 30 * 1000,
            ChecksumType inChecksumType     = kChecksumTypeCrc32,
            int          inBytesPerChecksum = 1 << 20)
            : mChunkSize(inChunkSize),
              mFlushSize(inFlushSize),
              mMaxBufferedBytes(inMaxBufferedBytes),
              mWatchTimeoutMs(inWatchTimeoutMs),
              mChecksumType(inChecksumType),
              mBytesPerChecksum(inBytesPerChecksum)
            {}
        // Loads the "chunkSize", "streamBufferFlushSize",
        // "streamBufferMaxSize", "watchTimeoutMs", "checksumType", and
        // "bytesPerChecksum" keys under the prefix. Keys not present keep
        // the current values. Returns 0, or -EINVAL if the checksum type
        // name is not recognized.
        int SetParameters(
            const Properties& inProps,
            const char*       inPrefixPtr = "rbs.client.");
        // Returns 0 or -EINVAL, and the reason in outErrMsg.
        int Validate(
            string* outErrMsgPtr = 0) const;

        int          mChunkSize;
        int64_t      mFlushSize;
        int64_t      mMaxBufferedBytes;
        int64_t      mWatchTimeoutMs;
        ChecksumType mChecksumType;
        int          mBytesPerChecksum;
    };

    struct Stats
    {
        typedef int64_t Counter;
        Stats()
            : mChunkWriteCount(0),
              mChunkWriteByteCount(0),
              mChunkWriteErrorCount(0),
              mPutBlockCount(0),
              mPutBlockErrorCount(0),
              mWatchCount(0),
              mWatchErrorCount(0),
              mFullBufferCount(0),
              mSegmentReleaseCount(0),
              mRetryWriteByteCount(0),
              mCanceledCount(0)
            {}
        void Clear()
            { *this = Stats(); }
        Stats& Add(
            const Stats& inStats)
        {
            mChunkWriteCount      += inStats.mChunkWriteCount;
            mChunkWriteByteCount  += inStats.mChunkWriteByteCount;
            mChunkWriteErrorCount += inStats.mChunkWriteErrorCount;
            mPutBlockCount        += inStats.mPutBlockCount;
            mPutBlockErrorCount   += inStats.mPutBlockErrorCount;
            mWatchCount           += inStats.mWatchCount;
            mWatchErrorCount      += inStats.mWatchErrorCount;
            mFullBufferCount      += inStats.mFullBufferCount;
            mSegmentReleaseCount  += inStats.mSegmentReleaseCount;
            mRetryWriteByteCount  += inStats.mRetryWriteByteCount;
            mCanceledCount        += inStats.mCanceledCount;
            return *this;
        }
        template<typename T>
        void Enumerate(
            T& inFunctor) const
        {
            inFunctor("ChunkWrites",      mChunkWriteCount);
            inFunctor("ChunkWriteBytes",  mChunkWriteByteCount);
            inFunctor("ChunkWriteErrors", mChunkWriteErrorCount);
            inFunctor("PutBlocks",        mPutBlockCount);
            inFunctor("PutBlockErrors",   mPutBlockErrorCount);
            inFunctor("Watches",          mWatchCount);
            inFunctor("WatchErrors",      mWatchErrorCount);
            inFunctor("FullBuffer",       mFullBufferCount);
            inFunctor("SegmentsReleased", mSegmentReleaseCount);
            inFunctor("RetryWriteBytes",  mRetryWriteByteCount);
            inFunctor("Canceled",         mCanceledCount);
        }
        Counter mChunkWriteCount;
        Counter mChunkWriteByteCount;
        Counter mChunkWriteErrorCount;
        Counter mPutBlockCount;
        Counter mPutBlockErrorCount;
        Counter mWatchCount;
        Counter mWatchErrorCount;
        Counter mFullBufferCount;
        Counter mSegmentReleaseCount;
        Counter mRetryWriteByteCount;
        Counter mCanceledCount;
    };

    BlockWriter(
        ReplicaSessionManager& inSessionManager,
        BufferPool&            inBufferPool,
        const Parameters&      inParameters = Parameters(),
        const char*            inLogPrefixPtr = 0);
    ~BlockWriter();
    // Binds the writer to the block and acquires the pipeline session. The
    // buffer pool segment size must be equal to the chunk size.
    int Open(
        const BlockId& inBlockId,
        const string&  inKey,
        const string&  inPipelineId);
    // Returns the number of bytes written, or negative error code. Blocks if
    // the buffered unacknowledged data reaches the maximum.
    int Write(
        const char* inBufPtr,
        int         inLength);
    // Re-sends data already resident in the buffer pool, for example after
    // the previous writer of the same pool failed.
    int WriteOnRetry(
        Offset inLength);
    // Sends the trailing partial chunk, commits the chunk list, and waits
    // for all issued put-blocks to complete.
    int Flush();
    // Flushes, waits until the highest pending put-block is quorum
    // committed, and releases the session. Subsequent calls return 0, or
    // the stored error.
    int Close();
    // Cancels outstanding ops and releases the session.
    void Cleanup(
        bool inInvalidateSessionFlag);
    bool IsOpen() const;
    bool IsClosed() const;
    BlockId GetBlockId() const;
    Offset GetWrittenDataLength() const;
    Offset GetTotalDataFlushedLength() const;
    Offset GetTotalAckDataLength() const;
    vector<ReplicaId> GetFailedReplicas() const;
    int GetErrorCode() const;
    string GetErrorMessage() const;
    string GetStreamId() const;
    // The chunk list sent with the most recent put-block.
    void GetBlockData(
        BlockData& outData) const;
    size_t GetPendingCommitCount() const;
    void GetStats(
        Stats& outStats) const;
    const Parameters& GetParameters() const;

private:
    Impl& mImpl;

private:
    BlockWriter(
        const BlockWriter& inWriter);
    BlockWriter& operator=(
        const BlockWriter& inWriter);
};

} // namespace client
} // namespace RBS

#endif // LIBCLIENT_BLOCK_WRITER_H
