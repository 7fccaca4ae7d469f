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
// \brief Block writer implementation.
//
//----------------------------------------------------------------------------

#include "BlockWriter.h"
#include "BlockOps.h"
#include "BufferPool.h"
#include "ChunkAssembler.h"
#include "CommitTracker.h"
#include "ReplicaSession.h"
#include "ResponseDispatcher.h"

#include "common/MdDigest.h"
#include "common/MsgLogger.h"
#include "common/Properties.h"
#include "qcdio/QCMutex.h"
#include "qcdio/QCUtils.h"
#include "qcdio/qcstutils.h"

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

#include <boost/scoped_ptr.hpp>
#include <boost/static_assert.hpp>

namespace RBS
{
namespace client
{

using std::min;
using std::max;
using std::string;
using std::vector;
using std::ostringstream;
using boost::scoped_ptr;

BOOST_STATIC_ASSERT(kErrorClosed < 0 && kErrorTransport < 0 &&
    kErrorCommitTimeout < 0 && kErrorChecksum < 0);

    int
BlockWriter::Parameters::SetParameters(
    const Properties& inProps,
    const char*       inPrefixPtr)
{
    const string thePrefix = inPrefixPtr ? inPrefixPtr : "";
    mChunkSize = inProps.getValue(
        thePrefix + "chunkSize", mChunkSize);
    mFlushSize = inProps.getValue(
        thePrefix + "streamBufferFlushSize", mFlushSize);
    mMaxBufferedBytes = inProps.getValue(
        thePrefix + "streamBufferMaxSize", mMaxBufferedBytes);
    mWatchTimeoutMs = inProps.getValue(
        thePrefix + "watchTimeoutMs", mWatchTimeoutMs);
    mBytesPerChecksum = inProps.getValue(
        thePrefix + "bytesPerChecksum", mBytesPerChecksum);
    const char* const theTypePtr = inProps.getValue(
        thePrefix + "checksumType", (const char*)0);
    if (! theTypePtr) {
        return 0;
    }
    const ChecksumType theType = ChecksumTypeFromName(theTypePtr);
    if (theType == kChecksumTypeCount) {
        RBS_LOG_STREAM_ERROR <<
            "invalid " << thePrefix << "checksumType: " << theTypePtr <<
        RBS_LOG_EOM;
        return kErrorParameters;
    }
    mChecksumType = theType;
    return 0;
}

    int
BlockWriter::Parameters::Validate(
    string* outErrMsgPtr) const
{
    const char* theMsgPtr = 0;
    if (mChunkSize <= 0) {
        theMsgPtr = "chunk size must be positive";
    } else if (mFlushSize <= 0) {
        theMsgPtr = "flush size must be positive";
    } else if (mMaxBufferedBytes <= 0) {
        theMsgPtr = "max buffered bytes must be positive";
    } else if (mFlushSize % mChunkSize != 0) {
        theMsgPtr = "flush size must be a multiple of chunk size";
    } else if (mMaxBufferedBytes % mFlushSize != 0) {
        theMsgPtr = "max buffered bytes must be a multiple of flush size";
    } else if (mWatchTimeoutMs <= 0) {
        theMsgPtr = "watch timeout must be positive";
    } else if (mChecksumType < kChecksumTypeNone ||
            kChecksumTypeCount <= mChecksumType) {
        theMsgPtr = "invalid checksum type";
    } else if (mBytesPerChecksum <= 0) {
        theMsgPtr = "bytes per checksum must be positive";
    }
    if (! theMsgPtr) {
        return 0;
    }
    if (outErrMsgPtr) {
        *outErrMsgPtr = theMsgPtr;
    }
    return kErrorParameters;
}

class BlockWriter::Impl : public OpOwner
{
public:
    typedef BlockWriter::Offset Offset;

    Impl(
        ReplicaSessionManager& inSessionManager,
        BufferPool&            inBufferPool,
        const Parameters&      inParameters,
        const char*            inLogPrefixPtr)
        : OpOwner(),
          mSessionManager(inSessionManager),
          mBufferPool(inBufferPool),
          mParameters(inParameters),
          mUserLogPrefix(inLogPrefixPtr ? inLogPrefixPtr : ""),
          mLogPrefix(mUserLogPrefix),
          mMutex(),
          mCond(),
          mDispatcher("rbs-dispatcher"),
          mSessionPtr(0),
          mAssemblerPtr(),
          mTracker(inBufferPool, mLogPrefix),
          mBlockData(),
          mStreamId(),
          mCurSegmentPtr(0),
          mWrittenDataLength(0),
          mTotalDataFlushedLength(0),
          mPutBlockInFlightCount(0),
          mWatchInFlightFlag(false),
          mWatchStatus(0),
          mFailedReplicas(),
          mErrorCode(0),
          mErrorMsg(),
          mOpenedFlag(false),
          mClosedFlag(false),
          mSeq(0),
          mStats()
        {}
    virtual ~Impl()
    {
        QCStMutexLocker theLock(mMutex);
        if (mSessionPtr) {
            CleanupSelf(false);
        }
    }
    int Open(
        const BlockId& inBlockId,
        const string&  inKey,
        const string&  inPipelineId)
    {
        QCStMutexLocker theLock(mMutex);
        if (mOpenedFlag) {
            RBS_LOG_STREAM_ERROR << mLogPrefix <<
                "open: already opened" <<
            RBS_LOG_EOM;
            return kErrorParameters;
        }
        string theErrMsg;
        if (mParameters.Validate(&theErrMsg) != 0) {
            RBS_LOG_STREAM_ERROR << mLogPrefix <<
                "open: " << theErrMsg <<
            RBS_LOG_EOM;
            return kErrorParameters;
        }
        if (mBufferPool.GetSegmentSize() != mParameters.mChunkSize ||
                mBufferPool.GetCapacityBytes() <
                    mParameters.mMaxBufferedBytes) {
            RBS_LOG_STREAM_ERROR << mLogPrefix <<
                "open: buffer pool segment size: " <<
                    mBufferPool.GetSegmentSize() <<
                " capacity: "    << mBufferPool.GetCapacityBytes() <<
                " chunk size: "  << mParameters.mChunkSize <<
                " max buffered: " << mParameters.mMaxBufferedBytes <<
                " mismatch" <<
            RBS_LOG_EOM;
            return kErrorParameters;
        }
        if (! inBlockId.IsValid()) {
            RBS_LOG_STREAM_ERROR << mLogPrefix <<
                "open: invalid " << inBlockId <<
            RBS_LOG_EOM;
            return kErrorParameters;
        }
        mStreamId = MdDigest::RandomHexId();
        if (mStreamId.empty()) {
            RBS_LOG_STREAM_ERROR << mLogPrefix <<
                "open: failed to generate stream id" <<
            RBS_LOG_EOM;
            return kErrorTransport;
        }
        mLogPrefix = mUserLogPrefix + "BW " + mStreamId + " ";
        mTracker.SetLogPrefix(mLogPrefix);
        ReplicaSession* const theSessionPtr =
            mSessionManager.Acquire(inPipelineId);
        if (! theSessionPtr) {
            RBS_LOG_STREAM_ERROR << mLogPrefix <<
                "open: pipeline " << inPipelineId << " unavailable" <<
            RBS_LOG_EOM;
            return kErrorTransport;
        }
        mAssemblerPtr.reset(new ChunkAssembler(inKey, mStreamId,
            Checksum(mParameters.mChecksumType,
                mParameters.mBytesPerChecksum)));
        mBlockData = BlockData();
        mBlockData.blockId = inBlockId;
        mBlockData.metadata["TYPE"] = "KEY";
        mSessionPtr = theSessionPtr;
        mOpenedFlag = true;
        mDispatcher.Start();
        RBS_LOG_STREAM_DEBUG << mLogPrefix <<
            "open: " << inBlockId <<
            " key: "      << inKey <<
            " pipeline: " << inPipelineId <<
        RBS_LOG_EOM;
        return 0;
    }
    int Write(
        const char* inBufPtr,
        int         inLength)
    {
        QCStMutexLocker theLock(mMutex);
        int theStatus = CheckOpen();
        if (theStatus != 0) {
            return theStatus;
        }
        if (inLength < 0 || (0 < inLength && ! inBufPtr)) {
            return kErrorParameters;
        }
        const char* thePtr = inBufPtr;
        int         theRem = inLength;
        while (0 < theRem) {
            if (! mCurSegmentPtr) {
                mCurSegmentPtr = mBufferPool.AllocateSegmentIfNeeded();
                if (! mCurSegmentPtr) {
                    return SetError(kErrorNoSpace, "no free buffer segment");
                }
            }
            const Offset theFlushRem = mParameters.mFlushSize -
                mWrittenDataLength % mParameters.mFlushSize;
            const int    theLen      = mBufferPool.Append(*mCurSegmentPtr,
                thePtr, (int)min(Offset(theRem), theFlushRem));
            QCRTASSERT(0 < theLen);
            thePtr             += theLen;
            theRem             -= theLen;
            mWrittenDataLength += theLen;
            if ((theStatus = WriteProcessed(false)) != 0) {
                return theStatus;
            }
        }
        CheckInvariants();
        return inLength;
    }
    int WriteOnRetry(
        Offset inLength)
    {
        QCStMutexLocker theLock(mMutex);
        int theStatus = CheckOpen();
        if (theStatus != 0) {
            return theStatus;
        }
        if (inLength < 0) {
            return kErrorParameters;
        }
        RBS_LOG_STREAM_DEBUG << mLogPrefix <<
            "retry: length: " << inLength <<
            " buffered: "     << mBufferPool.GetBufferedBytes() <<
            " segments: "     << mBufferPool.GetSegmentCount() <<
        RBS_LOG_EOM;
        // Chunks are re-sent whole, only the trailing unsealed segment can
        // be taken partially.
        Offset theAvail = 0;
        for (int i = 0; theAvail < inLength; i++) {
            const BufferPool::Segment* const theSegPtr =
                mBufferPool.GetSegment(i);
            if (! theSegPtr || theSegPtr->GetSize() <= 0) {
                RBS_LOG_STREAM_ERROR << mLogPrefix <<
                    "retry: length: " << inLength <<
                    " exceeds buffered: " << theAvail <<
                RBS_LOG_EOM;
                return kErrorParameters;
            }
            theAvail += theSegPtr->GetSize();
            if (inLength < theAvail &&
                    (theSegPtr->IsFull() || theSegPtr->IsSealed())) {
                RBS_LOG_STREAM_ERROR << mLogPrefix <<
                    "retry: length: " << inLength <<
                    " ends inside chunk: " << i <<
                    " end: " << theAvail <<
                RBS_LOG_EOM;
                return kErrorParameters;
            }
        }
        const int64_t theReleasedStart = mTracker.GetReleasedSegmentCount();
        Offset        theRem           = inLength;
        int           theCount         = 0;
        while (0 < theRem) {
            const int theIdx = theCount - (int)(
                mTracker.GetReleasedSegmentCount() - theReleasedStart);
            BufferPool::Segment* const theSegPtr =
                mBufferPool.GetSegment(theIdx);
            if (! theSegPtr || theSegPtr->GetSize() <= 0) {
                RBS_LOG_STREAM_ERROR << mLogPrefix <<
                    "retry: no buffered data at segment: " << theIdx <<
                    " remaining: " << theRem <<
                RBS_LOG_EOM;
                return kErrorParameters;
            }
            const int theLen = (int)min(Offset(theSegPtr->GetSize()), theRem);
            theRem             -= theLen;
            mWrittenDataLength += theLen;
            mStats.mRetryWriteByteCount += theLen;
            theCount++;
            if (theLen == theSegPtr->GetSize() &&
                    (theSegPtr->IsFull() || theSegPtr->IsSealed())) {
                mCurSegmentPtr = 0;
                if ((theStatus = SendSegment(*theSegPtr)) != 0) {
                    return theStatus;
                }
            } else {
                mCurSegmentPtr = theSegPtr;
            }
            if ((theStatus = WriteProcessed(true)) != 0) {
                return theStatus;
            }
        }
        CheckInvariants();
        return 0;
    }
    int Flush()
    {
        QCStMutexLocker theLock(mMutex);
        const int theStatus = CheckOpen();
        if (theStatus != 0) {
            return theStatus;
        }
        return FlushSelf();
    }
    int Close()
    {
        QCStMutexLocker theLock(mMutex);
        if (! mSessionPtr) {
            return mErrorCode;
        }
        int theStatus = CheckOpen();
        if (theStatus == 0) {
            theStatus = FlushSelf();
        }
        if (theStatus == 0 && ! mTracker.IsEmpty()) {
            theStatus = WatchForCommit(mTracker.GetMaxIndex());
            if (theStatus == 0) {
                theStatus = CheckOpen();
            }
            if (theStatus == 0 && ! mTracker.IsEmpty()) {
                theStatus = SetError(kErrorCommitTimeout,
                    "close: put-blocks not committed");
            }
        }
        if (theStatus == 0) {
            CheckInvariants();
            RBS_LOG_STREAM_DEBUG << mLogPrefix <<
                "closed: " << mBlockData.blockId <<
                " written: " << mWrittenDataLength <<
                " acked: "   << mTracker.GetTotalAckDataLength() <<
                " chunks: "  << mBlockData.chunks.size() <<
            RBS_LOG_EOM;
        }
        CleanupSelf(false);
        mClosedFlag = true;
        return theStatus;
    }
    void Cleanup(
        bool inInvalidateSessionFlag)
    {
        QCStMutexLocker theLock(mMutex);
        CleanupSelf(inInvalidateSessionFlag);
    }
    virtual void OpDone(
        RbsOp* inOpPtr,
        bool   inCanceledFlag)
    {
        QCRTASSERT(inOpPtr);
        Completion& theCompletion =
            *(new Completion(*this, *inOpPtr, inCanceledFlag));
        mDispatcher.Enqueue(theCompletion);
    }
    bool IsOpen() const
    {
        QCStMutexLocker theLock(mMutex);
        return (mSessionPtr != 0);
    }
    bool IsClosed() const
    {
        QCStMutexLocker theLock(mMutex);
        return mClosedFlag;
    }
    BlockId GetBlockId() const
    {
        QCStMutexLocker theLock(mMutex);
        return mBlockData.blockId;
    }
    Offset GetWrittenDataLength() const
    {
        QCStMutexLocker theLock(mMutex);
        return mWrittenDataLength;
    }
    Offset GetTotalDataFlushedLength() const
    {
        QCStMutexLocker theLock(mMutex);
        return mTotalDataFlushedLength;
    }
    Offset GetTotalAckDataLength() const
    {
        QCStMutexLocker theLock(mMutex);
        return mTracker.GetTotalAckDataLength();
    }
    vector<ReplicaId> GetFailedReplicas() const
    {
        QCStMutexLocker theLock(mMutex);
        return mFailedReplicas;
    }
    int GetErrorCode() const
    {
        QCStMutexLocker theLock(mMutex);
        return mErrorCode;
    }
    string GetErrorMessage() const
    {
        QCStMutexLocker theLock(mMutex);
        return mErrorMsg;
    }
    string GetStreamId() const
    {
        QCStMutexLocker theLock(mMutex);
        return mStreamId;
    }
    void GetBlockData(
        BlockData& outData) const
    {
        QCStMutexLocker theLock(mMutex);
        outData = mBlockData;
    }
    size_t GetPendingCommitCount() const
    {
        QCStMutexLocker theLock(mMutex);
        return mTracker.GetSize();
    }
    void GetStats(
        Stats& outStats) const
    {
        QCStMutexLocker theLock(mMutex);
        outStats = mStats;
        outStats.mSegmentReleaseCount = mTracker.GetReleasedSegmentCount();
    }
    const Parameters& GetParameters() const
        { return mParameters; }

private:
    class Completion : public ResponseDispatcher::Request
    {
    public:
        Completion(
            Impl&  inOuter,
            RbsOp& inOp,
            bool   inCanceledFlag)
            : ResponseDispatcher::Request(),
              mOuter(inOuter),
              mOp(inOp),
              mCanceledFlag(inCanceledFlag)
            {}
        virtual void Run()
            { mOuter.Dispatch(mOp, mCanceledFlag); }
        virtual void Done(
            bool inRanFlag)
        {
            if (! inRanFlag) {
                mOuter.Dispatch(mOp, true);
            }
            delete this;
        }
    private:
        Impl&      mOuter;
        RbsOp&     mOp;
        const bool mCanceledFlag;

        virtual ~Completion()
            {}
        Completion(const Completion&);
        Completion& operator=(const Completion&);
    };
    friend class Completion;

    class AdjustBuffersRequest : public ResponseDispatcher::SyncRequest
    {
    public:
        AdjustBuffersRequest(
            Impl& inOuter)
            : ResponseDispatcher::SyncRequest(),
              mOuter(inOuter)
            {}
        virtual void Run()
            { mOuter.AdjustBuffersOnError(); }
    private:
        Impl& mOuter;
    };
    friend class AdjustBuffersRequest;

    ReplicaSessionManager&     mSessionManager;
    BufferPool&                mBufferPool;
    const Parameters           mParameters;
    const string               mUserLogPrefix;
    string                     mLogPrefix;
    mutable QCMutex            mMutex;
    QCCondVar                  mCond;
    ResponseDispatcher         mDispatcher;
    ReplicaSession*            mSessionPtr;
    scoped_ptr<ChunkAssembler> mAssemblerPtr;
    CommitTracker              mTracker;
    BlockData                  mBlockData;
    string                     mStreamId;
    BufferPool::Segment*       mCurSegmentPtr;
    Offset                     mWrittenDataLength;
    Offset                     mTotalDataFlushedLength;
    int                        mPutBlockInFlightCount;
    bool                       mWatchInFlightFlag;
    int                        mWatchStatus;
    vector<ReplicaId>          mFailedReplicas;
    int                        mErrorCode;
    string                     mErrorMsg;
    bool                       mOpenedFlag;
    bool                       mClosedFlag;
    rbsSeq_t                   mSeq;
    Stats                      mStats;

    rbsSeq_t NextSeq()
        { return ++mSeq; }
    void CheckInvariants() const
    {
        QCRTASSERT(
            mTracker.GetTotalAckDataLength() <= mTotalDataFlushedLength &&
            mTotalDataFlushedLength <= mWrittenDataLength
        );
    }
    // The first error is kept, later errors are only logged.
    int SetError(
        int           inStatus,
        const string& inMsg)
    {
        QCRTASSERT(inStatus < 0);
        if (mErrorCode == 0) {
            mErrorCode = inStatus;
            mErrorMsg  = inMsg;
            RBS_LOG_STREAM_ERROR << mLogPrefix <<
                "error: " << mErrorCode <<
                " "       << ErrorCodeToStr(mErrorCode) <<
                " "       << mErrorMsg <<
            RBS_LOG_EOM;
        } else {
            RBS_LOG_STREAM_DEBUG << mLogPrefix <<
                "ignoring error: " << inStatus << " " << inMsg <<
                " current: "       << mErrorCode <<
            RBS_LOG_EOM;
        }
        mCond.NotifyAll();
        return mErrorCode;
    }
    int CheckOpen()
    {
        if (! mSessionPtr) {
            return kErrorClosed;
        }
        if (mErrorCode != 0) {
            AdjustBuffersOnErrorSync();
            return mErrorCode;
        }
        return 0;
    }
    void AdjustBuffersOnErrorSync()
    {
        AdjustBuffersRequest theReq(*this);
        QCStMutexUnlocker theUnlocker(mMutex);
        theReq.Execute(mDispatcher);
    }
    // Credits whatever the replica set has committed so far.
    void AdjustBuffersOnError()
    {
        QCStMutexLocker theLock(mMutex);
        if (! mSessionPtr) {
            return;
        }
        const rbsLogIndex_t theIndex =
            mSessionPtr->GetReplicatedMinCommitIndex();
        const int theCnt = mTracker.AdjustBuffers(theIndex);
        RBS_LOG_STREAM_DEBUG << mLogPrefix <<
            "adjust buffers: replicated commit index: " << theIndex <<
            " removed: " << theCnt <<
            " acked: "   << mTracker.GetTotalAckDataLength() <<
        RBS_LOG_EOM;
        mCond.NotifyAll();
    }
    int WriteProcessed(
        bool inRetryFlag)
    {
        int theStatus;
        if (mCurSegmentPtr && mCurSegmentPtr->IsFull()) {
            BufferPool::Segment& theSeg = *mCurSegmentPtr;
            mCurSegmentPtr = 0;
            if ((theStatus = SendSegment(theSeg)) != 0) {
                return theStatus;
            }
        }
        if (mWrittenDataLength % mParameters.mFlushSize == 0) {
            if ((theStatus = HandlePartialFlush()) != 0) {
                return theStatus;
            }
        }
        if (inRetryFlag ?
                mWrittenDataLength == mParameters.mMaxBufferedBytes :
                IsBufferPoolFull()) {
            HandleFullBuffer();
        }
        return (mErrorCode != 0 ? CheckOpen() : 0);
    }
    bool IsBufferPoolFull() const
    {
        return (mParameters.mMaxBufferedBytes <=
                mBufferPool.GetBufferedBytes() ||
            (mBufferPool.GetFreeCount() <= 0 &&
                (! mCurSegmentPtr || mCurSegmentPtr->GetRemaining() <= 0))
        );
    }
    int SendSegment(
        BufferPool::Segment& inSegment)
    {
        mBufferPool.Seal(inSegment);
        mTracker.AddSegmentEnd(mWrittenDataLength);
        ChunkInfo theChunk;
        const int theStatus = mAssemblerPtr->WriteChunk(
            *mSessionPtr,
            *this,
            NextSeq(),
            mBlockData.blockId,
            inSegment.GetPtr(),
            inSegment.GetSize(),
            theChunk
        );
        if (theStatus != 0) {
            return SetError(theStatus, "chunk checksum computation failure");
        }
        mBlockData.AddChunk(theChunk);
        mStats.mChunkWriteCount++;
        mStats.mChunkWriteByteCount += theChunk.len;
        return 0;
    }
    int HandlePartialFlush()
    {
        if (mCurSegmentPtr && 0 < mCurSegmentPtr->GetSize()) {
            BufferPool::Segment& theSeg = *mCurSegmentPtr;
            mCurSegmentPtr = 0;
            const int theStatus = SendSegment(theSeg);
            if (theStatus != 0) {
                return theStatus;
            }
        }
        mTotalDataFlushedLength = mWrittenDataLength;
        PutBlockOp& theOp = *(new PutBlockOp(
            NextSeq(), mBlockData, mTotalDataFlushedLength));
        theOp.requestId = mAssemblerPtr->MakeRequestId(
            CMD_PUT_BLOCK, mBlockData.blockId.ToString());
        mPutBlockInFlightCount++;
        mStats.mPutBlockCount++;
        RBS_LOG_STREAM_DEBUG << mLogPrefix <<
            "issue: " << theOp.Show() <<
            " in flight: " << mPutBlockInFlightCount <<
        RBS_LOG_EOM;
        mSessionPtr->PutBlock(theOp, *this);
        return 0;
    }
    void WaitForPutBlocks()
    {
        while (0 < mPutBlockInFlightCount) {
            mCond.Wait(mMutex);
        }
    }
    void HandleFullBuffer()
    {
        mStats.mFullBufferCount++;
        RBS_LOG_STREAM_DEBUG << mLogPrefix <<
            "buffer full: buffered: " << mBufferPool.GetBufferedBytes() <<
            " written: " << mWrittenDataLength <<
            " flushed: " << mTotalDataFlushedLength <<
            " acked: "   << mTracker.GetTotalAckDataLength() <<
        RBS_LOG_EOM;
        while (mErrorCode == 0 && IsBufferPoolFull()) {
            WaitForPutBlocks();
            if (mErrorCode != 0) {
                break;
            }
            if (mTracker.IsEmpty() &&
                    mTotalDataFlushedLength < mWrittenDataLength) {
                if (HandlePartialFlush() != 0) {
                    break;
                }
                WaitForPutBlocks();
                if (mErrorCode != 0) {
                    break;
                }
            }
            if (mTracker.IsEmpty()) {
                SetError(kErrorNoSpace, "buffer pool full, nothing to commit");
                break;
            }
            const size_t thePendingCount = mTracker.GetSize();
            if (WatchForCommit(mTracker.GetMinIndex()) == 0 &&
                    thePendingCount <= mTracker.GetSize()) {
                SetError(kErrorCommitTimeout,
                    "watch for commit made no progress");
            }
        }
    }
    int WatchForCommit(
        rbsLogIndex_t inIndex)
    {
        WatchForCommitOp& theOp = *(new WatchForCommitOp(
            NextSeq(), inIndex, mParameters.mWatchTimeoutMs));
        ostringstream theStream;
        theStream << mStreamId << OpTypeToName(CMD_WATCH_FOR_COMMIT) <<
            inIndex;
        theOp.requestId = theStream.str();
        mStats.mWatchCount++;
        mWatchInFlightFlag = true;
        mWatchStatus       = 0;
        RBS_LOG_STREAM_DEBUG << mLogPrefix <<
            "issue: " << theOp.Show() <<
        RBS_LOG_EOM;
        mSessionPtr->WatchForCommit(theOp, *this);
        while (mWatchInFlightFlag) {
            mCond.Wait(mMutex);
        }
        return mWatchStatus;
    }
    int FlushSelf()
    {
        if (mTotalDataFlushedLength < mWrittenDataLength) {
            const int theStatus = HandlePartialFlush();
            if (theStatus != 0) {
                return theStatus;
            }
        }
        WaitForPutBlocks();
        return CheckOpen();
    }
    void CleanupSelf(
        bool inInvalidateSessionFlag)
    {
        ReplicaSession* const theSessionPtr = mSessionPtr;
        if (theSessionPtr) {
            theSessionPtr->CancelAll(*this);
        }
        {
            QCStMutexUnlocker theUnlocker(mMutex);
            mDispatcher.Stop();
        }
        QCRTASSERT(mPutBlockInFlightCount == 0 && ! mWatchInFlightFlag);
        mSessionPtr    = 0;
        mCurSegmentPtr = 0;
        mTracker.Clear();
        if (theSessionPtr) {
            mSessionManager.Release(theSessionPtr, inInvalidateSessionFlag);
        }
    }
    void Dispatch(
        RbsOp& inOp,
        bool   inCanceledFlag)
    {
        QCStMutexLocker theLock(mMutex);
        if (inCanceledFlag) {
            mStats.mCanceledCount++;
        }
        switch (inOp.op) {
            case CMD_WRITE_CHUNK:
                WriteChunkDone(static_cast<WriteChunkOp&>(inOp),
                    inCanceledFlag);
                break;
            case CMD_PUT_BLOCK:
                PutBlockDone(static_cast<PutBlockOp&>(inOp),
                    inCanceledFlag);
                break;
            case CMD_WATCH_FOR_COMMIT:
                WatchForCommitDone(static_cast<WatchForCommitOp&>(inOp),
                    inCanceledFlag);
                break;
            default:
                QCRTASSERT(! "invalid op type");
                break;
        }
        delete &inOp;
        mCond.NotifyAll();
    }
    static int StatusToError(
        int inStatus)
    {
        switch (inStatus) {
            case kErrorChecksum:      return kErrorChecksum;
            case kErrorCommitTimeout: return kErrorCommitTimeout;
            default:                  break;
        }
        return kErrorTransport;
    }
    string OpError(
        const RbsOp& inOp,
        const char*  inMsgPtr) const
    {
        ostringstream theStream;
        theStream << inMsgPtr << ": " << inOp.status;
        if (! inOp.statusMsg.empty()) {
            theStream << " " << inOp.statusMsg;
        }
        theStream << " " << inOp.Show();
        return theStream.str();
    }
    void WriteChunkDone(
        WriteChunkOp& inOp,
        bool          inCanceledFlag)
    {
        if (inCanceledFlag) {
            return;
        }
        if (inOp.status != 0) {
            mStats.mChunkWriteErrorCount++;
            SetError(StatusToError(inOp.status),
                OpError(inOp, "write chunk failed"));
            return;
        }
        if (inOp.logIndex < 0) {
            mStats.mChunkWriteErrorCount++;
            SetError(kErrorChecksum,
                OpError(inOp, "write chunk: invalid response log index"));
            return;
        }
        RBS_LOG_STREAM_DEBUG << mLogPrefix <<
            "done: " << inOp.Show() <<
            " index: " << inOp.logIndex <<
        RBS_LOG_EOM;
    }
    void PutBlockDone(
        PutBlockOp& inOp,
        bool        inCanceledFlag)
    {
        QCRTASSERT(0 < mPutBlockInFlightCount);
        mPutBlockInFlightCount--;
        if (inCanceledFlag) {
            return;
        }
        if (inOp.status != 0) {
            mStats.mPutBlockErrorCount++;
            SetError(StatusToError(inOp.status),
                OpError(inOp, "put block failed"));
            return;
        }
        if (mErrorCode != 0) {
            RBS_LOG_STREAM_DEBUG << mLogPrefix <<
                "put block done after error: " << inOp.Show() <<
            RBS_LOG_EOM;
            return;
        }
        if (! inOp.committedBlockId.IsSameBlock(mBlockData.blockId) ||
                inOp.logIndex < 0) {
            mStats.mPutBlockErrorCount++;
            ostringstream theStream;
            theStream << "put block: response " << inOp.committedBlockId <<
                " index: " << inOp.logIndex <<
                " does not match " << mBlockData.blockId;
            SetError(kErrorChecksum, theStream.str());
            return;
        }
        mBlockData.blockId = inOp.committedBlockId;
        mTracker.Insert(inOp.logIndex, inOp.flushPos);
    }
    void WatchForCommitDone(
        WatchForCommitOp& inOp,
        bool              inCanceledFlag)
    {
        mWatchInFlightFlag = false;
        if (inCanceledFlag) {
            mWatchStatus = kErrorTransport;
            return;
        }
        if (inOp.status == 0) {
            mFailedReplicas.insert(mFailedReplicas.end(),
                inOp.laggingReplicas.begin(), inOp.laggingReplicas.end());
            if (! inOp.laggingReplicas.empty()) {
                RBS_LOG_STREAM_INFO << mLogPrefix <<
                    "commit index: " << inOp.commitIndex <<
                    " lagging replicas: " << inOp.laggingReplicas.size() <<
                    " first: " << inOp.laggingReplicas.front() <<
                RBS_LOG_EOM;
            }
            mTracker.AdjustBuffers(max(inOp.commitIndex, rbsLogIndex_t(0)));
            mWatchStatus = 0;
            return;
        }
        mStats.mWatchErrorCount++;
        RBS_LOG_STREAM_WARN << mLogPrefix <<
            "watch for commit failed: " << inOp.status <<
            " " << inOp.statusMsg <<
            " " << inOp.Show() <<
        RBS_LOG_EOM;
        if (mSessionPtr) {
            mTracker.AdjustBuffers(mSessionPtr->GetReplicatedMinCommitIndex());
        }
        mWatchStatus = SetError(
            inOp.status == kErrorCommitTimeout ?
                kErrorCommitTimeout : kErrorTransport,
            OpError(inOp, "watch for commit failed"));
    }

private:
    Impl(
        const Impl& inImpl);
    Impl& operator=(
        const Impl& inImpl);
};

BlockWriter::BlockWriter(
    ReplicaSessionManager&         inSessionManager,
    BufferPool&                    inBufferPool,
    const BlockWriter::Parameters& inParameters,
    const char*                    inLogPrefixPtr)
    : mImpl(*new BlockWriter::Impl(
        inSessionManager, inBufferPool, inParameters, inLogPrefixPtr))
{
}

BlockWriter::~BlockWriter()
{
    delete &mImpl;
}

    int
BlockWriter::Open(
    const BlockId& inBlockId,
    const string&  inKey,
    const string&  inPipelineId)
{
    return mImpl.Open(inBlockId, inKey, inPipelineId);
}

    int
BlockWriter::Write(
    const char* inBufPtr,
    int         inLength)
{
    return mImpl.Write(inBufPtr, inLength);
}

    int
BlockWriter::WriteOnRetry(
    BlockWriter::Offset inLength)
{
    return mImpl.WriteOnRetry(inLength);
}

    int
BlockWriter::Flush()
{
    return mImpl.Flush();
}

    int
BlockWriter::Close()
{
    return mImpl.Close();
}

    void
BlockWriter::Cleanup(
    bool inInvalidateSessionFlag)
{
    mImpl.Cleanup(inInvalidateSessionFlag);
}

    bool
BlockWriter::IsOpen() const
{
    return mImpl.IsOpen();
}

    bool
BlockWriter::IsClosed() const
{
    return mImpl.IsClosed();
}

    BlockId
BlockWriter::GetBlockId() const
{
    return mImpl.GetBlockId();
}

    BlockWriter::Offset
BlockWriter::GetWrittenDataLength() const
{
    return mImpl.GetWrittenDataLength();
}

    BlockWriter::Offset
BlockWriter::GetTotalDataFlushedLength() const
{
    return mImpl.GetTotalDataFlushedLength();
}

    BlockWriter::Offset
BlockWriter::GetTotalAckDataLength() const
{
    return mImpl.GetTotalAckDataLength();
}

    vector<ReplicaId>
BlockWriter::GetFailedReplicas() const
{
    return mImpl.GetFailedReplicas();
}

    int
BlockWriter::GetErrorCode() const
{
    return mImpl.GetErrorCode();
}

    string
BlockWriter::GetErrorMessage() const
{
    return mImpl.GetErrorMessage();
}

    string
BlockWriter::GetStreamId() const
{
    return mImpl.GetStreamId();
}

    void
BlockWriter::GetBlockData(
    BlockData& outData) const
{
    mImpl.GetBlockData(outData);
}

    size_t
BlockWriter::GetPendingCommitCount() const
{
    return mImpl.GetPendingCommitCount();
}

    void
BlockWriter::GetStats(
    BlockWriter::Stats& outStats) const
{
    mImpl.GetStats(outStats);
}

    const BlockWriter::Parameters&
BlockWriter::GetParameters() const
{
    return mImpl.GetParameters();
}

} // namespace client
} // namespace RBS
