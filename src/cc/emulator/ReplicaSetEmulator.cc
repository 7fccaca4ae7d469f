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

#include "ReplicaSetEmulator.h"

#include "common/MsgLogger.h"
#include "qcdio/QCUtils.h"
#include "qcdio/qcstutils.h"
#include "rbsio/checksum.h"

#include <algorithm>
#include <functional>
#include <sstream>
#include <errno.h>
#include <time.h>

namespace RBS
{
namespace client
{
using std::max;
using std::min;
using std::ostringstream;

ReplicaSetEmulator::ReplicaSetEmulator(
    int           inReplicaCount,
    const string& inPipelineId)
    : ReplicaSession(),
      ReplicaSessionManager(),
      QCRunnable(),
      mPipelineId(inPipelineId),
      mThread(0, "replica-emulator"),
      mMutex(),
      mWorkCond(),
      mCallbackDoneCond(),
      mQueue(),
      mHeldPutBlocks(),
      mReadyQueue(),
      mWatches(),
      mReplicas(max(1, inReplicaCount)),
      mCallbackOwnerPtr(0),
      mStopFlag(true),
      mLogIndex(0),
      mWriteChunkCount(0),
      mPutBlockCount(0),
      mWatchCount(0),
      mAcquireCount(0),
      mReleaseCount(0),
      mInvalidateCount(0),
      mFailChunkWriteOrdinal(0),
      mFailChunkWriteStatus(kErrorTransport),
      mFailPutBlocksFlag(false),
      mFailPutBlocksStatus(kErrorTransport),
      mCorruptChunkDataFlag(false),
      mMismatchBlockIdFlag(false),
      mShortWatchCommitFlag(false),
      mHoldPutBlocksFlag(false)
{
    for (size_t i = 0; i < mReplicas.size(); i++) {
        ostringstream theStream;
        theStream << "replica-" << i << "." << mPipelineId;
        mReplicas[i].mId = ReplicaId(theStream.str(), 9858 + (int)i);
    }
}

ReplicaSetEmulator::~ReplicaSetEmulator()
{
    ReplicaSetEmulator::Stop();
}

    /* static */ int64_t
ReplicaSetEmulator::Now()
{
    struct timespec theTs;
    if (clock_gettime(CLOCK_MONOTONIC, &theTs)) {
        QCUtils::FatalError("clock_gettime", errno);
    }
    return ((int64_t)theTs.tv_sec * 1000 + theTs.tv_nsec / 1000000);
}

    void
ReplicaSetEmulator::Start()
{
    QCStMutexLocker theLock(mMutex);
    if (mThread.IsStarted()) {
        return;
    }
    mStopFlag = false;
    const int kStackSize = 64 << 10;
    mThread.Start(this, kStackSize, "replica-emulator");
}

    void
ReplicaSetEmulator::CancelQueued(
    ReplicaSetEmulator::Queue& inCanceled)
{
    inCanceled.insert(inCanceled.end(), mQueue.begin(), mQueue.end());
    inCanceled.insert(inCanceled.end(),
        mReadyQueue.begin(), mReadyQueue.end());
    inCanceled.insert(inCanceled.end(),
        mHeldPutBlocks.begin(), mHeldPutBlocks.end());
    inCanceled.insert(inCanceled.end(), mWatches.begin(), mWatches.end());
    mQueue.clear();
    mReadyQueue.clear();
    mHeldPutBlocks.clear();
    mWatches.clear();
}

    void
ReplicaSetEmulator::Stop()
{
    {
        QCStMutexLocker theLock(mMutex);
        mStopFlag = true;
        mWorkCond.NotifyAll();
    }
    mThread.Join();
    Queue theCanceled;
    {
        QCStMutexLocker theLock(mMutex);
        CancelQueued(theCanceled);
    }
    for (Queue::iterator it = theCanceled.begin();
            it != theCanceled.end();
            ++it) {
        it->mOwnerPtr->OpDone(it->mOpPtr, true);
    }
}

    void
ReplicaSetEmulator::Submit(
    const ReplicaSetEmulator::Pending& inPending)
{
    {
        QCStMutexLocker theLock(mMutex);
        if (! mStopFlag) {
            mQueue.push_back(inPending);
            mWorkCond.Notify();
            return;
        }
    }
    RBS_LOG_STREAM_DEBUG <<
        "emulator stopped, canceling: " << inPending.mOpPtr->Show() <<
    RBS_LOG_EOM;
    inPending.mOwnerPtr->OpDone(inPending.mOpPtr, true);
}

    void
ReplicaSetEmulator::WriteChunk(
    WriteChunkOp& inOp,
    OpOwner&      inOwner)
{
    Pending thePending(&inOp, &inOwner,
        inOp.data ? string(inOp.data, (size_t)max(int64_t(0), inOp.chunk.len)) :
            string());
    {
        QCStMutexLocker theLock(mMutex);
        mWriteChunkCount++;
        if (mFailChunkWriteOrdinal == mWriteChunkCount) {
            thePending.mFailStatus = mFailChunkWriteStatus;
        }
    }
    Submit(thePending);
}

    void
ReplicaSetEmulator::PutBlock(
    PutBlockOp& inOp,
    OpOwner&    inOwner)
{
    Pending thePending(&inOp, &inOwner);
    {
        QCStMutexLocker theLock(mMutex);
        mPutBlockCount++;
        if (mFailPutBlocksFlag) {
            thePending.mFailStatus = mFailPutBlocksStatus;
        }
    }
    Submit(thePending);
}

    void
ReplicaSetEmulator::WatchForCommit(
    WatchForCommitOp& inOp,
    OpOwner&          inOwner)
{
    {
        QCStMutexLocker theLock(mMutex);
        mWatchCount++;
    }
    Submit(Pending(&inOp, &inOwner));
}

    /* static */ void
ReplicaSetEmulator::RemoveOwner(
    ReplicaSetEmulator::Queue& ioQueue,
    OpOwner&                   inOwner,
    ReplicaSetEmulator::Queue& outCanceled)
{
    Queue theKeep;
    for (Queue::iterator it = ioQueue.begin(); it != ioQueue.end(); ++it) {
        if (it->mOwnerPtr == &inOwner) {
            outCanceled.push_back(*it);
        } else {
            theKeep.push_back(*it);
        }
    }
    ioQueue.swap(theKeep);
}

    void
ReplicaSetEmulator::CancelAll(
    OpOwner& inOwner)
{
    Queue theCanceled;
    {
        QCStMutexLocker theLock(mMutex);
        QCRTASSERT(! mThread.IsCurrentThread());
        RemoveOwner(mQueue,         inOwner, theCanceled);
        RemoveOwner(mReadyQueue,    inOwner, theCanceled);
        RemoveOwner(mHeldPutBlocks, inOwner, theCanceled);
        Watches theKeep;
        for (Watches::iterator it = mWatches.begin();
                it != mWatches.end();
                ++it) {
            if (it->mOwnerPtr == &inOwner) {
                theCanceled.push_back(*it);
            } else {
                theKeep.push_back(*it);
            }
        }
        mWatches.swap(theKeep);
        while (mCallbackOwnerPtr == &inOwner) {
            mCallbackDoneCond.Wait(mMutex);
        }
    }
    for (Queue::iterator it = theCanceled.begin();
            it != theCanceled.end();
            ++it) {
        inOwner.OpDone(it->mOpPtr, true);
    }
}

    rbsLogIndex_t
ReplicaSetEmulator::GetReplicatedMinCommitIndex() const
{
    QCStMutexLocker theLock(mMutex);
    rbsLogIndex_t theRet = mReplicas.front().mCommitIndex;
    for (Replicas::const_iterator it = mReplicas.begin();
            it != mReplicas.end();
            ++it) {
        theRet = min(theRet, it->mCommitIndex);
    }
    return theRet;
}

    vector<ReplicaId>
ReplicaSetEmulator::GetReplicas() const
{
    QCStMutexLocker theLock(mMutex);
    vector<ReplicaId> theRet;
    for (Replicas::const_iterator it = mReplicas.begin();
            it != mReplicas.end();
            ++it) {
        theRet.push_back(it->mId);
    }
    return theRet;
}

    ReplicaSession*
ReplicaSetEmulator::Acquire(
    const string& inPipelineId)
{
    if (! inPipelineId.empty() && inPipelineId != mPipelineId) {
        RBS_LOG_STREAM_ERROR <<
            "no such pipeline: " << inPipelineId <<
            " emulated: "        << mPipelineId <<
        RBS_LOG_EOM;
        return 0;
    }
    Start();
    QCStMutexLocker theLock(mMutex);
    mAcquireCount++;
    return this;
}

    void
ReplicaSetEmulator::Release(
    ReplicaSession* inSessionPtr,
    bool            inInvalidateFlag)
{
    QCRTASSERT(inSessionPtr == this);
    QCStMutexLocker theLock(mMutex);
    mReleaseCount++;
    if (inInvalidateFlag) {
        mInvalidateCount++;
    }
}

    void
ReplicaSetEmulator::ApplyWriteChunk(
    ReplicaSetEmulator::Pending& inPending)
{
    WriteChunkOp& theOp = *static_cast<WriteChunkOp*>(inPending.mOpPtr);
    if (inPending.mFailStatus != 0) {
        theOp.status    = inPending.mFailStatus;
        theOp.statusMsg = "injected chunk write failure";
        return;
    }
    string& theData = inPending.mData;
    if (mCorruptChunkDataFlag && ! theData.empty()) {
        theData[0] = (char)(theData[0] ^ 0xFF);
    }
    if ((int64_t)theData.size() != theOp.chunk.len ||
            Checksum::VerifyChecksum(theData.data(), theData.size(),
                theOp.chunk.checksum) != 0) {
        theOp.status    = kErrorChecksum;
        theOp.statusMsg = "chunk checksum mismatch";
        return;
    }
    theOp.logIndex = ++mLogIndex;
    for (Replicas::iterator it = mReplicas.begin();
            it != mReplicas.end();
            ++it) {
        if (it->mLaggingFlag) {
            continue;
        }
        it->mChunks[theOp.chunk.name] = theData;
        it->mCommitIndex = mLogIndex;
    }
}

    void
ReplicaSetEmulator::ApplyPutBlock(
    ReplicaSetEmulator::Pending& inPending)
{
    PutBlockOp& theOp = *static_cast<PutBlockOp*>(inPending.mOpPtr);
    if (inPending.mFailStatus != 0) {
        theOp.status    = inPending.mFailStatus;
        theOp.statusMsg = "injected put block failure";
        return;
    }
    theOp.logIndex = ++mLogIndex;
    BlockData theData = theOp.blockData;
    theData.blockId.commitSeq = theOp.logIndex;
    theOp.committedBlockId = theData.blockId;
    if (mMismatchBlockIdFlag) {
        theOp.committedBlockId.localId++;
    }
    for (Replicas::iterator it = mReplicas.begin();
            it != mReplicas.end();
            ++it) {
        if (it->mLaggingFlag) {
            continue;
        }
        it->mBlockData        = theData;
        it->mHasBlockDataFlag = true;
        it->mCommitIndex      = mLogIndex;
    }
}

    bool
ReplicaSetEmulator::EvaluateWatch(
    WatchForCommitOp& inOp,
    bool              inTimedOutFlag) const
{
    if (mShortWatchCommitFlag) {
        inOp.commitIndex = inOp.watchIndex - 1;
        inOp.status      = 0;
        return true;
    }
    vector<rbsLogIndex_t> theIndices;
    int                   theCommittedCnt = 0;
    for (Replicas::const_iterator it = mReplicas.begin();
            it != mReplicas.end();
            ++it) {
        theIndices.push_back(it->mCommitIndex);
        if (inOp.watchIndex <= it->mCommitIndex) {
            theCommittedCnt++;
        }
    }
    std::sort(theIndices.begin(), theIndices.end(),
        std::greater<rbsLogIndex_t>());
    const int theCnt      = (int)theIndices.size();
    const int theMajority = theCnt / 2 + 1;
    if (theCommittedCnt == theCnt) {
        inOp.commitIndex = theIndices.back();
        inOp.status      = 0;
        return true;
    }
    if (theMajority <= theCommittedCnt) {
        inOp.commitIndex = theIndices[theMajority - 1];
        inOp.status      = 0;
        inOp.laggingReplicas.clear();
        for (Replicas::const_iterator it = mReplicas.begin();
                it != mReplicas.end();
                ++it) {
            if (it->mCommitIndex < inOp.watchIndex) {
                inOp.laggingReplicas.push_back(it->mId);
            }
        }
        return true;
    }
    if (! inTimedOutFlag) {
        return false;
    }
    inOp.commitIndex = theIndices.back();
    inOp.status      = kErrorCommitTimeout;
    inOp.statusMsg   = "watch for commit timed out";
    return true;
}

    void
ReplicaSetEmulator::Process(
    ReplicaSetEmulator::Pending& inPending)
{
    RbsOp& theOp = *inPending.mOpPtr;
    switch (theOp.op) {
        case CMD_WRITE_CHUNK:
            ApplyWriteChunk(inPending);
            break;
        case CMD_PUT_BLOCK:
            ApplyPutBlock(inPending);
            if (theOp.status == 0 && mHoldPutBlocksFlag) {
                mHeldPutBlocks.push_back(inPending);
                return;
            }
            break;
        case CMD_WATCH_FOR_COMMIT: {
            WatchForCommitOp& theWatch = static_cast<WatchForCommitOp&>(theOp);
            if (! EvaluateWatch(theWatch, false)) {
                inPending.mDeadline = Now() + max(int64_t(0), theWatch.timeoutMs);
                mWatches.push_back(inPending);
                return;
            }
            break;
        }
        default:
            theOp.status    = -EINVAL;
            theOp.statusMsg = "invalid op";
            break;
    }
    mReadyQueue.push_back(inPending);
}

    void
ReplicaSetEmulator::CheckWatches(
    int64_t inNow)
{
    Watches theKeep;
    for (Watches::iterator it = mWatches.begin(); it != mWatches.end(); ++it) {
        WatchForCommitOp& theOp = *static_cast<WatchForCommitOp*>(it->mOpPtr);
        if (EvaluateWatch(theOp, it->mDeadline <= inNow)) {
            mReadyQueue.push_back(*it);
        } else {
            theKeep.push_back(*it);
        }
    }
    mWatches.swap(theKeep);
}

    int64_t
ReplicaSetEmulator::NextWatchDeadline() const
{
    int64_t theRet = -1;
    for (Watches::const_iterator it = mWatches.begin();
            it != mWatches.end();
            ++it) {
        if (theRet < 0 || it->mDeadline < theRet) {
            theRet = it->mDeadline;
        }
    }
    return theRet;
}

    void
ReplicaSetEmulator::Run()
{
    QCStMutexLocker theLock(mMutex);
    while (! mStopFlag) {
        if (! mWatches.empty()) {
            CheckWatches(Now());
        }
        if (! mReadyQueue.empty()) {
            Pending const thePending = mReadyQueue.front();
            mReadyQueue.pop_front();
            mCallbackOwnerPtr = thePending.mOwnerPtr;
            {
                QCStMutexUnlocker theUnlocker(mMutex);
                thePending.mOwnerPtr->OpDone(thePending.mOpPtr, false);
            }
            mCallbackOwnerPtr = 0;
            mCallbackDoneCond.NotifyAll();
            continue;
        }
        if (! mQueue.empty()) {
            Pending thePending = mQueue.front();
            mQueue.pop_front();
            Process(thePending);
            continue;
        }
        const int64_t theDeadline = NextWatchDeadline();
        if (theDeadline < 0) {
            mWorkCond.Wait(mMutex);
        } else {
            const int64_t theWait = max(int64_t(1), theDeadline - Now());
            mWorkCond.Wait(mMutex, theWait * 1000 * 1000);
        }
    }
}

    void
ReplicaSetEmulator::SetFailChunkWrite(
    int64_t inOrdinal,
    int     inStatus)
{
    QCStMutexLocker theLock(mMutex);
    mFailChunkWriteOrdinal = inOrdinal;
    mFailChunkWriteStatus  = inStatus;
}

    void
ReplicaSetEmulator::SetFailPutBlocks(
    bool inFlag,
    int  inStatus)
{
    QCStMutexLocker theLock(mMutex);
    mFailPutBlocksFlag   = inFlag;
    mFailPutBlocksStatus = inStatus;
}

    void
ReplicaSetEmulator::SetCorruptChunkData(
    bool inFlag)
{
    QCStMutexLocker theLock(mMutex);
    mCorruptChunkDataFlag = inFlag;
}

    void
ReplicaSetEmulator::SetMismatchBlockId(
    bool inFlag)
{
    QCStMutexLocker theLock(mMutex);
    mMismatchBlockIdFlag = inFlag;
}

    void
ReplicaSetEmulator::SetShortWatchCommit(
    bool inFlag)
{
    QCStMutexLocker theLock(mMutex);
    mShortWatchCommitFlag = inFlag;
}

    void
ReplicaSetEmulator::SetHoldPutBlocks(
    bool inFlag)
{
    QCStMutexLocker theLock(mMutex);
    mHoldPutBlocksFlag = inFlag;
}

    void
ReplicaSetEmulator::ReleaseHeldPutBlocks(
    bool inReverseOrderFlag)
{
    QCStMutexLocker theLock(mMutex);
    if (inReverseOrderFlag) {
        mReadyQueue.insert(mReadyQueue.end(),
            mHeldPutBlocks.rbegin(), mHeldPutBlocks.rend());
    } else {
        mReadyQueue.insert(mReadyQueue.end(),
            mHeldPutBlocks.begin(), mHeldPutBlocks.end());
    }
    mHeldPutBlocks.clear();
    mWorkCond.Notify();
}

    void
ReplicaSetEmulator::SetReplicaLagging(
    int  inReplicaIdx,
    bool inFlag)
{
    QCStMutexLocker theLock(mMutex);
    if (inReplicaIdx < 0 || (int)mReplicas.size() <= inReplicaIdx) {
        return;
    }
    Replica& theReplica = mReplicas[inReplicaIdx];
    theReplica.mLaggingFlag = inFlag;
    if (! inFlag) {
        // Catch up with the log.
        theReplica.mCommitIndex = mLogIndex;
        mWorkCond.Notify();
    }
}

    int
ReplicaSetEmulator::GetReplicaCount() const
{
    QCStMutexLocker theLock(mMutex);
    return (int)mReplicas.size();
}

    int64_t
ReplicaSetEmulator::GetWriteChunkCount() const
{
    QCStMutexLocker theLock(mMutex);
    return mWriteChunkCount;
}

    int64_t
ReplicaSetEmulator::GetPutBlockCount() const
{
    QCStMutexLocker theLock(mMutex);
    return mPutBlockCount;
}

    int64_t
ReplicaSetEmulator::GetWatchCount() const
{
    QCStMutexLocker theLock(mMutex);
    return mWatchCount;
}

    int64_t
ReplicaSetEmulator::GetAcquireCount() const
{
    QCStMutexLocker theLock(mMutex);
    return mAcquireCount;
}

    int64_t
ReplicaSetEmulator::GetReleaseCount() const
{
    QCStMutexLocker theLock(mMutex);
    return mReleaseCount;
}

    int64_t
ReplicaSetEmulator::GetInvalidateCount() const
{
    QCStMutexLocker theLock(mMutex);
    return mInvalidateCount;
}

    size_t
ReplicaSetEmulator::GetHeldPutBlockCount() const
{
    QCStMutexLocker theLock(mMutex);
    return mHeldPutBlocks.size();
}

    rbsLogIndex_t
ReplicaSetEmulator::GetLastLogIndex() const
{
    QCStMutexLocker theLock(mMutex);
    return mLogIndex;
}

    rbsLogIndex_t
ReplicaSetEmulator::GetReplicaCommitIndex(
    int inReplicaIdx) const
{
    QCStMutexLocker theLock(mMutex);
    if (inReplicaIdx < 0 || (int)mReplicas.size() <= inReplicaIdx) {
        return kRbsLogIndexNone;
    }
    return mReplicas[inReplicaIdx].mCommitIndex;
}

    bool
ReplicaSetEmulator::GetReplicaBlockData(
    int        inReplicaIdx,
    BlockData& outData) const
{
    QCStMutexLocker theLock(mMutex);
    if (inReplicaIdx < 0 || (int)mReplicas.size() <= inReplicaIdx ||
            ! mReplicas[inReplicaIdx].mHasBlockDataFlag) {
        return false;
    }
    outData = mReplicas[inReplicaIdx].mBlockData;
    return true;
}

    bool
ReplicaSetEmulator::GetReplicaChunk(
    int           inReplicaIdx,
    const string& inName,
    string&       outData) const
{
    QCStMutexLocker theLock(mMutex);
    if (inReplicaIdx < 0 || (int)mReplicas.size() <= inReplicaIdx) {
        return false;
    }
    const map<string, string>& theChunks = mReplicas[inReplicaIdx].mChunks;
    map<string, string>::const_iterator const theIt = theChunks.find(inName);
    if (theIt == theChunks.end()) {
        return false;
    }
    outData = theIt->second;
    return true;
}

} // namespace client
} // namespace RBS
