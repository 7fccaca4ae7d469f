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
// \brief In process replica set emulator. Implements the replica session
// transport with a log index per accepted op, and a completion thread that
// delivers the op results asynchronously. Used by the unit tests and by
// rbsput.
//
//----------------------------------------------------------------------------

#ifndef EMULATOR_REPLICA_SET_EMULATOR_H
#define EMULATOR_REPLICA_SET_EMULATOR_H

#include "libclient/ReplicaSession.h"
#include "libclient/BlockOps.h"
#include "qcdio/QCMutex.h"
#include "qcdio/QCThread.h"

#include <deque>
#include <map>
#include <string>
#include <vector>

namespace RBS
{
namespace client
{
using std::deque;
using std::map;
using std::string;
using std::vector;

class ReplicaSetEmulator :
    public ReplicaSession,
    public ReplicaSessionManager,
    public QCRunnable
{
public:
    ReplicaSetEmulator(
        int           inReplicaCount = 3,
        const string& inPipelineId   = string("pipeline"));
    virtual ~ReplicaSetEmulator();
    void Start();
    // Completes all pending ops with the canceled flag set.
    void Stop();

    virtual void WriteChunk(
        WriteChunkOp& inOp,
        OpOwner&      inOwner);
    virtual void PutBlock(
        PutBlockOp& inOp,
        OpOwner&    inOwner);
    virtual void WatchForCommit(
        WatchForCommitOp& inOp,
        OpOwner&          inOwner);
    virtual void CancelAll(
        OpOwner& inOwner);
    virtual rbsLogIndex_t GetReplicatedMinCommitIndex() const;
    virtual vector<ReplicaId> GetReplicas() const;

    virtual ReplicaSession* Acquire(
        const string& inPipelineId);
    virtual void Release(
        ReplicaSession* inSessionPtr,
        bool            inInvalidateFlag);

    // Fails the Nth chunk write received, counting from 1. 0 disables.
    void SetFailChunkWrite(
        int64_t inOrdinal,
        int     inStatus = kErrorTransport);
    void SetFailPutBlocks(
        bool inFlag,
        int  inStatus = kErrorTransport);
    // The replicas see corrupted chunk data, and reject the writes with
    // checksum mismatch.
    void SetCorruptChunkData(
        bool inFlag);
    // Put-block responses name a different local block id.
    void SetMismatchBlockId(
        bool inFlag);
    // Watches succeed immediately, reporting a commit index one below the
    // watched index.
    void SetShortWatchCommit(
        bool inFlag);
    // Put-blocks are applied, but their completions are held until
    // released.
    void SetHoldPutBlocks(
        bool inFlag);
    void ReleaseHeldPutBlocks(
        bool inReverseOrderFlag = false);
    // A lagging replica stops applying ops.
    void SetReplicaLagging(
        int  inReplicaIdx,
        bool inFlag);

    int GetReplicaCount() const;
    int64_t GetWriteChunkCount() const;
    int64_t GetPutBlockCount() const;
    int64_t GetWatchCount() const;
    int64_t GetAcquireCount() const;
    int64_t GetReleaseCount() const;
    int64_t GetInvalidateCount() const;
    size_t GetHeldPutBlockCount() const;
    rbsLogIndex_t GetLastLogIndex() const;
    rbsLogIndex_t GetReplicaCommitIndex(
        int inReplicaIdx) const;
    bool GetReplicaBlockData(
        int        inReplicaIdx,
        BlockData& outData) const;
    bool GetReplicaChunk(
        int           inReplicaIdx,
        const string& inName,
        string&       outData) const;

    virtual void Run();

private:
    struct Replica
    {
        Replica()
            : mId(),
              mCommitIndex(0),
              mLaggingFlag(false),
              mChunks(),
              mBlockData(),
              mHasBlockDataFlag(false)
            {}
        ReplicaId           mId;
        rbsLogIndex_t       mCommitIndex;
        bool                mLaggingFlag;
        map<string, string> mChunks;
        BlockData           mBlockData;
        bool                mHasBlockDataFlag;
    };
    struct Pending
    {
        Pending(
            RbsOp*        inOpPtr    = 0,
            OpOwner*      inOwnerPtr = 0,
            const string& inData     = string())
            : mOpPtr(inOpPtr),
              mOwnerPtr(inOwnerPtr),
              mData(inData),
              mDeadline(0),
              mFailStatus(0)
            {}
        RbsOp*   mOpPtr;
        OpOwner* mOwnerPtr;
        string   mData;
        int64_t  mDeadline;
        int      mFailStatus;
    };
    typedef deque<Pending> Queue;
    typedef vector<Pending> Watches;
    typedef vector<Replica> Replicas;

    const string    mPipelineId;
    QCThread        mThread;
    mutable QCMutex mMutex;
    QCCondVar       mWorkCond;
    QCCondVar       mCallbackDoneCond;
    Queue           mQueue;
    Queue           mHeldPutBlocks;
    Queue           mReadyQueue;
    Watches         mWatches;
    Replicas        mReplicas;
    OpOwner*        mCallbackOwnerPtr;
    bool            mStopFlag;
    rbsLogIndex_t   mLogIndex;
    int64_t         mWriteChunkCount;
    int64_t         mPutBlockCount;
    int64_t         mWatchCount;
    int64_t         mAcquireCount;
    int64_t         mReleaseCount;
    int64_t         mInvalidateCount;
    int64_t         mFailChunkWriteOrdinal;
    int             mFailChunkWriteStatus;
    bool            mFailPutBlocksFlag;
    int             mFailPutBlocksStatus;
    bool            mCorruptChunkDataFlag;
    bool            mMismatchBlockIdFlag;
    bool            mShortWatchCommitFlag;
    bool            mHoldPutBlocksFlag;

    void Submit(
        const Pending& inPending);
    void Process(
        Pending& inPending);
    void ApplyWriteChunk(
        Pending& inPending);
    void ApplyPutBlock(
        Pending& inPending);
    // Returns true if the watch is complete.
    bool EvaluateWatch(
        WatchForCommitOp& inOp,
        bool              inTimedOutFlag) const;
    void CancelQueued(
        Queue& inCanceled);
    void CheckWatches(
        int64_t inNow);
    int64_t NextWatchDeadline() const;
    static int64_t Now();
    static void RemoveOwner(
        Queue&    ioQueue,
        OpOwner&  inOwner,
        Queue&    outCanceled);

    ReplicaSetEmulator(const ReplicaSetEmulator&);
    ReplicaSetEmulator& operator=(const ReplicaSetEmulator&);
};

} // namespace client
} // namespace RBS

#endif // EMULATOR_REPLICA_SET_EMULATOR_H
