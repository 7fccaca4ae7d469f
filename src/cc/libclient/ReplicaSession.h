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
// \brief Replica set transport interface. All operations are asynchronous,
// the result is delivered by invoking the owner's OpDone() on an arbitrary
// thread, exactly once per submitted op.
//
//----------------------------------------------------------------------------

#ifndef LIBCLIENT_REPLICA_SESSION_H
#define LIBCLIENT_REPLICA_SESSION_H

#include "BlockOps.h"

#include <string>
#include <vector>

namespace RBS
{
namespace client
{
using std::string;
using std::vector;

class OpOwner
{
public:
    virtual void OpDone(
        RbsOp* inOpPtr,
        bool   inCanceledFlag) = 0;
    virtual ~OpOwner() {}
};

class ReplicaSession
{
public:
    virtual void WriteChunk(
        WriteChunkOp& inOp,
        OpOwner&      inOwner) = 0;
    virtual void PutBlock(
        PutBlockOp& inOp,
        OpOwner&    inOwner) = 0;
    // Completes with -ETIMEDOUT if the index is not committed within the op
    // timeout.
    virtual void WatchForCommit(
        WatchForCommitOp& inOp,
        OpOwner&          inOwner) = 0;
    // Completes all pending ops of the owner with the canceled flag set. No
    // owner callback is in progress or invoked after the return.
    virtual void CancelAll(
        OpOwner& inOwner) = 0;
    // The lowest log index committed by every replica.
    virtual rbsLogIndex_t GetReplicatedMinCommitIndex() const = 0;
    virtual vector<ReplicaId> GetReplicas() const = 0;
protected:
    ReplicaSession()
        {}
    virtual ~ReplicaSession()
        {}
};

class ReplicaSessionManager
{
public:
    // Returns null if the pipeline cannot be reached.
    virtual ReplicaSession* Acquire(
        const string& inPipelineId) = 0;
    virtual void Release(
        ReplicaSession* inSessionPtr,
        bool            inInvalidateFlag) = 0;
protected:
    ReplicaSessionManager()
        {}
    virtual ~ReplicaSessionManager()
        {}
};

} // namespace client
} // namespace RBS

#endif // LIBCLIENT_REPLICA_SESSION_H
