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
// \brief Maps put-block log index to the stream position it flushed, and
// returns buffer pool segments once the bytes they hold are quorum
// committed.
//
//----------------------------------------------------------------------------

#ifndef LIBCLIENT_COMMIT_TRACKER_H
#define LIBCLIENT_COMMIT_TRACKER_H

#include "common/rbstypes.h"

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

class BufferPool;

class CommitTracker
{
public:
    typedef map<rbsLogIndex_t, rbsOff_t> CommitIndexMap;
    typedef vector<rbsLogIndex_t>        Indices;

    CommitTracker(
        BufferPool&   inBufferPool,
        const string& inLogPrefix = string());
    ~CommitTracker();
    void Insert(
        rbsLogIndex_t inLogIndex,
        rbsOff_t      inFlushPos);
    // Records the stream end position of a segment handed to the transport.
    void AddSegmentEnd(
        rbsOff_t inEndPos);
    // Removes the given entries in ascending log index order. The
    // acknowledged length must strictly increase with each removal,
    // otherwise the process aborts.
    void UpdateFlushIndex(
        const Indices& inIndices);
    // Applies UpdateFlushIndex() to all entries with log index less than or
    // equal to the commit index. Returns the number of entries removed.
    int AdjustBuffers(
        rbsLogIndex_t inCommitIndex);
    void Clear();
    void SetLogPrefix(
        const string& inLogPrefix)
        { mLogPrefix = inLogPrefix; }
    bool IsEmpty() const
        { return mCommitIndexMap.empty(); }
    size_t GetSize() const
        { return mCommitIndexMap.size(); }
    rbsLogIndex_t GetMinIndex() const
    {
        return (mCommitIndexMap.empty() ?
            kRbsLogIndexNone : mCommitIndexMap.begin()->first);
    }
    rbsLogIndex_t GetMaxIndex() const
    {
        return (mCommitIndexMap.empty() ?
            kRbsLogIndexNone : mCommitIndexMap.rbegin()->first);
    }
    rbsOff_t GetTotalAckDataLength() const
        { return mTotalAckDataLength; }
    int64_t GetReleasedSegmentCount() const
        { return mReleasedSegmentCount; }
    size_t GetPendingSegmentCount() const
        { return mSegmentEnds.size(); }
    const CommitIndexMap& GetCommitIndexMap() const
        { return mCommitIndexMap; }

private:
    typedef deque<rbsOff_t> SegmentEnds;

    BufferPool&    mBufferPool;
    string         mLogPrefix;
    CommitIndexMap mCommitIndexMap;
    SegmentEnds    mSegmentEnds;
    rbsOff_t       mTotalAckDataLength;
    int64_t        mReleasedSegmentCount;

    void ReleaseBuffers();

    CommitTracker(const CommitTracker&);
    CommitTracker& operator=(const CommitTracker&);
};

} // namespace client
} // namespace RBS

#endif // LIBCLIENT_COMMIT_TRACKER_H
