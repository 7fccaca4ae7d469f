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

#include "CommitTracker.h"
#include "BufferPool.h"

#include "common/MsgLogger.h"
#include "qcdio/QCUtils.h"

#include <algorithm>
#include <utility>

namespace RBS
{
namespace client
{

CommitTracker::CommitTracker(
    BufferPool&   inBufferPool,
    const string& inLogPrefix)
    : mBufferPool(inBufferPool),
      mLogPrefix(inLogPrefix),
      mCommitIndexMap(),
      mSegmentEnds(),
      mTotalAckDataLength(0),
      mReleasedSegmentCount(0)
{
}

CommitTracker::~CommitTracker()
{
}

    void
CommitTracker::Insert(
    rbsLogIndex_t inLogIndex,
    rbsOff_t      inFlushPos)
{
    RBS_LOG_STREAM_DEBUG << mLogPrefix <<
        "commit map insert:"
        " index: "    << inLogIndex <<
        " flushPos: " << inFlushPos <<
        " entries: "  << mCommitIndexMap.size() <<
    RBS_LOG_EOM;
    const bool theInsertedFlag = mCommitIndexMap.insert(
        std::make_pair(inLogIndex, inFlushPos)).second;
    QCRTASSERT(theInsertedFlag);
}

    void
CommitTracker::AddSegmentEnd(
    rbsOff_t inEndPos)
{
    QCRTASSERT(mSegmentEnds.empty() || mSegmentEnds.back() <= inEndPos);
    mSegmentEnds.push_back(inEndPos);
}

    void
CommitTracker::UpdateFlushIndex(
    const CommitTracker::Indices& inIndices)
{
    Indices theIndices(inIndices);
    std::sort(theIndices.begin(), theIndices.end());
    for (Indices::const_iterator it = theIndices.begin();
            it != theIndices.end();
            ++it) {
        CommitIndexMap::iterator const theIt = mCommitIndexMap.find(*it);
        if (theIt == mCommitIndexMap.end()) {
            continue;
        }
        const rbsOff_t theLength = theIt->second;
        QCRTASSERT(mTotalAckDataLength < theLength);
        mTotalAckDataLength = theLength;
        mCommitIndexMap.erase(theIt);
        RBS_LOG_STREAM_DEBUG << mLogPrefix <<
            "acked length: " << mTotalAckDataLength <<
            " index: "       << *it <<
        RBS_LOG_EOM;
    }
    ReleaseBuffers();
}

    int
CommitTracker::AdjustBuffers(
    rbsLogIndex_t inCommitIndex)
{
    Indices theIndices;
    for (CommitIndexMap::const_iterator it = mCommitIndexMap.begin();
            it != mCommitIndexMap.end() && it->first <= inCommitIndex;
            ++it) {
        theIndices.push_back(it->first);
    }
    if (theIndices.empty()) {
        return 0;
    }
    UpdateFlushIndex(theIndices);
    return (int)theIndices.size();
}

    void
CommitTracker::ReleaseBuffers()
{
    while (! mSegmentEnds.empty() &&
            mSegmentEnds.front() <= mTotalAckDataLength) {
        mSegmentEnds.pop_front();
        if (! mBufferPool.ReleaseOldestSegment()) {
            RBS_LOG_STREAM_ERROR << mLogPrefix <<
                "buffer pool has no segment to release"
                " acked length: " << mTotalAckDataLength <<
            RBS_LOG_EOM;
            continue;
        }
        mReleasedSegmentCount++;
    }
}

    void
CommitTracker::Clear()
{
    mCommitIndexMap.clear();
    mSegmentEnds.clear();
}

} // namespace client
} // namespace RBS
