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
// \brief Fixed capacity pool of chunk sized memory segments. Segments are
// kept in allocation order, the last allocated one is the current one.
//
//----------------------------------------------------------------------------

#ifndef LIBCLIENT_BUFFER_POOL_H
#define LIBCLIENT_BUFFER_POOL_H

#include "qcdio/QCMutex.h"

#include <stdint.h>
#include <deque>
#include <vector>

namespace RBS
{
namespace client
{
using std::deque;
using std::vector;

class BufferPool
{
public:
    class Segment
    {
    public:
        Segment()
            : mStartPtr(0),
              mCapacity(0),
              mSize(0),
              mSealedFlag(false)
            {}
        const char* GetPtr() const
            { return mStartPtr; }
        int GetSize() const
            { return mSize; }
        int GetCapacity() const
            { return mCapacity; }
        int GetRemaining() const
            { return (mSealedFlag ? 0 : mCapacity - mSize); }
        bool IsFull() const
            { return (mSize >= mCapacity); }
        bool IsSealed() const
            { return mSealedFlag; }
    private:
        char* mStartPtr;
        int   mCapacity;
        int   mSize;
        bool  mSealedFlag;

        void Reset()
        {
            mSize       = 0;
            mSealedFlag = false;
        }
    friend class BufferPool;
    };

    BufferPool();
    ~BufferPool();
    // Returns 0 on success, or negative errno.
    int Create(
        int inSegmentCount,
        int inSegmentSize);
    void Destroy();
    // Returns the current segment if it has room, otherwise the next free
    // one, null if all segments are in use.
    Segment* AllocateSegmentIfNeeded();
    // Copies at most the segment remaining room, returns the number of bytes
    // copied.
    int Append(
        Segment&    inSegment,
        const char* inDataPtr,
        int         inLength);
    // Marks a partially filled segment complete, later writes go into a new
    // segment.
    void Seal(
        Segment& inSegment);
    bool ReleaseOldestSegment();
    // Releases all segments, the released counter is not advanced.
    void Clear();
    const Segment* GetSegment(
        int inIndex) const;
    Segment* GetSegment(
        int inIndex);
    const Segment* GetCurrentSegment() const;
    int GetSegmentCount() const;
    int GetFreeCount() const;
    int64_t GetBufferedBytes() const;
    int64_t GetReleasedCount() const;
    int GetSegmentSize() const
        { return mSegmentSize; }
    int GetCapacity() const
        { return mTotalCnt; }
    int64_t GetCapacityBytes() const
        { return (int64_t)mTotalCnt * mSegmentSize; }

private:
    typedef unsigned int    SegmentIndex;
    typedef deque<Segment*> Segments;

    mutable QCMutex mMutex;
    void*           mAllocPtr;
    size_t          mAllocSize;
    char*           mStartPtr;
    SegmentIndex*   mFreeListPtr;
    vector<Segment> mSegmentsStorage;
    Segments        mSegments;
    int             mSegmentSize;
    int             mTotalCnt;
    int             mFreeCnt;
    int64_t         mBufferedBytes;
    int64_t         mReleasedCnt;

    Segment* GetFree();
    void PutFree(
        Segment& inSegment);

    // No copies.
    BufferPool(const BufferPool& inPool);
    BufferPool& operator=(const BufferPool& inPool);
};

} // namespace client
} // namespace RBS

#endif // LIBCLIENT_BUFFER_POOL_H
