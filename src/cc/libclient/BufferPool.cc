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

#include "BufferPool.h"

#include "qcdio/QCUtils.h"
#include "qcdio/qcdebug.h"
#include "qcdio/qcstutils.h"

#include <sys/mman.h>
#include <errno.h>
#include <string.h>
#include <unistd.h>

namespace RBS
{
namespace client
{

BufferPool::BufferPool()
    : mMutex(),
      mAllocPtr(0),
      mAllocSize(0),
      mStartPtr(0),
      mFreeListPtr(0),
      mSegmentsStorage(),
      mSegments(),
      mSegmentSize(0),
      mTotalCnt(0),
      mFreeCnt(0),
      mBufferedBytes(0),
      mReleasedCnt(0)
{
}

BufferPool::~BufferPool()
{
    BufferPool::Destroy();
}

    int
BufferPool::Create(
    int inSegmentCount,
    int inSegmentSize)
{
    QCStMutexLocker theLock(mMutex);
    Destroy();
    if (inSegmentCount <= 0 || inSegmentSize <= 0) {
        return -EINVAL;
    }
    size_t const kPageSize = sysconf(_SC_PAGESIZE);
    mAllocSize = size_t(inSegmentCount) * inSegmentSize;
    mAllocSize = (mAllocSize + kPageSize - 1) / kPageSize * kPageSize;
    mAllocPtr = mmap(0, mAllocSize,
        PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANON, -1, 0);
    if (mAllocPtr == MAP_FAILED) {
        const int theRet = errno;
        mAllocPtr  = 0;
        mAllocSize = 0;
        return (theRet == 0 ? -ENOMEM : -theRet);
    }
    mStartPtr    = static_cast<char*>(mAllocPtr);
    mSegmentSize = inSegmentSize;
    mTotalCnt    = inSegmentCount;
    mSegmentsStorage.resize(inSegmentCount);
    for (int i = 0; i < inSegmentCount; i++) {
        Segment& theSeg = mSegmentsStorage[i];
        theSeg.mStartPtr = mStartPtr + size_t(i) * inSegmentSize;
        theSeg.mCapacity = inSegmentSize;
        theSeg.Reset();
    }
    // Index 0 is the list head, buffer indices are 1 based.
    mFreeListPtr  = new SegmentIndex[inSegmentCount + 1];
    mFreeCnt      = 0;
    *mFreeListPtr = 0;
    while (mFreeCnt < mTotalCnt) {
        mFreeListPtr[mFreeCnt] = mFreeCnt + 1;
        mFreeCnt++;
    }
    mFreeListPtr[mFreeCnt] = 0;
    return 0;
}

    void
BufferPool::Destroy()
{
    QCStMutexLocker theLock(mMutex);
    delete [] mFreeListPtr;
    mFreeListPtr = 0;
    if (mAllocPtr && munmap(mAllocPtr, mAllocSize) != 0) {
        QCUtils::FatalError("munmap", errno);
    }
    mAllocPtr      = 0;
    mAllocSize     = 0;
    mStartPtr      = 0;
    mSegments.clear();
    mSegmentsStorage.clear();
    mSegmentSize   = 0;
    mTotalCnt      = 0;
    mFreeCnt       = 0;
    mBufferedBytes = 0;
}

    BufferPool::Segment*
BufferPool::GetFree()
{
    if (mFreeCnt <= 0) {
        QCASSERT(! mFreeListPtr || (*mFreeListPtr == 0 && mFreeCnt == 0));
        return 0;
    }
    const SegmentIndex theIdx = *mFreeListPtr;
    QCRTASSERT(theIdx > 0 && theIdx <= SegmentIndex(mTotalCnt));
    mFreeCnt--;
    *mFreeListPtr = mFreeListPtr[theIdx];
    Segment& theSeg = mSegmentsStorage[theIdx - 1];
    theSeg.Reset();
    return &theSeg;
}

    void
BufferPool::PutFree(
    BufferPool::Segment& inSegment)
{
    const size_t theOffset = inSegment.mStartPtr - mStartPtr;
    const size_t theIdx    = theOffset / mSegmentSize + 1;
    QCRTASSERT(mTotalCnt > mFreeCnt && theIdx <= size_t(mTotalCnt) &&
        theOffset % mSegmentSize == 0);
    mBufferedBytes -= inSegment.mSize;
    inSegment.Reset();
    mFreeListPtr[theIdx] = *mFreeListPtr;
    *mFreeListPtr = SegmentIndex(theIdx);
    mFreeCnt++;
}

    BufferPool::Segment*
BufferPool::AllocateSegmentIfNeeded()
{
    QCStMutexLocker theLock(mMutex);
    if (! mSegments.empty()) {
        Segment& theCur = *mSegments.back();
        if (! theCur.mSealedFlag && theCur.mSize < theCur.mCapacity) {
            return &theCur;
        }
    }
    Segment* const theSegPtr = GetFree();
    if (theSegPtr) {
        mSegments.push_back(theSegPtr);
    }
    return theSegPtr;
}

    int
BufferPool::Append(
    BufferPool::Segment& inSegment,
    const char*          inDataPtr,
    int                  inLength)
{
    QCStMutexLocker theLock(mMutex);
    const int theLen = inLength < inSegment.GetRemaining() ?
        inLength : inSegment.GetRemaining();
    if (theLen <= 0) {
        return 0;
    }
    memcpy(inSegment.mStartPtr + inSegment.mSize, inDataPtr, theLen);
    inSegment.mSize += theLen;
    mBufferedBytes  += theLen;
    return theLen;
}

    void
BufferPool::Seal(
    BufferPool::Segment& inSegment)
{
    QCStMutexLocker theLock(mMutex);
    inSegment.mSealedFlag = true;
}

    bool
BufferPool::ReleaseOldestSegment()
{
    QCStMutexLocker theLock(mMutex);
    if (mSegments.empty()) {
        return false;
    }
    Segment& theSeg = *mSegments.front();
    mSegments.pop_front();
    PutFree(theSeg);
    mReleasedCnt++;
    return true;
}

    void
BufferPool::Clear()
{
    QCStMutexLocker theLock(mMutex);
    while (! mSegments.empty()) {
        Segment& theSeg = *mSegments.front();
        mSegments.pop_front();
        PutFree(theSeg);
    }
    QCASSERT(mBufferedBytes == 0);
}

    const BufferPool::Segment*
BufferPool::GetSegment(
    int inIndex) const
{
    QCStMutexLocker theLock(mMutex);
    return ((inIndex < 0 || (int)mSegments.size() <= inIndex) ?
        0 : mSegments[inIndex]);
}

    BufferPool::Segment*
BufferPool::GetSegment(
    int inIndex)
{
    QCStMutexLocker theLock(mMutex);
    return ((inIndex < 0 || (int)mSegments.size() <= inIndex) ?
        0 : mSegments[inIndex]);
}

    const BufferPool::Segment*
BufferPool::GetCurrentSegment() const
{
    QCStMutexLocker theLock(mMutex);
    return (mSegments.empty() ? 0 : mSegments.back());
}

    int
BufferPool::GetSegmentCount() const
{
    QCStMutexLocker theLock(mMutex);
    return (int)mSegments.size();
}

    int
BufferPool::GetFreeCount() const
{
    QCStMutexLocker theLock(mMutex);
    return mFreeCnt;
}

    int64_t
BufferPool::GetBufferedBytes() const
{
    QCStMutexLocker theLock(mMutex);
    return mBufferedBytes;
}

    int64_t
BufferPool::GetReleasedCount() const
{
    QCStMutexLocker theLock(mMutex);
    return mReleasedCnt;
}

} // namespace client
} // namespace RBS
