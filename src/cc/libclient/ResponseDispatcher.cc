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

#include "ResponseDispatcher.h"

#include "common/MsgLogger.h"
#include "qcdio/QCUtils.h"
#include "qcdio/qcstutils.h"

namespace RBS
{
namespace client
{

    bool
ResponseDispatcher::SyncRequest::Execute(
    ResponseDispatcher& inDispatcher)
{
    QCRTASSERT(! inDispatcher.IsDispatcherThread());
    {
        QCStMutexLocker theLock(mMutex);
        QCRTASSERT(! mWaitingFlag);
        mWaitingFlag = true;
        mRanFlag     = false;
    }
    inDispatcher.Enqueue(*this);
    QCStMutexLocker theLock(mMutex);
    while (mWaitingFlag && mCond.Wait(mMutex))
        {}
    return mRanFlag;
}

    void
ResponseDispatcher::SyncRequest::Done(
    bool inRanFlag)
{
    QCStMutexLocker theLock(mMutex);
    mRanFlag     = inRanFlag;
    mWaitingFlag = false;
    mCond.Notify();
}

ResponseDispatcher::ResponseDispatcher(
    const char* inNamePtr)
    : QCRunnable(),
      mThread(0, inNamePtr),
      mMutex(),
      mWakeupCond(),
      mQueue(),
      mStopFlag(true),
      mProcessedCount(0),
      mName(inNamePtr ? inNamePtr : "dispatcher")
{
}

ResponseDispatcher::~ResponseDispatcher()
{
    ResponseDispatcher::Stop();
}

    void
ResponseDispatcher::Start()
{
    QCStMutexLocker theLock(mMutex);
    if (mThread.IsStarted()) {
        return;
    }
    mStopFlag = false;
    const int kStackSize = 64 << 10;
    mThread.Start(this, kStackSize, mName.c_str());
}

    void
ResponseDispatcher::Stop()
{
    QCRTASSERT(! IsDispatcherThread());
    {
        QCStMutexLocker theLock(mMutex);
        if (! mThread.IsStarted()) {
            mStopFlag = true;
            return;
        }
        mStopFlag = true;
        mWakeupCond.Notify();
    }
    mThread.Join();
    QCStMutexLocker theLock(mMutex);
    QCRTASSERT(mQueue.empty());
}

    bool
ResponseDispatcher::IsRunning() const
{
    QCStMutexLocker theLock(mMutex);
    return (! mStopFlag && mThread.IsStarted());
}

    int64_t
ResponseDispatcher::GetProcessedCount() const
{
    QCStMutexLocker theLock(mMutex);
    return mProcessedCount;
}

    bool
ResponseDispatcher::Enqueue(
    ResponseDispatcher::Request& inRequest)
{
    {
        QCStMutexLocker theLock(mMutex);
        if (! mStopFlag) {
            const bool theWakeupFlag = mQueue.empty();
            mQueue.push_back(&inRequest);
            if (theWakeupFlag) {
                mWakeupCond.Notify();
            }
            return true;
        }
    }
    RBS_LOG_STREAM_DEBUG << mName <<
        ": stopped, request rejected" <<
    RBS_LOG_EOM;
    inRequest.Done(false);
    return false;
}

    void
ResponseDispatcher::Run()
{
    QCStMutexLocker theLock(mMutex);
    for (; ;) {
        while (mQueue.empty() && ! mStopFlag) {
            mWakeupCond.Wait(mMutex);
        }
        if (mQueue.empty()) {
            break;
        }
        Request& theReq = *mQueue.front();
        mQueue.pop_front();
        {
            QCStMutexUnlocker theUnlock(mMutex);
            theReq.Run();
            theReq.Done(true);
        }
        mProcessedCount++;
    }
}

} // namespace client
} // namespace RBS
