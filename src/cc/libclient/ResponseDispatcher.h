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
// \brief Single worker thread that applies asynchronous op completions to the
// block writer state in the order they were received.
//
//----------------------------------------------------------------------------

#ifndef LIBCLIENT_RESPONSE_DISPATCHER_H
#define LIBCLIENT_RESPONSE_DISPATCHER_H

#include "qcdio/QCMutex.h"
#include "qcdio/QCThread.h"

#include <stdint.h>
#include <deque>
#include <string>

namespace RBS
{
namespace client
{
using std::deque;
using std::string;

class ResponseDispatcher : public QCRunnable
{
public:
    class Request
    {
    public:
        // Invoked on the dispatcher thread.
        virtual void Run() = 0;
        // Invoked once after Run(), or instead of Run() if the request is
        // rejected because the dispatcher is stopped. The request must not be
        // accessed by the dispatcher after Done() returns.
        virtual void Done(
            bool inRanFlag) = 0;
    protected:
        Request()
            {}
        virtual ~Request()
            {}
    };

    class SyncRequest : public Request
    {
    public:
        SyncRequest()
            : Request(),
              mMutex(),
              mCond(),
              mWaitingFlag(false),
              mRanFlag(false)
            {}
        virtual ~SyncRequest()
            {}
        // Returns false if the dispatcher rejected the request.
        bool Execute(
            ResponseDispatcher& inDispatcher);
        virtual void Done(
            bool inRanFlag);
    private:
        QCMutex   mMutex;
        QCCondVar mCond;
        bool      mWaitingFlag;
        bool      mRanFlag;
    };

    ResponseDispatcher(
        const char* inNamePtr = "dispatcher");
    virtual ~ResponseDispatcher();
    void Start();
    // Runs all queued requests, then stops the thread. Requests enqueued
    // after the stop are rejected.
    void Stop();
    // Returns false and does not take the request if the dispatcher is
    // stopped.
    bool Enqueue(
        Request& inRequest);
    bool IsDispatcherThread() const
        { return mThread.IsCurrentThread(); }
    bool IsRunning() const;
    int64_t GetProcessedCount() const;
    virtual void Run();

private:
    typedef deque<Request*> Queue;

    QCThread        mThread;
    mutable QCMutex mMutex;
    QCCondVar       mWakeupCond;
    Queue           mQueue;
    bool            mStopFlag;
    int64_t         mProcessedCount;
    string          mName;

    ResponseDispatcher(const ResponseDispatcher&);
    ResponseDispatcher& operator=(const ResponseDispatcher&);
};

} // namespace client
} // namespace RBS

#endif // LIBCLIENT_RESPONSE_DISPATCHER_H
