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

#include "QCThread.h"
#include "QCUtils.h"

#include <limits.h>

const int kMinThreadStackSize =
#ifdef PTHREAD_STACK_MIN
    PTHREAD_STACK_MIN;
#else
    (1 << 10);
#endif

QCThread::QCThread(
    QCRunnable* inRunnablePtr /* = 0 */,
    const char* inNamePtr     /* = 0 */)
    : QCRunnable(),
      mStartedFlag(false),
      mThread(),
      mRunnablePtr(inRunnablePtr),
      mName(inNamePtr ? inNamePtr : "")
{
}

    /* virtual */
QCThread::~QCThread()
{
    QCThread::Join();
}

    int
QCThread::TryToStart(
    QCRunnable* inRunnablePtr /* = 0 */,
    int         inStackSize   /* = -1 */,
    const char* inNamePtr     /* = 0 */)
{
    if (mStartedFlag) {
        return EINVAL;
    }
    pthread_attr_t theStackSizeAttr;
    int theErr = pthread_attr_init(&theStackSizeAttr);
    if (theErr != 0) {
        return theErr;
    }
    if (inStackSize > 0 && (theErr = pthread_attr_setstacksize(
            &theStackSizeAttr, kMinThreadStackSize < inStackSize ?
                inStackSize : kMinThreadStackSize)) != 0) {
        pthread_attr_destroy(&theStackSizeAttr);
        return theErr;
    }
    if (inNamePtr) {
        mName = inNamePtr;
    }
    if (inRunnablePtr) {
        mRunnablePtr = inRunnablePtr;
    }
    if (! mRunnablePtr) {
        mRunnablePtr = this;
    }
    mStartedFlag = true;
    theErr = pthread_create(
        &mThread, &theStackSizeAttr, &QCThread::Runner, this);
    pthread_attr_destroy(&theStackSizeAttr);
    if (theErr != 0) {
        mStartedFlag = false;
    }
    return theErr;
}

    void
QCThread::Join()
{
    if (! mStartedFlag) {
        return;
    }
    const int theErr = pthread_join(mThread, 0);
    if (theErr) {
        FatalError("pthread_join", theErr);
    }
    mStartedFlag = false;
}

    void
QCThread::FatalError(
    const char* inErrMsgPtr,
    int         inSysError)
{
    QCUtils::FatalError(inErrMsgPtr, inSysError);
}

    /* static */ void*
QCThread::Runner(
    void* inArgPtr)
{
    reinterpret_cast<QCThread*>(inArgPtr)->mRunnablePtr->Run();
    return 0;
}

    /* static */ std::string
QCThread::GetErrorMsg(
    int inErrorCode)
{
    return QCUtils::SysError(inErrorCode);
}
