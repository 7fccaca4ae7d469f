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

#include "QCUtils.h"

#include <stdlib.h>
#include <stdio.h>
#include <unistd.h>
#include <string.h>
#include <errno.h>

static inline void
StrAppend(
    const char* inStrPtr,
    char*&      ioPtr,
    size_t&     ioMaxLen)
{
    size_t theLen = inStrPtr ? strlen(inStrPtr) : 0;
    if (theLen > ioMaxLen) {
        theLen = ioMaxLen;
    }
    if (ioPtr != inStrPtr) {
        memmove(ioPtr, inStrPtr, theLen);
    }
    ioPtr    += theLen;
    ioMaxLen -= theLen;
    *ioPtr = 0;
}

static int
DoSysErrorMsg(
    const char* inMsgPtr,
    int         inSysError,
    char*       inMsgBufPtr,
    size_t      inMsgBufSize)
{
    if (inMsgBufSize <= 0) {
        return 0;
    }
    char*  theMsgPtr = inMsgBufPtr;
    size_t theMaxLen = inMsgBufSize - 1;

    theMsgPtr[theMaxLen] = 0;
    StrAppend(inMsgPtr, theMsgPtr, theMaxLen);
    if (theMaxLen > 2) {
        if (theMsgPtr != inMsgBufPtr) {
            StrAppend(" ", theMsgPtr, theMaxLen);
        }
#if ! defined(_GNU_SOURCE) && (defined(_XOPEN_SOURCE) && _XOPEN_SOURCE < 600 || \
        defined(_POSIX_C_SOURCE) && _POSIX_C_SOURCE < 200112L)
        int theErr = strerror_r(inSysError, theMsgPtr, theMaxLen);
        if (theErr != 0) {
            theMsgPtr[0] = 0;
        }
        const char* const thePtr = theMsgPtr;
#else
        const char* const thePtr = strerror_r(inSysError, theMsgPtr, theMaxLen);
#endif
        StrAppend(thePtr, theMsgPtr, theMaxLen);
        if (theMaxLen > 0) {
            char theNum[32];
            snprintf(theNum, sizeof(theNum), " %d", inSysError);
            StrAppend(theNum, theMsgPtr, theMaxLen);
        }
    }
    return (int)(theMsgPtr - inMsgBufPtr);
}

/* static */ void
QCUtils::FatalError(
    const char* inMsgPtr,
    int         inSysError)
{
    char      theMsgBuf[1<<9];
    const int theLen =
        DoSysErrorMsg(inMsgPtr, inSysError, theMsgBuf, sizeof(theMsgBuf) - 1);
    theMsgBuf[theLen] = '\n';
    if (write(2, theMsgBuf, theLen + 1) < 0) {
        // Nothing else can be done here.
    }
    abort();
}

/* static */ std::string
QCUtils::SysError(
    int         inSysError,
    const char* inMsgPtr /* = 0 */)
{
    char theMsgBuf[1<<9];
    DoSysErrorMsg(inMsgPtr, inSysError, theMsgBuf, sizeof(theMsgBuf));
    return std::string(theMsgBuf);
}

/* static */ void
QCUtils::AssertionFailure(
    const char* inMsgPtr,
    const char* inFileNamePtr,
    int         inLineNum)
{
    char   theMsgBuf[1<<10];
    char*  theMsgPtr = theMsgBuf;
    size_t theMaxLen = sizeof(theMsgBuf) - 1;

    StrAppend("assertion failure: ", theMsgPtr, theMaxLen);
    StrAppend(inMsgPtr ? inMsgPtr : "", theMsgPtr, theMaxLen);
    StrAppend(" ", theMsgPtr, theMaxLen);
    StrAppend(inFileNamePtr ? inFileNamePtr : "???", theMsgPtr, theMaxLen);
    if (theMaxLen > 4) {
        char theLine[32];
        snprintf(theLine, sizeof(theLine), ":%d\n", inLineNum);
        StrAppend(theLine, theMsgPtr, theMaxLen);
    }
    if (write(2, theMsgBuf, theMsgPtr - theMsgBuf) < 0) {
        // Nothing else can be done here.
    }
    abort();
}
