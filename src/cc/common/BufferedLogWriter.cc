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

#include "BufferedLogWriter.h"
#include "Properties.h"

#include "qcdio/QCMutex.h"
#include "qcdio/QCUtils.h"
#include "qcdio/qcstutils.h"
#include "qcdio/qcdebug.h"

#include <fcntl.h>
#include <unistd.h>
#include <stdio.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <time.h>
#include <errno.h>
#include <string.h>

#include <string>
#include <sstream>

namespace RBS
{

using std::string;
using std::ostringstream;
using std::ostream;

const char* const kBufferedLogWriter_LogLevels[] = {
    "FATAL",
    "ALERT",
    "CRIT",
    "ERROR",
    "WARN",
    "NOTICE",
    "INFO",
    "DEBUG",
    "NOTSET"
};

const int kLogWriterDefaulOpenFlags = O_CREAT | O_APPEND | O_WRONLY;

class BufferedLogWriter::Impl
{
public:
    Impl(
        int         inFd,
        const char* inFileNamePtr,
        const char* inTimeStampFormatPtr,
        bool        inUseGMTFlag)
        : mMutex(),
          mFileName(inFileNamePtr ? inFileNamePtr : ""),
          mTimeStampFormat(inTimeStampFormatPtr ?
            inTimeStampFormatPtr : "%m-%d-%Y %H:%M:%S"),
          mFd(inFd >= 0 ? dup(inFd) : -1),
          mUseGMTFlag(inUseGMTFlag),
          mStream(),
          mAppendCount(0),
          mWriteErrorCount(0),
          mWriteByteCount(0)
    {
        if (mFd < 0 && ! mFileName.empty()) {
            OpenSelf(mFileName.c_str());
        }
    }
    ~Impl()
        { Impl::Close(); }
    static const char* GetLogLevelNamePtr(
        LogLevel inLogLevel)
    {
        const int theLogLevel = inLogLevel / 100;
        return (
            (theLogLevel < 0 || theLogLevel >=
                int(sizeof(kBufferedLogWriter_LogLevels) /
                    sizeof(kBufferedLogWriter_LogLevels[0]))) ?
            "INVALID" :  kBufferedLogWriter_LogLevels[theLogLevel]
        );
    }
    void SetParameters(
        const string&     inPropsPrefix,
        const Properties& inProps)
    {
        QCStMutexLocker theLocker(mMutex);
        mTimeStampFormat = inProps.getValue(
            inPropsPrefix + "timeStampFormat", mTimeStampFormat);
        mUseGMTFlag      = inProps.getValue(
            inPropsPrefix + "useGMT", mUseGMTFlag ? 1 : 0) != 0;
        const string theFileName = inProps.getValue(
            inPropsPrefix + "logFile", mFileName);
        if (theFileName != mFileName && ! theFileName.empty()) {
            OpenSelf(theFileName.c_str());
        }
    }
    int Open(
        const char* inFileNamePtr)
    {
        QCStMutexLocker theLocker(mMutex);
        return OpenSelf(inFileNamePtr);
    }
    void Close()
    {
        QCStMutexLocker theLocker(mMutex);
        if (mFd >= 0) {
            ::close(mFd);
            mFd = -1;
        }
    }
    void Flush()
    {
        QCStMutexLocker theLocker(mMutex);
        if (mFd >= 0) {
            ::fsync(mFd);
        }
    }
    ostream& GetStream(
        LogLevel inLogLevel)
    {
        mMutex.Lock();
        mStream.str(string());
        mStream.clear();
        WritePrefix(inLogLevel);
        return mStream;
    }
    void PutStream(
        ostream& inStream)
    {
        QCASSERT(&inStream == &mStream && mMutex.IsOwned());
        mStream << '\n';
        const string theMsg = mStream.str();
        WriteSelf(theMsg.data(), theMsg.size());
        mMutex.Unlock();
    }
    void Append(
        LogLevel    inLogLevel,
        const char* inFmtStrPtr,
        va_list     inArgs)
    {
        char theBuf[4 << 10];
        const int theLen = ::vsnprintf(theBuf, sizeof(theBuf),
            inFmtStrPtr ? inFmtStrPtr : "", inArgs);
        if (theLen < 0) {
            return;
        }
        ostream& theStream = GetStream(inLogLevel);
        theStream.write(theBuf,
            theLen < (int)sizeof(theBuf) ? theLen : (int)sizeof(theBuf) - 1);
        PutStream(theStream);
    }
    void GetCounters(
        Counters& outCounters)
    {
        QCStMutexLocker theLocker(mMutex);
        outCounters.mAppendCount     = mAppendCount;
        outCounters.mWriteErrorCount = mWriteErrorCount;
        outCounters.mWriteByteCount  = mWriteByteCount;
    }
private:
    QCMutex       mMutex;
    string        mFileName;
    string        mTimeStampFormat;
    int           mFd;
    bool          mUseGMTFlag;
    ostringstream mStream;
    int64_t       mAppendCount;
    int64_t       mWriteErrorCount;
    int64_t       mWriteByteCount;

    int OpenSelf(
        const char* inFileNamePtr)
    {
        if (! inFileNamePtr || ! *inFileNamePtr) {
            return -EINVAL;
        }
        const int theFd = ::open(
            inFileNamePtr, kLogWriterDefaulOpenFlags, 0644);
        if (theFd < 0) {
            const int theErr = errno;
            mWriteErrorCount++;
            return (theErr > 0 ? -theErr : -EIO);
        }
        if (mFd >= 0) {
            ::close(mFd);
        }
        mFd       = theFd;
        mFileName = inFileNamePtr;
        return 0;
    }
    void WritePrefix(
        LogLevel inLogLevel)
    {
        struct timeval theTime;
        ::gettimeofday(&theTime, 0);
        const time_t theSec = theTime.tv_sec;
        struct tm    theTm;
        if (mUseGMTFlag) {
            ::gmtime_r(&theSec, &theTm);
        } else {
            ::localtime_r(&theSec, &theTm);
        }
        char         theBuf[128];
        const size_t theLen = ::strftime(
            theBuf, sizeof(theBuf), mTimeStampFormat.c_str(), &theTm);
        mStream.write(theBuf, theLen < sizeof(theBuf) ? theLen : 0);
        ::snprintf(theBuf, sizeof(theBuf), ".%03ld %s - ",
            (long)(theTime.tv_usec / 1000), GetLogLevelNamePtr(inLogLevel));
        mStream << theBuf;
    }
    void WriteSelf(
        const char* inPtr,
        size_t      inLen)
    {
        mAppendCount++;
        const int theFd = mFd >= 0 ? mFd : 2;
        const char* thePtr = inPtr;
        size_t      theRem = inLen;
        while (theRem > 0) {
            const ssize_t theNWr = ::write(theFd, thePtr, theRem);
            if (theNWr < 0) {
                if (errno == EINTR) {
                    continue;
                }
                mWriteErrorCount++;
                break;
            }
            thePtr += theNWr;
            theRem -= theNWr;
            mWriteByteCount += theNWr;
        }
    }
private:
    Impl(
        const Impl&);
    Impl& operator=(
        const Impl&);
};

BufferedLogWriter::BufferedLogWriter(
    int         inFd,
    const char* inFileNamePtr,
    LogLevel    inLogLevel,
    const char* inTimeStampFormatPtr,
    bool        inUseGMTFlag)
    : mLogLevel(inLogLevel),
      mImpl(*(new Impl(inFd, inFileNamePtr, inTimeStampFormatPtr,
        inUseGMTFlag)))
{
}

BufferedLogWriter::~BufferedLogWriter()
{
    delete &mImpl;
}

void
BufferedLogWriter::SetParameters(
    const Properties& inProps,
    const char*       inPropsPrefixPtr /* = 0 */)
{
    const string thePropsPrefix = inPropsPrefixPtr ? inPropsPrefixPtr : "";
    mImpl.SetParameters(thePropsPrefix, inProps);
    SetLogLevel(inProps.getValue(thePropsPrefix + "logLevel",
        Impl::GetLogLevelNamePtr(mLogLevel)
    ));
}

int
BufferedLogWriter::Open(
    const char* inFileNamePtr)
{
    return mImpl.Open(inFileNamePtr);
}

void
BufferedLogWriter::Close()
{
    mImpl.Close();
}

void
BufferedLogWriter::Flush()
{
    mImpl.Flush();
}

bool
BufferedLogWriter::SetLogLevel(
    const char* inLogLevelNamePtr)
{
    if (! inLogLevelNamePtr || ! *inLogLevelNamePtr) {
        return false;
    }
    struct { const char* mNamePtr; LogLevel mLevel; } const kLogLevels[] = {
        { "EMERG",  kLogLevelEMERG  },
        { "FATAL",  kLogLevelFATAL  },
        { "ALERT",  kLogLevelALERT  },
        { "CRIT",   kLogLevelCRIT   },
        { "ERROR",  kLogLevelERROR  },
        { "WARN",   kLogLevelWARN   },
        { "NOTICE", kLogLevelNOTICE },
        { "INFO",   kLogLevelINFO   },
        { "DEBUG",  kLogLevelDEBUG  },
        { "NOTSET", kLogLevelNOTSET }
    };
    const size_t kNumLogLevels = sizeof(kLogLevels) / sizeof(kLogLevels[0]);
    for (size_t i = 0; i < kNumLogLevels; i++) {
        if (::strcmp(kLogLevels[i].mNamePtr, inLogLevelNamePtr) == 0) {
            mLogLevel = kLogLevels[i].mLevel;
            return true;
        }
    }
    return false;
}

/* static */ const char*
BufferedLogWriter::GetLogLevelNamePtr(
    BufferedLogWriter::LogLevel inLogLevel)
{
    return Impl::GetLogLevelNamePtr(inLogLevel);
}

void
BufferedLogWriter::Append(
    BufferedLogWriter::LogLevel inLogLevel,
    const char*                 inFmtStrPtr,
    va_list                     inArgs)
{
    if (mLogLevel < inLogLevel) {
        return;
    }
    mImpl.Append(inLogLevel, inFmtStrPtr, inArgs);
}

void
BufferedLogWriter::GetCounters(
    BufferedLogWriter::Counters& outCounters)
{
    mImpl.GetCounters(outCounters);
}

ostream&
BufferedLogWriter::GetStream(
    BufferedLogWriter::LogLevel inLogLevel)
{
    return mImpl.GetStream(inLogLevel);
}

void
BufferedLogWriter::PutStream(
    ostream& inStream)
{
    mImpl.PutStream(inStream);
}

}
