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
// Thread safe log writer. Each message is formatted into a stream owned by
// the writer while the writer lock is held, then written to the file
// descriptor in one write call.
//
//----------------------------------------------------------------------------

#ifndef BUFFEREDLOGWRITER_H
#define BUFFEREDLOGWRITER_H

#include <inttypes.h>
#include <stdarg.h>
#include <iostream>

namespace RBS
{
using std::ostream;
class Properties;

class BufferedLogWriter
{
public:
    enum LogLevel
    {
        kLogLevelEMERG  = 0,
        kLogLevelFATAL  = 0,
        kLogLevelALERT  = 100,
        kLogLevelCRIT   = 200,
        kLogLevelERROR  = 300,
        kLogLevelWARN   = 400,
        kLogLevelNOTICE = 500,
        kLogLevelINFO   = 600,
        kLogLevelDEBUG  = 700,
        kLogLevelNOTSET = 800
    };
    struct Counters
    {
        int64_t mAppendCount;
        int64_t mWriteErrorCount;
        int64_t mWriteByteCount;
    };
    BufferedLogWriter(
        int         inFd                 = -1,
        const char* inFileNamePtr        = 0,
        LogLevel    inLogLevel           = kLogLevelDEBUG,
        const char* inTimeStampFormatPtr = 0,      // see strftime
        bool        inUseGMTFlag         = false); // GMT vs local
    ~BufferedLogWriter();
    // Recognized keys: logLevel, logFile, timeStampFormat, useGMT.
    void SetParameters(
        const Properties& inProps,
        const char*       inPropsPrefixPtr = 0);
    int Open(
        const char* inFileNamePtr);
    void Close();
    void Stop()
        { Close(); }
    void Flush();
    void SetLogLevel(
        LogLevel inLogLevel)
        { mLogLevel = inLogLevel; }
    bool SetLogLevel(
        const char* inLogLevelNamePtr);
    LogLevel GetLogLevel() const
        { return mLogLevel; }
    static const char* GetLogLevelNamePtr(
        LogLevel inLogLevel);
    bool IsLogLevelEnabled(
        LogLevel inLogLevel) const
        { return (mLogLevel >= inLogLevel); }
    void Append(
        LogLevel    inLogLevel,
        const char* inFmtStrPtr,
        ...)
    {
        if (mLogLevel < inLogLevel) {
            return;
        }
        va_list theArgs;
        va_start(theArgs, inFmtStrPtr);
        Append(inLogLevel, inFmtStrPtr, theArgs);
        va_end(theArgs);
    }
    void Append(
        LogLevel    inLogLevel,
        const char* inFmtStrPtr,
        va_list     inArgs);
    void GetCounters(
        Counters& outCounters);
    // GetStream() acquires the writer lock, PutStream() writes the message
    // and releases it. Use StStream to keep the two paired.
    ostream& GetStream(LogLevel inLogLevel);
    void PutStream(ostream& inStream);

    class StStream
    {
    public:
        StStream(
            BufferedLogWriter& inLogWriter,
            LogLevel           inLogLevel)
            : mLogWriter(inLogWriter),
              mStream(inLogWriter.GetStream(inLogLevel))
            {}
        ~StStream()
            { mLogWriter.PutStream(mStream); }
        operator ostream& ()
            { return mStream; }
        ostream& GetStream()
            { return mStream; }
    private:
        BufferedLogWriter& mLogWriter;
        ostream&           mStream;
    private:
        StStream(
            const StStream&);
        StStream& operator=(
            const StStream&);
    };
private:
    class Impl;
    volatile LogLevel mLogLevel;
    Impl&             mImpl;

private:
    BufferedLogWriter(
        const BufferedLogWriter& inWriter);
    BufferedLogWriter& operator=(
        const BufferedLogWriter& inWriter);
};
}

#endif /* BUFFEREDLOGWRITER_H */
