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

#include "rbsdecls.h"

#include <sstream>
#include <string.h>

namespace RBS
{
using std::ostringstream;

string
ErrorCodeToStr(int status)
{
    switch (status) {
        case kErrorNone:          return "";
        case kErrorClosed:        return "stream closed";
        case kErrorTransport:     return "transport failure";
        case kErrorCommitTimeout: return "commit watch timed out";
        case kErrorChecksum:      return "checksum or response validation failure";
        case kErrorParameters:    return "invalid parameters";
        case kErrorNoSpace:       return "buffer pool exhausted";
        default:                  break;
    }
    const int theErr = status < 0 ? -status : status;
    const char* const theMsgPtr = strerror(theErr);
    ostringstream theStream;
    theStream << "error " << status;
    if (theMsgPtr && *theMsgPtr) {
        theStream << " " << theMsgPtr;
    }
    return theStream.str();
}

string
BlockId::ToString() const
{
    ostringstream os;
    Display(os);
    return os.str();
}

string
ReplicaId::ToString() const
{
    ostringstream os;
    Display(os);
    return os.str();
}

}
