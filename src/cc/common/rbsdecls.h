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
// \brief Block and replica identifiers, error codes shared by the client and
// the replica emulator.
//
//----------------------------------------------------------------------------

#ifndef COMMON_RBSDECLS_H
#define COMMON_RBSDECLS_H

#include "rbstypes.h"

#include <errno.h>
#include <string>

namespace RBS
{
using std::string;

enum
{
    kErrorNone          = 0,
    kErrorClosed        = -EBADF,
    kErrorTransport     = -EIO,
    kErrorCommitTimeout = -ETIMEDOUT,
    kErrorChecksum      = -EBADMSG,
    kErrorParameters    = -EINVAL,
    kErrorNoSpace       = -ENOBUFS
};

string ErrorCodeToStr(int status);

struct BlockId
{
    BlockId(
        rbsContainerId_t c = -1,
        rbsLocalId_t     l = -1,
        rbsCommitSeq_t   s = 0)
        : containerId(c),
          localId(l),
          commitSeq(s)
        {}
    bool IsValid() const
        { return (containerId >= 0 && localId >= 0); }
    // Same block, commit sequence is ignored.
    bool IsSameBlock(const BlockId& other) const
    {
        return (containerId == other.containerId &&
            localId == other.localId);
    }
    bool operator==(const BlockId& other) const
    {
        return (IsSameBlock(other) && commitSeq == other.commitSeq);
    }
    bool operator!=(const BlockId& other) const
        { return (! (*this == other)); }
    template<typename T>
    T& Display(T& os) const
    {
        os << "conID: " << containerId <<
            " locID: "       << localId <<
            " bcsId: "       << commitSeq;
        return os;
    }
    string ToString() const;

    rbsContainerId_t containerId;
    rbsLocalId_t     localId;
    rbsCommitSeq_t   commitSeq;
};

template<typename T>
inline static T&
operator<<(T& os, const BlockId& id)
    { return id.Display(os); }

struct ReplicaId
{
    ReplicaId()
        : hostname(),
          port(-1)
        {}
    ReplicaId(const string& h, int p)
        : hostname(h),
          port(p)
        {}
    bool operator == (const ReplicaId& other) const
        { return (hostname == other.hostname && port == other.port); }
    bool operator != (const ReplicaId& other) const
        { return (! (*this == other)); }
    bool operator < (const ReplicaId& other) const
    {
        const int res = hostname.compare(other.hostname);
        return (res < 0 || (res == 0 && port < other.port));
    }
    bool IsValid() const
        { return (! hostname.empty() && port > 0); }
    string ToString() const;
    template<typename T>
    T& Display(T& os) const
    {
        os << hostname;
        os << ' ';
        os << port;
        return os;
    }

    string hostname;
    int    port;
};

template<typename T>
inline static T&
operator<<(T& os, const ReplicaId& id)
    { return id.Display(os); }

}

#endif // COMMON_RBSDECLS_H
