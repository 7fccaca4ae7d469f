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
// \brief Common integer types.
//
//----------------------------------------------------------------------------

#ifndef COMMON_RBSTYPES_H
#define COMMON_RBSTYPES_H

#include <stdint.h>
#include <stddef.h>

namespace RBS
{

typedef int64_t  rbsSeq_t;
typedef int64_t  rbsOff_t;
typedef int64_t  rbsLogIndex_t;
typedef int64_t  rbsContainerId_t;
typedef int64_t  rbsLocalId_t;
typedef int64_t  rbsCommitSeq_t;
typedef uint32_t rbsChecksum_t;

const rbsLogIndex_t kRbsLogIndexNone = -1;

}

#endif // COMMON_RBSTYPES_H
