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

#include "BlockOps.h"

#include <algorithm>

namespace RBS
{
namespace client
{

static const char* const kOpTypeNames[CMD_NCMDS] = {
    "WriteChunk",
    "PutBlock",
    "WatchForCommit"
};

const char*
OpTypeToName(RbsOp_t op)
{
    return ((op < CMD_WRITE_CHUNK || CMD_NCMDS <= op) ?
        "Invalid" : kOpTypeNames[op]);
}

static inline bool
ChunkIndexLess(const ChunkInfo& lhs, const ChunkInfo& rhs)
{
    return (lhs.index < rhs.index);
}

    void
BlockData::AddChunk(const ChunkInfo& chunk)
{
    if (chunks.empty() || chunks.back().index < chunk.index) {
        chunks.push_back(chunk);
        return;
    }
    chunks.insert(std::upper_bound(chunks.begin(), chunks.end(), chunk,
        &ChunkIndexLess), chunk);
}

    int64_t
BlockData::GetSize() const
{
    int64_t ret = 0;
    for (Chunks::const_iterator it = chunks.begin();
            it != chunks.end();
            ++it) {
        ret += it->len;
    }
    return ret;
}

    ostream&
ChunkInfo::Show(ostream& os) const
{
    return (os <<
        "chunk: "   << name <<
        " index: "  << index <<
        " offset: " << offset <<
        " len: "    << len <<
        " sum: "    << checksum
    );
}

    ostream&
BlockData::Show(ostream& os) const
{
    os << blockId << " chunks: " << chunks.size() << " size: " << GetSize();
    for (Metadata::const_iterator it = metadata.begin();
            it != metadata.end();
            ++it) {
        os << " " << it->first << "=" << it->second;
    }
    return os;
}

    ostream&
WriteChunkOp::ShowSelf(ostream& os) const
{
    os <<
        "write-chunk:"
        " seq: "   << seq <<
        " req: "   << requestId <<
        " "        << blockId <<
        " ";
    return chunk.Show(os);
}

    ostream&
PutBlockOp::ShowSelf(ostream& os) const
{
    os <<
        "put-block:"
        " seq: "      << seq <<
        " req: "      << requestId <<
        " flushPos: " << flushPos <<
        " ";
    return blockData.Show(os);
}

    ostream&
WatchForCommitOp::ShowSelf(ostream& os) const
{
    return (os <<
        "watch-for-commit:"
        " seq: "     << seq <<
        " index: "   << watchIndex <<
        " timeout: " << timeoutMs <<
        " commit: "  << commitIndex <<
        " lagging: " << laggingReplicas.size()
    );
}

} // namespace client
} // namespace RBS
