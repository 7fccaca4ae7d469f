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
// \brief Block metadata and the asynchronous replica set operations issued
// by the block writer.
//
//----------------------------------------------------------------------------

#ifndef LIBCLIENT_BLOCK_OPS_H
#define LIBCLIENT_BLOCK_OPS_H

#include "common/rbstypes.h"
#include "common/rbsdecls.h"
#include "rbsio/checksum.h"

#include <string>
#include <vector>
#include <map>
#include <ostream>

namespace RBS
{
namespace client
{
using std::string;
using std::vector;
using std::map;
using std::ostream;

enum RbsOp_t
{
    CMD_WRITE_CHUNK,
    CMD_PUT_BLOCK,
    CMD_WATCH_FOR_COMMIT,
    CMD_NCMDS
};

const char* OpTypeToName(RbsOp_t op);

struct ChunkInfo
{
    ChunkInfo()
        : name(),
          index(0),
          offset(0),
          len(0),
          checksum()
        {}
    ostream& Show(ostream& os) const;

    string       name;
    int64_t      index;
    rbsOff_t     offset;
    int64_t      len;
    ChecksumData checksum;
};

struct BlockData
{
    typedef map<string, string> Metadata;
    typedef vector<ChunkInfo>   Chunks;

    BlockData()
        : blockId(),
          metadata(),
          chunks()
        {}
    // Inserts keeping the list ordered by chunk index.
    void AddChunk(const ChunkInfo& chunk);
    int64_t GetSize() const;
    ostream& Show(ostream& os) const;

    BlockId  blockId;
    Metadata metadata;
    Chunks   chunks;
};

struct RbsOp
{
    class Display
    {
    public:
        Display(const RbsOp& op)
            : mOp(op)
            {}
        ostream& Show(ostream& os) const
            { return mOp.ShowSelf(os); }
    private:
        const RbsOp& mOp;
    };

    RbsOp_t       op;
    rbsSeq_t      seq;
    int           status;
    string        statusMsg; // optional, mostly for debugging
    string        requestId;
    // Replica assigned log position, set on success.
    rbsLogIndex_t logIndex;

    RbsOp(RbsOp_t o, rbsSeq_t s)
        : op(o),
          seq(s),
          status(0),
          statusMsg(),
          requestId(),
          logIndex(kRbsLogIndexNone)
        {}
    virtual ~RbsOp()
        {}
    Display Show() const
        { return Display(*this); }
    virtual ostream& ShowSelf(ostream& os) const = 0;
private:
    RbsOp(const RbsOp&);
    RbsOp& operator=(const RbsOp&);
};

inline static ostream& operator<<(ostream& os, const RbsOp::Display& disp)
{ return disp.Show(os); }

struct WriteChunkOp : public RbsOp
{
    BlockId     blockId;
    ChunkInfo   chunk;
    // Points into a buffer pool segment, valid until the op completes.
    const char* data;

    WriteChunkOp(rbsSeq_t s, const BlockId& b)
        : RbsOp(CMD_WRITE_CHUNK, s),
          blockId(b),
          chunk(),
          data(0)
        {}
    virtual ostream& ShowSelf(ostream& os) const;
};

struct PutBlockOp : public RbsOp
{
    BlockData blockData;
    // Stream bytes covered by this put-block.
    rbsOff_t  flushPos;
    // Response: the block id with the replica set's commit sequence.
    BlockId   committedBlockId;

    PutBlockOp(rbsSeq_t s, const BlockData& d, rbsOff_t pos)
        : RbsOp(CMD_PUT_BLOCK, s),
          blockData(d),
          flushPos(pos),
          committedBlockId()
        {}
    virtual ostream& ShowSelf(ostream& os) const;
};

struct WatchForCommitOp : public RbsOp
{
    rbsLogIndex_t     watchIndex;
    int64_t           timeoutMs;
    // Response: highest index known committed, and the replicas that did not
    // commit watchIndex.
    rbsLogIndex_t     commitIndex;
    vector<ReplicaId> laggingReplicas;

    WatchForCommitOp(rbsSeq_t s, rbsLogIndex_t idx, int64_t timeout)
        : RbsOp(CMD_WATCH_FOR_COMMIT, s),
          watchIndex(idx),
          timeoutMs(timeout),
          commitIndex(kRbsLogIndexNone),
          laggingReplicas()
        {}
    virtual ostream& ShowSelf(ostream& os) const;
};

} // namespace client
} // namespace RBS

#endif // LIBCLIENT_BLOCK_OPS_H
