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
// \brief Reads stdin and writes it into one block of an emulated replica
// set.
//
//----------------------------------------------------------------------------

#include "libclient/BlockWriter.h"
#include "libclient/BlockOps.h"
#include "libclient/BufferPool.h"
#include "emulator/ReplicaSetEmulator.h"
#include "common/MsgLogger.h"
#include "common/Properties.h"

#include <iostream>
#include <unistd.h>
#include <string.h>
#include <stdlib.h>

using std::cout;
using std::cerr;
using std::cin;
using std::string;
using std::vector;

using namespace RBS;
using namespace RBS::client;

struct StatsPrinter
{
    void operator()(const char* inNamePtr, int64_t inValue) const
        { cout << inNamePtr << ": " << inValue << "\n"; }
};

static int64_t doPut(BlockWriter& writer);

int
main(int argc, char **argv)
{
    int         optchar;
    string      key;
    int         replicas       = 3;
    bool        help           = false;
    bool        verboseLogging = false;
    const char* config         = 0;

    while ((optchar = getopt(argc, argv, "hk:c:r:v")) != -1) {
        switch (optchar) {
            case 'k':
                key = optarg;
                break;
            case 'c':
                config = optarg;
                break;
            case 'r':
                replicas = atoi(optarg);
                break;
            case 'h':
                help = true;
                break;
            case 'v':
                verboseLogging = true;
                break;
            default:
                cout << "Unrecognized flag : " << optchar << "\n";
                help = true;
                break;
        }
    }

    if (help || key.empty() || replicas <= 0) {
        cout << "Usage: " << argv[0] <<
            " -k <key> [-c <config>] [-r <replicas>] [-v]\n"
            "Reads from stdin and writes to one block of an emulated"
            " replica set.\n";
        return 1;
    }

    Properties props;
    if (config && props.loadProperties(config, '=') != 0) {
        cerr << "failed to load " << config << "\n";
        return 1;
    }
    MsgLogger::Init(props, "rbs.log.");
    if (verboseLogging) {
        MsgLogger::SetLevel(MsgLogger::kLogLevelDEBUG);
    }

    BlockWriter::Parameters params;
    if (params.SetParameters(props) != 0) {
        return 1;
    }
    string errMsg;
    if (params.Validate(&errMsg) != 0) {
        cerr << "invalid parameters: " << errMsg << "\n";
        return 1;
    }
    BufferPool pool;
    int status = pool.Create(
        (int)(params.mMaxBufferedBytes / params.mChunkSize),
        params.mChunkSize);
    if (status != 0) {
        cerr << "buffer pool: " << ErrorCodeToStr(status) << "\n";
        return 1;
    }
    const string      pipelineId("pipeline-0");
    ReplicaSetEmulator replicaSet(replicas, pipelineId);
    int64_t            numBytes;
    {
        BlockWriter writer(replicaSet, pool, params);
        status = writer.Open(
            BlockId(props.getValue("rbs.put.containerId", int64_t(1)),
                props.getValue("rbs.put.localId", int64_t(1))),
            key,
            pipelineId
        );
        if (status != 0) {
            cerr << "open: " << ErrorCodeToStr(status) << "\n";
            return 1;
        }
        numBytes = doPut(writer);
        if (numBytes >= 0) {
            status = writer.Close();
            if (status != 0) {
                cerr << "close: " << ErrorCodeToStr(status) << " " <<
                    writer.GetErrorMessage() << "\n";
                numBytes = status;
            }
        } else if ((status = writer.Close()) != 0) {
            cerr << "close after write failure: " <<
                ErrorCodeToStr(status) << "\n";
        }
        BlockData data;
        writer.GetBlockData(data);
        cout <<
            "block: "   << writer.GetBlockId() << "\n"
            "written: " << writer.GetWrittenDataLength() << "\n"
            "acked: "   << writer.GetTotalAckDataLength() << "\n"
            "chunks: "  << data.chunks.size() << "\n";
        const vector<ReplicaId> failed = writer.GetFailedReplicas();
        for (vector<ReplicaId>::const_iterator it = failed.begin();
                it != failed.end();
                ++it) {
            cout << "failed replica: " << *it << "\n";
        }
        BlockWriter::Stats stats;
        writer.GetStats(stats);
        StatsPrinter printer;
        stats.Enumerate(printer);
    }
    replicaSet.Stop();
    MsgLogger::Stop();
    return (numBytes < 0 ? 1 : 0);
}

int64_t
doPut(BlockWriter& writer)
{
    static char dataBuf[4 << 20];
    int64_t     bytesWritten = 0;

    for (; ;) {
        cin.read(dataBuf, sizeof(dataBuf));
        const int cnt = (int)cin.gcount();
        if (cnt <= 0) {
            break;
        }
        const int res = writer.Write(dataBuf, cnt);
        if (res != cnt) {
            cerr << "Write failed...expect to write: " << cnt <<
                " status: " << ErrorCodeToStr(res) << "\n";
            return (res < 0 ? res : -1);
        }
        bytesWritten += res;
    }
    return bytesWritten;
}
