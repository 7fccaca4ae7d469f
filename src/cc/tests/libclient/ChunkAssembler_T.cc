#include <gtest/gtest.h>

#include "common/MdDigest.h"
#include "libclient/ChunkAssembler.h"
#include "libclient/ReplicaSession.h"
#include "tests/rbstest.h"

#include <set>
#include <string>
#include <vector>

using std::set;
using std::string;
using std::vector;
using RBS::BlockId;
using RBS::Checksum;
using RBS::MdDigest;
using RBS::rbsLogIndex_t;
using RBS::ReplicaId;
using namespace RBS::client;
using RBS::Test::RbsTestUtils;

namespace
{

// Records submitted chunk writes without completing them.
class RecordingSession : public ReplicaSession
{
public:
	vector<WriteChunkOp*> mWrites;

	RecordingSession()
		: ReplicaSession(),
		  mWrites()
		{}
	virtual ~RecordingSession()
	{
		for (size_t i = 0; i < mWrites.size(); i++) {
			delete mWrites[i];
		}
	}
	virtual void WriteChunk(WriteChunkOp& op, OpOwner&)
		{ mWrites.push_back(&op); }
	virtual void PutBlock(PutBlockOp& op, OpOwner&)
		{ delete &op; }
	virtual void WatchForCommit(WatchForCommitOp& op, OpOwner&)
		{ delete &op; }
	virtual void CancelAll(OpOwner&)
		{}
	virtual rbsLogIndex_t GetReplicatedMinCommitIndex() const
		{ return RBS::kRbsLogIndexNone; }
	virtual vector<ReplicaId> GetReplicas() const
		{ return vector<ReplicaId>(); }
};

class NullOwner : public OpOwner
{
public:
	virtual void OpDone(RbsOp*, bool)
		{}
};

}

TEST(ChunkAssemblerTest, NamesAndIndices) {
	ChunkAssembler assembler("volume/bucket/key", "0123abcd",
		Checksum(RBS::kChecksumTypeCrc32, 16));
	ASSERT_EQ(assembler.GetKeyHash(), MdDigest::Md5Hex("volume/bucket/key"));

	const string data = RbsTestUtils::MakeData(40);
	set<string>  names;
	for (int i = 1; i <= 5; i++) {
		ChunkInfo chunk;
		ASSERT_EQ(assembler.BuildChunk(data.data(), (int)data.size(), chunk),
			0);
		ASSERT_EQ(chunk.index, i);
		ASSERT_EQ(chunk.offset, 0);
		ASSERT_EQ(chunk.len, 40);
		ASSERT_EQ(chunk.checksum.checksums.size(), 3u);
		ASSERT_EQ(chunk.name, assembler.MakeChunkName(i));
		names.insert(chunk.name);
	}
	ASSERT_EQ(names.size(), 5u);
	ASSERT_EQ(assembler.MakeChunkName(1),
		assembler.GetKeyHash() + "_stream_0123abcd_chunk_1");
	ASSERT_EQ(assembler.MakeRequestId(CMD_PUT_BLOCK, "-x"),
		"0123abcdPutBlock5-x");
}

TEST(ChunkAssemblerTest, SameKeyDifferentStreams) {
	const Checksum checksum(RBS::kChecksumTypeNone);
	ChunkAssembler a("key", "stream-a", checksum);
	ChunkAssembler b("key", "stream-b", checksum);
	ChunkInfo ca;
	ChunkInfo cb;
	ASSERT_EQ(a.BuildChunk("x", 1, ca), 0);
	ASSERT_EQ(b.BuildChunk("x", 1, cb), 0);
	ASSERT_EQ(ca.index, cb.index);
	ASSERT_NE(ca.name, cb.name);
}

TEST(ChunkAssemblerTest, WriteChunkSubmits) {
	ChunkAssembler   assembler("key", "sid", Checksum(RBS::kChecksumTypeMd5, 8));
	RecordingSession session;
	NullOwner        owner;
	const BlockId    blockId(1, 2);
	const string     data = RbsTestUtils::MakeData(20);
	ChunkInfo        chunk;
	ASSERT_EQ(assembler.WriteChunk(session, owner, 7, blockId,
		data.data(), (int)data.size(), chunk), 0);
	ASSERT_EQ(session.mWrites.size(), 1u);
	const WriteChunkOp& op = *session.mWrites.front();
	ASSERT_EQ(op.op, CMD_WRITE_CHUNK);
	ASSERT_EQ(op.seq, 7);
	ASSERT_TRUE(op.blockId == blockId);
	ASSERT_EQ(op.data, data.data());
	ASSERT_EQ(op.chunk.name, chunk.name);
	ASSERT_EQ(op.requestId, "sidWriteChunk1" + chunk.name);
	ASSERT_EQ(Checksum::VerifyChecksum(op.data, (size_t)op.chunk.len,
		op.chunk.checksum), 0);

	// A checksum failure does not consume a chunk index or submit an op.
	ChunkAssembler bad("key", "sid", Checksum(RBS::kChecksumTypeCrc32, 0));
	ASSERT_NE(bad.WriteChunk(session, owner, 8, blockId,
		data.data(), (int)data.size(), chunk), 0);
	ASSERT_EQ(bad.GetChunkIndex(), 0);
	ASSERT_EQ(session.mWrites.size(), 1u);
}

TEST(BlockDataTest, ChunksOrderedByIndex) {
	BlockData data;
	const int order[] = { 2, 1, 4, 3 };
	for (int i = 0; i < 4; i++) {
		ChunkInfo chunk;
		chunk.index = order[i];
		chunk.len   = 10 * order[i];
		data.AddChunk(chunk);
	}
	ASSERT_EQ(data.chunks.size(), 4u);
	for (int i = 0; i < 4; i++) {
		ASSERT_EQ(data.chunks[i].index, i + 1);
	}
	ASSERT_EQ(data.GetSize(), 100);
}
