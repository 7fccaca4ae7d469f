// Block writer tests against the in process replica set emulator.

#include <gtest/gtest.h>

#include "common/Properties.h"
#include "emulator/ReplicaSetEmulator.h"
#include "libclient/BlockOps.h"
#include "libclient/BlockWriter.h"
#include "libclient/BufferPool.h"
#include "tests/rbstest.h"

#include <map>
#include <set>
#include <string>
#include <vector>

using std::map;
using std::set;
using std::string;
using std::vector;
using RBS::BlockId;
using RBS::Properties;
using RBS::ReplicaId;
using namespace RBS::client;
using RBS::Test::RbsTestUtils;

namespace
{

const int kMiB = 1 << 20;

struct HeldCount
{
	HeldCount(const ReplicaSetEmulator& emulator, size_t count)
		: mEmulator(emulator),
		  mCount(count)
		{}
	bool operator()() const
		{ return (mEmulator.GetHeldPutBlockCount() >= mCount); }
	const ReplicaSetEmulator& mEmulator;
	size_t                    mCount;
};

struct StatsCollector
{
	map<string, BlockWriter::Stats::Counter> mCounters;

	void operator()(const char* name, BlockWriter::Stats::Counter value)
		{ mCounters[name] = value; }
};

}

class BlockWriterTest : public ::testing::Test
{
protected:
	static const string kPipeline;
	static const string kKey;

	BufferPool          mPool;
	ReplicaSetEmulator* mEmulator;
	BlockWriter*        mWriter;
	BlockId             mBlockId;

	BlockWriterTest()
		: mPool(),
		  mEmulator(0),
		  mWriter(0),
		  mBlockId(7, 100)
		{}
	virtual void TearDown()
	{
		delete mWriter;
		mWriter = 0;
		delete mEmulator;
		mEmulator = 0;
		mPool.Destroy();
	}
	BlockWriter::Parameters MakeParameters(
		int     chunkSize,
		int64_t flushSize,
		int64_t maxSize,
		int64_t watchTimeoutMs = 5000)
	{
		return BlockWriter::Parameters(chunkSize, flushSize, maxSize,
			watchTimeoutMs, RBS::kChecksumTypeCrc32, 256);
	}
	// Creates a pool sized for the parameters, the emulator, and opens a
	// writer.
	void Init(
		const BlockWriter::Parameters& params,
		int                            replicaCount = 3)
	{
		ASSERT_EQ(mPool.Create(
			(int)(params.mMaxBufferedBytes / params.mChunkSize),
			params.mChunkSize), 0);
		mEmulator = new ReplicaSetEmulator(replicaCount, kPipeline);
		mWriter   = new BlockWriter(*mEmulator, mPool, params, "test ");
		ASSERT_EQ(mWriter->Open(mBlockId, kKey, kPipeline), 0);
		ASSERT_TRUE(mWriter->IsOpen());
	}
	void CheckInvariants() const
	{
		ASSERT_LE(mWriter->GetTotalAckDataLength(),
			mWriter->GetTotalDataFlushedLength());
		ASSERT_LE(mWriter->GetTotalDataFlushedLength(),
			mWriter->GetWrittenDataLength());
	}
	// Concatenation of the chunk data in the replica's latest block data.
	string ReplicaContent(ReplicaSetEmulator& emulator, int replicaIdx)
	{
		BlockData data;
		if (! emulator.GetReplicaBlockData(replicaIdx, data)) {
			return string();
		}
		string ret;
		for (size_t i = 0; i < data.chunks.size(); i++) {
			string chunk;
			EXPECT_TRUE(emulator.GetReplicaChunk(
				replicaIdx, data.chunks[i].name, chunk));
			ret += chunk;
		}
		return ret;
	}
};

const string BlockWriterTest::kPipeline = "pipeline-test";
const string BlockWriterTest::kKey      = "vol/bucket/key";

TEST_F(BlockWriterTest, ChunkAndPutBlockIssue) {
	Init(MakeParameters(kMiB, 4 * kMiB, 16 * kMiB));
	const string data = RbsTestUtils::MakeData(4 * kMiB);

	ASSERT_EQ(mWriter->Write(data.data(), kMiB), kMiB);
	ASSERT_EQ(mEmulator->GetWriteChunkCount(), 1);
	ASSERT_EQ(mEmulator->GetPutBlockCount(), 0);
	ASSERT_EQ(mWriter->GetTotalDataFlushedLength(), 0);
	CheckInvariants();

	ASSERT_EQ(mWriter->Write(data.data() + kMiB, 3 * kMiB), 3 * kMiB);
	ASSERT_EQ(mEmulator->GetWriteChunkCount(), 4);
	ASSERT_EQ(mEmulator->GetPutBlockCount(), 1);
	ASSERT_EQ(mWriter->GetTotalDataFlushedLength(), 4 * kMiB);
	CheckInvariants();

	// Nothing new to commit, flush only waits for the issued put-block.
	ASSERT_EQ(mWriter->Flush(), 0);
	ASSERT_EQ(mEmulator->GetPutBlockCount(), 1);

	BlockData replicaData;
	ASSERT_TRUE(mEmulator->GetReplicaBlockData(0, replicaData));
	ASSERT_EQ(replicaData.chunks.size(), 4u);
	ASSERT_EQ(replicaData.GetSize(), 4 * kMiB);
	ASSERT_EQ(replicaData.metadata["TYPE"], "KEY");
	set<string> names;
	for (size_t i = 0; i < replicaData.chunks.size(); i++) {
		const ChunkInfo& chunk = replicaData.chunks[i];
		ASSERT_EQ(chunk.index, (int64_t)i + 1);
		ASSERT_EQ(chunk.offset, 0);
		ASSERT_EQ(chunk.len, kMiB);
		ASSERT_EQ(chunk.checksum.checksums.size(), size_t(kMiB / 256));
		names.insert(chunk.name);
	}
	ASSERT_EQ(names.size(), 4u);
	ASSERT_EQ(ReplicaContent(*mEmulator, 2), data);

	// The replica set commit sequence replaces the local one.
	const BlockId blockId = mWriter->GetBlockId();
	ASSERT_TRUE(blockId.IsSameBlock(mBlockId));
	ASSERT_EQ(blockId.commitSeq, replicaData.blockId.commitSeq);
	ASSERT_GT(blockId.commitSeq, 0);

	ASSERT_EQ(mWriter->Close(), 0);
	ASSERT_EQ(mWriter->GetTotalAckDataLength(), 4 * kMiB);
	ASSERT_EQ(mPool.GetReleasedCount(), 4);
	ASSERT_EQ(mPool.GetSegmentCount(), 0);
	ASSERT_EQ(mEmulator->GetReleaseCount(), 1);
	ASSERT_EQ(mEmulator->GetInvalidateCount(), 0);
}

TEST_F(BlockWriterTest, FullBufferWaitsForCommit) {
	Init(MakeParameters(kMiB, 4 * kMiB, 16 * kMiB));
	const string data = RbsTestUtils::MakeData(17 * kMiB, 3);

	ASSERT_EQ(mWriter->Write(data.data(), 16 * kMiB), 16 * kMiB);
	CheckInvariants();
	ASSERT_EQ(mWriter->GetTotalAckDataLength(), 16 * kMiB);
	ASSERT_EQ(mPool.GetReleasedCount(), 16);
	ASSERT_EQ(mWriter->GetPendingCommitCount(), 0u);
	ASSERT_GE(mEmulator->GetWatchCount(), 1);

	ASSERT_EQ(mWriter->Write(data.data() + 16 * kMiB, kMiB), kMiB);
	ASSERT_EQ(mWriter->Close(), 0);
	ASSERT_EQ(mWriter->GetTotalAckDataLength(), 17 * kMiB);
	ASSERT_EQ(mPool.GetReleasedCount(), 17);
	ASSERT_EQ(mEmulator->GetPutBlockCount(), 5);
	ASSERT_EQ(ReplicaContent(*mEmulator, 1), data);

	BlockWriter::Stats stats;
	mWriter->GetStats(stats);
	ASSERT_GE(stats.mFullBufferCount, 1);
	ASSERT_EQ(stats.mChunkWriteCount, 17);
	ASSERT_EQ(stats.mChunkWriteByteCount, 17 * kMiB);
	ASSERT_EQ(stats.mSegmentReleaseCount, 17);
	StatsCollector collector;
	stats.Enumerate(collector);
	ASSERT_EQ(collector.mCounters.size(), 11u);
	ASSERT_EQ(collector.mCounters["PutBlocks"], 5);
}

TEST_F(BlockWriterTest, TrailingPartialChunkOnClose) {
	Init(MakeParameters(1024, 2048, 8192));
	const string data = RbsTestUtils::MakeData(4608, 5);
	ASSERT_EQ(mWriter->Write(data.data(), (int)data.size()),
		(int)data.size());
	ASSERT_EQ(mWriter->GetTotalDataFlushedLength(), 4096);
	ASSERT_EQ(mWriter->Close(), 0);
	ASSERT_TRUE(mWriter->IsClosed());
	ASSERT_FALSE(mWriter->IsOpen());
	ASSERT_EQ(mWriter->GetWrittenDataLength(), 4608);
	ASSERT_EQ(mWriter->GetTotalDataFlushedLength(), 4608);
	ASSERT_EQ(mWriter->GetTotalAckDataLength(), 4608);
	ASSERT_EQ(mPool.GetReleasedCount(), 5);

	BlockData writerData;
	mWriter->GetBlockData(writerData);
	ASSERT_EQ(writerData.chunks.size(), 5u);
	ASSERT_EQ(writerData.chunks.back().len, 512);
	ASSERT_EQ(ReplicaContent(*mEmulator, 0), data);
}

TEST_F(BlockWriterTest, ExplicitFlushCommitsPartialChunk) {
	Init(MakeParameters(1024, 4096, 8192));
	const string data = RbsTestUtils::MakeData(3000, 9);
	ASSERT_EQ(mWriter->Write(data.data(), 1500), 1500);
	ASSERT_EQ(mWriter->Flush(), 0);
	ASSERT_EQ(mWriter->GetTotalDataFlushedLength(), 1500);
	ASSERT_EQ(mEmulator->GetPutBlockCount(), 1);
	ASSERT_EQ(mEmulator->GetWriteChunkCount(), 2);
	// Later writes go into a new chunk.
	ASSERT_EQ(mWriter->Write(data.data() + 1500, 1500), 1500);
	ASSERT_EQ(mWriter->Close(), 0);
	ASSERT_EQ(mEmulator->GetWriteChunkCount(), 4);
	ASSERT_EQ(mWriter->GetTotalAckDataLength(), 3000);
	ASSERT_EQ(ReplicaContent(*mEmulator, 2), data);
}

TEST_F(BlockWriterTest, LaggingReplicaReported) {
	Init(MakeParameters(kMiB, 4 * kMiB, 16 * kMiB));
	mEmulator->SetReplicaLagging(2, true);
	const string data = RbsTestUtils::MakeData(4 * kMiB, 11);
	ASSERT_EQ(mWriter->Write(data.data(), (int)data.size()),
		(int)data.size());
	ASSERT_EQ(mWriter->Close(), 0);
	ASSERT_EQ(mWriter->GetTotalAckDataLength(), 4 * kMiB);
	const vector<ReplicaId> failed = mWriter->GetFailedReplicas();
	ASSERT_EQ(failed.size(), 1u);
	ASSERT_TRUE(failed.front() == mEmulator->GetReplicas()[2]);
	BlockData replicaData;
	ASSERT_FALSE(mEmulator->GetReplicaBlockData(2, replicaData));
	ASSERT_EQ(ReplicaContent(*mEmulator, 0), data);
}

TEST_F(BlockWriterTest, ChunkWriteFailureIsSticky) {
	Init(MakeParameters(1024, 2048, 8192));
	mEmulator->SetFailChunkWrite(3);
	const string data = RbsTestUtils::MakeData(4096, 13);

	ASSERT_EQ(mWriter->Write(data.data(), 2048), 2048);
	ASSERT_EQ(mWriter->Flush(), 0);

	const int status = mWriter->Write(data.data() + 2048, 2048);
	ASSERT_TRUE(status == 2048 || status == RBS::kErrorTransport);
	ASSERT_EQ(mWriter->Flush(), RBS::kErrorTransport);
	ASSERT_EQ(mWriter->GetErrorCode(), RBS::kErrorTransport);
	ASSERT_FALSE(mWriter->GetErrorMessage().empty());

	const int64_t chunkWrites = mEmulator->GetWriteChunkCount();
	const int64_t putBlocks   = mEmulator->GetPutBlockCount();
	ASSERT_EQ(mWriter->Write(data.data(), 1024), RBS::kErrorTransport);
	ASSERT_EQ(mEmulator->GetWriteChunkCount(), chunkWrites);
	ASSERT_EQ(mEmulator->GetPutBlockCount(), putBlocks);

	// Only the first put-block was confirmed before the failure.
	ASSERT_EQ(mWriter->GetTotalAckDataLength(), 2048);
	CheckInvariants();

	ASSERT_EQ(mWriter->Close(), RBS::kErrorTransport);
	ASSERT_EQ(mWriter->Close(), RBS::kErrorTransport);
	ASSERT_EQ(mEmulator->GetReleaseCount(), 1);

	BlockWriter::Stats stats;
	mWriter->GetStats(stats);
	ASSERT_EQ(stats.mChunkWriteErrorCount, 1);
}

TEST_F(BlockWriterTest, ChecksumMismatchRejected) {
	Init(MakeParameters(1024, 2048, 8192));
	mEmulator->SetCorruptChunkData(true);
	const string data = RbsTestUtils::MakeData(2048, 17);
	const int status = mWriter->Write(data.data(), (int)data.size());
	ASSERT_TRUE(status == 2048 || status == RBS::kErrorChecksum);
	ASSERT_EQ(mWriter->Flush(), RBS::kErrorChecksum);
	ASSERT_EQ(mWriter->Close(), RBS::kErrorChecksum);
}

TEST_F(BlockWriterTest, FirstErrorWins) {
	Init(MakeParameters(1024, 2048, 8192));
	mEmulator->SetCorruptChunkData(true);
	mEmulator->SetFailPutBlocks(true);
	const string data = RbsTestUtils::MakeData(2048, 29);
	const int status = mWriter->Write(data.data(), (int)data.size());
	ASSERT_TRUE(status == 2048 || status == RBS::kErrorChecksum);
	// Both chunk writes and the put-block fail, the chunk failure comes
	// first.
	ASSERT_EQ(mWriter->Flush(), RBS::kErrorChecksum);
	ASSERT_EQ(mEmulator->GetPutBlockCount(), 1);
	ASSERT_EQ(mWriter->GetErrorCode(), RBS::kErrorChecksum);

	mEmulator->SetCorruptChunkData(false);
	ASSERT_EQ(mWriter->Write(data.data(), 10), RBS::kErrorChecksum);
	ASSERT_EQ(mWriter->Flush(), RBS::kErrorChecksum);
	ASSERT_EQ(mWriter->GetErrorCode(), RBS::kErrorChecksum);
	ASSERT_EQ(mWriter->Close(), RBS::kErrorChecksum);
	ASSERT_EQ(mWriter->Close(), RBS::kErrorChecksum);
}

TEST_F(BlockWriterTest, PutBlockFailure) {
	Init(MakeParameters(1024, 2048, 8192));
	mEmulator->SetFailPutBlocks(true);
	const string data = RbsTestUtils::MakeData(2048, 19);
	const int status = mWriter->Write(data.data(), (int)data.size());
	ASSERT_TRUE(status == 2048 || status == RBS::kErrorTransport);
	ASSERT_EQ(mWriter->Flush(), RBS::kErrorTransport);
	ASSERT_EQ(mWriter->GetTotalAckDataLength(), 0);
	ASSERT_EQ(mWriter->GetPendingCommitCount(), 0u);
}

TEST_F(BlockWriterTest, PutBlockResponseForDifferentBlock) {
	Init(MakeParameters(1024, 2048, 8192));
	mEmulator->SetMismatchBlockId(true);
	const string data = RbsTestUtils::MakeData(2048, 23);
	const int status = mWriter->Write(data.data(), (int)data.size());
	ASSERT_TRUE(status == 2048 || status == RBS::kErrorChecksum);
	ASSERT_EQ(mWriter->Flush(), RBS::kErrorChecksum);
	ASSERT_TRUE(mWriter->GetBlockId().IsSameBlock(mBlockId));
	ASSERT_EQ(mWriter->GetBlockId().commitSeq, 0);
}

TEST_F(BlockWriterTest, WatchTimeoutWithoutQuorum) {
	Init(MakeParameters(1024, 2048, 8192, 100));
	mEmulator->SetReplicaLagging(1, true);
	mEmulator->SetReplicaLagging(2, true);
	const string data = RbsTestUtils::MakeData(2048, 29);
	ASSERT_EQ(mWriter->Write(data.data(), (int)data.size()),
		(int)data.size());
	ASSERT_EQ(mWriter->Flush(), 0);
	ASSERT_EQ(mWriter->Close(), RBS::kErrorCommitTimeout);
	ASSERT_EQ(mWriter->GetTotalAckDataLength(), 0);
	ASSERT_EQ(mPool.GetSegmentCount(), 2);
	BlockWriter::Stats stats;
	mWriter->GetStats(stats);
	ASSERT_EQ(stats.mWatchErrorCount, 1);
}

TEST_F(BlockWriterTest, OutOfOrderPutBlockCompletions) {
	Init(MakeParameters(1024, 2048, 8192));
	mEmulator->SetHoldPutBlocks(true);
	const string data = RbsTestUtils::MakeData(6144, 31);
	ASSERT_EQ(mWriter->Write(data.data(), (int)data.size()),
		(int)data.size());
	ASSERT_TRUE(RbsTestUtils::WaitFor(HeldCount(*mEmulator, 3)));
	ASSERT_EQ(mWriter->GetPendingCommitCount(), 0u);
	mEmulator->SetHoldPutBlocks(false);
	mEmulator->ReleaseHeldPutBlocks(true);
	ASSERT_EQ(mWriter->Flush(), 0);
	ASSERT_EQ(mWriter->GetPendingCommitCount(), 3u);
	ASSERT_EQ(mWriter->Close(), 0);
	ASSERT_EQ(mWriter->GetTotalAckDataLength(), 6144);
	ASSERT_EQ(mPool.GetReleasedCount(), 6);
}

TEST_F(BlockWriterTest, CloseIsIdempotent) {
	Init(MakeParameters(1024, 2048, 8192));
	const string data = RbsTestUtils::MakeData(3000, 37);
	ASSERT_EQ(mWriter->Write(data.data(), (int)data.size()),
		(int)data.size());
	ASSERT_EQ(mWriter->Close(), 0);
	const int64_t chunkWrites = mEmulator->GetWriteChunkCount();
	const int64_t putBlocks   = mEmulator->GetPutBlockCount();
	const int64_t watches     = mEmulator->GetWatchCount();

	ASSERT_EQ(mWriter->Close(), 0);
	ASSERT_EQ(mEmulator->GetWriteChunkCount(), chunkWrites);
	ASSERT_EQ(mEmulator->GetPutBlockCount(), putBlocks);
	ASSERT_EQ(mEmulator->GetWatchCount(), watches);
	ASSERT_EQ(mEmulator->GetReleaseCount(), 1);

	ASSERT_EQ(mWriter->Write(data.data(), 10), RBS::kErrorClosed);
	ASSERT_EQ(mWriter->Flush(), RBS::kErrorClosed);
	ASSERT_EQ(mWriter->GetTotalAckDataLength(), 3000);
}

TEST_F(BlockWriterTest, CleanupInvalidatesSession) {
	Init(MakeParameters(1024, 2048, 8192));
	mEmulator->SetHoldPutBlocks(true);
	const string data = RbsTestUtils::MakeData(2048, 41);
	ASSERT_EQ(mWriter->Write(data.data(), (int)data.size()),
		(int)data.size());
	ASSERT_TRUE(RbsTestUtils::WaitFor(HeldCount(*mEmulator, 1)));
	mWriter->Cleanup(true);
	ASSERT_FALSE(mWriter->IsOpen());
	ASSERT_EQ(mEmulator->GetHeldPutBlockCount(), 0u);
	ASSERT_EQ(mEmulator->GetReleaseCount(), 1);
	ASSERT_EQ(mEmulator->GetInvalidateCount(), 1);
	ASSERT_EQ(mWriter->Write(data.data(), 10), RBS::kErrorClosed);
	BlockWriter::Stats stats;
	mWriter->GetStats(stats);
	ASSERT_GE(stats.mCanceledCount, 1);
	// The pool keeps the unacknowledged data.
	ASSERT_EQ(mPool.GetBufferedBytes(), 2048);
}

TEST_F(BlockWriterTest, RetryOnNewPipeline) {
	const BlockWriter::Parameters params = MakeParameters(1024, 2048, 8192, 100);
	Init(params);
	// No replica commits, the first writer fails with unacknowledged data.
	for (int i = 0; i < 3; i++) {
		mEmulator->SetReplicaLagging(i, true);
	}
	const string data = RbsTestUtils::MakeData(3000, 43);
	ASSERT_EQ(mWriter->Write(data.data(), (int)data.size()),
		(int)data.size());
	ASSERT_EQ(mWriter->Close(), RBS::kErrorCommitTimeout);
	ASSERT_EQ(mPool.GetBufferedBytes(), 3000);
	ASSERT_EQ(mPool.GetSegmentCount(), 3);

	ReplicaSetEmulator emulator(3, "pipeline-retry");
	BlockWriter        writer(emulator, mPool, params);
	ASSERT_EQ(writer.Open(mBlockId, kKey, "pipeline-retry"), 0);
	ASSERT_NE(writer.GetStreamId(), mWriter->GetStreamId());
	ASSERT_EQ(writer.WriteOnRetry(3000), 0);
	ASSERT_EQ(writer.GetWrittenDataLength(), 3000);
	ASSERT_EQ(writer.Close(), 0);
	ASSERT_EQ(writer.GetTotalAckDataLength(), 3000);
	ASSERT_EQ(mPool.GetSegmentCount(), 0);
	ASSERT_EQ(emulator.GetWriteChunkCount(), 3);
	ASSERT_EQ(ReplicaContent(emulator, 0), data);

	BlockWriter::Stats stats;
	writer.GetStats(stats);
	ASSERT_EQ(stats.mRetryWriteByteCount, 3000);
}

TEST_F(BlockWriterTest, RetryEndingInsideSentChunkFails) {
	const BlockWriter::Parameters params = MakeParameters(1024, 2048, 8192, 100);
	Init(params);
	for (int i = 0; i < 3; i++) {
		mEmulator->SetReplicaLagging(i, true);
	}
	const string data = RbsTestUtils::MakeData(3000, 47);
	ASSERT_EQ(mWriter->Write(data.data(), (int)data.size()),
		(int)data.size());
	ASSERT_EQ(mWriter->Close(), RBS::kErrorCommitTimeout);

	ReplicaSetEmulator emulator(3, "pipeline-retry");
	BlockWriter        writer(emulator, mPool, params);
	ASSERT_EQ(writer.Open(mBlockId, kKey, "pipeline-retry"), 0);
	// 1500 bytes end inside the second chunk.
	ASSERT_EQ(writer.WriteOnRetry(1500), RBS::kErrorParameters);
	ASSERT_EQ(writer.GetWrittenDataLength(), 0);
	ASSERT_EQ(emulator.GetWriteChunkCount(), 0);
	ASSERT_EQ(mPool.GetBufferedBytes(), 3000);

	ASSERT_EQ(writer.WriteOnRetry(2048), 0);
	ASSERT_EQ(writer.GetWrittenDataLength(), 2048);
	ASSERT_EQ(writer.Close(), 0);
	ASSERT_EQ(writer.GetTotalAckDataLength(), 2048);
	BlockData replicaData;
	ASSERT_TRUE(emulator.GetReplicaBlockData(0, replicaData));
	ASSERT_EQ(replicaData.GetSize(), 2048);
	ASSERT_EQ(ReplicaContent(emulator, 0), data.substr(0, 2048));
}

TEST_F(BlockWriterTest, CloseFailsWhenWatchLeavesPutBlocksUncommitted) {
	Init(MakeParameters(1024, 2048, 8192));
	mEmulator->SetShortWatchCommit(true);
	const string data = RbsTestUtils::MakeData(4096, 53);
	ASSERT_EQ(mWriter->Write(data.data(), (int)data.size()),
		(int)data.size());
	ASSERT_EQ(mWriter->Flush(), 0);
	ASSERT_EQ(mWriter->GetPendingCommitCount(), 2u);
	// The watch reports the first put-block committed, not the second.
	ASSERT_EQ(mWriter->Close(), RBS::kErrorCommitTimeout);
	ASSERT_EQ(mWriter->GetErrorCode(), RBS::kErrorCommitTimeout);
	ASSERT_EQ(mWriter->GetTotalAckDataLength(), 2048);
	ASSERT_EQ(mPool.GetBufferedBytes(), 2048);
}

TEST_F(BlockWriterTest, RetryBeyondBufferedDataFails) {
	Init(MakeParameters(1024, 2048, 8192));
	ASSERT_EQ(mWriter->WriteOnRetry(100), RBS::kErrorParameters);
}

TEST_F(BlockWriterTest, OpenValidation) {
	ASSERT_EQ(mPool.Create(8, 1024), 0);
	mEmulator = new ReplicaSetEmulator(3, kPipeline);

	BlockWriter notOpened(*mEmulator, mPool, MakeParameters(1024, 2048, 8192));
	ASSERT_EQ(notOpened.Write("a", 1), RBS::kErrorClosed);
	ASSERT_EQ(notOpened.Close(), 0);

	BlockWriter badParams(*mEmulator, mPool, MakeParameters(1024, 3000, 9000));
	ASSERT_EQ(badParams.Open(mBlockId, kKey, kPipeline),
		RBS::kErrorParameters);

	BlockWriter badPool(*mEmulator, mPool, MakeParameters(512, 2048, 8192));
	ASSERT_EQ(badPool.Open(mBlockId, kKey, kPipeline), RBS::kErrorParameters);

	BlockWriter tooLarge(*mEmulator, mPool, MakeParameters(1024, 2048, 16384));
	ASSERT_EQ(tooLarge.Open(mBlockId, kKey, kPipeline),
		RBS::kErrorParameters);

	BlockWriter badBlock(*mEmulator, mPool, MakeParameters(1024, 2048, 8192));
	ASSERT_EQ(badBlock.Open(BlockId(), kKey, kPipeline),
		RBS::kErrorParameters);

	BlockWriter badPipeline(*mEmulator, mPool,
		MakeParameters(1024, 2048, 8192));
	ASSERT_EQ(badPipeline.Open(mBlockId, kKey, "no-such-pipeline"),
		RBS::kErrorTransport);
	ASSERT_EQ(mEmulator->GetAcquireCount(), 0);

	BlockWriter twice(*mEmulator, mPool, MakeParameters(1024, 2048, 8192));
	ASSERT_EQ(twice.Open(mBlockId, kKey, kPipeline), 0);
	ASSERT_EQ(twice.Open(mBlockId, kKey, kPipeline), RBS::kErrorParameters);
	ASSERT_EQ(twice.Close(), 0);
	ASSERT_EQ(mEmulator->GetAcquireCount(), 1);
	ASSERT_EQ(mEmulator->GetReleaseCount(), 1);
}

TEST(BlockWriterParametersTest, Validate) {
	string msg;
	ASSERT_EQ(BlockWriter::Parameters().Validate(&msg), 0);
	ASSERT_EQ(BlockWriter::Parameters(1024, 3072, 6144).Validate(&msg), 0);
	ASSERT_EQ(BlockWriter::Parameters(1024, 1536, 3072).Validate(&msg),
		RBS::kErrorParameters);
	ASSERT_EQ(msg, "flush size must be a multiple of chunk size");
	ASSERT_EQ(BlockWriter::Parameters(1024, 2048, 5120).Validate(&msg),
		RBS::kErrorParameters);
	ASSERT_EQ(msg, "max buffered bytes must be a multiple of flush size");
	ASSERT_EQ(BlockWriter::Parameters(0, 2048, 4096).Validate(),
		RBS::kErrorParameters);
	ASSERT_EQ(BlockWriter::Parameters(1024, 2048, 4096, 0).Validate(),
		RBS::kErrorParameters);
}

TEST(BlockWriterParametersTest, LoadFromProperties) {
	const string conf =
		"rbs.client.chunkSize = 2048\n"
		"rbs.client.streamBufferFlushSize = 8192\n"
		"rbs.client.streamBufferMaxSize = 32768\n"
		"rbs.client.watchTimeoutMs = 250\n"
		"rbs.client.checksumType = sha256\n"
		"rbs.client.bytesPerChecksum = 512\n";
	Properties props;
	ASSERT_EQ(props.loadProperties(conf.data(), conf.size(), '='), 0);
	BlockWriter::Parameters params;
	ASSERT_EQ(params.SetParameters(props), 0);
	ASSERT_EQ(params.mChunkSize, 2048);
	ASSERT_EQ(params.mFlushSize, 8192);
	ASSERT_EQ(params.mMaxBufferedBytes, 32768);
	ASSERT_EQ(params.mWatchTimeoutMs, 250);
	ASSERT_EQ(params.mChecksumType, RBS::kChecksumTypeSha256);
	ASSERT_EQ(params.mBytesPerChecksum, 512);
	ASSERT_EQ(params.Validate(), 0);

	Properties bad;
	bad.setValue("rbs.client.checksumType", "CRC32C");
	ASSERT_EQ(params.SetParameters(bad), RBS::kErrorParameters);
	ASSERT_EQ(params.mChecksumType, RBS::kChecksumTypeSha256);
}
