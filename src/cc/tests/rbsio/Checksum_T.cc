#include <gtest/gtest.h>

#include "rbsio/checksum.h"
#include "tests/rbstest.h"

#include <errno.h>
#include <string>

using std::string;
using RBS::Checksum;
using RBS::ChecksumData;
using RBS::ChecksumType;
using RBS::Test::RbsTestUtils;

TEST(ChecksumTest, KnownValues) {
	ASSERT_EQ(RBS::ComputeCrc32("123456789", 9), 0xCBF43926u);
	ASSERT_EQ(RBS::ComputeAdler32("Wikipedia", 9), 0x11E60398u);
	ASSERT_EQ(RBS::ComputeAdler32("", 0), 1u);
}

TEST(ChecksumTest, TypeNames) {
	for (int i = RBS::kChecksumTypeNone; i < RBS::kChecksumTypeCount; i++) {
		const ChecksumType type = ChecksumType(i);
		ASSERT_EQ(RBS::ChecksumTypeFromName(RBS::ChecksumTypeToName(type)),
			type);
	}
	ASSERT_EQ(RBS::ChecksumTypeFromName("crc32"), RBS::kChecksumTypeCrc32);
	ASSERT_EQ(RBS::ChecksumTypeFromName("CRC32C"), RBS::kChecksumTypeCount);
	ASSERT_EQ(RBS::ChecksumTypeFromName(0), RBS::kChecksumTypeCount);
	ASSERT_STREQ(RBS::ChecksumTypeToName(RBS::kChecksumTypeCount), "INVALID");
}

TEST(ChecksumTest, WindowCountAndSizes) {
	const string data = RbsTestUtils::MakeData(10 * 1024 + 17);
	const struct {
		ChecksumType type;
		size_t       sumSize;
	} kTypes[] = {
		{ RBS::kChecksumTypeAdler32, 4 },
		{ RBS::kChecksumTypeCrc32,   4 },
		{ RBS::kChecksumTypeMd5,    16 },
		{ RBS::kChecksumTypeSha256, 32 }
	};
	for (size_t i = 0; i < sizeof(kTypes) / sizeof(kTypes[0]); i++) {
		const Checksum cs(kTypes[i].type, 1024);
		ChecksumData   sum;
		ASSERT_EQ(cs.ComputeChecksum(data.data(), data.size(), sum), 0);
		ASSERT_EQ(sum.type, kTypes[i].type);
		ASSERT_EQ(sum.bytesPerChecksum, 1024u);
		ASSERT_EQ(sum.checksums.size(), 11u);
		ASSERT_EQ(sum.checksums.front().size(), kTypes[i].sumSize);
		ASSERT_EQ(Checksum::VerifyChecksum(data.data(), data.size(), sum), 0);
	}
}

TEST(ChecksumTest, Crc32WindowBytes) {
	const Checksum cs(RBS::kChecksumTypeCrc32, 9);
	ChecksumData   sum;
	ASSERT_EQ(cs.ComputeChecksum("123456789", 9, sum), 0);
	ASSERT_EQ(sum.checksums.size(), 1u);
	ASSERT_EQ(sum.checksums[0], string("\xCB\xF4\x39\x26", 4));
}

TEST(ChecksumTest, DetectsCorruption) {
	string             data = RbsTestUtils::MakeData(4096, 7);
	const Checksum     cs(RBS::kChecksumTypeSha256, 1000);
	ChecksumData       sum;
	ASSERT_EQ(cs.ComputeChecksum(data.data(), data.size(), sum), 0);
	data[4095] ^= 0x1;
	ASSERT_EQ(Checksum::VerifyChecksum(data.data(), data.size(), sum),
		-EBADMSG);
	data[4095] ^= 0x1;
	ASSERT_EQ(Checksum::VerifyChecksum(data.data(), data.size() - 1, sum),
		-EBADMSG);
}

TEST(ChecksumTest, NoneAndInvalid) {
	ChecksumData sum;
	ASSERT_EQ(Checksum(RBS::kChecksumTypeNone).ComputeChecksum(
		"abc", 3, sum), 0);
	ASSERT_TRUE(sum.checksums.empty());
	ASSERT_EQ(Checksum::VerifyChecksum("xyz", 3, sum), 0);

	ASSERT_EQ(Checksum(RBS::kChecksumTypeCrc32, 0).ComputeChecksum(
		"abc", 3, sum), -EINVAL);
	ASSERT_EQ(Checksum(RBS::kChecksumTypeCount).ComputeChecksum(
		"abc", 3, sum), -EINVAL);
}
