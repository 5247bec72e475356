#include <gtest/gtest.h>
#include "../../src/codec/codecs.h"
#include "../test_util.h"

using namespace Seastitch;
using namespace Seastitch::testing_util;

class CodecsTest : public ::testing::Test {
protected:
    TempDir dir_;
};

TEST_F(CodecsTest, GzipDecompresses) {
    std::string plain = TextBytes(500, 1);
    WriteFile(dir_.File("in.gz"), Gzip(plain));

    absl::StatusOr<uint64_t> written = DecompressGzip(dir_.File("in.gz"), dir_.File("out"));
    ASSERT_TRUE(written.ok()) << written.status();
    EXPECT_EQ(*written, plain.size());
    EXPECT_EQ(ReadFile(dir_.File("out")), plain);
}

TEST_F(CodecsTest, GzipConcatenatedMembers) {
    std::string first = TextBytes(50, 2);
    std::string second = TextBytes(70, 3);
    WriteFile(dir_.File("in.gz"), Gzip(first) + Gzip(second));

    absl::StatusOr<uint64_t> written = DecompressGzip(dir_.File("in.gz"), dir_.File("out"));
    ASSERT_TRUE(written.ok()) << written.status();
    EXPECT_EQ(ReadFile(dir_.File("out")), first + second);
}

TEST_F(CodecsTest, TruncatedGzipKeepsRecoveredBytes) {
    std::string plain = RandomBytes(20000, 4);
    std::string compressed = Gzip(plain);
    WriteFile(dir_.File("in.gz"), compressed.substr(0, compressed.size() / 2));

    absl::StatusOr<uint64_t> written = DecompressGzip(dir_.File("in.gz"), dir_.File("out"));
    EXPECT_TRUE(absl::IsDataLoss(written.status())) << written.status();
    std::string recovered = ReadFile(dir_.File("out"));
    EXPECT_LT(recovered.size(), plain.size());
    EXPECT_EQ(recovered, plain.substr(0, recovered.size()));
}

TEST_F(CodecsTest, GarbageIsNotGzip) {
    WriteFile(dir_.File("in.gz"), RandomBytes(300, 5));
    EXPECT_FALSE(DecompressGzip(dir_.File("in.gz"), dir_.File("out")).ok());
}

TEST_F(CodecsTest, EmptyInputIsDataLoss) {
    WriteFile(dir_.File("empty"), "");
    EXPECT_TRUE(absl::IsDataLoss(DecompressGzip(dir_.File("empty"), dir_.File("out")).status()));
    EXPECT_TRUE(absl::IsDataLoss(DecompressBzip2(dir_.File("empty"), dir_.File("out")).status()));
}

TEST_F(CodecsTest, Bzip2Decompresses) {
    std::string plain = TextBytes(800, 6);
    WriteFile(dir_.File("in.bz2"), Bzip2(plain));

    absl::StatusOr<uint64_t> written = DecompressBzip2(dir_.File("in.bz2"), dir_.File("out"));
    ASSERT_TRUE(written.ok()) << written.status();
    EXPECT_EQ(*written, plain.size());
    EXPECT_EQ(ReadFile(dir_.File("out")), plain);
}

TEST_F(CodecsTest, Bzip2ConcatenatedStreams) {
    std::string first = TextBytes(30, 7);
    std::string second = TextBytes(40, 8);
    WriteFile(dir_.File("in.bz2"), Bzip2(first) + Bzip2(second));

    absl::StatusOr<uint64_t> written = DecompressBzip2(dir_.File("in.bz2"), dir_.File("out"));
    ASSERT_TRUE(written.ok()) << written.status();
    EXPECT_EQ(ReadFile(dir_.File("out")), first + second);
}

TEST_F(CodecsTest, TruncatedBzip2IsDataLoss) {
    std::string compressed = Bzip2(RandomBytes(50000, 9));
    WriteFile(dir_.File("in.bz2"), compressed.substr(0, compressed.size() - 100));
    EXPECT_TRUE(absl::IsDataLoss(DecompressBzip2(dir_.File("in.bz2"), dir_.File("out")).status()));
}

TEST_F(CodecsTest, MissingSourceIsNotFound) {
    EXPECT_TRUE(absl::IsNotFound(DecompressGzip(dir_.File("missing"), dir_.File("out")).status()));
}
