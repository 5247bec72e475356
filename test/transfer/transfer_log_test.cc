#include <gtest/gtest.h>
#include "../../src/transfer/transfer_log.h"
#include "../test_util.h"

using namespace Seastitch;
using namespace Seastitch::testing_util;

TEST(TransferLogTest, ParsesManifest) {
    absl::StatusOr<std::unique_ptr<ManifestTransferLog>> log = ManifestTransferLog::LoadFromString(R"(
fragment_sizes:
  12: 4096
fragments:
  sg0012lz.x00: {method: raw, expected: 4096, received: 4096}
  sg0012lz.x01: {method: xmodem, expected: 1000, received: 800}
totals:
  sg0012dz: 10000
)", 8192);
    ASSERT_TRUE(log.ok()) << log.status();
    const ManifestTransferLog& t = **log;

    EXPECT_EQ(t.FragmentSize(12), 4096);
    EXPECT_EQ(t.FragmentSize(13), 8192);
    EXPECT_TRUE(t.IsRawTransfer("sg0012lz.x00"));
    EXPECT_FALSE(t.IsRawTransfer("sg0012lz.x01"));
    ASSERT_EQ(t.ReportedSizes().count("sg0012lz.x01"), 1u);
    EXPECT_EQ(t.ReportedSizes().at("sg0012lz.x01").expected, 1000);
    EXPECT_EQ(t.ReportedSizes().at("sg0012lz.x01").received, 800);
    EXPECT_EQ(t.TotalSize("sg0012dz"), 10000);
    EXPECT_EQ(t.TotalSize("sg0012lz"), 0);
}

TEST(TransferLogTest, EmptyManifestUsesDefaults) {
    absl::StatusOr<std::unique_ptr<ManifestTransferLog>> log = ManifestTransferLog::LoadFromString("", 2048);
    ASSERT_TRUE(log.ok());
    EXPECT_EQ((*log)->FragmentSize(1), 2048);
    EXPECT_TRUE((*log)->ReportedSizes().empty());
}

TEST(TransferLogTest, MissingFileIsEmptyLog) {
    TempDir dir;
    absl::StatusOr<std::unique_ptr<ManifestTransferLog>> log =
        ManifestTransferLog::Load(dir.File("transfer.yml"), 8192);
    ASSERT_TRUE(log.ok());
    EXPECT_EQ((*log)->FragmentSize(3), 8192);
}

TEST(TransferLogTest, MalformedManifestIsInvalidArgument) {
    TempDir dir;
    WriteFile(dir.File("transfer.yml"), "fragment_sizes:\n  twelve: lots\n");
    EXPECT_TRUE(absl::IsInvalidArgument(ManifestTransferLog::Load(dir.File("transfer.yml"), 8192).status()));
    EXPECT_TRUE(absl::IsInvalidArgument(ManifestTransferLog::LoadFromString("- a\n- b\n", 8192).status()));
}
