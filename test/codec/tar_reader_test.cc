#include <gtest/gtest.h>
#include "../../src/codec/tar_reader.h"
#include "../test_util.h"

using namespace Seastitch;
using namespace Seastitch::testing_util;

class TarReaderTest : public ::testing::Test {
protected:
    std::vector<TarMember> ReadAll(TarReader* reader) {
        std::vector<TarMember> members;
        while (true) {
            absl::StatusOr<std::optional<TarMember>> member = reader->Next();
            EXPECT_TRUE(member.ok()) << member.status();
            if (!member.ok() || !member->has_value()) break;
            members.push_back(**member);
        }
        return members;
    }

    TempDir dir_;
};

TEST_F(TarReaderTest, ListsAndExtractsMembers) {
    std::string one = TextBytes(20, 1);
    std::string two = RandomBytes(1300, 2);
    WriteFile(dir_.File("a.tar"), MakeTar({{"sc0007lu.x00", one}, {"sub/data.bin", two}}));

    absl::StatusOr<std::unique_ptr<TarReader>> reader = TarReader::Open(dir_.File("a.tar"));
    ASSERT_TRUE(reader.ok()) << reader.status();
    std::vector<TarMember> members = ReadAll(reader->get());
    ASSERT_EQ(members.size(), 2u);
    EXPECT_EQ(members[0].name, "sc0007lu.x00");
    EXPECT_EQ(members[0].size, one.size());
    EXPECT_TRUE(members[0].IsRegular());
    EXPECT_EQ(members[1].name, "sub/data.bin");
    EXPECT_FALSE(members[1].truncated);

    std::string out_dir = dir_.File("out");
    std::string extracted;
    ASSERT_TRUE((*reader)->Extract(members[1], out_dir, &extracted).ok());
    EXPECT_EQ(extracted, out_dir + "/sub/data.bin");
    EXPECT_EQ(ReadFile(extracted), two);
}

TEST_F(TarReaderTest, TruncatedMemberIsWrittenAndReported) {
    std::string content = RandomBytes(2000, 3);
    std::string archive = MakeTar({{"big.bin", content}});
    // Cut in the middle of the member data
    WriteFile(dir_.File("cut.tar"), archive.substr(0, 512 + 700));

    absl::StatusOr<std::unique_ptr<TarReader>> reader = TarReader::Open(dir_.File("cut.tar"));
    ASSERT_TRUE(reader.ok());
    std::vector<TarMember> members = ReadAll(reader->get());
    ASSERT_EQ(members.size(), 1u);
    EXPECT_TRUE(members[0].truncated);

    std::string extracted;
    absl::Status status = (*reader)->Extract(members[0], dir_.path(), &extracted);
    EXPECT_TRUE(absl::IsDataLoss(status)) << status;
    EXPECT_EQ(ReadFile(extracted), content.substr(0, 700));
}

TEST_F(TarReaderTest, RefusesEscapingNames) {
    WriteFile(dir_.File("evil.tar"), MakeTar({{"../escape", "x"}, {"/abs", "y"}}));
    absl::StatusOr<std::unique_ptr<TarReader>> reader = TarReader::Open(dir_.File("evil.tar"));
    ASSERT_TRUE(reader.ok());
    for (const auto& member : ReadAll(reader->get())) {
        std::string extracted;
        EXPECT_TRUE(absl::IsInvalidArgument((*reader)->Extract(member, dir_.File("out"), &extracted)));
        EXPECT_TRUE(extracted.empty());
    }
    EXPECT_FALSE(Exists(dir_.path() + "/escape"));
}

TEST_F(TarReaderTest, CorruptHeaderStopsIteration) {
    std::string archive = MakeTar({{"first", "1234"}, {"second", "5678"}});
    // Break the checksum of the second header
    archive[1024 + 10] ^= 0x55;
    WriteFile(dir_.File("bad.tar"), archive);

    absl::StatusOr<std::unique_ptr<TarReader>> reader = TarReader::Open(dir_.File("bad.tar"));
    ASSERT_TRUE(reader.ok());
    absl::StatusOr<std::optional<TarMember>> first = (*reader)->Next();
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(first->has_value());
    EXPECT_EQ((*first)->name, "first");
    EXPECT_TRUE(absl::IsDataLoss((*reader)->Next().status()));
    absl::StatusOr<std::optional<TarMember>> after = (*reader)->Next();
    ASSERT_TRUE(after.ok());
    EXPECT_FALSE(after->has_value());
}

TEST_F(TarReaderTest, OpenRejectsNonArchives) {
    WriteFile(dir_.File("short"), "tiny");
    EXPECT_TRUE(absl::IsDataLoss(TarReader::Open(dir_.File("short")).status()));
    WriteFile(dir_.File("noise"), RandomBytes(2048, 4));
    EXPECT_TRUE(absl::IsDataLoss(TarReader::Open(dir_.File("noise")).status()));
}
