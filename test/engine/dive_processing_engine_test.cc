#include <gtest/gtest.h>
#include "../../src/engine/alert_report.h"
#include "../../src/engine/dive_processing_engine.h"
#include "../../src/engine/file_collector.h"
#include "../test_util.h"

#include <sys/stat.h>

#include <algorithm>
#include <memory>

#include "absl/time/clock.h"

using namespace Seastitch;
using namespace Seastitch::testing_util;

namespace {

// Requests a stop once the first reconstructed file has been delivered
class StoppingDownstream : public BasestationDownstream {
public:
    explicit StoppingDownstream(CancellationToken* cancel) : cancel_(cancel) {}

    absl::Status HandleFile(const FileCode& code, const std::string& path, RunResult* result) override {
        absl::Status status = BasestationDownstream::HandleFile(code, path, result);
        cancel_->Cancel();
        return status;
    }

private:
    CancellationToken* cancel_;
};

} // namespace

class DiveProcessingEngineTest : public ::testing::Test {
protected:
    static constexpr size_t kFragmentSize = 512;

    DiveProcessingEngineTest()
        : classifier_(45, {{"sc", false}}),
          transfer_log_(kFragmentSize),
          cache_(dir_.File("processed_files.cache"), &classifier_) {}

    absl::StatusOr<RunResult> RunEngine(bool force = false, DownstreamHandler* downstream = nullptr) {
        Defragmenter defragmenter(&filters_, &transfer_log_, downstream ? downstream : &downstream_,
                                  dir_.File(".scratch"));
        DiveProcessingEngine engine(dir_.path(), &classifier_, &cache_, &defragmenter, force);
        return engine.Run(cancel_);
    }

    // Fragments written in the past so they predate any cache timestamp
    std::vector<std::string> AddGroup(const std::string& base, const std::string& data) {
        std::vector<std::string> paths = WriteFragments(dir_.path(), base, data, kFragmentSize);
        const int64_t past = absl::ToUnixSeconds(absl::Now()) - 3600;
        for (const auto& path : paths) SetMtime(path, past);
        return paths;
    }

    void AddDive(int dive, uint32_t seed) {
        char base[16];
        snprintf(base, sizeof(base), "sg%04d", dive);
        logs_[dive] = TextBytes(150, seed);
        AddGroup(std::string(base) + "lz", Gzip(logs_[dive]));
        AddGroup(std::string(base) + "du", RandomBytes(2 * kFragmentSize + 40, seed + 1));
    }

    void Touch(const std::string& path) {
        SetMtime(path, absl::ToUnixSeconds(absl::Now()) + 3600);
    }

    TempDir dir_;
    SeagliderClassifier classifier_;
    DefaultRepairFilters filters_;
    ManifestTransferLog transfer_log_;
    BasestationDownstream downstream_;
    ProcessedFileCache cache_;
    CancellationToken cancel_;
    std::map<int, std::string> logs_;
};

TEST_F(DiveProcessingEngineTest, ProcessesNewDives) {
    AddDive(1, 10);
    AddDive(2, 20);

    absl::StatusOr<RunResult> result = RunEngine();
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->processed_dives, (std::set<int>{1, 2}));
    EXPECT_TRUE(result->failed_dives.empty());
    EXPECT_FALSE(result->cancelled);
    EXPECT_EQ(ReadFile(dir_.File("p0450001.log")), logs_[1]);
    EXPECT_EQ(ReadFile(dir_.File("p0450002.log")), logs_[2]);
    EXPECT_TRUE(Exists(dir_.File("p0450002.dat")));
    EXPECT_EQ(result->processed_log_files.size(), 4u);

    // Written through to disk
    ProcessedFileCache reread(cache_.path(), &classifier_);
    ASSERT_TRUE(reread.Read().ok());
    EXPECT_EQ(reread.files().size(), 4u);
}

TEST_F(DiveProcessingEngineTest, SecondRunIsIdempotent) {
    AddDive(1, 10);
    ASSERT_TRUE(RunEngine().ok());
    const TimestampMap before = cache_.files();

    absl::StatusOr<RunResult> result = RunEngine();
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_TRUE(result->processed_dives.empty());
    EXPECT_TRUE(result->processed_log_files.empty());
    EXPECT_TRUE(CollectResendHints(*result).empty());
    EXPECT_EQ(cache_.files(), before);
}

TEST_F(DiveProcessingEngineTest, TouchedFragmentReprocessesOnlyItsGroup) {
    AddDive(1, 10);
    AddDive(2, 20);
    ASSERT_TRUE(RunEngine().ok());
    const TimestampMap before = cache_.files();

    Touch(dir_.File("sg0002du.x01"));
    absl::StatusOr<RunResult> result = RunEngine();
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->processed_dives, (std::set<int>{2}));
    ASSERT_EQ(result->processed_log_files.size(), 1u);
    EXPECT_EQ(result->processed_log_files[0], dir_.File("p0450002.dat"));

    for (const auto& [base, when] : cache_.files()) {
        if (base == "sg0002du") continue;
        EXPECT_EQ(when, before.at(base)) << base;
    }
}

TEST_F(DiveProcessingEngineTest, FragmentWrittenDuringRunIsPickedUpNextRun) {
    AddDive(1, 10);
    ASSERT_TRUE(RunEngine().ok());

    // Latest second a fragment could have landed in while the run was going
    SetMtime(dir_.File("sg0001du.x01"), absl::ToUnixSeconds(absl::Now()));
    absl::StatusOr<RunResult> result = RunEngine();
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->processed_dives, (std::set<int>{1}));
    ASSERT_EQ(result->processed_log_files.size(), 1u);
    EXPECT_EQ(result->processed_log_files[0], dir_.File("p0450001.dat"));
}

TEST_F(DiveProcessingEngineTest, ReprocessedLogForcesDataGroup) {
    AddDive(1, 10);
    ASSERT_TRUE(RunEngine().ok());

    Touch(dir_.File("sg0001lz.x00"));
    absl::StatusOr<RunResult> result = RunEngine();
    ASSERT_TRUE(result.ok()) << result.status();
    std::vector<std::string> produced = result->processed_log_files;
    std::sort(produced.begin(), produced.end());
    EXPECT_EQ(produced, (std::vector<std::string>{dir_.File("p0450001.dat"), dir_.File("p0450001.log")}));
}

TEST_F(DiveProcessingEngineTest, FailedGroupIsIsolated) {
    AddDive(1, 10);
    // Dive 2: the log cannot be decompressed, the data is fine
    WriteFile(dir_.File("sg0002lz.x"), RandomBytes(700, 30));
    AddGroup("sg0002du", RandomBytes(kFragmentSize + 10, 31));

    absl::StatusOr<RunResult> result = RunEngine();
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->processed_dives, (std::set<int>{1}));
    EXPECT_EQ(result->failed_dives, (std::set<int>{2}));
    EXPECT_EQ(result->incomplete_files.count(dir_.File("sg0002lz.r")), 1u);
    EXPECT_TRUE(Exists(dir_.File("p0450002.dat")));

    EXPECT_EQ(cache_.files().count("sg0002lz"), 0u);
    EXPECT_EQ(cache_.files().count("sg0002du"), 1u);
    EXPECT_EQ(cache_.files().count("sg0001lz"), 1u);

    // The failed group is retried on the next run
    absl::StatusOr<RunResult> again = RunEngine();
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(again->failed_dives, (std::set<int>{2}));
}

TEST_F(DiveProcessingEngineTest, SelftestsAndPdosLogs) {
    AddGroup("st0003lu", TextBytes(60, 40));
    const std::string commands = "$D_TGT,90\n";
    WriteFile(dir_.File("sg0001pz.000"), Gzip(commands));
    SetMtime(dir_.File("sg0001pz.000"), absl::ToUnixSeconds(absl::Now()) - 3600);

    absl::StatusOr<RunResult> result = RunEngine();
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->processed_selftests, (std::set<int>{3}));
    EXPECT_TRUE(Exists(dir_.File("pt0450003.log")));
    ASSERT_EQ(result->processed_pdos_logs.size(), 1u);
    EXPECT_EQ(ReadFile(dir_.File("p0450001.000.pdos")), commands);
    EXPECT_EQ(cache_.pdos_logs().count("sg0001pz.000"), 1u);
    // The pdos log is not a dive group of its own
    EXPECT_EQ(cache_.files().count("sg0001pz"), 0u);

    absl::StatusOr<RunResult> again = RunEngine();
    ASSERT_TRUE(again.ok());
    EXPECT_TRUE(again->processed_pdos_logs.empty());
    EXPECT_TRUE(again->processed_selftests.empty());
}

TEST_F(DiveProcessingEngineTest, StopBeforeRunStillWritesCache) {
    AddDive(1, 10);
    cancel_.Cancel();

    absl::StatusOr<RunResult> result = RunEngine();
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_TRUE(result->cancelled);
    EXPECT_TRUE(result->processed_dives.empty());
    EXPECT_TRUE(Exists(cache_.path()));
    EXPECT_TRUE(cache_.files().empty());
}

TEST_F(DiveProcessingEngineTest, StopMidRunKeepsCompletedGroups) {
    AddDive(1, 10);
    AddDive(2, 20);
    StoppingDownstream stopping(&cancel_);

    absl::StatusOr<RunResult> result = RunEngine(false, &stopping);
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_TRUE(result->cancelled);

    ProcessedFileCache reread(cache_.path(), &classifier_);
    ASSERT_TRUE(reread.Read().ok());
    EXPECT_EQ(reread.files().size(), 1u);
    EXPECT_EQ(reread.files().count("sg0001lz"), 1u);

    // The next invocation picks up where this one stopped
    cancel_.Reset();
    absl::StatusOr<RunResult> resumed = RunEngine();
    ASSERT_TRUE(resumed.ok());
    EXPECT_EQ(resumed->processed_dives, (std::set<int>{1, 2}));
    EXPECT_EQ(cache_.files().size(), 4u);
}

TEST_F(DiveProcessingEngineTest, ForceReprocessesEverything) {
    AddDive(1, 10);
    ASSERT_TRUE(RunEngine().ok());

    absl::StatusOr<RunResult> result = RunEngine(true);
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->processed_dives, (std::set<int>{1}));
    EXPECT_EQ(result->processed_log_files.size(), 2u);
}

TEST_F(DiveProcessingEngineTest, InvalidatedDiveIsRetried) {
    AddDive(1, 10);
    AddDive(2, 20);
    ASSERT_TRUE(RunEngine().ok());

    Defragmenter defragmenter(&filters_, &transfer_log_, &downstream_, dir_.File(".scratch"));
    DiveProcessingEngine engine(dir_.path(), &classifier_, &cache_, &defragmenter);
    EXPECT_EQ(engine.InvalidateDive(2), 2u);
    ASSERT_TRUE(cache_.Write().ok());

    absl::StatusOr<RunResult> result = RunEngine();
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->processed_dives, (std::set<int>{2}));
}

TEST_F(DiveProcessingEngineTest, UnreadableCacheIsFatal) {
    AddDive(1, 10);
    ASSERT_EQ(mkdir(cache_.path().c_str(), 0755), 0);
    absl::StatusOr<RunResult> result = RunEngine();
    EXPECT_FALSE(result.ok());
    EXPECT_FALSE(Exists(dir_.File("p0450001.log")));
}

TEST_F(DiveProcessingEngineTest, MissingMissionDirectoryIsAnError) {
    Defragmenter defragmenter(&filters_, &transfer_log_, &downstream_, dir_.File(".scratch"));
    DiveProcessingEngine engine(dir_.File("nope"), &classifier_, &cache_, &defragmenter);
    EXPECT_FALSE(engine.Run(cancel_).ok());
}

TEST_F(DiveProcessingEngineTest, CollectorGroupsByOwnerAndDive) {
    AddDive(4, 50);
    AddGroup("st0001lu", TextBytes(10, 51));
    WriteFile(dir_.File("sg0004pz.001"), "x");
    WriteFile(dir_.File("notes.txt"), "ignored");

    absl::StatusOr<CollectedFiles> collected = CollectPreProcessingFiles(dir_.path(), classifier_);
    ASSERT_TRUE(collected.ok());
    EXPECT_EQ(collected->selftests.size(), 1u);
    ASSERT_EQ(collected->dives.count(4), 1u);
    EXPECT_EQ(collected->pdos_logs.size(), 1u);

    std::map<std::string, std::vector<FileCode>> groups = GroupByBaseName(collected->dives.at(4));
    EXPECT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups.count("sg0004lz"), 1u);
    EXPECT_EQ(groups.count("sg0004du"), 1u);
    EXPECT_EQ(groups.count("sg0004pz"), 1u);
}

TEST_F(DiveProcessingEngineTest, AlertReportListsHintsOnce) {
    std::vector<std::string> paths = AddGroup("sg0005du", RandomBytes(4 * kFragmentSize, 60));
    std::remove(paths[1].c_str());

    absl::StatusOr<RunResult> result = RunEngine();
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(CollectResendHints(*result), (std::vector<std::string>{"resend_dive /d 5 1"}));

    std::string report = FormatAlertReport(*result);
    EXPECT_NE(report.find("Processed dives: 5"), std::string::npos) << report;
    EXPECT_NE(report.find("Suggested resend commands:\n    resend_dive /d 5 1\n"), std::string::npos) << report;

    ASSERT_TRUE(WriteAlertReport(*result, dir_.File("alerts.log")).ok());
    EXPECT_EQ(ReadFile(dir_.File("alerts.log")), report);
}

TEST_F(DiveProcessingEngineTest, EmptyReportWritesNothing) {
    RunResult result;
    EXPECT_TRUE(FormatAlertReport(result).empty());
    ASSERT_TRUE(WriteAlertReport(result, dir_.File("alerts.log")).ok());
    EXPECT_FALSE(Exists(dir_.File("alerts.log")));
}
