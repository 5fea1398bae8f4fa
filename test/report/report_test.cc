#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/report/report_sink.h"
#include "../../src/report/run_summary.h"
#include <filesystem>
#include <fstream>
#include <json/json.h>
#include <sstream>
#include <unistd.h>

using namespace Crosscheck;
namespace fs = std::filesystem;

namespace {

BlockResult Diverged(BlockHeight height, std::vector<DivergenceKind> kinds) {
    BlockResult result;
    result.height = height;
    for (auto kind : kinds) {
        DivergenceEntry entry;
        entry.height = height;
        entry.kind = kind;
        entry.key = "k" + std::to_string(height);
        result.divergences.push_back(entry);
    }
    return result;
}

BlockResult Failed(BlockHeight height, BlockStatus status) {
    BlockResult result;
    result.height = height;
    result.status = status;
    result.error = "unreachable";
    return result;
}

std::vector<Json::Value> ReadLines(const fs::path& path) {
    std::vector<Json::Value> lines;
    std::ifstream in(path);
    std::string line;
    Json::CharReaderBuilder builder;
    while (std::getline(in, line)) {
        Json::Value value;
        std::string errors;
        std::istringstream stream(line);
        EXPECT_TRUE(Json::parseFromStream(builder, stream, &value, &errors)) << errors;
        lines.push_back(value);
    }
    return lines;
}

} // namespace

TEST(RunSummaryTest, CountsByKindAndBucket) {
    RunSummary summary(1000);
    summary.Record(Diverged(779832, {DivergenceKind::FIELD_MISMATCH}));
    summary.Record(Diverged(779999, {DivergenceKind::MISSING_IN_PRIMARY, DivergenceKind::COUNT_MISMATCH}));
    summary.Record(Diverged(780001, {}));
    summary.Record(Diverged(780500, {DivergenceKind::FIELD_MISMATCH}));

    EXPECT_EQ(summary.blocks_finalized, 4u);
    EXPECT_EQ(summary.blocks_ok, 4u);
    EXPECT_EQ(summary.blocks_diverged, 3u);
    EXPECT_EQ(summary.total_divergences, 4u);
    EXPECT_EQ(summary.divergences_by_kind.at(DivergenceKind::FIELD_MISMATCH), 2u);
    EXPECT_EQ(summary.divergences_by_bucket.at(779000), 3u);
    EXPECT_EQ(summary.divergences_by_bucket.at(780000), 1u);
    EXPECT_TRUE(summary.DivergenceFound());
    EXPECT_FALSE(summary.VerificationIncomplete());
}

TEST(RunSummaryTest, UnverifiedBlocksAreNotDivergences) {
    RunSummary summary;
    summary.Record(Failed(10, BlockStatus::FETCH_FAILED));
    summary.Record(Failed(11, BlockStatus::FATAL));

    EXPECT_FALSE(summary.DivergenceFound());
    EXPECT_TRUE(summary.VerificationIncomplete());
    EXPECT_EQ(summary.unverified_blocks, 2u);
    EXPECT_EQ(summary.unverified_ranges, std::vector<HeightRange>({{10, 11}}));
    EXPECT_EQ(summary.blocks_ok, 0u);
}

TEST(RunSummaryTest, UnverifiedHeightsCollapseIntoRanges) {
    RunSummary summary;
    for (BlockHeight h = 100; h < 10100; ++h) {
        bool flaky = (h >= 200 && h < 5200) || h == 6000 || h == 6002;
        summary.Record(flaky ? Failed(h, BlockStatus::FETCH_FAILED) : Diverged(h, {}));
    }

    EXPECT_EQ(summary.blocks_finalized, 10000u);
    EXPECT_EQ(summary.unverified_blocks, 5002u);
    EXPECT_EQ(summary.unverified_ranges,
              std::vector<HeightRange>({{200, 5199}, {6000, 6000}, {6002, 6002}}));
}

TEST(RunSummaryTest, ZeroBucketSizeIsCoerced) {
    RunSummary summary(0);
    EXPECT_EQ(summary.bucket_size, 1u);
    EXPECT_EQ(summary.BucketOf(42), 42u);
}

class JsonLinesReportSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = fs::temp_directory_path() /
                ("crosscheck_report_" + std::to_string(::getpid()) + "_" +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".jsonl");
        fs::remove(path_);
    }
    void TearDown() override { fs::remove(path_); }

    fs::path path_;
};

TEST_F(JsonLinesReportSinkTest, WritesBlocksThenSummary) {
    JsonLinesReportSink sink(path_.string());
    std::string error;
    ASSERT_TRUE(sink.Open(error)) << error;

    BlockResult diverged = Diverged(105, {DivergenceKind::FIELD_MISMATCH});
    diverged.divergences[0].fields.push_back({"owner", "alice", "bob"});
    RunSummary summary;
    summary.final_state = "COMPLETED";
    summary.start_height = 104;
    summary.end_height = 106;

    for (const auto& block : {Diverged(104, {}), diverged, Failed(106, BlockStatus::FETCH_FAILED)}) {
        sink.OnBlock(block);
        summary.Record(block);
    }
    sink.OnFinish(summary);

    auto lines = ReadLines(path_);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0]["type"].asString(), "block");
    EXPECT_EQ(lines[0]["height"].asUInt64(), 104u);
    EXPECT_EQ(lines[0]["divergences"].size(), 0u);

    const Json::Value& entry = lines[1]["divergences"][0];
    EXPECT_EQ(entry["kind"].asString(), "FIELD_MISMATCH");
    EXPECT_EQ(entry["fields"][0]["field"].asString(), "owner");
    EXPECT_EQ(entry["fields"][0]["secondary"].asString(), "bob");

    EXPECT_EQ(lines[2]["status"].asString(), "FETCH_FAILED");
    EXPECT_EQ(lines[2]["error"].asString(), "unreachable");

    const Json::Value& tail = lines[3];
    EXPECT_EQ(tail["type"].asString(), "summary");
    EXPECT_EQ(tail["state"].asString(), "COMPLETED");
    EXPECT_EQ(tail["total_divergences"].asUInt64(), 1u);
    EXPECT_TRUE(tail["divergence_found"].asBool());
    EXPECT_TRUE(tail["verification_incomplete"].asBool());
    EXPECT_EQ(tail["divergences_by_kind"]["FIELD_MISMATCH"].asUInt64(), 1u);
    EXPECT_EQ(tail["divergences_by_bucket"]["0"].asUInt64(), 1u);
    EXPECT_EQ(tail["unverified_blocks"].asUInt64(), 1u);
    ASSERT_EQ(tail["unverified_ranges"].size(), 1u);
    EXPECT_EQ(tail["unverified_ranges"][0][0].asUInt64(), 106u);
    EXPECT_EQ(tail["unverified_ranges"][0][1].asUInt64(), 106u);
}

TEST_F(JsonLinesReportSinkTest, AppendsAcrossRuns) {
    for (int run = 0; run < 2; ++run) {
        JsonLinesReportSink sink(path_.string());
        std::string error;
        ASSERT_TRUE(sink.Open(error));
        sink.OnBlock(Diverged(1, {}));
    }
    EXPECT_EQ(ReadLines(path_).size(), 2u);
}

TEST_F(JsonLinesReportSinkTest, UnopenablePathFails) {
    JsonLinesReportSink sink((path_ / "missing_dir" / "report.jsonl").string());
    std::string error;
    EXPECT_FALSE(sink.Open(error));
    EXPECT_FALSE(error.empty());
}

TEST(TeeReportSinkTest, FansOutInOrder) {
    class Counting : public IReportSink {
    public:
        void OnBlock(const BlockResult& result) override { heights.push_back(result.height); }
        void OnFinish(const RunSummary&) override { ++finished; }
        std::vector<BlockHeight> heights;
        int finished = 0;
    };
    Counting a, b;
    TeeReportSink tee;
    tee.Add(&a);
    tee.Add(&b);
    tee.OnBlock(Diverged(1, {}));
    tee.OnBlock(Diverged(2, {}));
    tee.OnFinish(RunSummary());

    EXPECT_EQ(a.heights, std::vector<BlockHeight>({1, 2}));
    EXPECT_EQ(b.heights, a.heights);
    EXPECT_EQ(a.finished, 1);
    EXPECT_EQ(b.finished, 1);
}

TEST(LogReportSinkTest, HandlesEveryStatus) {
    LogReportSink sink;
    RunSummary summary;
    for (const auto& block : {Diverged(1, {}), Diverged(2, {DivergenceKind::COUNT_MISMATCH}),
                              Failed(3, BlockStatus::FETCH_FAILED), Failed(4, BlockStatus::FATAL)}) {
        sink.OnBlock(block);
        summary.Record(block);
    }
    summary.final_state = "FAILED";
    sink.OnFinish(summary);
    EXPECT_EQ(summary.unverified_blocks, 2u);
}
