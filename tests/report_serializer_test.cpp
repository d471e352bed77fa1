#include "test_base.hpp"
#include "core/report_serializer.hpp"
#include <fstream>

class ReportSerializerTest : public TestBase
{
protected:
    QualityReport makeReport()
    {
        ComponentSummary visual;
        visual.score = 0.9;
        visual.metrics["drift"] = 0.05;
        ComponentSummary audio;
        audio.score = 0.7;
        audio.degraded = true;
        ComponentSummary sync;
        sync.score = 0.5;
        sync.metrics["offset_ms"] = 100.0;

        std::vector<Issue> issues;
        issues.emplace_back(IssueKind::AUDIO_SILENCE_GAP, Severity::HIGH, "Silence gap of 2.00s",
                            IssueLocation::at(4.0, "shot_002"));
        issues.back().id = "A001";
        issues.emplace_back(IssueKind::SYNC_OFFSET_EXCEEDED, Severity::CRITICAL, "Offset of 100 ms",
                            IssueLocation::entireVideo());
        issues.back().id = "S001";

        MediaArtifact artifact;
        artifact.path = "/renders/final.mp4";
        artifact.size_bytes = 4096;
        artifact.sha256 = std::string(64, 'a');

        return QualityReport(0.7, visual, audio, sync, issues, {"Synchronization: 1 issue (worst severity: critical)."},
                             false, 0.7, artifact);
    }
};

TEST_F(ReportSerializerTest, ReportFieldsAreRendered)
{
    nlohmann::json json = ReportSerializer::toJson(makeReport());

    EXPECT_DOUBLE_EQ(json["overall_score"].get<double>(), 0.7);
    EXPECT_DOUBLE_EQ(json["visual_coherence_score"].get<double>(), 0.9);
    EXPECT_DOUBLE_EQ(json["audio_quality_score"].get<double>(), 0.7);
    EXPECT_DOUBLE_EQ(json["sync_score"].get<double>(), 0.5);
    EXPECT_FALSE(json["passed"].get<bool>());
    EXPECT_DOUBLE_EQ(json["pass_threshold"].get<double>(), 0.7);

    EXPECT_EQ(json["artifact"]["path"], "/renders/final.mp4");
    EXPECT_EQ(json["artifact"]["size_bytes"].get<uint64_t>(), 4096u);

    EXPECT_TRUE(json["components"]["audio_quality"]["degraded"].get<bool>());
    EXPECT_TRUE(json["components"]["audio_quality"]["metrics"].is_object());
    EXPECT_DOUBLE_EQ(json["components"]["synchronization"]["metrics"]["offset_ms"].get<double>(), 100.0);

    ASSERT_EQ(json["recommendations"].size(), 1u);
    ASSERT_EQ(json["issues"].size(), 2u);
}

TEST_F(ReportSerializerTest, IssueLocationsKeepTimestampAndShot)
{
    nlohmann::json json = ReportSerializer::toJson(makeReport());

    const auto &gap = json["issues"][0];
    EXPECT_EQ(gap["id"], "A001");
    EXPECT_EQ(gap["kind"], "silence_gap");
    EXPECT_EQ(gap["severity"], "high");
    EXPECT_EQ(gap["category"], "audio_quality");
    EXPECT_DOUBLE_EQ(gap["location"]["timestamp_seconds"].get<double>(), 4.0);
    EXPECT_EQ(gap["location"]["shot_id"], "shot_002");
    EXPECT_EQ(gap["location"]["description"], "4.00s (shot_002)");

    const auto &offset = json["issues"][1];
    EXPECT_EQ(offset["severity"], "critical");
    EXPECT_EQ(offset["location"]["description"], "entire_video");
    EXPECT_FALSE(offset["location"].contains("timestamp_seconds"));
    EXPECT_FALSE(offset["location"].contains("shot_id"));
}

TEST_F(ReportSerializerTest, WritesParseableFile)
{
    std::string path = testPath("report.json");
    ASSERT_TRUE(ReportSerializer::writeToFile(makeReport(), path));

    std::ifstream in(path);
    nlohmann::json json = nlohmann::json::parse(in);
    EXPECT_EQ(json, ReportSerializer::toJson(makeReport()));
}

TEST_F(ReportSerializerTest, InvalidUtf8PathIsStillRendered)
{
    MediaArtifact artifact;
    artifact.path = std::string("/renders/clip_\xff\xfe.mp4");
    QualityReport report(1.0, ComponentSummary(), ComponentSummary(), ComponentSummary(), {}, {}, true, 0.7, artifact);

    std::string text;
    ASSERT_NO_THROW(text = ReportSerializer::toString(report));
    nlohmann::json json = nlohmann::json::parse(text);
    EXPECT_EQ(json["artifact"]["path"].get<std::string>().rfind("/renders/clip_", 0), 0u);
    EXPECT_TRUE(ReportSerializer::writeToFile(report, testPath("report.json")));
}

TEST_F(ReportSerializerTest, UnwritablePathReportsFailure)
{
    EXPECT_FALSE(ReportSerializer::writeToFile(makeReport(), testPath("missing_dir/report.json")));
}
