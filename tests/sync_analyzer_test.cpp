#include <gtest/gtest.h>
#include <cmath>
#include "core/sync_analyzer.hpp"
#include "stubs/synthetic_media.hpp"

namespace
{
    AudioExtraction audioOfLength(double seconds)
    {
        AudioExtraction extraction(AudioExtractionStatus::AVAILABLE, "");
        extraction.signal.sample_rate = 16000;
        extraction.signal.samples.assign(static_cast<size_t>(std::llround(seconds * 16000)), 0.1f);
        return extraction;
    }

    std::optional<VideoStreamInfo> videoOfLength(double seconds, double fps = 25.0)
    {
        return SyntheticFrameDecoder::makeInfo(seconds, fps);
    }
}

class SyncAnalyzerTest : public ::testing::Test
{
protected:
    SyncAnalysisConfig config_;
    DegradedScoreConfig defaults_;
    ProjectMetadata metadata_;
};

TEST_F(SyncAnalyzerTest, AlignedStreamsScorePerfectly)
{
    SyncAnalyzer analyzer(config_, defaults_);
    AnalysisResult result = analyzer.analyze(videoOfLength(30.0), audioOfLength(30.0), metadata_);

    EXPECT_DOUBLE_EQ(result.score, 1.0);
    EXPECT_TRUE(result.issues.empty());
    EXPECT_NEAR(result.metrics.at("offset_ms"), 0.0, 1e-6);
}

TEST_F(SyncAnalyzerTest, OffsetWithinLimitReducesScoreOnly)
{
    config_.max_offset_ms = 100.0;
    SyncAnalyzer analyzer(config_, defaults_);
    AnalysisResult result = analyzer.analyze(videoOfLength(30.0), audioOfLength(30.2), metadata_);

    EXPECT_NEAR(result.metrics.at("drift_ms"), 200.0, 1e-3);
    EXPECT_NEAR(result.metrics.at("offset_ms"), 100.0, 1e-3);
    EXPECT_NEAR(result.score, 0.75, 1e-3);
    EXPECT_TRUE(result.issues.empty());
}

TEST_F(SyncAnalyzerTest, OffsetBeyondLimitIsCritical)
{
    config_.max_offset_ms = 50.0;
    SyncAnalyzer analyzer(config_, defaults_);
    AnalysisResult result = analyzer.analyze(videoOfLength(30.0), audioOfLength(30.2), metadata_);

    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0].kind, IssueKind::SYNC_OFFSET_EXCEEDED);
    EXPECT_EQ(result.issues[0].severity, Severity::CRITICAL);
    EXPECT_NEAR(*result.issues[0].location.timestamp_seconds, 30.0, 1e-9);
    EXPECT_NEAR(result.score, 0.5, 1e-3);
}

TEST_F(SyncAnalyzerTest, LargerToleranceNeverLowersScore)
{
    double previous = -1.0;
    for (double max_offset = 10.0; max_offset <= 500.0; max_offset += 10.0)
    {
        config_.max_offset_ms = max_offset;
        SyncAnalyzer analyzer(config_, defaults_);
        double score = analyzer.analyze(videoOfLength(30.0), audioOfLength(30.35), metadata_).score;
        EXPECT_GE(score, previous);
        EXPECT_GE(score, 0.0);
        EXPECT_LE(score, 1.0);
        previous = score;
    }
}

TEST_F(SyncAnalyzerTest, MissingAudioIsInformational)
{
    SyncAnalyzer analyzer(config_, defaults_);
    AnalysisResult result = analyzer.analyze(videoOfLength(30.0),
                                             AudioExtraction(AudioExtractionStatus::NO_AUDIO_TRACK, "none"),
                                             metadata_);

    EXPECT_DOUBLE_EQ(result.score, defaults_.sync_unavailable_score);
    EXPECT_TRUE(result.degraded);
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0].kind, IssueKind::SYNC_TIMING_UNAVAILABLE);
    EXPECT_EQ(result.issues[0].severity, Severity::LOW);
}

TEST_F(SyncAnalyzerTest, MissingVideoIsInformational)
{
    SyncAnalyzer analyzer(config_, defaults_);
    AnalysisResult result = analyzer.analyze(std::nullopt, audioOfLength(30.0), metadata_);

    EXPECT_DOUBLE_EQ(result.score, defaults_.sync_unavailable_score);
    EXPECT_EQ(result.issues.size(), 1u);
}

TEST_F(SyncAnalyzerTest, FrameCountTakesPrecedenceOverContainerDuration)
{
    VideoStreamInfo info = SyntheticFrameDecoder::makeInfo(30.0, 25.0);
    info.duration_seconds = 31.0;
    EXPECT_DOUBLE_EQ(*SyncAnalyzer::videoDurationSeconds(info), 30.0);

    info.frame_count = 0;
    EXPECT_DOUBLE_EQ(*SyncAnalyzer::videoDurationSeconds(info), 31.0);

    info.duration_seconds = 0.0;
    EXPECT_FALSE(SyncAnalyzer::videoDurationSeconds(info).has_value());
}

TEST_F(SyncAnalyzerTest, TruncatedShotIsReported)
{
    ShotSpec intro;
    intro.id = "intro";
    intro.start_seconds = 0.0;
    intro.duration_seconds = 20.0;
    ShotSpec outro;
    outro.id = "outro";
    outro.start_seconds = 20.0;
    outro.duration_seconds = 15.0;
    ProjectMetadata metadata("p", {intro, outro});

    SyncAnalyzer analyzer(config_, defaults_);
    AnalysisResult result = analyzer.analyze(videoOfLength(30.0), audioOfLength(30.0), metadata);

    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0].kind, IssueKind::SYNC_SHOT_TRUNCATED);
    EXPECT_EQ(result.issues[0].severity, Severity::MEDIUM);
    EXPECT_EQ(result.issues[0].location.shot_id, "outro");
    EXPECT_DOUBLE_EQ(result.score, 1.0);
}

TEST_F(SyncAnalyzerTest, VideoShorterThanExpectedDurationIsReported)
{
    ProjectMetadata metadata("p", {}, 40.0);
    SyncAnalyzer analyzer(config_, defaults_);
    AnalysisResult result = analyzer.analyze(videoOfLength(30.0), audioOfLength(30.0), metadata);

    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0].kind, IssueKind::SYNC_DURATION_SHORT);
    EXPECT_EQ(result.issues[0].severity, Severity::MEDIUM);
    EXPECT_NEAR(*result.issues[0].location.timestamp_seconds, 30.0, 1e-9);
    EXPECT_DOUBLE_EQ(result.score, 1.0);
}

TEST_F(SyncAnalyzerTest, ExpectedDurationWithinToleranceIsAccepted)
{
    ProjectMetadata metadata("p", {}, 30.4);
    SyncAnalyzer analyzer(config_, defaults_);
    AnalysisResult result = analyzer.analyze(videoOfLength(30.0), audioOfLength(30.0), metadata);

    EXPECT_TRUE(result.issues.empty());
}

TEST_F(SyncAnalyzerTest, ShortfallIsCheckedWithoutAudioTiming)
{
    ProjectMetadata metadata("p", {}, 40.0);
    SyncAnalyzer analyzer(config_, defaults_);
    AnalysisResult result = analyzer.analyze(videoOfLength(30.0),
                                             AudioExtraction(AudioExtractionStatus::NO_AUDIO_TRACK, "none"), metadata);

    ASSERT_EQ(result.issues.size(), 2u);
    EXPECT_EQ(result.issues[0].kind, IssueKind::SYNC_TIMING_UNAVAILABLE);
    EXPECT_EQ(result.issues[1].kind, IssueKind::SYNC_DURATION_SHORT);
}

TEST_F(SyncAnalyzerTest, OffsetIssueQuotesEndOfStreamDrift)
{
    config_.max_offset_ms = 50.0;
    SyncAnalyzer analyzer(config_, defaults_);
    AnalysisResult result = analyzer.analyze(videoOfLength(30.0), audioOfLength(30.2), metadata_);

    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_NE(result.issues[0].description.find("100.0ms"), std::string::npos);
    EXPECT_NE(result.issues[0].description.find("drift of 200.0ms"), std::string::npos);
}
