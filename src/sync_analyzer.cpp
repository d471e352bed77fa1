#include "core/sync_analyzer.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace
{
    // Absorbs floating point noise when the offset equals the limit
    constexpr double kOffsetEpsilonMs = 1e-6;

    std::string formatMs(double ms)
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1fms", ms);
        return buf;
    }

    std::string formatSeconds(double seconds)
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.2fs", seconds);
        return buf;
    }
}

SyncAnalyzer::SyncAnalyzer(const SyncAnalysisConfig &config, const DegradedScoreConfig &defaults)
    : config_(config), defaults_(defaults)
{
}

std::optional<double> SyncAnalyzer::videoDurationSeconds(const std::optional<VideoStreamInfo> &video)
{
    if (!video)
    {
        return std::nullopt;
    }
    if (video->fps > 0.0 && video->frame_count > 0)
    {
        return static_cast<double>(video->frame_count) / video->fps;
    }
    if (video->duration_seconds > 0.0)
    {
        return video->duration_seconds;
    }
    return std::nullopt;
}

AnalysisResult SyncAnalyzer::analyze(const std::optional<VideoStreamInfo> &video,
                                     const AudioExtraction &audio,
                                     const ProjectMetadata &metadata) const
{
    AnalysisResult result;
    std::optional<double> video_duration = videoDurationSeconds(video);
    if (video_duration)
    {
        result.metrics["video_duration_seconds"] = *video_duration;
    }

    if (!video_duration || !audio.available() || audio.signal.sample_rate <= 0)
    {
        result.score = defaults_.sync_unavailable_score;
        result.degraded = true;
        std::string missing = !video_duration ? "video stream timing" : "audio stream timing";
        result.issues.emplace_back(IssueKind::SYNC_TIMING_UNAVAILABLE, Severity::LOW,
                                   "Synchronization not measured: no usable " + missing,
                                   IssueLocation::entireVideo());
        if (video_duration)
        {
            checkShotBoundaries(*video_duration, metadata, result);
        }
        return result;
    }

    double audio_duration = audio.signal.durationSeconds();
    double drift_ms = std::fabs(*video_duration - audio_duration) * 1000.0;
    double offset_ms = drift_ms / 2.0;
    result.metrics["audio_duration_seconds"] = audio_duration;
    result.metrics["drift_ms"] = drift_ms;
    result.metrics["offset_ms"] = offset_ms;

    double falloff_ms = config_.falloff_multiplier * config_.max_offset_ms;
    result.score = std::max(0.0, std::min(1.0, 1.0 - offset_ms / falloff_ms));

    if (offset_ms > config_.max_offset_ms + kOffsetEpsilonMs)
    {
        double end = std::min(*video_duration, audio_duration);
        result.issues.emplace_back(IssueKind::SYNC_OFFSET_EXCEEDED, Severity::CRITICAL,
                                   "Audio/video offset of " + formatMs(offset_ms) + " (mean misalignment over an end-of-stream drift of " +
                                       formatMs(drift_ms) + ") exceeds the " +
                                       formatMs(config_.max_offset_ms) + " limit (video " +
                                       formatSeconds(*video_duration) + ", audio " + formatSeconds(audio_duration) + ")",
                                   IssueLocation::at(end, metadata.shotIdAt(end)));
    }

    checkShotBoundaries(*video_duration, metadata, result);

    Logger::debug("Sync: video=" + formatSeconds(*video_duration) + " audio=" + formatSeconds(audio_duration) +
                  " offset=" + formatMs(offset_ms) + " score=" + std::to_string(result.score));
    return result;
}

void SyncAnalyzer::checkShotBoundaries(double video_duration, const ProjectMetadata &metadata, AnalysisResult &result) const
{
    const double tolerance = config_.shot_boundary_tolerance_ms / 1000.0;
    bool truncated = false;
    for (const auto &shot : metadata.shots())
    {
        if (shot.endSeconds() - video_duration > tolerance)
        {
            truncated = true;
            result.issues.emplace_back(IssueKind::SYNC_SHOT_TRUNCATED, Severity::MEDIUM,
                                       "Shot " + shot.id + " is expected to end at " + formatSeconds(shot.endSeconds()) +
                                           " but the video ends at " + formatSeconds(video_duration),
                                       IssueLocation::at(shot.start_seconds, shot.id));
        }
    }

    // A truncated shot already reports the missing tail
    double expected = metadata.expectedDurationSeconds();
    if (!truncated && expected > 0.0 && expected - video_duration > tolerance)
    {
        result.issues.emplace_back(IssueKind::SYNC_DURATION_SHORT, Severity::MEDIUM,
                                   "Video is " + formatSeconds(video_duration) + " long but the project expects " +
                                       formatSeconds(expected),
                                   IssueLocation::at(video_duration, metadata.shotIdAt(video_duration)));
    }
}
