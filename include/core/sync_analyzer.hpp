#pragma once

#include <optional>
#include "core/media_capabilities.hpp"
#include "core/project_metadata.hpp"
#include "core/quality_types.hpp"
#include "core/validator_config.hpp"

/**
 * @brief Measures timing alignment between the audio and video streams
 *
 * Video duration is frame_count / fps, audio duration is sample_count /
 * sample_rate. Their difference is the end-of-stream drift. Streams start
 * aligned and diverge linearly, so the mean misalignment reported as the
 * offset is half the drift.
 *
 * Metrics: video_duration_seconds, audio_duration_seconds, drift_ms, offset_ms.
 */
class SyncAnalyzer
{
public:
    SyncAnalyzer(const SyncAnalysisConfig &config, const DegradedScoreConfig &defaults);

    AnalysisResult analyze(const std::optional<VideoStreamInfo> &video,
                           const AudioExtraction &audio,
                           const ProjectMetadata &metadata) const;

    /**
     * @brief Implied video duration, or std::nullopt without usable timing
     */
    static std::optional<double> videoDurationSeconds(const std::optional<VideoStreamInfo> &video);

private:
    void checkShotBoundaries(double video_duration, const ProjectMetadata &metadata, AnalysisResult &result) const;

    SyncAnalysisConfig config_;
    DegradedScoreConfig defaults_;
};
