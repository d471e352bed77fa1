#pragma once

#include <vector>
#include "core/media_capabilities.hpp"
#include "core/project_metadata.hpp"
#include "core/quality_types.hpp"
#include "core/validator_config.hpp"

/**
 * @brief RMS energy of one fixed-length audio window
 */
struct AudioWindow
{
    double start_seconds;
    double duration_seconds;
    double rms;
    bool silent;
};

/**
 * @brief Measures gaps, spikes, dynamic range and noise of the audio track
 *
 * The signal is cut into windows of AudioAnalysisConfig::window_seconds.
 * A window is silent when its RMS is below silence_threshold.
 *
 * - Gap: a run of silent windows longer than min_gap_seconds that is not
 *   planned silence (high severity). Runs touching either end of the track
 *   are lead-in or tail silence and count only beyond edge_tolerance_seconds.
 * - Artifact: a window louder than spike_ratio times its loudest non-silent
 *   neighbour (medium severity).
 * - Dynamic range: 20*log10(max/min) over non-silent windows, scored 1 inside
 *   [min_dynamic_range_db, max_dynamic_range_db] and proportionally less outside.
 * - Noise: standard deviation of the RMS of silent windows, relative to the
 *   silence threshold.
 *
 * Metrics: duration_seconds, gap_seconds, artifact_count, dynamic_range_db,
 * noise_level, clarity.
 */
class AudioQualityAnalyzer
{
public:
    AudioQualityAnalyzer(const AudioAnalysisConfig &config, const DegradedScoreConfig &defaults);

    AnalysisResult analyze(const AudioExtraction &extraction, const ProjectMetadata &metadata) const;

    std::vector<AudioWindow> computeWindows(const AudioSignal &signal) const;

private:
    double dynamicRangeScore(double range_db) const;

    AudioAnalysisConfig config_;
    DegradedScoreConfig defaults_;
};
