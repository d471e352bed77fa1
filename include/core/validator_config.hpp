#pragma once

#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Raised when a configuration cannot be parsed or holds out-of-range values
 */
class ConfigurationError : public std::runtime_error
{
public:
    explicit ConfigurationError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Pass/fail thresholds applied by the aggregator
 */
struct ThresholdConfig
{
    double min_visual_coherence = 0.7;
    double min_audio_quality = 0.6;
    double min_sync_score = 0.8;
    double pass_threshold = 0.7;
};

/**
 * @brief Relative weights of the component scores in the overall score
 */
struct ComponentWeights
{
    double visual = 1.0 / 3.0;
    double audio = 1.0 / 3.0;
    double sync = 1.0 / 3.0;
};

struct VisualAnalysisConfig
{
    int sample_count = 10;
    int analysis_width = 320;          // Frames are scaled to this width before histogramming
    double local_consistency_weight = 0.6;
    double drift_weight = 0.4;
    double drift_threshold = 0.3;      // Drift above this is reported
};

struct AudioAnalysisConfig
{
    int analysis_sample_rate = 16000;
    double window_seconds = 0.25;
    double silence_threshold = 0.01;   // Linear RMS amplitude
    double min_gap_seconds = 0.5;
    double edge_tolerance_seconds = 1.0; // Lead-in/tail silence up to this length is not a gap
    double spike_ratio = 4.0;          // Window RMS over loudest non-silent neighbour
    double max_tolerated_gap_seconds = 4.0;
    int max_tolerated_artifacts = 5;
    double min_dynamic_range_db = 6.0;
    double max_dynamic_range_db = 30.0;
    double gap_weight = 0.35;
    double artifact_weight = 0.25;
    double dynamic_range_weight = 0.25;
    double noise_weight = 0.15;
};

struct SyncAnalysisConfig
{
    double max_offset_ms = 100.0;
    double falloff_multiplier = 4.0;   // Score reaches zero at falloff_multiplier * max_offset_ms
    double shot_boundary_tolerance_ms = 500.0;
};

/**
 * @brief Conservative scores used when a component cannot be measured
 */
struct DegradedScoreConfig
{
    double visual_degraded_score = 0.7;
    double audio_unavailable_score = 0.7;
    double sync_unavailable_score = 0.85;
    double analyzer_failure_score = 0.5;
};

struct CapabilityConfig
{
    bool video_decoding = true;
    bool audio_decoding = true;
};

/**
 * @brief Every tunable of a validation run
 *
 * A plain value: the validator copies it per call and never mutates it.
 */
struct ValidatorConfiguration
{
    ThresholdConfig thresholds;
    ComponentWeights weights;
    VisualAnalysisConfig visual;
    AudioAnalysisConfig audio;
    SyncAnalysisConfig sync;
    DegradedScoreConfig defaults;
    CapabilityConfig capabilities;
    std::string log_level = "INFO";

    /**
     * @brief Check value ranges
     * @return Human-readable errors, empty when the configuration is usable
     */
    std::vector<std::string> validate() const;

    bool isValid() const { return validate().empty(); }
};
