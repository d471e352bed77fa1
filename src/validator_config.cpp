#include "core/validator_config.hpp"
#include "logging/logger.hpp"

namespace
{
    void requireUnit(std::vector<std::string> &errors, const std::string &name, double value)
    {
        if (value < 0.0 || value > 1.0)
        {
            errors.push_back(name + " must be within [0, 1], got " + std::to_string(value));
        }
    }

    void requirePositive(std::vector<std::string> &errors, const std::string &name, double value)
    {
        if (!(value > 0.0))
        {
            errors.push_back(name + " must be positive, got " + std::to_string(value));
        }
    }

    void requireNonNegative(std::vector<std::string> &errors, const std::string &name, double value)
    {
        if (value < 0.0)
        {
            errors.push_back(name + " must not be negative, got " + std::to_string(value));
        }
    }
}

std::vector<std::string> ValidatorConfiguration::validate() const
{
    std::vector<std::string> errors;

    requireUnit(errors, "thresholds.min_visual_coherence", thresholds.min_visual_coherence);
    requireUnit(errors, "thresholds.min_audio_quality", thresholds.min_audio_quality);
    requireUnit(errors, "thresholds.min_sync_score", thresholds.min_sync_score);
    requireUnit(errors, "thresholds.pass_threshold", thresholds.pass_threshold);

    requireNonNegative(errors, "weights.visual", weights.visual);
    requireNonNegative(errors, "weights.audio", weights.audio);
    requireNonNegative(errors, "weights.sync", weights.sync);
    if (weights.visual + weights.audio + weights.sync <= 0.0)
    {
        errors.push_back("at least one component weight must be positive");
    }

    if (visual.sample_count < 1)
    {
        errors.push_back("visual.sample_count must be at least 1");
    }
    if (visual.analysis_width < 16)
    {
        errors.push_back("visual.analysis_width must be at least 16");
    }
    requireNonNegative(errors, "visual.local_consistency_weight", visual.local_consistency_weight);
    requireNonNegative(errors, "visual.drift_weight", visual.drift_weight);
    if (visual.local_consistency_weight + visual.drift_weight <= 0.0)
    {
        errors.push_back("visual weights must not both be zero");
    }
    requireUnit(errors, "visual.drift_threshold", visual.drift_threshold);

    if (audio.analysis_sample_rate < 1000)
    {
        errors.push_back("audio.analysis_sample_rate must be at least 1000");
    }
    requirePositive(errors, "audio.window_seconds", audio.window_seconds);
    requirePositive(errors, "audio.silence_threshold", audio.silence_threshold);
    requireNonNegative(errors, "audio.min_gap_seconds", audio.min_gap_seconds);
    requireNonNegative(errors, "audio.edge_tolerance_seconds", audio.edge_tolerance_seconds);
    if (audio.spike_ratio <= 1.0)
    {
        errors.push_back("audio.spike_ratio must be greater than 1");
    }
    requirePositive(errors, "audio.max_tolerated_gap_seconds", audio.max_tolerated_gap_seconds);
    if (audio.max_tolerated_artifacts < 1)
    {
        errors.push_back("audio.max_tolerated_artifacts must be at least 1");
    }
    requirePositive(errors, "audio.min_dynamic_range_db", audio.min_dynamic_range_db);
    if (audio.max_dynamic_range_db < audio.min_dynamic_range_db)
    {
        errors.push_back("audio.max_dynamic_range_db must not be below audio.min_dynamic_range_db");
    }
    requireNonNegative(errors, "audio.gap_weight", audio.gap_weight);
    requireNonNegative(errors, "audio.artifact_weight", audio.artifact_weight);
    requireNonNegative(errors, "audio.dynamic_range_weight", audio.dynamic_range_weight);
    requireNonNegative(errors, "audio.noise_weight", audio.noise_weight);
    if (audio.gap_weight + audio.artifact_weight + audio.dynamic_range_weight + audio.noise_weight <= 0.0)
    {
        errors.push_back("audio weights must not all be zero");
    }

    requirePositive(errors, "sync.max_offset_ms", sync.max_offset_ms);
    if (sync.falloff_multiplier < 1.0)
    {
        errors.push_back("sync.falloff_multiplier must be at least 1");
    }
    requireNonNegative(errors, "sync.shot_boundary_tolerance_ms", sync.shot_boundary_tolerance_ms);

    requireUnit(errors, "defaults.visual_degraded_score", defaults.visual_degraded_score);
    requireUnit(errors, "defaults.audio_unavailable_score", defaults.audio_unavailable_score);
    requireUnit(errors, "defaults.sync_unavailable_score", defaults.sync_unavailable_score);
    requireUnit(errors, "defaults.analyzer_failure_score", defaults.analyzer_failure_score);

    if (!Logger::isValidLevel(log_level))
    {
        errors.push_back("log_level must be one of TRACE, DEBUG, INFO, WARN, ERROR");
    }

    return errors;
}
