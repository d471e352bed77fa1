#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "core/media_capabilities.hpp"
#include "core/project_metadata.hpp"
#include "core/quality_types.hpp"
#include "core/validator_config.hpp"

/**
 * @brief Final quality gate for a rendered artifact
 *
 * Drives frame sampling and audio decoding, fans the three analyzers out in
 * parallel and merges their results into a QualityReport. Analyzer failures
 * degrade the affected component; only an inaccessible media file, an
 * invalid configuration or cancellation escape as exceptions.
 *
 * validate() keeps no per-run state in the validator, so one instance may
 * serve concurrent calls.
 */
class QualityValidator
{
public:
    using StageCallback = std::function<void(ValidationStage)>;

    /**
     * @brief Create a validator with FFmpeg-backed or stub capabilities chosen from config.capabilities
     */
    explicit QualityValidator(const ValidatorConfiguration &config = ValidatorConfiguration());

    /**
     * @brief Create a validator with explicit capability providers
     */
    QualityValidator(const ValidatorConfiguration &config, const MediaCapabilities &capabilities);

    /**
     * @brief Validate with the validator's current default configuration
     */
    QualityReport validate(const std::string &media_path, const ProjectMetadata &metadata) const;

    /**
     * @brief Validate with a per-call configuration override
     *
     * config.capabilities is not applied per call: the decoding providers
     * chosen at construction are used, and a differing value is logged as a
     * warning.
     * @param token Optional cancellation flag; decoding handles are released before the error propagates
     * @param on_stage Optional observer called on every stage transition
     * @throws MediaAccessError if media_path is missing or unreadable
     * @throws ConfigurationError if config fails validation
     * @throws ValidationCancelledError if the token is triggered
     */
    QualityReport validate(const std::string &media_path,
                           const ProjectMetadata &metadata,
                           const ValidatorConfiguration &config,
                           const CancellationToken *token = nullptr,
                           const StageCallback &on_stage = nullptr) const;

    ValidatorConfiguration configuration() const;

    /**
     * @brief Replace the default configuration used by later calls
     *
     * Capability providers stay as selected at construction.
     */
    void setConfiguration(const ValidatorConfiguration &config);

    /**
     * @brief One recommendation per category with at least one medium-or-worse issue
     */
    static std::vector<std::string> buildRecommendations(const std::vector<Issue> &issues);

    /**
     * @brief Weighted average of the component scores, normalized by the weight sum
     */
    static double overallScore(double visual, double audio, double sync, const ComponentWeights &weights);

private:
    mutable std::mutex config_mutex_;
    ValidatorConfiguration config_;
    CapabilityConfig capability_config_;
    MediaCapabilities capabilities_;
};
