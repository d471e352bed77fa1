#pragma once

#include <vector>
#include <opencv2/core.hpp>
#include "core/frame_sampler.hpp"
#include "core/project_metadata.hpp"
#include "core/quality_types.hpp"
#include "core/validator_config.hpp"

/**
 * @brief Measures whether the color style of the artifact stays consistent
 *
 * Each sampled frame is reduced to a normalized 8x8x8 BGR histogram.
 * Adjacent samples give the local consistency, the first and last samples
 * give the global drift.
 *
 * Metrics: local_consistency, global_similarity, drift, sampled_frames.
 */
class VisualCoherenceAnalyzer
{
public:
    VisualCoherenceAnalyzer(const VisualAnalysisConfig &config, const DegradedScoreConfig &defaults);

    /**
     * @brief Consume a frame sequence and score it
     */
    AnalysisResult analyze(FrameSequence &frames, const ProjectMetadata &metadata) const;

    /**
     * @brief Score an already decoded set of frames in timeline order
     */
    AnalysisResult analyzeFrames(const std::vector<SampledFrame> &frames, const ProjectMetadata &metadata) const;

    static cv::Mat colorHistogram(const cv::Mat &image);

    /**
     * @brief Histogram correlation clamped to [0, 1]
     */
    static double histogramSimilarity(const cv::Mat &a, const cv::Mat &b);

private:
    VisualAnalysisConfig config_;
    DegradedScoreConfig defaults_;
};
