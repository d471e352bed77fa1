#include "core/visual_coherence_analyzer.hpp"
#include "logging/logger.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cstdio>

namespace
{
    double clampUnit(double value)
    {
        return std::max(0.0, std::min(1.0, value));
    }

    std::string formatPercent(double value)
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.0f%%", value * 100.0);
        return buf;
    }
}

VisualCoherenceAnalyzer::VisualCoherenceAnalyzer(const VisualAnalysisConfig &config, const DegradedScoreConfig &defaults)
    : config_(config), defaults_(defaults)
{
}

AnalysisResult VisualCoherenceAnalyzer::analyze(FrameSequence &frames, const ProjectMetadata &metadata) const
{
    return analyzeFrames(frames.collect(), metadata);
}

AnalysisResult VisualCoherenceAnalyzer::analyzeFrames(const std::vector<SampledFrame> &frames, const ProjectMetadata &metadata) const
{
    AnalysisResult result;
    result.metrics["sampled_frames"] = static_cast<double>(frames.size());

    if (frames.empty())
    {
        Logger::warn("No frames available for visual analysis, using degraded score");
        result.score = defaults_.visual_degraded_score;
        result.degraded = true;
        return result;
    }

    if (frames.size() == 1)
    {
        result.score = 1.0;
        result.metrics["local_consistency"] = 1.0;
        result.metrics["global_similarity"] = 1.0;
        result.metrics["drift"] = 0.0;
        result.issues.emplace_back(IssueKind::VISUAL_INSUFFICIENT_DATA, Severity::LOW,
                                   "Only one frame could be sampled; visual coherence cannot be judged",
                                   IssueLocation::entireVideo());
        return result;
    }

    std::vector<cv::Mat> histograms;
    histograms.reserve(frames.size());
    for (const auto &frame : frames)
    {
        histograms.push_back(colorHistogram(frame.image));
    }

    double local_sum = 0.0;
    for (size_t i = 1; i < histograms.size(); ++i)
    {
        local_sum += histogramSimilarity(histograms[i - 1], histograms[i]);
    }
    double local_consistency = local_sum / static_cast<double>(histograms.size() - 1);
    double global_similarity = histogramSimilarity(histograms.front(), histograms.back());
    double drift = 1.0 - global_similarity;

    double weight_sum = config_.local_consistency_weight + config_.drift_weight;
    result.score = clampUnit((config_.local_consistency_weight * local_consistency +
                              config_.drift_weight * (1.0 - drift)) /
                             weight_sum);
    result.metrics["local_consistency"] = local_consistency;
    result.metrics["global_similarity"] = global_similarity;
    result.metrics["drift"] = drift;

    if (drift > config_.drift_threshold)
    {
        // Locate the first sample that has moved away from the opening style
        double location = (frames.front().timestamp_seconds + frames.back().timestamp_seconds) / 2.0;
        for (size_t i = 1; i < histograms.size(); ++i)
        {
            if (histogramSimilarity(histograms.front(), histograms[i]) < 1.0 - config_.drift_threshold)
            {
                location = frames[i].timestamp_seconds;
                break;
            }
        }
        result.issues.emplace_back(IssueKind::VISUAL_STYLE_DRIFT, Severity::MEDIUM,
                                   "Visual style drifts across the video (" + formatPercent(drift) +
                                       " color distribution change between first and last frame)",
                                   IssueLocation::at(location, metadata.shotIdAt(location)));
    }

    Logger::debug("Visual coherence: local=" + std::to_string(local_consistency) +
                  " drift=" + std::to_string(drift) + " score=" + std::to_string(result.score));
    return result;
}

cv::Mat VisualCoherenceAnalyzer::colorHistogram(const cv::Mat &image)
{
    cv::Mat hist;
    const int channels[] = {0, 1, 2};
    const int hist_size[] = {8, 8, 8};
    const float range[] = {0, 256};
    const float *ranges[] = {range, range, range};
    cv::calcHist(&image, 1, channels, cv::Mat(), hist, 3, hist_size, ranges);
    cv::normalize(hist, hist, 1.0, 0.0, cv::NORM_L1);
    return hist;
}

double VisualCoherenceAnalyzer::histogramSimilarity(const cv::Mat &a, const cv::Mat &b)
{
    return clampUnit(cv::compareHist(a, b, cv::HISTCMP_CORREL));
}
