#include "core/quality_validator.hpp"
#include "core/audio_extractor.hpp"
#include "core/audio_quality_analyzer.hpp"
#include "core/file_utils.hpp"
#include "core/frame_sampler.hpp"
#include "core/sync_analyzer.hpp"
#include "core/visual_coherence_analyzer.hpp"
#include "logging/logger.hpp"
#include <tbb/task_group.h>
#include <algorithm>
#include <cstdio>
#include <map>
#include <optional>

namespace
{
    void enterStage(ValidationStage stage, const QualityValidator::StageCallback &on_stage)
    {
        Logger::debug("Validation stage: " + QualityTypes::stageName(stage));
        if (on_stage)
        {
            on_stage(stage);
        }
    }

    // Runs one analyzer; any failure other than cancellation becomes a degraded result
    template <typename Analysis>
    AnalysisResult runAnalyzer(IssueKind failure_kind, double failure_score, Analysis analysis)
    {
        try
        {
            return analysis();
        }
        catch (const ValidationCancelledError &)
        {
            throw;
        }
        catch (const std::exception &e)
        {
            std::string category = QualityTypes::categoryName(QualityTypes::categoryOf(failure_kind));
            Logger::error("Analyzer failure in " + category + ": " + e.what());
            AnalysisResult failed(failure_score);
            failed.degraded = true;
            failed.issues.emplace_back(failure_kind, Severity::LOW,
                                       "Analysis could not be completed: " + std::string(e.what()),
                                       IssueLocation::entireVideo());
            return failed;
        }
    }

    std::string formatScore(double score)
    {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%.2f", score);
        return buf;
    }

    void appendComponent(const AnalysisResult &result, double minimum, IssueKind low_kind,
                         const std::string &label, std::vector<Issue> &issues)
    {
        issues.insert(issues.end(), result.issues.begin(), result.issues.end());
        if (result.score < minimum)
        {
            issues.emplace_back(low_kind, Severity::MEDIUM,
                                "Low " + label + " score: " + formatScore(result.score) +
                                    " is below the minimum of " + formatScore(minimum),
                                IssueLocation::entireVideo());
        }
    }

    ComponentSummary summarize(const AnalysisResult &result)
    {
        ComponentSummary summary;
        summary.score = result.score;
        summary.degraded = result.degraded;
        summary.metrics = result.metrics;
        return summary;
    }
}

QualityValidator::QualityValidator(const ValidatorConfiguration &config)
    : config_(config), capability_config_(config.capabilities),
      capabilities_(MediaCapabilities::fromConfig(config.capabilities))
{
}

QualityValidator::QualityValidator(const ValidatorConfiguration &config, const MediaCapabilities &capabilities)
    : config_(config), capability_config_(config.capabilities), capabilities_(capabilities)
{
    if (!capabilities_.frames)
    {
        capabilities_.frames = std::make_shared<UnavailableFrameDecoder>();
    }
    if (!capabilities_.audio)
    {
        capabilities_.audio = std::make_shared<UnavailableAudioDecoder>();
    }
}

ValidatorConfiguration QualityValidator::configuration() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void QualityValidator::setConfiguration(const ValidatorConfiguration &config)
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = config;
}

QualityReport QualityValidator::validate(const std::string &media_path, const ProjectMetadata &metadata) const
{
    return validate(media_path, metadata, configuration());
}

QualityReport QualityValidator::validate(const std::string &media_path,
                                         const ProjectMetadata &metadata,
                                         const ValidatorConfiguration &config,
                                         const CancellationToken *token,
                                         const StageCallback &on_stage) const
{
    enterStage(ValidationStage::NOT_STARTED, on_stage);

    std::vector<std::string> config_errors = config.validate();
    if (!config_errors.empty())
    {
        throw ConfigurationError("Invalid validator configuration: " + config_errors.front());
    }

    if (config.capabilities.video_decoding != capability_config_.video_decoding ||
        config.capabilities.audio_decoding != capability_config_.audio_decoding)
    {
        Logger::warn("Per-call capability settings are ignored; decoders were selected when the validator was created");
    }

    std::optional<MediaArtifact> artifact = FileUtils::describeArtifact(media_path);
    if (!artifact)
    {
        Logger::error("Media file does not exist or is not readable: " + media_path);
        throw MediaAccessError("Media file does not exist or is not readable: " + media_path);
    }
    if (!FileUtils::isSupportedContainer(media_path))
    {
        Logger::warn("Unrecognized container extension for " + media_path + ", decoding will be attempted anyway");
    }
    Logger::info("Validating " + media_path + " (" + std::to_string(artifact->size_bytes) + " bytes)");

    // Signal extraction
    enterStage(ValidationStage::EXTRACTING_SIGNALS, on_stage);
    if (token)
    {
        token->throwIfCancelled("signal extraction");
    }
    std::optional<VideoStreamInfo> video_info = capabilities_.frames->probe(media_path);
    FrameSampler sampler(capabilities_.frames, config.visual.analysis_width);
    FrameSequence frames = sampler.sample(media_path, config.visual.sample_count, token);
    AudioExtractor extractor(capabilities_.audio, config.audio.analysis_sample_rate);
    AudioExtraction audio = extractor.extract(media_path, token);

    // Independent analyzers
    enterStage(ValidationStage::ANALYZING, on_stage);
    AnalysisResult visual_result, audio_result, sync_result;
    const double failure_score = config.defaults.analyzer_failure_score;
    tbb::task_group group;
    group.run([&]()
              { visual_result = runAnalyzer(IssueKind::VISUAL_ANALYSIS_FAILED, failure_score, [&]()
                                            { return VisualCoherenceAnalyzer(config.visual, config.defaults).analyze(frames, metadata); }); });
    group.run([&]()
              { audio_result = runAnalyzer(IssueKind::AUDIO_ANALYSIS_FAILED, failure_score, [&]()
                                           { return AudioQualityAnalyzer(config.audio, config.defaults).analyze(audio, metadata); }); });
    group.run([&]()
              { sync_result = runAnalyzer(IssueKind::SYNC_ANALYSIS_FAILED, failure_score, [&]()
                                          { return SyncAnalyzer(config.sync, config.defaults).analyze(video_info, audio, metadata); }); });
    group.wait();
    if (token)
    {
        token->throwIfCancelled("analysis");
    }

    // Aggregation
    enterStage(ValidationStage::AGGREGATING, on_stage);
    std::vector<Issue> issues;
    appendComponent(visual_result, config.thresholds.min_visual_coherence, IssueKind::VISUAL_LOW_COHERENCE, "visual coherence", issues);
    appendComponent(audio_result, config.thresholds.min_audio_quality, IssueKind::AUDIO_LOW_QUALITY, "audio quality", issues);
    appendComponent(sync_result, config.thresholds.min_sync_score, IssueKind::SYNC_LOW_SCORE, "synchronization", issues);

    std::map<IssueCategory, int> counters;
    for (auto &issue : issues)
    {
        char id[16];
        std::snprintf(id, sizeof(id), "%03d", ++counters[issue.category]);
        issue.id = QualityTypes::categoryPrefix(issue.category) + id;
    }

    double overall = overallScore(visual_result.score, audio_result.score, sync_result.score, config.weights);
    bool has_critical = std::any_of(issues.begin(), issues.end(), [](const Issue &issue)
                                    { return issue.severity == Severity::CRITICAL; });
    bool passed = overall >= config.thresholds.pass_threshold && !has_critical;
    std::vector<std::string> recommendations = buildRecommendations(issues);

    QualityReport report(overall, summarize(visual_result), summarize(audio_result), summarize(sync_result),
                         std::move(issues), std::move(recommendations), passed,
                         config.thresholds.pass_threshold, *artifact);

    enterStage(ValidationStage::COMPLETE, on_stage);
    Logger::info("Validation complete for " + media_path + ": overall=" + formatScore(overall) +
                 " passed=" + (passed ? "true" : "false") +
                 " issues=" + std::to_string(report.issues().size()));
    return report;
}

double QualityValidator::overallScore(double visual, double audio, double sync, const ComponentWeights &weights)
{
    double weight_sum = weights.visual + weights.audio + weights.sync;
    if (weight_sum <= 0.0)
    {
        throw ConfigurationError("Component weights must not all be zero");
    }
    double overall = (weights.visual * visual + weights.audio * audio + weights.sync * sync) / weight_sum;
    return std::max(0.0, std::min(1.0, overall));
}

std::vector<std::string> QualityValidator::buildRecommendations(const std::vector<Issue> &issues)
{
    const IssueCategory order[] = {IssueCategory::VISUAL_COHERENCE, IssueCategory::AUDIO_QUALITY, IssueCategory::SYNCHRONIZATION};
    std::vector<std::string> recommendations;
    for (IssueCategory category : order)
    {
        int count = 0;
        Severity worst = Severity::LOW;
        for (const auto &issue : issues)
        {
            if (issue.category == category && issue.severity >= Severity::MEDIUM)
            {
                ++count;
                worst = std::max(worst, issue.severity);
            }
        }
        if (count == 0)
        {
            continue;
        }

        std::string summary = std::to_string(count) + " issue" + (count == 1 ? "" : "s") +
                              " (worst severity: " + QualityTypes::severityName(worst) + ")";
        switch (category)
        {
        case IssueCategory::VISUAL_COHERENCE:
            recommendations.push_back("Visual coherence: " + summary +
                                      ". Regenerate the affected shots with a shared style reference or apply consistent color grading.");
            break;
        case IssueCategory::AUDIO_QUALITY:
            recommendations.push_back("Audio quality: " + summary +
                                      ". Re-render the audio track, filling silence gaps and removing loudness spikes.");
            break;
        case IssueCategory::SYNCHRONIZATION:
            recommendations.push_back("Synchronization: " + summary +
                                      ". Re-mux audio and video so both streams cover the same duration.");
            break;
        }
    }
    return recommendations;
}
