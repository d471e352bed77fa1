#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/file_utils.hpp"

/**
 * @brief Severity of a detected issue, ordered from least to most severe
 */
enum class Severity
{
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

/**
 * @brief Signal domain an issue belongs to
 */
enum class IssueCategory
{
    VISUAL_COHERENCE,
    AUDIO_QUALITY,
    SYNCHRONIZATION
};

/**
 * @brief Closed set of issue kinds; each kind belongs to exactly one category
 */
enum class IssueKind
{
    // Visual coherence
    VISUAL_STYLE_DRIFT,
    VISUAL_INSUFFICIENT_DATA,
    VISUAL_LOW_COHERENCE,
    VISUAL_ANALYSIS_FAILED,

    // Audio quality
    AUDIO_SILENCE_GAP,
    AUDIO_SPIKE_ARTIFACT,
    AUDIO_SILENT_TRACK,
    AUDIO_UNAVAILABLE,
    AUDIO_LOW_QUALITY,
    AUDIO_ANALYSIS_FAILED,

    // Synchronization
    SYNC_OFFSET_EXCEEDED,
    SYNC_SHOT_TRUNCATED,
    SYNC_DURATION_SHORT,
    SYNC_TIMING_UNAVAILABLE,
    SYNC_LOW_SCORE,
    SYNC_ANALYSIS_FAILED
};

/**
 * @brief Stages a validation run passes through
 */
enum class ValidationStage
{
    NOT_STARTED,
    EXTRACTING_SIGNALS,
    ANALYZING,
    AGGREGATING,
    COMPLETE
};

/**
 * @brief Where in the artifact an issue was detected
 */
struct IssueLocation
{
    std::optional<double> timestamp_seconds; // Empty means the whole artifact
    std::string shot_id;                     // Shot containing the timestamp, if known

    static IssueLocation entireVideo() { return IssueLocation(); }
    static IssueLocation at(double seconds, const std::string &shot = "");

    std::string toString() const;
};

/**
 * @brief An atomic detected defect
 *
 * Analyzers create issues with an empty id; the aggregator assigns the
 * category-prefixed id (V001, A002, S003) when it merges them into a report.
 */
struct Issue
{
    std::string id;
    IssueKind kind;
    Severity severity;
    IssueCategory category;
    std::string description;
    IssueLocation location;

    Issue(IssueKind k, Severity s, const std::string &desc, const IssueLocation &loc = IssueLocation());
};

/**
 * @brief Output of one analyzer
 */
struct AnalysisResult
{
    double score;
    bool degraded;
    std::vector<Issue> issues;
    std::map<std::string, double> metrics;

    AnalysisResult() : score(0.0), degraded(false) {}
    explicit AnalysisResult(double s) : score(s), degraded(false) {}
};

/**
 * @brief Score, degradation flag and metrics of one component, as kept in a report
 */
struct ComponentSummary
{
    double score;
    bool degraded;
    std::map<std::string, double> metrics;

    ComponentSummary() : score(0.0), degraded(false) {}
};

/**
 * @brief Immutable result of one validation call
 */
class QualityReport
{
public:
    QualityReport(double overall_score,
                  const ComponentSummary &visual,
                  const ComponentSummary &audio,
                  const ComponentSummary &sync,
                  std::vector<Issue> issues,
                  std::vector<std::string> recommendations,
                  bool passed,
                  double pass_threshold,
                  const MediaArtifact &artifact);

    double overallScore() const { return overall_score_; }
    double visualCoherenceScore() const { return visual_.score; }
    double audioQualityScore() const { return audio_.score; }
    double syncScore() const { return sync_.score; }
    const std::vector<Issue> &issues() const { return issues_; }
    const std::vector<std::string> &recommendations() const { return recommendations_; }
    bool passed() const { return passed_; }
    double passThreshold() const { return pass_threshold_; }
    const MediaArtifact &artifact() const { return artifact_; }

    const ComponentSummary &visual() const { return visual_; }
    const ComponentSummary &audio() const { return audio_; }
    const ComponentSummary &sync() const { return sync_; }

    bool hasCriticalIssue() const;
    std::vector<Issue> issuesInCategory(IssueCategory category) const;

private:
    double overall_score_;
    ComponentSummary visual_;
    ComponentSummary audio_;
    ComponentSummary sync_;
    std::vector<Issue> issues_;
    std::vector<std::string> recommendations_;
    bool passed_;
    double pass_threshold_;
    MediaArtifact artifact_;
};

/**
 * @brief Raised when the media artifact is missing or unreadable
 */
class MediaAccessError : public std::runtime_error
{
public:
    explicit MediaAccessError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Raised when the caller cancels a validation run
 */
class ValidationCancelledError : public std::runtime_error
{
public:
    explicit ValidationCancelledError(const std::string &message) : std::runtime_error(message) {}
};

class QualityTypes
{
public:
    static std::string severityName(Severity severity);
    static std::string categoryName(IssueCategory category);
    static std::string categoryPrefix(IssueCategory category);
    static std::string stageName(ValidationStage stage);
    static std::string issueKindName(IssueKind kind);

    /**
     * @brief Get the category an issue kind belongs to
     */
    static IssueCategory categoryOf(IssueKind kind);
};
