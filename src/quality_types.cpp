#include "core/quality_types.hpp"
#include <algorithm>
#include <iomanip>
#include <iterator>
#include <sstream>

IssueLocation IssueLocation::at(double seconds, const std::string &shot)
{
    IssueLocation location;
    location.timestamp_seconds = seconds;
    location.shot_id = shot;
    return location;
}

std::string IssueLocation::toString() const
{
    if (!timestamp_seconds)
    {
        return shot_id.empty() ? "entire_video" : shot_id;
    }

    std::stringstream ss;
    ss << std::fixed << std::setprecision(2) << *timestamp_seconds << "s";
    if (!shot_id.empty())
    {
        ss << " (" << shot_id << ")";
    }
    return ss.str();
}

Issue::Issue(IssueKind k, Severity s, const std::string &desc, const IssueLocation &loc)
    : kind(k), severity(s), category(QualityTypes::categoryOf(k)), description(desc), location(loc)
{
}

QualityReport::QualityReport(double overall_score,
                             const ComponentSummary &visual,
                             const ComponentSummary &audio,
                             const ComponentSummary &sync,
                             std::vector<Issue> issues,
                             std::vector<std::string> recommendations,
                             bool passed,
                             double pass_threshold,
                             const MediaArtifact &artifact)
    : overall_score_(overall_score),
      visual_(visual),
      audio_(audio),
      sync_(sync),
      issues_(std::move(issues)),
      recommendations_(std::move(recommendations)),
      passed_(passed),
      pass_threshold_(pass_threshold),
      artifact_(artifact)
{
}

bool QualityReport::hasCriticalIssue() const
{
    return std::any_of(issues_.begin(), issues_.end(),
                       [](const Issue &issue)
                       { return issue.severity == Severity::CRITICAL; });
}

std::vector<Issue> QualityReport::issuesInCategory(IssueCategory category) const
{
    std::vector<Issue> result;
    std::copy_if(issues_.begin(), issues_.end(), std::back_inserter(result),
                 [category](const Issue &issue)
                 { return issue.category == category; });
    return result;
}

std::string QualityTypes::severityName(Severity severity)
{
    switch (severity)
    {
    case Severity::LOW:
        return "low";
    case Severity::MEDIUM:
        return "medium";
    case Severity::HIGH:
        return "high";
    case Severity::CRITICAL:
        return "critical";
    }
    return "low";
}

std::string QualityTypes::categoryName(IssueCategory category)
{
    switch (category)
    {
    case IssueCategory::VISUAL_COHERENCE:
        return "visual_coherence";
    case IssueCategory::AUDIO_QUALITY:
        return "audio_quality";
    case IssueCategory::SYNCHRONIZATION:
        return "synchronization";
    }
    return "visual_coherence";
}

std::string QualityTypes::categoryPrefix(IssueCategory category)
{
    switch (category)
    {
    case IssueCategory::VISUAL_COHERENCE:
        return "V";
    case IssueCategory::AUDIO_QUALITY:
        return "A";
    case IssueCategory::SYNCHRONIZATION:
        return "S";
    }
    return "V";
}

std::string QualityTypes::stageName(ValidationStage stage)
{
    switch (stage)
    {
    case ValidationStage::NOT_STARTED:
        return "NotStarted";
    case ValidationStage::EXTRACTING_SIGNALS:
        return "ExtractingSignals";
    case ValidationStage::ANALYZING:
        return "Analyzing";
    case ValidationStage::AGGREGATING:
        return "Aggregating";
    case ValidationStage::COMPLETE:
        return "Complete";
    }
    return "NotStarted";
}

std::string QualityTypes::issueKindName(IssueKind kind)
{
    switch (kind)
    {
    case IssueKind::VISUAL_STYLE_DRIFT:
        return "style_drift";
    case IssueKind::VISUAL_INSUFFICIENT_DATA:
        return "insufficient_data";
    case IssueKind::VISUAL_LOW_COHERENCE:
        return "low_visual_coherence";
    case IssueKind::VISUAL_ANALYSIS_FAILED:
        return "visual_analysis_failed";
    case IssueKind::AUDIO_SILENCE_GAP:
        return "silence_gap";
    case IssueKind::AUDIO_SPIKE_ARTIFACT:
        return "spike_artifact";
    case IssueKind::AUDIO_SILENT_TRACK:
        return "silent_track";
    case IssueKind::AUDIO_UNAVAILABLE:
        return "audio_unavailable";
    case IssueKind::AUDIO_LOW_QUALITY:
        return "low_audio_quality";
    case IssueKind::AUDIO_ANALYSIS_FAILED:
        return "audio_analysis_failed";
    case IssueKind::SYNC_OFFSET_EXCEEDED:
        return "offset_exceeded";
    case IssueKind::SYNC_SHOT_TRUNCATED:
        return "shot_truncated";
    case IssueKind::SYNC_DURATION_SHORT:
        return "duration_short";
    case IssueKind::SYNC_TIMING_UNAVAILABLE:
        return "timing_unavailable";
    case IssueKind::SYNC_LOW_SCORE:
        return "low_sync_score";
    case IssueKind::SYNC_ANALYSIS_FAILED:
        return "sync_analysis_failed";
    }
    return "unknown";
}

IssueCategory QualityTypes::categoryOf(IssueKind kind)
{
    switch (kind)
    {
    case IssueKind::VISUAL_STYLE_DRIFT:
    case IssueKind::VISUAL_INSUFFICIENT_DATA:
    case IssueKind::VISUAL_LOW_COHERENCE:
    case IssueKind::VISUAL_ANALYSIS_FAILED:
        return IssueCategory::VISUAL_COHERENCE;
    case IssueKind::AUDIO_SILENCE_GAP:
    case IssueKind::AUDIO_SPIKE_ARTIFACT:
    case IssueKind::AUDIO_SILENT_TRACK:
    case IssueKind::AUDIO_UNAVAILABLE:
    case IssueKind::AUDIO_LOW_QUALITY:
    case IssueKind::AUDIO_ANALYSIS_FAILED:
        return IssueCategory::AUDIO_QUALITY;
    case IssueKind::SYNC_OFFSET_EXCEEDED:
    case IssueKind::SYNC_SHOT_TRUNCATED:
    case IssueKind::SYNC_DURATION_SHORT:
    case IssueKind::SYNC_TIMING_UNAVAILABLE:
    case IssueKind::SYNC_LOW_SCORE:
    case IssueKind::SYNC_ANALYSIS_FAILED:
        return IssueCategory::SYNCHRONIZATION;
    }
    return IssueCategory::VISUAL_COHERENCE;
}
