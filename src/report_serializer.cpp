#include "core/report_serializer.hpp"
#include "logging/logger.hpp"
#include <fstream>

namespace
{
    nlohmann::json componentToJson(const ComponentSummary &component)
    {
        nlohmann::json metrics = nlohmann::json::object();
        for (const auto &metric : component.metrics)
        {
            metrics[metric.first] = metric.second;
        }
        return {
            {"score", component.score},
            {"degraded", component.degraded},
            {"metrics", metrics}};
    }
}

nlohmann::json ReportSerializer::issueToJson(const Issue &issue)
{
    nlohmann::json location = {{"description", issue.location.toString()}};
    if (issue.location.timestamp_seconds)
    {
        location["timestamp_seconds"] = *issue.location.timestamp_seconds;
    }
    if (!issue.location.shot_id.empty())
    {
        location["shot_id"] = issue.location.shot_id;
    }
    return {
        {"id", issue.id},
        {"kind", QualityTypes::issueKindName(issue.kind)},
        {"severity", QualityTypes::severityName(issue.severity)},
        {"category", QualityTypes::categoryName(issue.category)},
        {"description", issue.description},
        {"location", location}};
}

nlohmann::json ReportSerializer::toJson(const QualityReport &report)
{
    nlohmann::json issues = nlohmann::json::array();
    for (const auto &issue : report.issues())
    {
        issues.push_back(issueToJson(issue));
    }

    return {
        {"artifact",
         {{"path", report.artifact().path},
          {"size_bytes", report.artifact().size_bytes},
          {"sha256", report.artifact().sha256}}},
        {"overall_score", report.overallScore()},
        {"visual_coherence_score", report.visualCoherenceScore()},
        {"audio_quality_score", report.audioQualityScore()},
        {"sync_score", report.syncScore()},
        {"passed", report.passed()},
        {"pass_threshold", report.passThreshold()},
        {"components",
         {{"visual_coherence", componentToJson(report.visual())},
          {"audio_quality", componentToJson(report.audio())},
          {"synchronization", componentToJson(report.sync())}}},
        {"issues", issues},
        {"recommendations", report.recommendations()}};
}

std::string ReportSerializer::toString(const QualityReport &report, int indent)
{
    return toJson(report).dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool ReportSerializer::writeToFile(const QualityReport &report, const std::string &file_path, int indent)
{
    std::ofstream out(file_path);
    if (!out.is_open())
    {
        Logger::error("Could not open report file for writing: " + file_path);
        return false;
    }
    out << toString(report, indent) << std::endl;
    return out.good();
}
