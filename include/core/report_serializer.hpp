#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "core/quality_types.hpp"

/**
 * @brief JSON rendering of quality reports
 */
class ReportSerializer
{
public:
    static nlohmann::json toJson(const QualityReport &report);
    static nlohmann::json issueToJson(const Issue &issue);

    /**
     * @brief Render a report as JSON text; bytes that are not valid UTF-8 are replaced
     */
    static std::string toString(const QualityReport &report, int indent = 2);

    /**
     * @brief Write a report to a file
     * @return false if the file cannot be written
     */
    static bool writeToFile(const QualityReport &report, const std::string &file_path, int indent = 2);
};
