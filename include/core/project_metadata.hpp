#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace YAML
{
    class Node;
}

/**
 * @brief What the audio track is expected to carry during a shot
 */
enum class AudioExpectation
{
    DIALOGUE,
    MUSIC,
    AMBIENT,
    SILENT
};

/**
 * @brief One planned shot of the generated project
 */
struct ShotSpec
{
    std::string id;
    std::string sequence_id;
    double start_seconds;
    double duration_seconds;
    AudioExpectation audio;

    ShotSpec() : start_seconds(0.0), duration_seconds(0.0), audio(AudioExpectation::DIALOGUE) {}

    double endSeconds() const { return start_seconds + duration_seconds; }
};

/**
 * @brief Raised when project metadata cannot be parsed
 */
class MetadataError : public std::runtime_error
{
public:
    explicit MetadataError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Read-only project context supplied by the upstream orchestration
 *
 * Shots are kept in timeline order. A shot without an explicit start begins
 * where the previous one ended.
 */
class ProjectMetadata
{
public:
    ProjectMetadata() = default;
    ProjectMetadata(const std::string &project_name, std::vector<ShotSpec> shots, double expected_duration_seconds = 0.0);

    /**
     * @brief Parse metadata from a JSON document
     * @throws MetadataError on malformed input
     */
    static ProjectMetadata fromJson(const nlohmann::json &document);

    /**
     * @brief Parse metadata from a YAML document
     * @throws MetadataError on malformed input
     */
    static ProjectMetadata fromYaml(const YAML::Node &document);

    /**
     * @brief Load metadata from a .json, .yaml or .yml file
     * @throws MetadataError if the file is missing or malformed
     */
    static ProjectMetadata loadFromFile(const std::string &file_path);

    const std::string &projectName() const { return project_name_; }
    const std::vector<ShotSpec> &shots() const { return shots_; }
    bool hasShots() const { return !shots_.empty(); }

    /**
     * @brief Expected duration; the explicit value if given, else the end of the last shot
     */
    double expectedDurationSeconds() const;

    /**
     * @brief Find the shot containing a timestamp
     * @return Pointer to the shot, or nullptr when no shot covers it
     */
    const ShotSpec *shotAt(double seconds) const;

    /**
     * @brief Id of the shot containing a timestamp, or empty string
     */
    std::string shotIdAt(double seconds) const;

    /**
     * @brief Check whether [start, end) lies entirely within shots planned to be silent
     */
    bool isExpectedSilence(double start_seconds, double end_seconds) const;

    static AudioExpectation audioExpectationFromString(const std::string &value);
    static std::string audioExpectationName(AudioExpectation expectation);

private:
    void normalizeShots();

    std::string project_name_;
    std::vector<ShotSpec> shots_;
    double expected_duration_seconds_ = 0.0;
};
