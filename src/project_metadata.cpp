#include "core/project_metadata.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <fstream>

namespace
{
    constexpr double kUnsetStart = -1.0;

    ShotSpec makeShot(const std::string &id, const std::string &sequence_id, double start,
                      double duration, const std::string &audio, size_t index)
    {
        if (duration < 0.0)
        {
            throw MetadataError("Shot " + std::to_string(index) + " has a negative duration");
        }
        ShotSpec shot;
        shot.id = id.empty() ? "shot_" + std::to_string(index + 1) : id;
        shot.sequence_id = sequence_id;
        shot.start_seconds = start;
        shot.duration_seconds = duration;
        shot.audio = ProjectMetadata::audioExpectationFromString(audio);
        return shot;
    }
}

ProjectMetadata::ProjectMetadata(const std::string &project_name, std::vector<ShotSpec> shots, double expected_duration_seconds)
    : project_name_(project_name), shots_(std::move(shots)), expected_duration_seconds_(expected_duration_seconds)
{
    normalizeShots();
}

ProjectMetadata ProjectMetadata::fromJson(const nlohmann::json &document)
{
    if (!document.is_object())
    {
        throw MetadataError("Project metadata must be a JSON object");
    }

    try
    {
        std::vector<ShotSpec> shots;
        if (document.contains("shots"))
        {
            const auto &shot_list = document.at("shots");
            if (!shot_list.is_array())
            {
                throw MetadataError("'shots' must be an array");
            }
            for (size_t i = 0; i < shot_list.size(); ++i)
            {
                const auto &node = shot_list[i];
                shots.push_back(makeShot(node.value("id", std::string()),
                                         node.value("sequence_id", std::string()),
                                         node.value("start_seconds", kUnsetStart),
                                         node.value("duration_seconds", 0.0),
                                         node.value("audio", std::string("dialogue")),
                                         i));
            }
        }

        return ProjectMetadata(document.value("project_name", std::string()),
                               std::move(shots),
                               document.value("expected_duration_seconds", 0.0));
    }
    catch (const nlohmann::json::exception &e)
    {
        throw MetadataError(std::string("Invalid project metadata: ") + e.what());
    }
}

ProjectMetadata ProjectMetadata::fromYaml(const YAML::Node &document)
{
    if (!document.IsMap())
    {
        throw MetadataError("Project metadata must be a YAML mapping");
    }

    try
    {
        std::vector<ShotSpec> shots;
        if (document["shots"])
        {
            const YAML::Node shot_list = document["shots"];
            if (!shot_list.IsSequence())
            {
                throw MetadataError("'shots' must be a sequence");
            }
            for (size_t i = 0; i < shot_list.size(); ++i)
            {
                const YAML::Node node = shot_list[i];
                shots.push_back(makeShot(node["id"].as<std::string>(""),
                                         node["sequence_id"].as<std::string>(""),
                                         node["start_seconds"].as<double>(kUnsetStart),
                                         node["duration_seconds"].as<double>(0.0),
                                         node["audio"].as<std::string>("dialogue"),
                                         i));
            }
        }

        return ProjectMetadata(document["project_name"].as<std::string>(""),
                               std::move(shots),
                               document["expected_duration_seconds"].as<double>(0.0));
    }
    catch (const YAML::Exception &e)
    {
        throw MetadataError(std::string("Invalid project metadata: ") + e.what());
    }
}

ProjectMetadata ProjectMetadata::loadFromFile(const std::string &file_path)
{
    std::ifstream in(file_path);
    if (!in.good())
    {
        throw MetadataError("Could not open project metadata file: " + file_path);
    }

    std::string ext = FileUtils::getFileExtension(file_path);
    Logger::debug("Loading project metadata from " + file_path);
    if (ext == "yaml" || ext == "yml")
    {
        try
        {
            return fromYaml(YAML::Load(in));
        }
        catch (const YAML::Exception &e)
        {
            throw MetadataError("Could not parse " + file_path + ": " + e.what());
        }
    }

    try
    {
        return fromJson(nlohmann::json::parse(in));
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw MetadataError("Could not parse " + file_path + ": " + e.what());
    }
}

double ProjectMetadata::expectedDurationSeconds() const
{
    if (expected_duration_seconds_ > 0.0)
    {
        return expected_duration_seconds_;
    }
    if (shots_.empty())
    {
        return 0.0;
    }
    return shots_.back().endSeconds();
}

const ShotSpec *ProjectMetadata::shotAt(double seconds) const
{
    for (const auto &shot : shots_)
    {
        if (seconds >= shot.start_seconds && seconds < shot.endSeconds())
        {
            return &shot;
        }
    }
    // The very end of the timeline belongs to the last shot
    if (!shots_.empty() && seconds >= shots_.back().start_seconds && seconds <= shots_.back().endSeconds())
    {
        return &shots_.back();
    }
    return nullptr;
}

std::string ProjectMetadata::shotIdAt(double seconds) const
{
    const ShotSpec *shot = shotAt(seconds);
    return shot ? shot->id : "";
}

bool ProjectMetadata::isExpectedSilence(double start_seconds, double end_seconds) const
{
    if (shots_.empty() || end_seconds <= start_seconds)
    {
        return false;
    }

    double covered_until = start_seconds;
    for (const auto &shot : shots_)
    {
        if (shot.endSeconds() <= covered_until || shot.start_seconds > covered_until)
        {
            continue;
        }
        if (shot.audio != AudioExpectation::SILENT)
        {
            return false;
        }
        covered_until = shot.endSeconds();
        if (covered_until >= end_seconds)
        {
            return true;
        }
    }
    return false;
}

AudioExpectation ProjectMetadata::audioExpectationFromString(const std::string &value)
{
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), ::tolower);
    if (lowered == "dialogue")
        return AudioExpectation::DIALOGUE;
    else if (lowered == "music")
        return AudioExpectation::MUSIC;
    else if (lowered == "ambient")
        return AudioExpectation::AMBIENT;
    else if (lowered == "silent" || lowered == "silence" || lowered == "none")
        return AudioExpectation::SILENT;
    throw MetadataError("Unknown audio expectation: " + value);
}

std::string ProjectMetadata::audioExpectationName(AudioExpectation expectation)
{
    switch (expectation)
    {
    case AudioExpectation::DIALOGUE:
        return "dialogue";
    case AudioExpectation::MUSIC:
        return "music";
    case AudioExpectation::AMBIENT:
        return "ambient";
    case AudioExpectation::SILENT:
        return "silent";
    }
    return "dialogue";
}

void ProjectMetadata::normalizeShots()
{
    double cursor = 0.0;
    for (auto &shot : shots_)
    {
        if (shot.start_seconds < 0.0)
        {
            shot.start_seconds = cursor;
        }
        cursor = shot.endSeconds();
    }
    std::stable_sort(shots_.begin(), shots_.end(),
                     [](const ShotSpec &a, const ShotSpec &b)
                     { return a.start_seconds < b.start_seconds; });
}
