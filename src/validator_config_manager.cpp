#include "core/validator_config_manager.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <fstream>
#include <functional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

ValidatorConfigManager::ValidatorConfigManager()
{
    cfg_ = new JSONConfiguration();
}

bool ValidatorConfigManager::load(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path);
    if (!in.good())
        return false;
    try
    {
        AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
        tmp->load(in);
        cfg_ = tmp;
    }
    catch (const Poco::Exception &e)
    {
        throw ConfigurationError("Could not parse configuration file " + path + ": " + e.displayText());
    }
    Logger::info("Configuration loaded from " + path);
    return true;
}

bool ValidatorConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

nlohmann::json ValidatorConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void ValidatorConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    // Flatten and set values
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_integer())
                cfg_->setInt(prefix, node.get<int>());
            else if (node.is_number_unsigned())
                cfg_->setUInt(prefix, static_cast<unsigned>(node.get<unsigned long long>()));
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
            else
                Logger::warn("Ignoring non-scalar configuration value for key: " + prefix);
        }
    };
    apply("", patch);
}

std::string ValidatorConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int ValidatorConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

double ValidatorConfigManager::getDouble(const std::string &key, double def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getDouble(key, def);
}

bool ValidatorConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getBool(key, def);
}

ValidatorConfiguration ValidatorConfigManager::toConfiguration() const
{
    try
    {
        const ValidatorConfiguration d;
        ValidatorConfiguration c;

        c.thresholds.min_visual_coherence = getDouble("thresholds.min_visual_coherence", d.thresholds.min_visual_coherence);
        c.thresholds.min_audio_quality = getDouble("thresholds.min_audio_quality", d.thresholds.min_audio_quality);
        c.thresholds.min_sync_score = getDouble("thresholds.min_sync_score", d.thresholds.min_sync_score);
        c.thresholds.pass_threshold = getDouble("thresholds.pass_threshold", d.thresholds.pass_threshold);

        c.weights.visual = getDouble("weights.visual", d.weights.visual);
        c.weights.audio = getDouble("weights.audio", d.weights.audio);
        c.weights.sync = getDouble("weights.sync", d.weights.sync);

        c.visual.sample_count = getInt("visual.sample_count", d.visual.sample_count);
        c.visual.analysis_width = getInt("visual.analysis_width", d.visual.analysis_width);
        c.visual.local_consistency_weight = getDouble("visual.local_consistency_weight", d.visual.local_consistency_weight);
        c.visual.drift_weight = getDouble("visual.drift_weight", d.visual.drift_weight);
        c.visual.drift_threshold = getDouble("visual.drift_threshold", d.visual.drift_threshold);

        c.audio.analysis_sample_rate = getInt("audio.analysis_sample_rate", d.audio.analysis_sample_rate);
        c.audio.window_seconds = getDouble("audio.window_seconds", d.audio.window_seconds);
        c.audio.silence_threshold = getDouble("audio.silence_threshold", d.audio.silence_threshold);
        c.audio.min_gap_seconds = getDouble("audio.min_gap_seconds", d.audio.min_gap_seconds);
        c.audio.edge_tolerance_seconds = getDouble("audio.edge_tolerance_seconds", d.audio.edge_tolerance_seconds);
        c.audio.spike_ratio = getDouble("audio.spike_ratio", d.audio.spike_ratio);
        c.audio.max_tolerated_gap_seconds = getDouble("audio.max_tolerated_gap_seconds", d.audio.max_tolerated_gap_seconds);
        c.audio.max_tolerated_artifacts = getInt("audio.max_tolerated_artifacts", d.audio.max_tolerated_artifacts);
        c.audio.min_dynamic_range_db = getDouble("audio.min_dynamic_range_db", d.audio.min_dynamic_range_db);
        c.audio.max_dynamic_range_db = getDouble("audio.max_dynamic_range_db", d.audio.max_dynamic_range_db);
        c.audio.gap_weight = getDouble("audio.gap_weight", d.audio.gap_weight);
        c.audio.artifact_weight = getDouble("audio.artifact_weight", d.audio.artifact_weight);
        c.audio.dynamic_range_weight = getDouble("audio.dynamic_range_weight", d.audio.dynamic_range_weight);
        c.audio.noise_weight = getDouble("audio.noise_weight", d.audio.noise_weight);

        c.sync.max_offset_ms = getDouble("sync.max_offset_ms", d.sync.max_offset_ms);
        c.sync.falloff_multiplier = getDouble("sync.falloff_multiplier", d.sync.falloff_multiplier);
        c.sync.shot_boundary_tolerance_ms = getDouble("sync.shot_boundary_tolerance_ms", d.sync.shot_boundary_tolerance_ms);

        c.defaults.visual_degraded_score = getDouble("defaults.visual_degraded_score", d.defaults.visual_degraded_score);
        c.defaults.audio_unavailable_score = getDouble("defaults.audio_unavailable_score", d.defaults.audio_unavailable_score);
        c.defaults.sync_unavailable_score = getDouble("defaults.sync_unavailable_score", d.defaults.sync_unavailable_score);
        c.defaults.analyzer_failure_score = getDouble("defaults.analyzer_failure_score", d.defaults.analyzer_failure_score);

        c.capabilities.video_decoding = getBool("capabilities.video_decoding", d.capabilities.video_decoding);
        c.capabilities.audio_decoding = getBool("capabilities.audio_decoding", d.capabilities.audio_decoding);

        c.log_level = getString("log_level", d.log_level);
        return c;
    }
    catch (const Poco::Exception &e)
    {
        throw ConfigurationError("Invalid configuration value: " + e.displayText());
    }
}

nlohmann::json ValidatorConfigManager::toJson(const ValidatorConfiguration &c)
{
    return {
        {"thresholds",
         {{"min_visual_coherence", c.thresholds.min_visual_coherence},
          {"min_audio_quality", c.thresholds.min_audio_quality},
          {"min_sync_score", c.thresholds.min_sync_score},
          {"pass_threshold", c.thresholds.pass_threshold}}},
        {"weights",
         {{"visual", c.weights.visual},
          {"audio", c.weights.audio},
          {"sync", c.weights.sync}}},
        {"visual",
         {{"sample_count", c.visual.sample_count},
          {"analysis_width", c.visual.analysis_width},
          {"local_consistency_weight", c.visual.local_consistency_weight},
          {"drift_weight", c.visual.drift_weight},
          {"drift_threshold", c.visual.drift_threshold}}},
        {"audio",
         {{"analysis_sample_rate", c.audio.analysis_sample_rate},
          {"window_seconds", c.audio.window_seconds},
          {"silence_threshold", c.audio.silence_threshold},
          {"min_gap_seconds", c.audio.min_gap_seconds},
          {"edge_tolerance_seconds", c.audio.edge_tolerance_seconds},
          {"spike_ratio", c.audio.spike_ratio},
          {"max_tolerated_gap_seconds", c.audio.max_tolerated_gap_seconds},
          {"max_tolerated_artifacts", c.audio.max_tolerated_artifacts},
          {"min_dynamic_range_db", c.audio.min_dynamic_range_db},
          {"max_dynamic_range_db", c.audio.max_dynamic_range_db},
          {"gap_weight", c.audio.gap_weight},
          {"artifact_weight", c.audio.artifact_weight},
          {"dynamic_range_weight", c.audio.dynamic_range_weight},
          {"noise_weight", c.audio.noise_weight}}},
        {"sync",
         {{"max_offset_ms", c.sync.max_offset_ms},
          {"falloff_multiplier", c.sync.falloff_multiplier},
          {"shot_boundary_tolerance_ms", c.sync.shot_boundary_tolerance_ms}}},
        {"defaults",
         {{"visual_degraded_score", c.defaults.visual_degraded_score},
          {"audio_unavailable_score", c.defaults.audio_unavailable_score},
          {"sync_unavailable_score", c.defaults.sync_unavailable_score},
          {"analyzer_failure_score", c.defaults.analyzer_failure_score}}},
        {"capabilities",
         {{"video_decoding", c.capabilities.video_decoding},
          {"audio_decoding", c.capabilities.audio_decoding}}},
        {"log_level", c.log_level}};
}
