#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "core/validator_config.hpp"

/**
 * @brief JSON-file backed store for validator settings
 *
 * Keys are dotted paths ("thresholds.pass_threshold", "audio.window_seconds").
 * Absent keys fall back to the ValidatorConfiguration defaults.
 */
class ValidatorConfigManager
{
public:
    ValidatorConfigManager();

    /**
     * @brief Load settings from a JSON file, replacing the current ones
     * @return false if the file does not exist
     * @throws ConfigurationError if the file exists but is malformed
     */
    bool load(const std::string &path);

    bool save(const std::string &path) const;

    nlohmann::json getAll() const;

    /**
     * @brief Merge a (possibly nested) JSON patch into the current settings
     */
    void update(const nlohmann::json &patch);

    // Convenience getters
    std::string getString(const std::string &key, const std::string &def) const;
    int getInt(const std::string &key, int def) const;
    double getDouble(const std::string &key, double def) const;
    bool getBool(const std::string &key, bool def) const;

    /**
     * @brief Materialize a ValidatorConfiguration from the stored settings
     */
    ValidatorConfiguration toConfiguration() const;

    /**
     * @brief Serialize a configuration into the dotted-key layout used by this store
     */
    static nlohmann::json toJson(const ValidatorConfiguration &config);

private:
    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
