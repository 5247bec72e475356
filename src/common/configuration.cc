#include "configuration.h"
#include <algorithm>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Seastitch {

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoull(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::parseYAMLNode(const YAML::Node& yaml) {
    if (!yaml["seastitch"]) {
        LOG(WARNING) << "Configuration has no 'seastitch' section, keeping defaults";
        return;
    }
    auto root = yaml["seastitch"];

    // Mission
    if (root["mission"]) {
        auto mission = root["mission"];
        if (mission["instrument_id"]) config_.mission.instrument_id.set(mission["instrument_id"].as<int>());
        if (mission["cache_file"]) config_.mission.cache_file.set(mission["cache_file"].as<std::string>());
        if (mission["lock_file"]) config_.mission.lock_file.set(mission["lock_file"].as<std::string>());
        if (mission["alert_file"]) config_.mission.alert_file.set(mission["alert_file"].as<std::string>());
        if (mission["scratch_dir"]) config_.mission.scratch_dir.set(mission["scratch_dir"].as<std::string>());
    }

    // Fragments
    if (root["fragments"]) {
        auto fragments = root["fragments"];
        if (fragments["default_fragment_size"]) config_.fragments.default_fragment_size.set(fragments["default_fragment_size"].as<size_t>());
        if (fragments["transfer_manifest"]) config_.fragments.transfer_manifest.set(fragments["transfer_manifest"].as<std::string>());
    }

    // Guard
    if (root["guard"]) {
        auto guard = root["guard"];
        if (guard["stop_timeout_sec"]) config_.guard.stop_timeout_sec.set(guard["stop_timeout_sec"].as<int>());
        if (guard["poll_interval_ms"]) config_.guard.poll_interval_ms.set(guard["poll_interval_ms"].as<int>());
    }

    // Loggers
    if (root["loggers"]) {
        config_.loggers.clear();
        for (const auto& logger : root["loggers"]) {
            LoggerConfig entry;
            entry.prefix = logger["prefix"].as<std::string>();
            if (logger["strip_files"]) entry.strip_files = logger["strip_files"].as<bool>();
            config_.loggers.push_back(entry);
        }
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        parseYAMLNode(yaml);
        return validateConfig();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file: " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        parseYAMLNode(yaml);
        return validateConfig();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    // Basestation names carry the id as three digits
    if (config_.mission.instrument_id.get() < 0 || config_.mission.instrument_id.get() > 999) {
        validation_errors_.push_back("Instrument id must be between 0 and 999");
    }

    if (config_.mission.cache_file.get().empty()) {
        validation_errors_.push_back("Cache file must be set");
    }

    if (config_.mission.lock_file.get().empty()) {
        validation_errors_.push_back("Lock file must be set");
    }

    if (config_.fragments.default_fragment_size.get() == 0) {
        validation_errors_.push_back("Default fragment size must be positive");
    }

    if (config_.guard.stop_timeout_sec.get() < 0) {
        validation_errors_.push_back("Stop timeout cannot be negative");
    }

    if (config_.guard.poll_interval_ms.get() < 1) {
        validation_errors_.push_back("Poll interval must be at least 1 ms");
    }

    for (const auto& logger : config_.loggers) {
        if (logger.prefix.size() != 2) {
            validation_errors_.push_back("Logger prefix '" + logger.prefix + "' must be two characters");
        } else if (logger.prefix == "sg" || logger.prefix == "st") {
            validation_errors_.push_back("Logger prefix '" + logger.prefix + "' is reserved for the instrument");
        }
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

bool Configuration::validateConfig() {
    return validate();
}

} // namespace Seastitch
