#ifndef SEASTITCH_CONFIGURATION_H_
#define SEASTITCH_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace YAML {
class Node;
}

namespace Seastitch {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

struct LoggerConfig {
    std::string prefix;
    bool strip_files = false;
};

/**
 * Main configuration structure. Relative paths are taken relative to the
 * mission directory.
 */
struct SeastitchConfig {
    struct Mission {
        // 0: derive from the mission directory name (sgNNN)
        ConfigValue<int> instrument_id{0, "SEASTITCH_INSTRUMENT_ID"};
        ConfigValue<std::string> cache_file{"processed_files.cache", "SEASTITCH_CACHE_FILE"};
        ConfigValue<std::string> lock_file{".seastitch_lock", "SEASTITCH_LOCK_FILE"};
        ConfigValue<std::string> alert_file{"seastitch_alerts.log", "SEASTITCH_ALERT_FILE"};
        // Repaired fragments and trial decompressions
        ConfigValue<std::string> scratch_dir{".seastitch_scratch", "SEASTITCH_SCRATCH_DIR"};
    } mission;

    struct Fragments {
        ConfigValue<size_t> default_fragment_size{8192, "SEASTITCH_FRAGMENT_SIZE"};
        ConfigValue<std::string> transfer_manifest{"transfer.yml", "SEASTITCH_TRANSFER_MANIFEST"};
    } fragments;

    struct Guard {
        // How long to wait for a previous invocation to honour SIGUSR1
        ConfigValue<int> stop_timeout_sec{60, "SEASTITCH_STOP_TIMEOUT"};
        ConfigValue<int> poll_interval_ms{1000, "SEASTITCH_POLL_INTERVAL_MS"};
    } guard;

    std::vector<LoggerConfig> loggers;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Back to built-in defaults
    void reset() { config_ = SeastitchConfig{}; validation_errors_.clear(); }

    // Get the configuration
    const SeastitchConfig& config() const { return config_; }
    SeastitchConfig& config() { return config_; }

    // Helper methods for common access patterns
    int getInstrumentId() const { return config_.mission.instrument_id.get(); }
    size_t getDefaultFragmentSize() const { return config_.fragments.default_fragment_size.get(); }
    int getStopTimeoutSec() const { return config_.guard.stop_timeout_sec.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    SeastitchConfig config_;
    mutable std::vector<std::string> validation_errors_;

    // Helper methods for parsing
    void parseYAMLNode(const YAML::Node& yaml);
    bool validateConfig();
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Seastitch

#endif // SEASTITCH_CONFIGURATION_H_
