#ifndef CROSSCHECK_CONFIGURATION_H_
#define CROSSCHECK_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

#include "run_config.h"

namespace Crosscheck {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), default_(default_value), env_var_(env_var) {}

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
    void reset() { value_ = default_; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    T default_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure, mirrors the `crosscheck:` YAML node.
 * Heights use -1 for "unset".
 */
struct CrosscheckConfig {
    struct Run {
        ConfigValue<std::string> chain{"bitcoin", "CROSSCHECK_CHAIN"};
        ConfigValue<std::string> protocol{"ordinal", "CROSSCHECK_PROTOCOL"};
        ConfigValue<int64_t> start_height{-1, "CROSSCHECK_START_HEIGHT"};
        ConfigValue<int64_t> end_height{-1, "CROSSCHECK_END_HEIGHT"};
        ConfigValue<bool> tolerate_gaps{false, "CROSSCHECK_TOLERATE_GAPS"};
        ConfigValue<int> cancel_grace_ms{5000, "CROSSCHECK_CANCEL_GRACE_MS"};
    } run;

    struct Endpoints {
        ConfigValue<std::string> primary{"", "CROSSCHECK_PRIMARY"};
        ConfigValue<std::string> secondary{"", "CROSSCHECK_SECONDARY"};
        ConfigValue<int> fetch_timeout_ms{30000, "CROSSCHECK_FETCH_TIMEOUT_MS"};
        ConfigValue<int> tip_timeout_ms{10000, "CROSSCHECK_TIP_TIMEOUT_MS"};
        ConfigValue<int> connect_timeout_ms{3000, "CROSSCHECK_CONNECT_TIMEOUT_MS"};
        ConfigValue<bool> verify_tls{false, "CROSSCHECK_VERIFY_TLS"};
    } endpoints;

    struct Scheduler {
        ConfigValue<int> threads{100, "CROSSCHECK_THREADS"};
        // 0 picks twice the thread count
        ConfigValue<size_t> reorder_window{0, "CROSSCHECK_REORDER_WINDOW"};
        ConfigValue<size_t> progress_interval{1000, "CROSSCHECK_PROGRESS_INTERVAL"};
    } scheduler;

    struct Retry {
        ConfigValue<int> max_attempts{5, "CROSSCHECK_RETRY_MAX_ATTEMPTS"};
        ConfigValue<int> base_backoff_ms{1000, "CROSSCHECK_RETRY_BASE_BACKOFF_MS"};
        ConfigValue<int> max_backoff_ms{16000, "CROSSCHECK_RETRY_MAX_BACKOFF_MS"};
    } retry;

    struct Checkpoint {
        ConfigValue<std::string> directory{".crosscheck", "CROSSCHECK_CHECKPOINT_DIR"};
    } checkpoint;

    struct Report {
        // Empty disables the JSON-lines report
        ConfigValue<std::string> jsonl_path{"", "CROSSCHECK_REPORT"};
        ConfigValue<size_t> bucket_size{1000, "CROSSCHECK_REPORT_BUCKET_SIZE"};
    } report;
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

    // Back to compiled-in defaults (environment overrides still apply on get()).
    void reset();

    const CrosscheckConfig& config() const { return config_; }
    CrosscheckConfig& config() { return config_; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

    // Resolved parameters for one run. Fails on unknown chain or protocol names.
    bool BuildRunConfig(RunConfig& out, std::vector<std::string>& errors) const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    CrosscheckConfig config_;
    mutable std::vector<std::string> validation_errors_;

    // Shared by loadFromFile and loadFromString; takes the parsed document root.
    void applyYAML(const void* root);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Crosscheck

#endif // CROSSCHECK_CONFIGURATION_H_
