#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Crosscheck {

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
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return static_cast<int64_t>(std::stoll(env_val));
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
            return static_cast<size_t>(std::stoull(env_val));
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
        std::transform(val.begin(), val.end(), val.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

namespace {

template<typename T>
void setIfPresent(const YAML::Node& section, const char* key, ConfigValue<T>& value) {
    if (section[key]) value.set(section[key].as<T>());
}

} // namespace

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::reset() {
    config_ = CrosscheckConfig();
    validation_errors_.clear();
}

void Configuration::applyYAML(const void* node) {
    const YAML::Node& yaml = *static_cast<const YAML::Node*>(node);
    if (!yaml["crosscheck"]) {
        LOG(WARNING) << "Configuration has no 'crosscheck' section, keeping defaults";
        return;
    }
    auto root = yaml["crosscheck"];

    if (root["run"]) {
        auto run = root["run"];
        setIfPresent(run, "chain", config_.run.chain);
        setIfPresent(run, "protocol", config_.run.protocol);
        setIfPresent(run, "start_height", config_.run.start_height);
        setIfPresent(run, "end_height", config_.run.end_height);
        setIfPresent(run, "tolerate_gaps", config_.run.tolerate_gaps);
        setIfPresent(run, "cancel_grace_ms", config_.run.cancel_grace_ms);
    }

    if (root["endpoints"]) {
        auto endpoints = root["endpoints"];
        setIfPresent(endpoints, "primary", config_.endpoints.primary);
        setIfPresent(endpoints, "secondary", config_.endpoints.secondary);
        setIfPresent(endpoints, "fetch_timeout_ms", config_.endpoints.fetch_timeout_ms);
        setIfPresent(endpoints, "tip_timeout_ms", config_.endpoints.tip_timeout_ms);
        setIfPresent(endpoints, "connect_timeout_ms", config_.endpoints.connect_timeout_ms);
        setIfPresent(endpoints, "verify_tls", config_.endpoints.verify_tls);
    }

    if (root["scheduler"]) {
        auto scheduler = root["scheduler"];
        setIfPresent(scheduler, "threads", config_.scheduler.threads);
        setIfPresent(scheduler, "reorder_window", config_.scheduler.reorder_window);
        setIfPresent(scheduler, "progress_interval", config_.scheduler.progress_interval);
    }

    if (root["retry"]) {
        auto retry = root["retry"];
        setIfPresent(retry, "max_attempts", config_.retry.max_attempts);
        setIfPresent(retry, "base_backoff_ms", config_.retry.base_backoff_ms);
        setIfPresent(retry, "max_backoff_ms", config_.retry.max_backoff_ms);
    }

    if (root["checkpoint"]) {
        setIfPresent(root["checkpoint"], "directory", config_.checkpoint.directory);
    }

    if (root["report"]) {
        auto report = root["report"];
        setIfPresent(report, "jsonl_path", config_.report.jsonl_path);
        setIfPresent(report, "bucket_size", config_.report.bucket_size);
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(&yaml);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
    return validate();
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYAML(&yaml);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
    return validate();
}

bool Configuration::validate() const {
    validation_errors_.clear();

    ChainId chain;
    if (!ParseChain(config_.run.chain.get(), chain)) {
        validation_errors_.push_back("Unknown chain '" + config_.run.chain.get() + "'");
    }
    ProtocolId protocol;
    if (!ParseProtocol(config_.run.protocol.get(), protocol)) {
        validation_errors_.push_back("Unknown protocol '" + config_.run.protocol.get() + "'");
    }

    int64_t start = config_.run.start_height.get();
    int64_t end = config_.run.end_height.get();
    if (start < -1 || end < -1) {
        validation_errors_.push_back("Heights must be non-negative (-1 leaves them unset)");
    }
    if (start >= 0 && end >= 0 && end < start) {
        validation_errors_.push_back("End height " + std::to_string(end) +
                                     " is less than start height " + std::to_string(start));
    }

    if (config_.scheduler.threads.get() < 1) {
        validation_errors_.push_back("Threads must be at least 1");
    }
    size_t window = config_.scheduler.reorder_window.get();
    if (window != 0 && window < static_cast<size_t>(std::max(config_.scheduler.threads.get(), 1))) {
        validation_errors_.push_back("Reorder window cannot be smaller than the thread count");
    }

    if (config_.endpoints.fetch_timeout_ms.get() < 1 || config_.endpoints.tip_timeout_ms.get() < 1 ||
        config_.endpoints.connect_timeout_ms.get() < 1) {
        validation_errors_.push_back("Endpoint timeouts must be positive");
    }

    if (config_.retry.max_attempts.get() < 1) {
        validation_errors_.push_back("Retry max attempts must be at least 1");
    }
    if (config_.retry.base_backoff_ms.get() < 0 ||
        config_.retry.max_backoff_ms.get() < config_.retry.base_backoff_ms.get()) {
        validation_errors_.push_back("Retry backoff must satisfy 0 <= base_backoff_ms <= max_backoff_ms");
    }

    if (config_.run.cancel_grace_ms.get() < 0) {
        validation_errors_.push_back("Cancel grace period cannot be negative");
    }
    if (config_.checkpoint.directory.get().empty()) {
        validation_errors_.push_back("Checkpoint directory must be set");
    }
    if (config_.report.bucket_size.get() == 0) {
        validation_errors_.push_back("Report bucket size must be positive");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

bool Configuration::BuildRunConfig(RunConfig& out, std::vector<std::string>& errors) const {
    if (!validate()) {
        errors = validation_errors_;
        return false;
    }

    RunConfig run;
    ParseChain(config_.run.chain.get(), run.chain);
    ParseProtocol(config_.run.protocol.get(), run.protocol);
    run.primary_endpoint = config_.endpoints.primary.get();
    run.secondary_endpoint = config_.endpoints.secondary.get();

    if (config_.run.start_height.get() >= 0) {
        run.start_height = static_cast<BlockHeight>(config_.run.start_height.get());
    }
    if (config_.run.end_height.get() >= 0) {
        run.end_height = static_cast<BlockHeight>(config_.run.end_height.get());
    }

    run.thread_count = config_.scheduler.threads.get();
    run.reorder_window = config_.scheduler.reorder_window.get();
    run.progress_interval = config_.scheduler.progress_interval.get();
    run.retry.max_attempts = config_.retry.max_attempts.get();
    run.retry.base_backoff = std::chrono::milliseconds(config_.retry.base_backoff_ms.get());
    run.retry.max_backoff = std::chrono::milliseconds(config_.retry.max_backoff_ms.get());
    run.tolerate_gaps = config_.run.tolerate_gaps.get();
    run.cancel_grace = std::chrono::milliseconds(config_.run.cancel_grace_ms.get());
    run.report_bucket_size = config_.report.bucket_size.get();

    if (!ValidateRunConfig(run, errors)) {
        return false;
    }
    out = run;
    return true;
}

} // namespace Crosscheck
