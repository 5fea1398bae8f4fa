#include "run_config.h"

#include <algorithm>

namespace Crosscheck {

std::chrono::milliseconds RetryPolicy::BackoffFor(int failed_attempt) const {
    if (failed_attempt < 1) {
        return std::chrono::milliseconds(0);
    }
    auto delay = base_backoff;
    for (int i = 1; i < failed_attempt && delay < max_backoff; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_backoff);
}

bool ValidateRunConfig(const RunConfig& config, std::vector<std::string>& errors) {
    errors.clear();

    if (config.primary_endpoint.empty()) {
        errors.push_back("Primary endpoint must be set");
    }
    if (config.secondary_endpoint.empty()) {
        errors.push_back("Secondary endpoint must be set");
    }
    if (!config.primary_endpoint.empty() && config.primary_endpoint == config.secondary_endpoint) {
        errors.push_back("Primary and secondary endpoints must differ");
    }
    if (config.thread_count < 1) {
        errors.push_back("Thread count must be at least 1");
    }
    if (config.reorder_window != 0 && config.reorder_window < static_cast<size_t>(std::max(config.thread_count, 1))) {
        errors.push_back("Reorder window cannot be smaller than the thread count");
    }
    if (config.retry.max_attempts < 1) {
        errors.push_back("Retry attempts must be at least 1");
    }
    if (config.retry.base_backoff.count() < 0 || config.retry.max_backoff < config.retry.base_backoff) {
        errors.push_back("Retry backoff must satisfy 0 <= base <= max");
    }
    if (config.start_height && config.end_height && *config.end_height < *config.start_height) {
        errors.push_back("End height " + std::to_string(*config.end_height) +
                         " is less than start height " + std::to_string(*config.start_height));
    }
    if (config.report_bucket_size == 0) {
        errors.push_back("Report bucket size must be positive");
    }

    return errors.empty();
}

const char* RunErrorName(RunError error) {
    switch (error) {
        case RunError::NONE: return "NONE";
        case RunError::INVALID_CONFIG: return "INVALID_CONFIG";
        case RunError::RANGE_RESOLUTION: return "RANGE_RESOLUTION";
        case RunError::NETWORK_MISMATCH: return "NETWORK_MISMATCH";
        case RunError::CHECKPOINT_IO: return "CHECKPOINT_IO";
        case RunError::FOREIGN_CHECKPOINT: return "FOREIGN_CHECKPOINT";
        case RunError::SCHEMA: return "SCHEMA";
        case RunError::FETCH_GAP: return "FETCH_GAP";
    }
    return "UNKNOWN";
}

} // namespace Crosscheck
