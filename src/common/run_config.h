#ifndef CROSSCHECK_COMMON_RUN_CONFIG_H_
#define CROSSCHECK_COMMON_RUN_CONFIG_H_

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "types.h"

namespace Crosscheck {

/**
 * Exponential backoff for transient fetch errors.
 * Attempt n (1-based) that failed waits base * 2^(n-1), capped at max_backoff.
 */
struct RetryPolicy {
    int max_attempts = 5;
    std::chrono::milliseconds base_backoff{1000};
    std::chrono::milliseconds max_backoff{16000};

    std::chrono::milliseconds BackoffFor(int failed_attempt) const;
};

/**
 * Immutable parameters of one reconciliation run.
 */
struct RunConfig {
    ChainId chain = ChainId::BITCOIN;
    ProtocolId protocol = ProtocolId::ORDINAL;
    std::string primary_endpoint;
    std::string secondary_endpoint;

    // Unset start falls back to the protocol activation height,
    // unset end to the lowest tip reported by the two endpoints.
    std::optional<BlockHeight> start_height;
    std::optional<BlockHeight> end_height;

    int thread_count = 100;
    // Out-of-order results held before dispatch pauses. 0 selects 2 * thread_count.
    size_t reorder_window = 0;
    RetryPolicy retry;

    // Advance the checkpoint past FETCH_FAILED blocks instead of failing the run.
    bool tolerate_gaps = false;
    std::chrono::milliseconds cancel_grace{5000};
    size_t progress_interval = 1000;
    BlockHeight report_bucket_size = 1000;
};

bool ValidateRunConfig(const RunConfig& config, std::vector<std::string>& errors);

enum class RunError {
    NONE,
    INVALID_CONFIG,
    RANGE_RESOLUTION,
    NETWORK_MISMATCH,
    CHECKPOINT_IO,
    FOREIGN_CHECKPOINT,
    SCHEMA,
    FETCH_GAP
};

const char* RunErrorName(RunError error);

} // namespace Crosscheck

#endif // CROSSCHECK_COMMON_RUN_CONFIG_H_
