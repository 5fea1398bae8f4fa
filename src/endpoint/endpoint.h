#pragma once

#include <atomic>
#include <string>

#include "../common/types.h"
#include "../comparator/receipts.h"

namespace Crosscheck {

enum class FetchStatus {
    OK,
    TIMEOUT,
    UNAVAILABLE,
    INVALID_RESPONSE,
    CANCELLED          // the caller's abort flag was raised mid-call
};

const char* FetchStatusName(FetchStatus status);

// Timeouts and unavailability are retried; malformed responses are not.
inline bool IsTransient(FetchStatus status) {
    return status == FetchStatus::TIMEOUT || status == FetchStatus::UNAVAILABLE;
}

/**
 * Read-only access to one indexer. Implementations must be safe to call
 * concurrently from scheduler workers, and must not retry internally:
 * retry and backoff belong to the scheduler.
 */
class IIndexerEndpoint {
public:
    virtual ~IIndexerEndpoint() = default;

    // Identifies the endpoint in logs and checkpoint keys (usually the base URL).
    virtual const std::string& Name() const = 0;

    // Returns CANCELLED soon after abort becomes true, even while waiting on the network.
    virtual FetchStatus FetchBlockReceipts(ChainId chain, ProtocolId protocol, BlockHeight height,
                                           Receipts& receipts, std::string& error,
                                           const std::atomic<bool>& abort) = 0;

    virtual FetchStatus GetChainTip(ChainId chain, BlockHeight& tip, std::string& error) = 0;

    // Lower-case network name the indexer serves ("bitcoin", "fractal").
    virtual FetchStatus GetNetwork(std::string& network, std::string& error) = 0;
};

} // namespace Crosscheck
