#pragma once

#include <chrono>
#include <string>

#include <curl/curl.h>

#include "endpoint.h"
#include "receipt_decoder.h"

namespace Crosscheck {

struct HttpEndpointOptions {
    std::chrono::milliseconds fetch_timeout{30000};
    std::chrono::milliseconds info_timeout{10000};
    std::chrono::milliseconds connect_timeout{3000};
    bool verify_tls = false;
};

/**
 * Indexer reached over its REST API:
 *   GET /api/v1/node/info
 *   GET /blockhash/{height}
 *   GET /api/v1/{ord|brc20}/block/{hash}/events
 * Every call uses its own curl handle, so one instance serves all workers.
 * curl_global_init() must have run before the first call.
 */
class HttpIndexerEndpoint : public IIndexerEndpoint {
public:
    HttpIndexerEndpoint(const std::string& base_url, HttpEndpointOptions options);

    const std::string& Name() const override { return base_url_; }

    FetchStatus FetchBlockReceipts(ChainId chain, ProtocolId protocol, BlockHeight height,
                                   Receipts& receipts, std::string& error,
                                   const std::atomic<bool>& abort) override;
    FetchStatus GetChainTip(ChainId chain, BlockHeight& tip, std::string& error) override;
    FetchStatus GetNetwork(std::string& network, std::string& error) override;

private:
    static size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata);
    static int ProgressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                                curl_off_t ultotal, curl_off_t ulnow);

    // abort may be null for calls that cannot be interrupted.
    FetchStatus Get(const std::string& path, std::chrono::milliseconds timeout,
                    const std::atomic<bool>* abort, std::string& body, std::string& error) const;
    FetchStatus GetBlockHash(BlockHeight height, const std::atomic<bool>& abort,
                             std::string& hash, std::string& error) const;
    FetchStatus GetNodeInfo(NodeInfo& info, std::string& error) const;

    std::string base_url_;
    HttpEndpointOptions options_;
};

} // namespace Crosscheck
