#include "http_endpoint.h"

#include <memory>

#include <curl/curl.h>
#include <glog/logging.h>

namespace Crosscheck {

namespace {

struct CurlHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;

FetchStatus StatusForCurlError(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return FetchStatus::TIMEOUT;
        case CURLE_ABORTED_BY_CALLBACK:
            return FetchStatus::CANCELLED;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_SSL_CONNECT_ERROR:
            return FetchStatus::UNAVAILABLE;
        default:
            return FetchStatus::INVALID_RESPONSE;
    }
}

std::string Trim(const std::string& value) {
    const char* whitespace = " \t\r\n";
    size_t begin = value.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(whitespace);
    return value.substr(begin, end - begin + 1);
}

} // namespace

HttpIndexerEndpoint::HttpIndexerEndpoint(const std::string& base_url, HttpEndpointOptions options)
    : base_url_(base_url), options_(options) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

size_t HttpIndexerEndpoint::WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = reinterpret_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

int HttpIndexerEndpoint::ProgressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    // Non-zero makes curl_easy_perform return CURLE_ABORTED_BY_CALLBACK.
    const auto* abort = static_cast<const std::atomic<bool>*>(clientp);
    return abort->load() ? 1 : 0;
}

FetchStatus HttpIndexerEndpoint::Get(const std::string& path, std::chrono::milliseconds timeout,
                                     const std::atomic<bool>* abort, std::string& body, std::string& error) const {
    if (abort && abort->load()) {
        error = "aborted before request (" + base_url_ + path + ")";
        return FetchStatus::CANCELLED;
    }
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        error = "curl_easy_init failed";
        return FetchStatus::UNAVAILABLE;
    }

    std::string url = base_url_ + path;
    body.clear();
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, options_.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, options_.verify_tls ? 2L : 0L);
    if (abort) {
        // libcurl calls this at least once per second, also while the connection is idle.
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, ProgressCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, const_cast<std::atomic<bool>*>(abort));
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        error = std::string(curl_easy_strerror(res)) + " (" + url + ")";
        VLOG(2) << "GET " << url << " failed: " << curl_easy_strerror(res);
        return StatusForCurlError(res);
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code >= 500 || http_code == 429 || http_code == 408) {
        error = "HTTP " + std::to_string(http_code) + " (" + url + ")";
        return FetchStatus::UNAVAILABLE;
    }
    if (http_code == 404 && path.rfind("/blockhash/", 0) == 0) {
        // The indexer has not reached this height yet.
        error = "block hash not found (" + url + ")";
        return FetchStatus::UNAVAILABLE;
    }
    if (http_code < 200 || http_code >= 300) {
        error = "HTTP " + std::to_string(http_code) + " (" + url + ")";
        return FetchStatus::INVALID_RESPONSE;
    }
    return FetchStatus::OK;
}

FetchStatus HttpIndexerEndpoint::GetBlockHash(BlockHeight height, const std::atomic<bool>& abort,
                                              std::string& hash, std::string& error) const {
    std::string body;
    FetchStatus status = Get("/blockhash/" + std::to_string(height), options_.info_timeout, &abort, body, error);
    if (status != FetchStatus::OK) {
        return status;
    }
    hash = Trim(body);
    if (hash.empty()) {
        error = "empty block hash for height " + std::to_string(height);
        return FetchStatus::INVALID_RESPONSE;
    }
    return FetchStatus::OK;
}

FetchStatus HttpIndexerEndpoint::GetNodeInfo(NodeInfo& info, std::string& error) const {
    std::string body;
    FetchStatus status = Get("/api/v1/node/info", options_.info_timeout, nullptr, body, error);
    if (status != FetchStatus::OK) {
        return status;
    }
    return ReceiptDecoder::DecodeNodeInfo(body, info, error);
}

FetchStatus HttpIndexerEndpoint::FetchBlockReceipts(ChainId chain, ProtocolId protocol, BlockHeight height,
                                                    Receipts& receipts, std::string& error,
                                                    const std::atomic<bool>& abort) {
    (void)chain;  // the indexer serves a single chain; checked once at startup
    std::string hash;
    FetchStatus status = GetBlockHash(height, abort, hash, error);
    if (status != FetchStatus::OK) {
        return status;
    }

    const char* segment = protocol == ProtocolId::ORDINAL ? "ord" : "brc20";
    std::string body;
    status = Get("/api/v1/" + std::string(segment) + "/block/" + hash + "/events",
                 options_.fetch_timeout, &abort, body, error);
    if (status != FetchStatus::OK) {
        return status;
    }
    status = ReceiptDecoder::DecodeBlockReceipts(protocol, body, receipts, error);
    if (status != FetchStatus::OK) {
        error = "height " + std::to_string(height) + " (" + hash + "): " + error;
    }
    return status;
}

FetchStatus HttpIndexerEndpoint::GetChainTip(ChainId chain, BlockHeight& tip, std::string& error) {
    (void)chain;
    NodeInfo info;
    FetchStatus status = GetNodeInfo(info, error);
    if (status == FetchStatus::OK) {
        tip = info.ord_block_height;
    }
    return status;
}

FetchStatus HttpIndexerEndpoint::GetNetwork(std::string& network, std::string& error) {
    NodeInfo info;
    FetchStatus status = GetNodeInfo(info, error);
    if (status == FetchStatus::OK) {
        network = info.network;
    }
    return status;
}

} // namespace Crosscheck
