#include <gtest/gtest.h>
#include "../../src/endpoint/http_endpoint.h"
#include "../../src/common/scoped_fd.h"
#include <arpa/inet.h>
#include <curl/curl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <atomic>
#include <chrono>
#include <thread>

using namespace Crosscheck;
using namespace std::chrono_literals;

class HttpIndexerEndpointTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    static void TearDownTestSuite() { curl_global_cleanup(); }

    static HttpEndpointOptions ShortTimeouts() {
        HttpEndpointOptions options;
        options.fetch_timeout = 500ms;
        options.info_timeout = 500ms;
        options.connect_timeout = 200ms;
        return options;
    }
};

TEST_F(HttpIndexerEndpointTest, NameDropsTrailingSlashes) {
    HttpIndexerEndpoint endpoint("http://indexer.local:8080//", ShortTimeouts());
    EXPECT_EQ(endpoint.Name(), "http://indexer.local:8080");
}

TEST_F(HttpIndexerEndpointTest, RefusedConnectionIsTransient) {
    // Nothing listens on port 1.
    HttpIndexerEndpoint endpoint("http://127.0.0.1:1", ShortTimeouts());

    std::string network;
    std::string error;
    FetchStatus status = endpoint.GetNetwork(network, error);
    EXPECT_TRUE(IsTransient(status)) << FetchStatusName(status) << ": " << error;
    EXPECT_FALSE(error.empty());

    Receipts receipts;
    std::atomic<bool> abort{false};
    status = endpoint.FetchBlockReceipts(ChainId::BITCOIN, ProtocolId::BRC20, 800000, receipts, error, abort);
    EXPECT_TRUE(IsTransient(status)) << FetchStatusName(status) << ": " << error;
}

TEST_F(HttpIndexerEndpointTest, AbortInterruptsRequestWaitingForResponse) {
    // The kernel completes the handshake from the listen backlog, but nothing
    // ever answers, so the request would otherwise run into its timeout.
    ScopedFd listener(::socket(AF_INET, SOCK_STREAM, 0));
    ASSERT_TRUE(listener.valid());
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ASSERT_EQ(::bind(listener.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    ASSERT_EQ(::listen(listener.get(), 4), 0);
    socklen_t len = sizeof(addr);
    ASSERT_EQ(::getsockname(listener.get(), reinterpret_cast<sockaddr*>(&addr), &len), 0);

    HttpEndpointOptions options;
    options.fetch_timeout = 30s;
    options.info_timeout = 30s;
    options.connect_timeout = 2s;
    HttpIndexerEndpoint endpoint("http://127.0.0.1:" + std::to_string(ntohs(addr.sin_port)), options);

    std::atomic<bool> abort{false};
    std::thread aborter([&abort]() {
        std::this_thread::sleep_for(200ms);
        abort.store(true);
    });

    auto started = std::chrono::steady_clock::now();
    Receipts receipts;
    std::string error;
    FetchStatus status = endpoint.FetchBlockReceipts(ChainId::BITCOIN, ProtocolId::ORDINAL, 800000,
                                                     receipts, error, abort);
    auto elapsed = std::chrono::steady_clock::now() - started;
    aborter.join();

    EXPECT_EQ(status, FetchStatus::CANCELLED) << error;
    EXPECT_FALSE(IsTransient(status));
    EXPECT_LT(elapsed, 5s);
}

TEST_F(HttpIndexerEndpointTest, RaisedAbortSkipsTheRequest) {
    HttpIndexerEndpoint endpoint("http://127.0.0.1:1", ShortTimeouts());
    std::atomic<bool> abort{true};
    Receipts receipts;
    std::string error;
    EXPECT_EQ(endpoint.FetchBlockReceipts(ChainId::BITCOIN, ProtocolId::ORDINAL, 800000, receipts, error, abort),
              FetchStatus::CANCELLED);
}
