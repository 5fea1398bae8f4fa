#ifndef CROSSCHECK_TEST_TEST_UTILS_H_
#define CROSSCHECK_TEST_TEST_UTILS_H_

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "../src/checkpoint/checkpoint_store.h"
#include "../src/endpoint/endpoint.h"
#include "../src/report/report_sink.h"

namespace Crosscheck {
namespace testing_util {

inline InscriptionEvent Inscription(const std::string& id, const std::string& txid,
                                    const std::string& owner, uint64_t sequence = 0) {
    InscriptionEvent event;
    event.inscription_id = id;
    event.txid = txid;
    event.owner = owner;
    event.content_hash = "hash-" + id;
    event.sequence = sequence;
    return event;
}

inline Brc20Event Brc20(const std::string& ticker, const std::string& txid, Brc20Operation op,
                        const std::string& from, const std::string& to, const std::string& amount) {
    Brc20Event event;
    event.ticker = ticker;
    event.txid = txid;
    event.op = op;
    event.from = from;
    event.to = to;
    event.amount = amount;
    return event;
}

/**
 * Scripted indexer. Unscripted heights return empty receipts of the
 * endpoint's protocol. Thread-safe.
 */
class FakeEndpoint : public IIndexerEndpoint {
public:
    explicit FakeEndpoint(std::string name, ProtocolId protocol = ProtocolId::ORDINAL)
        : name_(std::move(name)), protocol_(protocol) {}

    const std::string& Name() const override { return name_; }

    void SetReceipts(BlockHeight height, Receipts receipts) {
        std::lock_guard<std::mutex> lock(mu_);
        receipts_[height] = std::move(receipts);
    }
    void SetDelay(BlockHeight height, std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mu_);
        delays_[height] = delay;
    }
    // The next `times` fetches of height fail with status.
    void FailTimes(BlockHeight height, int times, FetchStatus status = FetchStatus::UNAVAILABLE) {
        std::lock_guard<std::mutex> lock(mu_);
        failures_[height] = {times, status};
    }
    // Every fetch at or above height fails with status.
    void FailFrom(BlockHeight height, FetchStatus status = FetchStatus::UNAVAILABLE) {
        std::lock_guard<std::mutex> lock(mu_);
        fail_from_ = height;
        fail_from_status_ = status;
    }
    void ClearFailures() {
        std::lock_guard<std::mutex> lock(mu_);
        failures_.clear();
        fail_from_.reset();
    }
    void SetTip(BlockHeight tip) { tip_ = tip; }
    void SetNetwork(const std::string& network) {
        std::lock_guard<std::mutex> lock(mu_);
        network_ = network;
    }
    // Status returned by GetNetwork and GetChainTip.
    void SetNodeStatus(FetchStatus status) { node_status_ = status; }

    FetchStatus FetchBlockReceipts(ChainId, ProtocolId, BlockHeight height,
                                   Receipts& receipts, std::string& error,
                                   const std::atomic<bool>& abort) override {
        int now = ++in_flight_;
        int seen = max_in_flight_.load();
        while (now > seen && !max_in_flight_.compare_exchange_weak(seen, now)) {
        }

        std::chrono::milliseconds delay{0};
        FetchStatus status = FetchStatus::OK;
        {
            std::lock_guard<std::mutex> lock(mu_);
            fetches_[height]++;
            auto d = delays_.find(height);
            if (d != delays_.end()) delay = d->second;
            auto f = failures_.find(height);
            if (f != failures_.end() && f->second.first > 0) {
                f->second.first--;
                status = f->second.second;
            } else if (fail_from_ && height >= *fail_from_) {
                status = fail_from_status_;
            }
            if (status == FetchStatus::OK) {
                auto r = receipts_.find(height);
                receipts = r != receipts_.end() ? r->second : EmptyReceipts(protocol_);
            }
        }
        // A delayed fetch behaves like a slow request: it ends early once aborted.
        auto deadline = std::chrono::steady_clock::now() + delay;
        while (std::chrono::steady_clock::now() < deadline) {
            if (abort.load()) {
                status = FetchStatus::CANCELLED;
                break;
            }
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
                deadline - std::chrono::steady_clock::now(), std::chrono::milliseconds(5)));
        }
        --in_flight_;
        if (status == FetchStatus::CANCELLED) {
            ++aborted_;
        }

        if (status != FetchStatus::OK) {
            error = name_ + " scripted " + FetchStatusName(status) + " at " + std::to_string(height);
        }
        return status;
    }

    FetchStatus GetChainTip(ChainId, BlockHeight& tip, std::string& error) override {
        if (node_status_ != FetchStatus::OK) {
            error = name_ + " node unavailable";
            return node_status_;
        }
        tip = tip_;
        return FetchStatus::OK;
    }

    FetchStatus GetNetwork(std::string& network, std::string& error) override {
        if (node_status_ != FetchStatus::OK) {
            error = name_ + " node unavailable";
            return node_status_;
        }
        std::lock_guard<std::mutex> lock(mu_);
        network = network_;
        return FetchStatus::OK;
    }

    int FetchCount(BlockHeight height) const {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = fetches_.find(height);
        return it == fetches_.end() ? 0 : it->second;
    }
    std::set<BlockHeight> FetchedHeights() const {
        std::lock_guard<std::mutex> lock(mu_);
        std::set<BlockHeight> heights;
        for (const auto& [height, count] : fetches_) heights.insert(height);
        return heights;
    }
    int MaxInFlight() const { return max_in_flight_.load(); }
    int AbortedFetches() const { return aborted_.load(); }

private:
    std::string name_;
    ProtocolId protocol_;

    mutable std::mutex mu_;
    std::map<BlockHeight, Receipts> receipts_;
    std::map<BlockHeight, std::chrono::milliseconds> delays_;
    std::map<BlockHeight, std::pair<int, FetchStatus>> failures_;
    std::map<BlockHeight, int> fetches_;
    std::optional<BlockHeight> fail_from_;
    FetchStatus fail_from_status_ = FetchStatus::UNAVAILABLE;
    std::string network_ = "bitcoin";

    std::atomic<BlockHeight> tip_{0};
    std::atomic<FetchStatus> node_status_{FetchStatus::OK};
    std::atomic<int> in_flight_{0};
    std::atomic<int> max_in_flight_{0};
    std::atomic<int> aborted_{0};
};

class MemoryCheckpointStore : public ICheckpointStore {
public:
    CheckpointLoad Load(const CheckpointKey& key, Checkpoint& checkpoint, std::string& error) override {
        if (!stored_) return CheckpointLoad::NOT_FOUND;
        if (stored_->key != key) {
            error = "stored for " + stored_->key.primary_endpoint + " / " + stored_->key.secondary_endpoint;
            return CheckpointLoad::FOREIGN;
        }
        checkpoint = *stored_;
        return CheckpointLoad::FOUND;
    }

    bool Save(const Checkpoint& checkpoint, std::string& error) override {
        if (fail_saves_) {
            error = "disk full";
            return false;
        }
        stored_ = checkpoint;
        saved_heights_.push_back(checkpoint.last_reconciled_height);
        return true;
    }

    void Put(const Checkpoint& checkpoint) { stored_ = checkpoint; }
    void FailSaves(bool fail) { fail_saves_ = fail; }

    std::optional<BlockHeight> LastHeight() const {
        return stored_ ? std::optional<BlockHeight>(stored_->last_reconciled_height) : std::nullopt;
    }
    const std::vector<BlockHeight>& saved_heights() const { return saved_heights_; }

private:
    std::optional<Checkpoint> stored_;
    std::vector<BlockHeight> saved_heights_;
    bool fail_saves_ = false;
};

// Keeps everything it is given; on_block runs after a block is recorded.
class RecordingSink : public IReportSink {
public:
    void OnBlock(const BlockResult& result) override {
        blocks.push_back(result);
        if (on_block) on_block(result);
    }
    void OnFinish(const RunSummary& s) override {
        summary = s;
        ++finish_count;
    }

    std::vector<BlockHeight> Heights() const {
        std::vector<BlockHeight> heights;
        for (const auto& b : blocks) heights.push_back(b.height);
        return heights;
    }

    std::vector<BlockResult> blocks;
    std::optional<RunSummary> summary;
    int finish_count = 0;
    std::function<void(const BlockResult&)> on_block;
};

} // namespace testing_util
} // namespace Crosscheck

#endif // CROSSCHECK_TEST_TEST_UTILS_H_
