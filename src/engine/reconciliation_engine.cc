#include "reconciliation_engine.h"

#include <algorithm>
#include <future>
#include <thread>
#include <utility>

#include <glog/logging.h>

#include "../scheduler/block_scheduler.h"

namespace Crosscheck {

namespace {

constexpr std::chrono::milliseconds kPollSlice{100};

int64_t UnixNow() {
	return std::chrono::duration_cast<std::chrono::seconds>(
			std::chrono::system_clock::now().time_since_epoch()).count();
}

CheckpointKey KeyFor(const RunConfig& config) {
	CheckpointKey key;
	key.chain = config.chain;
	key.protocol = config.protocol;
	key.primary_endpoint = config.primary_endpoint;
	key.secondary_endpoint = config.secondary_endpoint;
	return key;
}

struct NodeQuery {
	FetchStatus status = FetchStatus::UNAVAILABLE;
	std::string network;
	BlockHeight tip = 0;
	std::string error;
};

} // End of anonymous namespace

const char* EngineStateName(EngineState state) {
	switch (state) {
		case EngineState::INITIALIZING: return "INITIALIZING";
		case EngineState::RESOLVING_RANGE: return "RESOLVING_RANGE";
		case EngineState::RUNNING: return "RUNNING";
		case EngineState::COMPLETED: return "COMPLETED";
		case EngineState::CANCELLED: return "CANCELLED";
		case EngineState::FAILED: return "FAILED";
	}
	return "UNKNOWN";
}

ReconciliationEngine::ReconciliationEngine(RunConfig config,
		IIndexerEndpoint& primary, IIndexerEndpoint& secondary,
		ICheckpointStore& checkpoints, IReportSink& report)
	: config_(std::move(config)),
	primary_(primary),
	secondary_(secondary),
	checkpoints_(checkpoints),
	report_(report),
	key_(KeyFor(config_)) {}

RunOutcome ReconciliationEngine::Run() {
	started_at_ = std::chrono::steady_clock::now();

	RunOutcome outcome;
	outcome.summary = RunSummary(config_.report_bucket_size);

	if (Initialize(outcome) && ResolveRange(outcome) && state() != EngineState::COMPLETED) {
		RunBlocks(outcome);
	}

	outcome.state = state();
	outcome.last_reconciled = last_reconciled_;
	outcome.summary.final_state = EngineStateName(outcome.state);
	outcome.summary.start_height = start_;
	outcome.summary.end_height = end_;
	outcome.summary.elapsed_seconds = std::chrono::duration<double>(
			std::chrono::steady_clock::now() - started_at_).count();
	report_.OnFinish(outcome.summary);

	if (outcome.state == EngineState::FAILED) {
		LOG(ERROR) << "Reconciliation failed (" << RunErrorName(outcome.error) << "): " << outcome.message;
	} else {
		LOG(INFO) << "Reconciliation " << EngineStateName(outcome.state)
			<< ", last reconciled height "
			<< (last_reconciled_ ? std::to_string(*last_reconciled_) : std::string("none"));
	}
	return outcome;
}

bool ReconciliationEngine::Initialize(RunOutcome& outcome) {
	Transition(EngineState::INITIALIZING);

	std::vector<std::string> errors;
	if (!ValidateRunConfig(config_, errors)) {
		std::string message = "Invalid run configuration:";
		for (const auto& error : errors) {
			message += " " + error + ";";
		}
		Fail(outcome, RunError::INVALID_CONFIG, message);
		return false;
	}

	start_ = config_.start_height ? *config_.start_height
		: FirstActivationHeight(config_.chain, config_.protocol);

	Checkpoint checkpoint;
	std::string error;
	switch (checkpoints_.Load(key_, checkpoint, error)) {
		case CheckpointLoad::NOT_FOUND:
			LOG(INFO) << "No checkpoint for " << ChainName(config_.chain) << "/"
				<< ProtocolName(config_.protocol) << ", starting at " << start_;
			break;
		case CheckpointLoad::FOREIGN:
			Fail(outcome, RunError::FOREIGN_CHECKPOINT, "Checkpoint belongs to another reconciliation: " + error);
			return false;
		case CheckpointLoad::IO_ERROR:
			Fail(outcome, RunError::CHECKPOINT_IO, "Failed to load checkpoint: " + error);
			return false;
		case CheckpointLoad::FOUND:
			if (checkpoint.key != key_) {
				Fail(outcome, RunError::FOREIGN_CHECKPOINT,
						"Checkpoint store returned a record for a different endpoint tuple");
				return false;
			}
			last_reconciled_ = checkpoint.last_reconciled_height;
			if (checkpoint.last_reconciled_height + 1 > start_) {
				LOG(INFO) << "Resuming after checkpoint " << checkpoint.last_reconciled_height
					<< " (configured start " << start_ << ")";
				start_ = checkpoint.last_reconciled_height + 1;
				outcome.resumed = true;
			}
			break;
	}
	outcome.effective_start = start_;
	return true;
}

bool ReconciliationEngine::SleepUnlessCancelled(std::chrono::milliseconds delay) {
	auto deadline = std::chrono::steady_clock::now() + delay;
	while (!cancel_requested_.load()) {
		auto now = std::chrono::steady_clock::now();
		if (now >= deadline) return true;
		std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(deadline - now, kPollSlice));
	}
	return false;
}

FetchStatus ReconciliationEngine::QueryNodeWithRetry(IIndexerEndpoint& endpoint, std::string& network,
		BlockHeight& tip, std::string& error) {
	FetchStatus status = FetchStatus::UNAVAILABLE;
	for (int attempt = 1; attempt <= config_.retry.max_attempts; ++attempt) {
		status = endpoint.GetNetwork(network, error);
		if (status == FetchStatus::OK) {
			status = endpoint.GetChainTip(config_.chain, tip, error);
		}
		if (status == FetchStatus::OK || !IsTransient(status)) {
			return status;
		}
		if (attempt == config_.retry.max_attempts) break;

		auto delay = config_.retry.BackoffFor(attempt);
		LOG(WARNING) << endpoint.Name() << ": node query attempt " << attempt << " failed ("
			<< FetchStatusName(status) << ": " << error << "), retrying in " << delay.count() << "ms";
		if (!SleepUnlessCancelled(delay)) {
			error = "cancelled";
			break;
		}
	}
	return status;
}

bool ReconciliationEngine::ResolveRange(RunOutcome& outcome) {
	Transition(EngineState::RESOLVING_RANGE);

	auto query = [this](IIndexerEndpoint& endpoint) {
		NodeQuery q;
		q.status = QueryNodeWithRetry(endpoint, q.network, q.tip, q.error);
		return q;
	};
	auto secondary_future = std::async(std::launch::async, query, std::ref(secondary_));
	NodeQuery primary = query(primary_);
	NodeQuery secondary = secondary_future.get();

	if (cancel_requested_.load()) {
		LOG(WARNING) << "Cancelled while resolving the block range";
		Transition(EngineState::CANCELLED);
		return false;
	}
	for (const auto* q : {&primary, &secondary}) {
		if (q->status != FetchStatus::OK) {
			const auto& name = q == &primary ? primary_.Name() : secondary_.Name();
			Fail(outcome, RunError::RANGE_RESOLUTION, "Failed to query " + name + ": " +
					FetchStatusName(q->status) + ": " + q->error);
			return false;
		}
	}

	const std::string expected = ChainNetworkName(config_.chain);
	if (primary.network != expected || secondary.network != expected) {
		Fail(outcome, RunError::NETWORK_MISMATCH, "Expected network " + expected + ", primary reports " +
				primary.network + ", secondary reports " + secondary.network);
		return false;
	}

	BlockHeight common_tip = std::min(primary.tip, secondary.tip);
	LOG(INFO) << "Chain tips: primary " << primary.tip << ", secondary " << secondary.tip;
	end_ = common_tip;
	if (config_.end_height) {
		if (*config_.end_height > common_tip) {
			LOG(WARNING) << "Configured end " << *config_.end_height
				<< " is beyond the common tip, clamping to " << common_tip;
		} else {
			end_ = *config_.end_height;
		}
	}
	outcome.effective_end = end_;

	if (end_ < start_) {
		if (last_reconciled_ && *last_reconciled_ >= end_) {
			LOG(INFO) << "Range already reconciled up to " << *last_reconciled_ << ", nothing to do";
			Transition(EngineState::COMPLETED);
			return true;
		}
		Fail(outcome, RunError::INVALID_CONFIG, "End block " + std::to_string(end_) +
				" is less than start block " + std::to_string(start_));
		return false;
	}

	LOG(INFO) << "Reconciling " << ChainName(config_.chain) << "/" << ProtocolName(config_.protocol)
		<< " blocks " << start_ << " to " << end_ << " with " << config_.thread_count << " workers";
	return true;
}

void ReconciliationEngine::RunBlocks(RunOutcome& outcome) {
	Transition(EngineState::RUNNING);

	BlockScheduler scheduler(config_.chain, config_.protocol, primary_, secondary_,
			config_.thread_count, config_.reorder_window, config_.retry);
	scheduler.Start(start_, end_);

	const uint64_t total = end_ - start_ + 1;
	BlockHeight expected = start_;
	bool cancelling = false;
	std::chrono::steady_clock::time_point grace_deadline;

	while (true) {
		if (!cancelling && cancel_requested_.load()) {
			LOG(WARNING) << "Cancellation requested, draining " << scheduler.InFlight()
				<< " in-flight blocks for up to " << config_.cancel_grace.count() << "ms";
			scheduler.Cancel();
			cancelling = true;
			grace_deadline = std::chrono::steady_clock::now() + config_.cancel_grace;
		}

		absl::Duration wait = absl::FromChrono(kPollSlice);
		if (cancelling) {
			auto left = grace_deadline - std::chrono::steady_clock::now();
			wait = absl::FromChrono(std::max<std::chrono::steady_clock::duration>(left,
						std::chrono::steady_clock::duration::zero()));
		}

		BlockResult result;
		auto next = scheduler.Next(result, wait);
		if (next == BlockScheduler::NextResult::EXHAUSTED) break;
		if (next == BlockScheduler::NextResult::TIMED_OUT) {
			if (cancelling) {
				LOG(WARNING) << "Grace period expired, aborting " << scheduler.InFlight() << " in-flight blocks";
				scheduler.Abort();
				break;
			}
			continue;
		}

		CHECK_EQ(result.height, expected) << "Scheduler released blocks out of order";
		++expected;

		if (!Finalize(result, outcome)) {
			DrainAfterStop(scheduler);
			return;
		}

		uint64_t done = expected - start_;
		if (config_.progress_interval > 0 && done % config_.progress_interval == 0) {
			LOG(INFO) << "Progress: " << done << "/" << total << " blocks, checkpoint "
				<< (last_reconciled_ ? std::to_string(*last_reconciled_) : std::string("none"))
				<< ", " << outcome.summary.total_divergences << " divergences";
		}
	}

	if (expected > end_) {
		Transition(EngineState::COMPLETED);
	} else {
		CHECK(cancelling) << "Scheduler exhausted at " << expected << " without cancellation";
		Transition(EngineState::CANCELLED);
	}
}

bool ReconciliationEngine::Finalize(const BlockResult& result, RunOutcome& outcome) {
	report_.OnBlock(result);
	outcome.summary.Record(result);

	std::string error;
	switch (result.status) {
		case BlockStatus::OK:
			break;
		case BlockStatus::FETCH_FAILED:
			if (!config_.tolerate_gaps) {
				Fail(outcome, RunError::FETCH_GAP, "Block " + std::to_string(result.height) +
						" could not be fetched: " + result.error);
				return false;
			}
			LOG(WARNING) << "Block " << result.height << " left unverified: " << result.error;
			break;
		case BlockStatus::FATAL:
			Fail(outcome, RunError::SCHEMA, "Block " + std::to_string(result.height) + ": " + result.error);
			return false;
	}

	if (!AdvanceCheckpoint(result.height, error)) {
		Fail(outcome, RunError::CHECKPOINT_IO, "Failed to save checkpoint at " +
				std::to_string(result.height) + ": " + error);
		return false;
	}
	return true;
}

bool ReconciliationEngine::AdvanceCheckpoint(BlockHeight height, std::string& error) {
	CHECK(!last_reconciled_ || height > *last_reconciled_)
		<< "Checkpoint would move backwards from " << *last_reconciled_ << " to " << height;

	Checkpoint checkpoint;
	checkpoint.key = key_;
	checkpoint.last_reconciled_height = height;
	checkpoint.updated_at = UnixNow();
	if (!checkpoints_.Save(checkpoint, error)) {
		return false;
	}
	last_reconciled_ = height;
	return true;
}

void ReconciliationEngine::DrainAfterStop(BlockScheduler& scheduler) {
	scheduler.Cancel();
	auto deadline = std::chrono::steady_clock::now() + config_.cancel_grace;
	BlockResult discarded;
	while (true) {
		auto left = deadline - std::chrono::steady_clock::now();
		if (left <= std::chrono::steady_clock::duration::zero()) {
			LOG(WARNING) << "Aborting " << scheduler.InFlight() << " in-flight blocks";
			scheduler.Abort();
			return;
		}
		auto next = scheduler.Next(discarded, absl::FromChrono(left));
		if (next != BlockScheduler::NextResult::READY) return;
		VLOG(1) << "Discarding block " << discarded.height << " after failure";
	}
}

void ReconciliationEngine::Transition(EngineState next) {
	EngineState previous = state_.exchange(next);
	VLOG(1) << "Engine state " << EngineStateName(previous) << " -> " << EngineStateName(next);
}

void ReconciliationEngine::Fail(RunOutcome& outcome, RunError error, const std::string& message) {
	outcome.error = error;
	outcome.message = message;
	Transition(EngineState::FAILED);
}

} // End of namespace Crosscheck
