#include "block_scheduler.h"

#include <algorithm>
#include <exception>
#include <future>

#include <glog/logging.h>

#include "../comparator/comparator.h"

namespace Crosscheck {

BlockScheduler::BlockScheduler(ChainId chain, ProtocolId protocol,
		IIndexerEndpoint& primary, IIndexerEndpoint& secondary,
		int thread_count, size_t reorder_window, RetryPolicy retry)
	: chain_(chain),
	protocol_(protocol),
	primary_(primary),
	secondary_(secondary),
	thread_count_(std::max(thread_count, 1)),
	reorder_window_(std::max(reorder_window == 0 ? 2 * static_cast<size_t>(thread_count_) : reorder_window,
				static_cast<size_t>(thread_count_))),
	retry_(retry) {}

BlockScheduler::~BlockScheduler() {
	Abort();
	Join();
}

void BlockScheduler::Start(BlockHeight start, BlockHeight end) {
	CHECK_LE(start, end) << "Empty range";
	size_t num_workers;
	{
		absl::MutexLock lock(&mu_);
		CHECK(!started_) << "BlockScheduler started twice";
		started_ = true;
		end_ = end;
		next_dispatch_ = start;
		next_release_ = start;
		uint64_t range = end - start;
		num_workers = range < static_cast<uint64_t>(thread_count_) ? static_cast<size_t>(range) + 1
			: static_cast<size_t>(thread_count_);
	}

	VLOG(1) << "Dispatching blocks " << start << "-" << end << " on " << num_workers
		<< " workers, reorder window " << reorder_window_;
	workers_.reserve(num_workers);
	for (size_t i = 0; i < num_workers; ++i) {
		workers_.emplace_back(&BlockScheduler::WorkerLoop, this);
	}
}

void BlockScheduler::StopDispatch() {
	absl::MutexLock lock(&mu_);
	stop_dispatch_ = true;
	dispatch_cv_.SignalAll();
	ready_cv_.SignalAll();
}

void BlockScheduler::Cancel() {
	absl::MutexLock lock(&mu_);
	stop_dispatch_ = true;
	cancelled_ = true;
	dispatch_cv_.SignalAll();
	ready_cv_.SignalAll();
	cancel_cv_.SignalAll();
}

void BlockScheduler::Abort() {
	Cancel();
	abort_fetches_.store(true);
}

void BlockScheduler::Join() {
	for (auto& worker : workers_) {
		if (worker.joinable()) {
			worker.join();
		}
	}
	workers_.clear();
}

size_t BlockScheduler::InFlight() const {
	absl::MutexLock lock(&mu_);
	return in_flight_;
}

bool BlockScheduler::IsCancelled() const {
	absl::MutexLock lock(&mu_);
	return cancelled_;
}

BlockScheduler::NextResult BlockScheduler::Next(BlockResult& result, absl::Duration timeout) {
	absl::Time deadline = timeout == absl::InfiniteDuration() ? absl::InfiniteFuture() : absl::Now() + timeout;
	absl::MutexLock lock(&mu_);
	CHECK(started_) << "Next() before Start()";

	bool timed_out = false;
	while (true) {
		auto it = reorder_buffer_.begin();
		if (it != reorder_buffer_.end() && it->first == next_release_) {
			result = std::move(it->second);
			reorder_buffer_.erase(it);
			++next_release_;
			dispatch_cv_.SignalAll();
			return NextResult::READY;
		}
		// Nothing more can arrive: everything claimed has completed and the
		// next height is absent (abandoned by cancellation, or past the end).
		if ((dispatch_done_ || stop_dispatch_) && in_flight_ == 0) {
			if (!reorder_buffer_.empty()) {
				VLOG(1) << "Discarding " << reorder_buffer_.size()
					<< " results above unfinished height " << next_release_;
				reorder_buffer_.clear();
			}
			return NextResult::EXHAUSTED;
		}
		if (timed_out) {
			return NextResult::TIMED_OUT;
		}
		timed_out = ready_cv_.WaitWithDeadline(&mu_, deadline);
	}
}

bool BlockScheduler::ClaimHeight(BlockHeight& height) {
	absl::MutexLock lock(&mu_);
	while (!stop_dispatch_ && !dispatch_done_ && next_dispatch_ - next_release_ >= reorder_window_) {
		dispatch_cv_.Wait(&mu_);
	}
	if (stop_dispatch_ || dispatch_done_) {
		return false;
	}
	height = next_dispatch_;
	if (height == end_) {
		dispatch_done_ = true;
	}
	++next_dispatch_;
	++in_flight_;
	return true;
}

void BlockScheduler::Complete(BlockHeight height, BlockResult result, bool abandoned) {
	absl::MutexLock lock(&mu_);
	--in_flight_;
	if (!abandoned) {
		if (result.status == BlockStatus::FATAL && !stop_dispatch_) {
			LOG(ERROR) << "Block " << height << " is fatal, stopping dispatch: " << result.error;
			stop_dispatch_ = true;
			dispatch_cv_.SignalAll();
		}
		reorder_buffer_.emplace(height, std::move(result));
	}
	ready_cv_.SignalAll();
}

void BlockScheduler::WorkerLoop() {
	BlockHeight height;
	while (ClaimHeight(height)) {
		bool abandoned = false;
		BlockResult result = ProcessHeight(height, abandoned);
		Complete(height, std::move(result), abandoned);
	}
}

BlockResult BlockScheduler::ProcessHeight(BlockHeight height, bool& abandoned) {
	BlockResult result;
	result.height = height;

	Receipts primary_receipts;
	Receipts secondary_receipts;
	std::string primary_error;
	std::string secondary_error;
	int primary_attempts = 0;
	int secondary_attempts = 0;
	bool primary_cancelled = false;
	bool secondary_cancelled = false;
	FetchStatus primary_status = FetchStatus::UNAVAILABLE;
	FetchStatus secondary_status = FetchStatus::UNAVAILABLE;

	try {
		// Secondary on its own thread so one slow endpoint does not serialize the other.
		auto secondary_future = std::async(std::launch::async, [&]() {
				return FetchWithRetry(secondary_, height, secondary_receipts, secondary_error,
						secondary_attempts, secondary_cancelled);
				});
		primary_status = FetchWithRetry(primary_, height, primary_receipts, primary_error,
				primary_attempts, primary_cancelled);
		secondary_status = secondary_future.get();
	} catch (const std::exception& e) {
		result.status = BlockStatus::FATAL;
		result.error = std::string("fetch raised: ") + e.what();
		return result;
	}

	result.attempts = primary_attempts + secondary_attempts;
	if (primary_cancelled || secondary_cancelled) {
		VLOG(2) << "Block " << height << " abandoned by cancellation";
		abandoned = true;
		return result;
	}

	if (primary_status == FetchStatus::INVALID_RESPONSE || secondary_status == FetchStatus::INVALID_RESPONSE) {
		result.status = BlockStatus::FATAL;
		result.error = primary_status == FetchStatus::INVALID_RESPONSE
			? "primary " + primary_.Name() + ": " + primary_error
			: "secondary " + secondary_.Name() + ": " + secondary_error;
		return result;
	}
	if (primary_status != FetchStatus::OK || secondary_status != FetchStatus::OK) {
		result.status = BlockStatus::FETCH_FAILED;
		result.error = primary_status != FetchStatus::OK
			? "primary " + primary_.Name() + " " + FetchStatusName(primary_status) + ": " + primary_error
			: "secondary " + secondary_.Name() + " " + FetchStatusName(secondary_status) + ": " + secondary_error;
		return result;
	}
	if (ProtocolOf(primary_receipts) != protocol_ || ProtocolOf(secondary_receipts) != protocol_) {
		result.status = BlockStatus::FATAL;
		result.error = std::string("receipts do not match protocol ") + ProtocolName(protocol_);
		return result;
	}

	result.status = BlockStatus::OK;
	result.divergences = CompareReceipts(height, primary_receipts, secondary_receipts);
	return result;
}

FetchStatus BlockScheduler::FetchWithRetry(IIndexerEndpoint& endpoint, BlockHeight height, Receipts& receipts,
		std::string& error, int& attempts, bool& cancelled) {
	FetchStatus status = FetchStatus::UNAVAILABLE;
	for (int attempt = 1; ; ++attempt) {
		if (IsCancelled()) {
			cancelled = true;
			return status;
		}
		++attempts;
		Receipts fetched;
		status = endpoint.FetchBlockReceipts(chain_, protocol_, height, fetched, error, abort_fetches_);
		if (status == FetchStatus::OK) {
			receipts = std::move(fetched);
			return status;
		}
		if (status == FetchStatus::CANCELLED) {
			cancelled = true;
			return status;
		}
		if (!IsTransient(status)) {
			LOG(ERROR) << "Invalid response from " << endpoint.Name() << " for block " << height << ": " << error;
			return status;
		}
		if (attempt >= retry_.max_attempts) {
			LOG(WARNING) << "Failed to fetch block " << height << " from " << endpoint.Name()
				<< " after " << attempt << " attempts: " << FetchStatusName(status) << " " << error;
			return status;
		}
		auto delay = retry_.BackoffFor(attempt);
		VLOG(1) << "Retrying block " << height << " from " << endpoint.Name() << " (" << attempt << "/"
			<< retry_.max_attempts << ") in " << delay.count() << "ms after " << FetchStatusName(status)
			<< ": " << error;
		if (!WaitBackoff(delay)) {
			cancelled = true;
			return status;
		}
	}
}

bool BlockScheduler::WaitBackoff(std::chrono::milliseconds delay) {
	absl::Time deadline = absl::Now() + absl::FromChrono(delay);
	absl::MutexLock lock(&mu_);
	while (!cancelled_) {
		if (cancel_cv_.WaitWithDeadline(&mu_, deadline)) {
			break;
		}
	}
	return !cancelled_;
}

} // namespace Crosscheck
