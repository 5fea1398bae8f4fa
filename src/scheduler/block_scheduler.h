#ifndef CROSSCHECK_SCHEDULER_BLOCK_SCHEDULER_H_
#define CROSSCHECK_SCHEDULER_BLOCK_SCHEDULER_H_

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/btree_map.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

#include "../common/run_config.h"
#include "../comparator/divergence.h"
#include "../endpoint/endpoint.h"

namespace Crosscheck {

/**
 * Fetch-and-compare over a closed height range with a fixed worker pool.
 *
 * Workers claim the lowest undispatched height, fetch it from both endpoints
 * concurrently (retrying transient errors with backoff), compare, and park the
 * result in a reorder buffer. Next() releases results strictly in height order.
 * At most reorder_window heights may be dispatched but not yet released, so a
 * stalled consumer pauses dispatch instead of growing the buffer.
 *
 * A FATAL result stops further dispatch; in-flight heights still complete.
 * Cancel() additionally aborts retries, letting fetches already on the wire
 * finish. Abort() also interrupts those fetches. Heights interrupted either way
 * produce no result, and Next() reports EXHAUSTED at the first such gap.
 */
class BlockScheduler {
	public:
		enum class NextResult {
			READY,
			EXHAUSTED,
			TIMED_OUT
		};

		BlockScheduler(ChainId chain, ProtocolId protocol,
				IIndexerEndpoint& primary, IIndexerEndpoint& secondary,
				int thread_count, size_t reorder_window, RetryPolicy retry);
		~BlockScheduler();

		BlockScheduler(const BlockScheduler&) = delete;
		BlockScheduler& operator=(const BlockScheduler&) = delete;

		// Dispatches [start, end]. Call once.
		void Start(BlockHeight start, BlockHeight end);

		NextResult Next(BlockResult& result, absl::Duration timeout = absl::InfiniteDuration());

		void StopDispatch();
		void Cancel();
		void Abort();

		// Waits for every worker to exit. Returns promptly after Abort(); after
		// Cancel() alone it may wait for fetches still on the wire.
		void Join();

		size_t InFlight() const;
		size_t reorder_window() const { return reorder_window_; }

	private:
		void WorkerLoop();
		bool ClaimHeight(BlockHeight& height);
		void Complete(BlockHeight height, BlockResult result, bool abandoned);

		BlockResult ProcessHeight(BlockHeight height, bool& abandoned);
		FetchStatus FetchWithRetry(IIndexerEndpoint& endpoint, BlockHeight height, Receipts& receipts,
				std::string& error, int& attempts, bool& cancelled);
		// Returns false if cancelled while waiting.
		bool WaitBackoff(std::chrono::milliseconds delay);
		bool IsCancelled() const;

		const ChainId chain_;
		const ProtocolId protocol_;
		IIndexerEndpoint& primary_;
		IIndexerEndpoint& secondary_;
		const int thread_count_;
		const size_t reorder_window_;
		const RetryPolicy retry_;

		std::vector<std::thread> workers_;
		std::atomic<bool> abort_fetches_{false};

		mutable absl::Mutex mu_;
		absl::CondVar dispatch_cv_;  // window space freed or dispatch stopped
		absl::CondVar ready_cv_;     // result parked or in-flight count changed
		absl::CondVar cancel_cv_;    // wakes backoff waits

		absl::btree_map<BlockHeight, BlockResult> reorder_buffer_ ABSL_GUARDED_BY(mu_);
		BlockHeight end_ ABSL_GUARDED_BY(mu_) = 0;
		BlockHeight next_dispatch_ ABSL_GUARDED_BY(mu_) = 0;
		BlockHeight next_release_ ABSL_GUARDED_BY(mu_) = 0;
		size_t in_flight_ ABSL_GUARDED_BY(mu_) = 0;
		bool started_ ABSL_GUARDED_BY(mu_) = false;
		bool dispatch_done_ ABSL_GUARDED_BY(mu_) = false;
		bool stop_dispatch_ ABSL_GUARDED_BY(mu_) = false;
		bool cancelled_ ABSL_GUARDED_BY(mu_) = false;
};

} // namespace Crosscheck

#endif // CROSSCHECK_SCHEDULER_BLOCK_SCHEDULER_H_
