#ifndef CROSSCHECK_ENGINE_RECONCILIATION_ENGINE_H_
#define CROSSCHECK_ENGINE_RECONCILIATION_ENGINE_H_

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

#include "../checkpoint/checkpoint_store.h"
#include "../common/run_config.h"
#include "../endpoint/endpoint.h"
#include "../report/report_sink.h"
#include "../report/run_summary.h"

namespace Crosscheck {

class BlockScheduler;

enum class EngineState {
	INITIALIZING,
	RESOLVING_RANGE,
	RUNNING,
	COMPLETED,
	CANCELLED,
	FAILED
};

const char* EngineStateName(EngineState state);

struct RunOutcome {
	EngineState state = EngineState::INITIALIZING;
	RunError error = RunError::NONE;
	std::string message;

	BlockHeight effective_start = 0;
	BlockHeight effective_end = 0;
	bool resumed = false;                          // start moved up by an existing checkpoint
	std::optional<BlockHeight> last_reconciled;    // checkpoint when the run stopped

	RunSummary summary;
};

/**
 * Drives one reconciliation run:
 *   INITIALIZING -> RESOLVING_RANGE -> RUNNING -> COMPLETED | CANCELLED | FAILED
 *
 * Results reach the checkpoint store and report sink strictly in height
 * order from this class only; scheduler workers never touch them.
 */
class ReconciliationEngine {
	public:
		ReconciliationEngine(RunConfig config,
				IIndexerEndpoint& primary, IIndexerEndpoint& secondary,
				ICheckpointStore& checkpoints, IReportSink& report);

		// Runs to a terminal state. Call once.
		RunOutcome Run();

		// Cooperative. Only stores an atomic flag, so it is safe from a signal handler.
		void Cancel() { cancel_requested_.store(true); }

		EngineState state() const { return state_.load(); }

	private:
		bool Initialize(RunOutcome& outcome);
		bool ResolveRange(RunOutcome& outcome);
		void RunBlocks(RunOutcome& outcome);

		FetchStatus QueryNodeWithRetry(IIndexerEndpoint& endpoint, std::string& network,
				BlockHeight& tip, std::string& error);
		bool SleepUnlessCancelled(std::chrono::milliseconds delay);

		// Returns false when the run must stop.
		bool Finalize(const BlockResult& result, RunOutcome& outcome);
		bool AdvanceCheckpoint(BlockHeight height, std::string& error);
		void DrainAfterStop(BlockScheduler& scheduler);

		void Transition(EngineState next);
		void Fail(RunOutcome& outcome, RunError error, const std::string& message);

		const RunConfig config_;
		IIndexerEndpoint& primary_;
		IIndexerEndpoint& secondary_;
		ICheckpointStore& checkpoints_;
		IReportSink& report_;
		const CheckpointKey key_;

		std::atomic<EngineState> state_{EngineState::INITIALIZING};
		std::atomic<bool> cancel_requested_{false};

		std::optional<BlockHeight> last_reconciled_;
		BlockHeight start_ = 0;
		BlockHeight end_ = 0;
		std::chrono::steady_clock::time_point started_at_;
};

} // namespace Crosscheck

#endif // CROSSCHECK_ENGINE_RECONCILIATION_ENGINE_H_
