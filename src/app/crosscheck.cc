#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>

#include <curl/curl.h>
#include <cxxopts.hpp>
#include <glog/logging.h>

#include "../checkpoint/checkpoint_store.h"
#include "../common/configuration.h"
#include "../endpoint/http_endpoint.h"
#include "../engine/reconciliation_engine.h"
#include "../report/report_sink.h"

namespace {

constexpr int kExitClean = 0;
constexpr int kExitFailed = 1;
constexpr int kExitDivergent = 2;
constexpr int kExitIncomplete = 3;
constexpr int kExitCancelled = 130;

std::atomic<Crosscheck::ReconciliationEngine*> g_engine{nullptr};

void HandleTermination(int signum) {
	Crosscheck::ReconciliationEngine* engine = g_engine.load();
	if (engine != nullptr) {
		engine->Cancel();
	}
	// A second signal terminates immediately.
	std::signal(signum, SIG_DFL);
}

int ExitCodeFor(const Crosscheck::RunOutcome& outcome) {
	switch (outcome.state) {
		case Crosscheck::EngineState::COMPLETED:
			if (outcome.summary.DivergenceFound()) return kExitDivergent;
			if (outcome.summary.VerificationIncomplete()) return kExitIncomplete;
			return kExitClean;
		case Crosscheck::EngineState::CANCELLED:
			return kExitCancelled;
		default:
			return kExitFailed;
	}
}

// Command-line values win over the file and the environment.
void ApplyArguments(const cxxopts::ParseResult& arguments, Crosscheck::CrosscheckConfig& config) {
	if (arguments.count("primary")) config.endpoints.primary.set(arguments["primary"].as<std::string>());
	if (arguments.count("secondary")) config.endpoints.secondary.set(arguments["secondary"].as<std::string>());
	if (arguments.count("chain")) config.run.chain.set(arguments["chain"].as<std::string>());
	if (arguments.count("protocol")) config.run.protocol.set(arguments["protocol"].as<std::string>());
	if (arguments.count("start")) config.run.start_height.set(arguments["start"].as<int64_t>());
	if (arguments.count("end")) config.run.end_height.set(arguments["end"].as<int64_t>());
	if (arguments.count("threads")) config.scheduler.threads.set(arguments["threads"].as<int>());
	if (arguments.count("checkpoint_dir")) {
		config.checkpoint.directory.set(arguments["checkpoint_dir"].as<std::string>());
	}
	if (arguments.count("tolerate_gaps")) config.run.tolerate_gaps.set(true);
	if (arguments.count("report")) config.report.jsonl_path.set(arguments["report"].as<std::string>());
}

int RunCrosscheck(int argc, char* argv[]) {
	cxxopts::Options options("crosscheck",
			"Block-by-block consistency check between two Ordinal/BRC20 indexers");

	options.add_options()
		("p,primary", "Primary indexer base URL", cxxopts::value<std::string>())
		("s,secondary", "Secondary indexer base URL", cxxopts::value<std::string>())
		("m,protocol", "Protocol to compare: ordinal or brc20", cxxopts::value<std::string>())
		("c,chain", "Chain: bitcoin or fractal", cxxopts::value<std::string>())
		("start", "First height to reconcile", cxxopts::value<int64_t>())
		("end", "Last height to reconcile (clamped to the common tip)", cxxopts::value<int64_t>())
		("threads", "Concurrent block workers", cxxopts::value<int>())
		("config", "YAML configuration file", cxxopts::value<std::string>())
		("checkpoint_dir", "Directory holding checkpoints", cxxopts::value<std::string>())
		("tolerate_gaps", "Advance the checkpoint past blocks that could not be fetched")
		("report", "Append a JSON-lines report to this file", cxxopts::value<std::string>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("log_dir", "Write glog files here instead of stderr", cxxopts::value<std::string>())
		("h,help", "Print usage");

	auto arguments = options.parse(argc, argv);

	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return kExitClean;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	if (arguments.count("log_dir")) {
		FLAGS_log_dir = arguments["log_dir"].as<std::string>();
	} else {
		FLAGS_logtostderr = 1; // log only to console, no files
	}

	// *************** Configuration **********************
	Crosscheck::Configuration& configuration = Crosscheck::Configuration::getInstance();
	if (arguments.count("config")) {
		const std::string path = arguments["config"].as<std::string>();
		if (!configuration.loadFromFile(path)) {
			for (const auto& error : configuration.getValidationErrors()) {
				LOG(ERROR) << path << ": " << error;
			}
			return kExitFailed;
		}
	}
	ApplyArguments(arguments, configuration.config());

	Crosscheck::RunConfig run_config;
	std::vector<std::string> errors;
	if (!configuration.BuildRunConfig(run_config, errors)) {
		for (const auto& error : errors) {
			LOG(ERROR) << "Configuration: " << error;
		}
		return kExitFailed;
	}

	const auto& config = configuration.config();
	Crosscheck::HttpEndpointOptions endpoint_options;
	endpoint_options.fetch_timeout = std::chrono::milliseconds(config.endpoints.fetch_timeout_ms.get());
	endpoint_options.info_timeout = std::chrono::milliseconds(config.endpoints.tip_timeout_ms.get());
	endpoint_options.connect_timeout = std::chrono::milliseconds(config.endpoints.connect_timeout_ms.get());
	endpoint_options.verify_tls = config.endpoints.verify_tls.get();

	// *************** Components **********************
	if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
		LOG(ERROR) << "curl_global_init failed";
		return kExitFailed;
	}

	int exit_code = kExitFailed;
	{
		Crosscheck::HttpIndexerEndpoint primary(run_config.primary_endpoint, endpoint_options);
		Crosscheck::HttpIndexerEndpoint secondary(run_config.secondary_endpoint, endpoint_options);
		Crosscheck::FileCheckpointStore checkpoints(config.checkpoint.directory.get());

		Crosscheck::TeeReportSink report;
		Crosscheck::LogReportSink log_report;
		report.Add(&log_report);

		std::unique_ptr<Crosscheck::JsonLinesReportSink> json_report;
		const std::string report_path = config.report.jsonl_path.get();
		if (!report_path.empty()) {
			json_report = std::make_unique<Crosscheck::JsonLinesReportSink>(report_path);
			std::string error;
			if (!json_report->Open(error)) {
				LOG(ERROR) << "Cannot open report " << report_path << ": " << error;
				curl_global_cleanup();
				return kExitFailed;
			}
			report.Add(json_report.get());
		}

		Crosscheck::ReconciliationEngine engine(run_config, primary, secondary, checkpoints, report);
		g_engine.store(&engine);
		std::signal(SIGINT, HandleTermination);
		std::signal(SIGTERM, HandleTermination);

		Crosscheck::RunOutcome outcome = engine.Run();

		std::signal(SIGINT, SIG_DFL);
		std::signal(SIGTERM, SIG_DFL);
		g_engine.store(nullptr);

		exit_code = ExitCodeFor(outcome);
	}

	curl_global_cleanup();
	return exit_code;
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	try {
		return RunCrosscheck(argc, argv);
	} catch (const std::exception& e) {
		// cxxopts reports malformed arguments by throwing
		std::cerr << "crosscheck: " << e.what() << std::endl;
		return kExitFailed;
	}
}
