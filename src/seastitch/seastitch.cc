#include <string>
#include <vector>
#include <chrono>
#include <cstdlib>
#include <optional>
#include <memory>
#include <iostream>

// System includes
#include <sys/stat.h>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

#include "absl/strings/numbers.h"
#include "absl/strings/str_join.h"

// Project includes
#include "cache/processed_file_cache.h"
#include "classifier/file_code.h"
#include "common/configuration.h"
#include "common/file_utils.h"
#include "engine/alert_report.h"
#include "engine/dive_processing_engine.h"
#include "guard/cancellation.h"
#include "guard/run_guard.h"
#include "reassembly/defragmenter.h"
#include "reassembly/downstream.h"
#include "repair/repair_filters.h"
#include "transfer/transfer_log.h"

namespace {

constexpr char kDefaultConfigName[] = "seastitch.yaml";

std::string ResolvePath(const std::string& mission_dir, const std::string& path) {
	if (!path.empty() && path[0] == '/') return path;
	return Seastitch::JoinPath(mission_dir, path);
}

bool FileExists(const std::string& path) {
	struct stat st;
	return stat(path.c_str(), &st) == 0;
}

// Mission directories are conventionally named sgNNN after the instrument
std::optional<int> InstrumentIdFromMissionDir(std::string mission_dir) {
	while (!mission_dir.empty() && mission_dir.back() == '/') mission_dir.pop_back();
	std::string name = Seastitch::Basename(mission_dir);
	int id = 0;
	if (name.size() == 5 && name.compare(0, 2, "sg") == 0 && absl::SimpleAtoi(name.substr(2), &id)) {
		return id;
	}
	return std::nullopt;
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("seastitch", "Reassembles fragmented instrument transmissions, one dive at a time");

	options.add_options()
		("m,mission_dir", "Mission directory holding the transmitted files", cxxopts::value<std::string>())
		("c,config", "YAML configuration file (default: <mission_dir>/seastitch.yaml if present)",
		 cxxopts::value<std::string>())
		("i,instrument_id", "Instrument id (default: from config or mission directory name)",
		 cxxopts::value<int>())
		("f,force", "Reprocess every file group, ignoring the processed file cache")
		("ignore_lock", "Ignore the lock file, if present")
		("stop_timeout", "Seconds to wait for a previous invocation to stop", cxxopts::value<int>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");

	cxxopts::ParseResult arguments;
	try {
		arguments = options.parse(argc, argv);
	} catch (const std::exception& e) {
		LOG(ERROR) << "Bad command line: " << e.what();
		return EXIT_FAILURE;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}
	if (!arguments.count("mission_dir")) {
		LOG(ERROR) << "--mission_dir is required\n" << options.help();
		return EXIT_FAILURE;
	}
	const std::string mission_dir = arguments["mission_dir"].as<std::string>();

	// *************** Configuration **********************
	Seastitch::Configuration& configuration = Seastitch::Configuration::getInstance();
	std::string config_file = arguments.count("config")
		? arguments["config"].as<std::string>()
		: Seastitch::JoinPath(mission_dir, kDefaultConfigName);
	if (arguments.count("config") || FileExists(config_file)) {
		if (!configuration.loadFromFile(config_file)) {
			LOG(ERROR) << "Invalid configuration " << config_file << ": "
				<< absl::StrJoin(configuration.getValidationErrors(), "; ");
			return EXIT_FAILURE;
		}
		LOG(INFO) << "Loaded configuration from " << config_file;
	}
	Seastitch::SeastitchConfig& config = configuration.config();
	if (arguments.count("instrument_id")) {
		config.mission.instrument_id.set(arguments["instrument_id"].as<int>());
	}
	if (arguments.count("stop_timeout")) {
		config.guard.stop_timeout_sec.set(arguments["stop_timeout"].as<int>());
	}
	if (!configuration.validate()) {
		LOG(ERROR) << "Invalid configuration: " << absl::StrJoin(configuration.getValidationErrors(), "; ");
		return EXIT_FAILURE;
	}

	int instrument_id = configuration.getInstrumentId();
	if (instrument_id == 0) {
		std::optional<int> derived = InstrumentIdFromMissionDir(mission_dir);
		if (!derived) {
			LOG(ERROR) << "No instrument id given and none derivable from " << mission_dir;
			return EXIT_FAILURE;
		}
		instrument_id = *derived;
	}
	LOG(INFO) << "Processing mission directory " << mission_dir << " for instrument " << instrument_id;

	// *************** Run guard **********************
	Seastitch::InstallStopSignalHandler();
	std::unique_ptr<Seastitch::RunGuard> guard;
	if (arguments.count("ignore_lock")) {
		LOG(WARNING) << "Ignoring the lock file";
	} else {
		guard = std::make_unique<Seastitch::RunGuard>(
				ResolvePath(mission_dir, config.mission.lock_file.get()),
				std::chrono::seconds(config.guard.stop_timeout_sec.get()),
				std::chrono::milliseconds(config.guard.poll_interval_ms.get()));
		absl::StatusOr<pid_t> pid = guard->Acquire();
		if (!pid.ok()) {
			LOG(ERROR) << "Could not take the lock: " << pid.status();
			return EXIT_FAILURE;
		}
	}

	// *************** Wire up the engine **********************
	std::vector<Seastitch::LoggerSpec> loggers;
	for (const auto& logger : config.loggers) {
		loggers.push_back({logger.prefix, logger.strip_files});
	}
	Seastitch::SeagliderClassifier classifier(instrument_id, loggers);
	Seastitch::DefaultRepairFilters filters;
	Seastitch::BasestationDownstream downstream;

	auto transfer_log = Seastitch::ManifestTransferLog::Load(
			ResolvePath(mission_dir, config.fragments.transfer_manifest.get()),
			static_cast<int64_t>(config.fragments.default_fragment_size.get()));
	if (!transfer_log.ok()) {
		LOG(ERROR) << transfer_log.status();
		return EXIT_FAILURE;
	}

	Seastitch::Defragmenter defragmenter(&filters, transfer_log->get(), &downstream,
			ResolvePath(mission_dir, config.mission.scratch_dir.get()));
	Seastitch::ProcessedFileCache cache(ResolvePath(mission_dir, config.mission.cache_file.get()),
			&classifier);
	Seastitch::DiveProcessingEngine engine(mission_dir, &classifier, &cache, &defragmenter,
			arguments.count("force") > 0);

	absl::StatusOr<Seastitch::RunResult> result = engine.Run(Seastitch::StopSignalToken());
	if (!result.ok()) {
		LOG(ERROR) << "Processing failed: " << result.status();
		return EXIT_FAILURE;
	}

	// *************** Report **********************
	std::string report = Seastitch::FormatAlertReport(*result);
	if (!report.empty()) {
		LOG(INFO) << "Run report:\n" << report;
	}
	const std::string alert_file = ResolvePath(mission_dir, config.mission.alert_file.get());
	absl::Status status = Seastitch::WriteAlertReport(*result, alert_file);
	if (!status.ok()) {
		LOG(WARNING) << "Could not write " << alert_file << ": " << status;
	}

	LOG(INFO) << "Processed " << result->processed_dives.size() << " dive(s) and "
		<< result->processed_selftests.size() << " selftest(s), "
		<< result->incomplete_files.size() << " incomplete file(s)";
	if (guard) guard->Release();
	return EXIT_SUCCESS;
}
