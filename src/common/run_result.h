#ifndef SEASTITCH_SRC_COMMON_RUN_RESULT_H_
#define SEASTITCH_SRC_COMMON_RUN_RESULT_H_

#include <map>
#include <set>
#include <string>
#include <vector>

#include "reassembly/validation.h"

namespace Seastitch {

// Everything one invocation produced, threaded through the engine and returned by Run().
struct RunResult {
	std::set<int> processed_dives;
	std::set<int> failed_dives;
	std::set<int> processed_selftests;
	std::set<int> failed_selftests;

	std::set<std::string> incomplete_files;
	// Conversion alerts per reassembled file
	ValidationReport alerts;

	std::vector<std::string> processed_log_files;
	std::vector<std::string> processed_selftest_files;
	std::vector<std::string> processed_other_files;
	std::vector<std::string> processed_pdos_logs;
	// Keyed by logger prefix
	std::map<std::string, std::vector<std::string>> processed_logger_files;

	bool cancelled = false;

	void AddAlerts(const std::string& file, const ValidationOutcome& outcome) {
		if (outcome.empty()) return;
		alerts[file].Merge(outcome);
		incomplete_files.insert(file);
	}
};

} // End of namespace Seastitch
#endif
