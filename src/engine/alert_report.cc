#include "engine/alert_report.h"

#include <algorithm>
#include <set>

#include <glog/logging.h>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "common/file_utils.h"

namespace Seastitch {

std::vector<std::string> CollectResendHints(const RunResult& result) {
	std::vector<std::string> hints;
	std::set<std::string> seen;
	for (const auto& [file, outcome] : result.alerts) {
		for (const auto& entry : outcome.entries) {
			if (entry.resend_hint && !entry.resend_hint->empty() && seen.insert(*entry.resend_hint).second) {
				hints.push_back(*entry.resend_hint);
			}
		}
	}
	return hints;
}

std::string FormatAlertReport(const RunResult& result) {
	std::string out;
	if (result.cancelled) {
		absl::StrAppend(&out, "Processing was stopped early by a later invocation\n");
	}
	if (!result.processed_selftests.empty()) {
		absl::StrAppend(&out, "Processed selftests: ", absl::StrJoin(result.processed_selftests, " "), "\n");
	}
	if (!result.failed_selftests.empty()) {
		absl::StrAppend(&out, "Failed selftests: ", absl::StrJoin(result.failed_selftests, " "), "\n");
	}
	if (!result.processed_dives.empty()) {
		absl::StrAppend(&out, "Processed dives: ", absl::StrJoin(result.processed_dives, " "), "\n");
	}
	if (!result.failed_dives.empty()) {
		absl::StrAppend(&out, "Failed dives: ", absl::StrJoin(result.failed_dives, " "), "\n");
	}

	if (!result.incomplete_files.empty()) {
		absl::StrAppend(&out, "\nIncomplete files:\n");
		for (const auto& file : result.incomplete_files) {
			absl::StrAppend(&out, "    ", file, "\n");
		}
	}

	if (!result.alerts.empty()) {
		absl::StrAppend(&out, "\nConversion alerts:\n");
		for (const auto& [file, outcome] : result.alerts) {
			absl::StrAppend(&out, "  ", file, outcome.ok ? "" : " (failed checks)", ":\n");
			for (const auto& entry : outcome.entries) {
				absl::StrAppend(&out, "    ", entry.message, "\n");
			}
		}
	}

	std::vector<std::string> hints = CollectResendHints(result);
	if (!hints.empty()) {
		absl::StrAppend(&out, "\nSuggested resend commands:\n");
		for (const auto& hint : hints) {
			absl::StrAppend(&out, "    ", hint, "\n");
		}
	}
	return out;
}

absl::Status WriteAlertReport(const RunResult& result, const std::string& path) {
	std::string report = FormatAlertReport(result);
	if (report.empty()) {
		VLOG(1) << "\t[AlertReport]\tNothing to report";
		return absl::OkStatus();
	}
	return WriteFileContents(path, report);
}

} // End of namespace Seastitch
