#ifndef INCLUDE_VALIDATION_H_
#define INCLUDE_VALIDATION_H_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "classifier/file_code.h"

namespace Seastitch {

struct ValidationEntry {
	std::string message;
	std::optional<std::string> resend_hint;
};

// Per defragmented file. Any entry lists the file as incomplete for the run.
struct ValidationOutcome {
	bool ok = true;
	std::vector<ValidationEntry> entries;

	void Warn(std::string message, std::optional<std::string> hint = std::nullopt) {
		entries.push_back({std::move(message), std::move(hint)});
	}
	void Fail(std::string message, std::optional<std::string> hint = std::nullopt) {
		ok = false;
		Warn(std::move(message), std::move(hint));
	}
	void Merge(const ValidationOutcome& other) {
		ok = ok && other.ok;
		entries.insert(entries.end(), other.entries.begin(), other.entries.end());
	}
	bool empty() const { return entries.empty(); }
};

// Keyed by defragmented file path
using ValidationReport = std::map<std::string, ValidationOutcome>;

// A fragment as it moves through the pipeline: classified by its transmitted
// name, with path pointing at the current (possibly repaired) bytes.
struct Fragment {
	FileCode code;
	std::string path;
};

// Expected vs received bytes for one fragment, as reported by the transfer record
struct FragmentSizes {
	int64_t expected = -1;
	int64_t received = -1;
};

// Keyed by transmitted fragment name (no directory)
using FragmentSizeMap = std::map<std::string, FragmentSizes>;

} // End of namespace Seastitch
#endif
