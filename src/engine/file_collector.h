#ifndef INCLUDE_FILE_COLLECTOR_H_
#define INCLUDE_FILE_COLLECTOR_H_

#include <map>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "classifier/file_code.h"

namespace Seastitch {

struct CollectedFiles {
	// Instrument and logger transmissions, by dive number
	std::map<int, std::vector<FileCode>> dives;
	// Selftest transmissions, by selftest number
	std::map<int, std::vector<FileCode>> selftests;
	// Instrument command logs; also present in dives/selftests
	std::vector<FileCode> pdos_logs;

	size_t size() const;
};

// Pre-processing files directly inside mission_dir, grouped for the engine.
absl::StatusOr<CollectedFiles> CollectPreProcessingFiles(const std::string& mission_dir,
		const FileClassifier& classifier);

// Files of one dive keyed by base name (first eight characters)
std::map<std::string, std::vector<FileCode>> GroupByBaseName(const std::vector<FileCode>& files);

} // End of namespace Seastitch
#endif
