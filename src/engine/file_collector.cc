#include "engine/file_collector.h"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include <glog/logging.h>

#include "absl/strings/str_cat.h"

namespace Seastitch {

namespace fs = std::filesystem;

size_t CollectedFiles::size() const {
	size_t n = 0;
	for (const auto& [dive, files] : dives) n += files.size();
	for (const auto& [selftest, files] : selftests) n += files.size();
	return n;
}

absl::StatusOr<CollectedFiles> CollectPreProcessingFiles(const std::string& mission_dir,
		const FileClassifier& classifier) {
	std::error_code ec;
	fs::directory_iterator it(mission_dir, ec);
	if (ec) {
		return absl::NotFoundError(absl::StrCat("Could not list ", mission_dir, ": ", ec.message()));
	}

	std::vector<std::string> names;
	for (; it != fs::directory_iterator(); it.increment(ec)) {
		if (ec) {
			return absl::InternalError(absl::StrCat("Could not list ", mission_dir, ": ", ec.message()));
		}
		if (!it->is_regular_file(ec)) continue;
		std::string name = it->path().filename().string();
		if (classifier.IsPreProcessingFile(name)) {
			names.push_back(name);
		}
	}
	std::sort(names.begin(), names.end());

	CollectedFiles collected;
	for (const auto& name : names) {
		std::optional<FileCode> fc = classifier.Classify((fs::path(mission_dir) / name).string());
		if (!fc) {
			LOG(WARNING) << "Could not classify " << name << " - skipping";
			continue;
		}
		if (fc->IsInstrumentNative() && fc->IsPdosLog()) {
			collected.pdos_logs.push_back(*fc);
		}
		if (fc->IsSelftest()) {
			collected.selftests[fc->DiveNumber()].push_back(*fc);
		} else {
			collected.dives[fc->DiveNumber()].push_back(*fc);
		}
	}
	LOG(INFO) << "Found " << collected.size() << " pre-processing file(s) in " << mission_dir
		<< " (" << collected.dives.size() << " dive(s), " << collected.selftests.size() << " selftest(s))";
	return collected;
}

std::map<std::string, std::vector<FileCode>> GroupByBaseName(const std::vector<FileCode>& files) {
	std::map<std::string, std::vector<FileCode>> groups;
	for (const auto& fc : files) {
		groups[fc.BaseName()].push_back(fc);
	}
	return groups;
}

} // End of namespace Seastitch
