#include "engine/dive_processing_engine.h"

#include <exception>
#include <map>
#include <set>
#include <utility>

#include <glog/logging.h>

#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "engine/file_collector.h"

namespace Seastitch {

namespace {

std::vector<std::string> Paths(const std::vector<FileCode>& group) {
	std::vector<std::string> paths;
	paths.reserve(group.size());
	for (const auto& fc : group) paths.push_back(fc.full_path());
	return paths;
}

void RecordDiveOutcome(int rc, int number, std::set<int>* processed, std::set<int>* failed) {
	if (rc == DiveProcessingEngine::kProcessed) {
		processed->insert(number);
	} else if (rc == DiveProcessingEngine::kFailed) {
		failed->insert(number);
	}
}

} // namespace

DiveProcessingEngine::DiveProcessingEngine(std::string mission_dir, const FileClassifier* classifier,
		ProcessedFileCache* cache, Defragmenter* defragmenter, bool force)
	: mission_dir_(std::move(mission_dir)),
	classifier_(classifier),
	cache_(cache),
	defragmenter_(defragmenter),
	force_(force) {}

absl::StatusOr<RunResult> DiveProcessingEngine::Run(const CancellationToken& cancel) {
	absl::StatusOr<CollectedFiles> collected = CollectPreProcessingFiles(mission_dir_, *classifier_);
	if (!collected.ok()) return collected.status();

	if (force_) {
		LOG(INFO) << "Forcing reprocessing of every file group";
		cache_->Clear();
	} else {
		absl::Status status = cache_->Read();
		if (!status.ok()) {
			LOG(ERROR) << "Could not read " << cache_->path() << ": " << status;
			return status;
		}
	}

	RunResult result;
	for (const auto& [selftest, files] : collected->selftests) {
		if (cancel.IsCancelled()) break;
		LOG(INFO) << "Processing selftest " << selftest;
		int rc = ProcessDive(selftest, files, &result, cancel);
		RecordDiveOutcome(rc, selftest, &result.processed_selftests, &result.failed_selftests);
	}

	if (!cancel.IsCancelled()) {
		ProcessPdosLogs(collected->pdos_logs, &result, cancel);
	}

	for (const auto& [dive, files] : collected->dives) {
		if (cancel.IsCancelled()) break;
		VLOG(1) << "\t[DiveProcessingEngine]\tProcessing dive " << dive;
		int rc = ProcessDive(dive, files, &result, cancel);
		RecordDiveOutcome(rc, dive, &result.processed_dives, &result.failed_dives);
	}

	if (cancel.IsCancelled()) {
		LOG(WARNING) << "Stop requested - skipping remaining processing";
		result.cancelled = true;
	}

	// Whatever completed before a stop request is still recorded
	absl::Status status = cache_->Write();
	if (!status.ok()) {
		LOG(ERROR) << "Could not write " << cache_->path() << ": " << status;
		return status;
	}
	return result;
}

bool DiveProcessingEngine::ShouldProcess(const std::string& base,
		const std::vector<FileCode>& group) const {
	return force_ || cache_->IsStale(base, Paths(group));
}

DiveProcessingEngine::GroupResult DiveProcessingEngine::ProcessGroup(const std::string& base,
		const std::vector<FileCode>& group, RunResult* result, const CancellationToken& cancel) {
	const absl::Time started = ProcessedFileCache::StampFor(absl::Now());
	const std::string defrag_file = group.front().ReceivedPath();

	absl::StatusOr<GroupOutcome> outcome;
	try {
		outcome = defragmenter_->ProcessGroup(group, result, cancel);
	} catch (const std::exception& e) {
		outcome = absl::InternalError(absl::StrCat("Unexpected error processing ", base, ": ", e.what()));
	}

	if (outcome.ok()) {
		cache_->MarkProcessed(base, started);
		if (outcome->incomplete) {
			LOG(WARNING) << "Processed " << base << " with problems, see " << defrag_file;
		}
		return GroupResult::kSucceeded;
	}
	if (absl::IsCancelled(outcome.status())) {
		LOG(WARNING) << "Stopped while processing " << base << ": " << outcome.status().message();
		return GroupResult::kCancelled;
	}
	LOG(ERROR) << "Could not process " << base << " - skipping: " << outcome.status();
	result->incomplete_files.insert(defrag_file);
	return GroupResult::kFailed;
}

int DiveProcessingEngine::ProcessDive(int number, const std::vector<FileCode>& files,
		RunResult* result, const CancellationToken& cancel) {
	int ret = kNothingNew;
	bool force_data_processing = false;
	std::map<std::string, std::vector<FileCode>> groups = GroupByBaseName(files);

	// Phase 1: instrument logs, which the data files of the dive depend on
	for (auto it = groups.begin(); it != groups.end();) {
		const FileCode& fc = it->second.front();
		if (!(fc.IsInstrumentNative() && fc.IsLog()) || !ShouldProcess(it->first, it->second)) {
			++it;
			continue;
		}
		if (cancel.IsCancelled()) {
			result->cancelled = true;
			return ret;
		}
		switch (ProcessGroup(it->first, it->second, result, cancel)) {
			case GroupResult::kSucceeded:
				force_data_processing = true;
				if (ret == kNothingNew) ret = kProcessed;
				it = groups.erase(it);
				continue;
			case GroupResult::kCancelled:
				result->cancelled = true;
				return ret;
			case GroupResult::kFailed:
				ret = kFailed;
				break;
		}
		++it;
	}

	// Phase 2: everything else
	for (const auto& [base, group] : groups) {
		const FileCode& fc = group.front();
		if (fc.IsInstrumentNative() && fc.IsPdosLog()) {
			// Handled by the pdos pass
			continue;
		}
		if (fc.IsInstrumentNative() && fc.IsLog()) {
			// Phase 1 already decided on logs
			continue;
		}
		bool forced_data = force_data_processing && fc.IsInstrumentNative() && fc.IsData();
		if (!forced_data && !ShouldProcess(base, group)) {
			VLOG(2) << "\t[DiveProcessingEngine]\t" << base << " already processed";
			continue;
		}
		if (cancel.IsCancelled()) {
			result->cancelled = true;
			return ret;
		}
		switch (ProcessGroup(base, group, result, cancel)) {
			case GroupResult::kSucceeded:
				if (ret == kNothingNew) ret = kProcessed;
				break;
			case GroupResult::kCancelled:
				result->cancelled = true;
				return ret;
			case GroupResult::kFailed:
				ret = kFailed;
				break;
		}
	}

	VLOG(1) << "\t[DiveProcessingEngine]\tProcessDive(" << number << ") = " << ret;
	return ret;
}

void DiveProcessingEngine::ProcessPdosLogs(const std::vector<FileCode>& pdos_logs,
		RunResult* result, const CancellationToken& cancel) {
	for (const auto& fc : pdos_logs) {
		if (cancel.IsCancelled()) {
			result->cancelled = true;
			return;
		}
		const std::string& name = fc.name();
		if (!force_ && !cache_->IsPdosLogStale(name, fc.full_path())) {
			continue;
		}
		const absl::Time started = ProcessedFileCache::StampFor(absl::Now());
		absl::StatusOr<std::string> produced = defragmenter_->ProcessPdosLog(fc, result);
		if (!produced.ok()) {
			LOG(ERROR) << "Could not process " << fc.full_path() << " - skipping: " << produced.status();
			result->incomplete_files.insert(fc.full_path());
			continue;
		}
		cache_->MarkPdosLogProcessed(name, started);
	}
}

size_t DiveProcessingEngine::InvalidateDive(int dive) {
	return cache_->InvalidateDive(dive);
}

} // End of namespace Seastitch
