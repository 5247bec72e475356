#ifndef INCLUDE_DIVE_PROCESSING_ENGINE_H_
#define INCLUDE_DIVE_PROCESSING_ENGINE_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "cache/processed_file_cache.h"
#include "classifier/file_code.h"
#include "common/run_result.h"
#include "guard/cancellation.h"
#include "reassembly/defragmenter.h"

namespace Seastitch {

/**
 * Incremental driver over a mission directory. Each run reassembles only the
 * groups that are new or changed since the cache last recorded them.
 *
 * Order: selftests, then instrument command (pdos) logs, then dives. Within a
 * dive or selftest, instrument log groups go first because a data file is
 * only meaningful next to its log; a data group whose log was just
 * reprocessed is reprocessed as well.
 *
 * The engine is single threaded. The cancellation token is polled between
 * groups and, inside the defragmenter, between stages.
 */
class DiveProcessingEngine {
	public:
		// Per-dive outcome
		static constexpr int kNothingNew = 0;
		static constexpr int kProcessed = 1;
		static constexpr int kFailed = -1;

		DiveProcessingEngine(std::string mission_dir, const FileClassifier* classifier,
				ProcessedFileCache* cache, Defragmenter* defragmenter, bool force = false);

		/**
		 * Collect, read the cache, process, write the cache. Only failures to
		 * list the mission directory or to read or write the cache are errors;
		 * group failures are reported in the result.
		 */
		absl::StatusOr<RunResult> Run(const CancellationToken& cancel);

		/**
		 * Process the groups of one dive or selftest. The cache must already be
		 * loaded. Returns kNothingNew, kProcessed or kFailed.
		 */
		int ProcessDive(int number, const std::vector<FileCode>& files, RunResult* result,
				const CancellationToken& cancel);

		// Forget a dive so the next run retries it
		size_t InvalidateDive(int dive);

	private:
		enum class GroupResult { kSucceeded, kFailed, kCancelled };

		GroupResult ProcessGroup(const std::string& base, const std::vector<FileCode>& group,
				RunResult* result, const CancellationToken& cancel);
		void ProcessPdosLogs(const std::vector<FileCode>& pdos_logs, RunResult* result,
				const CancellationToken& cancel);
		bool ShouldProcess(const std::string& base, const std::vector<FileCode>& group) const;

		std::string mission_dir_;
		const FileClassifier* classifier_;
		ProcessedFileCache* cache_;
		Defragmenter* defragmenter_;
		bool force_;
};

} // End of namespace Seastitch
#endif
