#ifndef INCLUDE_DEFRAGMENTER_H_
#define INCLUDE_DEFRAGMENTER_H_

#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "classifier/file_code.h"
#include "common/run_result.h"
#include "guard/cancellation.h"
#include "reassembly/downstream.h"
#include "reassembly/validation.h"
#include "repair/repair_filters.h"
#include "transfer/transfer_log.h"

namespace Seastitch {

struct GroupOutcome {
	// <root>.r of the group
	std::string defrag_file;
	// Files handed downstream
	std::vector<std::string> outputs;
	// Validation or member problems; the group still counts as processed
	bool incomplete = false;
};

/**
 * Turns the files of one group (all transmissions sharing a base name) into
 * the reconstructed file and hands it downstream:
 *
 *   select -> repair -> validate/concatenate -> choose -> unpack -> downstream
 *
 * Warnings land in the run result's alert report. Structural failures
 * (unreadable container, cannot write the output, downstream refusal) are
 * returned as an error status and fail the group.
 */
class Defragmenter {
	public:
		Defragmenter(FragmentRepairFilters* filters, const TransferLog* transfer_log,
				DownstreamHandler* downstream, std::string scratch_dir);

		/**
		 * @param group  Every transmitted file of the group, in any order
		 * @param cancel Polled between stages; a stop request returns Cancelled
		 */
		absl::StatusOr<GroupOutcome> ProcessGroup(std::vector<FileCode> group, RunResult* result,
				const CancellationToken& cancel);

		/**
		 * Instrument command (pdos) logs are never fragmented: strip escapes,
		 * then decompress (gzip) or copy into the basestation .pdos name.
		 *
		 * @return path of the produced .pdos file
		 */
		absl::StatusOr<std::string> ProcessPdosLog(const FileCode& code, RunResult* result);

	private:
		absl::StatusOr<GroupOutcome> RunStages(std::vector<FileCode> group, RunResult* result,
				const CancellationToken& cancel, ValidationOutcome* outcome);

		// Artifact removal and escape stripping into the scratch directory
		absl::StatusOr<std::vector<Fragment>> Repair(const FileCode& group_code,
				const std::vector<FileCode>& selected);
		// Fails only when not a single fragment could be read
		absl::Status Concatenate(const std::vector<Fragment>& fragments, const std::string& defrag_file,
				ValidationOutcome* outcome);
		// defrag_file holds the concatenated fragments
		bool PreferCompleteCopy(const FileCode& group_code, const FileCode& complete,
				const std::string& defrag_file);
		bool DecompressesCleanly(const FileCode& group_code, const std::string& path,
				const std::string& tag);
		absl::Status Unpack(const FileCode& group_code, const std::string& defrag_file,
				ValidationOutcome* outcome, RunResult* result, GroupOutcome* group_outcome);
		absl::Status UnpackTar(const FileCode& group_code, const std::string& defrag_file,
				ValidationOutcome* outcome, RunResult* result, GroupOutcome* group_outcome);

		absl::Status EnsureScratchDir();
		std::string ScratchPath(const std::string& name) const;

		FragmentRepairFilters* filters_;
		const TransferLog* transfer_log_;
		DownstreamHandler* downstream_;
		std::string scratch_dir_;
};

} // End of namespace Seastitch
#endif
