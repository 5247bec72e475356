#include "reassembly/defragmenter.h"

#include <sys/stat.h>
#include <utime.h>

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <system_error>
#include <utility>

#include <glog/logging.h>

#include "absl/strings/str_cat.h"
#include "codec/codecs.h"
#include "codec/tar_reader.h"
#include "common/file_utils.h"
#include "common/scoped_fd.h"
#include "reassembly/fragment_selector.h"
#include "reassembly/fragment_validator.h"
#include "reassembly/resend_hint.h"

namespace Seastitch {

namespace {

// dir/sg0012lz.x03 -> dir/sg0012lu.r
std::string ReceivedPathWithPacking(const FileCode& code, char packing) {
	return SplitExtension(code.WithPacking(packing)).first + ".r";
}

absl::Status CheckCancelled(const CancellationToken& cancel, const std::string& stage) {
	if (cancel.IsCancelled()) {
		return absl::CancelledError(absl::StrCat("Stop requested before ", stage));
	}
	return absl::OkStatus();
}

absl::Status CopyBytes(const std::string& from, const std::string& to) {
	absl::StatusOr<std::string> data = ReadFileContents(from);
	if (!data.ok()) return data.status();
	return WriteFileContents(to, *data);
}

} // namespace

Defragmenter::Defragmenter(FragmentRepairFilters* filters, const TransferLog* transfer_log,
		DownstreamHandler* downstream, std::string scratch_dir)
	: filters_(filters),
	transfer_log_(transfer_log),
	downstream_(downstream),
	scratch_dir_(std::move(scratch_dir)) {}

absl::StatusOr<GroupOutcome> Defragmenter::ProcessGroup(std::vector<FileCode> group,
		RunResult* result, const CancellationToken& cancel) {
	if (group.empty()) {
		return absl::InvalidArgumentError("Empty file group");
	}
	const std::string defrag_file = group.front().ReceivedPath();

	ValidationOutcome outcome;
	absl::StatusOr<GroupOutcome> group_outcome = RunStages(std::move(group), result, cancel, &outcome);

	// Warnings gathered before a failure are still worth reporting
	result->AddAlerts(defrag_file, outcome);
	if (group_outcome.ok() && !outcome.empty()) {
		group_outcome->incomplete = true;
	}
	return group_outcome;
}

absl::StatusOr<GroupOutcome> Defragmenter::RunStages(std::vector<FileCode> group,
		RunResult* result, const CancellationToken& cancel, ValidationOutcome* outcome) {
	std::sort(group.begin(), group.end(), FragmentLess);

	std::optional<FileCode> complete;
	std::vector<FileCode> fragments;
	for (auto& code : group) {
		if (code.IsCompleteTransmission()) {
			complete = code;
		} else {
			fragments.push_back(code);
		}
	}

	const FileCode& group_code = fragments.empty() ? *complete : fragments.front();
	GroupOutcome group_outcome;
	group_outcome.defrag_file = group_code.ReceivedPath();
	const std::string& defrag_file = group_outcome.defrag_file;
	LOG(INFO) << "Processing " << SplitExtension(group_code.non_partial_path()).first;

	// Fragment problems are reported only when the fragments are what gets used
	ValidationOutcome fragment_outcome;
	std::vector<FileCode> selected = SelectFragments(fragments, &fragment_outcome);

	absl::Status status = EnsureScratchDir();
	if (!status.ok()) return status;

	if (group_code.IsLoggerPayload()) {
		// Payload files go to the logger as they are, after repair
		outcome->Merge(fragment_outcome);
		std::vector<FileCode> parts = selected;
		if (parts.empty()) parts.push_back(*complete);
		status = CheckCancelled(cancel, "repair");
		if (!status.ok()) return status;
		absl::StatusOr<std::vector<Fragment>> repaired = Repair(group_code, parts);
		if (!repaired.ok()) return repaired.status();

		std::vector<std::string> paths;
		for (const auto& fragment : *repaired) paths.push_back(fragment.path);
		status = downstream_->HandleLoggerPayload(group_code, paths, result);
		if (!status.ok()) {
			LOG(ERROR) << "Problems processing logger file " << defrag_file << ": " << status;
		}
		group_outcome.outputs = std::move(paths);
		return group_outcome;
	}

	bool use_complete = false;
	if (complete && selected.size() < 2) {
		if (!selected.empty()) {
			LOG(INFO) << "Using complete copy " << complete->full_path() << " over single fragment "
				<< selected.front().full_path();
		}
		use_complete = true;
	} else {
		status = CheckCancelled(cancel, "repair");
		if (!status.ok()) return status;
		absl::StatusOr<std::vector<Fragment>> repaired = Repair(group_code, selected);
		if (!repaired.ok()) {
			outcome->Merge(fragment_outcome);
			return repaired.status();
		}

		status = CheckCancelled(cancel, "concatenation");
		if (!status.ok()) return status;
		fragment_outcome.Merge(ValidateFragments(defrag_file, *repaired,
					transfer_log_->FragmentSize(group_code.DiveNumber()),
					transfer_log_->ReportedSizes(),
					transfer_log_->TotalSize(group_code.BaseName())));
		status = Concatenate(*repaired, defrag_file, &fragment_outcome);
		if (!status.ok()) {
			if (!complete) {
				outcome->Merge(fragment_outcome);
				return status;
			}
			LOG(WARNING) << status << " - falling back to complete copy " << complete->full_path();
			use_complete = true;
		} else if (complete) {
			use_complete = PreferCompleteCopy(group_code, *complete, defrag_file);
		}
	}

	if (use_complete) {
		if (!fragment_outcome.empty()) {
			LOG(INFO) << "Dropping " << fragment_outcome.entries.size() << " fragment problem(s) of "
				<< defrag_file << ", complete copy " << complete->full_path() << " is used";
		}
		status = CopyBytes(complete->full_path(), defrag_file);
		if (!status.ok()) return status;
	} else {
		outcome->Merge(fragment_outcome);
	}

	status = CheckCancelled(cancel, "unpacking");
	if (!status.ok()) return status;
	status = Unpack(group_code, defrag_file, outcome, result, &group_outcome);
	if (!status.ok()) return status;
	return group_outcome;
}

absl::StatusOr<std::vector<Fragment>> Defragmenter::Repair(const FileCode& group_code,
		const std::vector<FileCode>& selected) {
	const int64_t fragment_size = transfer_log_->FragmentSize(group_code.DiveNumber());
	const bool payload = group_code.IsLoggerPayload();

	std::vector<Fragment> repaired;
	for (size_t i = 0; i < selected.size(); ++i) {
		const FileCode& code = selected[i];
		const std::string transmitted = Basename(code.full_path());
		const bool raw = transfer_log_->IsRawTransfer(transmitted) || transfer_log_->IsRawTransfer(code.name());
		const bool last = i + 1 == selected.size();
		std::string current = code.full_path();
		VLOG(2) << "\t[Defragmenter]\tfragment:" << transmitted << " raw:" << raw
			<< " logger_payload:" << payload << " strip_files:" << code.IsLoggerStripFiles();

		if (!raw) {
			std::string out = ScratchPath(transmitted + ".bogue");
			absl::Status status = filters_->RemoveArtifacts(current, out);
			if (status.ok()) {
				current = out;
			} else if (payload) {
				LOG(WARNING) << "Artifact removal failed for " << transmitted << ", using as is: " << status;
			} else {
				LOG(ERROR) << "Couldn't remove artifacts from " << transmitted << " - skipping: " << status;
				return status;
			}
		}

		if (!raw || payload || (code.IsLoggerStripFiles() && last)) {
			std::string out = ScratchPath(transmitted + ".1a");
			// Size mismatches are expected in the last fragment and in payload files
			int64_t size_hint = (last || payload) ? 0 : fragment_size;
			absl::Status status = filters_->StripEscapes(current, out, size_hint);
			if (status.ok()) {
				current = out;
			} else if (payload) {
				LOG(WARNING) << "Escape stripping failed for " << transmitted << ", using as is: " << status;
			} else {
				LOG(ERROR) << "Couldn't strip escapes from " << transmitted << " - skipping: " << status;
				return status;
			}
		}
		repaired.push_back({code, current});
	}
	return repaired;
}

absl::Status Defragmenter::Concatenate(const std::vector<Fragment>& fragments,
		const std::string& defrag_file, ValidationOutcome* outcome) {
	VLOG(1) << "\t[Defragmenter]\tConcatenating " << fragments.size() << " fragment(s) into " << defrag_file;
	ScopedFd fd = ScopedFd::Open(defrag_file, O_WRONLY | O_CREAT | O_TRUNC);
	if (!fd.valid()) {
		return ErrnoStatus(errno, "Could not create", defrag_file);
	}
	size_t appended = 0;
	for (const auto& fragment : fragments) {
		absl::StatusOr<std::string> data = ReadFileContents(fragment.path);
		if (!data.ok()) {
			std::string msg = absl::StrCat("Could not read fragment ", fragment.code.full_path(),
					" (", data.status().message(), ")");
			LOG(WARNING) << msg;
			outcome->Fail(msg, GenerateResend(fragment.code));
			continue;
		}
		absl::Status status = AppendFileContents(fd.get(), *data, defrag_file);
		if (!status.ok()) return status;
		++appended;
	}
	if (fd.Close() != 0) {
		return ErrnoStatus(errno, "Could not close", defrag_file);
	}
	if (appended == 0) {
		return absl::DataLossError(absl::StrCat("None of the ", fragments.size(),
					" fragment(s) of ", defrag_file, " could be read"));
	}
	return absl::OkStatus();
}

bool Defragmenter::DecompressesCleanly(const FileCode& group_code, const std::string& path,
		const std::string& tag) {
	const std::string out = ScratchPath(absl::StrCat(group_code.BaseName(), ".", tag));
	absl::StatusOr<uint64_t> written = absl::InternalError("no codec");
	if (group_code.IsGzip() || group_code.IsParm() || group_code.IsTarGzip()) {
		written = DecompressGzip(path, out);
	} else if (group_code.IsBzip() || group_code.IsTarBzip()) {
		written = DecompressBzip2(path, out);
	}
	if (!written.ok()) {
		VLOG(1) << "\t[Defragmenter]\t" << tag << " copy does not decompress: " << written.status();
		return false;
	}
	if (!group_code.IsTarGzip() && !group_code.IsTarBzip()) {
		return true;
	}

	absl::StatusOr<std::unique_ptr<TarReader>> reader = TarReader::Open(out);
	if (!reader.ok()) return false;
	while (true) {
		absl::StatusOr<std::optional<TarMember>> member = (*reader)->Next();
		if (!member.ok()) return false;
		if (!member->has_value()) return true;
		if ((*member)->truncated) return false;
	}
}

bool Defragmenter::PreferCompleteCopy(const FileCode& group_code, const FileCode& complete,
		const std::string& defrag_file) {
	bool use_complete;
	if (group_code.IsCompressed()) {
		bool fragments_ok = DecompressesCleanly(group_code, defrag_file, "fragments");
		bool complete_ok = DecompressesCleanly(group_code, complete.full_path(), "complete");
		use_complete = !fragments_ok && complete_ok;
		if (!fragments_ok && !complete_ok) {
			LOG(WARNING) << "Neither " << complete.full_path() << " nor the fragments of "
				<< defrag_file << " decompress cleanly, using the fragments";
		}
	} else {
		use_complete = !group_code.IsSelftest();
	}

	if (use_complete) {
		LOG(INFO) << "Using complete copy " << complete.full_path() << " over fragments";
	} else {
		LOG(INFO) << "Using fragments over complete copy " << complete.full_path();
	}
	return use_complete;
}

absl::Status Defragmenter::Unpack(const FileCode& group_code, const std::string& defrag_file,
		ValidationOutcome* outcome, RunResult* result, GroupOutcome* group_outcome) {
	LOG(INFO) << "Unpacking " << defrag_file;
	if (group_code.IsAnyTar()) {
		return UnpackTar(group_code, defrag_file, outcome, result, group_outcome);
	}

	std::string file;
	if (group_code.IsGzip() || group_code.IsBzip()) {
		file = ReceivedPathWithPacking(group_code, 'u');
		VLOG(1) << "\t[Defragmenter]\tDecompressing " << defrag_file << " to " << file;
		absl::StatusOr<uint64_t> written = group_code.IsGzip()
			? DecompressGzip(defrag_file, file) : DecompressBzip2(defrag_file, file);
		if (!written.ok()) {
			LOG(ERROR) << "Problem decompressing " << defrag_file << " - skipping: " << written.status();
			return written.status();
		}
	} else if (group_code.IsInstrument() && group_code.IsParm()) {
		// The parameter file has no uncompressed form in the transmitted namespace
		file = group_code.BaseParmName();
		absl::StatusOr<uint64_t> written = DecompressGzip(defrag_file, file);
		if (!written.ok()) {
			LOG(ERROR) << "Problem decompressing " << defrag_file << " - skipping: " << written.status();
			return written.status();
		}
	} else {
		file = defrag_file;
	}

	VLOG(1) << "\t[Defragmenter]\tContent specific processing of " << file;
	absl::Status status = downstream_->HandleFile(group_code, file, result);
	if (!status.ok()) return status;
	group_outcome->outputs.push_back(file);
	return absl::OkStatus();
}

absl::Status Defragmenter::UnpackTar(const FileCode& group_code, const std::string& defrag_file,
		ValidationOutcome* outcome, RunResult* result, GroupOutcome* group_outcome) {
	std::string tar_file = defrag_file;
	if (group_code.IsTarGzip() || group_code.IsTarBzip()) {
		tar_file = ReceivedPathWithPacking(group_code, 't');
		absl::StatusOr<uint64_t> written = group_code.IsTarGzip()
			? DecompressGzip(defrag_file, tar_file) : DecompressBzip2(defrag_file, tar_file);
		if (!written.ok()) {
			// Whatever was recovered may still hold complete members
			LOG(ERROR) << "Problem decompressing " << defrag_file << ": " << written.status();
			outcome->Fail(absl::StrCat("Problem decompressing ", defrag_file, " (",
						written.status().message(), ")"));
			absl::StatusOr<int64_t> size = FileSize(tar_file);
			if (!size.ok() || *size == 0) return written.status();
		}
	}

	absl::StatusOr<std::unique_ptr<TarReader>> reader = TarReader::Open(tar_file);
	if (!reader.ok()) {
		LOG(ERROR) << "Error reading " << tar_file << " - skipping: " << reader.status();
		return reader.status();
	}

	std::string dest_dir = defrag_file.substr(0, defrag_file.size() - Basename(defrag_file).size());
	if (dest_dir.empty()) dest_dir = ".";
	std::vector<std::string> members;
	while (true) {
		absl::StatusOr<std::optional<TarMember>> member = (*reader)->Next();
		if (!member.ok()) {
			LOG(WARNING) << member.status();
			outcome->Fail(std::string(member.status().message()));
			break;
		}
		if (!member->has_value()) break;
		const TarMember& m = **member;
		if (!m.IsRegular()) continue;

		LOG(INFO) << "Extracting " << m.name << " from " << tar_file << " to directory " << dest_dir;
		std::string extracted;
		absl::Status status = (*reader)->Extract(m, dest_dir, &extracted);
		if (!status.ok()) {
			LOG(WARNING) << "Potential problems extracting " << m.name << " (" << status << ")";
			outcome->Fail(absl::StrCat("Potential problems extracting ", m.name, " from ", tar_file,
						" (", status.message(), ")"));
			if (extracted.empty()) continue;
		}

		if (chmod(extracted.c_str(), S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH) != 0 ||
				utime(extracted.c_str(), nullptr) != 0) {
			absl::Status err = ErrnoStatus(errno, "Could not access", extracted);
			LOG(ERROR) << err << " - potential problem with tar file extraction";
			outcome->Fail(std::string(err.message()));
			continue;
		}
		members.push_back(extracted);
	}

	absl::Status status = group_code.IsLogger()
		? downstream_->HandleLoggerTarMembers(group_code, members, result)
		: downstream_->HandleTarMembers(group_code, members, result);
	if (!status.ok()) return status;
	group_outcome->outputs.insert(group_outcome->outputs.end(), members.begin(), members.end());
	return absl::OkStatus();
}

absl::StatusOr<std::string> Defragmenter::ProcessPdosLog(const FileCode& code, RunResult* result) {
	LOG(INFO) << "Processing " << code.full_path();
	absl::Status status = EnsureScratchDir();
	if (!status.ok()) return status;

	const std::string stripped = ScratchPath(Basename(code.full_path()) + ".1a");
	status = filters_->StripEscapes(code.full_path(), stripped, 0);
	if (!status.ok()) {
		LOG(ERROR) << "Couldn't strip escapes from " << code.full_path() << ": " << status;
		return status;
	}

	const std::string target = code.BasePdosLogName();
	if (code.IsGzip()) {
		absl::StatusOr<uint64_t> written = DecompressGzip(stripped, target);
		if (!written.ok()) {
			LOG(ERROR) << "Error decompressing " << code.full_path() << ": " << written.status();
			result->incomplete_files.insert(code.full_path());
			return written.status();
		}
	} else {
		status = CopyBytes(stripped, target);
		if (!status.ok()) return status;
	}
	result->processed_pdos_logs.push_back(target);
	return target;
}

absl::Status Defragmenter::EnsureScratchDir() {
	std::error_code ec;
	std::filesystem::create_directories(scratch_dir_, ec);
	if (ec) {
		return absl::InternalError(absl::StrCat("Could not create scratch directory ",
					scratch_dir_, ": ", ec.message()));
	}
	return absl::OkStatus();
}

std::string Defragmenter::ScratchPath(const std::string& name) const {
	return JoinPath(scratch_dir_, name);
}

} // End of namespace Seastitch
