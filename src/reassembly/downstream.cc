#include "reassembly/downstream.h"

#include <cerrno>
#include <cstdio>

#include <glog/logging.h>

#include "absl/strings/str_cat.h"
#include "common/file_utils.h"

namespace Seastitch {

namespace {

absl::Status MoveFile(const std::string& from, const std::string& to) {
	if (rename(from.c_str(), to.c_str()) != 0) {
		return ErrnoStatus(errno, absl::StrCat("rename to ", to), from);
	}
	VLOG(1) << "\t[Downstream]\tMoved " << from << " to " << to;
	return absl::OkStatus();
}

absl::Status CopyFile(const std::string& from, const std::string& to) {
	absl::StatusOr<std::string> data = ReadFileContents(from);
	if (!data.ok()) return data.status();
	return WriteFileContents(to, *data);
}

} // namespace

absl::Status BasestationDownstream::HandleFile(const FileCode& code, const std::string& path,
		RunResult* result) {
	if (code.IsInstrumentNative()) {
		std::vector<std::string>& eng_and_log = code.IsSelftest()
			? result->processed_selftest_files : result->processed_log_files;
		switch (code.kind()) {
			case FileKind::kParm:
				// Already decompressed into its basestation name
				result->processed_other_files.push_back(path);
				return absl::OkStatus();
			case FileKind::kLog:
			case FileKind::kNetworkLog: {
				std::string target = code.BaseLogName();
				absl::Status status = MoveFile(path, target);
				if (!status.ok()) return status;
				eng_and_log.push_back(target);
				return absl::OkStatus();
			}
			case FileKind::kData:
			case FileKind::kNetworkProfile: {
				std::string target = code.BaseDataName();
				absl::Status status = CopyFile(path, target);
				if (!status.ok()) return status;
				eng_and_log.push_back(target);
				return absl::OkStatus();
			}
			case FileKind::kCapture: {
				std::string target = code.BaseCaptureName();
				absl::Status status = MoveFile(path, target);
				if (!status.ok()) return status;
				result->processed_other_files.push_back(target);
				return absl::OkStatus();
			}
			default:
				break;
		}
	} else if (code.IsLogger()) {
		std::string target;
		if (code.IsLog()) {
			target = code.BaseLogName();
		} else if (code.IsLoggerData()) {
			target = code.BaseDataName();
		} else {
			return absl::UnimplementedError(absl::StrCat("Don't know how to deal with logger file (",
						path, ") - unknown type"));
		}
		absl::Status status = MoveFile(path, target);
		if (!status.ok()) return status;
		result->processed_logger_files[code.LoggerPrefix()].push_back(target);
		result->processed_other_files.push_back(target);
		return absl::OkStatus();
	}
	return absl::UnimplementedError(absl::StrCat("Don't know how to deal with file (",
				path, ") - unknown type"));
}

absl::Status BasestationDownstream::HandleTarMembers(const FileCode& container,
		const std::vector<std::string>& members, RunResult* result) {
	VLOG(1) << "\t[Downstream]\t" << members.size() << " member(s) from " << container.full_path();
	result->processed_other_files.insert(result->processed_other_files.end(),
			members.begin(), members.end());
	return absl::OkStatus();
}

absl::Status BasestationDownstream::HandleLoggerPayload(const FileCode& code,
		const std::vector<std::string>& fragments, RunResult* result) {
	std::vector<std::string>& logger_files = result->processed_logger_files[code.LoggerPrefix()];
	for (const auto& fragment : fragments) {
		logger_files.push_back(fragment);
		result->processed_other_files.push_back(fragment);
	}
	return absl::OkStatus();
}

absl::Status BasestationDownstream::HandleLoggerTarMembers(const FileCode& container,
		const std::vector<std::string>& members, RunResult* result) {
	std::vector<std::string>& logger_files = result->processed_logger_files[container.LoggerPrefix()];
	logger_files.insert(logger_files.end(), members.begin(), members.end());
	return absl::OkStatus();
}

} // End of namespace Seastitch
