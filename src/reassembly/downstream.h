#ifndef INCLUDE_DOWNSTREAM_H_
#define INCLUDE_DOWNSTREAM_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "classifier/file_code.h"
#include "common/run_result.h"

namespace Seastitch {

/**
 * Content-specific processing of reconstructed files. Everything here sits
 * past the reassembly boundary; the engine only cares whether it succeeded.
 */
class DownstreamHandler {
	public:
		virtual ~DownstreamHandler() = default;

		/**
		 * A reconstructed, unpacked file of the group described by code.
		 * A failure marks the group failed.
		 */
		virtual absl::Status HandleFile(const FileCode& code, const std::string& path,
				RunResult* result) = 0;

		// Regular files extracted from an instrument tar archive
		virtual absl::Status HandleTarMembers(const FileCode& container,
				const std::vector<std::string>& members, RunResult* result) = 0;

		// Repaired fragments of a logger payload group, in slot order
		virtual absl::Status HandleLoggerPayload(const FileCode& code,
				const std::vector<std::string>& fragments, RunResult* result) = 0;

		// Files extracted from a logger tar archive
		virtual absl::Status HandleLoggerTarMembers(const FileCode& container,
				const std::vector<std::string>& members, RunResult* result) = 0;
};

/**
 * Moves reconstructed instrument files to their basestation names
 * (p<id><dive>.log, .dat, .cap, pt... for selftests) and records every file
 * it produces in the run result.
 */
class BasestationDownstream : public DownstreamHandler {
	public:
		absl::Status HandleFile(const FileCode& code, const std::string& path,
				RunResult* result) override;
		absl::Status HandleTarMembers(const FileCode& container,
				const std::vector<std::string>& members, RunResult* result) override;
		absl::Status HandleLoggerPayload(const FileCode& code,
				const std::vector<std::string>& fragments, RunResult* result) override;
		absl::Status HandleLoggerTarMembers(const FileCode& container,
				const std::vector<std::string>& members, RunResult* result) override;
};

} // End of namespace Seastitch
#endif
