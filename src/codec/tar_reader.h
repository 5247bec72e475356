#ifndef INCLUDE_TAR_READER_H_
#define INCLUDE_TAR_READER_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace Seastitch {

struct TarMember {
	std::string name;
	char type = '0';
	uint64_t size = 0;
	uint64_t data_offset = 0;
	// Archive ends before the member's data does
	bool truncated = false;

	bool IsRegular() const { return type == '0' || type == '\0' || type == '7'; }
	bool IsDirectory() const { return type == '5'; }
};

/**
 * Reader for POSIX ustar archives (with GNU long names), as written by the
 * instrument. The archive is read into memory; instrument tarballs are small.
 */
class TarReader {
	public:
		static constexpr size_t kBlockSize = 512;

		// Fails when the file cannot be read, is empty or does not start with a
		// valid header.
		static absl::StatusOr<std::unique_ptr<TarReader>> Open(const std::string& path);

		// Next member, std::nullopt at the end of the archive. A corrupt header
		// is an error; iteration cannot continue past it.
		absl::StatusOr<std::optional<TarMember>> Next();

		/**
		 * Extract a regular member below dest_dir, preserving its relative path.
		 * Absolute names and names escaping dest_dir are refused. A truncated
		 * member is written with the bytes present and reported as DataLoss.
		 *
		 * @param out_path Set to the extracted path when the file was written
		 */
		absl::Status Extract(const TarMember& member, const std::string& dest_dir,
				std::string* out_path) const;

		const std::string& path() const { return path_; }

	private:
		TarReader(std::string path, std::string data)
			: path_(std::move(path)), data_(std::move(data)) {}

		static bool ChecksumMatches(const char* header);

		std::string path_;
		std::string data_;
		uint64_t offset_ = 0;
		bool done_ = false;
};

} // End of namespace Seastitch
#endif
