#ifndef INCLUDE_REPAIR_FILTERS_H_
#define INCLUDE_REPAIR_FILTERS_H_

#include <cstdint>
#include <string>

#include "absl/status/status.h"

namespace Seastitch {

/**
 * Byte-level repair applied to every raw fragment before reassembly.
 * Both transforms read src and write dst; dst is always written on success.
 */
class FragmentRepairFilters {
	public:
		virtual ~FragmentRepairFilters() = default;

		/**
		 * Remove transmission artifacts: sectors the modem duplicated and
		 * sectors made entirely of padding.
		 */
		virtual absl::Status RemoveArtifacts(const std::string& src, const std::string& dst) = 0;

		/**
		 * Remove trailing escape padding (0x1A). With a size hint the output is
		 * truncated to size_hint bytes; without one (0) trailing 0x1A pairs are
		 * removed.
		 */
		virtual absl::Status StripEscapes(const std::string& src, const std::string& dst,
				int64_t size_hint) = 0;
};

class DefaultRepairFilters : public FragmentRepairFilters {
	public:
		static constexpr size_t kSectorSize = 128;
		static constexpr char kPadByte = 0x1A;

		absl::Status RemoveArtifacts(const std::string& src, const std::string& dst) override;
		absl::Status StripEscapes(const std::string& src, const std::string& dst,
				int64_t size_hint) override;

		// Pure transforms behind the file-level filters
		static std::string RemoveDuplicateSectors(const std::string& data,
				size_t* duplicates_removed, size_t* padding_removed);
		static std::string StripTrailingPadding(const std::string& data, int64_t size_hint,
				size_t* lost_data_bytes);
};

} // End of namespace Seastitch
#endif
