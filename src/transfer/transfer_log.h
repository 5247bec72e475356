#ifndef INCLUDE_TRANSFER_LOG_H_
#define INCLUDE_TRANSFER_LOG_H_

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>

#include "absl/status/statusor.h"
#include "reassembly/validation.h"

namespace Seastitch {

/**
 * What the communication session recorded about each transfer. Looked up
 * by transmitted fragment name (no directory, no partial suffix).
 */
class TransferLog {
	public:
		virtual ~TransferLog() = default;

		// Fragment size the instrument used for a dive
		virtual int64_t FragmentSize(int dive) const = 0;
		// Fragment moved without a link protocol; no artifact removal applies
		virtual bool IsRawTransfer(const std::string& fragment_name) const = 0;
		virtual const FragmentSizeMap& ReportedSizes() const = 0;
		// Size of the whole file with this base name, 0 when unknown
		virtual int64_t TotalSize(const std::string& base_name) const = 0;
};

/**
 * TransferLog read from a YAML manifest in the mission directory:
 *
 *   fragment_sizes:
 *     12: 4096
 *   fragments:
 *     sg0012lz.x00: {method: raw, expected: 4096, received: 4096}
 *   totals:
 *     sg0012dz: 10000
 *
 * Every section is optional; dives without an entry use the default size.
 */
class ManifestTransferLog : public TransferLog {
	public:
		explicit ManifestTransferLog(int64_t default_fragment_size)
			: default_fragment_size_(default_fragment_size) {}

		// A missing manifest yields an empty log; a malformed one is an error
		static absl::StatusOr<std::unique_ptr<ManifestTransferLog>> Load(const std::string& path,
				int64_t default_fragment_size);
		static absl::StatusOr<std::unique_ptr<ManifestTransferLog>> LoadFromString(
				const std::string& yaml_content, int64_t default_fragment_size);

		int64_t FragmentSize(int dive) const override;
		bool IsRawTransfer(const std::string& fragment_name) const override;
		const FragmentSizeMap& ReportedSizes() const override { return sizes_; }
		int64_t TotalSize(const std::string& base_name) const override;

		void SetFragmentSize(int dive, int64_t size) { dive_fragment_sizes_[dive] = size; }
		void AddFragment(const std::string& fragment_name, FragmentSizes sizes, bool raw);
		void SetTotalSize(const std::string& base_name, int64_t size) { totals_[base_name] = size; }

	private:
		int64_t default_fragment_size_;
		std::map<int, int64_t> dive_fragment_sizes_;
		std::set<std::string> raw_transfers_;
		FragmentSizeMap sizes_;
		std::map<std::string, int64_t> totals_;
};

} // End of namespace Seastitch
#endif
