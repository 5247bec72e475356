#include "reassembly/fragment_validator.h"

#include <glog/logging.h>

#include "absl/strings/str_cat.h"
#include "common/file_utils.h"
#include "reassembly/resend_hint.h"

namespace Seastitch {

namespace {

std::string WithHint(const std::string& message, const std::optional<std::string>& hint) {
	return hint ? absl::StrCat(message, " - consider ", *hint) : message;
}

} // namespace

ValidationOutcome ValidateFragments(const std::string& defrag_file,
		const std::vector<Fragment>& fragments, int64_t fragment_size,
		const FragmentSizeMap& sizes, int64_t total_size) {
	ValidationOutcome outcome;

	if (fragment_size <= 0) {
		LOG(INFO) << "Fragment size specified is " << fragment_size
			<< ", skipping file fragment check for " << defrag_file;
		return outcome;
	}

	const int64_t count = static_cast<int64_t>(fragments.size());
	int64_t last_expected_size = 0;
	if (total_size > 0) {
		int64_t expected_count = (total_size + fragment_size - 1) / fragment_size;
		last_expected_size = total_size % fragment_size;
		if (last_expected_size == 0) last_expected_size = fragment_size;

		if (count == expected_count) {
			VLOG(1) << "\t[ValidateFragments]\tGot " << count << " fragments, expected " << expected_count;
		} else if (count < expected_count) {
			LOG(INFO) << "Missing fragments: total size logged was " << total_size
				<< ", got " << count << ", expected " << expected_count;
		} else {
			LOG(INFO) << "Too many fragments: total size logged was " << total_size
				<< "; got " << count << ", expected " << expected_count;
		}
	}

	int64_t size_from_fragments = 0;
	int next_slot = 0;
	for (size_t i = 0; i < fragments.size(); ++i) {
		const Fragment& fragment = fragments[i];
		VLOG(2) << "\t[ValidateFragments]\tChecking fragment " << fragment.path;

		int slot = fragment.code.FragmentIndex().value_or(next_slot);
		for (; next_slot < slot; ++next_slot) {
			std::string msg = absl::StrCat("Fragment ", next_slot, " for file ", defrag_file, " is missing");
			std::optional<std::string> hint = GenerateResend(fragment.code, next_slot);
			LOG(WARNING) << msg;
			outcome.Fail(WithHint(msg, hint), hint);
		}
		next_slot = slot + 1;

		int64_t current_size = 0;
		absl::StatusOr<int64_t> size = FileSize(fragment.path);
		if (size.ok()) {
			current_size = *size;
		} else {
			LOG(WARNING) << "Could not size fragment: " << size.status();
		}
		size_from_fragments += current_size;

		std::optional<std::string> hint = GenerateResend(fragment.code);
		if (i + 1 != fragments.size()) {
			// Preceding fragments must be exactly the fragment size
			if (current_size != fragment_size) {
				std::string msg = absl::StrCat("Fragment ", fragment.code.full_path(), " file size (",
						current_size, ") not equal to expected size (", fragment_size, ")");
				LOG(WARNING) << msg;
				outcome.Fail(WithHint(msg, hint), hint);
			}
			continue;
		}

		auto known = sizes.find(fragment.code.name());
		if (known != sizes.end() && known->second.expected >= 0 && known->second.received >= 0) {
			if (known->second.expected != known->second.received) {
				std::string msg = absl::StrCat("Final fragment ", fragment.code.full_path(),
						" received ", known->second.received, " of ", known->second.expected, " bytes");
				LOG(WARNING) << msg;
				outcome.Warn(WithHint(msg, hint), hint);
			}
		} else if (total_size > 0) {
			if (current_size != last_expected_size) {
				std::string msg = absl::StrCat("Final fragment ", fragment.code.full_path(), " size (",
						current_size, ") is not expected (should be ", last_expected_size, ")");
				LOG(WARNING) << msg;
				outcome.Warn(WithHint(msg, hint), hint);
			}
		} else if (current_size > fragment_size) {
			// Only meaningful when the file really is a numbered fragment
			if (fragment.code.IsFragment() &&
					!(fragment.code.IsSelftest() && fragment.code.IsCapture())) {
				std::string msg = absl::StrCat("Final fragment ", fragment.code.full_path(), " size (",
						current_size, ") is too big, expected less than or equal to ", fragment_size);
				LOG(WARNING) << msg;
				outcome.Warn(WithHint(msg, hint), hint);
			}
		}
	}

	if (total_size > 0 && size_from_fragments != total_size) {
		std::string msg = absl::StrCat("Size from frags (", size_from_fragments,
				") does not match logged value (", total_size, ")");
		LOG(WARNING) << msg;
		outcome.Fail(msg);
	}
	return outcome;
}

} // End of namespace Seastitch
