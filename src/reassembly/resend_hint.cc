#include "reassembly/resend_hint.h"

#include "absl/strings/str_cat.h"

namespace Seastitch {

std::optional<std::string> GenerateResend(const FileCode& fragment,
		std::optional<int> fragment_override) {
	if (!fragment.IsInstrumentNative()) {
		return std::nullopt;
	}

	std::string hint;
	if (fragment.IsLog()) {
		hint = absl::StrCat("resend_dive /l ", fragment.DiveNumber());
	} else if (fragment.IsData()) {
		hint = absl::StrCat("resend_dive /d ", fragment.DiveNumber());
	} else if (fragment.IsCapture()) {
		hint = absl::StrCat("resend_dive /c ", fragment.DiveNumber());
	} else if (fragment.IsTar()) {
		hint = absl::StrCat("resend_dive /t ", fragment.DiveNumber());
	} else {
		// Don't know about this file type
		hint = "resend";
	}

	std::optional<int> index = fragment_override ? fragment_override : fragment.FragmentIndex();
	if (index && *index >= 0) {
		absl::StrAppend(&hint, " ", *index);
	} else if (!fragment.IsFragment()) {
		absl::StrAppend(&hint, " recommend resend the entire file");
	}
	return hint;
}

} // End of namespace Seastitch
