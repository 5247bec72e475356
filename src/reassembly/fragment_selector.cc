#include "reassembly/fragment_selector.h"

#include <glog/logging.h>

#include "absl/strings/str_cat.h"
#include "reassembly/resend_hint.h"

namespace Seastitch {

namespace {

std::string ConsiderHint(const std::optional<std::string>& hint) {
	return hint ? absl::StrCat(" - consider ", *hint) : "";
}

} // namespace

std::vector<FileCode> SelectFragments(const std::vector<FileCode>& sorted,
		ValidationOutcome* outcome) {
	std::vector<FileCode> selected;
	size_t i = 0;
	while (i < sorted.size()) {
		// [i, end) are the variants of one slot
		size_t end = i + 1;
		while (end < sorted.size() && sorted[end].non_partial_path() == sorted[i].non_partial_path()) {
			++end;
		}

		const FileCode& kept = sorted[end - 1];
		if (!kept.IsPartial()) {
			for (size_t j = i; j < end - 1; ++j) {
				std::optional<std::string> hint = GenerateResend(sorted[j]);
				LOG(WARNING) << "Dropping " << sorted[j].full_path() << " in favor of " << kept.full_path();
				outcome->Warn(absl::StrCat("File ", sorted[j].full_path(),
							" was a PARTIAL transfer", ConsiderHint(hint)), hint);
			}
		} else {
			std::optional<std::string> hint = GenerateResend(kept);
			VLOG(1) << "\t[SelectFragments]\tNo final variant for " << kept.non_partial_path()
				<< ", keeping " << kept.full_path();
			outcome->Warn(absl::StrCat("File ", kept.full_path(), " is a PARTIAL file",
						ConsiderHint(hint)), hint);
		}
		selected.push_back(kept);
		i = end;
	}
	return selected;
}

} // End of namespace Seastitch
