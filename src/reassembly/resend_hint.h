#ifndef INCLUDE_RESEND_HINT_H_
#define INCLUDE_RESEND_HINT_H_

#include <optional>
#include <string>

#include "classifier/file_code.h"

namespace Seastitch {

// Resend command for a fragment, e.g. "resend_dive /l 12 3".
// fragment_override names a slot other than the fragment's own (a missing
// ordinal). Returns std::nullopt for owners without a resend command.
std::optional<std::string> GenerateResend(const FileCode& fragment,
		std::optional<int> fragment_override = std::nullopt);

} // End of namespace Seastitch
#endif
