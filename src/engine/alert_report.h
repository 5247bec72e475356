#ifndef INCLUDE_ALERT_REPORT_H_
#define INCLUDE_ALERT_REPORT_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "common/run_result.h"

namespace Seastitch {

// Unique resend hints of the run, in report order
std::vector<std::string> CollectResendHints(const RunResult& result);

// Human-readable summary: processed and failed units, incomplete files,
// conversion alerts and the resend commands to request.
std::string FormatAlertReport(const RunResult& result);

absl::Status WriteAlertReport(const RunResult& result, const std::string& path);

} // End of namespace Seastitch
#endif
