#ifndef SEASTITCH_SRC_COMMON_FILE_UTILS_H_
#define SEASTITCH_SRC_COMMON_FILE_UTILS_H_

#include <cstdint>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace Seastitch {

// Whole-file helpers over POSIX fds. Errors carry errno text and the path.
absl::StatusOr<std::string> ReadFileContents(const std::string& path);
absl::Status WriteFileContents(const std::string& path, const std::string& data);
absl::Status AppendFileContents(int fd, const std::string& data, const std::string& path);

// Modification time truncated to whole seconds since the epoch.
absl::StatusOr<int64_t> ModTimeSeconds(const std::string& path);
absl::StatusOr<int64_t> FileSize(const std::string& path);

std::string Basename(const std::string& path);
std::string JoinPath(const std::string& dir, const std::string& name);

// Splits "dir/name.ext" into ("dir/name", ".ext"); the extension is empty
// when the last component has no dot.
std::pair<std::string, std::string> SplitExtension(const std::string& path);

absl::Status ErrnoStatus(int err, const std::string& what, const std::string& path);

} // namespace Seastitch

#endif  // SEASTITCH_SRC_COMMON_FILE_UTILS_H_
