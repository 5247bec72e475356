#ifndef INCLUDE_CODECS_H_
#define INCLUDE_CODECS_H_

#include <cstdint>
#include <string>

#include "absl/status/statusor.h"

namespace Seastitch {

// Decompress src into dst and return the number of bytes written.
//
// On a corrupt or truncated stream dst still holds everything that could be
// recovered before the error, and the error is returned. Concatenated members
// (gzip) and streams (bzip2) are decoded back to back.
absl::StatusOr<uint64_t> DecompressGzip(const std::string& src, const std::string& dst);
absl::StatusOr<uint64_t> DecompressBzip2(const std::string& src, const std::string& dst);

} // End of namespace Seastitch
#endif
