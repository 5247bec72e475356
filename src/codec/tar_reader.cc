#include "codec/tar_reader.h"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <glog/logging.h>

#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "common/file_utils.h"

namespace Seastitch {

namespace fs = std::filesystem;

namespace {

// ustar header layout
constexpr size_t kNameOff = 0, kNameLen = 100;
constexpr size_t kSizeOff = 124, kSizeLen = 12;
constexpr size_t kChksumOff = 148, kChksumLen = 8;
constexpr size_t kTypeOff = 156;
constexpr size_t kMagicOff = 257;
constexpr size_t kPrefixOff = 345, kPrefixLen = 155;

std::string Field(const char* header, size_t off, size_t len) {
	const char* begin = header + off;
	const char* end = static_cast<const char*>(memchr(begin, '\0', len));
	return std::string(begin, end ? end : begin + len);
}

uint64_t ParseNumeric(const char* header, size_t off, size_t len) {
	const unsigned char* p = reinterpret_cast<const unsigned char*>(header + off);
	// GNU base-256 encoding for large values
	if (p[0] & 0x80) {
		uint64_t value = p[0] & 0x7f;
		for (size_t i = 1; i < len; ++i) value = (value << 8) | p[i];
		return value;
	}
	uint64_t value = 0;
	for (size_t i = 0; i < len; ++i) {
		char c = static_cast<char>(p[i]);
		if (c == ' ' && value == 0) continue;
		if (c < '0' || c > '7') break;
		value = value * 8 + static_cast<uint64_t>(c - '0');
	}
	return value;
}

bool AllZero(const char* block) {
	for (size_t i = 0; i < TarReader::kBlockSize; ++i) {
		if (block[i] != '\0') return false;
	}
	return true;
}

uint64_t RoundUpBlock(uint64_t n) {
	return (n + TarReader::kBlockSize - 1) / TarReader::kBlockSize * TarReader::kBlockSize;
}

bool SafeMemberName(const std::string& name) {
	if (name.empty() || name[0] == '/') return false;
	for (absl::string_view part : absl::StrSplit(name, '/')) {
		if (part == "..") return false;
	}
	return true;
}

// Returns the "path" record of a pax extended header, if any
std::string PaxPath(const std::string& records) {
	size_t pos = 0;
	while (pos < records.size()) {
		size_t space = records.find(' ', pos);
		if (space == std::string::npos) break;
		uint64_t len = 0;
		if (!absl::SimpleAtoi(records.substr(pos, space - pos), &len) || len == 0) break;
		std::string record = records.substr(space + 1, pos + len - space - 2);
		if (absl::StartsWith(record, "path=")) return record.substr(5);
		pos += len;
	}
	return "";
}

} // namespace

bool TarReader::ChecksumMatches(const char* header) {
	uint64_t expected = ParseNumeric(header, kChksumOff, kChksumLen);
	uint64_t unsigned_sum = 0;
	int64_t signed_sum = 0;
	for (size_t i = 0; i < kBlockSize; ++i) {
		bool in_chksum = i >= kChksumOff && i < kChksumOff + kChksumLen;
		unsigned char u = in_chksum ? ' ' : static_cast<unsigned char>(header[i]);
		signed char s = in_chksum ? ' ' : static_cast<signed char>(header[i]);
		unsigned_sum += u;
		signed_sum += s;
	}
	return expected == unsigned_sum || static_cast<int64_t>(expected) == signed_sum;
}

absl::StatusOr<std::unique_ptr<TarReader>> TarReader::Open(const std::string& path) {
	absl::StatusOr<std::string> data = ReadFileContents(path);
	if (!data.ok()) return data.status();
	if (data->size() < kBlockSize) {
		return absl::DataLossError(absl::StrCat("Error reading ", path,
					" (", data->size(), " bytes, might be empty tarfile)"));
	}
	const char* first = data->data();
	if (AllZero(first) || !ChecksumMatches(first)) {
		return absl::DataLossError(absl::StrCat(path, " is not a tar archive"));
	}
	VLOG(2) << "\t[TarReader]\tOpened " << path << " magic '" << Field(first, kMagicOff, 6) << "'";
	return std::unique_ptr<TarReader>(new TarReader(path, std::move(*data)));
}

absl::StatusOr<std::optional<TarMember>> TarReader::Next() {
	std::string long_name;
	while (!done_) {
		if (offset_ + kBlockSize > data_.size()) {
			done_ = true;
			break;
		}
		const char* header = data_.data() + offset_;
		if (AllZero(header)) {
			done_ = true;
			break;
		}
		if (!ChecksumMatches(header)) {
			done_ = true;
			return absl::DataLossError(absl::StrCat("Corrupt tar header at offset ",
						offset_, " in ", path_));
		}

		TarMember member;
		member.type = header[kTypeOff];
		member.size = ParseNumeric(header, kSizeOff, kSizeLen);
		member.data_offset = offset_ + kBlockSize;
		member.truncated = member.data_offset + member.size > data_.size();

		std::string prefix = Field(header, kPrefixOff, kPrefixLen);
		std::string name = Field(header, kNameOff, kNameLen);
		member.name = prefix.empty() ? name : absl::StrCat(prefix, "/", name);

		offset_ = std::min<uint64_t>(member.data_offset + RoundUpBlock(member.size), data_.size());
		if (member.truncated) done_ = true;

		// GNU long name and pax headers describe the member that follows
		if (member.type == 'L' || member.type == 'x') {
			if (member.truncated) {
				return absl::DataLossError(absl::StrCat("Truncated extended header in ", path_));
			}
			std::string payload = data_.substr(member.data_offset, member.size);
			if (member.type == 'L') {
				long_name = payload.substr(0, payload.find('\0'));
			} else {
				long_name = PaxPath(payload);
			}
			continue;
		}
		if (member.type == 'g') continue;

		if (!long_name.empty()) member.name = long_name;
		return std::optional<TarMember>(member);
	}
	return std::optional<TarMember>();
}

absl::Status TarReader::Extract(const TarMember& member, const std::string& dest_dir,
		std::string* out_path) const {
	if (!SafeMemberName(member.name)) {
		return absl::InvalidArgumentError(absl::StrCat("Refusing to extract ", member.name,
					" from ", path_));
	}
	fs::path target = fs::path(dest_dir) / member.name;
	std::error_code ec;
	if (member.IsDirectory()) {
		fs::create_directories(target, ec);
		if (ec) {
			return absl::InternalError(absl::StrCat("Could not create ", target.string(), ": ", ec.message()));
		}
		return absl::OkStatus();
	}
	if (!member.IsRegular()) {
		return absl::UnimplementedError(absl::StrCat("Unsupported member type '", std::string(1, member.type),
					"' for ", member.name));
	}
	if (target.has_parent_path()) {
		fs::create_directories(target.parent_path(), ec);
		if (ec) {
			return absl::InternalError(absl::StrCat("Could not create ",
						target.parent_path().string(), ": ", ec.message()));
		}
	}

	uint64_t available = member.truncated ? data_.size() - member.data_offset : member.size;
	absl::Status status = WriteFileContents(target.string(), data_.substr(member.data_offset, available));
	if (!status.ok()) return status;
	if (out_path) *out_path = target.string();
	if (member.truncated) {
		return absl::DataLossError(absl::StrCat("Member ", member.name, " truncated: got ",
					available, " of ", member.size, " bytes"));
	}
	return absl::OkStatus();
}

} // End of namespace Seastitch
