#include "repair/repair_filters.h"

#include <glog/logging.h>

#include "common/file_utils.h"

namespace Seastitch {

namespace {

bool IsPaddingSector(const std::string& data, size_t start) {
	for (size_t i = start; i < start + DefaultRepairFilters::kSectorSize; ++i) {
		if (data[i] != DefaultRepairFilters::kPadByte) return false;
	}
	return true;
}

} // namespace

std::string DefaultRepairFilters::RemoveDuplicateSectors(const std::string& data,
		size_t* duplicates_removed, size_t* padding_removed) {
	*duplicates_removed = 0;
	*padding_removed = 0;
	if (data.size() <= 2 * kSectorSize) {
		return data;
	}

	std::string out;
	out.reserve(data.size());
	const size_t last_sector = data.size() - kSectorSize;
	size_t start = 0;
	while (start <= last_sector) {
		if (IsPaddingSector(data, start)) {
			++*padding_removed;
			start += kSectorSize;
			continue;
		}

		// Scan ahead for a repeat of this sector; a run [start, dup) that is
		// immediately repeated is a duplicated transmission.
		bool found = false;
		for (size_t dup = start + kSectorSize; dup <= last_sector; dup += kSectorSize) {
			if (IsPaddingSector(data, dup)) continue;
			if (data.compare(dup, kSectorSize, data, start, kSectorSize) != 0) continue;
			size_t run = dup - start;
			if (dup + run <= data.size() && data.compare(dup, run, data, start, run) == 0) {
				out.append(data, start, run);
				start = dup + run;
				++*duplicates_removed;
				found = true;
				break;
			}
		}
		if (!found) {
			out.append(data, start, kSectorSize);
			start += kSectorSize;
		}
	}
	// Trailing partial sector
	if (start < data.size()) {
		out.append(data, start, std::string::npos);
	}
	return out;
}

std::string DefaultRepairFilters::StripTrailingPadding(const std::string& data, int64_t size_hint,
		size_t* lost_data_bytes) {
	*lost_data_bytes = 0;
	if (size_hint > 0) {
		size_t size = static_cast<size_t>(size_hint);
		if (data.size() <= size) return data;
		for (size_t i = size; i < data.size(); ++i) {
			if (data[i] != kPadByte) ++*lost_data_bytes;
		}
		return data.substr(0, size);
	}

	// Data files are made of shorts, so padding always comes in pairs.
	// Singleton 0x1A bytes inside the data are legitimate.
	size_t end = data.size();
	while (end >= 2 && data[end - 1] == kPadByte && data[end - 2] == kPadByte) {
		end -= 2;
	}
	return data.substr(0, end);
}

absl::Status DefaultRepairFilters::RemoveArtifacts(const std::string& src, const std::string& dst) {
	absl::StatusOr<std::string> data = ReadFileContents(src);
	if (!data.ok()) return data.status();

	size_t duplicates = 0;
	size_t padding = 0;
	std::string repaired = RemoveDuplicateSectors(*data, &duplicates, &padding);
	if (duplicates > 0) {
		LOG(INFO) << "Eliminated " << duplicates << " duplicated sector run(s) in " << src;
	}
	if (padding > 0) {
		LOG(INFO) << "Eliminated " << padding << " padding sector(s) in " << src;
	}
	return WriteFileContents(dst, repaired);
}

absl::Status DefaultRepairFilters::StripEscapes(const std::string& src, const std::string& dst,
		int64_t size_hint) {
	absl::StatusOr<std::string> data = ReadFileContents(src);
	if (!data.ok()) return data.status();

	size_t lost = 0;
	std::string stripped = StripTrailingPadding(*data, size_hint, &lost);
	if (lost > 0) {
		LOG(WARNING) << "Removing " << lost << " non-padding bytes from truncated "
			<< (data->size() - stripped.size()) << "-byte tail of " << src;
	}
	VLOG(2) << "\t[StripEscapes]\t" << src << " " << data->size() << " -> " << stripped.size();
	return WriteFileContents(dst, stripped);
}

} // End of namespace Seastitch
