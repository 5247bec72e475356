#include "cache/processed_file_cache.h"

#include <sys/stat.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <utility>

#include <glog/logging.h>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/time/clock.h"
#include "common/file_utils.h"

namespace Seastitch {

namespace {

constexpr char kTimestampFormat[] = "%H:%M:%S %d %b %Y";
constexpr char kLegacyFormat[] = "%a %b %d %H:%M:%S %Y";

bool IsAlphaToken(absl::string_view token) {
	if (token.empty()) return false;
	for (char c : token) {
		if (!std::isalpha(static_cast<unsigned char>(c))) return false;
	}
	return true;
}

} // namespace

ProcessedFileCache::ProcessedFileCache(std::string path, const FileClassifier* classifier)
	: path_(std::move(path)), classifier_(classifier) {}

std::string ProcessedFileCache::FormatTimestamp(absl::Time when) {
	return absl::FormatTime("%H:%M:%S %d %b %Y %Z", when, absl::UTCTimeZone());
}

absl::Time ProcessedFileCache::StampFor(absl::Time started) {
	return absl::FromUnixSeconds(absl::ToUnixSeconds(started) - 1);
}

std::optional<absl::Time> ProcessedFileCache::ParseTimestamp(absl::string_view text) {
	text = absl::StripAsciiWhitespace(text);
	size_t space = text.find_last_of(' ');
	if (space == absl::string_view::npos) return std::nullopt;
	absl::string_view zone = text.substr(space + 1);
	if (!IsAlphaToken(zone)) return std::nullopt;

	absl::TimeZone tz = (zone == "UTC" || zone == "GMT") ? absl::UTCTimeZone() : absl::LocalTimeZone();
	absl::Time when;
	std::string err;
	if (!absl::ParseTime(kTimestampFormat, text.substr(0, space), tz, &when, &err)) {
		return std::nullopt;
	}
	return when;
}

std::optional<absl::Time> ProcessedFileCache::ParseLegacyTimestamp(absl::string_view text) {
	absl::Time when;
	std::string err;
	if (!absl::ParseTime(kLegacyFormat, absl::StripAsciiWhitespace(text), absl::LocalTimeZone(),
				&when, &err)) {
		return std::nullopt;
	}
	return when;
}

absl::Status ProcessedFileCache::Read() {
	files_.clear();
	pdos_logs_.clear();

	struct stat st;
	if (stat(path_.c_str(), &st) != 0) {
		if (errno == ENOENT) {
			VLOG(1) << "\t[ProcessedFileCache]\tNo cache at " << path_;
			return absl::OkStatus();
		}
		return ErrnoStatus(errno, "Could not stat", path_);
	}
	absl::StatusOr<std::string> contents = ReadFileContents(path_);
	if (!contents.ok()) return contents.status();

	for (absl::string_view raw_line : absl::StrSplit(*contents, '\n')) {
		absl::string_view line = absl::StripTrailingAsciiWhitespace(raw_line);
		if (line.empty() || line[0] == '#') continue;

		std::pair<absl::string_view, absl::string_view> parts =
			absl::StrSplit(line, absl::MaxSplits(',', 1));
		std::string name(absl::StripAsciiWhitespace(parts.first));
		std::optional<FileCode> fc = classifier_->Classify(name);

		if (fc && fc->IsPdosLog() && fc->IsInstrumentNative()) {
			std::optional<absl::Time> when = ParseTimestamp(parts.second);
			// Older caches carried no usable time for these
			pdos_logs_[name] = when ? *when : absl::Now();
		} else if (fc && (fc->IsInstrumentNative() || fc->IsLogger())) {
			std::optional<absl::Time> when = ParseTimestamp(parts.second);
			if (!when) when = ParseLegacyTimestamp(parts.second);
			if (!when) {
				LOG(WARNING) << "Unparseable time in entry " << line << " in " << path_ << " - using current time";
				when = absl::Now();
			}
			files_[name] = *when;
		} else {
			LOG(ERROR) << "Unknown entry " << line << " in " << path_ << " - skipping";
		}
	}
	VLOG(1) << "\t[ProcessedFileCache]\tRead " << files_.size() << " file group(s) and "
		<< pdos_logs_.size() << " pdos log(s) from " << path_;
	return absl::OkStatus();
}

absl::Status ProcessedFileCache::Write() const {
	std::string out;
	absl::StrAppend(&out, "# This file contains the dives that have been processed and the times they were processed\n");
	absl::StrAppend(&out, "# To force a file to be re-processed, delete the corresponding line from this file\n");
	absl::StrAppend(&out, "# Written ", FormatTimestamp(absl::Now()), "\n");
	for (const auto& [name, when] : pdos_logs_) {
		absl::StrAppend(&out, name, ", ", FormatTimestamp(when), "\n");
	}
	for (const auto& [name, when] : files_) {
		absl::StrAppend(&out, name, ", ", FormatTimestamp(when), "\n");
	}

	const std::string tmp = path_ + ".tmp";
	absl::Status status = WriteFileContents(tmp, out);
	if (!status.ok()) return status;
	if (rename(tmp.c_str(), path_.c_str()) != 0) {
		absl::Status err = ErrnoStatus(errno, absl::StrCat("Could not rename ", tmp, " to"), path_);
		unlink(tmp.c_str());
		return err;
	}
	VLOG(1) << "\t[ProcessedFileCache]\tWrote " << files_.size() + pdos_logs_.size()
		<< " entries to " << path_;
	return absl::OkStatus();
}

bool ProcessedFileCache::IsNewerThan(const std::string& path, absl::Time when) {
	absl::StatusOr<int64_t> mtime = ModTimeSeconds(path);
	if (!mtime.ok()) {
		LOG(WARNING) << mtime.status() << " - treating as changed";
		return true;
	}
	return *mtime > absl::ToUnixSeconds(when);
}

bool ProcessedFileCache::IsStale(const std::string& base, const std::vector<std::string>& paths) const {
	auto it = files_.find(base);
	if (it == files_.end()) {
		return true;
	}
	for (const auto& path : paths) {
		if (IsNewerThan(path, it->second)) {
			VLOG(1) << "\t[ProcessedFileCache]\t" << path << " changed since " << FormatTimestamp(it->second);
			return true;
		}
	}
	return false;
}

bool ProcessedFileCache::IsPdosLogStale(const std::string& name, const std::string& path) const {
	auto it = pdos_logs_.find(name);
	return it == pdos_logs_.end() || IsNewerThan(path, it->second);
}

size_t ProcessedFileCache::InvalidateDive(int dive) {
	size_t removed = 0;
	for (auto it = files_.begin(); it != files_.end();) {
		std::optional<FileCode> fc = classifier_->Classify(it->first);
		if (fc && !fc->IsSelftest() && fc->DiveNumber() == dive) {
			LOG(INFO) << "Invalidating " << it->first;
			it = files_.erase(it);
			++removed;
		} else {
			++it;
		}
	}
	return removed;
}

bool ProcessedFileCache::Erase(const std::string& base) {
	return files_.erase(base) > 0 || pdos_logs_.erase(base) > 0;
}

void ProcessedFileCache::Clear() {
	files_.clear();
	pdos_logs_.clear();
}

} // End of namespace Seastitch
