#ifndef INCLUDE_PROCESSED_FILE_CACHE_H_
#define INCLUDE_PROCESSED_FILE_CACHE_H_

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "classifier/file_code.h"

namespace Seastitch {

using TimestampMap = std::map<std::string, absl::Time>;

/**
 * Persistent record of the file groups already processed and when.
 *
 * Two namespaces share one file: dive, selftest and logger groups keyed by
 * base name, and instrument command (pdos) logs keyed by file name. Lines are
 *
 *   <name>, <HH:MM:SS DD Mon YYYY TZ>
 *
 * written in UTC, sorted by name, after a '#' comment header.
 */
class ProcessedFileCache {
	public:
		ProcessedFileCache(std::string path, const FileClassifier* classifier);

		/**
		 * Replace the in-memory entries with the file's. A missing file yields
		 * empty maps; a file that exists but cannot be read is an error.
		 * Unknown names are logged and skipped.
		 */
		absl::Status Read();

		// Sorted, with header, via a temporary file renamed over the old one.
		absl::Status Write() const;

		/**
		 * True when base is not cached, or any of paths was modified (in whole
		 * seconds) strictly after the cached timestamp.
		 */
		bool IsStale(const std::string& base, const std::vector<std::string>& paths) const;
		bool IsPdosLogStale(const std::string& name, const std::string& path) const;

		/**
		 * Timestamp to cache for a group whose processing began at started:
		 * the whole second before it. A fragment landing in the same second
		 * as the start still compares strictly newer on the next run.
		 */
		static absl::Time StampFor(absl::Time started);

		void MarkProcessed(const std::string& base, absl::Time when) { files_[base] = when; }
		void MarkPdosLogProcessed(const std::string& name, absl::Time when) { pdos_logs_[name] = when; }

		// Drops every dive-namespace entry of an instrument or logger dive.
		// Returns the number of entries removed.
		size_t InvalidateDive(int dive);
		bool Erase(const std::string& base);
		void Clear();

		const TimestampMap& files() const { return files_; }
		const TimestampMap& pdos_logs() const { return pdos_logs_; }
		const std::string& path() const { return path_; }

		static std::string FormatTimestamp(absl::Time when);
		// "HH:MM:SS DD Mon YYYY TZ"; UTC/GMT are honoured, other zones read as local time
		static std::optional<absl::Time> ParseTimestamp(absl::string_view text);
		// ctime-style "Www Mon DD HH:MM:SS YYYY", local time
		static std::optional<absl::Time> ParseLegacyTimestamp(absl::string_view text);

	private:
		static bool IsNewerThan(const std::string& path, absl::Time when);

		std::string path_;
		const FileClassifier* classifier_;
		TimestampMap files_;
		TimestampMap pdos_logs_;
};

} // End of namespace Seastitch
#endif
