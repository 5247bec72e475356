#include "transfer/transfer_log.h"

#include <sys/stat.h>

#include <utility>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "absl/strings/str_cat.h"

namespace Seastitch {

namespace {

absl::StatusOr<std::unique_ptr<ManifestTransferLog>> ParseManifest(const YAML::Node& yaml,
		int64_t default_fragment_size, const std::string& source);

} // namespace

absl::StatusOr<std::unique_ptr<ManifestTransferLog>> ManifestTransferLog::Load(
		const std::string& path, int64_t default_fragment_size) {
	struct stat st;
	if (stat(path.c_str(), &st) != 0) {
		VLOG(1) << "\t[TransferLog]\tNo transfer manifest at " << path
			<< ", using fragment size " << default_fragment_size;
		return std::make_unique<ManifestTransferLog>(default_fragment_size);
	}
	try {
		return ParseManifest(YAML::LoadFile(path), default_fragment_size, path);
	} catch (const YAML::Exception& e) {
		return absl::InvalidArgumentError(absl::StrCat("Failed to parse transfer manifest ",
					path, ": ", e.what()));
	}
}

absl::StatusOr<std::unique_ptr<ManifestTransferLog>> ManifestTransferLog::LoadFromString(
		const std::string& yaml_content, int64_t default_fragment_size) {
	try {
		return ParseManifest(YAML::Load(yaml_content), default_fragment_size, "<string>");
	} catch (const YAML::Exception& e) {
		return absl::InvalidArgumentError(absl::StrCat("Failed to parse transfer manifest: ", e.what()));
	}
}

int64_t ManifestTransferLog::FragmentSize(int dive) const {
	auto it = dive_fragment_sizes_.find(dive);
	return it == dive_fragment_sizes_.end() ? default_fragment_size_ : it->second;
}

bool ManifestTransferLog::IsRawTransfer(const std::string& fragment_name) const {
	return raw_transfers_.count(fragment_name) > 0;
}

void ManifestTransferLog::AddFragment(const std::string& fragment_name, FragmentSizes sizes, bool raw) {
	sizes_[fragment_name] = sizes;
	if (raw) {
		raw_transfers_.insert(fragment_name);
	} else {
		raw_transfers_.erase(fragment_name);
	}
}

int64_t ManifestTransferLog::TotalSize(const std::string& base_name) const {
	auto it = totals_.find(base_name);
	return it == totals_.end() ? 0 : it->second;
}

namespace {

absl::StatusOr<std::unique_ptr<ManifestTransferLog>> ParseManifest(const YAML::Node& yaml,
		int64_t default_fragment_size, const std::string& source) {
	auto log = std::make_unique<ManifestTransferLog>(default_fragment_size);
	if (!yaml || yaml.IsNull()) {
		return std::move(log);
	}
	if (!yaml.IsMap()) {
		return absl::InvalidArgumentError(absl::StrCat("Transfer manifest ", source, " is not a map"));
	}

	if (yaml["fragment_sizes"]) {
		for (const auto& entry : yaml["fragment_sizes"]) {
			log->SetFragmentSize(entry.first.as<int>(), entry.second.as<int64_t>());
		}
	}
	if (yaml["fragments"]) {
		for (const auto& entry : yaml["fragments"]) {
			const std::string name = entry.first.as<std::string>();
			const YAML::Node& fragment = entry.second;
			FragmentSizes fs;
			if (fragment["expected"]) fs.expected = fragment["expected"].as<int64_t>();
			if (fragment["received"]) fs.received = fragment["received"].as<int64_t>();
			bool raw = fragment["method"] && fragment["method"].as<std::string>() == "raw";
			log->AddFragment(name, fs, raw);
		}
	}
	if (yaml["totals"]) {
		for (const auto& entry : yaml["totals"]) {
			log->SetTotalSize(entry.first.as<std::string>(), entry.second.as<int64_t>());
		}
	}

	VLOG(1) << "\t[TransferLog]\tLoaded " << source << ": " << log->ReportedSizes().size()
		<< " fragment record(s)";
	return std::move(log);
}

} // namespace

} // End of namespace Seastitch
