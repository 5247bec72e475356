#include "classifier/file_code.h"

#include <cctype>
#include <regex>

#include <glog/logging.h>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "common/file_utils.h"

namespace Seastitch {

namespace {

constexpr char kPartialTag[] = ".PARTIAL.";

// Pre-processing name patterns of the instrument and its selftests
const std::regex& InstrumentPattern() {
	static const std::regex re(
			R"(^sg[0-9]{4}[ldkper][nuztgjb]\.([xa0-9]..(\.PARTIAL\.[0-9]+)?|x)$)");
	return re;
}

const std::regex& ParmPattern() {
	static const std::regex re(R"(^sg0000kl\.x$)");
	return re;
}

const std::regex& SelftestPattern() {
	static const std::regex re(
			R"(^st[0-9]{4}[ldkp][uztgjb]\.([xa0-9]..(\.PARTIAL\.[0-9]+)?|[xa])$)");
	return re;
}

FileKind DecodeKind(char kind, char packing) {
	switch (kind) {
		case 'l': return FileKind::kLog;
		case 'd': return FileKind::kData;
		case 'k': return packing == 'l' ? FileKind::kParm : FileKind::kCapture;
		case 'p': return FileKind::kPdosLog;
		case 'e': return FileKind::kNetworkLog;
		case 'r': return FileKind::kNetworkProfile;
		case 'a': return FileKind::kDownData;
		case 'b': return FileKind::kUpData;
		case 'c': return FileKind::kLoiterData;
		default: return FileKind::kOther;
	}
}

Packing DecodePacking(char packing) {
	switch (packing) {
		case 'u': return Packing::kUncompressed;
		case 'z': return Packing::kGzip;
		case 'j': return Packing::kBzip;
		case 't': return Packing::kTar;
		case 'g': return Packing::kTarGzip;
		case 'b': return Packing::kTarBzip;
		case 'p': return Packing::kLoggerPayload;
		case 'n': return Packing::kNetwork;
		default: return Packing::kOther;
	}
}

std::optional<int> DecodeCounter(const std::string& digits) {
	std::string hex;
	for (char c : digits) {
		char l = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
		hex.push_back(l == 'k' ? 'c' : l);
	}
	int value = 0;
	if (!absl::SimpleHexAtoi(hex, &value)) {
		return std::nullopt;
	}
	return value;
}

} // namespace

std::string FileCode::WithPacking(char packing) const {
	std::string name = name_;
	name[7] = packing;
	return JoinPath(dir_, name);
}

std::string FileCode::ReceivedPath() const {
	return JoinPath(dir_, BaseName() + ".r");
}

std::string FileCode::MakeBasestationName(const std::string& ext, bool with_cast) const {
	std::string tail;
	if (IsInstrument()) {
		tail = absl::StrFormat("p%03d%04d%s", instrument_id_, dive_, ext);
	} else if (IsSelftest()) {
		tail = absl::StrFormat("pt%03d%04d%s", instrument_id_, dive_, ext);
	} else if (IsLogger()) {
		std::string cast;
		if (with_cast) {
			switch (kind_) {
				case FileKind::kDownData: cast = "a"; break;
				case FileKind::kUpData: cast = "b"; break;
				case FileKind::kLoiterData: cast = "c"; break;
				default: break;
			}
		}
		tail = absl::StrFormat("p%s%03d%04d%s%s", LoggerPrefix(), instrument_id_, dive_, cast, ext);
	} else {
		return "";
	}
	return JoinPath(dir_, tail);
}

std::string FileCode::BaseLogName() const {
	if (IsInstrument() && kind_ == FileKind::kNetworkLog) {
		return MakeBasestationName(".nlog", false);
	}
	return MakeBasestationName(".log", false);
}

std::string FileCode::BaseDataName() const {
	if (IsInstrument() && kind_ == FileKind::kNetworkProfile) {
		return MakeBasestationName(".npro", false);
	}
	return MakeBasestationName(".dat", true);
}

std::string FileCode::BaseCaptureName() const {
	if (!IsInstrumentNative()) return "";
	return MakeBasestationName(".cap", false);
}

std::string FileCode::BaseParmName() const {
	if (!IsInstrument()) return "";
	return MakeBasestationName(".prm", false);
}

std::string FileCode::BasePdosLogName() const {
	if (!IsInstrumentNative() || !IsPdosLog()) return "";
	// sg0003pz.002 -> p0450003.002.pdos
	std::string counter = name_.size() > 8 ? name_.substr(8) : "";
	return MakeBasestationName(counter + ".pdos", false);
}

SeagliderClassifier::SeagliderClassifier(int instrument_id, std::vector<LoggerSpec> loggers)
	: instrument_id_(instrument_id), loggers_(std::move(loggers)) {
		VLOG(3) << "\t[SeagliderClassifier]\tinstrument " << instrument_id_
			<< " with " << loggers_.size() << " logger(s)";
	}

const LoggerSpec* SeagliderClassifier::FindLogger(const std::string& prefix) const {
	for (const auto& logger : loggers_) {
		if (logger.prefix == prefix) return &logger;
	}
	return nullptr;
}

std::optional<FileCode> SeagliderClassifier::Classify(const std::string& path) const {
	FileCode fc;
	fc.full_path_ = path;
	fc.instrument_id_ = instrument_id_;

	std::string name = Basename(path);
	size_t dir_len = path.size() - name.size();
	fc.dir_ = dir_len > 0 ? path.substr(0, dir_len - 1) : "";

	size_t partial = name.find(kPartialTag);
	if (partial != std::string::npos) {
		int count = 0;
		if (!absl::SimpleAtoi(name.substr(partial + sizeof(kPartialTag) - 1), &count)) {
			return std::nullopt;
		}
		fc.partial_count_ = count;
		name = name.substr(0, partial);
	}
	fc.non_partial_path_ = JoinPath(fc.dir_, name);

	if (name.size() < 8 || name.size() > 13) {
		return std::nullopt;
	}
	for (size_t i = 2; i < 6; ++i) {
		if (!std::isdigit(static_cast<unsigned char>(name[i]))) return std::nullopt;
	}
	fc.name_ = name;
	fc.dive_ = std::stoi(name.substr(2, 4));

	std::string prefix = name.substr(0, 2);
	if (prefix == "sg") {
		fc.owner_ = Owner::kInstrument;
	} else if (prefix == "st") {
		fc.owner_ = Owner::kSelftest;
	} else if (const LoggerSpec* logger = FindLogger(prefix)) {
		fc.owner_ = Owner::kLogger;
		fc.logger_strip_files_ = logger->strip_files;
	}

	fc.kind_ = DecodeKind(name[6], name[7]);
	fc.packing_ = DecodePacking(name[7]);

	if (name.size() > 8) {
		if (name[8] != '.' || name.size() < 10) return std::nullopt;
		fc.state_ = static_cast<char>(std::tolower(static_cast<unsigned char>(name[9])));
		if (fc.state_ == 'x' && name.size() == 12) {
			fc.fragment_index_ = DecodeCounter(name.substr(10, 2));
		}
	}
	return fc;
}

bool SeagliderClassifier::IsPreProcessingFile(const std::string& name) const {
	if (std::regex_match(name, InstrumentPattern()) ||
			std::regex_match(name, ParmPattern()) ||
			std::regex_match(name, SelftestPattern())) {
		return true;
	}
	for (const auto& logger : loggers_) {
		if (name.compare(0, logger.prefix.size(), logger.prefix) != 0) continue;
		std::regex re(absl::StrCat("^", logger.prefix,
					R"([0-9]{4}..\.(...(\.PARTIAL\.[0-9]+)?|x)$)"));
		if (std::regex_match(name, re)) return true;
	}
	return false;
}

bool FragmentLess(const FileCode& a, const FileCode& b) {
	int ia = a.FragmentIndex().value_or(-1);
	int ib = b.FragmentIndex().value_or(-1);
	if (ia != ib) return ia < ib;
	return a.PartialCount() < b.PartialCount();
}

} // End of namespace Seastitch
