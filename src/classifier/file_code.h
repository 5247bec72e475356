#ifndef INCLUDE_FILE_CODE_H_
#define INCLUDE_FILE_CODE_H_

#include <optional>
#include <string>
#include <vector>

namespace Seastitch {

enum class Owner { kInstrument, kSelftest, kLogger, kUnknown };

// Character 6 of a transmitted name
enum class FileKind {
	kLog,
	kData,
	kCapture,
	kParm,
	kPdosLog,
	kNetworkLog,
	kNetworkProfile,
	kDownData,
	kUpData,
	kLoiterData,
	kOther
};

// Character 7 of a transmitted name
enum class Packing {
	kUncompressed,
	kGzip,
	kBzip,
	kTar,
	kTarGzip,
	kTarBzip,
	kLoggerPayload,
	kNetwork,
	kOther
};

struct LoggerSpec {
	std::string prefix;
	// Logger whose last fragment always gets the escape-strip treatment
	bool strip_files = false;
};

/**
 * Decoded form of a transmitted file name, following the instrument naming
 * convention (version 66 and later):
 *
 *   <owner:2><dive:4><kind:1><packing:1>.<state:1>[<counter:2>][.PARTIAL.<n>]
 *
 * e.g. sg0012lz.x03 is fragment 3 of the gzipped log of dive 12 and
 * sg0012lz.x is the complete (non-fragmented) transmission of the same file.
 * Fragment counters are hexadecimal with 'K' standing in for 'C'.
 */
class FileCode {
	public:
		static constexpr int kFinalPartialCount = 1000;

		const std::string& full_path() const { return full_path_; }
		// Path with any .PARTIAL.<n> suffix removed
		const std::string& non_partial_path() const { return non_partial_path_; }
		// Transmitted name (no directory, no partial suffix)
		const std::string& name() const { return name_; }
		int instrument_id() const { return instrument_id_; }

		std::string BaseName() const { return name_.substr(0, 8); }
		int DiveNumber() const { return dive_; }
		Owner owner() const { return owner_; }
		FileKind kind() const { return kind_; }
		Packing packing() const { return packing_; }
		std::string LoggerPrefix() const { return name_.substr(0, 2); }

		bool IsInstrument() const { return owner_ == Owner::kInstrument; }
		bool IsSelftest() const { return owner_ == Owner::kSelftest; }
		bool IsLogger() const { return owner_ == Owner::kLogger; }
		bool IsInstrumentNative() const { return IsInstrument() || IsSelftest(); }
		bool IsLoggerStripFiles() const { return IsLogger() && logger_strip_files_; }

		bool IsLog() const { return kind_ == FileKind::kLog; }
		bool IsData() const { return kind_ == FileKind::kData; }
		bool IsCapture() const { return kind_ == FileKind::kCapture; }
		bool IsParm() const { return kind_ == FileKind::kParm; }
		bool IsPdosLog() const { return kind_ == FileKind::kPdosLog; }
		bool IsLoggerData() const {
			return kind_ == FileKind::kData || kind_ == FileKind::kDownData ||
				kind_ == FileKind::kUpData || kind_ == FileKind::kLoiterData;
		}

		bool IsUncompressed() const { return packing_ == Packing::kUncompressed; }
		bool IsGzip() const { return packing_ == Packing::kGzip; }
		bool IsBzip() const { return packing_ == Packing::kBzip; }
		bool IsTar() const { return packing_ == Packing::kTar; }
		bool IsTarGzip() const { return packing_ == Packing::kTarGzip; }
		bool IsTarBzip() const { return packing_ == Packing::kTarBzip; }
		bool IsAnyTar() const { return IsTar() || IsTarGzip() || IsTarBzip(); }
		bool IsLoggerPayload() const { return packing_ == Packing::kLoggerPayload; }
		// Formats whose integrity can be checked by decompressing them
		bool IsCompressed() const {
			return IsGzip() || IsBzip() || IsTarGzip() || IsTarBzip() || IsParm();
		}

		// ".x" with no counter: a complete, non-fragmented transmission
		bool IsCompleteTransmission() const { return state_ == 'x' && !fragment_index_; }
		bool IsFragment() const { return fragment_index_.has_value(); }
		std::optional<int> FragmentIndex() const { return fragment_index_; }
		bool IsPartial() const { return partial_count_ < kFinalPartialCount; }
		int PartialCount() const { return partial_count_; }

		// Name conversions; results keep the directory of this file
		std::string WithPacking(char packing) const;
		// <root>.r, the reassembled ("received") form of this file
		std::string ReceivedPath() const;

		// Basestation names, e.g. p0450012.log for instrument 45 dive 12.
		// Empty when the owner has no such form.
		std::string BaseLogName() const;
		std::string BaseDataName() const;
		std::string BaseCaptureName() const;
		std::string BaseParmName() const;
		std::string BasePdosLogName() const;

	private:
		friend class SeagliderClassifier;
		FileCode() = default;

		std::string MakeBasestationName(const std::string& ext, bool with_cast) const;

		std::string full_path_;
		std::string non_partial_path_;
		std::string dir_;
		std::string name_;
		int instrument_id_ = 0;
		int dive_ = -1;
		Owner owner_ = Owner::kUnknown;
		FileKind kind_ = FileKind::kOther;
		Packing packing_ = Packing::kOther;
		char state_ = '\0';
		std::optional<int> fragment_index_;
		int partial_count_ = kFinalPartialCount;
		bool logger_strip_files_ = false;
};

/**
 * Maps a path to its FileCode. Must be a pure function of the path string and
 * the classifier's configuration.
 */
class FileClassifier {
	public:
		virtual ~FileClassifier() = default;
		virtual std::optional<FileCode> Classify(const std::string& path) const = 0;
		// True for transmitted files the engine should pick up from the mission directory
		virtual bool IsPreProcessingFile(const std::string& name) const = 0;
};

class SeagliderClassifier : public FileClassifier {
	public:
		SeagliderClassifier(int instrument_id, std::vector<LoggerSpec> loggers);

		std::optional<FileCode> Classify(const std::string& path) const override;
		bool IsPreProcessingFile(const std::string& name) const override;

		int instrument_id() const { return instrument_id_; }

	private:
		const LoggerSpec* FindLogger(const std::string& prefix) const;

		int instrument_id_;
		std::vector<LoggerSpec> loggers_;
};

// Ordering of fragments within a group: fragment counter first, then partial
// counter, so that a final variant sorts after every partial of its slot.
bool FragmentLess(const FileCode& a, const FileCode& b);

} // End of namespace Seastitch
#endif
