#include "codec/codecs.h"

#include <bzlib.h>
#include <zlib.h>

#include <glog/logging.h>

#include "absl/strings/str_cat.h"
#include "common/file_utils.h"

namespace Seastitch {

namespace {

constexpr size_t kChunk = 1 << 16;

// Writes out what was recovered, then reports the codec error (or the write
// error, which takes precedence).
absl::StatusOr<uint64_t> Finish(const std::string& dst, const std::string& out,
		absl::Status codec_status) {
	absl::Status write_status = WriteFileContents(dst, out);
	if (!write_status.ok()) return write_status;
	if (!codec_status.ok()) return codec_status;
	return static_cast<uint64_t>(out.size());
}

} // namespace

absl::StatusOr<uint64_t> DecompressGzip(const std::string& src, const std::string& dst) {
	absl::StatusOr<std::string> in = ReadFileContents(src);
	if (!in.ok()) return in.status();
	if (in->empty()) {
		return Finish(dst, "", absl::DataLossError(absl::StrCat("Empty gzip file ", src)));
	}

	z_stream strm = {};
	// 16 + MAX_WBITS: expect a gzip wrapper, not raw zlib
	if (inflateInit2(&strm, 16 + MAX_WBITS) != Z_OK) {
		return absl::InternalError(absl::StrCat("inflateInit2 failed for ", src));
	}
	strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in->data()));
	strm.avail_in = static_cast<uInt>(in->size());

	std::string out;
	char buf[kChunk];
	absl::Status status;
	while (true) {
		strm.next_out = reinterpret_cast<Bytef*>(buf);
		strm.avail_out = sizeof(buf);
		int rc = inflate(&strm, Z_NO_FLUSH);
		out.append(buf, sizeof(buf) - strm.avail_out);
		if (rc == Z_STREAM_END) {
			if (strm.avail_in == 0) break;
			// Another gzip member follows
			inflateReset(&strm);
			continue;
		}
		if (rc == Z_OK) continue;
		if (rc == Z_BUF_ERROR && strm.avail_in == 0) {
			status = absl::DataLossError(absl::StrCat("Truncated gzip stream in ", src));
		} else {
			status = absl::DataLossError(absl::StrCat("gzip error in ", src, ": ",
						strm.msg ? strm.msg : zError(rc)));
		}
		break;
	}
	inflateEnd(&strm);

	VLOG(2) << "\t[DecompressGzip]\t" << src << " -> " << dst << " (" << out.size() << " bytes)";
	return Finish(dst, out, status);
}

absl::StatusOr<uint64_t> DecompressBzip2(const std::string& src, const std::string& dst) {
	absl::StatusOr<std::string> in = ReadFileContents(src);
	if (!in.ok()) return in.status();
	if (in->empty()) {
		return Finish(dst, "", absl::DataLossError(absl::StrCat("Empty bzip2 file ", src)));
	}

	bz_stream strm = {};
	if (BZ2_bzDecompressInit(&strm, 0, 0) != BZ_OK) {
		return absl::InternalError(absl::StrCat("BZ2_bzDecompressInit failed for ", src));
	}
	strm.next_in = const_cast<char*>(in->data());
	strm.avail_in = static_cast<unsigned int>(in->size());

	std::string out;
	char buf[kChunk];
	absl::Status status;
	while (true) {
		strm.next_out = buf;
		strm.avail_out = sizeof(buf);
		int rc = BZ2_bzDecompress(&strm);
		out.append(buf, sizeof(buf) - strm.avail_out);
		if (rc == BZ_STREAM_END) {
			if (strm.avail_in == 0) break;
			// Another bzip2 stream follows; restart the decoder on it
			char* next_in = strm.next_in;
			unsigned int avail_in = strm.avail_in;
			BZ2_bzDecompressEnd(&strm);
			strm = {};
			if (BZ2_bzDecompressInit(&strm, 0, 0) != BZ_OK) {
				return absl::InternalError(absl::StrCat("BZ2_bzDecompressInit failed for ", src));
			}
			strm.next_in = next_in;
			strm.avail_in = avail_in;
			continue;
		}
		if (rc == BZ_OK) {
			if (strm.avail_in == 0 && strm.avail_out != 0) {
				status = absl::DataLossError(absl::StrCat("Truncated bzip2 stream in ", src));
				break;
			}
			continue;
		}
		status = absl::DataLossError(absl::StrCat("bzip2 error ", rc, " in ", src));
		break;
	}
	BZ2_bzDecompressEnd(&strm);

	VLOG(2) << "\t[DecompressBzip2]\t" << src << " -> " << dst << " (" << out.size() << " bytes)";
	return Finish(dst, out, status);
}

} // End of namespace Seastitch
