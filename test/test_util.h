#ifndef SEASTITCH_TEST_TEST_UTIL_H_
#define SEASTITCH_TEST_TEST_UTIL_H_

#include <gtest/gtest.h>
#include <bzlib.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <zlib.h>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace Seastitch {
namespace testing_util {

// Fresh directory under $TMPDIR (or /tmp), removed with everything in it
class TempDir {
public:
    TempDir() {
        const char* base = std::getenv("TMPDIR");
        std::string pattern = std::string(base ? base : "/tmp") + "/seastitch_test_XXXXXX";
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');
        char* made = mkdtemp(buf.data());
        EXPECT_NE(made, nullptr);
        path_ = made ? made : "";
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string File(const std::string& name) const { return path_ + "/" + name; }

private:
    std::string path_;
};

inline void WriteFile(const std::string& path, const std::string& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    ASSERT_TRUE(out.good()) << "could not write " << path;
}

inline std::string ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline bool Exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

inline void SetMtime(const std::string& path, int64_t seconds) {
    struct timeval times[2];
    times[0].tv_sec = static_cast<time_t>(seconds);
    times[0].tv_usec = 0;
    times[1] = times[0];
    ASSERT_EQ(utimes(path.c_str(), times), 0) << path;
}

// Non-repeating bytes; sector-level duplicate removal leaves them alone
inline std::string RandomBytes(size_t n, uint32_t seed) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::string out(n, '\0');
    for (auto& c : out) {
        c = static_cast<char>(dist(gen));
        // Keep padding bytes out so trailing 0x1A pairs never appear by chance
        if (c == 0x1A) c = 0x1B;
    }
    return out;
}

// Printable, non-repeating text
inline std::string TextBytes(size_t lines, uint32_t seed) {
    std::mt19937 gen(seed);
    std::string out;
    for (size_t i = 0; i < lines; ++i) {
        out += "$line," + std::to_string(i) + "," + std::to_string(gen()) + "\n";
    }
    return out;
}

inline std::string Gzip(const std::string& data) {
    z_stream strm = {};
    EXPECT_EQ(deflateInit2(&strm, Z_BEST_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8,
                           Z_DEFAULT_STRATEGY), Z_OK);
    std::string out(deflateBound(&strm, static_cast<uLong>(data.size())) + 64, '\0');
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = reinterpret_cast<Bytef*>(&out[0]);
    strm.avail_out = static_cast<uInt>(out.size());
    EXPECT_EQ(deflate(&strm, Z_FINISH), Z_STREAM_END);
    out.resize(strm.total_out);
    deflateEnd(&strm);
    return out;
}

inline std::string Bzip2(const std::string& data) {
    unsigned int len = static_cast<unsigned int>(data.size() + data.size() / 100 + 600);
    std::string out(len, '\0');
    EXPECT_EQ(BZ2_bzBuffToBuffCompress(&out[0], &len, const_cast<char*>(data.data()),
                                       static_cast<unsigned int>(data.size()), 9, 0, 0), BZ_OK);
    out.resize(len);
    return out;
}

// ustar archive of regular files
inline std::string MakeTar(const std::vector<std::pair<std::string, std::string>>& members) {
    std::string out;
    for (const auto& [name, content] : members) {
        std::string header(512, '\0');
        header.replace(0, name.size(), name);
        auto octal = [&header](size_t off, size_t len, uint64_t value) {
            char buf[32];
            snprintf(buf, sizeof(buf), "%0*llo", static_cast<int>(len - 1),
                     static_cast<unsigned long long>(value));
            header.replace(off, len - 1, buf);
        };
        octal(100, 8, 0644);
        octal(108, 8, 0);
        octal(116, 8, 0);
        octal(124, 12, content.size());
        octal(136, 12, 1700000000);
        header[156] = '0';
        header.replace(257, 6, std::string("ustar\0", 6));
        header.replace(263, 2, "00");
        header.replace(148, 8, "        ");
        unsigned int sum = 0;
        for (unsigned char c : header) sum += c;
        char chk[8];
        snprintf(chk, sizeof(chk), "%06o", sum);
        header.replace(148, 7, std::string(chk, 6) + '\0');
        out += header;
        out += content;
        out.append((512 - content.size() % 512) % 512, '\0');
    }
    out.append(1024, '\0');
    return out;
}

// Splits data into fragment files <base>.x00, .x01, ... in dir
inline std::vector<std::string> WriteFragments(const std::string& dir, const std::string& base,
                                               const std::string& data, size_t fragment_size) {
    std::vector<std::string> paths;
    size_t index = 0;
    for (size_t off = 0; off < data.size(); off += fragment_size, ++index) {
        char suffix[8];
        snprintf(suffix, sizeof(suffix), ".x%02zX", index);
        std::string path = dir + "/" + base + suffix;
        WriteFile(path, data.substr(off, fragment_size));
        paths.push_back(path);
    }
    return paths;
}

} // namespace testing_util
} // namespace Seastitch

#endif // SEASTITCH_TEST_TEST_UTIL_H_
