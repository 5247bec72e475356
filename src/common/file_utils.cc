#include "common/file_utils.h"

#include <errno.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include "absl/strings/str_cat.h"
#include "common/scoped_fd.h"

namespace Seastitch {

absl::Status ErrnoStatus(int err, const std::string& what, const std::string& path) {
	std::string msg = absl::StrCat(what, " ", path, ": ", strerror(err));
	switch (err) {
		case ENOENT:
			return absl::NotFoundError(msg);
		case EACCES:
		case EPERM:
			return absl::PermissionDeniedError(msg);
		default:
			return absl::InternalError(msg);
	}
}

absl::StatusOr<std::string> ReadFileContents(const std::string& path) {
	ScopedFd fd = ScopedFd::Open(path, O_RDONLY);
	if (!fd.valid()) {
		return ErrnoStatus(errno, "Could not open", path);
	}
	std::string data;
	char buf[1 << 16];
	while (true) {
		ssize_t n = ::read(fd.get(), buf, sizeof(buf));
		if (n < 0) {
			if (errno == EINTR) continue;
			return ErrnoStatus(errno, "Could not read", path);
		}
		if (n == 0) break;
		data.append(buf, static_cast<size_t>(n));
	}
	return data;
}

absl::Status AppendFileContents(int fd, const std::string& data, const std::string& path) {
	size_t off = 0;
	while (off < data.size()) {
		ssize_t n = ::write(fd, data.data() + off, data.size() - off);
		if (n < 0) {
			if (errno == EINTR) continue;
			return ErrnoStatus(errno, "Could not write", path);
		}
		off += static_cast<size_t>(n);
	}
	return absl::OkStatus();
}

absl::Status WriteFileContents(const std::string& path, const std::string& data) {
	ScopedFd fd = ScopedFd::Open(path, O_WRONLY | O_CREAT | O_TRUNC);
	if (!fd.valid()) {
		return ErrnoStatus(errno, "Could not open", path);
	}
	absl::Status status = AppendFileContents(fd.get(), data, path);
	if (!status.ok()) return status;
	if (fd.Close() != 0) {
		return ErrnoStatus(errno, "Could not close", path);
	}
	return absl::OkStatus();
}

absl::StatusOr<int64_t> ModTimeSeconds(const std::string& path) {
	struct stat st;
	if (::stat(path.c_str(), &st) != 0) {
		return ErrnoStatus(errno, "Could not stat", path);
	}
	return static_cast<int64_t>(st.st_mtim.tv_sec);
}

absl::StatusOr<int64_t> FileSize(const std::string& path) {
	struct stat st;
	if (::stat(path.c_str(), &st) != 0) {
		return ErrnoStatus(errno, "Could not stat", path);
	}
	return static_cast<int64_t>(st.st_size);
}

std::string Basename(const std::string& path) {
	size_t slash = path.find_last_of('/');
	return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string JoinPath(const std::string& dir, const std::string& name) {
	if (dir.empty()) return name;
	if (dir.back() == '/') return dir + name;
	return dir + "/" + name;
}

std::pair<std::string, std::string> SplitExtension(const std::string& path) {
	size_t slash = path.find_last_of('/');
	size_t dot = path.find_last_of('.');
	size_t start = slash == std::string::npos ? 0 : slash + 1;
	// A leading dot (".hidden") is not an extension
	if (dot == std::string::npos || dot <= start) {
		return {path, ""};
	}
	return {path.substr(0, dot), path.substr(dot)};
}

} // namespace Seastitch
