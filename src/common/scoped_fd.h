// RAII wrapper for file descriptors (fragments, lock file, cache temp file).
// Ensures fd is closed on scope exit; prevents leaks on early return.
#ifndef SEASTITCH_SRC_COMMON_SCOPED_FD_H_
#define SEASTITCH_SRC_COMMON_SCOPED_FD_H_

#include <fcntl.h>
#include <unistd.h>

#include <string>

namespace Seastitch {

struct ScopedFd {
	int fd = -1;

	ScopedFd() = default;
	explicit ScopedFd(int f) : fd(f) {}

	static ScopedFd Open(const std::string& path, int flags, mode_t mode = 0644) {
		return ScopedFd(::open(path.c_str(), flags | O_CLOEXEC, mode));
	}

	~ScopedFd() {
		if (fd >= 0) {
			::close(fd);
			fd = -1;
		}
	}

	ScopedFd(const ScopedFd&) = delete;
	ScopedFd& operator=(const ScopedFd&) = delete;

	ScopedFd(ScopedFd&& o) noexcept : fd(o.fd) { o.fd = -1; }
	ScopedFd& operator=(ScopedFd&& o) noexcept {
		if (this != &o) {
			if (fd >= 0) ::close(fd);
			fd = o.fd;
			o.fd = -1;
		}
		return *this;
	}

	int get() const { return fd; }
	bool valid() const { return fd >= 0; }

	// Close explicitly so the caller can see the error (close after write).
	int Close() {
		int rc = 0;
		if (fd >= 0) {
			rc = ::close(fd);
			fd = -1;
		}
		return rc;
	}
};

} // namespace Seastitch

#endif  // SEASTITCH_SRC_COMMON_SCOPED_FD_H_
