#include "guard/run_guard.h"

#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <thread>
#include <utility>

#include <glog/logging.h>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "common/file_utils.h"
#include "common/scoped_fd.h"

namespace Seastitch {

namespace {

// Each pass either takes the lock or clears one obstacle
constexpr int kMaxAcquireAttempts = 5;

void RemoveLockFile(const std::string& path) {
	if (unlink(path.c_str()) != 0 && errno != ENOENT) {
		LOG(WARNING) << ErrnoStatus(errno, "Could not remove", path);
	}
}

} // namespace

RunGuard::RunGuard(std::string lock_path, std::chrono::milliseconds stop_timeout,
		std::chrono::milliseconds poll_interval)
	: lock_path_(std::move(lock_path)),
	stop_timeout_(stop_timeout),
	poll_interval_(poll_interval) {}

RunGuard::~RunGuard() {
	Release();
}

bool RunGuard::ProcessExists(pid_t pid) {
	if (pid <= 0) return false;
	if (kill(pid, 0) == 0) return true;
	return errno == EPERM;
}

absl::StatusOr<pid_t> RunGuard::ReadLockPid() const {
	absl::StatusOr<std::string> contents = ReadFileContents(lock_path_);
	if (!contents.ok()) {
		if (absl::IsNotFound(contents.status())) return 0;
		return contents.status();
	}
	int pid = 0;
	if (!absl::SimpleAtoi(absl::StripAsciiWhitespace(*contents), &pid) || pid <= 0) {
		return -1;
	}
	return static_cast<pid_t>(pid);
}

bool RunGuard::WaitForExit(pid_t pid) const {
	auto deadline = std::chrono::steady_clock::now() + stop_timeout_;
	while (ProcessExists(pid)) {
		if (std::chrono::steady_clock::now() >= deadline) {
			return false;
		}
		std::this_thread::sleep_for(poll_interval_);
	}
	return true;
}

absl::StatusOr<bool> RunGuard::CreateLockFile(pid_t own) const {
	ScopedFd fd = ScopedFd::Open(lock_path_, O_WRONLY | O_CREAT | O_EXCL);
	if (!fd.valid()) {
		if (errno == EEXIST) return false;
		return ErrnoStatus(errno, "Could not create", lock_path_);
	}
	absl::Status status = AppendFileContents(fd.get(), absl::StrCat(own, "\n"), lock_path_);
	if (status.ok() && fd.Close() != 0) {
		status = ErrnoStatus(errno, "Could not close", lock_path_);
	}
	if (!status.ok()) {
		RemoveLockFile(lock_path_);
		return status;
	}
	return true;
}

absl::StatusOr<pid_t> RunGuard::Acquire() {
	const pid_t own = getpid();

	for (int attempt = 0; attempt < kMaxAcquireAttempts; ++attempt) {
		absl::StatusOr<bool> created = CreateLockFile(own);
		if (!created.ok()) return created.status();
		if (*created) {
			held_ = true;
			VLOG(1) << "\t[RunGuard]\tHolding " << lock_path_ << " as pid " << own;
			return own;
		}

		absl::StatusOr<pid_t> holder = ReadLockPid();
		if (holder.ok() && *holder < 0) {
			// Another newcomer may have created the file and not written its pid yet
			std::this_thread::sleep_for(poll_interval_);
			holder = ReadLockPid();
		}

		if (!holder.ok()) {
			LOG(WARNING) << "Error accessing the lock file (" << holder.status() << ") - removing it";
			RemoveLockFile(lock_path_);
		} else if (*holder == 0) {
			VLOG(1) << "\t[RunGuard]\tLock vanished, retrying";
		} else if (*holder < 0) {
			LOG(WARNING) << "Lock file " << lock_path_ << " does not hold a pid - removing it";
			RemoveLockFile(lock_path_);
		} else if (*holder == own) {
			VLOG(1) << "\t[RunGuard]\tLock already names this process";
			held_ = true;
			return own;
		} else if (!ProcessExists(*holder)) {
			LOG(WARNING) << "Removing stale lock of pid " << *holder;
			RemoveLockFile(lock_path_);
		} else {
			LOG(WARNING) << "Previous process (pid:" << *holder
				<< ") still exists - signalling process to complete";
			if (kill(*holder, SIGUSR1) != 0 && errno != ESRCH) {
				return ErrnoStatus(errno, absl::StrCat("Could not signal pid ", *holder, " holding"),
						lock_path_);
			}
			if (!WaitForExit(*holder)) {
				std::string msg = absl::StrCat("Process pid:", *holder, " did not respond to SIGUSR1 after ",
						std::chrono::duration_cast<std::chrono::seconds>(stop_timeout_).count(),
						" seconds - bailing out");
				LOG(ERROR) << msg;
				return absl::DeadlineExceededError(msg);
			}
			LOG(INFO) << "Previous process (pid:" << *holder << ") apparently received the signal - proceeding";
		}
	}
	return absl::AbortedError(absl::StrCat("Could not take ", lock_path_, " after ",
				kMaxAcquireAttempts, " attempts"));
}

void RunGuard::Release() {
	if (!held_) return;
	held_ = false;
	absl::StatusOr<pid_t> holder = ReadLockPid();
	if (!holder.ok() || *holder != getpid()) {
		LOG(WARNING) << "Lock " << lock_path_ << " no longer names this process - leaving it";
		return;
	}
	RemoveLockFile(lock_path_);
}

} // End of namespace Seastitch
