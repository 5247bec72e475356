#ifndef INCLUDE_RUN_GUARD_H_
#define INCLUDE_RUN_GUARD_H_

#include <sys/types.h>

#include <chrono>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace Seastitch {

/**
 * Single-runner protocol between invocations on one host.
 *
 * The lock file holds the PID of the active invocation. A newcomer that finds
 * a live holder sends it SIGUSR1 (cooperative stop) and waits for it to exit.
 * If it does not exit in time the newcomer gives up and the lock stays with
 * the holder.
 */
class RunGuard {
	public:
		RunGuard(std::string lock_path, std::chrono::milliseconds stop_timeout,
				std::chrono::milliseconds poll_interval = std::chrono::milliseconds(1000));
		~RunGuard();

		RunGuard(const RunGuard&) = delete;
		RunGuard& operator=(const RunGuard&) = delete;

		/**
		 * Take the lock, asking a live previous holder to stop first.
		 *
		 * The lock file is created exclusively, so two newcomers never both
		 * hold it; the loser finds the winner as the holder.
		 *
		 * @return own PID, or DeadlineExceeded when the holder did not exit
		 *         within the stop timeout
		 */
		absl::StatusOr<pid_t> Acquire();

		// Removes the lock if it still names this process. Safe to call twice.
		void Release();

		bool held() const { return held_; }
		const std::string& lock_path() const { return lock_path_; }

		// kill(pid, 0) semantics; EPERM counts as alive
		static bool ProcessExists(pid_t pid);

	private:
		// 0 when there is no lock file, -1 when it cannot be parsed
		absl::StatusOr<pid_t> ReadLockPid() const;
		bool WaitForExit(pid_t pid) const;
		// false when the lock file already exists
		absl::StatusOr<bool> CreateLockFile(pid_t own) const;

		std::string lock_path_;
		std::chrono::milliseconds stop_timeout_;
		std::chrono::milliseconds poll_interval_;
		bool held_ = false;
};

} // End of namespace Seastitch
#endif
