#ifndef INCLUDE_CANCELLATION_H_
#define INCLUDE_CANCELLATION_H_

#include <csignal>

namespace Seastitch {

/**
 * Cooperative stop request. Long-running work polls IsCancelled() between
 * units of work; nothing is interrupted mid-operation.
 */
class CancellationToken {
	public:
		CancellationToken() : flag_(&own_flag_) {}
		// Observes a flag owned elsewhere, e.g. by a signal handler
		explicit CancellationToken(volatile sig_atomic_t* flag) : flag_(flag) {}

		CancellationToken(const CancellationToken&) = delete;
		CancellationToken& operator=(const CancellationToken&) = delete;

		bool IsCancelled() const { return *flag_ != 0; }
		void Cancel() { *flag_ = 1; }
		void Reset() { *flag_ = 0; }

	private:
		volatile sig_atomic_t own_flag_ = 0;
		volatile sig_atomic_t* flag_;
};

// Installs the SIGUSR1 handler a later invocation uses to ask this one to stop
bool InstallStopSignalHandler();

// Token set by the SIGUSR1 handler
CancellationToken& StopSignalToken();

} // End of namespace Seastitch
#endif
