#include "guard/cancellation.h"

#include <signal.h>

#include <cerrno>
#include <cstring>

#include <glog/logging.h>

namespace Seastitch {

namespace {

volatile sig_atomic_t g_stop_requested = 0;

void StopSignalHandler(int) {
	g_stop_requested = 1;
}

} // namespace

bool InstallStopSignalHandler() {
	struct sigaction sa;
	memset(&sa, 0, sizeof(sa));
	sa.sa_handler = StopSignalHandler;
	sigemptyset(&sa.sa_mask);
	if (sigaction(SIGUSR1, &sa, nullptr) != 0) {
		LOG(ERROR) << "Failed to install SIGUSR1 handler: " << strerror(errno);
		return false;
	}
	VLOG(1) << "\t[Cancellation]\tSIGUSR1 requests a cooperative stop";
	return true;
}

CancellationToken& StopSignalToken() {
	static CancellationToken token(&g_stop_requested);
	return token;
}

} // End of namespace Seastitch
