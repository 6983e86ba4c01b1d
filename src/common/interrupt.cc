#include "interrupt.h"

#include <signal.h>

#include <atomic>
#include <cerrno>
#include <cstring>

#include <glog/logging.h>

namespace Skyvault {

namespace {

std::atomic<bool> g_interrupted{false};

void OnInterrupt(int) {
	g_interrupted.store(true, std::memory_order_relaxed);
}

} // namespace

void InstallInterruptHandlers() {
	struct sigaction action;
	std::memset(&action, 0, sizeof(action));
	action.sa_handler = OnInterrupt;
	sigemptyset(&action.sa_mask);
	action.sa_flags = 0;

	for (int sig : {SIGINT, SIGTERM}) {
		if (sigaction(sig, &action, nullptr) != 0) {
			LOG(WARNING) << "Failed to install handler for signal " << sig << ": " << strerror(errno);
		}
	}
}

bool InterruptRequested() {
	return g_interrupted.load(std::memory_order_relaxed);
}

void RequestInterrupt() {
	g_interrupted.store(true, std::memory_order_relaxed);
}

void ClearInterrupt() {
	g_interrupted.store(false, std::memory_order_relaxed);
}

} // namespace Skyvault
