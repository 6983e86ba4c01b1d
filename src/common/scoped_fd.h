// RAII wrapper for file descriptors (pipe ends, artifact files, /dev/null).
// Ensures fd is closed on scope exit; prevents leaks on early return or exception.
#ifndef SKYVAULT_COMMON_SCOPED_FD_H_
#define SKYVAULT_COMMON_SCOPED_FD_H_

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <string>
#include <system_error>
#include <utility>

namespace Skyvault {

struct ScopedFd {
	int fd = -1;

	ScopedFd() = default;
	explicit ScopedFd(int f) : fd(f) {}

	~ScopedFd() { Reset(); }

	ScopedFd(const ScopedFd&) = delete;
	ScopedFd& operator=(const ScopedFd&) = delete;

	ScopedFd(ScopedFd&& o) noexcept : fd(o.fd) { o.fd = -1; }
	ScopedFd& operator=(ScopedFd&& o) noexcept {
		if (this != &o) {
			Reset();
			fd = o.fd;
			o.fd = -1;
		}
		return *this;
	}

	int get() const { return fd; }
	bool valid() const { return fd >= 0; }

	void Reset() {
		if (fd >= 0) {
			::close(fd);
			fd = -1;
		}
	}

	// Release ownership; caller must close.
	int release() {
		int f = fd;
		fd = -1;
		return f;
	}
};

struct PipeEnds {
	ScopedFd read;
	ScopedFd write;
};

// Both ends are close-on-exec; dup2() into a child clears the flag on the copy.
inline PipeEnds MakePipe() {
	int fds[2];
	if (::pipe2(fds, O_CLOEXEC) != 0) {
		throw std::system_error(errno, std::generic_category(), "pipe2 failed");
	}
	return PipeEnds{ScopedFd(fds[0]), ScopedFd(fds[1])};
}

inline ScopedFd OpenDevNull(int flags) {
	int fd = ::open("/dev/null", flags | O_CLOEXEC);
	if (fd < 0) {
		throw std::system_error(errno, std::generic_category(), "open /dev/null failed");
	}
	return ScopedFd(fd);
}

} // namespace Skyvault

#endif  // SKYVAULT_COMMON_SCOPED_FD_H_
