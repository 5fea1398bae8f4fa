// RAII wrapper for file descriptors (checkpoint files, their directory).
// Ensures fd is closed on scope exit; prevents leaks on early return.
#ifndef CROSSCHECK_COMMON_SCOPED_FD_H_
#define CROSSCHECK_COMMON_SCOPED_FD_H_

#include <unistd.h>

namespace Crosscheck {

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

	// Closes now and reports close(2) failure, which can carry a deferred write error.
	bool Close() {
		if (fd < 0) return true;
		int rc = ::close(fd);
		fd = -1;
		return rc == 0;
	}

	void Reset() {
		if (fd >= 0) {
			::close(fd);
			fd = -1;
		}
	}
};

} // namespace Crosscheck

#endif  // CROSSCHECK_COMMON_SCOPED_FD_H_
