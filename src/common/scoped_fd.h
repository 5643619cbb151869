// RAII owner for the descriptors rxcache juggles across fork():
// the cache file, the writer's listening socket and producer connections.
#ifndef RXCACHE_SRC_COMMON_SCOPED_FD_H_
#define RXCACHE_SRC_COMMON_SCOPED_FD_H_

#include <unistd.h>

namespace Rxcache {

class ScopedFd {
	public:
		ScopedFd() = default;
		explicit ScopedFd(int fd) : fd_(fd) {}

		~ScopedFd() { reset(); }

		ScopedFd(const ScopedFd&) = delete;
		ScopedFd& operator=(const ScopedFd&) = delete;

		ScopedFd(ScopedFd&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
		ScopedFd& operator=(ScopedFd&& o) noexcept {
			if (this != &o) {
				reset(o.fd_);
				o.fd_ = -1;
			}
			return *this;
		}

		int get() const { return fd_; }
		bool valid() const { return fd_ >= 0; }

		// Closes the current descriptor (if any) and adopts fd.
		void reset(int fd = -1) {
			if (fd_ >= 0 && fd_ != fd) {
				::close(fd_);
			}
			fd_ = fd;
		}

	private:
		int fd_ = -1;
};

}  // namespace Rxcache

#endif  // RXCACHE_SRC_COMMON_SCOPED_FD_H_
