#include "cache_writer.h"

#include <sys/epoll.h>
#include <sys/socket.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>

#include <string>
#include <vector>

#include <glog/logging.h>

#include "cache_store/cache_store.h"
#include "common/errors.h"
#include "common/logging.h"

namespace Rxcache {

namespace {

constexpr int kMaxEvents = 64;
constexpr size_t kReadChunkSize = 64 * 1024;

void SetNonBlocking(int fd) {
	int flags = fcntl(fd, F_GETFL, 0);
	if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
		throw ChannelError(std::string("fcntl(O_NONBLOCK) failed: ") + strerror(errno));
	}
}

void AddToEpoll(int epoll_fd, int fd) {
	struct epoll_event event;
	memset(&event, 0, sizeof(event));
	event.events = EPOLLIN | EPOLLRDHUP;
	event.data.fd = fd;
	if (epoll_ctl(epoll_fd, EPOLL_CTL_ADD, fd, &event) == -1) {
		throw ChannelError(std::string("epoll_ctl failed: ") + strerror(errno));
	}
}

} // namespace

CacheWriter::CacheWriter(CacheStore* store, ScopedFd listen_fd, size_t progress_interval,
		DrainCallback on_drained)
	: store_(store),
	listen_fd_(std::move(listen_fd)),
	epoll_fd_(epoll_create1(EPOLL_CLOEXEC)),
	progress_interval_(progress_interval == 0 ? 1 : progress_interval),
	on_drained_(std::move(on_drained)) {
	if (!epoll_fd_.valid()) {
		throw ChannelError(std::string("epoll_create1 failed: ") + strerror(errno));
	}
	SetNonBlocking(listen_fd_.get());
	AddToEpoll(epoll_fd_.get(), listen_fd_.get());
}

CacheWriter::~CacheWriter() = default;

void CacheWriter::Run() {
	LOG(INFO) << "[" << TimestampString() << "] Cache writer started on " << store_->path()
		<< " (" << store_->index().size() << " keys indexed)";

	struct epoll_event events[kMaxEvents];
	while (true) {
		if (stop_received_ && connections_.empty()) {
			// Connections made before Stop may still sit in the accept queue
			if (AcceptPending() == 0) {
				break;
			}
		}

		int n = epoll_wait(epoll_fd_.get(), events, kMaxEvents, -1);
		if (n < 0) {
			if (errno == EINTR) continue;
			throw ChannelError(std::string("epoll_wait failed: ") + strerror(errno));
		}
		for (int i = 0; i < n; i++) {
			int fd = events[i].data.fd;
			if (fd == listen_fd_.get()) {
				AcceptPending();
				continue;
			}
			auto it = connections_.find(fd);
			if (it == connections_.end()) {
				continue;
			}
			if (ReadConnection(it->second)) {
				CloseConnection(fd);
			}
		}
	}

	LOG(INFO) << "[" << TimestampString() << "] Cache writer done, "
		<< stats_.records_written << " records written from "
		<< stats_.connections_accepted << " producer connection(s)";
}

size_t CacheWriter::AcceptPending() {
	size_t accepted = 0;
	while (true) {
		int fd = accept4(listen_fd_.get(), nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
		if (fd < 0) {
			if (errno == EINTR) continue;
			if (errno == EAGAIN || errno == EWOULDBLOCK) break;
			throw ChannelError(std::string("accept failed: ") + strerror(errno));
		}
		Connection& conn = connections_[fd];
		conn.fd.reset(fd);
		AddToEpoll(epoll_fd_.get(), fd);
		++stats_.connections_accepted;
		++accepted;
		VLOG(2) << "Producer connection " << fd << " accepted (" << connections_.size() << " open)";
	}
	return accepted;
}

bool CacheWriter::ReadConnection(Connection& conn) {
	std::vector<char> buf(kReadChunkSize);
	while (true) {
		ssize_t n = ::read(conn.fd.get(), buf.data(), buf.size());
		if (n < 0) {
			if (errno == EINTR) continue;
			if (errno == EAGAIN || errno == EWOULDBLOCK) return false;
			// Frames may have been lost; the producer cannot be counted as drained
			throw ChannelError("Producer connection " + std::to_string(conn.fd.get()) +
					" read failed: " + strerror(errno));
		}
		if (n == 0) {
			return true;
		}
		conn.decoder.Append(buf.data(), static_cast<size_t>(n));
		while (std::optional<Message> message = conn.decoder.Next()) {
			Handle(*message);
		}
	}
}

void CacheWriter::CloseConnection(int fd) {
	auto it = connections_.find(fd);
	if (it == connections_.end()) return;
	if (it->second.decoder.buffered() > 0) {
		// Producer died mid-send; its exit status already fails the run
		LOG(ERROR) << "Producer connection " << fd << " closed with "
			<< it->second.decoder.buffered() << " bytes of a partial frame, discarded";
	}
	epoll_ctl(epoll_fd_.get(), EPOLL_CTL_DEL, fd, nullptr);
	connections_.erase(it);
	++stats_.connections_drained;
	VLOG(2) << "Producer connection " << fd << " drained (" << stats_.connections_drained << " total)";
	if (on_drained_) {
		on_drained_(stats_);
	}
}

void CacheWriter::Handle(const Message& message) {
	std::visit(Overloaded{
			[this](const CacheWrite& write) {
				store_->Append(write.key, write.payload, TodayDateStamp());
				++stats_.records_written;
				if (stats_.records_written % progress_interval_ == 0) {
					LOG(INFO) << "[" << TimestampString() << "] Cache writer: "
						<< stats_.records_written << " records written";
				}
			},
			[this](const Stop&) {
				if (!stop_received_) {
					LOG(INFO) << "[" << TimestampString() << "] Stop received, draining "
						<< connections_.size() << " open connection(s)";
				}
				stop_received_ = true;
			},
		}, message);
}

} // namespace Rxcache
