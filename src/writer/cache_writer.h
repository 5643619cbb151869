#ifndef RXCACHE_CACHE_WRITER_H_
#define RXCACHE_CACHE_WRITER_H_

#include <cstdint>
#include <functional>

#include "absl/container/flat_hash_map.h"

#include "channel/cache_channel.h"
#include "common/scoped_fd.h"

namespace Rxcache {

class CacheStore;

struct CacheWriterStats {
	uint64_t records_written = 0;
	uint64_t connections_accepted = 0;
	uint64_t connections_drained = 0;
};

/**
 * The only process that appends to the cache file. Every producer holds one
 * stream connection to the writer's listening socket; frames from one
 * producer are appended in send order, producers interleave freely.
 *
 * Run() returns once Stop has been received and every connection, open or
 * still waiting in the accept queue, has reached EOF.
 */
class CacheWriter {
	public:
		// Called after a connection hits EOF with all of its frames appended
		using DrainCallback = std::function<void(const CacheWriterStats&)>;

		CacheWriter(CacheStore* store, ScopedFd listen_fd, size_t progress_interval,
				DrainCallback on_drained = nullptr);
		~CacheWriter();

		CacheWriter(const CacheWriter&) = delete;
		CacheWriter& operator=(const CacheWriter&) = delete;

		// Throws ChannelError, ChannelProtocolError, StoreUnavailable
		void Run();

		const CacheWriterStats& stats() const { return stats_; }

	private:
		struct Connection {
			ScopedFd fd;
			FrameDecoder decoder;
		};

		// Accepts until the listen queue is empty; returns how many were taken
		size_t AcceptPending();
		// Reads until EAGAIN; true once the peer closed
		bool ReadConnection(Connection& conn);
		void CloseConnection(int fd);
		void Handle(const Message& message);

		CacheStore* store_;
		ScopedFd listen_fd_;
		ScopedFd epoll_fd_;
		size_t progress_interval_;
		DrainCallback on_drained_;

		absl::flat_hash_map<int, Connection> connections_;
		bool stop_received_ = false;
		CacheWriterStats stats_;
};

} // namespace Rxcache

#endif // RXCACHE_CACHE_WRITER_H_
