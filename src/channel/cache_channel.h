#ifndef RXCACHE_CACHE_CHANNEL_H_
#define RXCACHE_CACHE_CHANNEL_H_

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "common/overloaded.h"
#include "common/scoped_fd.h"

namespace Rxcache {

// Result of one remote request, headed for the cache writer
struct CacheWrite {
	std::string key;
	std::string payload;
};

// Orchestrator's shutdown signal to the writer
struct Stop {};

using Message = std::variant<CacheWrite, Stop>;

// Serialized header + protobuf body, ready for the socket
std::string EncodeFrame(const Message& message);

/**
 * Reassembles frames from a byte stream. A connection's bytes arrive in
 * arbitrary chunks; Next() hands back whole messages in the order the
 * producer sent them.
 */
class FrameDecoder {
	public:
		void Append(const char* data, size_t len);

		// Next complete message, nullopt when more bytes are needed.
		// Throws ChannelProtocolError on a bad header or undecodable body.
		std::optional<Message> Next();

		size_t buffered() const { return buffer_.size() - consumed_; }

	private:
		std::string buffer_;
		size_t consumed_ = 0;
};

/**
 * Producer end of the writer channel. One connection per producer process;
 * Send() blocks until the whole frame is in the socket buffer.
 */
class ChannelProducer {
	public:
		ChannelProducer() = default;
		explicit ChannelProducer(ScopedFd fd) : fd_(std::move(fd)) {}

		// Throws ChannelError
		static ChannelProducer Connect(const std::string& socket_path);

		ChannelProducer(ChannelProducer&&) = default;
		ChannelProducer& operator=(ChannelProducer&&) = default;

		// Throws ChannelError if the writer went away
		void Send(const Message& message);

		void Close() { fd_.reset(); }
		bool connected() const { return fd_.valid(); }
		uint64_t sent() const { return sent_; }

	private:
		ScopedFd fd_;
		uint64_t sent_ = 0;
};

// Bound, listening AF_UNIX socket for the writer. Replaces a stale socket file.
ScopedFd ListenOnChannel(const std::string& socket_path);

// <TMPDIR or /tmp>/rxcache-writer-<pid>.sock
std::string DefaultChannelSocketPath();

} // namespace Rxcache

#endif // RXCACHE_CACHE_CHANNEL_H_
