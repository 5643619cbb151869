#include "cache_channel.h"

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>

#include <cstdlib>
#include <cstring>

#include <glog/logging.h>

#include "cache_channel.pb.h"
#include "common/errors.h"
#include "common/wire_formats.h"

namespace Rxcache {

namespace {

sockaddr_un MakeAddress(const std::string& socket_path) {
	sockaddr_un addr;
	memset(&addr, 0, sizeof(addr));
	addr.sun_family = AF_UNIX;
	if (socket_path.empty() || socket_path.size() >= sizeof(addr.sun_path)) {
		throw ChannelError("Invalid channel socket path [" + socket_path + "]");
	}
	memcpy(addr.sun_path, socket_path.c_str(), socket_path.size());
	return addr;
}

} // namespace

std::string EncodeFrame(const Message& message) {
	rxcache::channel::ChannelMessage proto;
	std::visit(Overloaded{
			[&proto](const CacheWrite& write) {
				auto* out = proto.mutable_cache_write();
				out->set_key(write.key);
				out->set_payload(write.payload);
			},
			[&proto](const Stop&) {
				proto.mutable_stop();
			},
		}, message);

	std::string body;
	if (!proto.SerializeToString(&body)) {
		throw ChannelProtocolError("Failed to serialize channel message");
	}
	if (body.size() > wire::MAX_FRAME_BODY_SIZE) {
		throw ChannelProtocolError("Channel message of " + std::to_string(body.size()) +
				" bytes exceeds frame limit");
	}

	wire::FrameHeader header{wire::FRAME_MAGIC, static_cast<uint32_t>(body.size())};
	std::string frame;
	frame.reserve(wire::FrameSize(body.size()));
	frame.append(reinterpret_cast<const char*>(&header), sizeof(header));
	frame.append(body);
	return frame;
}

void FrameDecoder::Append(const char* data, size_t len) {
	// Compact once the consumed prefix dominates the buffer
	if (consumed_ > 0 && consumed_ >= buffer_.size() / 2) {
		buffer_.erase(0, consumed_);
		consumed_ = 0;
	}
	buffer_.append(data, len);
}

std::optional<Message> FrameDecoder::Next() {
	if (buffered() < sizeof(wire::FrameHeader)) {
		return std::nullopt;
	}
	wire::FrameHeader header;
	memcpy(&header, buffer_.data() + consumed_, sizeof(header));
	if (!wire::ValidateFrameHeader(header)) {
		throw ChannelProtocolError("Invalid frame header (magic " + std::to_string(header.magic) +
				", length " + std::to_string(header.length) + ")");
	}
	if (buffered() < wire::FrameSize(header.length)) {
		return std::nullopt;
	}

	rxcache::channel::ChannelMessage proto;
	const char* body = buffer_.data() + consumed_ + sizeof(header);
	if (!proto.ParseFromArray(body, static_cast<int>(header.length))) {
		throw ChannelProtocolError("Undecodable channel message body");
	}
	consumed_ += wire::FrameSize(header.length);

	switch (proto.kind_case()) {
		case rxcache::channel::ChannelMessage::kCacheWrite: {
			auto* write = proto.mutable_cache_write();
			return Message{CacheWrite{std::move(*write->mutable_key()),
				std::move(*write->mutable_payload())}};
		}
		case rxcache::channel::ChannelMessage::kStop:
			return Message{Stop{}};
		case rxcache::channel::ChannelMessage::KIND_NOT_SET:
			break;
	}
	throw ChannelProtocolError("Channel message carries no recognised kind");
}

ChannelProducer ChannelProducer::Connect(const std::string& socket_path) {
	sockaddr_un addr = MakeAddress(socket_path);
	ScopedFd fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
	if (!fd.valid()) {
		throw ChannelError(std::string("Channel socket creation failed: ") + strerror(errno));
	}
	int ret;
	do {
		ret = ::connect(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
	} while (ret < 0 && errno == EINTR);
	if (ret < 0) {
		throw ChannelError("Cannot connect to cache writer at " + socket_path + ": " + strerror(errno));
	}
	return ChannelProducer(std::move(fd));
}

void ChannelProducer::Send(const Message& message) {
	if (!fd_.valid()) {
		throw ChannelError("Send on a closed channel producer");
	}
	std::string frame = EncodeFrame(message);
	const char* p = frame.data();
	size_t remaining = frame.size();
	while (remaining > 0) {
		// MSG_NOSIGNAL: a dead writer shows up as EPIPE, not SIGPIPE
		ssize_t n = ::send(fd_.get(), p, remaining, MSG_NOSIGNAL);
		if (n < 0) {
			if (errno == EINTR) continue;
			throw ChannelError(std::string("Send to cache writer failed: ") + strerror(errno));
		}
		p += n;
		remaining -= static_cast<size_t>(n);
	}
	++sent_;
}

ScopedFd ListenOnChannel(const std::string& socket_path) {
	sockaddr_un addr = MakeAddress(socket_path);
	if (::unlink(socket_path.c_str()) == 0) {
		LOG(WARNING) << "Removed stale channel socket " << socket_path;
	}

	ScopedFd fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
	if (!fd.valid()) {
		throw ChannelError(std::string("Channel socket creation failed: ") + strerror(errno));
	}
	if (::bind(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
		throw ChannelError("Cannot bind channel socket " + socket_path + ": " + strerror(errno));
	}
	if (::listen(fd.get(), SOMAXCONN) < 0) {
		throw ChannelError("Cannot listen on channel socket " + socket_path + ": " + strerror(errno));
	}
	VLOG(2) << "Channel listening on " << socket_path;
	return fd;
}

std::string DefaultChannelSocketPath() {
	const char* tmpdir = std::getenv("TMPDIR");
	std::string dir = (tmpdir && tmpdir[0]) ? tmpdir : "/tmp";
	if (dir.back() != '/') dir += '/';
	return dir + "rxcache-writer-" + std::to_string(::getpid()) + ".sock";
}

} // namespace Rxcache
