#ifndef RXCACHE_SRC_COMMON_ERRORS_H_
#define RXCACHE_SRC_COMMON_ERRORS_H_

#include <stdexcept>
#include <string>

namespace Rxcache {

/**
 * Base of every fatal rxcache condition. Transient network faults never
 * surface as one of these; they are absorbed by the retry loop.
 */
class CacheError : public std::runtime_error {
	public:
		explicit CacheError(const std::string& what) : std::runtime_error(what) {}
};

// Cache file could not be opened in the requested mode.
class StoreUnavailable : public CacheError {
	public:
		using CacheError::CacheError;
};

// On-disk log does not decompose into clean three-line records.
class CacheFormatError : public CacheError {
	public:
		using CacheError::CacheError;
};

// Strict (cache-only) mode lookup miss.
class NotCached : public CacheError {
	public:
		explicit NotCached(const std::string& request_key)
			: CacheError("RxNav data not in cache for [" + request_key + "]"),
			request_key_(request_key) {}

		const std::string& request_key() const { return request_key_; }

	private:
		std::string request_key_;
};

// Retry budget exhausted, or the service answered with a non-retryable status.
class RemoteUnavailable : public CacheError {
	public:
		RemoteUnavailable(const std::string& request_key, int attempts, const std::string& last_error)
			: CacheError("Remote service unavailable for [" + request_key + "] after " +
					std::to_string(attempts) + " attempt(s): " + last_error),
			request_key_(request_key), attempts_(attempts) {}

		const std::string& request_key() const { return request_key_; }
		int attempts() const { return attempts_; }

	private:
		std::string request_key_;
		int attempts_;
};

// A payload (remote or cached) is not the JSON document the caller expects.
class PayloadFormatError : public CacheError {
	public:
		using CacheError::CacheError;
};

// Socket level failure on the writer channel.
class ChannelError : public CacheError {
	public:
		using CacheError::CacheError;
};

// Bytes on the channel that are not a valid CacheWrite or Stop frame.
class ChannelProtocolError : public CacheError {
	public:
		using CacheError::CacheError;
};

} // namespace Rxcache

#endif // RXCACHE_SRC_COMMON_ERRORS_H_
