#ifndef RXCACHE_REMOTE_TRANSPORT_H_
#define RXCACHE_REMOTE_TRANSPORT_H_

#include <stdexcept>
#include <string>

namespace Rxcache {

struct HttpResponse {
	long status = 0;
	std::string body;
};

// Communication-level failure (DNS, connect, timeout, reset). Always retryable.
class TransportError : public std::runtime_error {
	public:
		explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * One blocking GET against the remote service. Implementations throw
 * TransportError when no HTTP response was obtained; any response, whatever
 * its status, is returned to the caller.
 */
class RemoteTransport {
	public:
		virtual ~RemoteTransport() = default;
		virtual HttpResponse Get(const std::string& url) = 0;
};

} // namespace Rxcache

#endif // RXCACHE_REMOTE_TRANSPORT_H_
