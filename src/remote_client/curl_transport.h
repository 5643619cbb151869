#ifndef RXCACHE_CURL_TRANSPORT_H_
#define RXCACHE_CURL_TRANSPORT_H_

#include <string>

#include <curl/curl.h>

#include "transport.h"

namespace Rxcache {

struct CurlTransportOptions {
	long connect_timeout_s = 30;
	long request_timeout_s = 300;
};

/**
 * libcurl easy handle, reused across requests so keep-alive connections to
 * the service survive between calls. Not thread safe; every process builds
 * its own after fork().
 */
class CurlTransport : public RemoteTransport {
	public:
		explicit CurlTransport(CurlTransportOptions options = CurlTransportOptions());
		~CurlTransport() override;

		CurlTransport(const CurlTransport&) = delete;
		CurlTransport& operator=(const CurlTransport&) = delete;

		HttpResponse Get(const std::string& url) override;

	private:
		static size_t WriteBody(char* data, size_t size, size_t nmemb, void* userdata);

		CURL* curl_;
		CurlTransportOptions options_;
		char error_buf_[CURL_ERROR_SIZE];
};

// curl_global_init; call once from main() before any fork
void InitCurlGlobal();
void CleanupCurlGlobal();

} // namespace Rxcache

#endif // RXCACHE_CURL_TRANSPORT_H_
