#include "curl_transport.h"

#include <cstring>

#include <glog/logging.h>

namespace Rxcache {

void InitCurlGlobal() {
	CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
	if (rc != CURLE_OK) {
		LOG(FATAL) << "curl_global_init failed: " << curl_easy_strerror(rc);
	}
}

void CleanupCurlGlobal() {
	curl_global_cleanup();
}

CurlTransport::CurlTransport(CurlTransportOptions options)
	: curl_(curl_easy_init()), options_(options) {
	if (curl_ == nullptr) {
		throw TransportError("curl_easy_init failed");
	}
	memset(error_buf_, 0, sizeof(error_buf_));
}

CurlTransport::~CurlTransport() {
	if (curl_) {
		curl_easy_cleanup(curl_);
	}
}

size_t CurlTransport::WriteBody(char* data, size_t size, size_t nmemb, void* userdata) {
	auto* body = static_cast<std::string*>(userdata);
	body->append(data, size * nmemb);
	return size * nmemb;
}

HttpResponse CurlTransport::Get(const std::string& url) {
	HttpResponse response;

	curl_easy_reset(curl_);
	error_buf_[0] = '\0';
	curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
	curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_s);
	curl_easy_setopt(curl_, CURLOPT_TIMEOUT, options_.request_timeout_s);
	curl_easy_setopt(curl_, CURLOPT_ACCEPT_ENCODING, "");
	curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, error_buf_);
	curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, &CurlTransport::WriteBody);
	curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);

	CURLcode rc = curl_easy_perform(curl_);
	if (rc != CURLE_OK) {
		std::string detail = error_buf_[0] ? std::string(error_buf_) : curl_easy_strerror(rc);
		throw TransportError("GET " + url + " failed: " + detail);
	}
	curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status);
	VLOG(4) << "GET " << url << " -> " << response.status << " (" << response.body.size() << " bytes)";
	return response;
}

} // namespace Rxcache
