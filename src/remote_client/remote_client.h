#ifndef RXCACHE_REMOTE_CLIENT_H_
#define RXCACHE_REMOTE_CLIENT_H_

#include <chrono>
#include <cstdint>
#include <deque>
#include <string>

#include <json/json.h>

#include "transport.h"

namespace Rxcache {

class CacheStore;
class ChannelProducer;
struct RxcacheConfig;

struct RemoteClientOptions {
	// Send every remotely fetched payload to the cache writer
	bool forward_to_writer = false;
	// Cache-only: a miss raises NotCached instead of going to the network
	bool fail_if_not_cached = false;
	int retry_limit = 40;
	std::chrono::milliseconds retry_delay{15000};
	// Remote calls per throughput summary; also the timing window length
	size_t stats_interval = 500;

	static RemoteClientOptions FromConfig(const RxcacheConfig& config);
};

struct RequestCounters {
	uint64_t requests = 0;          // logical Fetch calls
	uint64_t remote_calls = 0;      // successful remote round trips
	uint64_t remote_attempts = 0;   // transport invocations, retries included
	uint64_t cache_hits = 0;
	uint64_t forwarded = 0;
};

/**
 * One logical fetch per request key: cache snapshot first, then the remote
 * service with bounded retry. The client never writes the cache file; with
 * forwarding on, each fresh payload goes to the writer as a CacheWrite.
 *
 * Every process builds its own client; none of the pointers are owned.
 * store may be null (no cache), transport may be null (cache only),
 * producer must be set when forwarding is on.
 */
class RemoteClient {
	public:
		RemoteClient(CacheStore* store, RemoteTransport* transport, ChannelProducer* producer,
				RemoteClientOptions options);

		RemoteClient(const RemoteClient&) = delete;
		RemoteClient& operator=(const RemoteClient&) = delete;

		// Throws NotCached, RemoteUnavailable, PayloadFormatError, ChannelError
		Json::Value Fetch(const std::string& request_key);

		// Payload text as cached, single line
		std::string FetchText(const std::string& request_key);

		const RequestCounters& counters() const { return counters_; }
		const RemoteClientOptions& options() const { return options_; }
		std::string CacheUsage() const { return std::to_string(counters_.cache_hits); }

	private:
		std::string FetchRemote(const std::string& request_key);
		void RecordCall(double seconds);
		void LogStats();
		double SecondsSinceStart() const;

		CacheStore* store_;
		RemoteTransport* transport_;
		ChannelProducer* producer_;
		RemoteClientOptions options_;

		RequestCounters counters_;
		std::deque<double> call_timings_;
		std::chrono::steady_clock::time_point start_time_;
		std::chrono::steady_clock::time_point last_stats_time_;
		uint64_t last_stats_count_ = 0;
};

// HTTP 429 and 5xx are worth retrying; everything else non-2xx is final
bool IsTransientStatus(long status);

// Throws PayloadFormatError naming the request key
Json::Value ParsePayload(const std::string& text, const std::string& request_key);

// Compact single-line rendering of a multi-line payload; other text is returned as is
std::string NormalizePayload(const std::string& text, const Json::Value& parsed);

} // namespace Rxcache

#endif // RXCACHE_REMOTE_CLIENT_H_
