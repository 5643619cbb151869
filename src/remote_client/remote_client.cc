#include "remote_client.h"

#include <iomanip>
#include <memory>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <thread>

#include <glog/logging.h>

#include "cache_store/cache_store.h"
#include "channel/cache_channel.h"
#include "common/configuration.h"
#include "common/errors.h"
#include "common/logging.h"

namespace Rxcache {

namespace {

constexpr size_t kTimingsPerLine = 20;

} // namespace

RemoteClientOptions RemoteClientOptions::FromConfig(const RxcacheConfig& config) {
	RemoteClientOptions options;
	options.fail_if_not_cached = config.build.fail_if_not_cached.get();
	options.retry_limit = config.remote.retry_limit.get();
	options.retry_delay = std::chrono::milliseconds(config.remote.retry_delay_ms.get());
	options.stats_interval = config.remote.stats_interval.get();
	return options;
}

bool IsTransientStatus(long status) {
	return status == 429 || (status >= 500 && status < 600);
}

Json::Value ParsePayload(const std::string& text, const std::string& request_key) {
	Json::CharReaderBuilder builder;
	std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
	Json::Value root;
	std::string errs;
	if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
		throw PayloadFormatError("Payload for [" + request_key + "] is not JSON: " + errs);
	}
	return root;
}

std::string NormalizePayload(const std::string& text, const Json::Value& parsed) {
	if (text.find_first_of("\r\n") == std::string::npos) {
		return text;
	}
	Json::StreamWriterBuilder builder;
	builder["indentation"] = "";
	builder["emitUTF8"] = true;
	return Json::writeString(builder, parsed);
}

RemoteClient::RemoteClient(CacheStore* store, RemoteTransport* transport, ChannelProducer* producer,
		RemoteClientOptions options)
	: store_(store),
	transport_(transport),
	producer_(producer),
	options_(options),
	start_time_(std::chrono::steady_clock::now()),
	last_stats_time_(start_time_) {
	if (options_.forward_to_writer && producer_ == nullptr) {
		throw std::invalid_argument("RemoteClient: forwarding requires a channel producer");
	}
	if (options_.retry_limit < 1) {
		throw std::invalid_argument("RemoteClient: retry limit must be at least 1");
	}
	if (options_.stats_interval == 0) {
		options_.stats_interval = 1;
	}
}

Json::Value RemoteClient::Fetch(const std::string& request_key) {
	std::string text = FetchText(request_key);
	return ParsePayload(text, request_key);
}

std::string RemoteClient::FetchText(const std::string& request_key) {
	++counters_.requests;

	if (store_ != nullptr) {
		std::optional<std::string> cached = store_->Lookup(request_key);
		if (cached) {
			++counters_.cache_hits;
			VLOG(3) << "Cache hit [" << request_key << "]";
			return std::move(*cached);
		}
	}

	if (options_.fail_if_not_cached || transport_ == nullptr) {
		throw NotCached(request_key);
	}
	return FetchRemote(request_key);
}

std::string RemoteClient::FetchRemote(const std::string& request_key) {
	auto started = std::chrono::steady_clock::now();
	std::string last_error;
	HttpResponse response;
	bool succeeded = false;

	for (int attempt = 1; attempt <= options_.retry_limit && !succeeded; ++attempt) {
		++counters_.remote_attempts;
		try {
			response = transport_->Get(request_key);
			if (response.status >= 200 && response.status < 300) {
				succeeded = true;
				break;
			}
			if (!IsTransientStatus(response.status)) {
				throw RemoteUnavailable(request_key, attempt,
						"HTTP status " + std::to_string(response.status));
			}
			last_error = "HTTP status " + std::to_string(response.status);
		} catch (const TransportError& e) {
			last_error = e.what();
		}

		bool will_retry = attempt < options_.retry_limit;
		LOG(WARNING) << "[Communications error with RxNav REST API ... attempt " << attempt
			<< " of " << options_.retry_limit
			<< (will_retry ? ", retrying in " + std::to_string(options_.retry_delay.count()) + "ms" : "")
			<< "]";
		LOG(WARNING) << "Communication Error: [" << last_error << "]";
		LOG(WARNING) << "NOTE: RxNav requests: " << counters_.remote_calls
			<< ", seconds since start: " << SecondsSinceStart();
		if (will_retry && options_.retry_delay.count() > 0) {
			std::this_thread::sleep_for(options_.retry_delay);
		}
	}

	if (!succeeded) {
		throw RemoteUnavailable(request_key, options_.retry_limit, last_error);
	}

	// Validate before anything reaches the writer
	Json::Value parsed = ParsePayload(response.body, request_key);
	std::string payload = NormalizePayload(response.body, parsed);

	std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
	RecordCall(elapsed.count());

	if (options_.forward_to_writer) {
		producer_->Send(CacheWrite{request_key, payload});
		++counters_.forwarded;
	}
	return payload;
}

void RemoteClient::RecordCall(double seconds) {
	call_timings_.push_back(seconds);
	while (call_timings_.size() > options_.stats_interval) {
		call_timings_.pop_front();
	}
	++counters_.remote_calls;
	if (counters_.remote_calls % options_.stats_interval == 0) {
		LogStats();
	}
}

void RemoteClient::LogStats() {
	uint64_t batch_size = counters_.remote_calls - last_stats_count_;

	if (counters_.remote_calls == options_.stats_interval) {
		LOG(INFO) << "[Timings of first " << options_.stats_interval << " requests]";
		for (size_t i = 0; i < call_timings_.size(); i += kTimingsPerLine) {
			std::ostringstream line;
			line << std::fixed << std::setprecision(3) << "[";
			for (size_t j = i; j < call_timings_.size() && j < i + kTimingsPerLine; ++j) {
				if (j != i) line << ", ";
				line << call_timings_[j];
			}
			line << "]";
			LOG(INFO) << line.str();
		}
		LOG(INFO) << "[End timings]";
	}

	double window_sum = std::accumulate(call_timings_.begin(), call_timings_.end(), 0.0);
	LOG(INFO) << "[" << TimestampString() << "] Sum of request timings of last batch of "
		<< batch_size << " ==> " << window_sum << " seconds";

	auto now = std::chrono::steady_clock::now();
	std::chrono::duration<double> since_last = now - last_stats_time_;
	double rate = since_last.count() > 0 ? batch_size / since_last.count() : 0.0;
	LOG(INFO) << "[" << TimestampString() << "] RxNav requests: " << counters_.requests
		<< ", REST API calls: " << counters_.remote_calls
		<< ", seconds: " << since_last.count()
		<< ", rate/sec: " << std::fixed << std::setprecision(3) << rate
		<< ", cache (size: " << (store_ ? store_->index().size() : 0)
		<< ", hits: " << counters_.cache_hits << ")";

	last_stats_time_ = now;
	last_stats_count_ = counters_.remote_calls;
}

double RemoteClient::SecondsSinceStart() const {
	std::chrono::duration<double> d = std::chrono::steady_clock::now() - start_time_;
	return d.count();
}

} // namespace Rxcache
