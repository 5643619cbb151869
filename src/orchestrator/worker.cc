#include "worker.h"

#include <exception>

#include <glog/logging.h>

#include "cache_store/cache_store.h"
#include "channel/cache_channel.h"
#include "common/logging.h"
#include "remote_client/rxnav_api.h"

namespace Rxcache {

const char* WorkerStateName(WorkerState state) {
	switch (state) {
		case WorkerState::kInit: return "Init";
		case WorkerState::kAwaitBarrier: return "AwaitBarrier";
		case WorkerState::kProcessing: return "Processing";
		case WorkerState::kDone: return "Done";
	}
	return "Unknown";
}

Worker::Worker(WorkerSpec spec, WorkerEnvironment env, RemoteTransport* transport,
		ChannelProducer* producer, std::function<void()> await_barrier)
	: spec_(std::move(spec)),
	env_(std::move(env)),
	transport_(transport),
	producer_(producer),
	await_barrier_(std::move(await_barrier)) {
	if (env_.progress_interval == 0) env_.progress_interval = 1;
}

Worker::~Worker() = default;

const RequestCounters& Worker::counters() const {
	static const RequestCounters kEmpty;
	return client_ ? client_->counters() : kEmpty;
}

void Worker::Run() {
	// A worker that fails to initialise still releases the barrier, otherwise
	// its peers and the orchestrator would wait on it forever
	std::exception_ptr init_error;
	try {
		Init();
	} catch (const std::exception& e) {
		LOG(ERROR) << spec_.name << " initialisation failed: " << e.what();
		init_error = std::current_exception();
	}

	state_ = WorkerState::kAwaitBarrier;
	LOG(INFO) << "[" << TimestampString() << "] Waiting at the barrier";
	if (await_barrier_) {
		await_barrier_();
	}
	LOG(INFO) << "[" << TimestampString() << "] Passing the barrier";
	if (init_error) {
		std::rethrow_exception(init_error);
	}

	state_ = WorkerState::kProcessing;
	Process();

	state_ = WorkerState::kDone;
	const RequestCounters& c = client_->counters();
	LOG(INFO) << "[" << TimestampString() << "] Finished processing " << spec_.segment.size()
		<< " codes ... terminating (requests " << c.requests << ", remote calls " << c.remote_calls
		<< ", cache hits " << c.cache_hits << ")";
}

void Worker::Init() {
	state_ = WorkerState::kInit;
	if (spec_.segment.empty()) {
		LOG(INFO) << "[" << TimestampString() << "] " << spec_.name << " -- empty segment";
	} else {
		LOG(INFO) << "[" << TimestampString() << "] " << spec_.name << " -- processing "
			<< spec_.segment.size() << " codes from [" << spec_.segment.front()
			<< "] to [" << spec_.segment.back() << "]";
	}

	store_ = CacheStore::Open(env_.cache_path, StoreMode::kReadOnly);
	store_->set_load_progress_interval(env_.load_progress_interval);
	store_->LoadIndex();

	client_ = std::make_unique<RemoteClient>(store_.get(), transport_, producer_, env_.client_options);
	api_ = std::make_unique<RxNavApi>(client_.get(), env_.base_url);
}

void Worker::Process() {
	const size_t total = spec_.segment.size();
	for (size_t idx = 0; idx < total; ++idx) {
		int64_t code = spec_.segment[idx];
		for (ItemOperation op : spec_.operations) {
			Apply(op, code);
		}
		if (idx % env_.progress_interval == 0) {
			LOG(INFO) << "[" << TimestampString() << "] Processed " << (idx + 1) << "/" << total
				<< " codes, last was [" << code << "]";
		}
	}
}

void Worker::Apply(ItemOperation operation, int64_t code) {
	// Fetching is the point; forwarding already queued any new payload
	switch (operation) {
		case ItemOperation::kHistoricalStatus:
			api_->HistoricalConcept(code);
			break;
		case ItemOperation::kAllRelated:
			api_->AllRelated(code);
			break;
		case ItemOperation::kNdcCodes:
			api_->NdcCodesFor(code);
			break;
	}
}

} // namespace Rxcache
