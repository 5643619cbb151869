#ifndef RXCACHE_WORKER_H_
#define RXCACHE_WORKER_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "remote_client/remote_client.h"

namespace Rxcache {

class CacheStore;
class ChannelProducer;
class RemoteTransport;
class RxNavApi;

enum class WorkerState {
	kInit,
	kAwaitBarrier,
	kProcessing,
	kDone,
};

const char* WorkerStateName(WorkerState state);

// What a phase asks of every code in a segment
enum class ItemOperation {
	kHistoricalStatus,   // rxcuihistory concept
	kAllRelated,         // allrelated
	kNdcCodes,           // allhistoricalndcs
};

struct WorkerSpec {
	std::string name;                       // e.g. rxcui_worker_2
	std::vector<int64_t> segment;
	std::vector<ItemOperation> operations;  // applied in order to each code
};

struct WorkerEnvironment {
	std::string cache_path;
	std::string base_url;
	RemoteClientOptions client_options;
	size_t load_progress_interval = 10000;
	size_t progress_interval = 1000;
};

/**
 * One fetcher process's life: open the cache read-only and load the
 * snapshot (Init), meet the other workers and the orchestrator at the
 * barrier (AwaitBarrier), run every operation on every code of the segment
 * (Processing), then Done. Fatal conditions propagate as exceptions.
 */
class Worker {
	public:
		Worker(WorkerSpec spec, WorkerEnvironment env, RemoteTransport* transport,
				ChannelProducer* producer, std::function<void()> await_barrier);
		~Worker();

		void Run();

		WorkerState state() const { return state_; }
		const RequestCounters& counters() const;

	private:
		void Init();
		void Process();
		void Apply(ItemOperation operation, int64_t code);

		WorkerSpec spec_;
		WorkerEnvironment env_;
		RemoteTransport* transport_;
		ChannelProducer* producer_;
		std::function<void()> await_barrier_;

		WorkerState state_ = WorkerState::kInit;
		std::unique_ptr<CacheStore> store_;
		std::unique_ptr<RemoteClient> client_;
		std::unique_ptr<RxNavApi> api_;
};

} // namespace Rxcache

#endif // RXCACHE_WORKER_H_
