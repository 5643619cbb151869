#ifndef RXCACHE_ORCHESTRATOR_H_
#define RXCACHE_ORCHESTRATOR_H_

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/btree_set.h"
#include "absl/container/flat_hash_map.h"

#include "channel/cache_channel.h"
#include "process.h"
#include "remote_client/remote_client.h"
#include "worker.h"

namespace Rxcache {

class RemoteTransport;
class RxNavApi;
class SharedPhaseState;
struct RxcacheConfig;

struct BuildOptions {
	std::string cache_path = "rxcui.cache";
	int workers = 4;
	std::string log_dir;
	// Empty picks <tmpdir>/rxcache-writer-<pid>.sock
	std::string socket_path;
	std::string base_url = "https://rxnav.nlm.nih.gov/REST";
	RemoteClientOptions client_options;
	size_t load_progress_interval = 10000;
	size_t worker_progress_interval = 1000;
	size_t writer_progress_interval = 1000;
	std::string va_root_class = "VA000";
	std::chrono::milliseconds drain_poll{200};

	static BuildOptions FromConfig(const RxcacheConfig& config);
};

// Each process that talks to the service builds its own transport after fork()
using TransportFactory = std::function<std::unique_ptr<RemoteTransport>()>;

struct CodeUniverse {
	absl::btree_set<int64_t> rxnorm_codes;       // ACTIVE, RETIRED, NEVER ACTIVE
	absl::btree_set<int64_t> non_rxnorm_codes;   // overlap already removed
	// Codes listed both as RxNorm and NON-RXNORM (PartitionMismatch report)
	std::vector<int64_t> overlap;
	absl::flat_hash_map<int64_t, std::string> status_of;
};

/**
 * Status enumerations split into RxNorm and NON-RXNORM code sets. The two
 * are expected to be disjoint; any overlap is logged and dropped from the
 * NON-RXNORM side.
 */
CodeUniverse DetermineCodeUniverse(RxNavApi& api);

// Codes whose history TTY is a drug term type, sorted
std::vector<int64_t> DetermineDrugCodes(RxNavApi& api, const std::vector<int64_t>& codes,
		size_t progress_interval);

/**
 * Runs the whole cache build: writer start, phase 0 (status listings),
 * universe, phase 1 (allrelated + history per RxNorm code), drug set,
 * phase 2 (NDCs per drug), phase 3 (VA classes), Stop, writer join.
 * Phases run strictly in sequence; a phase's output is drained into the
 * file before the next phase takes its snapshot.
 */
class Orchestrator {
	public:
		Orchestrator(BuildOptions options, TransportFactory transport_factory);
		~Orchestrator();

		Orchestrator(const Orchestrator&) = delete;
		Orchestrator& operator=(const Orchestrator&) = delete;

		// Process exit status: 0 when every phase and the writer succeeded
		int Run();

		const std::string& socket_path() const { return socket_path_; }

	private:
		using PhaseTask = std::function<void(RxNavApi&)>;

		bool RunPhases();
		void StartWriter();
		bool StopWriter();
		// Connects a new producer to the writer; counted for the drain wait
		ChannelProducer OpenProducer();
		bool WaitForDrain(const std::string& phase);

		bool RunSingleTaskPhase(const std::string& process_name, const PhaseTask& task);
		bool RunWorkerPhase(const std::string& phase, const std::string& name_prefix,
				const std::vector<int64_t>& items, const std::vector<ItemOperation>& operations);

		// Orchestrator's own read-only, non-forwarding view of the current file
		template <typename Fn>
		auto WithSnapshotApi(Fn&& fn);

		WorkerEnvironment MakeWorkerEnvironment() const;

		BuildOptions options_;
		TransportFactory transport_factory_;
		std::string socket_path_;
		std::unique_ptr<SharedPhaseState> shared_;
		std::optional<ChildProcess> writer_;
		// Set once the writer has been reaped
		std::optional<ExitReport> writer_exit_;
		uint64_t producers_opened_ = 0;
};

} // namespace Rxcache

#endif // RXCACHE_ORCHESTRATOR_H_
