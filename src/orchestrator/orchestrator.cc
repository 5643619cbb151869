#include "orchestrator.h"

#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <stdexcept>

#include <glog/logging.h>

#include "absl/strings/str_join.h"

#include "cache_store/cache_store.h"
#include "common/configuration.h"
#include "common/errors.h"
#include "common/logging.h"
#include "common/scoped_fd.h"
#include "partition.h"
#include "remote_client/rxnav_api.h"
#include "remote_client/transport.h"
#include "shared_phase_state.h"
#include "writer/cache_writer.h"

namespace Rxcache {

BuildOptions BuildOptions::FromConfig(const RxcacheConfig& config) {
	BuildOptions options;
	options.cache_path = config.cache.path.get();
	options.workers = config.build.workers.get();
	options.log_dir = config.build.log_dir.get();
	options.socket_path = config.channel.socket_path.get();
	options.base_url = config.remote.base_url.get();
	options.client_options = RemoteClientOptions::FromConfig(config);
	options.load_progress_interval = config.cache.load_progress_interval.get();
	options.worker_progress_interval = config.build.progress_interval.get();
	options.writer_progress_interval = config.writer.progress_interval.get();
	options.va_root_class = config.build.va_root_class.get();
	options.drain_poll = std::chrono::milliseconds(config.build.drain_poll_ms.get());
	return options;
}

CodeUniverse DetermineCodeUniverse(RxNavApi& api) {
	StatusEnumeration rxnorm = api.CodesWithStatuses(
			{kStatusActive, kStatusRetired, kStatusNeverActive}, true);
	StatusEnumeration non_rxnorm = api.CodesWithStatuses({kStatusNonRxnorm}, true);

	CodeUniverse universe;
	universe.rxnorm_codes = std::move(rxnorm.codes);
	universe.status_of = std::move(rxnorm.status_of);
	for (int64_t code : non_rxnorm.codes) {
		if (universe.rxnorm_codes.contains(code)) {
			universe.overlap.push_back(code);
			continue;
		}
		universe.non_rxnorm_codes.insert(code);
		universe.status_of[code] = kStatusNonRxnorm;
	}

	if (!universe.overlap.empty()) {
		LOG(WARNING) << "*** [Sanity checking] PartitionMismatch: found " << universe.overlap.size()
			<< " NON-RXNORM codes which overlapped with RxNorm codes";
		LOG(WARNING) << "[" << absl::StrJoin(universe.overlap, ", ") << "]";
		LOG(WARNING) << "[End of list]";
		LOG(WARNING) << "Size of non-overlapping set of NON-RXNORM codes is "
			<< universe.non_rxnorm_codes.size();
	} else {
		LOG(INFO) << "[Sanity checking] Passed: No overlap of RxNorm and NON-RXNORM codes, as expected.";
	}
	return universe;
}

std::vector<int64_t> DetermineDrugCodes(RxNavApi& api, const std::vector<int64_t>& codes,
		size_t progress_interval) {
	if (progress_interval == 0) progress_interval = 1;
	std::vector<int64_t> drugs;
	for (size_t idx = 0; idx < codes.size(); ++idx) {
		if (CategoryForTty(api.HistoryTty(codes[idx])) == TtyCategory::kDrug) {
			drugs.push_back(codes[idx]);
		}
		if ((idx + 1) % progress_interval == 0) {
			LOG(INFO) << "..Classified " << (idx + 1) << "/" << codes.size() << " codes, "
				<< drugs.size() << " drugs so far";
		}
	}
	std::sort(drugs.begin(), drugs.end());
	return drugs;
}

Orchestrator::Orchestrator(BuildOptions options, TransportFactory transport_factory)
	: options_(std::move(options)),
	transport_factory_(std::move(transport_factory)) {
	if (options_.workers < 1) {
		throw std::invalid_argument("Orchestrator: worker count must be at least 1");
	}
}

Orchestrator::~Orchestrator() = default;

template <typename Fn>
auto Orchestrator::WithSnapshotApi(Fn&& fn) {
	auto store = CacheStore::Open(options_.cache_path, StoreMode::kReadOnly);
	store->set_load_progress_interval(options_.load_progress_interval);
	store->LoadIndex();
	std::unique_ptr<RemoteTransport> transport;
	if (transport_factory_) {
		transport = transport_factory_();
	}
	RemoteClientOptions client_options = options_.client_options;
	client_options.forward_to_writer = false;
	RemoteClient client(store.get(), transport.get(), nullptr, client_options);
	RxNavApi api(&client, options_.base_url);
	return fn(api);
}

int Orchestrator::Run() {
	ConfigureProcessLogging(options_.log_dir, "manager");
	LOG(INFO) << "[" << TimestampString() << "] Starting cache build of " << options_.cache_path
		<< " with " << options_.workers << " workers";

	int rc = 0;
	try {
		EnsureCacheFileExists(options_.cache_path);
		shared_ = SharedPhaseState::Create();
		StartWriter();
		if (!RunPhases()) {
			LOG(ERROR) << "Cache build aborted, later phases skipped";
			rc = 1;
		}
	} catch (const std::exception& e) {
		LOG(ERROR) << "Cache build failed: " << e.what();
		rc = 1;
	}

	if (!StopWriter()) {
		rc = 1;
	}
	if (!socket_path_.empty()) {
		::unlink(socket_path_.c_str());
	}
	LOG(INFO) << "[" << TimestampString() << "] Cache build " << (rc == 0 ? "complete" : "FAILED");
	return rc;
}

bool Orchestrator::RunPhases() {
	if (!RunSingleTaskPhase("phase0", [](RxNavApi& api) {
				api.CodesWithStatuses({kStatusActive, kStatusRetired, kStatusNeverActive,
						kStatusNonRxnorm}, true);
			})) {
		return false;
	}

	CodeUniverse universe = WithSnapshotApi([](RxNavApi& api) {
			return DetermineCodeUniverse(api);
		});
	std::vector<int64_t> rxnorm_codes(universe.rxnorm_codes.begin(), universe.rxnorm_codes.end());
	LOG(INFO) << "[" << TimestampString() << "] " << rxnorm_codes.size() << " RxNorm codes, "
		<< universe.non_rxnorm_codes.size() << " NON-RXNORM codes";

	if (!RunWorkerPhase("phase 1", "rxcui_worker_", rxnorm_codes,
				{ItemOperation::kAllRelated, ItemOperation::kHistoricalStatus})) {
		return false;
	}

	std::vector<int64_t> drug_codes = WithSnapshotApi([&](RxNavApi& api) {
			return DetermineDrugCodes(api, rxnorm_codes, options_.load_progress_interval);
		});
	LOG(INFO) << "[" << TimestampString() << "] " << drug_codes.size() << " drug codes for NDC lookup";

	if (!RunWorkerPhase("phase 2", "ndc_worker_", drug_codes, {ItemOperation::kNdcCodes})) {
		return false;
	}

	const std::string root = options_.va_root_class;
	return RunSingleTaskPhase("phase3", [root](RxNavApi& api) {
			LOG(INFO) << "Determine VA drug class hierarchy from " << root;
			Json::Value tree = api.ClassTree(root);
			std::vector<std::string> leaves = LeafClassIds(tree);
			LOG(INFO) << "Obtaining generic drugs for " << leaves.size() << " leaf VA classes";
			for (const auto& class_id : leaves) {
				api.GenericDrugsForVaClass(class_id);
			}
		});
}

void Orchestrator::StartWriter() {
	socket_path_ = options_.socket_path.empty() ? DefaultChannelSocketPath() : options_.socket_path;
	// Bound before the fork so producers can connect as soon as they exist
	ScopedFd listen_fd = ListenOnChannel(socket_path_);
	const int fd = listen_fd.get();
	SharedPhaseState* shared = shared_.get();

	writer_ = SpawnProcess("cache_writer", [this, fd, shared]() {
			ConfigureProcessLogging(options_.log_dir, "cache_writer");
			ScopedFd owned(fd);
			auto store = CacheStore::Open(options_.cache_path, StoreMode::kAppend);
			store->set_load_progress_interval(options_.load_progress_interval);
			store->LoadIndex();
			CacheWriter writer(store.get(), std::move(owned), options_.writer_progress_interval,
					[shared](const CacheWriterStats&) { shared->MarkProducerDrained(); });
			writer.Run();
			return 0;
		});
	LOG(INFO) << "[" << TimestampString() << "] Cache writer started (pid " << writer_->pid
		<< ") on " << socket_path_;
}

bool Orchestrator::StopWriter() {
	if (!writer_) {
		return true;
	}
	if (!writer_exit_) {
		try {
			ChannelProducer stop = OpenProducer();
			stop.Send(Stop{});
			stop.Close();
		} catch (const ChannelError& e) {
			LOG(ERROR) << "Could not deliver Stop to the cache writer: " << e.what();
		}
		writer_exit_ = JoinProcess(*writer_);
	}
	if (!writer_exit_->ok()) {
		LOG(ERROR) << "Cache writer ended abnormally: " << writer_exit_->Describe();
		return false;
	}
	LOG(INFO) << "[" << TimestampString() << "] Cache writer joined";
	return true;
}

ChannelProducer Orchestrator::OpenProducer() {
	ChannelProducer producer = ChannelProducer::Connect(socket_path_);
	++producers_opened_;
	return producer;
}

bool Orchestrator::WaitForDrain(const std::string& phase) {
	VLOG(1) << "Waiting for the writer to drain " << producers_opened_ << " producer(s)";
	while (true) {
		uint64_t drained = shared_->WaitForDrained(producers_opened_, options_.drain_poll);
		if (drained >= producers_opened_) {
			LOG(INFO) << "[" << TimestampString() << "] Writer drained " << phase << " output";
			return true;
		}
		std::optional<ExitReport> report = PollProcess(*writer_);
		if (report) {
			writer_exit_ = report;
			LOG(ERROR) << "Cache writer exited while draining " << phase << ": " << report->Describe();
			return false;
		}
	}
}

WorkerEnvironment Orchestrator::MakeWorkerEnvironment() const {
	WorkerEnvironment env;
	env.cache_path = options_.cache_path;
	env.base_url = options_.base_url;
	env.client_options = options_.client_options;
	env.client_options.forward_to_writer = true;
	env.load_progress_interval = options_.load_progress_interval;
	env.progress_interval = options_.worker_progress_interval;
	return env;
}

bool Orchestrator::RunSingleTaskPhase(const std::string& process_name, const PhaseTask& task) {
	LOG(INFO) << "[" << TimestampString() << "] Starting " << process_name;
	ChannelProducer producer = OpenProducer();
	WorkerEnvironment env = MakeWorkerEnvironment();

	ChildProcess child = SpawnProcess(process_name, [&]() {
			ConfigureProcessLogging(options_.log_dir, process_name);
			LOG(INFO) << "[" << TimestampString() << "] Starting";
			std::unique_ptr<RemoteTransport> transport;
			if (transport_factory_) {
				transport = transport_factory_();
			}
			auto store = CacheStore::Open(env.cache_path, StoreMode::kReadOnly);
			store->set_load_progress_interval(env.load_progress_interval);
			store->LoadIndex();
			RemoteClient client(store.get(), transport.get(), &producer, env.client_options);
			RxNavApi api(&client, env.base_url);
			task(api);
			producer.Close();
			LOG(INFO) << "[" << TimestampString() << "] Done, requests " << client.counters().requests
				<< ", remote calls " << client.counters().remote_calls;
			return 0;
		});
	// The child holds the only remaining copy; its exit is the writer's EOF
	producer.Close();

	ExitReport report = JoinProcess(child);
	if (!report.ok()) {
		LOG(ERROR) << process_name << " failed: " << report.Describe();
		return false;
	}
	LOG(INFO) << "[" << TimestampString() << "] Done with " << process_name;
	return WaitForDrain(process_name);
}

bool Orchestrator::RunWorkerPhase(const std::string& phase, const std::string& name_prefix,
		const std::vector<int64_t>& items, const std::vector<ItemOperation>& operations) {
	const size_t worker_count = static_cast<size_t>(options_.workers);
	std::vector<std::vector<int64_t>> segments = PartitionSegments(items, worker_count);
	LOG(INFO) << "[" << TimestampString() << "] Creating " << worker_count << " worker processes for "
		<< items.size() << " codes (" << phase << ")";

	shared_->ResetBarrier(static_cast<unsigned>(worker_count + 1));
	WorkerEnvironment env = MakeWorkerEnvironment();
	std::vector<ChildProcess> children;

	try {
		for (size_t i = 0; i < worker_count; ++i) {
			const std::string name = name_prefix + std::to_string(i + 1);
			ChannelProducer producer = OpenProducer();
			WorkerSpec spec{name, std::move(segments[i]), operations};

			children.push_back(SpawnProcess(name, [&]() {
					std::unique_ptr<RemoteTransport> transport;
					try {
						ConfigureProcessLogging(options_.log_dir, name);
						if (transport_factory_) {
							transport = transport_factory_();
						}
					} catch (const std::exception& e) {
						// Peers and the orchestrator are already counted on this worker
						LOG(ERROR) << name << " could not start: " << e.what();
						shared_->WaitBarrier();
						throw;
					}
					Worker worker(std::move(spec), env, transport.get(), &producer,
							[this]() { shared_->WaitBarrier(); });
					worker.Run();
					producer.Close();
					return 0;
				}));
			producer.Close();
		}
	} catch (const std::exception& e) {
		// Spawned workers would wait at the barrier for the missing ones forever
		LOG(ERROR) << "Could not start " << phase << " workers: " << e.what();
		for (const auto& child : children) {
			kill(child.pid, SIGKILL);
			JoinProcess(child);
		}
		return false;
	}

	LOG(INFO) << "[" << TimestampString() << "] Waiting at the " << phase << " barrier";
	shared_->WaitBarrier();
	LOG(INFO) << "[" << TimestampString() << "] Passing the " << phase << " barrier";

	bool ok = true;
	for (const auto& child : children) {
		ExitReport report = JoinProcess(child);
		if (!report.ok()) {
			LOG(ERROR) << child.name << " failed: " << report.Describe();
			ok = false;
		}
	}
	if (!ok) {
		return false;
	}
	LOG(INFO) << "[" << TimestampString() << "] Done with " << phase;
	return WaitForDrain(phase);
}

} // namespace Rxcache
