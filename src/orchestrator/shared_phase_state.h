#ifndef RXCACHE_SHARED_PHASE_STATE_H_
#define RXCACHE_SHARED_PHASE_STATE_H_

#include <pthread.h>
#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <memory>

namespace Rxcache {

/**
 * Synchronisation state shared by the orchestrator and every process it
 * forks: a phase barrier and the writer's "producers drained" counter.
 * Lives in an anonymous MAP_SHARED mapping created before the first fork,
 * so all children see the same pages. Only the creating process tears it
 * down.
 */
class SharedPhaseState {
	public:
		static std::unique_ptr<SharedPhaseState> Create();
		~SharedPhaseState();

		SharedPhaseState(const SharedPhaseState&) = delete;
		SharedPhaseState& operator=(const SharedPhaseState&) = delete;

		// Orchestrator only, before forking a phase's workers
		void ResetBarrier(unsigned participants);

		// Blocks until every participant of the current phase arrived. No timeout.
		void WaitBarrier();

		// Writer side, once per connection that reached EOF
		void MarkProducerDrained();

		/**
		 * Waits up to timeout for the drained counter to reach target.
		 * @return the counter when the wait ended
		 */
		uint64_t WaitForDrained(uint64_t target, std::chrono::milliseconds timeout);

	private:
		struct Block {
			pthread_barrier_t barrier;
			bool barrier_initialized;
			pthread_mutex_t drain_mutex;
			pthread_cond_t drain_cond;
			uint64_t producers_drained;
		};

		explicit SharedPhaseState(Block* block);

		Block* block_;
		pid_t owner_;
};

} // namespace Rxcache

#endif // RXCACHE_SHARED_PHASE_STATE_H_
