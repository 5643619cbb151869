#include "shared_phase_state.h"

#include <sys/mman.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>
#include <time.h>

#include <new>
#include <stdexcept>
#include <string>

#include <glog/logging.h>

namespace Rxcache {

namespace {

void CheckPthread(int rc, const char* what) {
	if (rc != 0) {
		throw std::runtime_error(std::string(what) + " failed: " + strerror(rc));
	}
}

timespec DeadlineAfter(std::chrono::milliseconds timeout) {
	timespec ts;
	clock_gettime(CLOCK_MONOTONIC, &ts);
	long long ns = ts.tv_nsec + static_cast<long long>(timeout.count() % 1000) * 1000000LL;
	ts.tv_sec += static_cast<time_t>(timeout.count() / 1000 + ns / 1000000000LL);
	ts.tv_nsec = static_cast<long>(ns % 1000000000LL);
	return ts;
}

} // namespace

std::unique_ptr<SharedPhaseState> SharedPhaseState::Create() {
	void* addr = mmap(nullptr, sizeof(Block), PROT_READ | PROT_WRITE,
			MAP_SHARED | MAP_ANONYMOUS, -1, 0);
	if (addr == MAP_FAILED) {
		throw std::runtime_error(std::string("mmap of shared phase state failed: ") + strerror(errno));
	}
	Block* block = new (addr) Block;
	block->barrier_initialized = false;
	block->producers_drained = 0;

	pthread_mutexattr_t mattr;
	pthread_mutexattr_init(&mattr);
	pthread_mutexattr_setpshared(&mattr, PTHREAD_PROCESS_SHARED);
	int rc = pthread_mutex_init(&block->drain_mutex, &mattr);
	pthread_mutexattr_destroy(&mattr);
	if (rc != 0) {
		munmap(addr, sizeof(Block));
		CheckPthread(rc, "pthread_mutex_init");
	}

	pthread_condattr_t cattr;
	pthread_condattr_init(&cattr);
	pthread_condattr_setpshared(&cattr, PTHREAD_PROCESS_SHARED);
	pthread_condattr_setclock(&cattr, CLOCK_MONOTONIC);
	rc = pthread_cond_init(&block->drain_cond, &cattr);
	pthread_condattr_destroy(&cattr);
	if (rc != 0) {
		pthread_mutex_destroy(&block->drain_mutex);
		munmap(addr, sizeof(Block));
		CheckPthread(rc, "pthread_cond_init");
	}

	return std::unique_ptr<SharedPhaseState>(new SharedPhaseState(block));
}

SharedPhaseState::SharedPhaseState(Block* block) : block_(block), owner_(getpid()) {}

SharedPhaseState::~SharedPhaseState() {
	if (getpid() != owner_) {
		return;
	}
	if (block_->barrier_initialized) {
		pthread_barrier_destroy(&block_->barrier);
	}
	pthread_cond_destroy(&block_->drain_cond);
	pthread_mutex_destroy(&block_->drain_mutex);
	munmap(block_, sizeof(Block));
}

void SharedPhaseState::ResetBarrier(unsigned participants) {
	if (block_->barrier_initialized) {
		pthread_barrier_destroy(&block_->barrier);
		block_->barrier_initialized = false;
	}
	pthread_barrierattr_t attr;
	pthread_barrierattr_init(&attr);
	pthread_barrierattr_setpshared(&attr, PTHREAD_PROCESS_SHARED);
	int rc = pthread_barrier_init(&block_->barrier, &attr, participants);
	pthread_barrierattr_destroy(&attr);
	CheckPthread(rc, "pthread_barrier_init");
	block_->barrier_initialized = true;
	VLOG(1) << "Phase barrier sized " << participants;
}

void SharedPhaseState::WaitBarrier() {
	if (!block_->barrier_initialized) {
		throw std::logic_error("WaitBarrier before ResetBarrier");
	}
	int rc = pthread_barrier_wait(&block_->barrier);
	if (rc != 0 && rc != PTHREAD_BARRIER_SERIAL_THREAD) {
		CheckPthread(rc, "pthread_barrier_wait");
	}
}

void SharedPhaseState::MarkProducerDrained() {
	pthread_mutex_lock(&block_->drain_mutex);
	++block_->producers_drained;
	pthread_cond_broadcast(&block_->drain_cond);
	pthread_mutex_unlock(&block_->drain_mutex);
}

uint64_t SharedPhaseState::WaitForDrained(uint64_t target, std::chrono::milliseconds timeout) {
	timespec deadline = DeadlineAfter(timeout);
	pthread_mutex_lock(&block_->drain_mutex);
	while (block_->producers_drained < target) {
		int rc = pthread_cond_timedwait(&block_->drain_cond, &block_->drain_mutex, &deadline);
		if (rc == ETIMEDOUT) break;
	}
	uint64_t drained = block_->producers_drained;
	pthread_mutex_unlock(&block_->drain_mutex);
	return drained;
}

} // namespace Rxcache
