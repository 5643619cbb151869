#include <sys/socket.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../src/cache_store/cache_store.h"
#include "../src/channel/cache_channel.h"
#include "../src/common/errors.h"
#include "../src/orchestrator/worker.h"
#include "../src/remote_client/rxnav_api.h"
#include "test_helpers.h"

using namespace Rxcache;
using Rxcache::testing_util::MockTransport;
using Rxcache::testing_util::ReadFileToString;
using Rxcache::testing_util::TempDir;
using Rxcache::testing_util::UnreachableTransport;
using ::testing::_;
using ::testing::Return;

namespace {

const char kBase[] = "http://rxnav.test/REST";

}  // namespace

class WorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        cache_path_ = dir_.File("rxnav.cache");
        env_.cache_path = cache_path_;
        env_.base_url = kBase;
        env_.client_options.retry_limit = 1;
        env_.client_options.retry_delay = std::chrono::milliseconds(0);
        env_.progress_interval = 1;
    }

    // Cache holding allrelated and history records for every code
    void PrepareCache(const std::vector<int64_t>& codes) {
        RxNavApi keys(nullptr, kBase);
        auto store = CacheStore::Open(cache_path_, StoreMode::kAppend);
        store->LoadIndex();
        for (int64_t code : codes) {
            store->Append(keys.AllRelatedKey(code), "{\"allRelatedGroup\":{}}", "20261019");
            store->Append(keys.HistoryKey(code), "{\"rxcuiHistoryConcept\":{}}", "20261019");
        }
    }

    std::function<void()> CountingBarrier() {
        return [this] { ++barrier_calls_; };
    }

    TempDir dir_;
    std::string cache_path_;
    WorkerEnvironment env_;
    int barrier_calls_ = 0;
};

TEST_F(WorkerTest, StrictRestartIsServedFromCache) {
    PrepareCache({10, 11, 12});
    env_.client_options.fail_if_not_cached = true;
    UnreachableTransport transport;

    WorkerSpec spec{"rxcui_worker_0", {10, 11, 12},
                    {ItemOperation::kAllRelated, ItemOperation::kHistoricalStatus}};
    Worker worker(spec, env_, &transport, nullptr, CountingBarrier());
    worker.Run();

    EXPECT_EQ(worker.state(), WorkerState::kDone);
    EXPECT_EQ(barrier_calls_, 1);
    EXPECT_EQ(worker.counters().remote_calls, 0u);
    EXPECT_EQ(worker.counters().cache_hits, 6u);
    EXPECT_EQ(worker.counters().requests, 6u);
}

TEST_F(WorkerTest, EmptySegmentStillMeetsBarrier) {
    PrepareCache({});
    WorkerSpec spec{"ndc_worker_3", {}, {ItemOperation::kNdcCodes}};
    Worker worker(spec, env_, nullptr, nullptr, CountingBarrier());
    worker.Run();

    EXPECT_EQ(worker.state(), WorkerState::kDone);
    EXPECT_EQ(barrier_calls_, 1);
    EXPECT_EQ(worker.counters().requests, 0u);
}

TEST_F(WorkerTest, MissingCacheFileFailsAfterBarrier) {
    WorkerSpec spec{"rxcui_worker_1", {1}, {ItemOperation::kAllRelated}};
    Worker worker(spec, env_, nullptr, nullptr, CountingBarrier());

    EXPECT_THROW(worker.Run(), StoreUnavailable);
    EXPECT_EQ(barrier_calls_, 1);
    EXPECT_EQ(worker.state(), WorkerState::kAwaitBarrier);
}

TEST_F(WorkerTest, StrictMissIsFatal) {
    PrepareCache({10});
    env_.client_options.fail_if_not_cached = true;
    WorkerSpec spec{"ndc_worker_0", {10}, {ItemOperation::kNdcCodes}};
    Worker worker(spec, env_, nullptr, nullptr, CountingBarrier());

    EXPECT_THROW(worker.Run(), NotCached);
    EXPECT_EQ(worker.state(), WorkerState::kProcessing);
}

TEST_F(WorkerTest, MissesAreFetchedAndForwarded) {
    PrepareCache({20});
    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    ChannelProducer producer{ScopedFd(fds[0])};
    ScopedFd writer_end(fds[1]);

    env_.client_options.forward_to_writer = true;
    RxNavApi keys(nullptr, kBase);
    MockTransport transport;
    EXPECT_CALL(transport, Get(keys.NdcKey(20)))
        .WillOnce(Return(HttpResponse{200, "{\"historicalNdcConcept\":null}"}));
    EXPECT_CALL(transport, Get(keys.NdcKey(21)))
        .WillOnce(Return(HttpResponse{200, "{\"historicalNdcConcept\":{}}"}));

    WorkerSpec spec{"ndc_worker_0", {20, 21}, {ItemOperation::kNdcCodes}};
    Worker worker(spec, env_, &transport, &producer, CountingBarrier());
    worker.Run();
    producer.Close();

    EXPECT_EQ(worker.counters().remote_calls, 2u);
    EXPECT_EQ(worker.counters().forwarded, 2u);

    FrameDecoder decoder;
    char buf[4096];
    ssize_t n;
    while ((n = read(writer_end.get(), buf, sizeof(buf))) > 0) {
        decoder.Append(buf, static_cast<size_t>(n));
    }
    std::vector<std::string> keys_seen;
    while (auto m = decoder.Next()) {
        keys_seen.push_back(std::get<CacheWrite>(*m).key);
    }
    EXPECT_EQ(keys_seen, (std::vector<std::string>{keys.NdcKey(20), keys.NdcKey(21)}));

    // The worker never touches the file itself
    EXPECT_EQ(ReadFileToString(cache_path_).find("allhistoricalndcs"), std::string::npos);
}

TEST(WorkerStateTest, Names) {
    EXPECT_STREQ(WorkerStateName(WorkerState::kInit), "Init");
    EXPECT_STREQ(WorkerStateName(WorkerState::kAwaitBarrier), "AwaitBarrier");
    EXPECT_STREQ(WorkerStateName(WorkerState::kDone), "Done");
}
