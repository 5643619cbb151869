#include <cstdint>
#include <numeric>

#include <gtest/gtest.h>

#include "../src/orchestrator/partition.h"

using namespace Rxcache;

namespace {

std::vector<int64_t> Iota(size_t n) {
    std::vector<int64_t> v(n);
    std::iota(v.begin(), v.end(), 100);
    return v;
}

std::vector<size_t> Sizes(const std::vector<std::vector<int64_t>>& segments) {
    std::vector<size_t> sizes;
    for (const auto& s : segments) sizes.push_back(s.size());
    return sizes;
}

}  // namespace

TEST(PartitionTest, TenItemsFourWorkers) {
    auto segments = PartitionSegments(Iota(10), 4);
    EXPECT_EQ(Sizes(segments), (std::vector<size_t>{3, 3, 3, 1}));
}

TEST(PartitionTest, ConcatenationRestoresInput) {
    for (size_t n : {0u, 1u, 7u, 100u, 101u}) {
        for (size_t w : {1u, 2u, 3u, 8u}) {
            auto items = Iota(n);
            auto segments = PartitionSegments(items, w);
            ASSERT_EQ(segments.size(), w);
            std::vector<int64_t> joined;
            for (const auto& s : segments) joined.insert(joined.end(), s.begin(), s.end());
            EXPECT_EQ(joined, items) << "n=" << n << " w=" << w;
        }
    }
}

TEST(PartitionTest, MoreWorkersThanItemsLeavesEmptySegments) {
    auto segments = PartitionSegments(Iota(2), 4);
    EXPECT_EQ(Sizes(segments), (std::vector<size_t>{1, 1, 0, 0}));
}

TEST(PartitionTest, CeilSizedSegmentsLeaveShortfallToTrailingWorkers) {
    // ceil(9/4) = 3 leaves the last worker nothing
    EXPECT_EQ(Sizes(PartitionSegments(Iota(9), 4)), (std::vector<size_t>{3, 3, 3, 0}));
    // ceil(5/4) = 2: two trailing workers come up short, one of them empty
    EXPECT_EQ(Sizes(PartitionSegments(Iota(5), 4)), (std::vector<size_t>{2, 2, 1, 0}));
    EXPECT_EQ(Sizes(PartitionSegments(Iota(10), 4)), (std::vector<size_t>{3, 3, 3, 1}));
}

TEST(PartitionTest, ZeroWorkersRejected) {
    EXPECT_THROW(PartitionSegments(Iota(3), 0), std::invalid_argument);
}
