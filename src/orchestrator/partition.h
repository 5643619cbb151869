#ifndef RXCACHE_PARTITION_H_
#define RXCACHE_PARTITION_H_

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace Rxcache {

/**
 * Splits items into worker_count contiguous segments of ceil(n / workers)
 * items; the tail segments may be short or empty. Concatenating the result
 * gives back items in order.
 */
template <typename T>
std::vector<std::vector<T>> PartitionSegments(const std::vector<T>& items, size_t worker_count) {
	if (worker_count == 0) {
		throw std::invalid_argument("PartitionSegments: worker count must be at least 1");
	}
	const size_t segment_size = (items.size() + worker_count - 1) / worker_count;
	std::vector<std::vector<T>> segments(worker_count);
	for (size_t i = 0; i < worker_count; ++i) {
		size_t begin = i * segment_size;
		if (begin >= items.size()) break;
		size_t end = std::min(begin + segment_size, items.size());
		segments[i].assign(items.begin() + begin, items.begin() + end);
	}
	return segments;
}

} // namespace Rxcache

#endif // RXCACHE_PARTITION_H_
