#ifndef RXCACHE_CACHE_QUERY_SERVICE_H_
#define RXCACHE_CACHE_QUERY_SERVICE_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cache_store/cache_store.h"
#include "remote_client.h"
#include "rxnav_api.h"

namespace Rxcache {

/**
 * Read-only view over a finished cache for downstream builders. Backed by a
 * strict RemoteClient with no transport: every key not in the cache raises
 * NotCached, nothing ever goes to the network.
 */
class CacheQueryService {
	public:
		// Opens read-only and loads the index. Throws StoreUnavailable, CacheFormatError
		static std::unique_ptr<CacheQueryService> Open(const std::string& cache_path,
				const std::string& base_url);

		std::string Lookup(const std::string& request_key) { return client_.FetchText(request_key); }

		std::optional<std::vector<HistoryValue>> HistoricalAttributes(int64_t code,
				const std::vector<HistoryField>& fields) {
			return api_.HistoricalAttributes(code, fields);
		}
		Json::Value AllRelated(int64_t code) { return api_.AllRelated(code); }
		absl::btree_set<std::string> NdcCodesFor(int64_t code) { return api_.NdcCodesFor(code); }
		Json::Value ClassTree(const std::string& root_class_id) { return api_.ClassTree(root_class_id); }
		std::vector<int64_t> GenericDrugsForVaClass(const std::string& class_id) {
			return api_.GenericDrugsForVaClass(class_id);
		}

		RxNavApi& api() { return api_; }
		const CacheStore& store() const { return *store_; }
		const RequestCounters& counters() const { return client_.counters(); }

	private:
		CacheQueryService(std::unique_ptr<CacheStore> store, const std::string& base_url);

		std::unique_ptr<CacheStore> store_;
		RemoteClient client_;
		RxNavApi api_;
};

} // namespace Rxcache

#endif // RXCACHE_CACHE_QUERY_SERVICE_H_
