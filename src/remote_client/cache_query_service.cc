#include "cache_query_service.h"

#include <glog/logging.h>

namespace Rxcache {

namespace {

RemoteClientOptions StrictOptions() {
	RemoteClientOptions options;
	options.fail_if_not_cached = true;
	return options;
}

} // namespace

std::unique_ptr<CacheQueryService> CacheQueryService::Open(const std::string& cache_path,
		const std::string& base_url) {
	auto store = CacheStore::Open(cache_path, StoreMode::kReadOnly);
	store->LoadIndex();
	return std::unique_ptr<CacheQueryService>(new CacheQueryService(std::move(store), base_url));
}

CacheQueryService::CacheQueryService(std::unique_ptr<CacheStore> store, const std::string& base_url)
	: store_(std::move(store)),
	client_(store_.get(), nullptr, nullptr, StrictOptions()),
	api_(&client_, base_url) {
	VLOG(1) << "CacheQueryService over " << store_->path() << " (" << store_->index().size() << " keys)";
}

} // namespace Rxcache
