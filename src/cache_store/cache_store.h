#ifndef RXCACHE_CACHE_STORE_H_
#define RXCACHE_CACHE_STORE_H_

#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>

#include "absl/container/flat_hash_map.h"

#include "common/scoped_fd.h"

namespace Rxcache {

enum class StoreMode {
	kReadOnly,
	kAppend,
};

// Where a record lives in the log. The payload itself is never held in memory.
struct CacheEntryLocation {
	off_t offset;                // first byte of the key line
	std::string retrieval_date;  // YYYYMMDD
};

using CacheIndex = absl::flat_hash_map<std::string, CacheEntryLocation>;

/**
 * Append-only record log:
 *
 *   <request key>\n
 *   <YYYYMMDD>\n
 *   <payload text>\n
 *
 * Exactly one process may hold a kAppend store for a path; every other holder
 * opens kReadOnly and only ever sees the snapshot taken by LoadIndex().
 * Nothing is locked; correctness comes from the single writer and from
 * records being self-delimiting.
 */
class CacheStore {
	public:
		// Throws StoreUnavailable. kAppend creates the file when it is missing.
		static std::unique_ptr<CacheStore> Open(const std::string& path, StoreMode mode);

		CacheStore(const CacheStore&) = delete;
		CacheStore& operator=(const CacheStore&) = delete;

		/**
		 * Full forward scan from byte 0 in groups of three lines. Rebuilds the
		 * index (last occurrence of a key wins) and leaves the file cursor at
		 * EOF. Throws CacheFormatError on a trailing partial record or a date
		 * line that is not 8 characters.
		 * @return number of records scanned, duplicates included
		 */
		size_t LoadIndex();

		// Payload of the newest indexed record for key, or nullopt.
		std::optional<std::string> Lookup(const std::string& key);

		bool Contains(const std::string& key) const { return index_.contains(key); }

		/**
		 * Writes one record at end of file and points the index at it.
		 * Only valid on a kAppend store.
		 * @return offset of the record's key line
		 */
		off_t Append(const std::string& key, const std::string& payload, const std::string& date);

		const CacheIndex& index() const { return index_; }
		const std::string& path() const { return path_; }

		void set_load_progress_interval(size_t interval) { load_progress_interval_ = interval; }

	private:
		CacheStore(std::string path, StoreMode mode, ScopedFd fd);

		void WriteAll(const std::string& data);

		std::string path_;
		StoreMode mode_;
		ScopedFd fd_;
		CacheIndex index_;
		// False once a Lookup moved the cursor away from end of file
		bool at_eof_ = false;
		// Log ended in an unterminated line; the next append must close it first
		bool needs_line_terminator_ = false;
		size_t load_progress_interval_ = 10000;
};

// Creates the cache file if absent so read-only opens never race the writer.
void EnsureCacheFileExists(const std::string& path);

} // End of namespace Rxcache
#endif // RXCACHE_CACHE_STORE_H_
