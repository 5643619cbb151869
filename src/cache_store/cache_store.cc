#include "cache_store.h"

#include <fcntl.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>

#include <stdexcept>
#include <vector>

#include <glog/logging.h>

#include "common/errors.h"

namespace Rxcache {

namespace {

constexpr size_t kScanChunkSize = 1UL << 20;
constexpr size_t kLookupChunkSize = 64UL * 1024;
constexpr size_t kDateLength = 8;

std::string ErrnoMessage(const std::string& what, const std::string& path) {
	return what + " [" + path + "]: " + strerror(errno);
}

void StripCarriageReturn(std::string& line) {
	if (!line.empty() && line.back() == '\r') {
		line.pop_back();
	}
}

bool HasLineBreak(const std::string& s) {
	return s.find_first_of("\r\n") != std::string::npos;
}

} // namespace

std::unique_ptr<CacheStore> CacheStore::Open(const std::string& path, StoreMode mode) {
	int flags = (mode == StoreMode::kAppend) ? (O_RDWR | O_CREAT) : O_RDONLY;
	int fd = ::open(path.c_str(), flags | O_CLOEXEC, 0644);
	if (fd < 0) {
		throw StoreUnavailable(ErrnoMessage("Cannot open cache file", path));
	}
	VLOG(2) << "[CacheStore] opened " << path
		<< (mode == StoreMode::kAppend ? " for append" : " read-only");
	return std::unique_ptr<CacheStore>(new CacheStore(path, mode, ScopedFd(fd)));
}

CacheStore::CacheStore(std::string path, StoreMode mode, ScopedFd fd)
	: path_(std::move(path)), mode_(mode), fd_(std::move(fd)) {}

size_t CacheStore::LoadIndex() {
	LOG(INFO) << "Reading existing cache " << path_;
	if (::lseek(fd_.get(), 0, SEEK_SET) < 0) {
		throw StoreUnavailable(ErrnoMessage("Cannot rewind cache file", path_));
	}
	index_.clear();
	needs_line_terminator_ = false;

	std::vector<char> buf(kScanChunkSize);
	off_t pos = 0;            // offset of the next unread byte
	off_t record_start = 0;
	int line_in_group = 0;    // 0 key, 1 date, 2 payload
	size_t line_number = 0;
	size_t records = 0;
	bool line_has_bytes = false;
	std::string current;      // only key and date lines are accumulated
	std::string key;

	auto finish_line = [&]() {
		++line_number;
		StripCarriageReturn(current);
		if (line_in_group == 0) {
			key = std::move(current);
		} else if (line_in_group == 1) {
			if (current.size() != kDateLength) {
				throw CacheFormatError("Cache file format error, date not YYYYMMDD, line " +
						std::to_string(line_number) + " of " + path_);
			}
			index_[key] = CacheEntryLocation{record_start, current};
		} else {
			++records;
			record_start = pos;
			if (records % load_progress_interval_ == 0) {
				LOG(INFO) << "..Read " << records << " entries from cache";
			}
		}
		current.clear();
		line_has_bytes = false;
		line_in_group = (line_in_group + 1) % 3;
	};

	while (true) {
		ssize_t n = ::read(fd_.get(), buf.data(), buf.size());
		if (n < 0) {
			if (errno == EINTR) continue;
			throw StoreUnavailable(ErrnoMessage("Read failed while loading cache", path_));
		}
		if (n == 0) break;

		const char* p = buf.data();
		const char* end = buf.data() + n;
		while (p < end) {
			const char* nl = static_cast<const char*>(memchr(p, '\n', end - p));
			const char* seg_end = nl ? nl : end;
			if (line_in_group < 2) {
				current.append(p, seg_end - p);
			}
			if (seg_end > p) line_has_bytes = true;
			pos += seg_end - p;
			if (!nl) break;
			pos += 1;
			finish_line();
			p = nl + 1;
		}
	}

	// A final line without '\n' still counts as a line
	if (line_has_bytes) {
		finish_line();
		needs_line_terminator_ = true;
	}
	if (line_in_group != 0) {
		throw CacheFormatError("Cache file format error, not in groups of 3 lines: " +
				std::to_string(line_in_group) + " trailing line(s) in " + path_);
	}

	at_eof_ = true;
	LOG(INFO) << "[Done reading cache, found " << records << " existing entries, "
		<< index_.size() << " distinct keys]";
	return records;
}

std::optional<std::string> CacheStore::Lookup(const std::string& key) {
	auto it = index_.find(key);
	if (it == index_.end()) {
		return std::nullopt;
	}

	at_eof_ = false;
	if (::lseek(fd_.get(), it->second.offset, SEEK_SET) < 0) {
		throw StoreUnavailable(ErrnoMessage("Seek failed during lookup", path_));
	}

	// Skip the key and date lines, the payload is the third line
	std::vector<char> buf(kLookupChunkSize);
	std::string payload;
	int newlines = 0;
	bool complete = false;
	while (!complete) {
		ssize_t n = ::read(fd_.get(), buf.data(), buf.size());
		if (n < 0) {
			if (errno == EINTR) continue;
			throw StoreUnavailable(ErrnoMessage("Read failed during lookup", path_));
		}
		if (n == 0) break;

		const char* p = buf.data();
		const char* end = buf.data() + n;
		while (p < end && newlines < 2) {
			const char* nl = static_cast<const char*>(memchr(p, '\n', end - p));
			if (!nl) {
				p = end;
				break;
			}
			++newlines;
			p = nl + 1;
		}
		if (newlines < 2) continue;

		const char* nl = static_cast<const char*>(memchr(p, '\n', end - p));
		if (nl) {
			payload.append(p, nl - p);
			complete = true;
		} else {
			payload.append(p, end - p);
		}
	}

	if (newlines < 2) {
		throw CacheFormatError("Cache record for [" + key + "] at offset " +
				std::to_string(it->second.offset) + " is truncated in " + path_);
	}
	StripCarriageReturn(payload);
	return payload;
}

off_t CacheStore::Append(const std::string& key, const std::string& payload, const std::string& date) {
	if (mode_ != StoreMode::kAppend) {
		throw std::logic_error("Append on read-only cache store " + path_);
	}
	if (HasLineBreak(key) || HasLineBreak(payload)) {
		throw std::invalid_argument("Cache record fields must be single lines, key [" + key + "]");
	}
	if (date.size() != kDateLength) {
		throw std::invalid_argument("Cache record date must be YYYYMMDD, got [" + date + "]");
	}

	if (!at_eof_) {
		if (::lseek(fd_.get(), 0, SEEK_END) < 0) {
			throw StoreUnavailable(ErrnoMessage("Seek to end failed", path_));
		}
		at_eof_ = true;
	}
	off_t offset = ::lseek(fd_.get(), 0, SEEK_CUR);
	if (offset < 0) {
		throw StoreUnavailable(ErrnoMessage("Cannot read file position", path_));
	}

	std::string record;
	record.reserve(key.size() + date.size() + payload.size() + 4);
	if (needs_line_terminator_) {
		LOG(WARNING) << "Cache file " << path_ << " ended without a newline, terminating last line";
		record.push_back('\n');
		offset += 1;
	}
	record.append(key).push_back('\n');
	record.append(date).push_back('\n');
	record.append(payload).push_back('\n');

	WriteAll(record);
	needs_line_terminator_ = false;
	index_[key] = CacheEntryLocation{offset, date};
	return offset;
}

void CacheStore::WriteAll(const std::string& data) {
	const char* p = data.data();
	size_t remaining = data.size();
	while (remaining > 0) {
		ssize_t n = ::write(fd_.get(), p, remaining);
		if (n < 0) {
			if (errno == EINTR) continue;
			throw StoreUnavailable(ErrnoMessage("Write failed", path_));
		}
		p += n;
		remaining -= static_cast<size_t>(n);
	}
}

void EnsureCacheFileExists(const std::string& path) {
	CacheStore::Open(path, StoreMode::kAppend);
}

} // End of namespace Rxcache
