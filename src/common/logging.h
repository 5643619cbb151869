#ifndef RXCACHE_SRC_COMMON_LOGGING_H_
#define RXCACHE_SRC_COMMON_LOGGING_H_

#include <string>

namespace Rxcache {

/**
 * Point this process's glog output at <log_dir>/<process_name>.
 * Called right after fork() so every worker, the writer and the
 * orchestrator keep separate logs. An empty log_dir keeps stderr.
 */
void ConfigureProcessLogging(const std::string& log_dir, const std::string& process_name);

// "YYYY-mm-dd HH:MM:SS" local time, used in progress lines
std::string TimestampString();

// "YYYYMMDD" local date stamped on every cache record
std::string TodayDateStamp();

} // namespace Rxcache

#endif // RXCACHE_SRC_COMMON_LOGGING_H_
