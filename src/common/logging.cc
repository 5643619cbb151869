#include "logging.h"

#include <ctime>

#include <glog/logging.h>

namespace Rxcache {

namespace {

std::string FormatLocalTime(const char* format) {
	std::time_t now = std::time(nullptr);
	std::tm local_tm;
	localtime_r(&now, &local_tm);
	char buf[32];
	size_t n = std::strftime(buf, sizeof(buf), format, &local_tm);
	return std::string(buf, n);
}

} // namespace

void ConfigureProcessLogging(const std::string& log_dir, const std::string& process_name) {
	if (log_dir.empty()) {
		FLAGS_logtostderr = 1;
		return;
	}
	std::string prefix = log_dir;
	if (prefix.back() != '/') {
		prefix += '/';
	}
	prefix += process_name;

	FLAGS_logtostderr = 0;
	FLAGS_alsologtostderr = 0;
	// Everything at INFO and above goes to the one per-process file
	google::SetLogDestination(google::GLOG_INFO, (prefix + ".log.").c_str());
	google::SetLogDestination(google::GLOG_WARNING, "");
	google::SetLogDestination(google::GLOG_ERROR, "");
	google::SetLogDestination(google::GLOG_FATAL, "");
	google::SetLogSymlink(google::GLOG_INFO, "");
	VLOG(1) << "Logging for " << process_name << " redirected to " << prefix;
}

std::string TimestampString() {
	return FormatLocalTime("%Y-%m-%d %H:%M:%S");
}

std::string TodayDateStamp() {
	return FormatLocalTime("%Y%m%d");
}

} // namespace Rxcache
