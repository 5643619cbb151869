#include "process.h"

#include <sys/wait.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>

#include <stdexcept>

#include <glog/logging.h>

namespace Rxcache {

namespace {

ExitReport FromWaitStatus(int status) {
	ExitReport report;
	if (WIFEXITED(status)) {
		report.exit_code = WEXITSTATUS(status);
	} else if (WIFSIGNALED(status)) {
		report.signal = WTERMSIG(status);
	}
	return report;
}

} // namespace

std::string ExitReport::Describe() const {
	if (signal != 0) {
		return std::string("killed by signal ") + std::to_string(signal) + " (" + strsignal(signal) + ")";
	}
	return "exit status " + std::to_string(exit_code);
}

ChildProcess SpawnProcess(const std::string& name, const std::function<int()>& body) {
	google::FlushLogFiles(google::GLOG_INFO);
	pid_t pid = fork();
	if (pid < 0) {
		throw std::runtime_error("fork failed for " + name + ": " + strerror(errno));
	}
	if (pid == 0) {
		int rc = 1;
		try {
			rc = body();
		} catch (const std::exception& e) {
			LOG(ERROR) << "[" << name << "] terminated: " << e.what();
			rc = 1;
		} catch (...) {
			// Never unwind into the parent's stack frames
			LOG(ERROR) << "[" << name << "] terminated by a non-standard exception";
			rc = 1;
		}
		google::FlushLogFiles(google::GLOG_INFO);
		_exit(rc);
	}
	VLOG(1) << "Started " << name << " (pid " << pid << ")";
	return ChildProcess{name, pid};
}

ExitReport JoinProcess(const ChildProcess& child) {
	int status = 0;
	pid_t rc;
	do {
		rc = waitpid(child.pid, &status, 0);
	} while (rc < 0 && errno == EINTR);
	if (rc < 0) {
		throw std::runtime_error("waitpid failed for " + child.name + ": " + strerror(errno));
	}
	return FromWaitStatus(status);
}

std::optional<ExitReport> PollProcess(const ChildProcess& child) {
	int status = 0;
	pid_t rc;
	do {
		rc = waitpid(child.pid, &status, WNOHANG);
	} while (rc < 0 && errno == EINTR);
	if (rc < 0) {
		throw std::runtime_error("waitpid failed for " + child.name + ": " + strerror(errno));
	}
	if (rc == 0) {
		return std::nullopt;
	}
	return FromWaitStatus(status);
}

} // namespace Rxcache
