#ifndef RXCACHE_PROCESS_H_
#define RXCACHE_PROCESS_H_

#include <sys/types.h>

#include <functional>
#include <optional>
#include <string>

namespace Rxcache {

struct ChildProcess {
	std::string name;
	pid_t pid = -1;
};

struct ExitReport {
	int exit_code = 0;   // valid when signal == 0
	int signal = 0;

	bool ok() const { return signal == 0 && exit_code == 0; }
	std::string Describe() const;
};

/**
 * fork()s and runs body in the child. The child never returns: it exits
 * with body's result, or 1 if body threw, after flushing its logs.
 * Throws std::runtime_error if fork fails.
 */
ChildProcess SpawnProcess(const std::string& name, const std::function<int()>& body);

// Blocking waitpid
ExitReport JoinProcess(const ChildProcess& child);

// nullopt while the child is still running
std::optional<ExitReport> PollProcess(const ChildProcess& child);

} // namespace Rxcache

#endif // RXCACHE_PROCESS_H_
