#ifndef RXCACHE_CONFIGURATION_H_
#define RXCACHE_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstddef>

namespace YAML {
class Node;
}

namespace Rxcache {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct RxcacheConfig {
    // Backing log file
    struct Cache {
        ConfigValue<std::string> path{"rxcui.cache", "RXCACHE_CACHE_PATH"};
        // Records between "..Read N entries" lines while loading the index
        ConfigValue<size_t> load_progress_interval{10000, "RXCACHE_LOAD_PROGRESS_INTERVAL"};
    } cache;

    // Writer channel (AF_UNIX). Empty path means <tmpdir>/rxcache-writer-<pid>.sock
    struct Channel {
        ConfigValue<std::string> socket_path{"", "RXCACHE_CHANNEL_SOCKET"};
    } channel;

    // RxNav REST service
    struct Remote {
        ConfigValue<std::string> base_url{"https://rxnav.nlm.nih.gov/REST", "RXCACHE_REMOTE_BASE_URL"};
        ConfigValue<int> retry_limit{40, "RXCACHE_REMOTE_RETRY_LIMIT"};
        ConfigValue<int> retry_delay_ms{15000, "RXCACHE_REMOTE_RETRY_DELAY_MS"};
        // Remote calls between throughput summaries
        ConfigValue<size_t> stats_interval{500, "RXCACHE_REMOTE_STATS_INTERVAL"};
        ConfigValue<int> connect_timeout_s{30, "RXCACHE_REMOTE_CONNECT_TIMEOUT"};
        ConfigValue<int> request_timeout_s{300, "RXCACHE_REMOTE_REQUEST_TIMEOUT"};
    } remote;

    // Cache build pipeline
    struct Build {
        ConfigValue<int> workers{4, "RXCACHE_BUILD_WORKERS"};
        // Per-process log files land here. Empty keeps every process on stderr.
        ConfigValue<std::string> log_dir{"", "RXCACHE_BUILD_LOG_DIR"};
        ConfigValue<bool> fail_if_not_cached{false, "RXCACHE_BUILD_FAIL_IF_NOT_CACHED"};
        ConfigValue<size_t> progress_interval{1000, "RXCACHE_BUILD_PROGRESS_INTERVAL"};
        ConfigValue<std::string> va_root_class{"VA000", "RXCACHE_BUILD_VA_ROOT_CLASS"};
        // How often the orchestrator re-checks writer liveness while waiting for a drain
        ConfigValue<int> drain_poll_ms{200, "RXCACHE_BUILD_DRAIN_POLL_MS"};
    } build;

    struct Writer {
        ConfigValue<size_t> progress_interval{1000, "RXCACHE_WRITER_PROGRESS_INTERVAL"};
    } writer;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Drop everything loaded so far (tests reuse the singleton)
    void resetToDefaults() { config_ = RxcacheConfig{}; }

    // Get the configuration
    const RxcacheConfig& config() const { return config_; }
    RxcacheConfig& config() { return config_; }

    // Helper methods for common access patterns
    std::string getCachePath() const { return config_.cache.path.get(); }
    int getWorkerCount() const { return config_.build.workers.get(); }
    int getRetryLimit() const { return config_.remote.retry_limit.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    RxcacheConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
};

// Global accessor used by code that only reads configuration
const Configuration& GetConfig();

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Rxcache

#endif // RXCACHE_CONFIGURATION_H_
