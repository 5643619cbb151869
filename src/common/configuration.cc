#include "configuration.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sys/un.h>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Rxcache {

// Global function to get configuration instance
const Configuration& GetConfig() {
    return Configuration::getInstance();
}

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoull(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["rxcache"]) {
        LOG(WARNING) << "Configuration has no 'rxcache' root, keeping defaults";
        return;
    }
    auto root = yaml["rxcache"];

    // Cache
    if (root["cache"]) {
        auto cache = root["cache"];
        if (cache["path"]) config_.cache.path.set(cache["path"].as<std::string>());
        if (cache["load_progress_interval"]) config_.cache.load_progress_interval.set(cache["load_progress_interval"].as<size_t>());
    }

    // Channel
    if (root["channel"]) {
        auto channel = root["channel"];
        if (channel["socket_path"]) config_.channel.socket_path.set(channel["socket_path"].as<std::string>());
    }

    // Remote
    if (root["remote"]) {
        auto remote = root["remote"];
        if (remote["base_url"]) config_.remote.base_url.set(remote["base_url"].as<std::string>());
        if (remote["retry_limit"]) config_.remote.retry_limit.set(remote["retry_limit"].as<int>());
        if (remote["retry_delay_ms"]) config_.remote.retry_delay_ms.set(remote["retry_delay_ms"].as<int>());
        if (remote["stats_interval"]) config_.remote.stats_interval.set(remote["stats_interval"].as<size_t>());
        if (remote["connect_timeout_s"]) config_.remote.connect_timeout_s.set(remote["connect_timeout_s"].as<int>());
        if (remote["request_timeout_s"]) config_.remote.request_timeout_s.set(remote["request_timeout_s"].as<int>());
    }

    // Build
    if (root["build"]) {
        auto build = root["build"];
        if (build["workers"]) config_.build.workers.set(build["workers"].as<int>());
        if (build["log_dir"]) config_.build.log_dir.set(build["log_dir"].as<std::string>());
        if (build["fail_if_not_cached"]) config_.build.fail_if_not_cached.set(build["fail_if_not_cached"].as<bool>());
        if (build["progress_interval"]) config_.build.progress_interval.set(build["progress_interval"].as<size_t>());
        if (build["va_root_class"]) config_.build.va_root_class.set(build["va_root_class"].as<std::string>());
        if (build["drain_poll_ms"]) config_.build.drain_poll_ms.set(build["drain_poll_ms"].as<int>());
    }

    // Writer
    if (root["writer"]) {
        auto writer = root["writer"];
        if (writer["progress_interval"]) config_.writer.progress_interval.set(writer["progress_interval"].as<size_t>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.cache.path.get().empty()) {
        validation_errors_.push_back("Cache path must not be empty");
    }
    if (config_.cache.load_progress_interval.get() < 1) {
        validation_errors_.push_back("Cache load progress interval must be at least 1");
    }

    // sockaddr_un::sun_path includes the terminating NUL
    const std::string socket_path = config_.channel.socket_path.get();
    if (socket_path.size() >= sizeof(sockaddr_un::sun_path)) {
        validation_errors_.push_back("Channel socket path must be shorter than " +
                                     std::to_string(sizeof(sockaddr_un::sun_path)) + " bytes");
    }

    if (config_.remote.base_url.get().empty()) {
        validation_errors_.push_back("Remote base URL must not be empty");
    }
    if (config_.remote.retry_limit.get() < 1) {
        validation_errors_.push_back("Remote retry limit must be at least 1");
    }
    if (config_.remote.retry_delay_ms.get() < 0) {
        validation_errors_.push_back("Remote retry delay cannot be negative");
    }
    if (config_.remote.stats_interval.get() < 1) {
        validation_errors_.push_back("Remote stats interval must be at least 1");
    }

    if (config_.build.workers.get() < 1) {
        validation_errors_.push_back("Worker count must be at least 1");
    }
    if (config_.build.progress_interval.get() < 1) {
        validation_errors_.push_back("Worker progress interval must be at least 1");
    }
    if (config_.build.drain_poll_ms.get() < 1) {
        validation_errors_.push_back("Drain poll interval must be at least 1ms");
    }
    if (config_.writer.progress_interval.get() < 1) {
        validation_errors_.push_back("Writer progress interval must be at least 1");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Rxcache
