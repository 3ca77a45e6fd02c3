#ifndef REMOTECHUNK_CONFIGURATION_H_
#define REMOTECHUNK_CONFIGURATION_H_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace RemoteChunk {

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

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

/**
 * Main configuration structure
 */
struct RemoteChunkConfig {
    // Producer-side coordination
    struct Coordinator {
        // Maximum chunks in flight before Flush() blocks.
        ConfigValue<int> throttle_limit{6, "REMOTECHUNK_THROTTLE_LIMIT"};
        // Bounded terminal wait: drain_max_attempts x poll_interval_ms.
        ConfigValue<int> drain_max_attempts{40, "REMOTECHUNK_DRAIN_MAX_ATTEMPTS"};
        ConfigValue<int> poll_interval_ms{100, "REMOTECHUNK_POLL_INTERVAL_MS"};
        // Short look for an immediate reply at the end of every flush.
        ConfigValue<int> flush_poll_timeout_ms{1, "REMOTECHUNK_FLUSH_POLL_TIMEOUT_MS"};
    } coordinator;

    // In-process channel (folly::MPMCQueue) sizing
    struct Channel {
        ConfigValue<size_t> request_capacity{1024, "REMOTECHUNK_REQUEST_CAPACITY"};
        ConfigValue<size_t> reply_capacity{1024, "REMOTECHUNK_REPLY_CAPACITY"};
        ConfigValue<int> send_timeout_ms{5000, "REMOTECHUNK_SEND_TIMEOUT_MS"};
    } channel;

    // Loopback worker pool used by remote_chunk_demo
    struct Demo {
        ConfigValue<int> workers{2, "REMOTECHUNK_DEMO_WORKERS"};
        ConfigValue<int> worker_delay_ms{5, "REMOTECHUNK_DEMO_WORKER_DELAY_MS"};
    } demo;
};

/**
 * Snapshot of the coordinator settings. The coordinator takes this by value
 * so it never reads the Configuration singleton on the hot path.
 */
struct CoordinatorOptions {
    int64_t throttle_limit = 6;
    int drain_max_attempts = 40;
    std::chrono::milliseconds poll_interval{100};
    std::chrono::milliseconds flush_poll_timeout{1};

    static CoordinatorOptions FromConfig(const RemoteChunkConfig& config);
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

    // Override with command line arguments
    void overrideFromCommandLine(int argc, char* argv[]);

    // Get the configuration
    const RemoteChunkConfig& config() const { return config_; }
    RemoteChunkConfig& config() { return config_; }

    // Helper methods for common access patterns
    int getThrottleLimit() const { return config_.coordinator.throttle_limit.get(); }
    int getDrainMaxAttempts() const { return config_.coordinator.drain_max_attempts.get(); }
    CoordinatorOptions getCoordinatorOptions() const { return CoordinatorOptions::FromConfig(config_); }

    // Restore compiled defaults (tests reuse the singleton)
    void reset() { config_ = RemoteChunkConfig{}; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    RemoteChunkConfig config_;
    mutable std::vector<std::string> validation_errors_;

    // Shared by loadFromFile and loadFromString; node is a YAML::Node
    void parseYAMLNode(const void* node);
    bool validateConfig();
};

} // namespace RemoteChunk

#endif // REMOTECHUNK_CONFIGURATION_H_
