#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <getopt.h>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace RemoteChunk {

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
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

CoordinatorOptions CoordinatorOptions::FromConfig(const RemoteChunkConfig& config) {
    CoordinatorOptions options;
    options.throttle_limit = config.coordinator.throttle_limit.get();
    options.drain_max_attempts = config.coordinator.drain_max_attempts.get();
    options.poll_interval = std::chrono::milliseconds(config.coordinator.poll_interval_ms.get());
    options.flush_poll_timeout = std::chrono::milliseconds(config.coordinator.flush_poll_timeout_ms.get());
    return options;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::parseYAMLNode(const void* node) {
    const YAML::Node& yaml = *static_cast<const YAML::Node*>(node);
    if (!yaml["remote_chunk"]) {
        LOG(WARNING) << "Configuration has no top-level 'remote_chunk' key; keeping defaults";
        return;
    }
    auto root = yaml["remote_chunk"];

    // Coordinator
    if (root["coordinator"]) {
        auto coordinator = root["coordinator"];
        if (coordinator["throttle_limit"]) config_.coordinator.throttle_limit.set(coordinator["throttle_limit"].as<int>());
        if (coordinator["drain_max_attempts"]) config_.coordinator.drain_max_attempts.set(coordinator["drain_max_attempts"].as<int>());
        if (coordinator["poll_interval_ms"]) config_.coordinator.poll_interval_ms.set(coordinator["poll_interval_ms"].as<int>());
        if (coordinator["flush_poll_timeout_ms"]) config_.coordinator.flush_poll_timeout_ms.set(coordinator["flush_poll_timeout_ms"].as<int>());
    }

    // Channel
    if (root["channel"]) {
        auto channel = root["channel"];
        if (channel["request_capacity"]) config_.channel.request_capacity.set(channel["request_capacity"].as<size_t>());
        if (channel["reply_capacity"]) config_.channel.reply_capacity.set(channel["reply_capacity"].as<size_t>());
        if (channel["send_timeout_ms"]) config_.channel.send_timeout_ms.set(channel["send_timeout_ms"].as<int>());
    }

    // Demo
    if (root["demo"]) {
        auto demo = root["demo"];
        if (demo["workers"]) config_.demo.workers.set(demo["workers"].as<int>());
        if (demo["worker_delay_ms"]) config_.demo.worker_delay_ms.set(demo["worker_delay_ms"].as<int>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        parseYAMLNode(&yaml);
        return validateConfig();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        parseYAMLNode(&yaml);
        return validateConfig();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::overrideFromCommandLine(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"throttle_limit", required_argument, 0, 't'},
        {"drain_max_attempts", required_argument, 0, 'd'},
        {"poll_interval_ms", required_argument, 0, 'p'},
        {"workers", required_argument, 0, 'w'},
        // Accept flags owned by the demo parser so getopt_long doesn't error
        {"config", required_argument, 0, 0},
        {"job_id", required_argument, 0, 0},
        {"items", required_argument, 0, 0},
        {"commit_interval", required_argument, 0, 0},
        {"fail_after", required_argument, 0, 0},
        {"restart_after", required_argument, 0, 0},
        {"log_level", required_argument, 0, 0},
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;
    // Suppress getopt_long default error messages for unknown options
    opterr = 0;
    // Reset getopt state in case other parsers were used earlier
    optind = 1;

    while ((c = getopt_long(argc, argv, "t:d:p:w:", long_options, &option_index)) != -1) {
        try {
            switch (c) {
                case 't':
                    config_.coordinator.throttle_limit.set(std::stoi(optarg));
                    break;
                case 'd':
                    config_.coordinator.drain_max_attempts.set(std::stoi(optarg));
                    break;
                case 'p':
                    config_.coordinator.poll_interval_ms.set(std::stoi(optarg));
                    break;
                case 'w':
                    config_.demo.workers.set(std::stoi(optarg));
                    break;
                case 0:
                    // Known app flags we intentionally ignore here (handled elsewhere)
                    break;
                default:
                    // Ignore unknown flags; the app parser reports them
                    break;
            }
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse command line value '" << (optarg ? optarg : "")
                         << "': " << e.what();
        }
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.coordinator.throttle_limit.get() < 1) {
        validation_errors_.push_back("Throttle limit must be at least 1");
    }

    if (config_.coordinator.drain_max_attempts.get() < 1) {
        validation_errors_.push_back("Drain max attempts must be at least 1");
    }

    if (config_.coordinator.poll_interval_ms.get() < 1) {
        validation_errors_.push_back("Poll interval must be at least 1ms");
    }

    if (config_.coordinator.flush_poll_timeout_ms.get() < 0) {
        validation_errors_.push_back("Flush poll timeout cannot be negative");
    }

    // A channel smaller than the throttle window would reject sends before the
    // throttle ever engages.
    if (config_.channel.request_capacity.get() <
            static_cast<size_t>(std::max(1, config_.coordinator.throttle_limit.get()))) {
        validation_errors_.push_back("Request channel capacity must be at least the throttle limit");
    }

    if (config_.channel.reply_capacity.get() < 1) {
        validation_errors_.push_back("Reply channel capacity must be at least 1");
    }

    if (config_.demo.workers.get() < 1) {
        validation_errors_.push_back("Demo workers must be at least 1");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

bool Configuration::validateConfig() {
    bool ok = validate();
    for (const auto& error : validation_errors_) {
        LOG(ERROR) << "Invalid configuration: " << error;
    }
    return ok;
}

} // namespace RemoteChunk
