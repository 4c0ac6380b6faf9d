#ifndef REQFLOW_CONFIGURATION_H_
#define REQFLOW_CONFIGURATION_H_

#include <string>
#include <memory>
#include <optional>
#include <vector>
#include <cstdint>

#include "workflow_config.h"

namespace Reqflow {

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
struct ReqflowConfig {
    // Daemon surface
    struct Server {
        ConfigValue<std::string> address{"0.0.0.0", "REQFLOW_SERVER_ADDRESS"};
        ConfigValue<int> port{50061, "REQFLOW_SERVER_PORT"};
    } server;

    // Defaults applied to runs submitted without explicit options
    struct Workflow {
        ConfigValue<double> pass_threshold{0.7, "REQFLOW_PASS_THRESHOLD"};
        ConfigValue<int> per_item_timeout_ms{120000, "REQFLOW_ITEM_TIMEOUT_MS"};
        ConfigValue<int> max_attempts{3, "REQFLOW_MAX_ATTEMPTS"};
        ConfigValue<int> retry_backoff_ms{250, "REQFLOW_RETRY_BACKOFF_MS"};
        ConfigValue<int> clarification_timeout_ms{300000, "REQFLOW_CLARIFICATION_TIMEOUT_MS"};
        ConfigValue<int> max_rewrite_rounds{1, "REQFLOW_MAX_REWRITE_ROUNDS"};
        ConfigValue<double> duplicate_threshold{0.9, "REQFLOW_DUPLICATE_THRESHOLD"};
        ConfigValue<int> search_top_k{5, "REQFLOW_SEARCH_TOP_K"};

        // Validation and rewrite are bound by the language model and get the
        // smallest ceilings.
        struct MaxConcurrent {
            ConfigValue<int> mining{8, "REQFLOW_MINING_MAX_CONCURRENT"};
            ConfigValue<int> kg_build{4, "REQFLOW_KG_MAX_CONCURRENT"};
            ConfigValue<int> validating{5, "REQFLOW_VALIDATION_MAX_CONCURRENT"};
            ConfigValue<int> rewriting{3, "REQFLOW_REWRITE_MAX_CONCURRENT"};
            ConfigValue<int> qa_review{5, "REQFLOW_QA_MAX_CONCURRENT"};
            ConfigValue<int> clarification{10, "REQFLOW_CLARIFICATION_MAX_CONCURRENT"};
        } max_concurrent;
    } workflow;

    // Event stream and session lifecycle
    struct Events {
        ConfigValue<int> replay_buffer{256, "REQFLOW_EVENT_REPLAY_BUFFER"};
        ConfigValue<int> channel_grace_ms{30000, "REQFLOW_CHANNEL_GRACE_MS"};
        ConfigValue<int> reap_interval_ms{1000, "REQFLOW_REAP_INTERVAL_MS"};
    } events;

    // Emulated capability used when no language model is attached
    struct Synthetic {
        ConfigValue<int> latency_ms{50, "REQFLOW_SYNTHETIC_LATENCY_MS"};
        ConfigValue<double> transient_failure_rate{0.0, "REQFLOW_SYNTHETIC_FAILURE_RATE"};
        ConfigValue<int> seed{42, "REQFLOW_SYNTHETIC_SEED"};
    } synthetic;
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
    const ReqflowConfig& config() const { return config_; }
    ReqflowConfig& config() { return config_; }

    // Helper methods for common access patterns
    int getServerPort() const { return config_.server.port.get(); }
    std::string getServerAddress() const {
        return config_.server.address.get() + ":" + std::to_string(config_.server.port.get());
    }
    size_t getReplayBufferSize() const {
        return static_cast<size_t>(config_.events.replay_buffer.get());
    }

    // Per-run defaults assembled from the workflow section
    WorkflowConfig DefaultWorkflowConfig() const;

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

    // Restores built-in defaults; used by tests
    void reset() { config_ = ReqflowConfig(); validation_errors_.clear(); }

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    ReqflowConfig config_;
    mutable std::vector<std::string> validation_errors_;

    // Applies a parsed document (YAML::Node) to config_
    void parseYAMLNode(const void* node);
    bool validateConfig();
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

} // namespace Reqflow

#endif // REQFLOW_CONFIGURATION_H_
