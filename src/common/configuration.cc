#include "configuration.h"
#include <cstdlib>
#include <getopt.h>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Reqflow {

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
std::optional<double> ConfigValue<double>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stod(env_val);
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

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        parseYAMLNode(&yaml);
        LOG(INFO) << "Loaded configuration from " << filename;
        return validateConfig();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file: " << e.what();
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

void Configuration::parseYAMLNode(const void* node) {
    const YAML::Node& yaml = *static_cast<const YAML::Node*>(node);
    if (!yaml["reqflow"]) {
        LOG(WARNING) << "Configuration has no top-level 'reqflow' key; keeping defaults";
        return;
    }
    auto root = yaml["reqflow"];

    // Server
    if (root["server"]) {
        auto server = root["server"];
        if (server["address"]) config_.server.address.set(server["address"].as<std::string>());
        if (server["port"]) config_.server.port.set(server["port"].as<int>());
    }

    // Workflow defaults
    if (root["workflow"]) {
        auto workflow = root["workflow"];
        if (workflow["pass_threshold"]) config_.workflow.pass_threshold.set(workflow["pass_threshold"].as<double>());
        if (workflow["per_item_timeout_ms"]) config_.workflow.per_item_timeout_ms.set(workflow["per_item_timeout_ms"].as<int>());
        if (workflow["max_attempts"]) config_.workflow.max_attempts.set(workflow["max_attempts"].as<int>());
        if (workflow["retry_backoff_ms"]) config_.workflow.retry_backoff_ms.set(workflow["retry_backoff_ms"].as<int>());
        if (workflow["clarification_timeout_ms"]) config_.workflow.clarification_timeout_ms.set(workflow["clarification_timeout_ms"].as<int>());
        if (workflow["max_rewrite_rounds"]) config_.workflow.max_rewrite_rounds.set(workflow["max_rewrite_rounds"].as<int>());
        if (workflow["duplicate_threshold"]) config_.workflow.duplicate_threshold.set(workflow["duplicate_threshold"].as<double>());
        if (workflow["search_top_k"]) config_.workflow.search_top_k.set(workflow["search_top_k"].as<int>());

        if (workflow["max_concurrent"]) {
            auto limits = workflow["max_concurrent"];
            auto& mc = config_.workflow.max_concurrent;
            if (limits["mining"]) mc.mining.set(limits["mining"].as<int>());
            if (limits["kg_build"]) mc.kg_build.set(limits["kg_build"].as<int>());
            if (limits["validating"]) mc.validating.set(limits["validating"].as<int>());
            if (limits["rewriting"]) mc.rewriting.set(limits["rewriting"].as<int>());
            if (limits["qa_review"]) mc.qa_review.set(limits["qa_review"].as<int>());
            if (limits["clarification"]) mc.clarification.set(limits["clarification"].as<int>());
        }
    }

    // Events
    if (root["events"]) {
        auto events = root["events"];
        if (events["replay_buffer"]) config_.events.replay_buffer.set(events["replay_buffer"].as<int>());
        if (events["channel_grace_ms"]) config_.events.channel_grace_ms.set(events["channel_grace_ms"].as<int>());
        if (events["reap_interval_ms"]) config_.events.reap_interval_ms.set(events["reap_interval_ms"].as<int>());
    }

    // Synthetic capability
    if (root["synthetic"]) {
        auto synthetic = root["synthetic"];
        if (synthetic["latency_ms"]) config_.synthetic.latency_ms.set(synthetic["latency_ms"].as<int>());
        if (synthetic["transient_failure_rate"]) config_.synthetic.transient_failure_rate.set(synthetic["transient_failure_rate"].as<double>());
        if (synthetic["seed"]) config_.synthetic.seed.set(synthetic["seed"].as<int>());
    }
}

void Configuration::overrideFromCommandLine(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"port", required_argument, 0, 'p'},
        {"pass-threshold", required_argument, 0, 't'},
        {"item-timeout-ms", required_argument, 0, 'i'},
        {"max-attempts", required_argument, 0, 'a'},
        {"synthetic-latency-ms", required_argument, 0, 's'},
        // Handled by the binary's own parser
        {"config", required_argument, 0, 0},
        {"log_level", required_argument, 0, 0},
        {"help", no_argument, 0, 0},
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;
    // Suppress getopt_long default error messages for unknown options
    opterr = 0;
    // Reset getopt state in case other parsers were used earlier
    optind = 1;

    while ((c = getopt_long(argc, argv, "p:t:i:a:s:", long_options, &option_index)) != -1) {
        try {
            switch (c) {
                case 'p':
                    config_.server.port.set(std::stoi(optarg));
                    break;
                case 't':
                    config_.workflow.pass_threshold.set(std::stod(optarg));
                    break;
                case 'i':
                    config_.workflow.per_item_timeout_ms.set(std::stoi(optarg));
                    break;
                case 'a':
                    config_.workflow.max_attempts.set(std::stoi(optarg));
                    break;
                case 's':
                    config_.synthetic.latency_ms.set(std::stoi(optarg));
                    break;
                default:
                    break;
            }
        } catch (const std::exception& e) {
            LOG(WARNING) << "Ignoring malformed value '" << optarg << "' for option -"
                         << static_cast<char>(c) << ": " << e.what();
        }
    }
    optind = 1;
}

WorkflowConfig Configuration::DefaultWorkflowConfig() const {
    const auto& wf = config_.workflow;
    WorkflowConfig cfg;
    cfg.max_concurrent_per_phase = {
        {Phase::Mining, wf.max_concurrent.mining.get()},
        {Phase::KGBuild, wf.max_concurrent.kg_build.get()},
        {Phase::Validating, wf.max_concurrent.validating.get()},
        {Phase::Rewriting, wf.max_concurrent.rewriting.get()},
        {Phase::QAReview, wf.max_concurrent.qa_review.get()},
        {Phase::Clarification, wf.max_concurrent.clarification.get()},
    };
    cfg.per_item_timeout = std::chrono::milliseconds(wf.per_item_timeout_ms.get());
    cfg.max_attempts = wf.max_attempts.get();
    cfg.retry_backoff = std::chrono::milliseconds(wf.retry_backoff_ms.get());
    cfg.clarification_timeout = std::chrono::milliseconds(wf.clarification_timeout_ms.get());
    cfg.pass_threshold = wf.pass_threshold.get();
    cfg.max_rewrite_rounds = wf.max_rewrite_rounds.get();
    cfg.duplicate_threshold = wf.duplicate_threshold.get();
    cfg.search_top_k = wf.search_top_k.get();
    return cfg;
}

bool Configuration::validate() const {
    validation_errors_.clear();

    // Validate port ranges
    if (config_.server.port.get() < 1024 || config_.server.port.get() > 65535) {
        validation_errors_.push_back("Server port must be between 1024 and 65535");
    }

    // Workflow defaults share the per-run checks
    for (const auto& error : DefaultWorkflowConfig().Validate()) {
        validation_errors_.push_back("workflow: " + error);
    }

    // Event stream
    if (config_.events.replay_buffer.get() < 1) {
        validation_errors_.push_back("Replay buffer must hold at least 1 event");
    }
    if (config_.events.channel_grace_ms.get() < 0) {
        validation_errors_.push_back("Channel grace period cannot be negative");
    }
    if (config_.events.reap_interval_ms.get() < 1) {
        validation_errors_.push_back("Reap interval must be at least 1ms");
    }

    // Synthetic capability
    double rate = config_.synthetic.transient_failure_rate.get();
    if (rate < 0.0 || rate >= 1.0) {
        validation_errors_.push_back("Synthetic transient failure rate must be within [0, 1)");
    }
    if (config_.synthetic.latency_ms.get() < 0) {
        validation_errors_.push_back("Synthetic latency cannot be negative");
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

} // namespace Reqflow
