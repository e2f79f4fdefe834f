#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace VerifyRep {

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
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
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

void Configuration::applyYAML(const void* node) {
    const YAML::Node& yaml = *static_cast<const YAML::Node*>(node);
    if (!yaml["verifyrep"]) {
        return;
    }
    auto root = yaml["verifyrep"];

    // Registry
    if (root["registry"]) {
        auto registry = root["registry"];
        if (registry["address"]) config_.registry.address.set(registry["address"].as<std::string>());
        if (registry["connect_timeout_ms"]) config_.registry.connect_timeout_ms.set(registry["connect_timeout_ms"].as<int>());
        if (registry["rpc_timeout_ms"]) config_.registry.rpc_timeout_ms.set(registry["rpc_timeout_ms"].as<int>());
    }

    // Local cluster
    if (root["local"]) {
        auto local = root["local"];
        if (local["scan_address"]) config_.local.scan_address.set(local["scan_address"].as<std::string>());
    }

    // Scan
    if (root["scan"]) {
        auto scan = root["scan"];
        if (scan["caching"]) config_.scan.caching.set(scan["caching"].as<int>());
        if (scan["connect_timeout_ms"]) config_.scan.connect_timeout_ms.set(scan["connect_timeout_ms"].as<int>());
        if (scan["rpc_timeout_ms"]) config_.scan.rpc_timeout_ms.set(scan["rpc_timeout_ms"].as<int>());
    }

    // Job
    if (root["job"]) {
        auto job = root["job"];
        if (job["worker_threads"]) config_.job.worker_threads.set(job["worker_threads"].as<int>());
        if (job["max_partition_attempts"]) config_.job.max_partition_attempts.set(job["max_partition_attempts"].as<int>());
    }

    // Replication
    if (root["replication"]) {
        auto replication = root["replication"];
        if (replication["enabled"]) config_.replication.enabled.set(replication["enabled"].as<bool>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(&yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYAML(&yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.registry.address.get().empty()) {
        validation_errors_.push_back("Registry address must not be empty");
    }
    if (config_.local.scan_address.get().empty()) {
        validation_errors_.push_back("Local scan address must not be empty");
    }

    // Validate timeouts
    if (config_.registry.connect_timeout_ms.get() <= 0 || config_.registry.rpc_timeout_ms.get() <= 0) {
        validation_errors_.push_back("Registry timeouts must be positive");
    }
    if (config_.scan.connect_timeout_ms.get() <= 0 || config_.scan.rpc_timeout_ms.get() <= 0) {
        validation_errors_.push_back("Scan timeouts must be positive");
    }

    if (config_.scan.caching.get() < 1) {
        validation_errors_.push_back("Scan caching must be at least 1");
    }

    // Validate thread counts
    if (config_.job.worker_threads.get() < 1) {
        validation_errors_.push_back("Worker threads must be at least 1");
    }
    if (config_.job.max_partition_attempts.get() < 1) {
        validation_errors_.push_back("Max partition attempts must be at least 1");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace VerifyRep
