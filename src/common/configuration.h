#ifndef VERIFYREP_CONFIGURATION_H_
#define VERIFYREP_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace VerifyRep {

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
struct VerifyRepConfig {
    // Peer metadata registry
    struct Registry {
        ConfigValue<std::string> address{"127.0.0.1:2181", "VERIFYREP_REGISTRY_ADDRESS"};
        ConfigValue<int> connect_timeout_ms{2000, "VERIFYREP_REGISTRY_CONNECT_TIMEOUT_MS"};
        ConfigValue<int> rpc_timeout_ms{5000, "VERIFYREP_REGISTRY_RPC_TIMEOUT_MS"};
    } registry;

    // Primary cluster, source of partitions and local scans
    struct Local {
        ConfigValue<std::string> scan_address{"127.0.0.1:16020", "VERIFYREP_LOCAL_SCAN_ADDRESS"};
    } local;

    // Scanner settings shared by both sides
    struct Scan {
        ConfigValue<int> caching{1, "VERIFYREP_SCAN_CACHING"};
        ConfigValue<int> connect_timeout_ms{2000, "VERIFYREP_SCAN_CONNECT_TIMEOUT_MS"};
        ConfigValue<int> rpc_timeout_ms{60000, "VERIFYREP_SCAN_RPC_TIMEOUT_MS"};
    } scan;

    struct Job {
        ConfigValue<int> worker_threads{4, "VERIFYREP_WORKER_THREADS"};
        ConfigValue<int> max_partition_attempts{2, "VERIFYREP_MAX_PARTITION_ATTEMPTS"};
    } job;

    struct Replication {
        ConfigValue<bool> enabled{true, "VERIFYREP_REPLICATION_ENABLED"};
    } replication;
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

    // Get the configuration
    const VerifyRepConfig& config() const { return config_; }
    VerifyRepConfig& config() { return config_; }

    // Drop every value set from YAML or code
    void reset() { config_ = VerifyRepConfig(); }

    // Helper methods for common access patterns
    std::string getRegistryAddress() const { return config_.registry.address.get(); }
    int getRegistryConnectTimeoutMs() const { return config_.registry.connect_timeout_ms.get(); }
    int getRegistryRpcTimeoutMs() const { return config_.registry.rpc_timeout_ms.get(); }
    std::string getLocalScanAddress() const { return config_.local.scan_address.get(); }
    int getScanCaching() const { return config_.scan.caching.get(); }
    int getScanConnectTimeoutMs() const { return config_.scan.connect_timeout_ms.get(); }
    int getScanRpcTimeoutMs() const { return config_.scan.rpc_timeout_ms.get(); }
    int getWorkerThreads() const { return config_.job.worker_threads.get(); }
    int getMaxPartitionAttempts() const { return config_.job.max_partition_attempts.get(); }
    bool isReplicationEnabled() const { return config_.replication.enabled.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    VerifyRepConfig config_;
    mutable std::vector<std::string> validation_errors_;

    // Applies a parsed document on top of the current values
    void applyYAML(const void* root);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace VerifyRep

#endif // VERIFYREP_CONFIGURATION_H_
