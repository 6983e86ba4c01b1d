#ifndef SKYVAULT_CONFIGURATION_H_
#define SKYVAULT_CONFIGURATION_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Skyvault {

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

constexpr size_t kDefaultSegmentBytes = 100UL * 1024 * 1024;

/**
 * Main configuration structure
 */
struct SkyvaultConfig {
    // Remote object store
    struct Store {
        ConfigValue<std::string> root{"/var/lib/skyvault/store", "SKYVAULT_STORE_ROOT"};
        ConfigValue<std::string> container{"", "SKYVAULT_CONTAINER"};
        ConfigValue<size_t> segment_bytes{kDefaultSegmentBytes, "SKYVAULT_SEGMENT_BYTES"};
    } store;

    // Local artifact preparation
    struct Transfer {
        ConfigValue<std::string> destination_dir{"/tmp", "SKYVAULT_DESTINATION_DIR"};
        // Empty means no encryption stage.
        ConfigValue<std::string> crypto_recipient{"", "SKYVAULT_CRYPTO_RECIPIENT"};
        ConfigValue<bool> metering{true, "SKYVAULT_METERING"};
        // Passed verbatim to the meter: 100, 1K, 1M, 1G...
        ConfigValue<std::string> rate_limit{"", "SKYVAULT_RATE_LIMIT"};
        ConfigValue<bool> keep_artifacts{false, "SKYVAULT_KEEP_ARTIFACTS"};
    } transfer;

    // External byte-transform tools, looked up through PATH unless absolute
    struct Tools {
        ConfigValue<std::string> serializer{"btrfs", "SKYVAULT_SERIALIZER"};
        ConfigValue<std::string> encryptor{"age", "SKYVAULT_ENCRYPTOR"};
        ConfigValue<std::string> meter{"pv", "SKYVAULT_METER"};
    } tools;

    struct Lineage {
        ConfigValue<std::string> manifest{"", "SKYVAULT_LINEAGE_MANIFEST"};
    } lineage;

    struct Run {
        ConfigValue<bool> dry_run{false, "SKYVAULT_DRY_RUN"};
        ConfigValue<int> verbosity{0, "SKYVAULT_VERBOSITY"};
    } run;
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
    const SkyvaultConfig& config() const { return config_; }
    SkyvaultConfig& config() { return config_; }

    // Restore compiled-in defaults
    void reset() { config_ = SkyvaultConfig{}; validation_errors_.clear(); }

    // Helper methods for common access patterns
    std::string getContainer() const { return config_.store.container.get(); }
    size_t getSegmentBytes() const { return config_.store.segment_bytes.get(); }
    std::string getDestinationDir() const { return config_.transfer.destination_dir.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    SkyvaultConfig config_;
    mutable std::vector<std::string> validation_errors_;

    // Shared by loadFromFile and loadFromString; node is a YAML::Node
    void applyYAML(const void* node);
};

} // namespace Skyvault

#endif // SKYVAULT_CONFIGURATION_H_
