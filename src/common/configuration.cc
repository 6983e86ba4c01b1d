#include "configuration.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Skyvault {

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
    if (!yaml["skyvault"]) {
        LOG(WARNING) << "Configuration has no top-level 'skyvault' section, keeping defaults";
        return;
    }
    auto root = yaml["skyvault"];

    // Store
    if (root["store"]) {
        auto store = root["store"];
        if (store["root"]) config_.store.root.set(store["root"].as<std::string>());
        if (store["container"]) config_.store.container.set(store["container"].as<std::string>());
        if (store["segment_bytes"]) config_.store.segment_bytes.set(store["segment_bytes"].as<size_t>());
    }

    // Transfer
    if (root["transfer"]) {
        auto transfer = root["transfer"];
        if (transfer["destination_dir"]) config_.transfer.destination_dir.set(transfer["destination_dir"].as<std::string>());
        if (transfer["crypto_recipient"]) config_.transfer.crypto_recipient.set(transfer["crypto_recipient"].as<std::string>());
        if (transfer["metering"]) config_.transfer.metering.set(transfer["metering"].as<bool>());
        if (transfer["rate_limit"]) config_.transfer.rate_limit.set(transfer["rate_limit"].as<std::string>());
        if (transfer["keep_artifacts"]) config_.transfer.keep_artifacts.set(transfer["keep_artifacts"].as<bool>());
    }

    // Tools
    if (root["tools"]) {
        auto tools = root["tools"];
        if (tools["serializer"]) config_.tools.serializer.set(tools["serializer"].as<std::string>());
        if (tools["encryptor"]) config_.tools.encryptor.set(tools["encryptor"].as<std::string>());
        if (tools["meter"]) config_.tools.meter.set(tools["meter"].as<std::string>());
    }

    // Lineage
    if (root["lineage"]) {
        auto lineage = root["lineage"];
        if (lineage["manifest"]) config_.lineage.manifest.set(lineage["manifest"].as<std::string>());
    }

    // Run
    if (root["run"]) {
        auto run = root["run"];
        if (run["dry_run"]) config_.run.dry_run.set(run["dry_run"].as<bool>());
        if (run["verbosity"]) config_.run.verbosity.set(run["verbosity"].as<int>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(&yaml);
        VLOG(1) << "Loaded configuration from " << filename;
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

    // Segments below 1MB turn a snapshot into millions of objects
    if (config_.store.segment_bytes.get() < (1UL << 20)) {
        validation_errors_.push_back("Segment size must be at least 1MB");
    }

    if (config_.store.root.get().empty()) {
        validation_errors_.push_back("Store root must not be empty");
    }

    if (config_.transfer.destination_dir.get().empty()) {
        validation_errors_.push_back("Destination directory must not be empty");
    }

    if (config_.tools.serializer.get().empty()) {
        validation_errors_.push_back("Serializer tool must be set");
    }

    if (!config_.transfer.crypto_recipient.get().empty() && config_.tools.encryptor.get().empty()) {
        validation_errors_.push_back("Encryptor tool must be set when a crypto recipient is given");
    }

    if (config_.transfer.metering.get() && config_.tools.meter.get().empty()) {
        validation_errors_.push_back("Meter tool must be set when metering is enabled");
    }

    const std::string rate = config_.transfer.rate_limit.get();
    if (!rate.empty()) {
        size_t digits = 0;
        while (digits < rate.size() && std::isdigit(static_cast<unsigned char>(rate[digits]))) {
            ++digits;
        }
        bool suffix_ok = digits == rate.size() ||
            (digits + 1 == rate.size() && std::string("KMGTkmgt").find(rate.back()) != std::string::npos);
        if (digits == 0 || !suffix_ok) {
            validation_errors_.push_back("Rate limit must look like 100, 1K, 1M or 1G");
        }
    }

    if (config_.run.verbosity.get() < 0) {
        validation_errors_.push_back("Verbosity cannot be negative");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Skyvault
