#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Handoff {

namespace {

// Guards against sources that would not fit in memory alongside the destination.
constexpr size_t kMaxSourceLength = 1UL << 28;

} // namespace

template<>
std::optional<int> ConfigValue<int>::parseEnv(const char* text) const {
    char* end = nullptr;
    errno = 0;
    long parsed = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE ||
        parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
        LOG(WARNING) << env_var_ << "='" << text << "' is not an int; using " << value_;
        return std::nullopt;
    }
    return static_cast<int>(parsed);
}

template<>
std::optional<size_t> ConfigValue<size_t>::parseEnv(const char* text) const {
    // strtoull accepts "-1" and wraps it, which would turn into a huge length.
    const char* digits = text;
    while (std::isspace(static_cast<unsigned char>(*digits))) ++digits;
    char* end = nullptr;
    errno = 0;
    unsigned long long parsed = std::strtoull(digits, &end, 10);
    if (*digits == '-' || end == digits || *end != '\0' || errno == ERANGE ||
        parsed > std::numeric_limits<size_t>::max()) {
        LOG(WARNING) << env_var_ << "='" << text << "' is not a non-negative count; using " << value_;
        return std::nullopt;
    }
    return static_cast<size_t>(parsed);
}

template<>
std::optional<std::string> ConfigValue<std::string>::parseEnv(const char* text) const {
    return std::string(text);
}

template<>
std::optional<bool> ConfigValue<bool>::parseEnv(const char* text) const {
    std::string val(text);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (val == "true" || val == "1" || val == "yes" || val == "on") {
        return true;
    }
    if (val == "false" || val == "0" || val == "no" || val == "off") {
        return false;
    }
    LOG(WARNING) << env_var_ << "='" << text << "' is not a boolean; using "
                 << (value_ ? "true" : "false");
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["handoff"]) {
        LOG(WARNING) << "Configuration has no top-level 'handoff' node; keeping defaults";
        return;
    }
    auto root = yaml["handoff"];

    if (root["pipeline"]) {
        auto pipeline = root["pipeline"];
        if (pipeline["source_length"]) config_.pipeline.source_length.set(pipeline["source_length"].as<size_t>());
        if (pipeline["capacity"]) config_.pipeline.capacity.set(pipeline["capacity"].as<size_t>());
        if (pipeline["backend"]) config_.pipeline.backend.set(pipeline["backend"].as<std::string>());
    }

    if (root["source"]) {
        auto source = root["source"];
        if (source["policy"]) config_.source.policy.set(source["policy"].as<std::string>());
        if (source["seed"]) config_.source.seed.set(source["seed"].as<size_t>());
    }

    if (root["logging"]) {
        auto logging = root["logging"];
        if (logging["trace_items"]) config_.logging.trace_items.set(logging["trace_items"].as<bool>());
        if (logging["print_sequences"]) config_.logging.print_sequences.set(logging["print_sequences"].as<bool>());
        if (logging["verbosity"]) config_.logging.verbosity.set(logging["verbosity"].as<int>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        applyYAML(YAML::LoadFile(filename));
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        applyYAML(YAML::Load(yaml_content));
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.pipeline.source_length.get() > kMaxSourceLength) {
        validation_errors_.push_back("Source length must not exceed " + std::to_string(kMaxSourceLength));
    }

    if (config_.pipeline.capacity.get() > kMaxSourceLength) {
        validation_errors_.push_back("Channel capacity must not exceed " + std::to_string(kMaxSourceLength));
    }

    if (config_.pipeline.backend.get().empty()) {
        validation_errors_.push_back("Channel backend must not be empty");
    }

    if (config_.source.policy.get().empty()) {
        validation_errors_.push_back("Source policy must not be empty");
    }

    if (config_.logging.verbosity.get() < 0) {
        validation_errors_.push_back("Log verbosity must not be negative");
    }

    for (const auto& err : validation_errors_) {
        LOG(ERROR) << "Invalid configuration: " << err;
    }
    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Handoff
