#ifndef HANDOFF_CONFIGURATION_H_
#define HANDOFF_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <cstdlib>
#include <utility>

namespace YAML {
class Node;
}

namespace Handoff {

/**
 * A setting with a built-in default. If env_var names a variable that is set
 * and its text parses as T, get() returns the parsed text instead of the
 * stored value. Text that does not parse is logged and ignored.
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            if (const char* text = std::getenv(env_var_.c_str())) {
                std::optional<T> parsed = parseEnv(text);
                if (parsed.has_value()) {
                    return *parsed;
                }
            }
        }
        return value_;
    }

    void set(T value) { value_ = std::move(value); }
    const std::string& env_var() const { return env_var_; }

private:
    T value_{};
    std::string env_var_;

    std::optional<T> parseEnv(const char* text) const;
};

/**
 * Main configuration structure
 */
struct HandoffConfig {
    struct Pipeline {
        ConfigValue<size_t> source_length{10, "HANDOFF_SOURCE_LENGTH"};
        // 0 derives max(1, source_length / 2)
        ConfigValue<size_t> capacity{0, "HANDOFF_CHANNEL_CAPACITY"};
        // monitor | mpmc
        ConfigValue<std::string> backend{"monitor", "HANDOFF_CHANNEL_BACKEND"};
    } pipeline;

    struct Source {
        // mixed | integers | reals
        ConfigValue<std::string> policy{"mixed", "HANDOFF_SOURCE_POLICY"};
        ConfigValue<size_t> seed{0, "HANDOFF_SOURCE_SEED"};
    } source;

    struct Logging {
        ConfigValue<bool> trace_items{false, "HANDOFF_TRACE_ITEMS"};
        ConfigValue<bool> print_sequences{false, "HANDOFF_PRINT_SEQUENCES"};
        ConfigValue<int> verbosity{0, "HANDOFF_LOG_LEVEL"};
    } logging;
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
    const HandoffConfig& config() const { return config_; }
    HandoffConfig& config() { return config_; }

    // Restore every value to its default
    void reset() { config_ = HandoffConfig{}; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    HandoffConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
};

// Environment parsers, one per supported setting type
template<>
std::optional<int> ConfigValue<int>::parseEnv(const char* text) const;

template<>
std::optional<size_t> ConfigValue<size_t>::parseEnv(const char* text) const;

template<>
std::optional<std::string> ConfigValue<std::string>::parseEnv(const char* text) const;

template<>
std::optional<bool> ConfigValue<bool>::parseEnv(const char* text) const;

} // namespace Handoff

#endif // HANDOFF_CONFIGURATION_H_
