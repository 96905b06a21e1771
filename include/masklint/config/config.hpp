#pragma once

#include <yaml-cpp/yaml.h>

#include <boost/property_tree/ptree.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

namespace masklint::config {

// Configuration file path constants
class ConfigPaths {
public:
    static constexpr const char* DEFAULT_CONFIG_FILE = "masklint.yaml";
    static constexpr const char* DEFAULT_MASKFILE = "maskfile.md";
};

enum class ConfigFormat { YAML, JSON, INI };

// Picks the format from the file extension, YAML when unrecognized
ConfigFormat format_from_path(const std::string& path);

// A named configuration section, filled from its subtree of the loaded file
class ConfigurationProperties {
public:
    virtual ~ConfigurationProperties() = default;
    virtual void from_ptree(const boost::property_tree::ptree& pt) = 0;
    virtual void validate() const {}
    virtual std::string properties_name() const = 0;

protected:
    template <typename T>
    T get_value(const boost::property_tree::ptree& pt, const std::string& path,
                const T& default_value) const {
        return pt.get<T>(path, default_value);
    }

    template <typename T>
    std::optional<T> get_optional_value(const boost::property_tree::ptree& pt,
                                        const std::string& path) const {
        auto result = pt.get_optional<T>(path);
        if (result) {
            return *result;
        }
        return std::nullopt;
    }
};

// Configuration manager
class ConfigManager {
public:
    static ConfigManager& instance() {
        static ConfigManager instance;
        return instance;
    }

    // Load configuration file and populate every registered section
    void load_config(const std::string& config_file,
                     ConfigFormat format = ConfigFormat::YAML);

    // Load configuration from an in-memory YAML document
    void load_yaml_string(const std::string& yaml);

    // Register a section; a later registration under the same name replaces
    // the earlier one
    template <typename T>
    void register_configuration_properties(std::shared_ptr<T> config) {
        static_assert(std::is_base_of_v<ConfigurationProperties, T>,
                      "T must inherit from ConfigurationProperties");
        configs_[config->properties_name()] = config;
    }

    // Reset all configurations
    void reset() {
        configs_.clear();
        config_tree_ = boost::property_tree::ptree();
    }

private:
    ConfigManager() = default;

    std::map<std::string, std::shared_ptr<ConfigurationProperties>> configs_;
    boost::property_tree::ptree config_tree_;

    void load_component_configs();

    // Helper to convert YAML::Node to boost::property_tree::ptree
    boost::property_tree::ptree yaml_to_ptree(const YAML::Node& node);
};

}  // namespace masklint::config
