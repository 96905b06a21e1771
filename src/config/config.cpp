#include "masklint/config/config.hpp"

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <filesystem>
#include <fstream>

#include "masklint/core/errors.hpp"
#include "masklint/log/logger.hpp"

namespace masklint::config {

ConfigFormat format_from_path(const std::string& path) {
    const std::string ext = std::filesystem::path(path).extension().string();
    if (ext == ".json") {
        return ConfigFormat::JSON;
    }
    if (ext == ".ini") {
        return ConfigFormat::INI;
    }
    return ConfigFormat::YAML;
}

// Helper to convert YAML::Node to boost::property_tree::ptree
boost::property_tree::ptree ConfigManager::yaml_to_ptree(
    const YAML::Node& node) {
    boost::property_tree::ptree pt;
    if (node.IsMap()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            pt.add_child(it->first.as<std::string>(),
                         yaml_to_ptree(it->second));
        }
    } else if (node.IsSequence()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            pt.add_child("",
                         yaml_to_ptree(*it));  // Empty key for array elements
        }
    } else if (node.IsScalar()) {
        pt.put("", node.as<std::string>());
    }
    return pt;
}

void ConfigManager::load_config(const std::string& config_file,
                                ConfigFormat format) {
    MASKLINT_LOG_INFO << "Loading config file: " << config_file;

    try {
        switch (format) {
            case ConfigFormat::YAML: {
                YAML::Node yaml_node = YAML::LoadFile(config_file);
                config_tree_ = yaml_to_ptree(yaml_node);
                break;
            }
            case ConfigFormat::JSON: {
                std::ifstream ifs(config_file);
                boost::property_tree::read_json(ifs, config_tree_);
                break;
            }
            case ConfigFormat::INI: {
                std::ifstream ifs(config_file);
                boost::property_tree::read_ini(ifs, config_tree_);
                break;
            }
        }
    } catch (const std::exception& e) {
        MASKLINT_LOG_DEBUG << "Failed to load config file: " << config_file
                           << ", Error: " << e.what();
        throw ConfigError("failed to load " + config_file + ": " + e.what());
    }

    load_component_configs();
    MASKLINT_LOG_INFO << "Successfully loaded config file: " << config_file;
}

void ConfigManager::load_yaml_string(const std::string& yaml) {
    try {
        config_tree_ = yaml_to_ptree(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid YAML: ") + e.what());
    }
    load_component_configs();
}

void ConfigManager::load_component_configs() {
    for (auto& [properties_name, config] : configs_) {
        auto subtree = config_tree_.get_child_optional(properties_name);
        if (!subtree) {
            MASKLINT_LOG_DEBUG << "No configuration found for properties: "
                               << properties_name << ", using defaults";
            continue;
        }

        try {
            config->from_ptree(*subtree);
            config->validate();
            MASKLINT_LOG_DEBUG << "Loaded configuration for properties: "
                               << properties_name;
        } catch (const ConfigError&) {
            throw;
        } catch (const boost::property_tree::ptree_error& e) {
            throw ConfigError("section '" + properties_name +
                              "': " + e.what());
        }
    }
}

}  // namespace masklint::config
