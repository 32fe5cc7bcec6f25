#pragma once

#include <yaml-cpp/node/node.h>

#include <filesystem>
#include <string>
#include <string_view>

namespace drydock {

/// The manifest file being parsed when YAML parsing failed
struct e_parse_yaml_file_path {
    std::filesystem::path value;
};

/// The message from yaml-cpp
struct e_yaml_parse_error {
    std::string value;
};

/**
 * @brief Parse YAML text. A syntax error is an invalid_config_error carrying e_yaml_parse_error.
 */
YAML::Node parse_yaml_string(std::string_view);

YAML::Node parse_yaml_file(const std::filesystem::path&);

}  // namespace drydock
