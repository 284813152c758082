// Session configuration YAML read/write implementation
#include "parley/parley_config.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <yaml-cpp/yaml.h>

#include "parley/text_layout.hpp"

namespace fs = std::filesystem;

namespace parley {

bool write_config_to_file(const ParleyConfig& config, const std::string& path) {
    YAML::Node root;
    root["_comment1"] = "Parley session configuration. 0 disables wrap_at/page_at.";
    root["wrap_at"] = config.wrap_at;
    root["page_at"] = config.page_at;
    root["use_color"] = config.use_color;
    root["default_list_mode"] = config.default_list_mode;
    root["shell_prompt"] = config.shell_prompt;

    std::ofstream fout(path);
    if (!fout) return false;
    fout << root;
    return static_cast<bool>(fout);
}

void load_or_create_config(const std::string& config_path, ParleyConfig& config) {
    if (fs::exists(config_path)) {
        config.loaded_config_path = fs::absolute(config_path).string();
        try {
            YAML::Node root = YAML::LoadFile(config_path);
            if (root["wrap_at"]) config.wrap_at = root["wrap_at"].as<size_t>();
            if (root["page_at"]) config.page_at = root["page_at"].as<size_t>();
            if (root["use_color"]) config.use_color = root["use_color"].as<bool>();
            if (root["default_list_mode"]) {
                std::string mode = root["default_list_mode"].as<std::string>();
                if (ListModeFromName(mode)) {
                    config.default_list_mode = mode;
                } else {
                    std::cerr << "Warning: Unknown default_list_mode '" << mode
                              << "' in '" << config_path << "'. Keeping '"
                              << config.default_list_mode << "'." << std::endl;
                }
            }
            if (root["shell_prompt"]) config.shell_prompt = root["shell_prompt"].as<std::string>();
            std::cout << "Loaded configuration from '" << config_path << "'." << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "Warning: Could not parse config file '" << config_path
                      << "'. Using default settings. Error: " << e.what() << std::endl;
        }
    } else if (config_path == "parley.yaml") {
        std::cout << "Configuration file 'parley.yaml' not found. Creating a default one." << std::endl;
        if (write_config_to_file(config, "parley.yaml")) {
            config.loaded_config_path = fs::absolute("parley.yaml").string();
        } else {
            std::cerr << "Warning: Could not write default configuration to 'parley.yaml'." << std::endl;
        }
    }
}

} // namespace parley
