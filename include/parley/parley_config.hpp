// Session configuration definition and YAML I/O declarations
#pragma once

#include <string>

#include "parley/parley_types.hpp"

namespace parley {

struct ParleyConfig {
    std::string loaded_config_path;
    size_t wrap_at = 0;  // 0 disables wrapping
    size_t page_at = 0;  // 0 disables paging
    bool use_color = true;
    std::string default_list_mode = "rows";
    std::string shell_prompt = "parley> ";
};

// Persist the configuration to a YAML file at `path`.
// Returns true on success.
PARLEY_API bool write_config_to_file(const ParleyConfig& config, const std::string& path);

// Load an existing config from `config_path` if it exists.
// If `config_path` is the default "parley.yaml" and does not exist, create it with defaults.
PARLEY_API void load_or_create_config(const std::string& config_path, ParleyConfig& config);

} // namespace parley
