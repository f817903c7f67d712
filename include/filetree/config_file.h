#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

#include "filetree/config.h"

namespace filetree::config_file {

// Keys recognised in a configuration file, in documentation order.
std::vector<std::string_view> known_keys();

// Applies every key present in the JSON object `text` onto `options`.
// Throws ConfigFileError for invalid JSON or mistyped values.
void apply_text(std::string_view text, Config::Options& options);

// Reads `path` and applies it onto `options`.
void apply_file(const std::filesystem::path& path, Config::Options& options);

} // namespace filetree::config_file
