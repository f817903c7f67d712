#pragma once

#include <filesystem>
#include <iosfwd>
#include <string_view>
#include <system_error>

namespace filetree::sink {

inline constexpr std::string_view kDefaultSuffix = "_filetree.txt";

void print(std::ostream& out, std::string_view text);

// Creates or truncates `path` and writes `text` followed by a newline.
std::error_code save(const std::filesystem::path& path, std::string_view text);

// "<parent>/<name>_filetree.txt" next to the root directory.
std::filesystem::path default_output_path(const std::filesystem::path& root);

} // namespace filetree::sink
