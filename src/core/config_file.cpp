#include "filetree/config_file.h"

#include <format>
#include <fstream>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "filetree/errors.h"
#include "filetree/filters.h"
#include "filetree/logger.h"

namespace filetree::config_file {
namespace {

using json = nlohmann::json;

[[noreturn]] void wrong_type(std::string_view key, std::string_view expected, const json& value) {
    throw ConfigFileError(std::format("config key '{}' must be {}, got {}", key, expected, value.type_name()));
}

bool read_bool(std::string_view key, const json& value) {
    if (!value.is_boolean()) {
        wrong_type(key, "a boolean", value);
    }
    return value.get<bool>();
}

std::string read_string(std::string_view key, const json& value) {
    if (!value.is_string()) {
        wrong_type(key, "a string", value);
    }
    return value.get<std::string>();
}

long long read_integer(std::string_view key, const json& value) {
    if (!value.is_number_integer()) {
        wrong_type(key, "an integer", value);
    }
    return value.get<long long>();
}

// Arrays of strings, or one string holding a bracketed list or a single name.
std::vector<std::string> read_names(std::string_view key, const json& value) {
    if (value.is_null()) {
        return {};
    }
    if (value.is_string()) {
        return parse_name_list({value.get<std::string>()});
    }
    if (!value.is_array()) {
        wrong_type(key, "a list of names", value);
    }
    std::vector<std::string> names;
    names.reserve(value.size());
    for (const auto& item : value) {
        if (!item.is_string()) {
            wrong_type(key, "a list of names", value);
        }
        names.push_back(item.get<std::string>());
    }
    return names;
}

void apply_key(const std::string& key, const json& value, Config::Options& options) {
    if (key == "root_dir") {
        options.root_dir = read_string(key, value);
    } else if (key == "filepath") {
        if (value.is_null()) {
            options.filepath.reset();
        } else {
            options.filepath = std::filesystem::path{read_string(key, value)};
        }
    } else if (key == "ignore_dirs") {
        options.ignore_dirs = read_names(key, value);
    } else if (key == "ignore_files") {
        options.ignore_files = read_names(key, value);
    } else if (key == "include_dirs") {
        options.include_dirs = read_names(key, value);
    } else if (key == "include_files") {
        options.include_files = read_names(key, value);
    } else if (key == "style") {
        options.style = read_string(key, value);
    } else if (key == "indent") {
        const auto indent = read_integer(key, value);
        if (indent < StyleRegistry::kMinIndent || indent > StyleRegistry::kMaxIndent) {
            throw ConfigFileError(std::format("config key 'indent' must be between {} and {}",
                                              StyleRegistry::kMinIndent, StyleRegistry::kMaxIndent));
        }
        options.indent = static_cast<int>(indent);
    } else if (key == "sort_key") {
        options.sort_key = read_string(key, value);
    } else if (key == "files_first") {
        options.files_first = read_bool(key, value);
    } else if (key == "skip_sorting") {
        options.skip_sorting = read_bool(key, value);
    } else if (key == "reverse") {
        options.reverse = read_bool(key, value);
    } else if (key == "follow_symlinks") {
        options.follow_symlinks = read_bool(key, value);
    } else if (key == "max_depth") {
        if (value.is_null()) {
            options.max_depth.reset();
            return;
        }
        const auto depth = read_integer(key, value);
        if (depth < 1) {
            throw ConfigFileError("config key 'max_depth' must be at least 1");
        }
        options.max_depth = static_cast<std::size_t>(depth);
    } else if (key == "stream_output") {
        options.stream_output = read_bool(key, value);
    } else if (key == "no_save") {
        options.save_to_file = !read_bool(key, value);
    } else if (key == "printout") {
        options.printout = read_bool(key, value);
    } else if (key == "entry_count") {
        options.entry_count = read_bool(key, value);
    } else {
        Logger::instance().warn("ignoring unknown config key '{}'", key);
    }
}

} // namespace

std::vector<std::string_view> known_keys() {
    return {"root_dir",     "filepath",     "ignore_dirs",     "ignore_files", "include_dirs",
            "include_files", "style",        "indent",          "files_first",  "skip_sorting",
            "sort_key",     "reverse",      "follow_symlinks", "max_depth",    "stream_output",
            "no_save",      "printout",     "entry_count"};
}

void apply_text(std::string_view text, Config::Options& options) {
    json doc;
    try {
        doc = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& ex) {
        throw ConfigFileError(std::format("invalid JSON: {}", ex.what()));
    }
    if (!doc.is_object()) {
        throw ConfigFileError("configuration must be a JSON object");
    }
    for (const auto& [key, value] : doc.items()) {
        apply_key(key, value, options);
    }
}

void apply_file(const std::filesystem::path& path, Config::Options& options) {
    std::ifstream file{path, std::ios::binary};
    if (!file) {
        throw ConfigFileError(std::format("cannot open config file '{}'", path.string()));
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    Logger::instance().debug("loading config file {}", path.string());
    try {
        apply_text(buffer.str(), options);
    } catch (const ConfigFileError& ex) {
        throw ConfigFileError(std::format("{}: {}", path.string(), ex.what()));
    }
}

} // namespace filetree::config_file
