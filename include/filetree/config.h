#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "filetree/sort.h"
#include "filetree/style.h"

namespace filetree {

class Config {
public:
    struct Options {
        std::filesystem::path root_dir;
        std::optional<std::filesystem::path> filepath;

        std::vector<std::string> ignore_dirs;
        std::vector<std::string> ignore_files;
        std::vector<std::string> include_dirs;
        std::vector<std::string> include_files;

        std::string style = "classic";
        int indent = StyleRegistry::kDefaultIndent;
        std::string sort_key = "natural";
        // API only; there is no textual form for a comparator.
        std::optional<NameOrder> custom_sort;

        bool files_first = false;
        bool skip_sorting = false;
        bool reverse = false;
        bool follow_symlinks = false;
        std::optional<std::size_t> max_depth;

        bool stream_output = false;
        bool save_to_file = true;
        bool printout = false;
        bool entry_count = false;

        std::string log_level = "error";
        std::optional<std::filesystem::path> log_file;
        std::optional<std::filesystem::path> config_file;
        bool dump_markdown = false;
    };

    static Config& instance();

    // One-line summary of the traversal-relevant settings, for debug logs.
    static std::string describe(const Options& options);

    void set_options(Options options);
    const Options& options() const noexcept;

    void set_program_name(std::string_view name);
    std::string_view program_name() const noexcept;

private:
    Config() = default;

    Options options_{};
    std::string program_name_;
};

} // namespace filetree
