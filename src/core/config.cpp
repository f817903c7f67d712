#include "filetree/config.h"

#include <format>
#include <utility>

namespace filetree {

Config& Config::instance() {
    static Config instance;
    return instance;
}

std::string Config::describe(const Options& options) {
    auto join = [](const std::vector<std::string>& items) {
        std::string out;
        for (const auto& item : items) {
            if (!out.empty()) {
                out += ',';
            }
            out += item;
        }
        return out;
    };
    return std::format("root={} style={} indent={} sort={} files_first={} skip_sorting={} reverse={} "
                       "ignore_dirs=[{}] ignore_files=[{}] include_dirs=[{}] include_files=[{}]",
                       options.root_dir.string(), options.style, options.indent, options.sort_key,
                       options.files_first, options.skip_sorting, options.reverse, join(options.ignore_dirs),
                       join(options.ignore_files), join(options.include_dirs), join(options.include_files));
}

void Config::set_options(Options options) {
    options_ = std::move(options);
}

const Config::Options& Config::options() const noexcept {
    return options_;
}

void Config::set_program_name(std::string_view name) {
    program_name_.assign(name.begin(), name.end());
}

std::string_view Config::program_name() const noexcept {
    return program_name_;
}

} // namespace filetree
