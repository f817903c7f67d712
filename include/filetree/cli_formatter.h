#pragma once

#include <CLI/CLI.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace filetree {

// Help formatter that colours headings and option names on a terminal.
class ColorFormatter final : public CLI::Formatter {
public:
    ColorFormatter() = default;

    std::string make_usage(const CLI::App* app, std::string name) const override;
    std::string make_group(std::string group, bool is_positional, std::vector<const CLI::Option*> opts) const override;
    std::string make_option_name(const CLI::Option* opt, bool is_positional) const override;
    std::string make_footer(const CLI::App* app) const override;
    std::string make_description(const CLI::App* app) const override;

private:
    static bool should_colorize();
    static std::string color_text(std::string_view text, std::string_view color);
};

} // namespace filetree
