#include "filetree/cli_formatter.h"

#include <cstdlib>
#include <sstream>

#include "filetree/platform.h"

namespace filetree {

namespace {
constexpr std::string_view kHeading = "\x1b[33m";
constexpr std::string_view kGroup = "\x1b[36m";
constexpr std::string_view kOptionName = "\x1b[32m";
constexpr std::string_view kFooter = "\x1b[35m";
constexpr std::string_view kReset = "\x1b[0m";
} // namespace

bool ColorFormatter::should_colorize() {
    static const bool colorize = [] {
        if (std::getenv("NO_COLOR") != nullptr) {
            return false;
        }
        return platform::stdout_is_terminal();
    }();
    return colorize;
}

std::string ColorFormatter::color_text(std::string_view text, std::string_view color) {
    if (!should_colorize() || text.empty()) {
        return std::string{text};
    }
    std::string out;
    out.reserve(color.size() + text.size() + kReset.size());
    out += color;
    out += text;
    out += kReset;
    return out;
}

std::string ColorFormatter::make_usage(const CLI::App* app, std::string name) const {
    std::ostringstream out;
    out << '\n' << color_text(get_label("Usage"), kHeading) << ':';
    if (!name.empty()) {
        out << ' ' << name;
    }

    std::vector<const CLI::Option*> non_positional =
        app->get_options([](const CLI::Option* opt) { return opt->nonpositional(); });
    if (!non_positional.empty()) {
        out << " [" << get_label("OPTIONS") << "]";
    }
    out << "\n\n";
    return out.str();
}

std::string ColorFormatter::make_group(std::string group, bool is_positional, std::vector<const CLI::Option*> opts) const {
    if (opts.empty()) {
        return {};
    }

    std::ostringstream out;
    out << "\n";
    if (!group.empty()) {
        out << color_text(group, kGroup);
    }
    out << ":\n";
    for (const CLI::Option* opt : opts) {
        out << make_option(opt, is_positional);
    }
    return out.str();
}

std::string ColorFormatter::make_option_name(const CLI::Option* opt, bool is_positional) const {
    return color_text(Formatter::make_option_name(opt, is_positional), kOptionName);
}

std::string ColorFormatter::make_footer(const CLI::App* app) const {
    std::string footer = Formatter::make_footer(app);
    if (footer.empty()) {
        return footer;
    }
    return color_text(footer, kFooter);
}

std::string ColorFormatter::make_description(const CLI::App* app) const {
    std::string desc = Formatter::make_description(app);
    if (desc.empty()) {
        return desc;
    }
    return color_text(desc, kHeading);
}

} // namespace filetree
