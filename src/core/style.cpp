#include "filetree/style.h"

#include <algorithm>
#include <format>
#include <utility>

#include "filetree/errors.h"
#include "filetree/string_utils.h"

namespace filetree {
namespace {

std::string repeat(std::string_view glyph, int count) {
    std::string out;
    out.reserve(glyph.size() * static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) {
        out += glyph;
    }
    return out;
}

} // namespace

StyleRegistry::StyleRegistry(int indent)
    : indent_{std::clamp(indent, kMinIndent, kMaxIndent)} {
    register_builtins();
}

void StyleRegistry::register_builtins() {
    const std::string solid = repeat("─", indent_);
    const std::string ascii = repeat("-", indent_);

    register_style("classic", "├" + solid + " ", "└" + solid + " ");
    register_style("dash", "|" + ascii + " ", "`" + ascii + " ", "|");
    // The arrow tip replaces the last fill glyph so widths match classic.
    register_style("arrow", "├" + repeat("─", indent_ - 1) + "> ", "└" + repeat("─", indent_ - 1) + "> ");
    register_style("plus", "+" + ascii + " ", "+" + repeat("=", indent_) + " ", "|");
}

void StyleRegistry::set_indent(int indent) {
    const int clamped = std::clamp(indent, kMinIndent, kMaxIndent);
    if (clamped == indent_) {
        return;
    }
    indent_ = clamped;
    register_builtins();
}

StyleSpec StyleRegistry::make_spec(std::string branch, std::string end, std::string_view vertical_glyph) {
    const std::size_t width = std::max(string_utils::display_width(branch), string_utils::display_width(end));
    const std::size_t glyph_width = string_utils::display_width(vertical_glyph);

    StyleSpec spec;
    spec.space.assign(width, ' ');
    spec.vertical = std::string{vertical_glyph};
    if (width > glyph_width) {
        spec.vertical.append(width - glyph_width, ' ');
    }
    spec.branch = std::move(branch);
    spec.end = std::move(end);
    return spec;
}

const StyleSpec& StyleRegistry::register_style(std::string name, std::string branch, std::string end,
                                               std::string_view vertical_glyph) {
    auto spec = make_spec(std::move(branch), std::move(end), vertical_glyph);
    auto [it, inserted] = styles_.insert_or_assign(std::move(name), std::move(spec));
    return it->second;
}

const StyleSpec& StyleRegistry::resolve(std::string_view name) const {
    auto it = styles_.find(name);
    if (it == styles_.end()) {
        throw UnknownStyle(std::format("Unknown style '{}'", name));
    }
    return it->second;
}

bool StyleRegistry::contains(std::string_view name) const {
    return styles_.find(name) != styles_.end();
}

std::vector<std::string> StyleRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(styles_.size());
    for (const auto& [name, spec] : styles_) {
        out.push_back(name);
    }
    return out;
}

} // namespace filetree
