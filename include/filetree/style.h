#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace filetree {

struct StyleSpec {
    std::string space;
    std::string vertical;
    std::string branch;
    std::string end;

    bool operator==(const StyleSpec&) const = default;
};

class StyleRegistry {
public:
    static constexpr int kDefaultIndent = 2;
    static constexpr int kMinIndent = 1;
    static constexpr int kMaxIndent = 8;

    // Registers the built-in styles with connectors `indent` fill glyphs wide.
    explicit StyleRegistry(int indent = kDefaultIndent);

    const StyleSpec& register_style(std::string name, std::string branch, std::string end,
                                    std::string_view vertical_glyph = "│");
    const StyleSpec& resolve(std::string_view name) const;

    // Rebuilds the built-in styles at a new width; user styles are kept.
    void set_indent(int indent);

    bool contains(std::string_view name) const;
    std::vector<std::string> names() const;
    int indent() const noexcept { return indent_; }

    static StyleSpec make_spec(std::string branch, std::string end, std::string_view vertical_glyph = "│");

private:
    void register_builtins();

    int indent_;
    std::map<std::string, StyleSpec, std::less<>> styles_;
};

} // namespace filetree
