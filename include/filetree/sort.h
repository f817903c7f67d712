#pragma once

#include <compare>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace filetree {

// Strict weak "less than" over entry names.
using NameOrder = std::function<bool(std::string_view lhs, std::string_view rhs)>;

// One run of a natural sort key. Digit runs hold the number without
// leading zeros so arbitrarily long numbers compare by length first.
struct NaturalChunk {
    bool numeric = false;
    std::string text;

    std::strong_ordering operator<=>(const NaturalChunk& other) const;
    bool operator==(const NaturalChunk& other) const = default;
};

using NaturalKey = std::vector<NaturalChunk>;

NaturalKey natural_key(std::string_view name);
bool natural_less(std::string_view lhs, std::string_view rhs);
bool lexical_less(std::string_view lhs, std::string_view rhs);

class SortResolver {
public:
    static constexpr std::string_view kNatural = "natural";
    static constexpr std::string_view kLexical = "lex";
    static constexpr std::string_view kCustom = "custom";

    static NameOrder resolve(std::string_view key_name, const std::optional<NameOrder>& custom = std::nullopt);
};

} // namespace filetree
