#include "filetree/sort.h"

#include <algorithm>
#include <format>

#include "filetree/errors.h"
#include "filetree/string_utils.h"

namespace filetree {

std::strong_ordering NaturalChunk::operator<=>(const NaturalChunk& other) const {
    if (numeric != other.numeric) {
        // Only reachable when one key starts with a digit and the other does not.
        return numeric ? std::strong_ordering::less : std::strong_ordering::greater;
    }
    if (numeric && text.size() != other.text.size()) {
        return text.size() <=> other.text.size();
    }
    return text.compare(other.text) <=> 0;
}

NaturalKey natural_key(std::string_view name) {
    NaturalKey key;
    std::size_t pos = 0;
    while (pos < name.size()) {
        const bool numeric = string_utils::is_digit(name[pos]);
        std::size_t end = pos;
        while (end < name.size() && string_utils::is_digit(name[end]) == numeric) {
            ++end;
        }

        NaturalChunk chunk;
        chunk.numeric = numeric;
        auto run = name.substr(pos, end - pos);
        if (numeric) {
            auto first = run.find_first_not_of('0');
            chunk.text = first == std::string_view::npos ? std::string{"0"} : std::string{run.substr(first)};
        } else {
            chunk.text = string_utils::fold_case(run);
        }
        key.push_back(std::move(chunk));
        pos = end;
    }
    return key;
}

bool natural_less(std::string_view lhs, std::string_view rhs) {
    const auto lkey = natural_key(lhs);
    const auto rkey = natural_key(rhs);
    if (lkey != rkey) {
        return std::lexicographical_compare(lkey.begin(), lkey.end(), rkey.begin(), rkey.end());
    }
    // "file01" and "file1" share a key; fall back to code points to stay total.
    return lhs < rhs;
}

bool lexical_less(std::string_view lhs, std::string_view rhs) {
    return lhs < rhs;
}

NameOrder SortResolver::resolve(std::string_view key_name, const std::optional<NameOrder>& custom) {
    if (key_name == kNatural) {
        return natural_less;
    }
    if (key_name == kLexical) {
        return lexical_less;
    }
    if (key_name == kCustom) {
        if (!custom || !*custom) {
            throw MissingComparator("custom_sort function must be specified when sort key is 'custom'");
        }
        return *custom;
    }
    throw UnknownSortKey(std::format("Invalid sort key name '{}'", key_name));
}

} // namespace filetree
