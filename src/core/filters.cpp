#include "filetree/filters.h"

#include <format>
#include <memory>
#include <utility>

#include "filetree/errors.h"
#include "filetree/string_utils.h"

namespace filetree {
namespace {

bool has_wildcard(std::string_view pattern) {
    return pattern.find_first_of("*?") != std::string_view::npos;
}

bool matches_any(const std::set<std::string, std::less<>>& patterns, std::string_view name) {
    if (patterns.find(name) != patterns.end()) {
        return true;
    }
    for (const auto& pattern : patterns) {
        if (has_wildcard(pattern) && string_utils::wildcard_match(pattern, name)) {
            return true;
        }
    }
    return false;
}

[[noreturn]] void malformed(std::string_view text, std::string_view reason) {
    throw InvalidFilterSyntax(std::format("Invalid list syntax: {} ({})", text, reason));
}

std::vector<std::string> parse_bracketed(std::string_view text) {
    std::string_view body = string_utils::trim(text);
    if (body.size() < 2 || body.front() != '[' || body.back() != ']') {
        malformed(text, "expected closing ']'");
    }
    body = body.substr(1, body.size() - 2);

    std::vector<std::string> items;
    std::size_t pos = 0;
    auto skip_spaces = [&]() {
        while (pos < body.size() && (body[pos] == ' ' || body[pos] == '\t')) {
            ++pos;
        }
    };

    skip_spaces();
    if (pos == body.size()) {
        return items;
    }

    while (true) {
        skip_spaces();
        if (pos >= body.size()) {
            malformed(text, "expected item after ','");
        }
        const char quote = body[pos];
        if (quote != '\'' && quote != '"') {
            malformed(text, "items must be quoted");
        }
        ++pos;
        std::string item;
        bool closed = false;
        while (pos < body.size()) {
            char ch = body[pos++];
            if (ch == '\\' && pos < body.size()) {
                item.push_back(body[pos++]);
                continue;
            }
            if (ch == quote) {
                closed = true;
                break;
            }
            item.push_back(ch);
        }
        if (!closed) {
            malformed(text, "unterminated string");
        }
        items.push_back(std::move(item));

        skip_spaces();
        if (pos == body.size()) {
            break;
        }
        if (body[pos] != ',') {
            malformed(text, "expected ','");
        }
        ++pos;
        skip_spaces();
        // A trailing comma before ']' is accepted.
        if (pos == body.size()) {
            break;
        }
    }
    return items;
}

} // namespace

NamePredicate make_name_predicate(std::set<std::string> ignore, std::set<std::string> include) {
    // Shared immutable snapshot: copies of the predicate never see later edits.
    auto ignored = std::make_shared<const std::set<std::string, std::less<>>>(ignore.begin(), ignore.end());
    auto included = std::make_shared<const std::set<std::string, std::less<>>>(include.begin(), include.end());
    return [ignored, included](std::string_view name) {
        if (matches_any(*ignored, name)) {
            return false;
        }
        return included->empty() || matches_any(*included, name);
    };
}

FilterPair build_filters(const FilterSets& sets) {
    FilterPair pair;
    pair.dir_filter = make_name_predicate(sets.ignore_dirs, sets.include_dirs);
    pair.file_filter = make_name_predicate(sets.ignore_files, sets.include_files);
    return pair;
}

FilterPair allow_all_filters() {
    auto allow = [](std::string_view) { return true; };
    return FilterPair{allow, allow};
}

std::vector<std::string> parse_name_list(const std::vector<std::string>& args) {
    if (args.empty()) {
        return {};
    }
    if (args.size() == 1 && string_utils::trim(args.front()).starts_with('[')) {
        return parse_bracketed(args.front());
    }
    return args;
}

} // namespace filetree
