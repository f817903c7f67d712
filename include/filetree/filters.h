#pragma once

#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace filetree {

using NamePredicate = std::function<bool(std::string_view name)>;

// Admit/deny decisions handed to the tree builder as one value.
struct FilterPair {
    NamePredicate dir_filter;
    NamePredicate file_filter;
};

struct FilterSets {
    std::set<std::string> ignore_dirs;
    std::set<std::string> ignore_files;
    std::set<std::string> include_dirs;
    std::set<std::string> include_files;
};

// A name passes when it matches no ignore entry and, if the include set is
// non-empty, matches at least one include entry. Entries may use * and ?.
NamePredicate make_name_predicate(std::set<std::string> ignore, std::set<std::string> include);

FilterPair build_filters(const FilterSets& sets);

FilterPair allow_all_filters();

// Accepts either plain items or a single bracketed list such as
// "['.git', \"build\"]". Throws InvalidFilterSyntax on a malformed list.
std::vector<std::string> parse_name_list(const std::vector<std::string>& args);

} // namespace filetree
