#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>

#include "filetree/style.h"
#include "filetree/tree_builder.h"

namespace filetree {

// "<name>/" for the directory at `root`. Paths like "." or "dir/" resolve
// to the name of the absolute directory.
std::string root_label(const std::filesystem::path& root);

// Counts as derived from text rendered with `style`: directory lines end
// with the suffix, sentinel lines are errors, everything else is a file.
// A last-child file literally named like a marker is indistinguishable
// from a sentinel and counts as one; TreeWalker::count() is exact.
EntryCount count_entries(std::string_view text, const StyleSpec& style);

std::string format_entry_count(const EntryCount& count);

class OutputAssembler {
public:
    // Root label, then every tree line, joined by '\n' without a trailing break.
    static std::string assemble(TreeWalker& walker, std::string_view root_label);

    // Prints the root label and each line as soon as the walker produces it.
    // Returns an empty string; nothing is kept for persistence.
    static std::string stream(TreeWalker& walker, std::string_view root_label, std::ostream& out);
};

} // namespace filetree
