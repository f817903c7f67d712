#pragma once

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>

#include "filetree/config.h"
#include "filetree/filters.h"
#include "filetree/output.h"
#include "filetree/sort.h"
#include "filetree/style.h"
#include "filetree/tree_builder.h"

namespace filetree {

// Programmatic entry point: owns a configuration and the state derived from
// it, and runs traversal, assembly and output in one call.
class TreeDisplay {
public:
    explicit TreeDisplay(Config::Options options, std::ostream& out);
    TreeDisplay(Config::Options options, std::ostream& out, std::shared_ptr<const DirectoryLister> lister);

    // Replaces the configuration and rebuilds styles, filters and sort order.
    void reconfigure(Config::Options options);

    // Rebuilds the filter pair from the current ignore/include lists.
    void update_predicates();

    const Config::Options& options() const noexcept { return options_; }
    StyleRegistry& styles() noexcept { return styles_; }
    const FilterPair& filters() const noexcept { return filters_; }

    const StyleSpec& format_style() const;
    NameOrder resolve_order() const;

    TraversalOptions traversal_options() const;
    TreeWalker build_tree(const std::filesystem::path& path, std::string prefix = {}) const;

    // Assembled text, or an empty string in streaming mode.
    std::string display();

    const EntryCount& last_count() const noexcept { return last_count_; }

private:
    void validate() const;
    std::filesystem::path checked_root() const;
    void finish(const std::filesystem::path& root, const std::string& text);

    Config::Options options_;
    std::ostream& out_;
    TreeBuilder builder_;
    StyleRegistry styles_;
    FilterPair filters_;
    EntryCount last_count_{};
};

} // namespace filetree
