#include "filetree/tree_display.h"

#include <format>
#include <ostream>
#include <utility>

#include "filetree/errors.h"
#include "filetree/logger.h"
#include "filetree/perf.h"
#include "filetree/sink.h"

namespace filetree {
namespace {

// Lists arrive already resolved; bracketed syntax is handled where the
// text enters (Cli, config_file), so a name like "[draft].md" is literal here.
std::set<std::string> to_set(const std::vector<std::string>& names) {
    return {names.begin(), names.end()};
}

} // namespace

TreeDisplay::TreeDisplay(Config::Options options, std::ostream& out)
    : TreeDisplay(std::move(options), out, std::make_shared<FilesystemLister>()) {}

TreeDisplay::TreeDisplay(Config::Options options, std::ostream& out, std::shared_ptr<const DirectoryLister> lister)
    : options_{std::move(options)}, out_{out}, builder_{std::move(lister)}, styles_{options_.indent} {
    update_predicates();
    validate();
}

void TreeDisplay::reconfigure(Config::Options options) {
    options_ = std::move(options);
    styles_.set_indent(options_.indent);
    update_predicates();
    validate();
}

void TreeDisplay::update_predicates() {
    FilterSets sets;
    sets.ignore_dirs = to_set(options_.ignore_dirs);
    sets.ignore_files = to_set(options_.ignore_files);
    sets.include_dirs = to_set(options_.include_dirs);
    sets.include_files = to_set(options_.include_files);
    filters_ = build_filters(sets);
}

const StyleSpec& TreeDisplay::format_style() const {
    return styles_.resolve(options_.style);
}

NameOrder TreeDisplay::resolve_order() const {
    return SortResolver::resolve(options_.sort_key, options_.custom_sort);
}

void TreeDisplay::validate() const {
    (void)format_style();
    (void)resolve_order();
}

TraversalOptions TreeDisplay::traversal_options() const {
    TraversalOptions traversal;
    traversal.style = format_style();
    traversal.order = resolve_order();
    traversal.filters = filters_;
    traversal.files_first = options_.files_first;
    traversal.reverse = options_.reverse;
    traversal.skip_sorting = options_.skip_sorting;
    traversal.follow_symlinks = options_.follow_symlinks;
    traversal.max_depth = options_.max_depth;
    return traversal;
}

TreeWalker TreeDisplay::build_tree(const std::filesystem::path& path, std::string prefix) const {
    return builder_.build(path, std::move(prefix), traversal_options());
}

std::filesystem::path TreeDisplay::checked_root() const {
    std::filesystem::path root = options_.root_dir.empty() ? std::filesystem::current_path() : options_.root_dir;
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        throw InvalidRoot(std::format("The path '{}' is not a directory.", root.string()));
    }
    return root;
}

std::string TreeDisplay::display() {
    // Everything that can fail on configuration fails here, before output.
    const auto traversal = traversal_options();
    const auto root = checked_root();
    Logger::instance().debug("{}", Config::describe(options_));

    perf::ScopedTimer timer{std::format("tree for {}", root.string())};
    const std::string label = root_label(root);
    auto walker = builder_.build(root, {}, traversal);

    if (options_.stream_output) {
        OutputAssembler::stream(walker, label, out_);
        last_count_ = walker.count();
        if (options_.save_to_file) {
            Logger::instance().info("streaming mode: tree not saved");
        }
        if (options_.entry_count) {
            sink::print(out_, format_entry_count(last_count_));
        }
        return {};
    }

    std::string text;
    {
        perf::ScopedTimer assemble_timer{"assemble"};
        text = OutputAssembler::assemble(walker, label);
    }
    last_count_ = walker.count();
    finish(root, text);
    return text;
}

void TreeDisplay::finish(const std::filesystem::path& root, const std::string& text) {
    if (options_.save_to_file) {
        const auto destination = options_.filepath ? *options_.filepath : sink::default_output_path(root);
        perf::ScopedTimer timer{"save"};
        if (auto ec = sink::save(destination, text)) {
            throw OutputError(std::format("cannot write '{}': {}", destination.string(), ec.message()));
        }
    }
    if (options_.printout) {
        sink::print(out_, text);
    }
    if (options_.entry_count) {
        sink::print(out_, format_entry_count(last_count_));
    }
}

} // namespace filetree
