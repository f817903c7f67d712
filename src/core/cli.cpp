#include "filetree/cli.h"
#include "filetree/cli_formatter.h"

#include <sstream>
#include <string_view>

#include "filetree/config_file.h"
#include "filetree/filters.h"
#include "filetree/logger.h"
#include "filetree/version.h"

namespace filetree {

namespace {
constexpr std::string_view kDescription =
    "filetree - display a filtered, sorted directory tree.\n"
    "Each of the ignore/include options accepts either space-separated names "
    "or a single bracketed list such as \"['.git', '.idea']\".";
}

Cli::Cli()
    : app_{std::make_unique<CLI::App>(std::string{kDescription}, "filetree")} {
    app_->formatter(std::make_shared<ColorFormatter>());
    app_->set_version_flag("-v,--version", std::string{Version::String()});
    app_->footer(R"(Command-line options override values from --cfg; options left at their
defaults do not. Custom sort functions are available only through the library API.

Exit status:
 0  if OK,
 1  if the tree could not be produced (invalid root, configuration or output),
 2+ if the command line could not be parsed.)");

    add_input_options();
    add_filter_options();
    add_sort_options();
    add_layout_options();
    add_output_options();
    add_diagnostic_options();
}

Cli::~Cli() = default;

void Cli::add_input_options() {
    auto* cfg = app_->add_option_function<std::string>(
        "--cfg", [&](const std::string& value) { options_.config_file = value; }, "Path to JSON config file");
    cfg->type_name("FILE");
    document_option(cfg);

    auto* root = app_->add_option("-r,--root-dir", options_.root_dir, "Root directory to display");
    root->type_name("DIR");
    overrides(root, &Config::Options::root_dir);
    document_option(root);
}

void Cli::add_filter_options() {
    auto filtering = app_->add_option_group("Filtering");

    auto add_list = [&](const std::string& flags, std::vector<std::string>& target, const std::string& description,
                        std::vector<std::string> Config::Options::*field) {
        auto* option = filtering->add_option(flags, target, description);
        option->expected(0, -1);
        option->type_name("NAME");
        overrides(option, field);
        document_option(option);
    };

    add_list("--ignore-dirs", ignore_dirs_, "Directories to ignore", &Config::Options::ignore_dirs);
    add_list("--ignore-files", ignore_files_, "Files to ignore", &Config::Options::ignore_files);
    add_list("--include-dirs", include_dirs_, "Directories to include", &Config::Options::include_dirs);
    add_list("--include-files", include_files_, "Files to include", &Config::Options::include_files);
}

void Cli::add_sort_options() {
    auto sorting = app_->add_option_group("Sorting");

    auto* files_first = sorting->add_flag("-f,--files-first", options_.files_first, "List files before directories");
    overrides(files_first, &Config::Options::files_first);
    document_option(files_first);

    auto* skip = sorting->add_flag("--skip-sorting", options_.skip_sorting, "Disable sorting");
    overrides(skip, &Config::Options::skip_sorting);
    document_option(skip);

    auto* sort_key = sorting->add_option("--sort-key", options_.sort_key, "Sort key for entry names");
    sort_key->check(CLI::IsMember({"natural", "lex"}));
    sort_key->capture_default_str();
    overrides(sort_key, &Config::Options::sort_key);
    document_option(sort_key);

    auto* reverse = sorting->add_flag("--reverse", options_.reverse, "Reverse sort order");
    overrides(reverse, &Config::Options::reverse);
    document_option(reverse);
}

void Cli::add_layout_options() {
    auto layout = app_->add_option_group("Layout");

    auto* style = layout->add_option("-s,--style", options_.style, "Tree connector style");
    style->check(CLI::IsMember({"classic", "dash", "arrow", "plus"}));
    style->capture_default_str();
    overrides(style, &Config::Options::style);
    document_option(style);

    auto* indent = layout->add_option("-i,--indent", options_.indent, "Indent width per level");
    indent->check(CLI::Range(StyleRegistry::kMinIndent, StyleRegistry::kMaxIndent));
    indent->capture_default_str();
    overrides(indent, &Config::Options::indent);
    document_option(indent);

    auto* depth = layout->add_option("--max-depth", options_.max_depth, "Limit the number of levels shown");
    depth->check(CLI::Range(std::size_t{1}, std::size_t{4096}));
    overrides(depth, &Config::Options::max_depth);
    document_option(depth);

    auto* follow = layout->add_flag("--follow-symlinks", options_.follow_symlinks,
                                    "Descend into symbolic links to directories");
    overrides(follow, &Config::Options::follow_symlinks);
    document_option(follow);
}

void Cli::add_output_options() {
    auto output = app_->add_option_group("Output");

    auto* filepath = output->add_option_function<std::string>(
        "-o,--filepath", [&](const std::string& value) { options_.filepath = std::filesystem::path{value}; },
        "Output file path");
    filepath->type_name("FILE");
    overrides(filepath, &Config::Options::filepath);
    document_option(filepath);

    auto* no_save = output->add_flag_callback("--no-save", [&]() { options_.save_to_file = false; },
                                              "Do not save to file");
    overrides(no_save, &Config::Options::save_to_file);
    document_option(no_save);

    auto* printout = output->add_flag("-p,--printout", options_.printout, "Print tree to stdout");
    overrides(printout, &Config::Options::printout);
    document_option(printout);

    auto* stream = output->add_flag("--stream", options_.stream_output, "Print lines as they are produced");
    overrides(stream, &Config::Options::stream_output);
    document_option(stream);

    auto* count = output->add_flag("-c,--count", options_.entry_count, "Report directory and file counts");
    overrides(count, &Config::Options::entry_count);
    document_option(count);
}

void Cli::add_diagnostic_options() {
    auto diagnostics = app_->add_option_group("Diagnostics");

    auto* level = diagnostics->add_option("--log-level", options_.log_level, "Set log verbosity");
    level->check(CLI::IsMember({"error", "warn", "warning", "info", "debug", "trace"}));
    level->type_name("LEVEL");
    level->capture_default_str();
    document_option(level);

    auto* log_file = diagnostics->add_option_function<std::string>(
        "--log-file", [&](const std::string& value) { options_.log_file = value; }, "Write log records to FILE");
    log_file->type_name("FILE");
    document_option(log_file);

    auto* dump = diagnostics->add_flag("--dump-markdown", options_.dump_markdown,
                                       "Print CLI options as markdown and exit");
    dump->configurable(false);
    document_option(dump);
}

Config::Options Cli::parse(int argc, const char* const* argv) {
    options_ = Config::Options{};
    ignore_dirs_.clear();
    ignore_files_.clear();
    include_dirs_.clear();
    include_files_.clear();

    app_->parse(argc, argv);

    options_.ignore_dirs = parse_name_list(ignore_dirs_);
    options_.ignore_files = parse_name_list(ignore_files_);
    options_.include_dirs = parse_name_list(include_dirs_);
    options_.include_files = parse_name_list(include_files_);

    return resolve();
}

Config::Options Cli::resolve() const {
    if (!options_.config_file) {
        return options_;
    }

    Config::Options merged{};
    config_file::apply_file(*options_.config_file, merged);
    for (const auto& entry : overrides_) {
        if (entry.option->count() > 0) {
            entry.copy(merged, options_);
        }
    }
    merged.config_file = options_.config_file;
    merged.log_level = options_.log_level;
    merged.log_file = options_.log_file;
    merged.dump_markdown = options_.dump_markdown;
    return merged;
}

int Cli::exit(const CLI::Error& error) const {
    return app_->exit(error);
}

std::string Cli::usage_markdown() const {
    std::ostringstream out;
    out << "### Command line options\n\n";
    out << "| Option | Description | Default |\n";
    out << "| ------ | ----------- | ------- |\n";
    for (const auto& doc : docs_) {
        out << "| `" << doc.name << "` | " << doc.description << " | " << doc.default_value << " |\n";
    }
    out << '\n';
    return out.str();
}

} // namespace filetree
