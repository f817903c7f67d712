#pragma once

#include <CLI/CLI.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "filetree/config.h"

namespace filetree {

class Cli {
public:
    Cli();
    ~Cli();

    // Throws CLI::ParseError (including help/version requests) and
    // filetree::Error for malformed lists or an unreadable config file.
    Config::Options parse(int argc, const char* const* argv);

    // Prints the message for a parse error and returns the exit status.
    int exit(const CLI::Error& error) const;

    std::string usage_markdown() const;

private:
    struct OptionDoc {
        std::string name;
        std::string description;
        std::string default_value;
    };

    // Copies the value of one option from the command line into a
    // configuration loaded from file, if the option was given explicitly.
    struct Override {
        const CLI::Option* option = nullptr;
        std::function<void(Config::Options& target, const Config::Options& source)> copy;
    };

    template <typename OptionPtr>
    void document_option(const OptionPtr& option);

    template <typename Field>
    void overrides(const CLI::Option* option, Field Config::Options::*field);

    void add_input_options();
    void add_filter_options();
    void add_sort_options();
    void add_layout_options();
    void add_output_options();
    void add_diagnostic_options();

    Config::Options resolve() const;

    std::unique_ptr<CLI::App> app_;
    Config::Options options_{};
    std::vector<std::string> ignore_dirs_;
    std::vector<std::string> ignore_files_;
    std::vector<std::string> include_dirs_;
    std::vector<std::string> include_files_;
    std::vector<OptionDoc> docs_;
    std::vector<Override> overrides_;
};

} // namespace filetree

#include "filetree/cli.tpp"
