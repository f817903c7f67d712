#pragma once

namespace filetree {

template <typename OptionPtr>
void Cli::document_option(const OptionPtr& option) {
    OptionDoc doc;
    doc.name = option->get_name(false, true);
    doc.description = option->get_description();
    doc.default_value = option->get_default_str();
    docs_.push_back(std::move(doc));
}

template <typename Field>
void Cli::overrides(const CLI::Option* option, Field Config::Options::*field) {
    overrides_.push_back(Override{option, [field](Config::Options& target, const Config::Options& source) {
                                      target.*field = source.*field;
                                  }});
}

} // namespace filetree
