#include "test_support.h"

#include <atomic>
#include <chrono>
#include <fstream>
#include <string>

#include "filetree/filters.h"
#include "filetree/sort.h"
#include "filetree/style.h"

namespace filetree::test {

TempDir::TempDir() {
    static std::atomic<unsigned> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    base_ = std::filesystem::temp_directory_path() /
            ("filetree-test-" + std::to_string(stamp) + "-" + std::to_string(counter++));
    std::filesystem::create_directories(base_ / "project");
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(base_, ec);
}

std::filesystem::path TempDir::make_dir(const std::filesystem::path& relative) const {
    auto path = root() / relative;
    std::filesystem::create_directories(path);
    return path;
}

std::filesystem::path TempDir::make_file(const std::filesystem::path& relative, std::string_view content) const {
    auto path = root() / relative;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream file{path, std::ios::binary};
    file << content;
    return path;
}

void FakeLister::add(const std::filesystem::path& dir, std::vector<std::pair<std::string, EntryKind>> children) {
    auto& listing = listings_[dir.generic_string()];
    for (auto& [name, kind] : children) {
        ListedEntry entry;
        entry.path = dir / name;
        entry.name = std::move(name);
        entry.kind = kind;
        listing.push_back(std::move(entry));
    }
}

void FakeLister::add_link(const std::filesystem::path& dir, std::string name) {
    ListedEntry entry;
    entry.path = dir / name;
    entry.name = std::move(name);
    entry.kind = EntryKind::Directory;
    entry.is_symlink = true;
    listings_[dir.generic_string()].push_back(std::move(entry));
}

void FakeLister::fail(const std::filesystem::path& dir, std::errc error) {
    failures_[dir.generic_string()] = error;
}

std::vector<ListedEntry> FakeLister::list(const std::filesystem::path& dir, std::error_code& ec) const {
    const auto key = dir.generic_string();
    calls_.push_back(key);
    ec.clear();
    if (auto failure = failures_.find(key); failure != failures_.end()) {
        ec = std::make_error_code(failure->second);
        return {};
    }
    if (auto listing = listings_.find(key); listing != listings_.end()) {
        return listing->second;
    }
    return {};
}

std::shared_ptr<FakeLister> sample_lister() {
    auto lister = std::make_shared<FakeLister>();
    lister->add("/r", {{"b", EntryKind::Directory},
                       {"a.txt", EntryKind::File},
                       {"d", EntryKind::Directory},
                       {"c.txt", EntryKind::File}});
    lister->add("/r/b", {{"x.txt", EntryKind::File}});
    return lister;
}

TraversalOptions default_traversal() {
    TraversalOptions options;
    options.style = StyleRegistry{}.resolve("classic");
    options.order = natural_less;
    options.filters = allow_all_filters();
    return options;
}

std::vector<std::string> collect(TreeWalker& walker) {
    std::vector<std::string> lines;
    for (const auto& line : walker) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace filetree::test
