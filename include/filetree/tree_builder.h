#pragma once

#include <cstddef>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "filetree/filters.h"
#include "filetree/sort.h"
#include "filetree/style.h"

namespace filetree {

inline constexpr std::string_view kPermissionDeniedMarker = "[Permission Denied]";
inline constexpr std::string_view kReadErrorMarker = "[Error reading directory]";
inline constexpr char kDirectorySuffix = '/';

enum class EntryKind {
    Directory,
    File,
    Unreadable
};

// One child as reported by a directory listing.
struct ListedEntry {
    std::string name;
    std::filesystem::path path;
    EntryKind kind = EntryKind::File;
    bool is_symlink = false;
};

class DirectoryLister {
public:
    virtual ~DirectoryLister() = default;

    // Returns the children of `dir` in listing order. On failure `ec` is set
    // and the returned vector is empty.
    virtual std::vector<ListedEntry> list(const std::filesystem::path& dir, std::error_code& ec) const = 0;
};

class FilesystemLister final : public DirectoryLister {
public:
    std::vector<ListedEntry> list(const std::filesystem::path& dir, std::error_code& ec) const override;
};

struct EntryCount {
    std::size_t directories = 0;
    std::size_t files = 0;
    std::size_t errors = 0;

    std::size_t lines() const noexcept { return directories + files + errors; }
    bool operator==(const EntryCount&) const = default;
};

struct TraversalOptions {
    StyleSpec style;
    NameOrder order;
    FilterPair filters;
    bool files_first = false;
    bool reverse = false;
    bool skip_sorting = false;
    bool follow_symlinks = false;
    std::optional<std::size_t> max_depth;
};

// A rendered line plus where it sits in the tree. Sentinel lines for
// unreadable directories carry EntryKind::Unreadable.
struct TreeLine {
    std::string text;
    std::string name;
    EntryKind kind = EntryKind::File;
    std::size_t depth = 0;
    std::size_t position = 0;
    std::size_t siblings = 0;

    bool last_sibling() const noexcept { return position + 1 == siblings; }
};

// Lazy depth-first pre-order traversal. Each call to next() produces at
// most one line and lists at most one directory; the walker is single-pass.
class TreeWalker {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        iterator() = default;
        explicit iterator(TreeWalker* walker)
            : walker_{walker} {
            advance();
        }

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        iterator& operator++() {
            advance();
            return *this;
        }
        void operator++(int) { advance(); }

        friend bool operator==(const iterator& it, std::default_sentinel_t) noexcept { return it.walker_ == nullptr; }

    private:
        void advance();

        TreeWalker* walker_ = nullptr;
        std::string current_;
    };

    TreeWalker(std::filesystem::path root, std::string prefix, TraversalOptions options,
               std::shared_ptr<const DirectoryLister> lister);

    TreeWalker(TreeWalker&&) noexcept = default;
    TreeWalker& operator=(TreeWalker&&) noexcept = default;
    TreeWalker(const TreeWalker&) = delete;
    TreeWalker& operator=(const TreeWalker&) = delete;

    std::optional<TreeLine> next_line();
    std::optional<std::string> next();

    iterator begin() { return iterator{this}; }
    std::default_sentinel_t end() const noexcept { return {}; }

    const EntryCount& count() const noexcept { return count_; }
    bool finished() const noexcept { return started_ && stack_.empty() && !pending_; }

private:
    struct Frame {
        std::vector<ListedEntry> children;
        std::size_t index = 0;
        std::string prefix;
        std::size_t depth = 0;
        std::filesystem::path canonical;
    };

    struct Descent {
        std::filesystem::path dir;
        std::string prefix;
        std::size_t depth = 0;
    };

    std::optional<TreeLine> open(Descent descent);
    std::vector<ListedEntry> arrange(std::vector<ListedEntry> listed) const;
    bool should_descend(const ListedEntry& entry, const Frame& frame) const;
    bool on_current_path(const std::filesystem::path& canonical) const;

    std::filesystem::path root_;
    std::string root_prefix_;
    TraversalOptions options_;
    std::shared_ptr<const DirectoryLister> lister_;

    std::vector<Frame> stack_;
    std::optional<Descent> pending_;
    bool started_ = false;
    EntryCount count_{};
};

class TreeBuilder {
public:
    TreeBuilder();
    explicit TreeBuilder(std::shared_ptr<const DirectoryLister> lister);

    // The walker captures `options` by value; later changes to the caller's
    // filters or style do not reach it.
    TreeWalker build(std::filesystem::path path, std::string prefix, TraversalOptions options) const;

private:
    std::shared_ptr<const DirectoryLister> lister_;
};

} // namespace filetree
