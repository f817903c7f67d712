#include "filetree/tree_builder.h"

#include <algorithm>
#include <utility>

#include "filetree/logger.h"

namespace filetree {
namespace {

bool is_permission_error(const std::error_code& ec) {
    return ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted;
}

std::filesystem::path canonical_or_self(const std::filesystem::path& path) {
    std::error_code ec;
    auto resolved = std::filesystem::weakly_canonical(path, ec);
    return ec ? path.lexically_normal() : resolved;
}

} // namespace

std::vector<ListedEntry> FilesystemLister::list(const std::filesystem::path& dir, std::error_code& ec) const {
    std::vector<ListedEntry> out;
    ec.clear();
    for (std::filesystem::directory_iterator it{dir, ec}; !ec && it != std::filesystem::directory_iterator{};
         it.increment(ec)) {
        const auto& entry = *it;
        ListedEntry listed;
        listed.path = entry.path();
        listed.name = entry.path().filename().string();

        std::error_code type_ec;
        listed.is_symlink = entry.is_symlink(type_ec);
        const bool is_dir = entry.is_directory(type_ec);
        if (type_ec) {
            Logger::instance().debug("cannot determine type of {}: {}", listed.path.string(), type_ec.message());
            listed.kind = EntryKind::File;
        } else {
            listed.kind = is_dir ? EntryKind::Directory : EntryKind::File;
        }
        out.push_back(std::move(listed));
    }
    if (ec) {
        out.clear();
    }
    return out;
}

void TreeWalker::iterator::advance() {
    if (walker_ == nullptr) {
        return;
    }
    if (auto line = walker_->next()) {
        current_ = std::move(*line);
    } else {
        walker_ = nullptr;
        current_.clear();
    }
}

TreeWalker::TreeWalker(std::filesystem::path root, std::string prefix, TraversalOptions options,
                       std::shared_ptr<const DirectoryLister> lister)
    : root_{std::move(root)},
      root_prefix_{std::move(prefix)},
      options_{std::move(options)},
      lister_{std::move(lister)} {}

std::optional<std::string> TreeWalker::next() {
    if (auto line = next_line()) {
        return std::move(line->text);
    }
    return std::nullopt;
}

std::optional<TreeLine> TreeWalker::next_line() {
    if (!started_) {
        started_ = true;
        pending_ = Descent{root_, root_prefix_, 0};
    }

    while (true) {
        if (pending_) {
            Descent descent = std::move(*pending_);
            pending_.reset();
            if (auto sentinel = open(std::move(descent))) {
                return sentinel;
            }
        }

        if (stack_.empty()) {
            return std::nullopt;
        }

        Frame& frame = stack_.back();
        if (frame.index >= frame.children.size()) {
            stack_.pop_back();
            continue;
        }

        const std::size_t position = frame.index++;
        const ListedEntry& entry = frame.children[position];
        const bool last = position + 1 == frame.children.size();
        const StyleSpec& style = options_.style;

        TreeLine line;
        line.name = entry.name;
        line.depth = frame.depth + 1;
        line.position = position;
        line.siblings = frame.children.size();
        line.text.reserve(frame.prefix.size() + style.branch.size() + entry.name.size() + 1);
        line.text += frame.prefix;
        line.text += last ? style.end : style.branch;
        line.text += entry.name;

        if (entry.kind == EntryKind::Directory) {
            line.kind = EntryKind::Directory;
            line.text += kDirectorySuffix;
            ++count_.directories;
            if (should_descend(entry, frame)) {
                pending_ = Descent{entry.path, frame.prefix + (last ? style.space : style.vertical), frame.depth + 1};
            }
        } else {
            line.kind = EntryKind::File;
            ++count_.files;
        }
        return line;
    }
}

std::optional<TreeLine> TreeWalker::open(Descent descent) {
    Logger::instance().trace("listing {}", descent.dir.string());

    std::error_code ec;
    auto listed = lister_->list(descent.dir, ec);
    if (ec) {
        const bool denied = is_permission_error(ec);
        Logger::instance().warn("cannot read directory {}: {}", descent.dir.string(), ec.message());
        ++count_.errors;

        TreeLine line;
        line.kind = EntryKind::Unreadable;
        line.name = std::string{denied ? kPermissionDeniedMarker : kReadErrorMarker};
        line.depth = descent.depth + 1;
        line.siblings = 1;
        line.text = descent.prefix + options_.style.end + line.name;
        return line;
    }

    Frame frame;
    frame.children = arrange(std::move(listed));
    frame.prefix = std::move(descent.prefix);
    frame.depth = descent.depth;
    if (options_.follow_symlinks) {
        frame.canonical = canonical_or_self(descent.dir);
    }
    stack_.push_back(std::move(frame));
    return std::nullopt;
}

std::vector<ListedEntry> TreeWalker::arrange(std::vector<ListedEntry> listed) const {
    std::vector<ListedEntry> dirs;
    std::vector<ListedEntry> files;
    for (auto& entry : listed) {
        if (entry.kind == EntryKind::Directory) {
            if (!options_.filters.dir_filter || options_.filters.dir_filter(entry.name)) {
                dirs.push_back(std::move(entry));
            }
        } else if (!options_.filters.file_filter || options_.filters.file_filter(entry.name)) {
            files.push_back(std::move(entry));
        }
    }

    if (!options_.skip_sorting && options_.order) {
        const auto by_name = [this](const ListedEntry& lhs, const ListedEntry& rhs) {
            return options_.order(lhs.name, rhs.name);
        };
        std::stable_sort(dirs.begin(), dirs.end(), by_name);
        std::stable_sort(files.begin(), files.end(), by_name);
        if (options_.reverse) {
            std::reverse(dirs.begin(), dirs.end());
            std::reverse(files.begin(), files.end());
        }
    }

    auto& first = options_.files_first ? files : dirs;
    auto& second = options_.files_first ? dirs : files;
    std::vector<ListedEntry> arranged;
    arranged.reserve(first.size() + second.size());
    std::move(first.begin(), first.end(), std::back_inserter(arranged));
    std::move(second.begin(), second.end(), std::back_inserter(arranged));
    return arranged;
}

bool TreeWalker::should_descend(const ListedEntry& entry, const Frame& frame) const {
    if (options_.max_depth && frame.depth + 1 >= *options_.max_depth) {
        return false;
    }
    if (!entry.is_symlink) {
        return true;
    }
    if (!options_.follow_symlinks) {
        return false;
    }
    if (on_current_path(canonical_or_self(entry.path))) {
        Logger::instance().info("not following {}: link cycle", entry.path.string());
        return false;
    }
    return true;
}

bool TreeWalker::on_current_path(const std::filesystem::path& canonical) const {
    return std::any_of(stack_.begin(), stack_.end(), [&](const Frame& frame) { return frame.canonical == canonical; });
}

TreeBuilder::TreeBuilder()
    : lister_{std::make_shared<FilesystemLister>()} {}

TreeBuilder::TreeBuilder(std::shared_ptr<const DirectoryLister> lister)
    : lister_{std::move(lister)} {}

TreeWalker TreeBuilder::build(std::filesystem::path path, std::string prefix, TraversalOptions options) const {
    return TreeWalker{std::move(path), std::move(prefix), std::move(options), lister_};
}

} // namespace filetree
