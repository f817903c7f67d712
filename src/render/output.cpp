#include "filetree/output.h"

#include <format>
#include <initializer_list>
#include <ostream>

namespace filetree {
namespace {

// True when `head` is nothing but space and vertical pieces of `style`.
bool is_indent(std::string_view head, const StyleSpec& style) {
    while (!head.empty()) {
        if (!style.vertical.empty() && head.starts_with(style.vertical)) {
            head.remove_prefix(style.vertical.size());
        } else if (!style.space.empty() && head.starts_with(style.space)) {
            head.remove_prefix(style.space.size());
        } else {
            return false;
        }
    }
    return true;
}

// "<indent><end><marker>"; a file whose name merely ends in a marker has
// its own text between the connector and the marker.
bool is_sentinel(std::string_view line, const StyleSpec& style) {
    for (std::string_view marker : {kPermissionDeniedMarker, kReadErrorMarker}) {
        if (!line.ends_with(marker)) {
            continue;
        }
        auto head = line.substr(0, line.size() - marker.size());
        if (!head.ends_with(style.end)) {
            return false;
        }
        head.remove_suffix(style.end.size());
        return is_indent(head, style);
    }
    return false;
}

} // namespace

std::string root_label(const std::filesystem::path& root) {
    auto name = root.filename();
    if (name.empty() || name == "." || name == "..") {
        std::error_code ec;
        auto absolute = std::filesystem::weakly_canonical(std::filesystem::absolute(root, ec), ec);
        if (!ec) {
            auto trimmed = absolute.has_filename() ? absolute : absolute.parent_path();
            name = trimmed.filename();
        }
    }
    std::string label = name.string();
    label += kDirectorySuffix;
    return label;
}

EntryCount count_entries(std::string_view text, const StyleSpec& style) {
    EntryCount count;
    bool first = true;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        auto end = text.find('\n', pos);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        auto line = text.substr(pos, end - pos);
        if (first) {
            first = false;
        } else if (!line.empty()) {
            if (line.back() == kDirectorySuffix) {
                ++count.directories;
            } else if (is_sentinel(line, style)) {
                ++count.errors;
            } else {
                ++count.files;
            }
        }
        pos = end + 1;
    }
    return count;
}

std::string format_entry_count(const EntryCount& count) {
    auto out = std::format("{} {}, {} {}", count.directories, count.directories == 1 ? "directory" : "directories",
                           count.files, count.files == 1 ? "file" : "files");
    if (count.errors > 0) {
        out += std::format(", {} unreadable", count.errors);
    }
    return out;
}

std::string OutputAssembler::assemble(TreeWalker& walker, std::string_view root_label) {
    std::string text{root_label};
    for (const auto& line : walker) {
        text += '\n';
        text += line;
    }
    return text;
}

std::string OutputAssembler::stream(TreeWalker& walker, std::string_view root_label, std::ostream& out) {
    out << root_label << '\n';
    for (const auto& line : walker) {
        out << line << '\n';
    }
    out.flush();
    return {};
}

} // namespace filetree
