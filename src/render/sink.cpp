#include "filetree/sink.h"

#include <cerrno>
#include <fstream>
#include <ostream>
#include <string>

#include "filetree/logger.h"

namespace filetree::sink {

void print(std::ostream& out, std::string_view text) {
    out << text << '\n';
    out.flush();
}

std::error_code save(const std::filesystem::path& path, std::string_view text) {
    std::ofstream file{path, std::ios::binary | std::ios::trunc};
    if (!file) {
        const int err = errno != 0 ? errno : EIO;
        return std::error_code{err, std::generic_category()};
    }
    file.write(text.data(), static_cast<std::streamsize>(text.size()));
    file.put('\n');
    file.flush();
    if (!file) {
        return std::make_error_code(std::errc::io_error);
    }
    Logger::instance().info("saved {} bytes to {}", text.size() + 1, path.string());
    return {};
}

std::filesystem::path default_output_path(const std::filesystem::path& root) {
    std::error_code ec;
    auto absolute = std::filesystem::weakly_canonical(std::filesystem::absolute(root, ec), ec);
    if (ec) {
        absolute = root;
    }
    if (!absolute.has_filename()) {
        absolute = absolute.parent_path();
    }
    std::string name = absolute.filename().string();
    name += kDefaultSuffix;
    return absolute.parent_path() / name;
}

} // namespace filetree::sink
