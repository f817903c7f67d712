#pragma once

#include <string_view>

#ifndef FILETREE_VERSION_MAJOR
#define FILETREE_VERSION_MAJOR 0
#endif

#ifndef FILETREE_VERSION_MINOR
#define FILETREE_VERSION_MINOR 0
#endif

#ifndef FILETREE_VERSION_PATCH
#define FILETREE_VERSION_PATCH 0
#endif

#ifndef FILETREE_VERSION_STRING
#define FILETREE_VERSION_STRING "0.0.0"
#endif

namespace filetree {

class Version {
public:
    static constexpr int Major() noexcept { return FILETREE_VERSION_MAJOR; }
    static constexpr int Minor() noexcept { return FILETREE_VERSION_MINOR; }
    static constexpr int Patch() noexcept { return FILETREE_VERSION_PATCH; }

    static constexpr std::string_view String() noexcept { return std::string_view{FILETREE_VERSION_STRING}; }
};

} // namespace filetree
