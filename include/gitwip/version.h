#pragma once

#include <string_view>

#ifndef GITWIP_VERSION_STRING
#define GITWIP_VERSION_STRING "0.0"
#endif

namespace gitwip {

class Version {
public:
    static constexpr std::string_view String() noexcept { return std::string_view{GITWIP_VERSION_STRING}; }
};

} // namespace gitwip
