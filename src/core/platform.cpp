#include "gitwip/platform.h"

#include <cstdlib>

#ifndef _WIN32
#include <pwd.h>
#include <unistd.h>
#endif

namespace gitwip::platform {

std::optional<std::string> environment_value(std::string_view name) {
    const std::string key{name};
    if (const char* value = std::getenv(key.c_str())) {
        if (*value != '\0') {
            return std::string{value};
        }
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> home_directory() {
#ifdef _WIN32
    if (auto profile = environment_value("USERPROFILE")) {
        return std::filesystem::path{*profile};
    }
    return std::nullopt;
#else
    if (auto home = environment_value("HOME")) {
        return std::filesystem::path{*home};
    }
    if (auto* pw = ::getpwuid(::getuid())) {
        if (pw->pw_dir != nullptr && *pw->pw_dir != '\0') {
            return std::filesystem::path{pw->pw_dir};
        }
    }
    return std::nullopt;
#endif
}

std::vector<std::filesystem::path> default_excluded_paths(const std::filesystem::path& home) {
    std::vector<std::filesystem::path> paths{
        home / ".Trash",
        home / ".cache",
        home / ".local" / "share" / "Trash",
    };
#if defined(__APPLE__)
    for (const char* name : {"Library", "Music", "Movies", "Pictures", "Applications"}) {
        paths.push_back(home / name);
    }
#elif defined(_WIN32)
    paths.push_back(home / "AppData");
#endif
    return paths;
}

} // namespace gitwip::platform
