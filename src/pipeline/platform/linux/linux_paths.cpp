#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace platform {

namespace {

constexpr const char* kAppDir = "callscribe";

// XDG base directories must be absolute; empty or relative values are ignored.
const char* xdg_base(const char* var) {
    const char* value = std::getenv(var);
    if (!value || value[0] != '/') return nullptr;
    return value;
}

std::string home_dir() {
    const char* home = std::getenv("HOME");
    if (home && home[0] == '/') return home;
    // Services started without a login environment still have a passwd entry.
    if (const passwd* pw = getpwuid(getuid()); pw && pw->pw_dir && pw->pw_dir[0] == '/') {
        return pw->pw_dir;
    }
    return {};
}

std::string app_dir(const char* var, const char* home_suffix) {
    if (const char* base = xdg_base(var)) return std::string(base) + "/" + kAppDir;
    auto home = home_dir();
    if (home.empty()) return {};
    return home + home_suffix + "/" + kAppDir;
}

} // namespace

std::string config_dir() {
    return app_dir("XDG_CONFIG_HOME", "/.config");
}

std::string data_dir() {
    return app_dir("XDG_DATA_HOME", "/.local/share");
}

} // namespace platform
