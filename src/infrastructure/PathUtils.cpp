#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace kelvin::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetKelvinDir() {
    return GetConfigHome() / "kelvin";
}

fs::path PathUtils::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return fs::path(path);
    }
    // Only "~" and "~/..." are expanded; "~user" is left alone.
    if (path.size() > 1 && path[1] != '/') {
        return fs::path(path);
    }
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        return fs::path(path);
    }
    if (path.size() == 1) {
        return fs::path(home);
    }
    return fs::path(home) / path.substr(2);
}

} // namespace kelvin::infrastructure
