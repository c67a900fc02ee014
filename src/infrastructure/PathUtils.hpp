// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace kelvin::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetKelvinDir();
    static std::filesystem::path ExpandTilde(const std::string& path);
};

} // namespace kelvin::infrastructure
