// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace dropkeeper::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetDefaultConfigPath();
    static std::filesystem::path Resolve(const std::filesystem::path& base, const std::string& path);
    static bool IsHiddenName(const std::string& filename);
    static std::string LowerExtension(const std::filesystem::path& path);
};

} // namespace dropkeeper::infrastructure
