#include "infrastructure/PathUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace dropkeeper::infrastructure {

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

fs::path PathUtils::GetDefaultConfigPath() {
    const char* explicitPath = std::getenv("DROPKEEPER_CONFIG");
    if (explicitPath && *explicitPath) {
        return fs::path(explicitPath);
    }
    return GetConfigHome() / "dropkeeper" / "config.json";
}

fs::path PathUtils::Resolve(const fs::path& base, const std::string& path) {
    fs::path p(path);
    fs::path resolved = p.is_absolute() ? p.lexically_normal() : (base / p).lexically_normal();
    // "dir/" normalizes to "dir/" with an empty filename; drop it so comparisons stay stable.
    if (resolved.has_parent_path() && resolved.filename().empty()) {
        resolved = resolved.parent_path();
    }
    return resolved;
}

bool PathUtils::IsHiddenName(const std::string& filename) {
    return !filename.empty() && filename.front() == '.';
}

std::string PathUtils::LowerExtension(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });
    return ext;
}

} // namespace dropkeeper::infrastructure
