#pragma once

#include <string>
#include <filesystem>

namespace patterngate {
namespace utils {

class PathUtils {
public:
    // Directory holding the running executable
    static std::filesystem::path getExecutableDir();

    // Resolve a path relative to the executable directory
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace patterngate
