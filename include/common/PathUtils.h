#pragma once

#include <string>
#include <filesystem>

namespace portopt {
namespace utils {

class PathUtils {
public:
    // Directory of the running executable (falls back to the working directory)
    static std::filesystem::path getExecutableDir();

    // Resolve a path relative to the executable directory
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);

    // "data/portfolios/trades.csv" -> "trades"
    static std::string portfolioStem(const std::string& portfolio);
};

} // namespace utils
} // namespace portopt
