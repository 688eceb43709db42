#include "common/PathUtils.h"

#include <system_error>

namespace portopt {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    const auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe_path.empty()) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    return getExecutableDir() / relative_path;
}

std::string PathUtils::portfolioStem(const std::string& portfolio) {
    const std::string stem = std::filesystem::path(portfolio).stem().string();
    return stem.empty() ? "portfolio" : stem;
}

} // namespace utils
} // namespace portopt
