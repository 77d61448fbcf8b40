#pragma once

#include <string>
#include <filesystem>

namespace regimegate {
namespace utils {

class PathUtils {
public:
    // 실행 파일의 디렉토리 경로 반환
    static std::filesystem::path getExecutableDir();

    // Relative paths resolve against the working directory when the target
    // exists there, otherwise against the executable directory.
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace regimegate
