#include "ChangeDetector.hpp"
#include <chrono>
#include <cmath>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

bool ChangeDetector::isUnchanged(const std::string& sourceFile, const std::string& destinationFile,
                                 double toleranceSeconds) {
    std::error_code ec;
    if (!fs::exists(destinationFile, ec) || ec) {
        return false;
    }

    auto sourceSize = fs::file_size(sourceFile, ec);
    if (ec) {
        return false;
    }
    auto destSize = fs::file_size(destinationFile, ec);
    if (ec || sourceSize != destSize) {
        return false;
    }

    auto sourceTime = fs::last_write_time(sourceFile, ec);
    if (ec) {
        return false;
    }
    auto destTime = fs::last_write_time(destinationFile, ec);
    if (ec) {
        return false;
    }

    // 不同文件系统的时间精度不同（FAT 为 2 秒，NTFS 为 100 纳秒），因此允许一定误差
    std::chrono::duration<double> diff = sourceTime - destTime;
    return std::fabs(diff.count()) <= toleranceSeconds;
}
