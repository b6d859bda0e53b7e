#pragma once
#include <string>

// 仅依据文件大小和修改时间判断目标文件是否已是源文件的最新副本。
// 不做内容哈希：大小相同且时间接近的两个文件被视为相同。
class ChangeDetector {
public:
    static constexpr double DEFAULT_TOLERANCE_SECONDS = 1.0;

    // 目标存在、大小一致且修改时间差不超过 toleranceSeconds 时返回 true。
    // 任一文件无法 stat 时返回 false（视为已变化），从不抛出。
    static bool isUnchanged(const std::string& sourceFile, const std::string& destinationFile,
                            double toleranceSeconds = DEFAULT_TOLERANCE_SECONDS);
};
