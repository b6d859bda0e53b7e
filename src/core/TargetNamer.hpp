#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include "../utils/HostEnvironment.hpp"

namespace fs = std::filesystem;

// 生成每次运行唯一的输出位置：
//   <destRoot>/EliteDangerousBackup_<machine>_<YYYYMMDD_HHMMSS>[.zip]
class TargetNamer {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static const char* const PREFIX;
    static const char* const UNKNOWN_MACHINE;
    static const char* const ARCHIVE_EXTENSION;

    explicit TargetNamer(const HostEnvironment& host, Clock clock = &std::chrono::system_clock::now);

    // 主机名，不可用时返回 UNKNOWN_MACHINE
    std::string machineId() const;

    // 仅计算路径，不触碰文件系统
    fs::path makeTargetPath(const fs::path& destRoot, bool archiveMode,
                            std::chrono::system_clock::time_point startTime) const;

    // 以当前时钟计算路径；镜像模式下同时创建目录，失败抛出 std::runtime_error
    fs::path createTarget(const fs::path& destRoot, bool archiveMode) const;

    // 本地时间 YYYYMMDD_HHMMSS
    static std::string formatTimestamp(std::chrono::system_clock::time_point time);

    std::chrono::system_clock::time_point now() const;

private:
    std::string machineName;
    Clock clock;
};
