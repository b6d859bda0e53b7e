#include "TargetNamer.hpp"
#include "../utils/FileSystem.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

const char* const TargetNamer::PREFIX = "EliteDangerousBackup";
const char* const TargetNamer::UNKNOWN_MACHINE = "UNKNOWNPC";
const char* const TargetNamer::ARCHIVE_EXTENSION = ".zip";

TargetNamer::TargetNamer(const HostEnvironment& host, Clock clk)
    : machineName(host.machineName), clock(std::move(clk)) {
    if (!clock) {
        clock = &std::chrono::system_clock::now;
    }
}

std::string TargetNamer::machineId() const {
    return machineName.empty() ? std::string(UNKNOWN_MACHINE) : machineName;
}

std::string TargetNamer::formatTimestamp(std::chrono::system_clock::time_point time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm localTm{};
#ifdef _WIN32
    localtime_s(&localTm, &t);
#else
    localtime_r(&t, &localTm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&localTm, "%Y%m%d_%H%M%S");
    return oss.str();
}

std::chrono::system_clock::time_point TargetNamer::now() const {
    return clock();
}

fs::path TargetNamer::makeTargetPath(const fs::path& destRoot, bool archiveMode,
                                     std::chrono::system_clock::time_point startTime) const {
    std::string name = std::string(PREFIX) + "_" + machineId() + "_" + formatTimestamp(startTime);
    if (archiveMode) {
        name += ARCHIVE_EXTENSION;
    }
    return destRoot / name;
}

fs::path TargetNamer::createTarget(const fs::path& destRoot, bool archiveMode) const {
    fs::path target = makeTargetPath(destRoot, archiveMode, now());
    if (!archiveMode) {
        // 镜像目录无法创建是唯一的致命启动条件
        std::string errorMessage;
        if (!FileSystem::createDirectories(target.string(), errorMessage)) {
            throw std::runtime_error(errorMessage);
        }
    }
    return target;
}
