#pragma once
#include <functional>
#include <string>
#include <vector>

// 主机环境信息。引擎和配置只通过这个值对象读取环境，测试中可直接构造。
struct HostEnvironment {
    std::string machineName;      // 为空时由 TargetNamer 使用占位名
    std::string homeDir;
    std::string localAppDataDir;

    // 可移动磁盘枚举能力，非 Windows 平台为空实现
    std::function<std::vector<std::string>()> removableDrives;

    std::vector<std::string> listRemovableDrives() const;

    // 从当前进程环境读取
    static HostEnvironment detect();
};
