#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "../utils/HostEnvironment.hpp"

namespace fs = std::filesystem;

class ILogger;

// 持久化的用户配置
struct AppConfig {
    std::vector<std::string> sources;   // 恰好 3 项，可为空字符串
    bool zipMode = false;
    bool incremental = true;
};

// config.json 的读写。
// load 在文件缺失或内容不合法时回退到默认值，只记录警告；
// save 先写临时文件再改名替换，失败抛出 std::runtime_error。
class ConfigStore {
private:
    fs::path configPath;
    HostEnvironment host;
    ILogger* logger;

public:
    static const char* const APP_NAME;
    static const char* const CONFIG_FILE_NAME;
    static constexpr std::size_t SOURCE_COUNT = 3;

    ConfigStore(const HostEnvironment& hostEnv, ILogger* log);
    ConfigStore(const fs::path& path, const HostEnvironment& hostEnv, ILogger* log);

    AppConfig load() const;
    void save(const AppConfig& config) const;

    AppConfig defaults() const;
    const fs::path& getPath() const;

    // <localAppData>/EliteBackup/config.json，localAppData 未知时退回到 home
    static fs::path defaultConfigPath(const HostEnvironment& hostEnv);

    // 游戏存档和设置的默认位置
    static std::vector<std::string> defaultSources(const HostEnvironment& hostEnv);
};
