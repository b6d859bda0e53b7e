#include "ConfigStore.hpp"
#include "../utils/ILogger.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>
#include <system_error>

using json = nlohmann::json;

const char* const ConfigStore::APP_NAME = "EliteBackup";
const char* const ConfigStore::CONFIG_FILE_NAME = "config.json";

ConfigStore::ConfigStore(const HostEnvironment& hostEnv, ILogger* log)
    : configPath(defaultConfigPath(hostEnv)), host(hostEnv), logger(log) {}

ConfigStore::ConfigStore(const fs::path& path, const HostEnvironment& hostEnv, ILogger* log)
    : configPath(path), host(hostEnv), logger(log) {}

fs::path ConfigStore::defaultConfigPath(const HostEnvironment& hostEnv) {
    fs::path base = hostEnv.localAppDataDir.empty() ? fs::path(hostEnv.homeDir) : fs::path(hostEnv.localAppDataDir);
    return base / APP_NAME / CONFIG_FILE_NAME;
}

std::vector<std::string> ConfigStore::defaultSources(const HostEnvironment& hostEnv) {
    fs::path home(hostEnv.homeDir);
    fs::path localApp = hostEnv.localAppDataDir.empty() ? home / "AppData" / "Local"
                                                        : fs::path(hostEnv.localAppDataDir);
    fs::path savedGames = home / "Saved Games";
    return {
        (savedGames / "Frontier Developments" / "Elite Dangerous").string(),
        (localApp / "Frontier Developments").string(),
        (localApp / "Frontier_Developments").string(),
    };
}

AppConfig ConfigStore::defaults() const {
    AppConfig config;
    config.sources = defaultSources(host);
    return config;
}

const fs::path& ConfigStore::getPath() const {
    return configPath;
}

AppConfig ConfigStore::load() const {
    AppConfig config = defaults();

    std::error_code ec;
    if (!fs::is_regular_file(configPath, ec)) {
        logger->debug("No config file at " + configPath.string() + ", using defaults");
        return config;
    }

    json root;
    try {
        std::ifstream in(configPath);
        if (!in) {
            logger->warn("Cannot open config file " + configPath.string() + ", using defaults");
            return config;
        }
        root = json::parse(in);
    } catch (const json::exception& e) {
        logger->warn("Invalid config file " + configPath.string() + " (" + e.what() + "), using defaults");
        return config;
    }

    if (!root.is_object()) {
        logger->warn("Config file is not a JSON object, using defaults");
        return config;
    }

    // sources 必须是 3 个字符串组成的列表，否则整体回退到默认源
    auto sources = root.find("sources");
    if (sources != root.end() && sources->is_array() && sources->size() == SOURCE_COUNT) {
        std::vector<std::string> loaded;
        for (const auto& item : *sources) {
            if (!item.is_string()) {
                break;
            }
            loaded.push_back(item.get<std::string>());
        }
        if (loaded.size() == SOURCE_COUNT) {
            config.sources = loaded;
        } else {
            logger->warn("Config 'sources' contains non-string values, using default sources");
        }
    } else if (sources != root.end()) {
        logger->warn("Config 'sources' must be a list of 3 paths, using default sources");
    }

    auto zipMode = root.find("zip_mode");
    if (zipMode != root.end()) {
        if (zipMode->is_boolean()) {
            config.zipMode = zipMode->get<bool>();
        } else {
            logger->warn("Config 'zip_mode' is not a boolean, ignoring");
        }
    }

    auto incremental = root.find("incremental");
    if (incremental != root.end()) {
        if (incremental->is_boolean()) {
            config.incremental = incremental->get<bool>();
        } else {
            logger->warn("Config 'incremental' is not a boolean, ignoring");
        }
    }

    return config;
}

void ConfigStore::save(const AppConfig& config) const {
    if (config.sources.size() != SOURCE_COUNT) {
        throw std::invalid_argument("Config must contain exactly " + std::to_string(SOURCE_COUNT) + " sources");
    }

    std::error_code ec;
    fs::create_directories(configPath.parent_path(), ec);
    if (ec) {
        throw std::runtime_error("Cannot create config directory " + configPath.parent_path().string() +
                                 ": " + ec.message());
    }

    // 保留其他程序写入的键（例如界面主题）
    json root = json::object();
    if (fs::is_regular_file(configPath, ec)) {
        try {
            std::ifstream in(configPath);
            json existing = json::parse(in);
            if (existing.is_object()) {
                root = existing;
            }
        } catch (const json::exception& e) {
            logger->warn("Overwriting unreadable config file " + configPath.string() + " (" + e.what() + ")");
        }
    }

    root["sources"] = config.sources;
    root["zip_mode"] = config.zipMode;
    root["incremental"] = config.incremental;

    fs::path tmpPath = configPath;
    tmpPath += ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::out | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot write config file " + tmpPath.string());
        }
        out << root.dump(2);
        out.flush();
        if (!out) {
            throw std::runtime_error("Failed writing config file " + tmpPath.string());
        }
    }

    fs::rename(tmpPath, configPath, ec);
    if (ec) {
        throw std::runtime_error("Cannot replace config file " + configPath.string() + ": " + ec.message());
    }
    logger->info("Configuration saved to " + configPath.string());
}
