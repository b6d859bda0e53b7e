#include <chrono>
#include <csignal>
#include <cstddef>
#include <exception>
#include <iostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "core/BackupWorker.hpp"
#include "core/ConfigStore.hpp"
#include "core/TargetNamer.hpp"
#include "core/models/BackupRequest.hpp"
#include "utils/ConsoleLogger.hpp"
#include "utils/EventChannel.hpp"
#include "utils/FileSystem.hpp"
#include "utils/HostEnvironment.hpp"

namespace {
    // SIGINT 只设置标志，由轮询循环转为取消请求
    volatile std::sig_atomic_t gInterrupted = 0;

    void onInterrupt(int) {
        gInterrupted = 1;
    }

    const int EXIT_OK = 0;
    const int EXIT_FAILED = 1;
    const int EXIT_CANCELLED = 130;

    // 界面轮询事件通道的间隔
    const std::chrono::milliseconds POLL_INTERVAL(100);
}

// 命令行选项
struct CliOptions {
    std::string command;
    std::string configPath;
    std::string destination;
    std::vector<std::pair<int, std::string>> sourceOverrides;
    int zipMode = -1;        // -1 表示沿用配置
    int incremental = -1;
    bool saveConfig = false;
    bool verbose = false;
};

// 用户界面抽象接口
class IUserInterface {
public:
    virtual ~IUserInterface() = default;

    virtual int run() = 0;

    virtual void showHelp() = 0;

    virtual void showMessage(const std::string& message) = 0;

    virtual void showError(const std::string& message) = 0;

    // 处理一次备份事件
    virtual void onEvent(const TransferEvent& event) = 0;
};

// 控制器类 - 处理业务逻辑，与具体界面实现解耦合
class ApplicationController {
private:
    IUserInterface* ui;
    ConsoleLogger& logger;
    HostEnvironment host;
    EventChannel<TransferEvent> channel;
    BackupWorker worker;

public:
    ApplicationController(IUserInterface* ui, ConsoleLogger& logger)
        : ui(ui), logger(logger), host(HostEnvironment::detect()), worker(channel, &logger) {}

    void setUserInterface(IUserInterface* userInterface) {
        ui = userInterface;
    }

    const HostEnvironment& getHost() const {
        return host;
    }

    ConsoleLogger& getLogger() {
        return logger;
    }

    // 启动前的检查，对应原界面上的弹窗提示
    bool validate(const AppConfig& config, const std::string& destination) {
        if (destination.empty()) {
            ui->showError("No destination: pass --dest <folder> or choose a removable drive.");
            return false;
        }
        if (!FileSystem::isWritableDirectory(destination)) {
            ui->showError("Cannot write to destination: " + destination);
            return false;
        }
        bool anySource = false;
        for (const auto& source : config.sources) {
            if (!source.empty()) {
                anySource = true;
            }
        }
        if (!anySource) {
            ui->showError("Please provide at least one source folder.");
            return false;
        }
        return true;
    }

    // 执行备份并轮询事件直到终止事件到达，返回进程退出码
    int executeBackup(const AppConfig& config, const std::string& destination) {
        if (!validate(config, destination)) {
            return EXIT_FAILED;
        }

        BackupRequest request(config.sources, destination, config.zipMode, config.incremental);
        TargetNamer namer(host);
        if (!worker.start(request, namer)) {
            ui->showError("A backup is already running.");
            return EXIT_FAILED;
        }
        ui->showMessage("Starting backup to: " + destination + "  |  Mode: " + request.describeMode());

        int exitCode = EXIT_OK;
        bool finished = false;
        while (!finished) {
            std::this_thread::sleep_for(POLL_INTERVAL);
            if (gInterrupted && !worker.isCancelRequested()) {
                worker.cancel();
                ui->showMessage("Cancel requested; stopping soon...");
            }
            for (const auto& event : channel.drain()) {
                logger.debug("Event " + event.toString());
                ui->onEvent(event);
                if (event.type == EventType::FAILED) {
                    exitCode = EXIT_FAILED;
                } else if (event.type == EventType::CANCELLED) {
                    exitCode = EXIT_CANCELLED;
                }
                if (event.isTerminal()) {
                    finished = true;
                }
            }
        }
        worker.wait();
        return exitCode;
    }
};

// 命令行界面实现 - 作为IUserInterface的具体实现
class CommandLineInterface : public IUserInterface {
private:
    ApplicationController& controller;
    int argc;
    char** argv;
    CliOptions options;

    bool parseArguments() {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto needValue = [&](const std::string& name) -> bool {
                if (i + 1 >= argc) {
                    showError("Option " + name + " requires a value");
                    return false;
                }
                return true;
            };

            if (arg == "backup" || arg == "-b") {
                options.command = "backup";
            } else if (arg == "show-config" || arg == "drives") {
                options.command = arg;
            } else if (arg == "-h" || arg == "--help") {
                options.command = "help";
            } else if (arg == "--source1" || arg == "--source2" || arg == "--source3") {
                if (!needValue(arg)) return false;
                options.sourceOverrides.emplace_back(arg.back() - '1', argv[++i]);
            } else if (arg == "--dest") {
                if (!needValue(arg)) return false;
                options.destination = argv[++i];
            } else if (arg == "--config") {
                if (!needValue(arg)) return false;
                options.configPath = argv[++i];
            } else if (arg == "--zip") {
                options.zipMode = 1;
            } else if (arg == "--mirror") {
                options.zipMode = 0;
            } else if (arg == "--incremental") {
                options.incremental = 1;
            } else if (arg == "--full") {
                options.incremental = 0;
            } else if (arg == "--save-config") {
                options.saveConfig = true;
            } else if (arg == "--verbose") {
                options.verbose = true;
            } else {
                showError("Unknown argument: " + arg);
                return false;
            }
        }
        return true;
    }

    ConfigStore makeStore() {
        const HostEnvironment& host = controller.getHost();
        if (options.configPath.empty()) {
            return ConfigStore(host, &controller.getLogger());
        }
        return ConfigStore(options.configPath, host, &controller.getLogger());
    }

    AppConfig resolveConfig(const ConfigStore& store) {
        AppConfig config = store.load();
        for (const auto& entry : options.sourceOverrides) {
            config.sources[static_cast<std::size_t>(entry.first)] = entry.second;
        }
        if (options.zipMode >= 0) {
            config.zipMode = options.zipMode == 1;
        }
        if (options.incremental >= 0) {
            config.incremental = options.incremental == 1;
        }
        return config;
    }

    // 未指定 --dest 时使用第一个可移动磁盘
    std::string resolveDestination() {
        if (!options.destination.empty()) {
            return options.destination;
        }
        for (const auto& drive : controller.getHost().listRemovableDrives()) {
            if (FileSystem::isDirectory(drive)) {
                return drive;
            }
        }
        return "";
    }

    void showConfig(const ConfigStore& store, const AppConfig& config) {
        std::cout << "Config file: " << store.getPath().string() << "\n";
        for (std::size_t i = 0; i < config.sources.size(); ++i) {
            std::cout << "  Source " << (i + 1) << ": " << config.sources[i] << "\n";
        }
        std::cout << "  ZIP mode: " << (config.zipMode ? "ON" : "OFF") << "\n";
        std::cout << "  Incremental: " << (config.incremental ? "ON" : "OFF") << "\n";
    }

public:
    CommandLineInterface(ApplicationController& controller, int argc, char** argv)
        : controller(controller), argc(argc), argv(argv) {}

    int run() override {
        if (!parseArguments()) {
            return EXIT_FAILED;
        }
        if (options.verbose) {
            controller.getLogger().setLogLevel(LogLevel::DEBUG);
        }
        if (options.command.empty() || options.command == "help") {
            showHelp();
            return options.command.empty() ? EXIT_FAILED : EXIT_OK;
        }

        ConfigStore store = makeStore();
        AppConfig config = resolveConfig(store);

        if (options.saveConfig) {
            try {
                store.save(config);
            } catch (const std::exception& e) {
                showError(std::string("Failed to save configuration: ") + e.what());
                return EXIT_FAILED;
            }
            showMessage("Configuration saved.");
        }

        if (options.command == "show-config") {
            showConfig(store, config);
            return EXIT_OK;
        }
        if (options.command == "drives") {
            auto drives = controller.getHost().listRemovableDrives();
            if (drives.empty()) {
                std::cout << "No removable drives detected.\n";
            }
            for (const auto& drive : drives) {
                std::cout << drive << "\n";
            }
            return EXIT_OK;
        }

        std::signal(SIGINT, onInterrupt);
        return controller.executeBackup(config, resolveDestination());
    }

    void showHelp() override {
        std::cout << "=== Elite Dangerous Backup Help Information ===\n";
        std::cout << "Usage: EliteBackup [options] [command]\n\n";
        std::cout << "Commands:\n";
        std::cout << "  backup, -b          Run a backup with the configured sources\n";
        std::cout << "  show-config         Print the effective configuration\n";
        std::cout << "  drives              List removable drives\n";
        std::cout << "  -h, --help          Show this help information\n\n";
        std::cout << "Options:\n";
        std::cout << "  --source1..3 <path> Override one of the three source folders\n";
        std::cout << "  --dest <path>       Destination folder (default: first removable drive)\n";
        std::cout << "  --zip               Write a single ZIP archive\n";
        std::cout << "  --mirror            Mirror to a folder tree\n";
        std::cout << "  --incremental       Skip unchanged files (mirror only)\n";
        std::cout << "  --full              Copy every file (mirror only)\n";
        std::cout << "  --config <file>     Use another config.json\n";
        std::cout << "  --save-config       Persist sources and mode flags\n";
        std::cout << "  --verbose           Enable debug logging\n\n";
        std::cout << "Examples:\n";
        std::cout << "  EliteBackup --dest /media/usb -b\n";
        std::cout << "  EliteBackup --zip --dest /media/usb backup\n";
        std::cout << "  EliteBackup --source1 ~/saves --save-config show-config\n";
    }

    void showMessage(const std::string& message) override {
        std::cout << message << std::endl;
    }

    void showError(const std::string& message) override {
        std::cerr << "Error: " << message << std::endl;
    }

    void onEvent(const TransferEvent& event) override {
        switch (event.type) {
            case EventType::LOG:
                std::cout << event.text << std::endl;
                break;
            case EventType::PROGRESS: {
                std::size_t pct = event.total == 0 ? 0 : event.done * 100 / event.total;
                std::cout << "Progress: " << pct << "% (" << event.done << "/" << event.total << ")" << std::endl;
                break;
            }
            case EventType::DONE:
                std::cout << "Finished. Output:\n" << event.text << std::endl;
                break;
            case EventType::FAILED:
                showError("Backup failed: " + event.text);
                break;
            case EventType::CANCELLED:
                std::cout << "Cancelled." << std::endl;
                break;
        }
    }
};

int main(int argc, char* argv[]) {
    ConsoleLogger logger(LogLevel::WARNING);

    // 1. First create controller with null interface pointer
    ApplicationController controller(nullptr, logger);

    // 2. Create command line interface and pass controller reference
    CommandLineInterface cli(controller, argc, argv);

    // 3. Set interface to controller
    controller.setUserInterface(&cli);

    return cli.run();
}
