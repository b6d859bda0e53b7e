#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "../Types.hpp"

// 一次备份运行的输入，构造后不可修改
class BackupRequest {
private:
    std::vector<std::string> sources;
    std::string destinationRoot;
    bool archiveMode;
    bool incremental;

public:
    static constexpr std::size_t MAX_SOURCES = 3;

    // 源目录超过 MAX_SOURCES 个时抛出 std::invalid_argument。
    // archiveMode 为 true 时 incremental 强制为 false。
    BackupRequest(const std::vector<std::string>& sourceList, const std::string& destRoot,
                  bool archive, bool incrementalEnabled);

    const std::vector<std::string>& getSources() const;
    const std::string& getDestinationRoot() const;
    bool isArchiveMode() const;
    bool isIncremental() const;
    TransferMode getMode() const;

    // 界面上显示的模式名称
    std::string describeMode() const;
};
