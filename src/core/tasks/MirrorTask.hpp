#pragma once
#include <fstream>
#include <string>
#include "TransferTask.hpp"

// 把源目录复制为 <backupDir>/<tag>/<相对路径>，并在 backupDir 下写 backup_log.txt。
// 增量模式下跳过大小和修改时间都未变化的文件。
class MirrorTask : public TransferTask {
private:
    fs::path backupDir;
    bool incremental;
    std::ofstream logFile;

    void writeLogLine(const std::string& line);

protected:
    void beginRun() override;
    void beginRoot(const fs::path& root, const std::string& tag) override;
    FileOutcome processFile(const PathEnumerator::Entry& entry, const std::string& tag) override;
    void endRun() override;

public:
    static const char* const LOG_FILE_NAME;

    MirrorTask(EventChannel<TransferEvent>& eventChannel, const std::atomic<bool>& cancel,
               ILogger* log, std::size_t totalFiles, const fs::path& targetDir, bool incrementalEnabled);
};
