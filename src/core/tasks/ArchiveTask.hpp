#pragma once
#include <memory>
#include <string>
#include <vector>
#include "TransferTask.hpp"

class ArchiveWriter;

// 把所有源文件写入一个 ZIP 文件，条目名为 <tag>/<相对路径>，
// 结束时追加 backup_log.txt 条目，逐行记录每次写入尝试
class ArchiveTask : public TransferTask {
private:
    std::string archivePath;
    std::unique_ptr<ArchiveWriter> writer;
    std::vector<std::string> logLines;

protected:
    void beginRun() override;
    void beginRoot(const fs::path& root, const std::string& tag) override;
    FileOutcome processFile(const PathEnumerator::Entry& entry, const std::string& tag) override;
    void endRun() override;

public:
    static const char* const LOG_ENTRY_NAME;

    ArchiveTask(EventChannel<TransferEvent>& eventChannel, const std::atomic<bool>& cancel,
                ILogger* log, std::size_t totalFiles, const std::string& archiveFile);
    ~ArchiveTask() override;

    const std::vector<std::string>& getLogLines() const;
};
