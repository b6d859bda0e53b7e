#include "ArchiveTask.hpp"
#include "../../utils/ArchiveWriter.hpp"
#include <exception>

const char* const ArchiveTask::LOG_ENTRY_NAME = "backup_log.txt";

ArchiveTask::ArchiveTask(EventChannel<TransferEvent>& eventChannel, const std::atomic<bool>& cancel,
                         ILogger* log, std::size_t totalFiles, const std::string& archiveFile)
    : TransferTask(eventChannel, cancel, log, totalFiles), archivePath(archiveFile) {}

// ArchiveWriter 在这里是完整类型
ArchiveTask::~ArchiveTask() = default;

void ArchiveTask::beginRun() {
    emitLog("ZIP mode: " + archivePath);
    // 打开失败直接抛出，由引擎顶层转为 FAILED
    writer = std::make_unique<ArchiveWriter>(archivePath);
}

void ArchiveTask::beginRoot(const fs::path& root, const std::string& tag) {
    emitLog("Zipping: " + root.string() + " -> /" + tag + "/");
}

FileOutcome ArchiveTask::processFile(const PathEnumerator::Entry& entry, const std::string& tag) {
    std::string source = entry.absolutePath.string();
    // ZIP 条目统一使用正斜杠
    std::string entryName = (fs::path(tag) / entry.relativePath).generic_string();

    try {
        writer->addFile(entry.absolutePath, entryName);
        logLines.push_back("ZIP: " + source + " -> " + entryName);
        return FileOutcome::copied();
    } catch (const std::exception& e) {
        std::string line = "[ERROR] ZIP " + source + " -> " + entryName + ": " + e.what();
        logLines.push_back(line);
        recordError(FileErrorRecord{source, entryName, e.what()}, line);
        return FileOutcome::errored(e.what());
    }
}

void ArchiveTask::endRun() {
    std::string content;
    for (std::size_t i = 0; i < logLines.size(); ++i) {
        if (i > 0) {
            content += "\n";
        }
        content += logLines[i];
    }
    writer->addEntry(LOG_ENTRY_NAME, content);
    writer->close();
}

const std::vector<std::string>& ArchiveTask::getLogLines() const {
    return logLines;
}
