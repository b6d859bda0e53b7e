#include "MirrorTask.hpp"
#include "../ChangeDetector.hpp"
#include "../../utils/FileSystem.hpp"
#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <sstream>
#include <stdexcept>

const char* const MirrorTask::LOG_FILE_NAME = "backup_log.txt";

static std::string isoTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm localTm{};
#ifdef _WIN32
    localtime_s(&localTm, &t);
#else
    localtime_r(&t, &localTm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&localTm, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

MirrorTask::MirrorTask(EventChannel<TransferEvent>& eventChannel, const std::atomic<bool>& cancel,
                       ILogger* log, std::size_t totalFiles, const fs::path& targetDir,
                       bool incrementalEnabled)
    : TransferTask(eventChannel, cancel, log, totalFiles), backupDir(targetDir),
      incremental(incrementalEnabled) {}

void MirrorTask::beginRun() {
    emitLog("Mirror mode: " + backupDir.string());

    fs::path logPath = backupDir / LOG_FILE_NAME;
    logFile.open(logPath, std::ios::out | std::ios::trunc);
    if (!logFile) {
        throw std::runtime_error("Cannot open log file " + logPath.string());
    }

    logFile << "Elite Dangerous Backup Log (Mirror) - " << isoTimestamp() << "\n";
    logFile << "Destination: " << backupDir.string() << "\n";
    logFile << "Incremental: " << (incremental ? "ON" : "OFF") << "\n\n";
    logFile.flush();
    if (!logFile) {
        throw std::runtime_error("Cannot write run header to " + logPath.string());
    }
}

void MirrorTask::beginRoot(const fs::path& root, const std::string& tag) {
    fs::path destBase = backupDir / tag;
    emitLog("Copying: " + root.string() + " -> " + destBase.string());

    std::string errorMessage;
    if (!FileSystem::createDirectories(destBase.string(), errorMessage)) {
        throw std::runtime_error(errorMessage);
    }
}

FileOutcome MirrorTask::processFile(const PathEnumerator::Entry& entry, const std::string& tag) {
    std::string source = entry.absolutePath.string();
    fs::path destFile = backupDir / tag / entry.relativePath;
    std::string dest = destFile.string();

    try {
        if (incremental && FileSystem::exists(dest) && ChangeDetector::isUnchanged(source, dest)) {
            writeLogLine("SKIP: " + source);
            return FileOutcome::skipped();
        }

        std::string errorMessage;
        if (!FileSystem::createDirectories(destFile.parent_path().string(), errorMessage) ||
            !FileSystem::copyFileWithMetadata(source, dest, errorMessage)) {
            throw std::runtime_error(errorMessage);
        }
        writeLogLine("COPY: " + source + " -> " + dest);
        return FileOutcome::copied();
    } catch (const std::exception& e) {
        std::string line = "[ERROR] " + source + " -> " + dest + ": " + e.what();
        writeLogLine(line);
        recordError(FileErrorRecord{source, dest, e.what()}, line);
        return FileOutcome::errored(e.what());
    }
}

void MirrorTask::endRun() {
    logFile.close();
}

void MirrorTask::writeLogLine(const std::string& line) {
    logFile << line << "\n";
}
