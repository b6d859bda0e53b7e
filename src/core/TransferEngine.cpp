#include "TransferEngine.hpp"
#include "tasks/ArchiveTask.hpp"
#include "tasks/MirrorTask.hpp"
#include "../utils/FileSystem.hpp"
#include "../utils/PathEnumerator.hpp"
#include <exception>
#include <memory>
#include <typeinfo>
#include <utility>

TransferEngine::TransferEngine(const BackupRequest& backupRequest, const TargetNamer& targetNamer,
                               EventChannel<TransferEvent>& eventChannel, const std::atomic<bool>& cancel,
                               ILogger* log)
    : request(backupRequest), namer(targetNamer), channel(eventChannel), cancelFlag(cancel),
      logger(log), status(TaskStatus::IDLE) {}

TaskStatus TransferEngine::run() {
    status = TaskStatus::RUNNING;
    logger->info("Backup run started: " + request.describeMode() + " -> " + request.getDestinationRoot());

    try {
        // 区分存在的源目录和缺失/未设置的源目录，缺失的只警告不失败
        std::vector<fs::path> existing;
        for (const auto& source : request.getSources()) {
            if (FileSystem::isDirectory(source)) {
                // 保留配置中的写法，标签由它推导；PathEnumerator 内部再转为绝对路径
                existing.push_back(fs::path(source));
            } else {
                emitLog("[WARN] Source not found or unset (skipping): " + source);
            }
        }

        std::size_t totalFiles = PathEnumerator::countFiles(existing);
        channel.push(TransferEvent::progress(0, totalFiles > 0 ? totalFiles : 1));

        target = namer.createTarget(request.getDestinationRoot(), request.isArchiveMode()).string();

        std::unique_ptr<TransferTask> task;
        if (request.isArchiveMode()) {
            task = std::make_unique<ArchiveTask>(channel, cancelFlag, logger, totalFiles, target);
        } else {
            task = std::make_unique<MirrorTask>(channel, cancelFlag, logger, totalFiles, target,
                                                request.isIncremental());
        }

        bool completed = task->execute(existing);
        errors = task->getErrors();

        if (!completed) {
            emitLog("Backup cancelled by user.");
            logger->info("Backup run cancelled after " + std::to_string(task->getDone()) + " file(s)");
            finish(TaskStatus::CANCELLED, TransferEvent::cancelled());
            return status;
        }

        if (errors.empty()) {
            emitLog("Backup completed successfully. No errors reported.");
        } else {
            emitLog("Completed with " + std::to_string(errors.size()) + " error(s). See log for details.");
        }
        logger->info("Backup run finished: " + std::to_string(task->getCopiedCount()) + " written, " +
                     std::to_string(task->getSkippedCount()) + " skipped, " +
                     std::to_string(errors.size()) + " error(s)");
        finish(TaskStatus::COMPLETED, TransferEvent::finished(target));
    } catch (const std::exception& e) {
        fail(e.what(), std::string(typeid(e).name()) + ": " + e.what());
    } catch (...) {
        fail("Unknown error", "non-standard exception");
    }
    return status;
}

void TransferEngine::fail(const std::string& message, const std::string& detail) {
    std::string diagnostic = "Fatal error: " + message + "\n" + detail +
                             "\nMode: " + request.describeMode() +
                             "\nDestination: " + request.getDestinationRoot() +
                             (target.empty() ? std::string() : "\nTarget: " + target);
    logger->error(diagnostic);
    emitLog(diagnostic);
    finish(TaskStatus::FAILED, TransferEvent::failed(message));
}

void TransferEngine::finish(TaskStatus result, const TransferEvent& terminalEvent) {
    status = result;
    if (finishHook) {
        finishHook(status);
    }
    channel.push(terminalEvent);
}

void TransferEngine::setFinishHook(std::function<void(TaskStatus)> hook) {
    finishHook = std::move(hook);
}

void TransferEngine::emitLog(const std::string& message) {
    channel.push(TransferEvent::log(message));
}

TaskStatus TransferEngine::getStatus() const {
    return status;
}

const std::string& TransferEngine::getTarget() const {
    return target;
}

const std::vector<FileErrorRecord>& TransferEngine::getErrors() const {
    return errors;
}
