#include "BackupWorker.hpp"
#include "TransferEngine.hpp"
#include "../utils/ILogger.hpp"

BackupWorker::BackupWorker(EventChannel<TransferEvent>& eventChannel, ILogger* log)
    : channel(eventChannel), logger(log), running(false), cancelRequested(false) {}

BackupWorker::~BackupWorker() {
    if (running) {
        logger->info("Backup still running on shutdown, cancelling...");
        cancel();
    }
    wait();
}

bool BackupWorker::start(const BackupRequest& request, const TargetNamer& namer) {
    if (running) {
        logger->error("A backup is already running.");
        return false;
    }

    // 上一次运行的线程可能还在收尾，等它退出
    if (workerThread.joinable()) {
        workerThread.join();
    }

    cancelRequested = false;
    running = true;
    workerThread = std::thread([this, request, namer]() {
        logger->debug("Backup worker thread started.");
        TransferEngine engine(request, namer, channel, cancelRequested, logger);
        // 界面看到终止事件时必须已经可以再次 start
        engine.setFinishHook([this](TaskStatus) { running = false; });
        TaskStatus result = engine.run();
        logger->debug("Backup worker thread exiting with status " + toString(result));
        running = false;
    });
    return true;
}

void BackupWorker::cancel() {
    if (running && !cancelRequested) {
        cancelRequested = true;
        logger->info("Cancel requested; stopping soon...");
    }
}

void BackupWorker::wait() {
    if (workerThread.joinable()) {
        workerThread.join();
    }
}

bool BackupWorker::isRunning() const {
    return running;
}

bool BackupWorker::isCancelRequested() const {
    return cancelRequested;
}
