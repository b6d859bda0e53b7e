#include "TransferTask.hpp"

TransferTask::TransferTask(EventChannel<TransferEvent>& eventChannel, const std::atomic<bool>& cancel,
                           ILogger* log, std::size_t totalFiles)
    : channel(eventChannel), cancelFlag(cancel), logger(log), total(totalFiles), done(0),
      lastReported(0), copiedCount(0), skippedCount(0) {}

bool TransferTask::execute(const std::vector<fs::path>& roots) {
    beginRun();

    bool cancelled = false;
    for (const auto& root : roots) {
        std::string tag = sourceTag(root);
        beginRoot(root, tag);

        for (const auto& entry : PathEnumerator(root)) {
            // 每个文件开始前检查一次取消标志，单个文件的复制不会被打断
            if (cancelFlag.load()) {
                cancelled = true;
                break;
            }

            logger->debug("Processing: " + entry.absolutePath.string());
            FileOutcome outcome = processFile(entry, tag);
            if (outcome.kind == OutcomeKind::COPIED) {
                ++copiedCount;
            } else if (outcome.kind == OutcomeKind::SKIPPED) {
                ++skippedCount;
            } else {
                logger->debug("Transfer failed for " + entry.absolutePath.string() + ": " + outcome.reason);
            }
            advanceProgress();
        }

        if (cancelled) {
            break;
        }
    }

    // 文件数比预先统计的少时，补发一次进度让界面看到最终值
    if (!cancelled && lastReported != done) {
        channel.push(TransferEvent::progress(done, total > 0 ? total : 1));
        lastReported = done;
    }

    endRun();
    return !cancelled;
}

std::string TransferTask::sourceTag(const fs::path& root) {
    fs::path normalized = root.lexically_normal();
    if (!normalized.has_filename() && normalized.has_parent_path()) {
        // 去掉末尾的分隔符
        normalized = normalized.parent_path();
    }

    std::string leaf = normalized.filename().string();
    std::string parent = normalized.parent_path().filename().string();
    if (parent.empty()) {
        return leaf;
    }
    return parent + "__" + leaf;
}

const std::vector<FileErrorRecord>& TransferTask::getErrors() const {
    return errors;
}

std::size_t TransferTask::getDone() const {
    return done;
}

std::size_t TransferTask::getCopiedCount() const {
    return copiedCount;
}

std::size_t TransferTask::getSkippedCount() const {
    return skippedCount;
}

void TransferTask::emitLog(const std::string& message) {
    channel.push(TransferEvent::log(message));
}

void TransferTask::recordError(const FileErrorRecord& record, const std::string& line) {
    errors.push_back(record);
    emitLog(line);
}

void TransferTask::advanceProgress() {
    ++done;
    // 文件数比预先统计的多时抬高分母，百分比不超过 100%
    if (done > total) {
        total = done;
    }
    if (done % PROGRESS_INTERVAL == 0 || done == total) {
        channel.push(TransferEvent::progress(done, total));
        lastReported = done;
    }
}
