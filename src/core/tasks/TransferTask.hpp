#pragma once
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "../models/FileOutcome.hpp"
#include "../models/TransferEvent.hpp"
#include "../../utils/EventChannel.hpp"
#include "../../utils/ILogger.hpp"
#include "../../utils/PathEnumerator.hpp"

namespace fs = std::filesystem;

// 归档/镜像两种传输共用的逐文件循环。
// 子类实现 beginRun / beginRoot / processFile / endRun，
// 基类负责取消检查、进度统计和错误记录。
class TransferTask {
public:
    // 每处理 PROGRESS_INTERVAL 个文件发送一次进度，最后一个文件总会发送
    static constexpr std::size_t PROGRESS_INTERVAL = 5;

    TransferTask(EventChannel<TransferEvent>& eventChannel, const std::atomic<bool>& cancel,
                 ILogger* log, std::size_t totalFiles);
    virtual ~TransferTask() = default;

    TransferTask(const TransferTask&) = delete;
    TransferTask& operator=(const TransferTask&) = delete;

    // 依次处理所有根目录。观察到取消标志时提前结束并返回 false。
    // 取消时仍会调用 endRun，已写出的部分结果保留在磁盘上。
    bool execute(const std::vector<fs::path>& roots);

    // 由根目录推导输出中的顶层目录名：<父目录名>__<目录名>，无父目录时只用目录名
    static std::string sourceTag(const fs::path& root);

    const std::vector<FileErrorRecord>& getErrors() const;
    std::size_t getDone() const;
    std::size_t getCopiedCount() const;
    std::size_t getSkippedCount() const;

protected:
    EventChannel<TransferEvent>& channel;
    const std::atomic<bool>& cancelFlag;
    ILogger* logger;

    virtual void beginRun() = 0;
    virtual void beginRoot(const fs::path& root, const std::string& tag) = 0;
    virtual FileOutcome processFile(const PathEnumerator::Entry& entry, const std::string& tag) = 0;
    virtual void endRun() = 0;

    void emitLog(const std::string& message);

    // 追加错误记录，并把 line 作为日志事件发出
    void recordError(const FileErrorRecord& record, const std::string& line);

private:
    std::vector<FileErrorRecord> errors;
    std::size_t total;
    std::size_t done;
    std::size_t lastReported;
    std::size_t copiedCount;
    std::size_t skippedCount;

    void advanceProgress();
};
