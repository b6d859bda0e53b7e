#pragma once
#include <atomic>
#include <functional>
#include <string>
#include <vector>
#include "Types.hpp"
#include "TargetNamer.hpp"
#include "models/BackupRequest.hpp"
#include "models/FileOutcome.hpp"
#include "models/TransferEvent.hpp"
#include "../utils/EventChannel.hpp"
#include "../utils/ILogger.hpp"

// 一次备份运行的状态机：IDLE -> RUNNING -> {COMPLETED, FAILED, CANCELLED}。
// run() 在调用线程上同步执行，结束时向通道发出恰好一个终止事件，
// 并且不会让任何异常逃逸。
class TransferEngine {
private:
    BackupRequest request;
    TargetNamer namer;
    EventChannel<TransferEvent>& channel;
    const std::atomic<bool>& cancelFlag;
    ILogger* logger;

    TaskStatus status;
    std::string target;
    std::vector<FileErrorRecord> errors;
    std::function<void(TaskStatus)> finishHook;

    void emitLog(const std::string& message);
    void fail(const std::string& message, const std::string& detail);
    void finish(TaskStatus result, const TransferEvent& terminalEvent);

public:
    TransferEngine(const BackupRequest& backupRequest, const TargetNamer& targetNamer,
                   EventChannel<TransferEvent>& eventChannel, const std::atomic<bool>& cancel,
                   ILogger* log);

    TaskStatus run();

    // 在终止事件入队之前调用，参数为最终状态
    void setFinishHook(std::function<void(TaskStatus)> hook);

    TaskStatus getStatus() const;
    // 本次运行的输出路径，目标尚未计算时为空
    const std::string& getTarget() const;
    const std::vector<FileErrorRecord>& getErrors() const;
};
