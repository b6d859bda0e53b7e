#pragma once
#include <atomic>
#include <thread>
#include "TargetNamer.hpp"
#include "models/BackupRequest.hpp"
#include "models/TransferEvent.hpp"
#include "../utils/EventChannel.hpp"

class ILogger;

// 后台备份线程。每次 start 创建一个新的 TransferEngine，
// 同一时间只允许一个运行；界面只通过事件通道和 cancel() 与其交互。
class BackupWorker {
private:
    EventChannel<TransferEvent>& channel;
    ILogger* logger;

    std::thread workerThread;
    std::atomic<bool> running;
    std::atomic<bool> cancelRequested;

public:
    BackupWorker(EventChannel<TransferEvent>& eventChannel, ILogger* log);
    ~BackupWorker();

    BackupWorker(const BackupWorker&) = delete;
    BackupWorker& operator=(const BackupWorker&) = delete;

    // 已有运行在进行时拒绝并返回 false
    bool start(const BackupRequest& request, const TargetNamer& namer);

    // 请求取消，在下一个文件开始前生效
    void cancel();

    // 等待当前运行结束
    void wait();

    bool isRunning() const;
    bool isCancelRequested() const;
};
