#pragma once
#include <string>

// 一次运行的状态：IDLE -> RUNNING -> {COMPLETED, FAILED, CANCELLED}
enum class TaskStatus {
    IDLE,
    RUNNING,
    COMPLETED,
    FAILED,
    CANCELLED
};

enum class TransferMode {
    ARCHIVE,
    MIRROR
};

// 通道上传递的事件类型
enum class EventType {
    LOG,
    PROGRESS,
    DONE,
    FAILED,
    CANCELLED
};

inline std::string toString(TaskStatus status) {
    switch (status) {
        case TaskStatus::IDLE: return "IDLE";
        case TaskStatus::RUNNING: return "RUNNING";
        case TaskStatus::COMPLETED: return "COMPLETED";
        case TaskStatus::FAILED: return "FAILED";
        case TaskStatus::CANCELLED: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

inline std::string toString(TransferMode mode) {
    switch (mode) {
        case TransferMode::ARCHIVE: return "ARCHIVE";
        case TransferMode::MIRROR: return "MIRROR";
        default: return "UNKNOWN";
    }
}

inline std::string toString(EventType type) {
    switch (type) {
        case EventType::LOG: return "log";
        case EventType::PROGRESS: return "progress";
        case EventType::DONE: return "done";
        case EventType::FAILED: return "failed";
        case EventType::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}
