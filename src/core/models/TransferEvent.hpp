#pragma once
#include <cstddef>
#include <string>
#include "../Types.hpp"

// 引擎发往界面的事件：
//   LOG(text) / PROGRESS(done, total) / DONE(outputPath) / FAILED(errorText) / CANCELLED
// text 在 LOG、DONE、FAILED 中分别表示日志行、输出路径、错误信息
struct TransferEvent {
    EventType type = EventType::LOG;
    std::string text;
    std::size_t done = 0;
    std::size_t total = 0;

    static TransferEvent log(const std::string& message);
    static TransferEvent progress(std::size_t done, std::size_t total);
    static TransferEvent finished(const std::string& outputPath);
    static TransferEvent failed(const std::string& errorText);
    static TransferEvent cancelled();

    // DONE / FAILED / CANCELLED 是终止事件
    bool isTerminal() const;

    std::string toString() const;
};
