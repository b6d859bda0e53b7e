#pragma once
#include <string>

enum class OutcomeKind {
    COPIED,
    SKIPPED,
    ERRORED
};

// 单个文件的处理结果
struct FileOutcome {
    OutcomeKind kind;
    std::string reason; // 仅 ERRORED 时有意义

    static FileOutcome copied() { return FileOutcome{OutcomeKind::COPIED, ""}; }
    static FileOutcome skipped() { return FileOutcome{OutcomeKind::SKIPPED, ""}; }
    static FileOutcome errored(const std::string& why) { return FileOutcome{OutcomeKind::ERRORED, why}; }
};

// 一条单文件错误记录，按发生顺序保存在引擎中
struct FileErrorRecord {
    std::string sourcePath;
    std::string destination; // 目标文件路径或归档条目名
    std::string errorText;
};
