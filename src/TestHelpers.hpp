#pragma once
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <archive.h>
#include <archive_entry.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <sstream>
#include <string>
#include <vector>
#include "utils/ILogger.hpp"

namespace fs = std::filesystem;

// 模拟ILogger接口
class MockLogger : public ILogger {
public:
    MOCK_METHOD(void, info, (const std::string& message), (override));
    MOCK_METHOD(void, error, (const std::string& message), (override));
    MOCK_METHOD(void, warn, (const std::string& message), (override));
    MOCK_METHOD(void, debug, (const std::string& message), (override));
    MOCK_METHOD(void, setLogLevel, (LogLevel level), (override));
    MOCK_METHOD(LogLevel, getLogLevel, (), (const, override));
    MOCK_METHOD(void, log, (LogLevel level, const std::string& message), (override));
};

namespace testutil {

// 每个测试用例独立的临时目录，避免并行运行时互相干扰
inline fs::path uniqueTestDir(const std::string& prefix) {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = prefix;
    if (info != nullptr) {
        name += std::string("_") + info->test_suite_name() + "_" + info->name();
    }
    return fs::temp_directory_path() / name;
}

inline void writeFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline std::vector<std::string> readLines(const fs::path& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

inline std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

inline std::size_t countPrefixed(const std::vector<std::string>& lines, const std::string& prefix) {
    std::size_t count = 0;
    for (const auto& line : lines) {
        if (line.rfind(prefix, 0) == 0) {
            ++count;
        }
    }
    return count;
}

// 读出 ZIP 中所有条目：条目名 -> 内容
inline std::map<std::string, std::string> readZipEntries(const fs::path& zipPath) {
    std::map<std::string, std::string> entries;
    struct archive* reader = archive_read_new();
    archive_read_support_format_zip(reader);
    if (archive_read_open_filename(reader, zipPath.string().c_str(), 10240) != ARCHIVE_OK) {
        ADD_FAILURE() << "Cannot open zip " << zipPath << ": " << archive_error_string(reader);
        archive_read_free(reader);
        return entries;
    }

    struct archive_entry* entry = nullptr;
    while (archive_read_next_header(reader, &entry) == ARCHIVE_OK) {
        std::string name = archive_entry_pathname(entry);
        std::string content;
        char buffer[4096];
        la_ssize_t got = 0;
        while ((got = archive_read_data(reader, buffer, sizeof(buffer))) > 0) {
            content.append(buffer, static_cast<std::size_t>(got));
        }
        entries[name] = content;
    }
    archive_read_close(reader);
    archive_read_free(reader);
    return entries;
}

inline std::chrono::system_clock::time_point fixedTime() {
    return std::chrono::system_clock::from_time_t(1700000000);
}

} // namespace testutil
