#pragma once
#include <string>
#include <filesystem>

struct archive;

// 基于 libarchive 的 ZIP 写入器（deflate 压缩）。
// 构造时打开归档文件，失败抛出 std::runtime_error；析构时若未 close 则尽力关闭。
class ArchiveWriter {
private:
    struct archive* handle;
    std::string archivePath;

    void fail(const std::string& what) const;

public:
    explicit ArchiveWriter(const std::string& path);
    ~ArchiveWriter();

    ArchiveWriter(const ArchiveWriter&) = delete;
    ArchiveWriter& operator=(const ArchiveWriter&) = delete;

    // 把磁盘上的文件写为归档条目 entryName（正斜杠分隔）
    void addFile(const std::filesystem::path& source, const std::string& entryName);

    // 写入内存中的文本内容作为条目
    void addEntry(const std::string& entryName, const std::string& data);

    // 写完中央目录并关闭文件，失败抛出 std::runtime_error
    void close();

    bool isOpen() const;
    const std::string& getPath() const;
};
