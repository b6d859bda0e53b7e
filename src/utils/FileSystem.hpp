#pragma once
#include <string>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

// 文件系统辅助函数，全部基于 error_code，不向调用方抛出 filesystem_error
class FileSystem {
public:
    // 检查文件或目录是否存在（不解析符号链接）
    static bool exists(const std::string& path);

    // 检查路径是否为目录（解析符号链接）
    static bool isDirectory(const std::string& path);

    // 检查目录是否存在且当前进程可写
    static bool isWritableDirectory(const std::string& path);

    // 创建目录（包括父目录），失败时写入 errorMessage
    static bool createDirectories(const std::string& path, std::string& errorMessage);

    // 复制单个普通文件，并保留修改时间和权限
    static bool copyFileWithMetadata(const std::string& source, const std::string& destination,
                                     std::string& errorMessage);

    // Windows 下超过 MAX_PATH 的路径加 \\?\ 前缀，其他平台原样返回
    static std::string longPath(const std::string& path);
};
