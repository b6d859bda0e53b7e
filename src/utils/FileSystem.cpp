#include "FileSystem.hpp"

// 跨平台头文件包含
#ifdef _WIN32
    #include <io.h>
    #define ACCESS_WRITE_OK 2
#else
    #include <unistd.h>
#endif

namespace fs = std::filesystem;

#ifdef _WIN32
namespace {
    // 与 MAX_PATH (260) 留出余量
    const std::size_t LONG_PATH_THRESHOLD = 240;
}
#endif

bool FileSystem::exists(const std::string& path) {
    std::error_code ec;
    // 使用symlink_status检查文件是否存在，不解析符号链接
    fs::file_status status = fs::symlink_status(path, ec);
    return !ec && status.type() != fs::file_type::not_found;
}

bool FileSystem::isDirectory(const std::string& path) {
    if (path.empty()) {
        return false;
    }
    std::error_code ec;
    bool result = fs::is_directory(path, ec);
    return result && !ec;
}

bool FileSystem::isWritableDirectory(const std::string& path) {
    if (!isDirectory(path)) {
        return false;
    }
#ifdef _WIN32
    return _access(path.c_str(), ACCESS_WRITE_OK) == 0;
#else
    return access(path.c_str(), W_OK) == 0;
#endif
}

bool FileSystem::createDirectories(const std::string& path, std::string& errorMessage) {
    std::error_code ec;

    // 目录已存在时直接返回成功
    if (fs::is_directory(path, ec)) {
        return true;
    }

    fs::create_directories(path, ec);
    if (ec) {
        errorMessage = "Failed to create directory " + path + " (" + ec.message() + ")";
        return false;
    }
    return true;
}

bool FileSystem::copyFileWithMetadata(const std::string& source, const std::string& destination,
                                      std::string& errorMessage) {
    fs::path sourcePath(longPath(source));
    fs::path destPath(longPath(destination));
    std::error_code ec;

    // 只复制普通文件，目录和特殊文件交由调用方处理
    auto status = fs::status(sourcePath, ec);
    if (ec) {
        errorMessage = ec.message();
        return false;
    }
    if (!fs::is_regular_file(status)) {
        errorMessage = "Not a regular file";
        return false;
    }

    // 目标是符号链接时先删除，避免写穿到链接目标
    if (fs::is_symlink(fs::symlink_status(destPath, ec))) {
        fs::remove(destPath, ec);
        if (ec) {
            errorMessage = "Failed to remove existing symlink (" + ec.message() + ")";
            return false;
        }
    }

    if (!fs::copy_file(sourcePath, destPath, fs::copy_options::overwrite_existing, ec)) {
        errorMessage = ec ? ec.message() : "copy_file reported failure";
        return false;
    }

    // 保留修改时间，下一次增量备份依赖它进行比较
    auto modified = fs::last_write_time(sourcePath, ec);
    if (!ec) {
        fs::last_write_time(destPath, modified, ec);
    }
    if (ec) {
        errorMessage = "Copied but failed to preserve modification time (" + ec.message() + ")";
        return false;
    }

    fs::permissions(destPath, status.permissions(), fs::perm_options::replace, ec);
    if (ec) {
        errorMessage = "Copied but failed to preserve permissions (" + ec.message() + ")";
        return false;
    }
    return true;
}

std::string FileSystem::longPath(const std::string& path) {
#ifdef _WIN32
    if (path.rfind("\\\\?\\", 0) == 0 || path.rfind("\\\\", 0) == 0) {
        return path;
    }
    if (path.size() >= LONG_PATH_THRESHOLD) {
        std::error_code ec;
        fs::path absolute = fs::absolute(path, ec);
        return "\\\\?\\" + (ec ? path : absolute.string());
    }
    return path;
#else
    return path;
#endif
}
