#include "ArchiveWriter.hpp"
#include "FileSystem.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <cerrno>
#include <cstdint>
#include <chrono>
#include <cstring>
#include <ctime>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace {
    const std::size_t COPY_BUFFER_SIZE = 64 * 1024;

    using EntryPtr = std::unique_ptr<archive_entry, decltype(&archive_entry_free)>;

    EntryPtr makeEntry(const std::string& name, int64_t size, unsigned int perm, std::time_t mtime) {
        EntryPtr entry(archive_entry_new(), &archive_entry_free);
        if (!entry) {
            throw std::runtime_error("archive_entry_new failed");
        }
        archive_entry_set_pathname(entry.get(), name.c_str());
        archive_entry_set_size(entry.get(), size);
        archive_entry_set_filetype(entry.get(), AE_IFREG);
        archive_entry_set_perm(entry.get(), perm);
        archive_entry_set_mtime(entry.get(), mtime, 0);
        return entry;
    }

    // file_time_type 转 time_t（C++17 没有 clock_cast）
    std::time_t toTimeT(fs::file_time_type fileTime) {
        auto sysTime = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            fileTime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
        return std::chrono::system_clock::to_time_t(sysTime);
    }
}

ArchiveWriter::ArchiveWriter(const std::string& path) : handle(archive_write_new()), archivePath(path) {
    if (handle == nullptr) {
        throw std::runtime_error("Cannot allocate archive writer for " + path);
    }
    if (archive_write_set_format_zip(handle) != ARCHIVE_OK ||
        archive_write_zip_set_compression_deflate(handle) != ARCHIVE_OK) {
        std::string reason = archive_error_string(handle) ? archive_error_string(handle) : "unknown";
        archive_write_free(handle);
        handle = nullptr;
        throw std::runtime_error("Cannot configure ZIP format: " + reason);
    }
    if (archive_write_open_filename(handle, FileSystem::longPath(path).c_str()) != ARCHIVE_OK) {
        std::string reason = archive_error_string(handle) ? archive_error_string(handle) : "unknown";
        archive_write_free(handle);
        handle = nullptr;
        throw std::runtime_error("Cannot create archive " + path + ": " + reason);
    }
}

ArchiveWriter::~ArchiveWriter() {
    if (handle != nullptr) {
        // 析构中不能抛出，关闭失败只能放弃
        archive_write_close(handle);
        archive_write_free(handle);
        handle = nullptr;
    }
}

void ArchiveWriter::fail(const std::string& what) const {
    const char* reason = handle ? archive_error_string(handle) : nullptr;
    throw std::runtime_error(what + (reason ? std::string(": ") + reason : std::string()));
}

void ArchiveWriter::addFile(const fs::path& source, const std::string& entryName) {
    if (handle == nullptr) {
        throw std::runtime_error("Archive is closed: " + archivePath);
    }

    // 先打开源文件，不可读时在写条目头之前失败，避免留下残缺条目
    std::ifstream in(FileSystem::longPath(source.string()), std::ios::binary);
    if (!in) {
        throw std::runtime_error(std::string("Cannot open file: ") + std::strerror(errno));
    }

    std::error_code ec;
    auto size = fs::file_size(source, ec);
    if (ec) {
        throw std::runtime_error("Cannot stat file: " + ec.message());
    }
    auto status = fs::status(source, ec);
    unsigned int perm = ec ? 0644u : static_cast<unsigned int>(status.permissions() & fs::perms::mask);
    auto modified = fs::last_write_time(source, ec);
    std::time_t mtime = ec ? std::time(nullptr) : toTimeT(modified);

    EntryPtr entry = makeEntry(entryName, static_cast<int64_t>(size), perm, mtime);
    if (archive_write_header(handle, entry.get()) < ARCHIVE_WARN) {
        fail("Cannot write entry header");
    }

    std::vector<char> buffer(COPY_BUFFER_SIZE);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got > 0 && archive_write_data(handle, buffer.data(), static_cast<std::size_t>(got)) < 0) {
            fail("Cannot write entry data");
        }
    }
    if (in.bad()) {
        throw std::runtime_error("Read error while archiving " + source.string());
    }
}

void ArchiveWriter::addEntry(const std::string& entryName, const std::string& data) {
    if (handle == nullptr) {
        throw std::runtime_error("Archive is closed: " + archivePath);
    }

    EntryPtr entry = makeEntry(entryName, static_cast<int64_t>(data.size()), 0644, std::time(nullptr));
    if (archive_write_header(handle, entry.get()) < ARCHIVE_WARN) {
        fail("Cannot write entry header for " + entryName);
    }
    if (!data.empty() && archive_write_data(handle, data.data(), data.size()) < 0) {
        fail("Cannot write entry data for " + entryName);
    }
}

void ArchiveWriter::close() {
    if (handle == nullptr) {
        return;
    }
    int result = archive_write_close(handle);
    std::string reason = archive_error_string(handle) ? archive_error_string(handle) : "unknown";
    archive_write_free(handle);
    handle = nullptr;
    if (result != ARCHIVE_OK) {
        throw std::runtime_error("Cannot finalize archive " + archivePath + ": " + reason);
    }
}

bool ArchiveWriter::isOpen() const {
    return handle != nullptr;
}

const std::string& ArchiveWriter::getPath() const {
    return archivePath;
}
