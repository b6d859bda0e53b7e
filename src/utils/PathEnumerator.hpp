#pragma once
#include <cstddef>
#include <filesystem>
#include <iterator>
#include <vector>

namespace fs = std::filesystem;

// 惰性遍历根目录下的所有普通文件。
// 每次调用 begin() 都会重新遍历，不缓存任何结果。
// 无法列出的目录或条目（权限不足、句柄耗尽、并发删除、悬空链接等）只跳过它本身，
// 遍历继续进行，不抛出异常。
class PathEnumerator {
public:
    struct Entry {
        fs::path absolutePath;
        fs::path relativePath; // 相对于根目录
    };

    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Entry;
        using difference_type = std::ptrdiff_t;
        using pointer = const Entry*;
        using reference = const Entry&;

        Iterator() = default;
        explicit Iterator(const fs::path& root);

        reference operator*() const { return current; }
        pointer operator->() const { return &current; }
        Iterator& operator++();

        // 只保证与 end() 的比较有意义
        bool operator==(const Iterator& other) const {
            return ended == other.ended && (ended || current.absolutePath == other.current.absolutePath);
        }
        bool operator!=(const Iterator& other) const { return !(*this == other); }

    private:
        fs::path root;
        std::vector<fs::path> pendingDirs;          // 待列出的目录（栈）
        std::vector<fs::directory_entry> listing;   // 当前目录的全部条目
        std::size_t index = 0;
        bool ended = true;
        Entry current;

        // 前进到下一个普通文件（当前位置若已是普通文件则不动）
        void settle();
        // 一次读完一个目录后立即关闭，遍历过程中最多占用一个目录句柄
        void loadListing(const fs::path& dir);
    };

    explicit PathEnumerator(const fs::path& rootDir);

    Iterator begin() const;
    Iterator end() const;

    const fs::path& getRoot() const;

    // 统计多个根目录下的文件总数，仅用于进度条分母
    static std::size_t countFiles(const std::vector<fs::path>& roots);

private:
    fs::path root;
};
