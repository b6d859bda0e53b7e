#include "PathEnumerator.hpp"
#include <system_error>

PathEnumerator::Iterator::Iterator(const fs::path& rootDir) : root(rootDir), ended(false) {
    pendingDirs.push_back(root);
    settle();
}

PathEnumerator::Iterator& PathEnumerator::Iterator::operator++() {
    ++index;
    settle();
    return *this;
}

void PathEnumerator::Iterator::settle() {
    while (true) {
        while (index < listing.size()) {
            const fs::directory_entry& entry = listing[index];
            std::error_code ec;
            if (entry.is_symlink(ec)) {
                // 指向文件的链接按文件处理，指向目录的链接不递归
                if (fs::is_regular_file(entry.path(), ec)) {
                    break;
                }
            } else if (entry.is_directory(ec)) {
                pendingDirs.push_back(entry.path());
            } else if (entry.is_regular_file(ec)) {
                break;
            }
            ++index;
        }

        if (index < listing.size()) {
            current.absolutePath = listing[index].path();
            current.relativePath = current.absolutePath.lexically_relative(root);
            return;
        }
        if (pendingDirs.empty()) {
            listing.clear();
            ended = true;
            return;
        }

        fs::path dir = pendingDirs.back();
        pendingDirs.pop_back();
        loadListing(dir);
    }
}

void PathEnumerator::Iterator::loadListing(const fs::path& dir) {
    listing.clear();
    index = 0;

    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    const fs::directory_iterator endIt;
    // 打不开的目录整体跳过；读到一半出错时保留已读到的条目
    while (!ec && it != endIt) {
        listing.push_back(*it);
        it.increment(ec);
    }
}

PathEnumerator::PathEnumerator(const fs::path& rootDir) {
    std::error_code ec;
    root = fs::absolute(rootDir, ec);
    if (ec) {
        root = rootDir;
    }
}

PathEnumerator::Iterator PathEnumerator::begin() const {
    return Iterator(root);
}

PathEnumerator::Iterator PathEnumerator::end() const {
    return Iterator();
}

const fs::path& PathEnumerator::getRoot() const {
    return root;
}

std::size_t PathEnumerator::countFiles(const std::vector<fs::path>& roots) {
    std::size_t total = 0;
    for (const auto& rootDir : roots) {
        PathEnumerator enumerator(rootDir);
        for (auto it = enumerator.begin(); it != enumerator.end(); ++it) {
            ++total;
        }
    }
    return total;
}
