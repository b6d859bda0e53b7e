#include <gtest/gtest.h>
#include <filesystem>
#include <set>
#include <string>
#include <vector>
#include <sys/resource.h>
#include <unistd.h>
#include "utils/PathEnumerator.hpp"
#include "TestHelpers.hpp"

namespace fs = std::filesystem;

class PathEnumeratorTest : public ::testing::Test {
protected:
    fs::path testDir;
    fs::path rootDir;

    void SetUp() override {
        testDir = testutil::uniqueTestDir("path_enumerator_test");
        fs::remove_all(testDir);
        rootDir = testDir / "root";

        // 多层嵌套的测试树，共 7 个文件，另含一个空目录
        testutil::writeFile(rootDir / "a.txt", "a");
        testutil::writeFile(rootDir / "b.log", "bb");
        testutil::writeFile(rootDir / "sub1" / "c.txt", "ccc");
        testutil::writeFile(rootDir / "sub1" / "d.txt", "dddd");
        testutil::writeFile(rootDir / "sub1" / "deeper" / "e.bin", "eeeee");
        testutil::writeFile(rootDir / "sub2" / "x" / "y" / "z" / "f.txt", "f");
        testutil::writeFile(rootDir / "sub2" / "g.txt", "g");
        fs::create_directories(rootDir / "empty" / "nested");
    }

    void TearDown() override {
        std::error_code ec;
        fs::permissions(rootDir / "locked", fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(testDir, ec);
    }

    std::set<std::string> relativeSet(const PathEnumerator& enumerator) {
        std::set<std::string> result;
        for (const auto& entry : enumerator) {
            result.insert(entry.relativePath.generic_string());
        }
        return result;
    }
};

// 测试遍历完整性：每个文件出现一次，根目录拼接相对路径得到绝对路径
TEST_F(PathEnumeratorTest, EnumeratesEveryFileAtAnyDepth) {
    PathEnumerator enumerator(rootDir);

    std::vector<PathEnumerator::Entry> entries;
    for (const auto& entry : enumerator) {
        entries.push_back(entry);
    }

    ASSERT_EQ(entries.size(), 7u);
    for (const auto& entry : entries) {
        EXPECT_TRUE(entry.absolutePath.is_absolute());
        EXPECT_EQ(fs::canonical(enumerator.getRoot() / entry.relativePath), fs::canonical(entry.absolutePath));
        EXPECT_TRUE(fs::is_regular_file(entry.absolutePath));
    }

    std::set<std::string> expected = {
        "a.txt", "b.log", "sub1/c.txt", "sub1/d.txt", "sub1/deeper/e.bin",
        "sub2/x/y/z/f.txt", "sub2/g.txt"
    };
    EXPECT_EQ(relativeSet(enumerator), expected);
}

// 测试每次遍历都重新开始，结果一致
TEST_F(PathEnumeratorTest, RestartableWalkSeesSameFiles) {
    PathEnumerator enumerator(rootDir);
    auto first = relativeSet(enumerator);
    auto second = relativeSet(enumerator);
    EXPECT_EQ(first, second);

    // 不缓存：新增文件在下一次遍历中出现
    testutil::writeFile(rootDir / "late.txt", "late");
    auto third = relativeSet(enumerator);
    EXPECT_EQ(third.size(), first.size() + 1);
    EXPECT_EQ(third.count("late.txt"), 1u);
}

// 测试相对路径形式的根目录
TEST_F(PathEnumeratorTest, RelativeRootIsResolved) {
    fs::path previous = fs::current_path();
    fs::current_path(testDir);
    PathEnumerator enumerator("root");
    auto files = relativeSet(enumerator);
    fs::current_path(previous);

    EXPECT_EQ(files.size(), 7u);
    EXPECT_TRUE(enumerator.getRoot().is_absolute());
}

// 测试不存在的根目录不抛异常，结果为空
TEST_F(PathEnumeratorTest, MissingRootYieldsNothing) {
    PathEnumerator enumerator(testDir / "does_not_exist");
    EXPECT_TRUE(enumerator.begin() == enumerator.end());
    EXPECT_EQ(PathEnumerator::countFiles({testDir / "does_not_exist"}), 0u);
}

// 测试空目录和只含空子目录的目录
TEST_F(PathEnumeratorTest, EmptyDirectoriesYieldNothing) {
    PathEnumerator enumerator(rootDir / "empty");
    EXPECT_TRUE(enumerator.begin() == enumerator.end());
}

// 测试多个根目录的计数
TEST_F(PathEnumeratorTest, CountFilesAcrossRoots) {
    testutil::writeFile(testDir / "other" / "one.txt", "1");
    testutil::writeFile(testDir / "other" / "two" / "two.txt", "2");

    EXPECT_EQ(PathEnumerator::countFiles({rootDir}), 7u);
    EXPECT_EQ(PathEnumerator::countFiles({rootDir, testDir / "other"}), 9u);
    EXPECT_EQ(PathEnumerator::countFiles({}), 0u);
}

// 测试不进入指向目录的符号链接，但包含指向文件的符号链接
TEST_F(PathEnumeratorTest, DirectorySymlinksAreNotFollowed) {
    testutil::writeFile(testDir / "outside" / "hidden.txt", "hidden");
    std::error_code ec;
    fs::create_directory_symlink(testDir / "outside", rootDir / "linkdir", ec);
    if (ec) {
        GTEST_SKIP() << "Cannot create symlinks here: " << ec.message();
    }
    fs::create_symlink(rootDir / "a.txt", rootDir / "alias.txt", ec);
    ASSERT_FALSE(ec);

    auto files = relativeSet(PathEnumerator(rootDir));
    EXPECT_EQ(files.count("linkdir/hidden.txt"), 0u);
    EXPECT_EQ(files.count("alias.txt"), 1u);
}

// 测试无权限的子目录被静默跳过
TEST_F(PathEnumeratorTest, UnreadableSubtreeIsSkipped) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "Permission checks do not apply to root";
    }
    testutil::writeFile(rootDir / "locked" / "secret.txt", "secret");
    fs::permissions(rootDir / "locked", fs::perms::none);

    std::set<std::string> files;
    EXPECT_NO_THROW(files = relativeSet(PathEnumerator(rootDir)));
    EXPECT_EQ(files.count("locked/secret.txt"), 0u);
    EXPECT_EQ(files.size(), 7u);
}

// 测试深层目录在文件句柄很少时仍能完整遍历
TEST_F(PathEnumeratorTest, DeepTreeSurvivesLowDescriptorLimit) {
    fs::path deepRoot = testDir / "deep";
    fs::path level = deepRoot;
    for (int depth = 0; depth < 40; ++depth) {
        level /= "level" + std::to_string(depth);
        for (int i = 0; i < 4; ++i) {
            testutil::writeFile(level / ("file" + std::to_string(i) + ".txt"), "x");
        }
    }

    struct rlimit previous {};
    ASSERT_EQ(getrlimit(RLIMIT_NOFILE, &previous), 0);
    struct rlimit limited = previous;
    limited.rlim_cur = 24;
    if (previous.rlim_cur < limited.rlim_cur || setrlimit(RLIMIT_NOFILE, &limited) != 0) {
        GTEST_SKIP() << "Cannot lower the descriptor limit";
    }
    std::size_t count = PathEnumerator::countFiles({deepRoot});
    auto files = relativeSet(PathEnumerator(deepRoot));
    setrlimit(RLIMIT_NOFILE, &previous);

    EXPECT_EQ(count, 160u);
    EXPECT_EQ(files.size(), 160u);
}

// 测试遍历中途出错的子目录只影响它自己
TEST_F(PathEnumeratorTest, VanishedSubtreeOnlyLosesItself) {
    PathEnumerator enumerator(rootDir);
    std::set<std::string> seen;
    bool removed = false;
    for (const auto& entry : enumerator) {
        seen.insert(entry.relativePath.generic_string());
        if (!removed) {
            // 第一个文件之后删掉 sub1，模拟并发删除
            fs::remove_all(rootDir / "sub1");
            removed = true;
        }
    }

    // sub2 下的文件总能遍历到
    EXPECT_EQ(seen.count("sub2/g.txt"), 1u);
    EXPECT_EQ(seen.count("sub2/x/y/z/f.txt"), 1u);
}
