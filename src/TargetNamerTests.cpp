#include <gtest/gtest.h>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/TargetNamer.hpp"
#include "utils/HostEnvironment.hpp"
#include "TestHelpers.hpp"

namespace fs = std::filesystem;

namespace {
    // 本地时间 2024-03-05 14:07:09
    std::chrono::system_clock::time_point localTime() {
        std::tm tm{};
        tm.tm_year = 2024 - 1900;
        tm.tm_mon = 2;
        tm.tm_mday = 5;
        tm.tm_hour = 14;
        tm.tm_min = 7;
        tm.tm_sec = 9;
        tm.tm_isdst = -1;
        return std::chrono::system_clock::from_time_t(std::mktime(&tm));
    }

    HostEnvironment makeHost(const std::string& machine) {
        HostEnvironment host;
        host.machineName = machine;
        return host;
    }
}

class TargetNamerTest : public ::testing::Test {
protected:
    fs::path testDir;

    void SetUp() override {
        testDir = testutil::uniqueTestDir("target_namer_test");
        fs::remove_all(testDir);
        fs::create_directories(testDir);
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }
};

// 测试时间戳格式
TEST_F(TargetNamerTest, TimestampFormat) {
    EXPECT_EQ(TargetNamer::formatTimestamp(localTime()), "20240305_140709");
}

// 测试归档和镜像两种命名
TEST_F(TargetNamerTest, NamesFollowConvention) {
    TargetNamer namer(makeHost("RIG01"));

    fs::path archive = namer.makeTargetPath(testDir, true, localTime());
    EXPECT_EQ(archive.parent_path(), testDir);
    EXPECT_EQ(archive.filename().string(), "EliteDangerousBackup_RIG01_20240305_140709.zip");

    fs::path mirror = namer.makeTargetPath(testDir, false, localTime());
    EXPECT_EQ(mirror.filename().string(), "EliteDangerousBackup_RIG01_20240305_140709");
}

// 测试主机名不可用时使用占位名
TEST_F(TargetNamerTest, UnknownMachineFallback) {
    TargetNamer namer(makeHost(""));
    EXPECT_EQ(namer.machineId(), "UNKNOWNPC");
    EXPECT_EQ(namer.makeTargetPath(testDir, false, localTime()).filename().string(),
              "EliteDangerousBackup_UNKNOWNPC_20240305_140709");
}

// 测试时间取自注入的时钟
TEST_F(TargetNamerTest, CreateTargetUsesInjectedClock) {
    TargetNamer namer(makeHost("RIG01"), []() { return localTime(); });
    EXPECT_EQ(namer.now(), localTime());

    fs::path archive = namer.createTarget(testDir, true);
    EXPECT_EQ(archive, namer.makeTargetPath(testDir, true, localTime()));
    // 归档模式只计算路径，文件由写入器创建
    EXPECT_FALSE(fs::exists(archive));
}

// 测试镜像模式创建目录
TEST_F(TargetNamerTest, MirrorTargetDirectoryIsCreated) {
    TargetNamer namer(makeHost("RIG01"), []() { return localTime(); });
    fs::path mirror = namer.createTarget(testDir / "nested" / "dest", false);
    EXPECT_TRUE(fs::is_directory(mirror));

    // 同一时刻再次创建不会失败
    EXPECT_NO_THROW(namer.createTarget(testDir / "nested" / "dest", false));
}

// 测试目录无法创建时抛出异常
TEST_F(TargetNamerTest, MirrorTargetCreationFailureThrows) {
    testutil::writeFile(testDir / "not_a_dir", "file");
    TargetNamer namer(makeHost("RIG01"), []() { return localTime(); });
    EXPECT_THROW(namer.createTarget(testDir / "not_a_dir", false), std::runtime_error);
}

// 测试可移动磁盘枚举能力可注入
TEST(HostEnvironmentTest, RemovableDrivesAreInjectable) {
    HostEnvironment host;
    EXPECT_TRUE(host.listRemovableDrives().empty());

    host.removableDrives = []() { return std::vector<std::string>{"E:\\", "F:\\"}; };
    auto drives = host.listRemovableDrives();
    ASSERT_EQ(drives.size(), 2u);
    EXPECT_EQ(drives[0], "E:\\");
}

#ifndef _WIN32
// 测试非 Windows 平台检测结果
TEST(HostEnvironmentTest, DetectOnPosix) {
    HostEnvironment host = HostEnvironment::detect();
    EXPECT_TRUE(host.listRemovableDrives().empty());
    if (!host.homeDir.empty() && std::getenv("LOCALAPPDATA") == nullptr) {
        EXPECT_EQ(host.localAppDataDir, (fs::path(host.homeDir) / "AppData" / "Local").string());
    }
}
#endif
