#include "HostEnvironment.hpp"
#include <cstdlib>
#include <filesystem>

#ifdef _WIN32
    #define NOMINMAX
    #include <windows.h>
#else
    #include <unistd.h>
    #include <limits.h>
#endif

namespace fs = std::filesystem;

namespace {
    std::string getEnv(const char* name) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string();
    }

    std::string detectMachineName() {
        std::string name = getEnv("COMPUTERNAME");
        if (!name.empty()) {
            return name;
        }
#ifndef _WIN32
#ifndef HOST_NAME_MAX
#define HOST_NAME_MAX 255
#endif
        char buffer[HOST_NAME_MAX + 1] = {0};
        if (gethostname(buffer, sizeof(buffer) - 1) == 0) {
            name = buffer;
        }
#endif
        return name;
    }

#ifdef _WIN32
    std::vector<std::string> listWindowsRemovableDrives() {
        std::vector<std::string> drives;
        DWORD bitmask = GetLogicalDrives();
        for (int i = 0; i < 26; ++i) {
            if (bitmask & (1u << i)) {
                std::string letter = std::string(1, static_cast<char>('A' + i)) + ":\\";
                if (GetDriveTypeA(letter.c_str()) == DRIVE_REMOVABLE) {
                    drives.push_back(letter);
                }
            }
        }
        return drives;
    }
#endif
}

std::vector<std::string> HostEnvironment::listRemovableDrives() const {
    if (!removableDrives) {
        return {};
    }
    return removableDrives();
}

HostEnvironment HostEnvironment::detect() {
    HostEnvironment host;
    host.machineName = detectMachineName();

    host.homeDir = getEnv("USERPROFILE");
    if (host.homeDir.empty()) {
        host.homeDir = getEnv("HOME");
    }

    host.localAppDataDir = getEnv("LOCALAPPDATA");
    if (host.localAppDataDir.empty() && !host.homeDir.empty()) {
        host.localAppDataDir = (fs::path(host.homeDir) / "AppData" / "Local").string();
    }

#ifdef _WIN32
    host.removableDrives = listWindowsRemovableDrives;
#else
    host.removableDrives = []() { return std::vector<std::string>(); };
#endif
    return host;
}
