/*
 * Platform capabilities implementation - jdkrun
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <jdkrun/platform/platform_ops.hpp>
#include <filesystem>
#include <system_error>
#include <vector>
#ifndef _WIN32
#include <csignal>
#include <sys/types.h>
#include <signal.h>
#endif

namespace jdkrun {
namespace fs = std::filesystem;

void PortablePlatformOps::create_directory(const std::string& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec); // "already exists" is silently fine
}

void PortablePlatformOps::clear_directory(const std::string& dir) {
    std::error_code ec;
    std::vector<fs::path> entries;
    fs::directory_iterator it(dir, ec), end;
    while (!ec && it != end) {
        entries.push_back(it->path());
        it.increment(ec);
    }
    for (auto &p : entries) {
        std::error_code rec;
        fs::remove_all(p, rec);
    }
}

#ifndef _WIN32
bool PosixPlatformOps::interrupt(int pid) {
    if (pid <= 0) return false;
    return ::kill(static_cast<pid_t>(pid), SIGINT) == 0;
}

bool PosixPlatformOps::force_kill(int pid) {
    if (pid <= 0) return false;
    return ::kill(static_cast<pid_t>(pid), SIGKILL) == 0;
}

std::unique_ptr<PlatformOps> make_platform_ops() {
    return std::make_unique<PosixPlatformOps>();
}
#endif

} // namespace jdkrun
