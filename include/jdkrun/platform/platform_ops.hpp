/*
 * Platform capabilities - jdkrun
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <memory>
#include <string>

namespace jdkrun {

// Small capability set used by the compiler gateway and the supervisor.
// Every operation is best-effort and tolerant: failures are not reported.
class PlatformOps {
public:
    virtual ~PlatformOps() = default;
    // Creates dir (and parents); an existing directory is not an error.
    virtual void create_directory(const std::string& dir) = 0;
    // Removes every entry inside dir, keeps dir itself. Missing dir is fine.
    virtual void clear_directory(const std::string& dir) = 0;
    // Asks the process to stop (does not wait). Returns false if delivery failed.
    virtual bool interrupt(int pid) = 0;
    virtual bool force_kill(int pid) = 0;
};

// Directory ops on std::filesystem, shared by all platform families.
class PortablePlatformOps : public PlatformOps {
public:
    void create_directory(const std::string& dir) override;
    void clear_directory(const std::string& dir) override;
};

#ifndef _WIN32
// SIGINT for interrupt, SIGKILL for force_kill.
class PosixPlatformOps : public PortablePlatformOps {
public:
    bool interrupt(int pid) override;
    bool force_kill(int pid) override;
};
#else
// Whole process tree kill via taskkill for both operations.
class WindowsPlatformOps : public PortablePlatformOps {
public:
    bool interrupt(int pid) override;
    bool force_kill(int pid) override;
};
#endif

// Implementation for the platform this binary was built for.
std::unique_ptr<PlatformOps> make_platform_ops();

} // namespace jdkrun
