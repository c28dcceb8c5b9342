/*
 * Child process primitives - jdkrun
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace jdkrun {

enum class StreamKind { Stdout, Stderr };

struct ExitStatus {
    std::optional<int> code;   // set when the process exited normally
    std::optional<int> signal; // set when it was terminated by a signal
};

struct LaunchSpec {
    std::string program;            // resolved through PATH
    std::vector<std::string> args;  // argv[1..]
    std::string cwd;                // empty: inherit
};

struct ProcessCallbacks {
    std::function<void(StreamKind, std::string)> on_data;
    std::function<void(ExitStatus)> on_exit; // invoked exactly once
};

// A launched child. Destroying the handle closes its stdin (after queued input
// is written) and waits for the monitor to report the exit, so the owner must
// stop the child first.
class ProcessHandle {
public:
    virtual ~ProcessHandle() = default;
    virtual int pid() const = 0;
    // Queues text unaltered for the child's stdin; never blocks. False once
    // the input is closed.
    virtual bool write_stdin(const std::string& text) = 0;
    // Child sees EOF once the queued input has been written.
    virtual void close_input() = 0;
    // True once the OS reported the exit; pid() may then belong to someone else.
    virtual bool exited() const = 0;
};

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;
    // Never returns null. A launch that fails is reported through on_exit
    // (code 127), possibly before launch() returns. Callbacks run on a
    // monitor thread owned by the handle.
    virtual std::unique_ptr<ProcessHandle> launch(const LaunchSpec& spec, ProcessCallbacks cb) = 0;
};

#ifndef _WIN32
// fork/execvp with stdin/stdout/stderr pipes; child runs in its own process group.
class PosixProcessLauncher : public ProcessLauncher {
public:
    PosixProcessLauncher();
    std::unique_ptr<ProcessHandle> launch(const LaunchSpec& spec, ProcessCallbacks cb) override;
};

// Blocking run with captured output, stdin redirected from /dev/null.
// exit_code: exit status, 128+signal if killed, 127 if exec failed, -1 if
// the process could not be started at all (err holds the reason).
struct CapturedRun {
    int exit_code = -1;
    std::string out;
    std::string err;
};

CapturedRun run_captured(const std::vector<std::string>& argv, const std::string& cwd = {});
#endif

} // namespace jdkrun
