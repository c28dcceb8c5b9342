/*
 * Compiler gateway - jdkrun
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <jdkrun/core/event.hpp>
#include <jdkrun/platform/platform_ops.hpp>
#include <string>
#include <vector>

namespace jdkrun {

struct InvokeResult {
    int exit_code = -1;
    std::string diagnostics; // compiler stderr
};

// The external compiler: blocking, files in order plus an output directory.
class CompilerInvoker {
public:
    virtual ~CompilerInvoker() = default;
    virtual InvokeResult invoke(const std::vector<std::string>& files, const std::string& output_dir) = 0;
};

#ifndef _WIN32
// <program> [args...] file1 ... fileN -d <output_dir>
class ExternalCompiler : public CompilerInvoker {
public:
    explicit ExternalCompiler(std::string program = "javac", std::vector<std::string> args = {})
        : m_program(std::move(program)), m_args(std::move(args)) {}
    InvokeResult invoke(const std::vector<std::string>& files, const std::string& output_dir) override;
    std::vector<std::string> command_line(const std::vector<std::string>& files, const std::string& output_dir) const;
private:
    std::string m_program;
    std::vector<std::string> m_args;
};
#endif

struct CompileResult {
    bool ok = false;
    std::string diagnostics;
};

class CompilerGateway {
public:
    CompilerGateway(CompilerInvoker& invoker, PlatformOps& ops, EventSink& sink)
        : m_invoker(invoker), m_ops(ops), m_sink(sink) {}

    // Empty files: immediate failure, nothing touched, no events.
    // Otherwise prepares output_dir (create, then clear its contents) and
    // runs the compiler; diagnostics are also emitted as an error event.
    // Not reentrant for the same output_dir.
    CompileResult compile(const std::vector<std::string>& files, const std::string& output_dir);

private:
    CompilerInvoker& m_invoker;
    PlatformOps& m_ops;
    EventSink& m_sink;
};

} // namespace jdkrun
