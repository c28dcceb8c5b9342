/*
 * Compiler gateway implementation - jdkrun
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <jdkrun/build/compiler.hpp>
#include <jdkrun/exec/process.hpp>

namespace jdkrun {

#ifndef _WIN32
std::vector<std::string> ExternalCompiler::command_line(const std::vector<std::string>& files, const std::string& output_dir) const {
    std::vector<std::string> argv;
    argv.reserve(files.size()+m_args.size()+3);
    argv.push_back(m_program);
    argv.insert(argv.end(), m_args.begin(), m_args.end());
    argv.insert(argv.end(), files.begin(), files.end());
    argv.push_back("-d");
    argv.push_back(output_dir);
    return argv;
}

InvokeResult ExternalCompiler::invoke(const std::vector<std::string>& files, const std::string& output_dir) {
    auto run = run_captured(command_line(files, output_dir));
    InvokeResult r;
    r.exit_code = run.exit_code;
    r.diagnostics = run.err;
    // Some compilers report errors on stdout only.
    if (r.exit_code != 0 && r.diagnostics.empty()) r.diagnostics = run.out;
    return r;
}
#endif

CompileResult CompilerGateway::compile(const std::vector<std::string>& files, const std::string& output_dir) {
    if (files.empty()) return CompileResult{false, {}};

    m_ops.create_directory(output_dir);
    // stale classes from a previous compile with different file names
    m_ops.clear_directory(output_dir);

    m_sink.log("Compiling...");
    InvokeResult r = m_invoker.invoke(files, output_dir);
    if (r.exit_code != 0) {
        m_sink.error(r.diagnostics);
        return CompileResult{false, r.diagnostics};
    }
    m_sink.log("Done.");
    return CompileResult{true, {}};
}

} // namespace jdkrun
