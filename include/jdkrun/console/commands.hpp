/*
 * Console commands - jdkrun
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <jdkrun/build/compiler.hpp>
#include <jdkrun/exec/supervisor.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace jdkrun {

struct CommandResult {
    int exit_code = 0;
    bool should_exit = false;
};

// Splits on blanks; double quotes group words, backslash escapes inside quotes.
std::vector<std::string> split_words(const std::string& line);

// "src/app/Main.java" -> "Main"
std::string class_name_for(const std::string& source_file);

// Lines starting with ':' are commands (:compile :run :go :kill :eof :status
// :wait :help :quit); anything else is sent to the running program plus '\n'.
class CommandInterpreter {
public:
    CommandInterpreter(CompilerGateway& compiler, ProcessSupervisor& supervisor, std::ostream& out)
        : m_compiler(compiler), m_supervisor(supervisor), m_out(out) {}

    CommandResult execute(const std::string& line);

    static bool is_command(const std::string& line) { return !line.empty() && line[0]==':'; }

private:
    CommandResult do_compile(const std::vector<std::string>& argv, bool then_run);
    CommandResult do_run(const std::vector<std::string>& argv);
    CommandResult do_status();
    CommandResult do_wait(const std::vector<std::string>& argv);
    void print_help();

    CompilerGateway& m_compiler;
    ProcessSupervisor& m_supervisor;
    std::ostream& m_out;
};

} // namespace jdkrun
