/*
 * jdkrun Script Runner (.jds)
 * Reads a file of console lines (see :help), skips comments (#...) and blank
 * lines, executes each one, then waits for the running program to exit.
 */
#include <jdkrun/build/compiler.hpp>
#include <jdkrun/console/commands.hpp>
#include <jdkrun/core/config.hpp>
#include <jdkrun/exec/process.hpp>
#include <jdkrun/exec/supervisor.hpp>
#include <jdkrun/platform/platform_ops.hpp>
#include <jdkrun/sink/console_sink.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <string>

using namespace jdkrun;

static volatile sig_atomic_t g_stop = 0;
void sigint_handler(int){ g_stop = 1; }

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: jdkrun-script <file.jds>" << std::endl;
        return 1;
    }
    std::string path = argv[1];
    std::ifstream in(path);
    if (!in) { std::perror("open script"); return 1; }

    std::signal(SIGINT, sigint_handler);

    RunnerConfig cfg;
    load_config_file(default_config_path(), cfg);
    auto ops = make_platform_ops();
    PosixProcessLauncher launcher;
    ConsoleSink sink(std::cout, std::cerr, false);
    ExternalCompiler javac(cfg.compiler, cfg.compiler_args);
    CompilerGateway compiler(javac, *ops, sink);
    SupervisorOptions sopts; sopts.runtime = cfg.runtime; sopts.runtime_args = cfg.runtime_args; sopts.verbose = cfg.verbose;
    ProcessSupervisor supervisor(launcher, *ops, sink, sopts);
    CommandInterpreter interp(compiler, supervisor, std::cout);

    int last_status = 0;
    std::string line; size_t lineno=0;
    while (std::getline(in, line)) {
        ++lineno;
        if (g_stop) { std::cerr << "Interrupted" << std::endl; supervisor.terminate(); break; }
        auto notspace = [](int ch){ return !std::isspace(ch); };
        line.erase(line.begin(), std::find_if(line.begin(), line.end(), notspace));
        line.erase(std::find_if(line.rbegin(), line.rend(), notspace).base(), line.end());
        if (line.empty()) continue;
        if (line[0]=='#') continue; // comment
        auto r = interp.execute(line);
        last_status = r.exit_code;
        if (last_status != 0) {
            std::cerr << "Line " << lineno << " exit status " << last_status << std::endl;
        }
        if (r.should_exit) break;
    }

    while (!supervisor.wait_idle(std::chrono::milliseconds(100))) {
        if (g_stop) { g_stop = 0; supervisor.terminate(); }
    }
    return last_status;
}
