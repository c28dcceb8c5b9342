/*
 * jdkrun main - compile-then-run console
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <jdkrun/build/compiler.hpp>
#include <jdkrun/console/commands.hpp>
#include <jdkrun/core/config.hpp>
#include <jdkrun/core/event.hpp>
#include <jdkrun/exec/process.hpp>
#include <jdkrun/exec/supervisor.hpp>
#include <jdkrun/platform/platform_ops.hpp>
#include <jdkrun/sink/console_sink.hpp>
#include <jdkrun/sink/http_sink.hpp>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

using namespace jdkrun;
namespace fs = std::filesystem;

static volatile sig_atomic_t g_interrupted = 0;
static void sigint_handler(int){ g_interrupted=1; }

// No SA_RESTART: a blocked getline must return so Ctrl-C reaches the child.
static void install_sigint() {
    struct sigaction sa{}; sa.sa_handler = sigint_handler; sigemptyset(&sa.sa_mask); sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
}

static void set_sigint_blocked(bool blocked) {
    sigset_t set; sigemptyset(&set); sigaddset(&set, SIGINT);
    pthread_sigmask(blocked ? SIG_BLOCK : SIG_UNBLOCK, &set, nullptr);
}

static void usage() {
    std::cerr << "Usage: jdkrun [-d|--verbose] [--config <file>] [--out <dir>] [<Main.java> ...]\n"
                 "  with source files: compile them and run the first file's class\n"
                 "  without: interactive console (:help for commands)\n";
}

static int exit_code_of(const SlotSnapshot& s) {
    if (!s.last_exit) return 0;
    if (s.last_exit->code) return *s.last_exit->code;
    if (s.last_exit->signal) return 128 + *s.last_exit->signal;
    return 1;
}

// Compile, run, forward stdin; returns the program's exit code.
static int run_once(CompilerGateway& compiler, ProcessSupervisor& supervisor, const RunnerConfig& cfg, const std::vector<std::string>& sources) {
    std::vector<std::string> files;
    for (auto &s : sources) { std::error_code ec; auto p = fs::absolute(s, ec); files.push_back(ec ? s : p.string()); }
    auto r = compiler.compile(files, cfg.output_dir);
    if (!r.ok) return 1;
    supervisor.run(cfg.output_dir, class_name_for(files.front()));

    // Forward raw stdin bytes until the program is gone.
    bool stdin_open = true;
    while (true) {
        if (g_interrupted) { g_interrupted = 0; supervisor.terminate(); }
        if (supervisor.snapshot().state == SlotState::Idle) break;
        if (!stdin_open) { std::this_thread::sleep_for(std::chrono::milliseconds(100)); continue; }
        struct pollfd p{STDIN_FILENO, POLLIN, 0};
        if (::poll(&p, 1, 100) <= 0) continue;
        char buf[4096];
        ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
        if (n > 0) supervisor.write_input(std::string(buf, static_cast<size_t>(n)));
        else if (n == 0 || errno != EINTR) { stdin_open = false; supervisor.close_input(); }
    }
    return exit_code_of(supervisor.snapshot());
}

static int console_loop(CommandInterpreter& interp, ProcessSupervisor& supervisor) {
    std::cout << "jdkrun console - :help for commands, :quit to leave\n";
    std::string line;
    int last_status = 0;
    while (true) {
        if (!std::getline(std::cin, line)) {
            if (g_interrupted) {
                g_interrupted = 0; std::cin.clear(); clearerr(stdin);
                supervisor.terminate();
                continue;
            }
            break; // EOF
        }
        if (g_interrupted) { g_interrupted = 0; supervisor.terminate(); }
        auto r = interp.execute(line);
        last_status = r.exit_code;
        if (r.should_exit) break;
    }
    return last_status;
}

int main(int argc, char* argv[]) {
    RunnerConfig cfg;
    std::string config_path = default_config_path();
    std::string out_dir;
    bool verbose = false;
    std::vector<std::string> sources;
    for (int i=1;i<argc;++i) {
        std::string a = argv[i];
        if (a=="-d" || a=="--verbose") verbose = true;
        else if (a=="--config" && i+1<argc) config_path = argv[++i];
        else if (a=="--out" && i+1<argc) out_dir = argv[++i];
        else if (a=="-h" || a=="--help") { usage(); return 0; }
        else if (!a.empty() && a[0]=='-') { std::cerr << "jdkrun: unknown option " << a << '\n'; usage(); return 2; }
        else sources.push_back(a);
    }
    if (!load_config_file(config_path, cfg) && verbose && !config_path.empty())
        std::cerr << "[jdkrun] no config at " << config_path << ", using defaults" << '\n';
    if (verbose) cfg.verbose = true;
    if (!out_dir.empty()) cfg.output_dir = out_dir;

    // Worker threads (and their children until exec) start with SIGINT blocked;
    // only the main thread handles Ctrl-C.
    set_sigint_blocked(true);

    auto ops = make_platform_ops();
    PosixProcessLauncher launcher;
    ConsoleSink console(std::cout, std::cerr, cfg.color && isatty(STDERR_FILENO));
    FanoutSink sink; sink.add(&console);
    std::unique_ptr<HttpEventSink> http;
    if (!cfg.event_endpoint.empty()) {
        http = std::make_unique<HttpEventSink>(HttpSinkConfig{cfg.event_endpoint, cfg.event_timeout_seconds});
        sink.add(http.get());
    }
    ExternalCompiler javac(cfg.compiler, cfg.compiler_args);
    CompilerGateway compiler(javac, *ops, sink);
    SupervisorOptions sopts; sopts.runtime = cfg.runtime; sopts.runtime_args = cfg.runtime_args; sopts.verbose = cfg.verbose;
    ProcessSupervisor supervisor(launcher, *ops, sink, sopts);

    install_sigint();
    set_sigint_blocked(false);

    if (!sources.empty()) return run_once(compiler, supervisor, cfg, sources);
    CommandInterpreter interp(compiler, supervisor, std::cout);
    return console_loop(interp, supervisor);
}
