/*
 * Console commands implementation - jdkrun
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <jdkrun/console/commands.hpp>
#include <cctype>
#include <chrono>
#include <filesystem>

namespace jdkrun {
namespace fs = std::filesystem;

std::vector<std::string> split_words(const std::string& line) {
    std::vector<std::string> out; std::string cur; bool in_word=false, in_q=false;
    for (size_t i=0;i<line.size();++i) {
        char c = line[i];
        if (in_q) {
            if (c=='\\' && i+1<line.size() && (line[i+1]=='"' || line[i+1]=='\\')) { cur.push_back(line[++i]); continue; }
            if (c=='"') { in_q=false; continue; }
            cur.push_back(c); continue;
        }
        if (c=='"') { in_q=true; in_word=true; continue; }
        if (std::isspace((unsigned char)c)) {
            if (in_word) { out.push_back(cur); cur.clear(); in_word=false; }
            continue;
        }
        cur.push_back(c); in_word=true;
    }
    if (in_word) out.push_back(cur);
    return out;
}

std::string class_name_for(const std::string& source_file) {
    return fs::path(source_file).stem().string();
}

CommandResult CommandInterpreter::execute(const std::string& line) {
    if (!is_command(line)) {
        m_supervisor.write_input(line + "\n");
        return {};
    }
    auto argv = split_words(line.substr(1));
    if (argv.empty()) return {};
    const std::string& cmd = argv[0];
    if (cmd=="compile") return do_compile(argv, false);
    if (cmd=="go") return do_compile(argv, true);
    if (cmd=="run") return do_run(argv);
    if (cmd=="kill") { m_supervisor.terminate(); return {}; }
    if (cmd=="eof") { m_supervisor.close_input(); return {}; }
    if (cmd=="status") return do_status();
    if (cmd=="wait") return do_wait(argv);
    if (cmd=="help") { print_help(); return {}; }
    if (cmd=="quit" || cmd=="exit") return CommandResult{0, true};
    m_out << "unknown command: :" << cmd << " (try :help)" << '\n';
    return CommandResult{2, false};
}

CommandResult CommandInterpreter::do_compile(const std::vector<std::string>& argv, bool then_run) {
    if (argv.size() < 3) {
        m_out << "usage: :" << argv[0] << " <outdir> <file...>" << '\n';
        return CommandResult{2, false};
    }
    std::vector<std::string> files;
    for (size_t i=2;i<argv.size();++i) {
        std::error_code ec;
        auto abs = fs::absolute(argv[i], ec);
        files.push_back(ec ? argv[i] : abs.string());
    }
    auto r = m_compiler.compile(files, argv[1]);
    if (!r.ok) return CommandResult{1, false};
    if (then_run) m_supervisor.run(argv[1], class_name_for(files.front()));
    return {};
}

CommandResult CommandInterpreter::do_run(const std::vector<std::string>& argv) {
    if (argv.size() != 3) {
        m_out << "usage: :run <dir> <identifier>" << '\n';
        return CommandResult{2, false};
    }
    m_supervisor.run(argv[1], argv[2]);
    return {};
}

CommandResult CommandInterpreter::do_status() {
    auto s = m_supervisor.snapshot();
    m_out << state_name(s.state);
    if (s.state != SlotState::Idle) m_out << " pid=" << s.pid << " generation=" << s.generation << " " << s.identifier << " in " << s.working_directory;
    if (s.pending) m_out << " | next: " << s.pending->identifier << " in " << s.pending->working_directory;
    m_out << " | launches=" << s.launches << '\n';
    return {};
}

CommandResult CommandInterpreter::do_wait(const std::vector<std::string>& argv) {
    long ms = 10000;
    if (argv.size() > 1) {
        try { ms = std::stol(argv[1]); } catch (const std::exception&) {
            m_out << "usage: :wait [ms]" << '\n';
            return CommandResult{2, false};
        }
    }
    if (!m_supervisor.wait_idle(std::chrono::milliseconds(ms))) {
        m_out << "still running after " << ms << " ms" << '\n';
        return CommandResult{1, false};
    }
    return {};
}

void CommandInterpreter::print_help() {
    m_out << ":compile <outdir> <file...>   compile sources into outdir\n"
             ":go <outdir> <file...>        compile, then run the first file's class\n"
             ":run <dir> <identifier>       run (replacing the current program)\n"
             ":kill                         interrupt the current program\n"
             ":eof                          close the program's stdin\n"
             ":status                       show the supervised slot\n"
             ":wait [ms]                    wait until no program is running\n"
             ":quit                         leave\n"
             "any other line is sent to the program's stdin\n";
}

} // namespace jdkrun
