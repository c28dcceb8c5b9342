/*
 * Runner configuration implementation - jdkrun
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <jdkrun/core/config.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace jdkrun {

static std::string trim(const std::string& s){ size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a; size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b; return s.substr(a,b-a); }
static bool as_bool(const std::string& v){ return v=="1"||v=="true"||v=="on"; }

static std::vector<std::string> split_args(const std::string& v) {
    std::vector<std::string> out; std::istringstream iss(v); std::string w;
    while (iss >> w) out.push_back(w);
    return out;
}

void load_config(std::istream& in, RunnerConfig& cfg) {
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0]=='#') continue;
        auto eq = line.find('='); if (eq==std::string::npos) continue;
        auto key = trim(line.substr(0,eq)); auto val = trim(line.substr(eq+1));
        if (key=="compiler") cfg.compiler = val;
        else if (key=="compiler_args") cfg.compiler_args = split_args(val);
        else if (key=="runtime") cfg.runtime = val;
        else if (key=="runtime_args") cfg.runtime_args = split_args(val);
        else if (key=="output_dir") cfg.output_dir = val;
        else if (key=="color") cfg.color = as_bool(val);
        else if (key=="verbose") cfg.verbose = as_bool(val);
        else if (key=="event_endpoint") cfg.event_endpoint = val;
        else if (key=="event_timeout_seconds") {
            try { cfg.event_timeout_seconds = std::stoi(val); } catch (const std::exception&) {}
        }
    }
}

bool load_config_file(const std::string& path, RunnerConfig& cfg) {
    if (path.empty()) return false;
    std::ifstream in(path);
    if (!in) return false;
    load_config(in, cfg);
    return true;
}

std::string default_config_path() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + "/.jdkrunrc";
}

} // namespace jdkrun
