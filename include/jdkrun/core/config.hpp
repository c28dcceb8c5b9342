/*
 * Runner configuration - jdkrun
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <istream>
#include <string>
#include <vector>

namespace jdkrun {

struct RunnerConfig {
    std::string compiler = "javac";
    std::vector<std::string> compiler_args;
    std::string runtime = "java";
    std::vector<std::string> runtime_args; // placed before the identifier
    std::string output_dir = "bin";
    bool color = true;
    bool verbose = false;            // trace lines on stderr
    std::string event_endpoint;      // HTTP sink disabled when empty
    int event_timeout_seconds = 5;
};

// Reads key=value lines into cfg; unknown keys and malformed lines are skipped.
void load_config(std::istream& in, RunnerConfig& cfg);

// Returns false if the file cannot be opened (cfg untouched).
bool load_config_file(const std::string& path, RunnerConfig& cfg);

// $HOME/.jdkrunrc, or empty if HOME is unset.
std::string default_config_path();

} // namespace jdkrun
