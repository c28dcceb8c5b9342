#ifdef _WIN32
#include <jdkrun/platform/platform_ops.hpp>
#include <cstdlib>
#include <string>

namespace jdkrun {

// taskkill /T /F: forza la chiusura dell'intero albero di processi
static bool taskkill_tree(int pid) {
    if (pid <= 0) return false;
    std::string cmd = "taskkill /pid " + std::to_string(pid) + " /T /F >NUL 2>&1";
    return std::system(cmd.c_str()) == 0;
}

bool WindowsPlatformOps::interrupt(int pid) { return taskkill_tree(pid); }

bool WindowsPlatformOps::force_kill(int pid) { return taskkill_tree(pid); }

std::unique_ptr<PlatformOps> make_platform_ops() {
    return std::make_unique<WindowsPlatformOps>();
}

} // namespace jdkrun
#endif // _WIN32
