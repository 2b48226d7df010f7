#include "depres_utils.h"
#include <sys/wait.h>

// Runs cmd through the shell with stdout and stderr merged. A positive timeout
// wraps the command in coreutils `timeout`, which exits 124 on expiry.
ExecResult run_captured(const std::string& cmd, int timeout_seconds) {
    ExecResult res;
    std::string full_cmd = timeout_seconds > 0
        ? std::format("timeout --kill-after=10 {} sh -c {} 2>&1", timeout_seconds, quote_arg(cmd))
        : cmd + " 2>&1";
    auto start = std::chrono::steady_clock::now();
    FILE* pipe = popen(full_cmd.c_str(), "r");
    if (!pipe) {
        res.output = "failed to spawn: " + cmd;
        return res;
    }
    char buffer[4096];
    while (fgets(buffer, sizeof(buffer), pipe) != NULL) res.output += buffer;
    int status = pclose(pipe);
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    res.duration = elapsed.count();
    if (status == -1) res.exit_code = -1;
    else if (WIFEXITED(status)) res.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res.exit_code = 128 + WTERMSIG(status);
    if (res.exit_code == 130 || res.exit_code == 128 + SIGINT) g_interrupted = true;
    res.timed_out = timeout_seconds > 0 && res.exit_code == 124;
    return res;
}
