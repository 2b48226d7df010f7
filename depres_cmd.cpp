#include "depres_cmd.h"
#include "depres_session.h"

namespace {
void print_usage() {
    std::cout << "Usage: depres [command]\n"
              << "  resolve          scan components, install with fallback strategies (default)\n"
              << "  scan             print the aggregated requirement manifest\n"
              << "  plan [strategy]  print the installer input a strategy would use\n"
              << "  history [n]      list the n most recent sessions\n" << std::endl;
}
} // namespace

int run_command(Config& cfg, const std::vector<std::string>& args) {
    std::string cmd = args.empty() ? "resolve" : args[0];
    if (cmd == "resolve") return run_command_resolve(cfg);
    if (cmd == "scan") return run_command_scan(cfg);
    if (cmd == "plan") return run_command_plan(cfg, args);
    if (cmd == "history") return run_command_history(cfg, args);
    print_usage();
    return (cmd == "help" || cmd == "-h" || cmd == "--help") ? 0 : 1;
}

int run_command_resolve(Config& cfg) {
    SessionController controller(cfg, default_hooks(cfg));
    return controller.run() == SessionStatus::Success ? 0 : 1;
}
