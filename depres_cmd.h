#pragma once
#include "depres_utils.h"

int run_command(Config& cfg, const std::vector<std::string>& args);
int run_command_resolve(Config& cfg);
int run_command_scan(Config& cfg);
int run_command_plan(Config& cfg, const std::vector<std::string>& args);
int run_command_history(Config& cfg, const std::vector<std::string>& args);
