#pragma once
#include "depres_types.h"

std::string compute_hash(const std::string& s);
std::vector<std::string> split(const std::string& s, char delim);
std::string trim(const std::string& s);
std::string read_text_file(const fs::path& p, bool& ok);
std::string quote_arg(const std::string& arg);
ExecResult run_captured(const std::string& cmd, int timeout_seconds = 0);
std::string sanitize_home(const std::string& text);
std::string tail_excerpt(const std::string& text, size_t max_chars = 1000);
std::string iso_timestamp();
std::string new_session_id();

constexpr std::string_view RESET = "\033[0m";
constexpr std::string_view BOLD = "\033[1m";
constexpr std::string_view CYAN = "\033[36m";
constexpr std::string_view GREEN = "\033[32m";
constexpr std::string_view YELLOW = "\033[33m";
constexpr std::string_view BLUE = "\033[34m";
constexpr std::string_view MAGENTA = "\033[35m";
constexpr std::string_view RED = "\033[31m";
