#pragma once
#include <iostream>
#include <cstdint>
#include <iterator>
#include <unistd.h>
#include <string>
#include <vector>
#include <filesystem>
#include <cstdlib>
#include <format>
#include <functional>
#include <fstream>
#include <sstream>
#include <atomic>
#include <algorithm>
#include <regex>
#include <set>
#include <map>
#include <chrono>
#include <optional>
#include <string_view>
#include <csignal>
#include <sqlite3.h>

namespace fs = std::filesystem;
extern volatile std::atomic<bool> g_interrupted;
