#include "depres_utils.h"
#include <ctime>

volatile std::atomic<bool> g_interrupted{false};

std::string compute_hash(const std::string& s) {
    uint64_t h = 0xcbf29ce484222325;
    for (char c : s) {
        h ^= static_cast<uint8_t>(c);
        h *= 0x100000001b3;
    }
    std::stringstream ss; ss << std::hex << h;
    return ss.str().substr(0, 16);
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, delim)) parts.push_back(item);
    return parts;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    return s.substr(b, s.find_last_not_of(ws) - b + 1);
}

std::string read_text_file(const fs::path& p, bool& ok) {
    std::ifstream ifs(p, std::ios::binary);
    if (!ifs.is_open()) { ok = false; return ""; }
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    ok = !ifs.bad();
    return content;
}

std::string sanitize_home(const std::string& text) {
    const char* home = std::getenv("HOME");
    if (!home || std::string_view(home).size() <= 1) return text;
    std::string h = home, out = text;
    for (size_t pos = out.find(h); pos != std::string::npos; pos = out.find(h, pos + 12)) out.replace(pos, h.size(), "/home/<USER>");
    return out;
}

std::string tail_excerpt(const std::string& text, size_t max_chars) {
    std::string clean = sanitize_home(text);
    if (clean.size() <= max_chars) return clean;
    size_t start = clean.size() - max_chars;
    while (start < clean.size() && (static_cast<unsigned char>(clean[start]) & 0xC0) == 0x80) ++start;
    return clean.substr(start);
}

std::string iso_timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::string new_session_id() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%S", &tm);
    auto ticks = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return std::format("{}-{}", buf, compute_hash(std::to_string(ticks) + ":" + std::to_string(getpid())).substr(0, 8));
}
