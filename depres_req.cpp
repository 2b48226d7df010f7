#include "depres_req.h"

namespace {

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
}

// Characters that may legally follow a distribution name in a specifier.
bool is_name_terminator(char c) {
    return std::isspace(static_cast<unsigned char>(c)) || c == '[' || c == ';' || c == '@' || c == ',' ||
           c == '=' || c == '<' || c == '>' || c == '!' || c == '~' || c == '(';
}

std::string strip_comment(const std::string& line) {
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '#' && (i == 0 || std::isspace(static_cast<unsigned char>(line[i - 1])))) return line.substr(0, i);
    }
    return line;
}

} // namespace

// Empty result means the declaration has no recognizable name.
std::string canonical_name(const std::string& raw) {
    std::string s = trim(raw);
    size_t end = 0;
    while (end < s.size() && is_name_char(s[end])) ++end;
    if (end == 0 || !std::isalnum(static_cast<unsigned char>(s[0]))) return "";
    if (end < s.size() && !is_name_terminator(s[end])) return "";
    std::string name;
    bool pending_sep = false;
    for (size_t i = 0; i < end; ++i) {
        char c = s[i];
        if (c == '-' || c == '_' || c == '.') { pending_sep = true; continue; }
        if (pending_sep && !name.empty()) name += '_';
        pending_sep = false;
        name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return name;
}

std::optional<Requirement> parse_requirement(const std::string& line) {
    std::string text = trim(strip_comment(line));
    if (text.empty() || text[0] == '-') return std::nullopt;
    std::string name = canonical_name(text);
    if (name.empty()) return std::nullopt;
    return Requirement{text, name};
}

std::vector<Requirement> parse_requirement_lines(const std::string& text) {
    std::vector<Requirement> out;
    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        if (auto req = parse_requirement(line)) out.push_back(*req);
    }
    return out;
}

std::vector<Requirement> parse_requirement_list(const std::vector<std::string>& raws) {
    std::vector<Requirement> out;
    for (const auto& r : raws) {
        if (auto req = parse_requirement(r)) out.push_back(*req);
    }
    return out;
}

// Keeps every non-empty entry as written. Entries without a recognizable name
// (VCS or wheel URLs, local paths) get an empty canonical name, which no
// override or ban set ever contains.
std::vector<Requirement> verbatim_requirements(const std::vector<std::string>& raws) {
    std::vector<Requirement> out;
    for (const auto& r : raws) {
        std::string text = trim(r);
        if (text.empty()) continue;
        out.push_back(Requirement{text, canonical_name(text)});
    }
    return out;
}
