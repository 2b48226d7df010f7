#include "depres_json.h"

namespace {

struct Parser {
    const std::string& s;
    size_t i = 0;
    std::string err;

    void ws() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }
    bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }
    void fail(const std::string& what) { if (err.empty()) err = std::format("{} at offset {}", what, i); }

    static void append_utf8(std::string& o, unsigned cp) {
        if (cp < 0x80) o += static_cast<char>(cp);
        else if (cp < 0x800) { o += static_cast<char>(0xC0 | (cp >> 6)); o += static_cast<char>(0x80 | (cp & 0x3F)); }
        else if (cp < 0x10000) { o += static_cast<char>(0xE0 | (cp >> 12)); o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F)); o += static_cast<char>(0x80 | (cp & 0x3F)); }
        else { o += static_cast<char>(0xF0 | (cp >> 18)); o += static_cast<char>(0x80 | ((cp >> 12) & 0x3F)); o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F)); o += static_cast<char>(0x80 | (cp & 0x3F)); }
    }

    bool hex4(unsigned& out) {
        if (i + 4 > s.size()) return false;
        out = 0;
        for (int k = 0; k < 4; ++k) {
            char c = s[i++]; out <<= 4;
            if (c >= '0' && c <= '9') out |= c - '0';
            else if (c >= 'a' && c <= 'f') out |= c - 'a' + 10;
            else if (c >= 'A' && c <= 'F') out |= c - 'A' + 10;
            else return false;
        }
        return true;
    }

    std::string parse_string() {
        std::string o;
        if (!eat('"')) { fail("expected string"); return o; }
        while (i < s.size()) {
            char c = s[i++];
            if (c == '"') return o;
            if (c != '\\') { o += c; continue; }
            if (i >= s.size()) break;
            char n = s[i++];
            switch (n) {
                case 'n': o += '\n'; break;
                case 't': o += '\t'; break;
                case 'r': o += '\r'; break;
                case 'b': o += '\b'; break;
                case 'f': o += '\f'; break;
                case 'u': {
                    unsigned cp = 0;
                    if (!hex4(cp)) { fail("bad \\u escape"); return o; }
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        unsigned lo = 0;
                        if (i + 6 > s.size() || s[i] != '\\' || s[i + 1] != 'u') { fail("unpaired surrogate"); return o; }
                        i += 2;
                        if (!hex4(lo) || lo < 0xDC00 || lo > 0xDFFF) { fail("bad surrogate pair"); return o; }
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        fail("unpaired surrogate"); return o;
                    }
                    append_utf8(o, cp);
                    break;
                }
                default: o += n;
            }
        }
        fail("unterminated string");
        return o;
    }

    JsonValue parse_number() {
        size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        while (i < s.size() && (std::isdigit(static_cast<unsigned char>(s[i])) || s[i] == '.' || s[i] == 'e' || s[i] == 'E' || s[i] == '+' || s[i] == '-')) ++i;
        std::string num = s.substr(start, i - start);
        JsonValue v; v.type = JsonValue::Type::Number;
        try {
            size_t used = 0;
            v.number = std::stod(num, &used);
            if (used != num.size()) fail("invalid number");
        } catch (const std::exception&) {
            fail("invalid number");
        }
        return v;
    }

    JsonValue parse_value(int depth) {
        ws();
        if (depth > 64) { fail("nesting too deep"); return {}; }
        if (i >= s.size()) { fail("unexpected end of input"); return {}; }
        char c = s[i];
        if (c == '{') return parse_object(depth);
        if (c == '[') return parse_array(depth);
        if (c == '"') return JsonValue::of(parse_string());
        if (s.compare(i, 4, "true") == 0) { i += 4; return JsonValue::of(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JsonValue::of(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return {}; }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();
        fail("unexpected token");
        return {};
    }

    JsonValue parse_object(int depth) {
        JsonValue out = JsonValue::object();
        eat('{');
        if (eat('}')) return out;
        while (err.empty()) {
            ws();
            std::string key = parse_string();
            if (!err.empty()) break;
            if (!eat(':')) { fail("expected ':'"); break; }
            out.set(key, parse_value(depth + 1));
            if (!err.empty()) break;
            if (eat('}')) return out;
            if (!eat(',')) { fail("expected ',' or '}'"); break; }
        }
        return out;
    }

    JsonValue parse_array(int depth) {
        JsonValue out = JsonValue::array();
        eat('[');
        if (eat(']')) return out;
        while (err.empty()) {
            out.push(parse_value(depth + 1));
            if (!err.empty()) break;
            if (eat(']')) return out;
            if (!eat(',')) { fail("expected ',' or ']'"); break; }
        }
        return out;
    }
};

void write_value(const JsonValue& v, int indent, int level, std::string& out) {
    auto newline = [&](int lvl) {
        if (indent < 0) return;
        out += '\n';
        out.append(static_cast<size_t>(indent * lvl), ' ');
    };
    switch (v.type) {
        case JsonValue::Type::Null: out += "null"; break;
        case JsonValue::Type::Bool: out += v.boolean ? "true" : "false"; break;
        case JsonValue::Type::Number: out += std::format("{}", v.number); break;
        case JsonValue::Type::String: out += '"'; out += json_escape(v.str); out += '"'; break;
        case JsonValue::Type::Array:
            out += '[';
            for (size_t k = 0; k < v.items.size(); ++k) {
                if (k) out += ',';
                newline(level + 1);
                write_value(v.items[k], indent, level + 1, out);
            }
            if (!v.items.empty()) newline(level);
            out += ']';
            break;
        case JsonValue::Type::Object:
            out += '{';
            for (size_t k = 0; k < v.members.size(); ++k) {
                if (k) out += ',';
                newline(level + 1);
                out += '"'; out += json_escape(v.members[k].first); out += indent < 0 ? "\":" : "\": ";
                write_value(v.members[k].second, indent, level + 1, out);
            }
            if (!v.members.empty()) newline(level);
            out += '}';
            break;
    }
}

} // namespace

const JsonValue* JsonValue::find(const std::string& key) const {
    for (const auto& [k, v] : members) if (k == key) return &v;
    return nullptr;
}

JsonValue& JsonValue::set(const std::string& key, JsonValue value) {
    for (auto& [k, v] : members) if (k == key) { v = std::move(value); return v; }
    members.emplace_back(key, std::move(value));
    return members.back().second;
}

std::optional<JsonValue> parse_json(const std::string& text, std::string& error) {
    Parser p{text};
    JsonValue root = p.parse_value(0);
    p.ws();
    if (p.err.empty() && p.i != text.size()) p.fail("trailing characters");
    if (!p.err.empty()) { error = p.err; return std::nullopt; }
    return root;
}

std::string to_json(const JsonValue& v, int indent) {
    std::string out;
    write_value(v, indent, 0, out);
    return out;
}

std::string json_escape(const std::string& s) {
    std::string o;
    o.reserve(s.size());
    for (unsigned char c : s) {
        switch (c) {
            case '"': o += "\\\""; break;
            case '\\': o += "\\\\"; break;
            case '\n': o += "\\n"; break;
            case '\r': o += "\\r"; break;
            case '\t': o += "\\t"; break;
            case '\b': o += "\\b"; break;
            case '\f': o += "\\f"; break;
            default:
                if (c < 0x20) o += std::format("\\u{:04x}", static_cast<unsigned>(c));
                else o += static_cast<char>(c);
        }
    }
    return o;
}

// Collects the string elements of an array. Non-string elements and non-array
// values clear well_formed; a missing value is an empty list.
std::vector<std::string> string_items(const JsonValue* v, bool& well_formed) {
    std::vector<std::string> out;
    if (!v || v->type == JsonValue::Type::Null) return out;
    if (!v->is_array()) { well_formed = false; return out; }
    for (const auto& item : v->items) {
        if (item.is_string()) out.push_back(item.str);
        else well_formed = false;
    }
    return out;
}
