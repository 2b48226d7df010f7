#pragma once
#include "depres_utils.h"

// Minimal JSON document model. Object members keep insertion order so that
// manifests and strategy lists serialize in the order they were read.
struct JsonValue {
    enum class Type { Null, Bool, Number, String, Array, Object };
    Type type = Type::Null;
    bool boolean = false;
    double number = 0.0;
    std::string str;
    std::vector<JsonValue> items;
    std::vector<std::pair<std::string, JsonValue>> members;

    static JsonValue object() { JsonValue v; v.type = Type::Object; return v; }
    static JsonValue array() { JsonValue v; v.type = Type::Array; return v; }
    static JsonValue of(const std::string& s) { JsonValue v; v.type = Type::String; v.str = s; return v; }
    static JsonValue of(const char* s) { return of(std::string(s)); }
    static JsonValue of(double d) { JsonValue v; v.type = Type::Number; v.number = d; return v; }
    static JsonValue of(bool b) { JsonValue v; v.type = Type::Bool; v.boolean = b; return v; }

    bool is_object() const { return type == Type::Object; }
    bool is_array() const { return type == Type::Array; }
    bool is_string() const { return type == Type::String; }
    bool is_bool() const { return type == Type::Bool; }

    const JsonValue* find(const std::string& key) const;
    JsonValue& set(const std::string& key, JsonValue value);
    JsonValue& push(JsonValue value) { items.push_back(std::move(value)); return items.back(); }
};

std::optional<JsonValue> parse_json(const std::string& text, std::string& error);
std::string to_json(const JsonValue& v, int indent = -1);
std::string json_escape(const std::string& s);
std::vector<std::string> string_items(const JsonValue* v, bool& well_formed);
