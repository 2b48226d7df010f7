#pragma once
#include "depres_json.h"

// Delivers one serialized envelope. Returns false and fills error on any failure.
using Transport = std::function<bool(const std::string& payload, std::string& error)>;

class TelemetryReporter {
    Transport transport;
    fs::path work_dir;

public:
    TelemetryReporter(Transport t, fs::path work);
    bool report(const Session& session);
    std::optional<std::string> envelope(const Session& session, std::string& error) const;
    static JsonValue session_record(const Session& session);
};

std::string base64_encode(const std::string& data);
std::optional<std::string> gzip_compress(const std::string& data, const fs::path& work_dir, std::string& error);
Transport make_curl_transport(const Config& cfg);
