#include "TelemetryReporter.h"

TelemetryReporter::TelemetryReporter(Transport t, fs::path work) : transport(std::move(t)), work_dir(std::move(work)) {}

JsonValue TelemetryReporter::session_record(const Session& session) {
    JsonValue rec = JsonValue::object();
    rec.set("session_id", JsonValue::of(session.id));
    JsonValue& manifest = rec.set("input_manifest", JsonValue::object());
    for (const auto& [comp, reqs] : session.manifest) {
        JsonValue list = JsonValue::array();
        for (const auto& r : reqs) list.push(JsonValue::of(r.raw));
        manifest.set(comp, std::move(list));
    }
    JsonValue& trials = rec.set("trials", JsonValue::array());
    for (const auto& t : session.trials) {
        JsonValue j = JsonValue::object();
        j.set("strategy", JsonValue::of(t.strategy));
        j.set("success", JsonValue::of(t.success));
        j.set("duration", JsonValue::of(t.duration));
        j.set("log_snippet", JsonValue::of(t.log_snippet));
        trials.push(std::move(j));
    }
    rec.set("final_status", JsonValue::of(status_name(session.status)));
    return rec;
}

std::optional<std::string> TelemetryReporter::envelope(const Session& session, std::string& error) const {
    auto gz = gzip_compress(to_json(session_record(session)), work_dir, error);
    if (!gz) return std::nullopt;
    JsonValue env = JsonValue::object();
    env.set("log_type", JsonValue::of("dependency_graph"));
    env.set("is_compressed", JsonValue::of(true));
    env.set("body", JsonValue::of(base64_encode(*gz)));
    return to_json(env);
}

// Exactly one submission per call. Failures are logged and swallowed.
bool TelemetryReporter::report(const Session& session) {
    if (!transport) {
        std::cout << YELLOW << "⚠️ Telemetry disabled." << RESET << std::endl;
        return false;
    }
    std::string error;
    auto payload = envelope(session, error);
    if (!payload) {
        std::cout << YELLOW << "⚠️ Telemetry not sent: " << error << RESET << std::endl;
        return false;
    }
    std::cout << BLUE << "📡 Sending session report..." << RESET << std::endl;
    if (!transport(*payload, error)) {
        std::cout << YELLOW << "⚠️ Failed to send session report (network issue?): " << error << RESET << std::endl;
        return false;
    }
    std::cout << GREEN << "✔ Session report sent." << RESET << std::endl;
    return true;
}
