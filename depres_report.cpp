#include "depres_report.h"
#include "TelemetryReporter.h"
#include <sys/utsname.h>

namespace {
std::string platform_string() {
    struct utsname u;
    if (uname(&u) != 0) return "unknown";
    return std::format("{}-{}-{}", u.sysname, u.release, u.machine);
}
} // namespace

JsonValue build_session_report(const Session& session) {
    JsonValue report = JsonValue::object();
    JsonValue& meta = report.set("meta", JsonValue::object());
    meta.set("tool", JsonValue::of("depres 1.0"));
    meta.set("generated_at", JsonValue::of(iso_timestamp()));
    meta.set("platform", JsonValue::of(platform_string()));
    meta.set("component_count", JsonValue::of(static_cast<double>(session.manifest.size())));
    meta.set("trial_count", JsonValue::of(static_cast<double>(session.trials.size())));
    report.set("session", TelemetryReporter::session_record(session));
    return report;
}

bool write_session_report(const Session& session, const fs::path& logs_dir) {
    std::error_code ec;
    fs::create_directories(logs_dir, ec);
    fs::path out = logs_dir / "resolver_report.json";
    std::ofstream ofs(out, std::ios::trunc);
    ofs << to_json(build_session_report(session), 2) << "\n";
    ofs.close();
    if (!ofs) {
        std::cout << YELLOW << "⚠️ Could not write report " << out << RESET << std::endl;
        return false;
    }
    std::cout << CYAN << "📄 Report saved to: " << out.string() << RESET << std::endl;
    return true;
}
