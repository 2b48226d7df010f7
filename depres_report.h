#pragma once
#include "depres_json.h"

JsonValue build_session_report(const Session& session);
bool write_session_report(const Session& session, const fs::path& logs_dir);
