#pragma once
#include "depres_json.h"

using FreezeRunner = std::function<ExecResult()>;

std::vector<PinnedPackage> parse_freeze_output(const std::string& text);
Recipe build_recipe(const std::string& session_id, const std::string& freeze_output);
JsonValue recipe_to_json(const Recipe& recipe);
std::optional<fs::path> export_recipe(const Recipe& recipe, const fs::path& dir, Status& status);
FreezeRunner make_shell_freezer(const Config& cfg);
