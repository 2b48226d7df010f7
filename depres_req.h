#pragma once
#include "depres_utils.h"

std::string canonical_name(const std::string& raw);
std::optional<Requirement> parse_requirement(const std::string& line);
std::vector<Requirement> parse_requirement_lines(const std::string& text);
std::vector<Requirement> parse_requirement_list(const std::vector<std::string>& raws);
std::vector<Requirement> verbatim_requirements(const std::vector<std::string>& raws);
