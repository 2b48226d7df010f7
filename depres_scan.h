#pragma once
#include "KnowledgeBase.h"

Manifest scan_manifest(const fs::path& root, const KnowledgeBase& kb, const std::string& standard_file, Status& status);
size_t requirement_count(const Manifest& manifest);
