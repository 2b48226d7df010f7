#pragma once
#include "depres_utils.h"

struct ArbitrationResult {
    std::vector<Requirement> kept;
    std::vector<Requirement> removed;
    std::vector<size_t> fired;
    std::set<std::string> banned;
};

ArbitrationResult arbitrate(const std::vector<Requirement>& requirements, const std::vector<ConflictRule>& matrix, bool verbose = true);
