#pragma once

#include <espresso/models.h>

#include <vector>

namespace espresso {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitWarnings = 2;

int BuildExitCode(const std::vector<BuildWarning> &warnings);

} // namespace espresso
