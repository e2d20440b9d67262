#pragma once

#include <pris/config.h>
#include <pris/result.hpp>

namespace pris {

// Set the spdlog level from log/level, then apply SPDLOG_LEVEL on top.
// Fails on an unknown level name and leaves the level unchanged.
Result<void> configureLogging(const Config& config);

} // namespace pris
