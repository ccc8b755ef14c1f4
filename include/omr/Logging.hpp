#pragma once
#include <string>

namespace omr {

// Installs the "omr" console logger as spdlog's default. Safe to call twice.
// Throws ConfigException for an unknown level name.
void setupLogging(const std::string& level);

}
