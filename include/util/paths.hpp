#pragma once

#include <filesystem>

namespace lw::paths {

// Resolved from $LOGWARDEN_CONFIG, falling back to /etc/logwarden/config.yaml.
std::filesystem::path getConfigPath();

void setConfigPathForTesting(const std::filesystem::path& path);

}
