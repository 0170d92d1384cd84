#include "util/paths.hpp"

#include <cstdlib>
#include <optional>

namespace lw::paths {

namespace {
constexpr const auto* DEFAULT_CONFIG_PATH = "/etc/logwarden/config.yaml";
std::optional<std::filesystem::path> testConfigPath;
}

std::filesystem::path getConfigPath() {
    if (testConfigPath) return *testConfigPath;
    if (const char* env = std::getenv("LOGWARDEN_CONFIG"); env && *env) return env;
    return DEFAULT_CONFIG_PATH;
}

void setConfigPathForTesting(const std::filesystem::path& path) { testConfigPath = path; }

}
