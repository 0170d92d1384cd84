#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <type_traits>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

namespace lw::config {

std::chrono::days RetentionConfig::retentionFor(const std::string& logType, const std::string& environment) const {
    const auto base = retention_days.contains(logType) ? retention_days.at(logType) : default_retention_days;
    const auto mult = environment_multipliers.contains(environment) ? environment_multipliers.at(environment) : 1.0;
    return std::chrono::days(static_cast<long>(base * mult));
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return cfg;

    try {
        const YAML::Node root = YAML::LoadFile(path.string());
        if (!root || root.IsNull()) return cfg;
        if (!root.IsMap()) throw ConfigError(fmt::format("{}: top level must be a mapping", path.string()));

        const auto section = [&](const char* key, auto& out) {
            const auto node = root[key];
            if (!node) return;
            if (!YAML::convert<std::remove_reference_t<decltype(out)>>::decode(node, out))
                throw ConfigError(fmt::format("{}: '{}' must be a mapping", path.string(), key));
        };

        cfg.environment = root["environment"].as<std::string>(cfg.environment);
        section("rotation", cfg.rotation);
        section("retention", cfg.retention);
        section("logging", cfg.logging);
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("Failed to load config {}: {}", path.string(), e.what()));
    }

    return cfg;
}

namespace {
const char* env(const char* name) {
    const char* v = std::getenv(name);
    return v && *v ? v : nullptr;
}
}

void applyEnvironmentOverrides(Config& cfg) {
    if (const auto* v = env("ENVIRONMENT")) cfg.environment = v;
    if (const auto* v = env("LOGWARDEN_RULES_PATH")) cfg.rotation.rules_path = v;
    if (const auto* v = env("LOGWARDEN_STATE_PATH")) cfg.rotation.state_path = v;
    if (const auto* v = env("LOGWARDEN_LOG_DIR")) cfg.retention.log_dir = v;

    if (const auto* v = env("LOG_LEVEL")) {
        std::string name(v);
        std::ranges::transform(name, name.begin(), [](unsigned char c) { return std::tolower(c); });

        // spdlog maps unknown names to "off"; keep the configured levels in that case
        const auto lvl = spdlog::level::from_str(name);
        if (lvl != spdlog::level::off || name == "off") {
            auto& levels = cfg.logging.levels;
            levels.console_log_level = lvl;
            auto& sub = levels.subsystem_levels;
            sub.logwarden = sub.coordinator = sub.rotation = sub.cleanup = sub.state = sub.config = lvl;
        }
    }
}

}
