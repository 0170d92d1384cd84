#pragma once

#include "config/Config.hpp"
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace lw::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

// spdlog maps unknown names to "off"; a typo must not mute a logger
inline spdlog::level::level_enum levelAt(const Node& node, const char* key, const spdlog::level::level_enum fallback) {
    if (!node[key]) return fallback;
    const auto name = node[key].as<std::string>();
    const auto lvl = spdlog::level::from_str(name);
    if (lvl == spdlog::level::off && name != "off")
        throw ConfigError(fmt::format("unknown log level '{}' for '{}'", name, key));
    return lvl;
}

template<>
struct convert<RotationConfig> {
    static Node encode(const RotationConfig& rhs) {
        Node node;
        node["logrotate_binary"] = rhs.logrotate_binary.string();
        node["rules_path"] = rhs.rules_path.string();
        node["state_path"] = rhs.state_path.string();
        node["state_owner_uid"] = rhs.state_owner_uid ? static_cast<long long>(*rhs.state_owner_uid) : -1LL;
        node["command_prefix"] = rhs.command_prefix;
        node["verbose"] = rhs.verbose;
        node["force"] = rhs.force;
        return node;
    }

    static bool decode(const Node& node, RotationConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.logrotate_binary = node["logrotate_binary"].as<std::string>("/usr/sbin/logrotate");
        rhs.rules_path = node["rules_path"].as<std::string>("/etc/logrotate.d/markitdown");
        rhs.state_path = node["state_path"].as<std::string>("/var/lib/logrotate/status");

        const auto uid = node["state_owner_uid"].as<long long>(0);
        if (uid < 0) rhs.state_owner_uid.reset();
        else rhs.state_owner_uid = static_cast<uid_t>(uid);

        if (node["command_prefix"]) rhs.command_prefix = node["command_prefix"].as<std::vector<std::string>>();
        rhs.verbose = node["verbose"].as<bool>(false);
        rhs.force = node["force"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<RetentionConfig> {
    static Node encode(const RetentionConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["archive_dir"] = rhs.archive_dir ? rhs.archive_dir->string() : std::string{};
        node["default_retention_days"] = rhs.default_retention_days;
        node["retention_days"] = rhs.retention_days;
        node["environment_multipliers"] = rhs.environment_multipliers;
        node["max_retained_size_mb"] = rhs.max_retained_bytes ? *rhs.max_retained_bytes / (1024 * 1024) : 0;
        node["strict_retention"] = rhs.strict_retention;
        return node;
    }

    static bool decode(const Node& node, RetentionConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/app/logs");

        if (const auto archive = node["archive_dir"].as<std::string>(""); !archive.empty()) rhs.archive_dir = archive;
        else rhs.archive_dir.reset();

        rhs.default_retention_days = node["default_retention_days"].as<unsigned int>(30);

        // Listed entries override the defaults; unlisted log types keep theirs.
        if (node["retention_days"])
            for (const auto& [type, days] : node["retention_days"].as<std::map<std::string, unsigned int>>())
                rhs.retention_days[type] = days;

        if (node["environment_multipliers"])
            for (const auto& [env, mult] : node["environment_multipliers"].as<std::map<std::string, double>>())
                rhs.environment_multipliers[env] = mult;

        if (const auto mb = node["max_retained_size_mb"].as<std::uintmax_t>(0); mb > 0)
            rhs.max_retained_bytes = mb * 1024 * 1024;
        else rhs.max_retained_bytes.reset();

        rhs.strict_retention = node["strict_retention"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["logwarden"]   = to_std_string(spdlog::level::to_string_view(rhs.logwarden));
        node["coordinator"] = to_std_string(spdlog::level::to_string_view(rhs.coordinator));
        node["rotation"]    = to_std_string(spdlog::level::to_string_view(rhs.rotation));
        node["cleanup"]     = to_std_string(spdlog::level::to_string_view(rhs.cleanup));
        node["state"]       = to_std_string(spdlog::level::to_string_view(rhs.state));
        node["config"]      = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.logwarden = levelAt(node, "logwarden", rhs.logwarden);
        rhs.coordinator = levelAt(node, "coordinator", rhs.coordinator);
        rhs.rotation = levelAt(node, "rotation", rhs.rotation);
        rhs.cleanup = levelAt(node, "cleanup", rhs.cleanup);
        rhs.state = levelAt(node, "state", rhs.state);
        rhs.config = levelAt(node, "config", rhs.config);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = levelAt(node, "console_log_level", rhs.console_log_level);
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
