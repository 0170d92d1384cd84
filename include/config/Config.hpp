#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <sys/types.h>
#include <spdlog/spdlog.h>

namespace lw::config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct RotationConfig {
    std::filesystem::path logrotate_binary = "/usr/sbin/logrotate";
    std::filesystem::path rules_path = "/etc/logrotate.d/markitdown";
    std::filesystem::path state_path = "/var/lib/logrotate/status";
    std::optional<uid_t> state_owner_uid = 0;      // nullopt disables the ownership check
    std::vector<std::string> command_prefix;       // e.g. {"sudo", "-n"} for an unprivileged runtime user
    bool verbose = false;
    bool force = false;
};

struct RetentionConfig {
    std::filesystem::path log_dir = "/app/logs";
    std::optional<std::filesystem::path> archive_dir; // move instead of delete when set
    unsigned int default_retention_days = 30;
    std::map<std::string, unsigned int> retention_days = {
        {"audit", 90},
        {"app", 30},
        {"cli", 15},
        {"sql", 7}
    };
    std::map<std::string, double> environment_multipliers = {
        {"development", 0.5},
        {"test", 0.25},
        {"production", 1.0}
    };
    std::optional<std::uintmax_t> max_retained_bytes; // cap on the total size of rotated artifacts
    bool strict_retention = false;                    // if true, never prune inside the age window for size
    bool dry_run = false;                             // command line only

    [[nodiscard]] std::chrono::days retentionFor(const std::string& logType, const std::string& environment) const;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum logwarden   = spdlog::level::info;
    spdlog::level::level_enum coordinator = spdlog::level::info;
    spdlog::level::level_enum rotation    = spdlog::level::info;
    spdlog::level::level_enum cleanup     = spdlog::level::info;
    spdlog::level::level_enum state       = spdlog::level::info;
    spdlog::level::level_enum config      = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    LogLevelsConfig levels;
};

struct Config {
    std::string environment = "production";
    RotationConfig rotation;
    RetentionConfig retention;
    LoggingConfig logging;
};

// A missing file yields the built-in defaults; a malformed one throws ConfigError.
Config loadConfig(const std::filesystem::path& path);

// ENVIRONMENT, LOG_LEVEL, LOGWARDEN_RULES_PATH, LOGWARDEN_STATE_PATH, LOGWARDEN_LOG_DIR
void applyEnvironmentOverrides(Config& cfg);

}
