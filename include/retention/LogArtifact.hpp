#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace lw::retention {

// A rotated log file. Active files never become artifacts.
struct LogArtifact {
    std::filesystem::path path;
    std::string active_name;   // e.g. "app_production.log" for "app_production.log.3.gz"
    std::string type;          // e.g. "app"
    std::chrono::system_clock::time_point mtime;
    std::uintmax_t size = 0;
};

// Name of the active log a rotated file was produced from, or nullopt when the
// file is not a rotated artifact (including the active log itself).
std::optional<std::string> rotatedFrom(const std::string& filename);

// Retention class of an active log: the name up to the first '_' or '.'.
std::string logTypeOf(const std::string& activeName);

}
