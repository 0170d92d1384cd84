#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>

namespace lw::logging {

class LogRegistry {
public:
    // Initialize all loggers with the stdout sink and per-subsystem levels.
    static void init(const config::LoggingConfig& cfg);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands; the logger name is the phase label on every line
    static std::shared_ptr<spdlog::logger> logwarden()   { return get("logwarden"); }
    static std::shared_ptr<spdlog::logger> coordinator() { return get("coordinator"); }
    static std::shared_ptr<spdlog::logger> rotation()    { return get("rotation"); }
    static std::shared_ptr<spdlog::logger> cleanup()     { return get("cleanup"); }
    static std::shared_ptr<spdlog::logger> state()       { return get("state"); }
    static std::shared_ptr<spdlog::logger> config()      { return get("config"); }

    // Attach/detach an extra sink on every registered logger.
    static void addSink(const spdlog::sink_ptr& sink);
    static void removeSink(const spdlog::sink_ptr& sink);

    [[nodiscard]] static bool isInitialized();

    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

private:
    static inline bool initialized_ = false;
    static inline std::vector<std::string> names_;
};

} // namespace lw::logging
