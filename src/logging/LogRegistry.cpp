#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <stdexcept>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace lw::logging {

void LogRegistry::init(const config::LoggingConfig& cfg) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    // Scheduler log capture reads stdout; colors only when attached to a terminal
    const auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(cfg.levels.console_log_level);
    consoleSink->set_color_mode(spdlog::color_mode::automatic);
    consoleSink->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        if (spdlog::get(name)) spdlog::drop(name);
        const auto logger = std::make_shared<spdlog::logger>(name, spdlog::sinks_init_list{consoleSink});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
        names_.push_back(name);
    };

    const auto& sub = cfg.levels.subsystem_levels;

    makeLogger("logwarden", sub.logwarden);
    makeLogger("coordinator", sub.coordinator);
    makeLogger("rotation", sub.rotation);
    makeLogger("cleanup", sub.cleanup);
    makeLogger("state", sub.state);
    makeLogger("config", sub.config);

    initialized_ = true;
    logwarden()->debug("[LogRegistry] Initialized {} loggers", names_.size());
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

void LogRegistry::addSink(const spdlog::sink_ptr& sink) {
    sink->set_pattern(LOG_FORMAT);
    for (const auto& name : names_) get(name)->sinks().push_back(sink);
}

void LogRegistry::removeSink(const spdlog::sink_ptr& sink) {
    for (const auto& name : names_) {
        auto& sinks = get(name)->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink), sinks.end());
    }
}

bool LogRegistry::isInitialized() { return initialized_; }

}
