#include "retention/RetentionCleaner.hpp"
#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"
#include "runtime/ExitCode.hpp"

#include <algorithm>
#include <regex>
#include <fmt/chrono.h>
#include <fmt/format.h>

using namespace lw::retention;
using namespace lw::runtime;
using namespace lw::logging;

namespace fs = std::filesystem;

namespace lw::retention {

std::optional<std::string> rotatedFrom(const std::string& filename) {
    // logrotate: app.log.1, app.log.2.gz, app.log-20261019, app.log-20261019.gz
    static const std::regex numbered(R"(^(.+\.log)[.-](\d[\w.-]*)$)");
    // in-process rotation: app.20261019-000000.log[.gz|.zst]
    static const std::regex stamped(R"(^(.+)\.\d{8}-\d{6}(\.log)(?:\.gz|\.zst)?$)");

    std::smatch m;
    if (std::regex_match(filename, m, stamped)) return m[1].str() + m[2].str();
    if (std::regex_match(filename, m, numbered)) return m[1].str();
    return std::nullopt;
}

std::string logTypeOf(const std::string& activeName) {
    return activeName.substr(0, activeName.find_first_of("_."));
}

}

RetentionCleaner::RetentionCleaner(Options opts) : opts_(std::move(opts)) {
    if (opts_.log_dir.empty()) throw std::invalid_argument("RetentionCleaner: log_dir is empty.");
}

RetentionCleaner::Options RetentionCleaner::optionsFrom(const config::Config& cfg) {
    const auto& r = cfg.retention;
    return {
        .log_dir = r.log_dir,
        .archive_dir = r.archive_dir,
        .retention = [r, env = cfg.environment](const std::string& type) { return r.retentionFor(type, env); },
        .max_retained_bytes = r.max_retained_bytes,
        .strict_retention = r.strict_retention,
        .dry_run = r.dry_run
    };
}

std::chrono::system_clock::time_point RetentionCleaner::to_sys(fs::file_time_type tp) {
    using namespace std::chrono;
    return time_point_cast<system_clock::duration>(tp - decltype(tp)::clock::now() + system_clock::now());
}

const char* RetentionCleaner::reasonStr(const Reason r) {
    switch (r) {
        case Reason::Age: return "age";
        case Reason::Size: return "size";
    }
    return "?";
}

std::vector<LogArtifact> RetentionCleaner::scan() const {
    std::vector<LogArtifact> out;

    for (const auto& de : fs::directory_iterator(opts_.log_dir)) {
        std::error_code ec;
        if (!de.is_regular_file(ec) || ec) continue;

        const auto name = de.path().filename().string();
        const auto active = rotatedFrom(name);
        if (!active) continue;

        // Entries may vanish underneath us while logrotate is renaming
        const auto mtime = fs::last_write_time(de.path(), ec);
        if (ec) continue;
        const auto size = fs::file_size(de.path(), ec);
        if (ec) continue;

        out.push_back({
            .path = de.path(),
            .active_name = *active,
            .type = logTypeOf(*active),
            .mtime = to_sys(mtime),
            .size = size
        });
    }

    std::ranges::sort(out, [](const LogArtifact& a, const LogArtifact& b) { return a.mtime < b.mtime; });
    return out;
}

PhaseOutcome RetentionCleaner::cleanup() {
    const auto log = LogRegistry::cleanup();
    report_ = {};

    std::error_code ec;
    if (!fs::is_directory(opts_.log_dir, ec)) {
        log->error("[RetentionCleaner] Log directory {} does not exist", opts_.log_dir.string());
        return PhaseOutcome::failure(toInt(ExitCode::NoInput));
    }

    std::vector<LogArtifact> artifacts;
    try {
        artifacts = scan();
    } catch (const fs::filesystem_error& e) {
        log->error("[RetentionCleaner] Failed to scan {}: {}", opts_.log_dir.string(), e.what());
        return PhaseOutcome::failure(toInt(ExitCode::IoError));
    }

    report_.scanned = artifacts.size();
    if (artifacts.empty()) {
        log->info("[RetentionCleaner] No rotated artifacts in {}", opts_.log_dir.string());
        return PhaseOutcome::success();
    }

    const auto now = opts_.now ? opts_.now() : std::chrono::system_clock::now();

    // 1) AGE-BASED PRUNE: anything strictly older than its type's retention
    std::vector<LogArtifact> survivors;
    for (const auto& a : artifacts) {
        const auto limit = opts_.retention ? opts_.retention(a.type) : std::chrono::days(30);
        if (a.mtime < now - limit) dispose(a, Reason::Age);
        else survivors.push_back(a);
    }

    // 2) SIZE-BASED PRUNE (only if NOT strict_retention), oldest first.
    //    This may remove artifacts that are still inside their age window.
    if (!opts_.strict_retention && opts_.max_retained_bytes) {
        std::uintmax_t total = 0;
        for (const auto& a : survivors) total += a.size;

        for (std::size_t i = 0; i < survivors.size() && total > *opts_.max_retained_bytes; ++i)
            if (dispose(survivors[i], Reason::Size)) total -= std::min(total, survivors[i].size);
    }

    const char* verb = opts_.dry_run ? "would be disposed" : opts_.archive_dir ? "archived" : "removed";
    log->info("[RetentionCleaner] Scanned {} artifact(s): {} {} ({} bytes), {} failed",
              report_.scanned, report_.removed, verb, report_.bytes_freed, report_.failed);

    if (report_.failed) return PhaseOutcome::failure(toInt(ExitCode::IoError));
    return PhaseOutcome::success();
}

bool RetentionCleaner::dispose(const LogArtifact& artifact, const Reason why) {
    const auto log = LogRegistry::cleanup();
    const auto name = artifact.path.filename().string();

    if (opts_.dry_run) {
        log->info("[RetentionCleaner] dry-run: would {} {} ({})",
                  opts_.archive_dir ? "archive" : "remove", name, reasonStr(why));
        ++report_.removed;
        report_.bytes_freed += artifact.size;
        return true;
    }

    std::error_code ec;
    const bool done = opts_.archive_dir ? archive(artifact, ec) : fs::remove(artifact.path, ec);

    if (ec) {
        log->error("[RetentionCleaner] Failed to {} {}: {}",
                   opts_.archive_dir ? "archive" : "remove", name, ec.message());
        ++report_.failed;
        return false;
    }
    if (!done) {
        log->debug("[RetentionCleaner] {} vanished before disposal", name);
        return false;
    }

    ++report_.removed;
    report_.bytes_freed += artifact.size;
    log->info("[RetentionCleaner] {} {} ({})", opts_.archive_dir ? "archived" : "removed", name, reasonStr(why));
    return true;
}

bool RetentionCleaner::archive(const LogArtifact& artifact, std::error_code& ec) const {
    fs::create_directories(*opts_.archive_dir, ec);
    if (ec) return false;

    const auto target = archiveTarget(artifact, ec);
    if (ec) return false;

    if (target.filename() != artifact.path.filename())
        LogRegistry::cleanup()->info("[RetentionCleaner] {} already archived, keeping both as {}",
                                     artifact.path.filename().string(), target.filename().string());

    fs::rename(artifact.path, target, ec);

    if (ec == std::errc::cross_device_link) {
        ec.clear();
        fs::copy_file(artifact.path, target, fs::copy_options::none, ec);
        if (ec) return false;
        fs::remove(artifact.path, ec);
    } else if (ec == std::errc::no_such_file_or_directory) {
        ec.clear();
        return false;
    }

    return !ec;
}

// Earlier archives are never replaced: a taken name gets the artifact's mtime
// appended, then a counter.
fs::path RetentionCleaner::archiveTarget(const LogArtifact& artifact, std::error_code& ec) const {
    const auto& dir = *opts_.archive_dir;
    const auto name = artifact.path.filename().string();

    auto target = dir / name;
    if (!fs::exists(target, ec) && !ec) return target;
    if (ec) return {};

    const auto stamped = fmt::format("{}.{:%Y%m%d-%H%M%S}", name,
                                     fmt::localtime(std::chrono::system_clock::to_time_t(artifact.mtime)));
    target = dir / stamped;
    for (unsigned n = 1; fs::exists(target, ec) && !ec; ++n) target = dir / fmt::format("{}.{}", stamped, n);
    if (ec) return {};
    return target;
}
