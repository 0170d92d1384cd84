#pragma once

#include "retention/CleanupPass.hpp"
#include "retention/LogArtifact.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lw::config { struct Config; }

namespace lw::retention {

// Scan-and-filter over the rotated artifacts of one log directory. Running it
// twice without new rotations removes nothing the second time.
class RetentionCleaner final : public CleanupPass {
public:
    struct Options {
        std::filesystem::path log_dir;

        // Move expired artifacts here instead of deleting them
        std::optional<std::filesystem::path> archive_dir = std::nullopt;

        // Age limit per log type; 30 days when unset
        std::function<std::chrono::days(const std::string& logType)> retention = nullptr;

        // Cap on the total size of surviving artifacts, oldest go first
        std::optional<std::uintmax_t> max_retained_bytes = std::nullopt;
        bool strict_retention = false;   // if true, ignore the size cap entirely

        bool dry_run = false;

        std::function<std::chrono::system_clock::time_point()> now = nullptr;
    };

    struct Report {
        std::size_t scanned = 0;
        std::size_t removed = 0;   // or archived; in dry-run, would be
        std::size_t failed = 0;
        std::uintmax_t bytes_freed = 0;
    };

    explicit RetentionCleaner(Options opts);

    static Options optionsFrom(const config::Config& cfg);

    [[nodiscard]] std::string_view name() const override { return "retention"; }
    runtime::PhaseOutcome cleanup() override;

    // Rotated artifacts, oldest first. Throws std::filesystem::filesystem_error.
    [[nodiscard]] std::vector<LogArtifact> scan() const;

    [[nodiscard]] const Report& lastReport() const { return report_; }

private:
    enum class Reason { Age, Size };

    Options opts_;
    Report report_;

    bool dispose(const LogArtifact& artifact, Reason why);
    bool archive(const LogArtifact& artifact, std::error_code& ec) const;
    std::filesystem::path archiveTarget(const LogArtifact& artifact, std::error_code& ec) const;

    static const char* reasonStr(Reason r);
    static std::chrono::system_clock::time_point to_sys(std::filesystem::file_time_type tp);
};

}
