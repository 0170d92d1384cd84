#pragma once

#include "state/StateStore.hpp"

#include <optional>
#include <sys/types.h>

namespace lw::state {

class FileStateStore final : public StateStore {
public:
    struct Options {
        // e.g. /var/lib/logrotate/status; must live on persistent storage
        std::filesystem::path path;

        // Owner required for both the file and its directory; nullopt skips the check
        std::optional<uid_t> expected_owner = std::nullopt;

        mode_t file_mode = 0644;
        mode_t dir_mode = 0755;
    };

    explicit FileStateStore(Options opts);

    [[nodiscard]] const std::filesystem::path& location() const override { return opts_.path; }
    [[nodiscard]] StateAccess check() const override;
    void initialize() override;
    [[nodiscard]] std::optional<std::string> read() const override;
    void write(std::string_view content) override;

private:
    Options opts_;

    StateAccess checkEntry(const std::filesystem::path& p, bool expectDir) const;
    void syncDirectory() const;
    static void chownTo(const std::filesystem::path& p, uid_t owner);
};

}
