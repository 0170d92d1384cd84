#include "state/FileStateStore.hpp"
#include "runtime/ExitCode.hpp"
#include "logging/LogRegistry.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <fmt/format.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace lw::state;
using namespace lw::logging;
using lw::runtime::ExitCode;
using lw::runtime::toInt;

namespace lw::state {

std::string_view to_string(const StateAccess access) {
    switch (access) {
        case StateAccess::Ready: return "ready";
        case StateAccess::Absent: return "absent";
        case StateAccess::BadOwner: return "bad owner";
        case StateAccess::BadPermissions: return "bad permissions";
        case StateAccess::Unreadable: return "unreadable";
    }
    return "?";
}

int exitCodeFor(const StateAccess access) {
    switch (access) {
        case StateAccess::Ready:
        case StateAccess::Absent: return toInt(ExitCode::Success);
        case StateAccess::BadOwner:
        case StateAccess::BadPermissions: return toInt(ExitCode::NoPerm);
        case StateAccess::Unreadable: return toInt(ExitCode::IoError);
    }
    return toInt(ExitCode::IoError);
}

}

FileStateStore::FileStateStore(Options opts) : opts_(std::move(opts)) {
    if (opts_.path.empty()) throw std::invalid_argument("FileStateStore: path is empty.");
    if (!opts_.path.has_parent_path()) opts_.path = std::filesystem::path(".") / opts_.path;
}

StateAccess FileStateStore::checkEntry(const std::filesystem::path& p, const bool expectDir) const {
    struct stat st{};
    if (::stat(p.c_str(), &st) != 0) return errno == ENOENT ? StateAccess::Absent : StateAccess::Unreadable;

    if (expectDir ? !S_ISDIR(st.st_mode) : !S_ISREG(st.st_mode)) return StateAccess::Unreadable;
    if (opts_.expected_owner && st.st_uid != *opts_.expected_owner) return StateAccess::BadOwner;
    if (st.st_mode & (S_IWGRP | S_IWOTH)) return StateAccess::BadPermissions;
    if (::access(p.c_str(), expectDir ? X_OK : R_OK) != 0) return StateAccess::Unreadable;

    return StateAccess::Ready;
}

StateAccess FileStateStore::check() const {
    if (const auto dir = checkEntry(opts_.path.parent_path(), true); dir != StateAccess::Ready) return dir;
    return checkEntry(opts_.path, false);
}

void FileStateStore::initialize() {
    const auto access = check();
    if (access == StateAccess::Ready) return;
    if (access != StateAccess::Absent)
        throw StateStoreError(fmt::format("State store {} is {}", opts_.path.string(), to_string(access)),
                              exitCodeFor(access));

    namespace fs = std::filesystem;
    std::error_code ec;

    const auto dir = opts_.path.parent_path();
    const bool createdDir = !fs::exists(dir, ec);
    if (createdDir) {
        fs::create_directories(dir, ec);
        if (ec)
            throw StateStoreError(fmt::format("Failed to create state directory {}: {}", dir.string(), ec.message()),
                                  toInt(ExitCode::CantCreate));
        fs::permissions(dir, static_cast<fs::perms>(opts_.dir_mode), ec);
        if (ec)
            throw StateStoreError(fmt::format("Failed to chmod state directory {}: {}", dir.string(), ec.message()),
                                  toInt(ExitCode::CantCreate));
    }

    if (!fs::exists(opts_.path, ec)) {
        write("");
        LogRegistry::state()->info("[FileStateStore] Initialized empty state store {}", opts_.path.string());

        // Only root can hand what it created over to the configured owner
        if (opts_.expected_owner && ::geteuid() == 0 && *opts_.expected_owner != 0) {
            if (createdDir) chownTo(dir, *opts_.expected_owner);
            chownTo(opts_.path, *opts_.expected_owner);
        }
    }

    // A store the next run would refuse must fail now, not after a successful first run
    if (const auto after = check(); after != StateAccess::Ready)
        throw StateStoreError(fmt::format("State store {} is {} after initialization", opts_.path.string(),
                                          to_string(after)),
                              after == StateAccess::Absent ? toInt(ExitCode::CantCreate) : exitCodeFor(after));
}

void FileStateStore::chownTo(const std::filesystem::path& p, const uid_t owner) {
    if (::chown(p.c_str(), owner, static_cast<gid_t>(-1)) != 0)
        throw StateStoreError(fmt::format("Failed to chown {}: {}", p.string(), std::strerror(errno)),
                              toInt(ExitCode::CantCreate));
}

std::optional<std::string> FileStateStore::read() const {
    std::error_code ec;
    if (!std::filesystem::exists(opts_.path, ec)) {
        if (ec) throw StateStoreError(fmt::format("Failed to stat {}: {}", opts_.path.string(), ec.message()),
                                      toInt(ExitCode::IoError));
        return std::nullopt;
    }

    std::ifstream in(opts_.path, std::ios::binary);
    if (!in.is_open())
        throw StateStoreError(fmt::format("Failed to open state store {}", opts_.path.string()),
                              toInt(ExitCode::IoError));

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad())
        throw StateStoreError(fmt::format("Failed to read state store {}", opts_.path.string()),
                              toInt(ExitCode::IoError));
    return buffer.str();
}

void FileStateStore::write(const std::string_view content) {
    auto tmp = opts_.path;
    tmp += ".tmp";

    const int fd = ::open(tmp.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, opts_.file_mode);
    if (fd < 0)
        throw StateStoreError(fmt::format("Failed to open {}: {}", tmp.string(), std::strerror(errno)),
                              toInt(ExitCode::CantCreate));

    const auto fail = [&](const char* what) {
        const int err = errno;
        ::close(fd);
        ::unlink(tmp.c_str());
        throw StateStoreError(fmt::format("{} {}: {}", what, tmp.string(), std::strerror(err)),
                              toInt(ExitCode::IoError));
    };

    const char* data = content.data();
    size_t left = content.size();
    while (left) {
        const ssize_t n = ::write(fd, data, left);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) fail("Failed to write");
        data += n;
        left -= static_cast<size_t>(n);
    }

    // umask may have stripped bits from the creation mode
    if (::fchmod(fd, opts_.file_mode) != 0) fail("Failed to chmod");
    if (::fsync(fd) != 0) fail("Failed to fsync");
    if (::close(fd) != 0) {
        const int err = errno;
        ::unlink(tmp.c_str());
        throw StateStoreError(fmt::format("Failed to close {}: {}", tmp.string(), std::strerror(err)),
                              toInt(ExitCode::IoError));
    }

    std::error_code ec;
    std::filesystem::rename(tmp, opts_.path, ec);
    if (ec) {
        const auto reason = ec.message();
        std::filesystem::remove(tmp, ec);
        throw StateStoreError(fmt::format("Failed to replace state store {}: {}", opts_.path.string(), reason),
                              toInt(ExitCode::IoError));
    }

    syncDirectory();
}

void FileStateStore::syncDirectory() const {
    const int dfd = ::open(opts_.path.parent_path().c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd < 0) return;
    if (::fsync(dfd) != 0)
        LogRegistry::state()->warn("[FileStateStore] fsync of {} failed: {}",
                                   opts_.path.parent_path().string(), std::strerror(errno));
    ::close(dfd);
}
