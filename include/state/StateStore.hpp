#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lw::state {

enum class StateAccess {
    Ready,          // present, owned and protected as required
    Absent,         // first run; initialize() creates it
    BadOwner,
    BadPermissions, // group- or world-writable
    Unreadable
};

std::string_view to_string(StateAccess access);

// sysexits code for an access status; 0 for Ready and Absent.
int exitCodeFor(StateAccess access);

class StateStoreError : public std::runtime_error {
public:
    StateStoreError(const std::string& what, const int exitCode)
        : std::runtime_error(what), exitCode_(exitCode) {}

    [[nodiscard]] int exitCode() const noexcept { return exitCode_; }

private:
    int exitCode_;
};

// Persisted rotation bookkeeping. The content format belongs to the rotation
// engine; everybody else only sees location and access status.
class StateStore {
public:
    virtual ~StateStore() = default;

    [[nodiscard]] virtual const std::filesystem::path& location() const = 0;
    [[nodiscard]] virtual StateAccess check() const = 0;

    // Creates an empty store when absent, no-op otherwise.
    virtual void initialize() = 0;

    [[nodiscard]] virtual std::optional<std::string> read() const = 0;

    // Replaces the whole content atomically.
    virtual void write(std::string_view content) = 0;
};

}
