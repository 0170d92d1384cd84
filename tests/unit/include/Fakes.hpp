#pragma once

#include "state/StateStore.hpp"
#include "rotation/RotationEngine.hpp"
#include "retention/CleanupPass.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace lw::test {

class MemoryStateStore final : public state::StateStore {
public:
    explicit MemoryStateStore(std::filesystem::path location = "/var/lib/logrotate/status")
        : location_(std::move(location)) {}

    [[nodiscard]] const std::filesystem::path& location() const override { return location_; }

    [[nodiscard]] state::StateAccess check() const override {
        if (forced) return *forced;
        return content ? state::StateAccess::Ready : state::StateAccess::Absent;
    }

    void initialize() override {
        ++initializeCalls;
        if (!content) content = std::string{};
    }

    [[nodiscard]] std::optional<std::string> read() const override { return content; }

    void write(const std::string_view c) override {
        ++writes;
        content = std::string(c);
    }

    std::optional<std::string> content;
    std::optional<state::StateAccess> forced;
    int initializeCalls = 0;
    int writes = 0;

private:
    std::filesystem::path location_;
};

// Returns a fixed status; initializes the store on first use like logrotate does.
class ScriptedRotationEngine final : public rotation::RotationEngine {
public:
    explicit ScriptedRotationEngine(const int status = 0) : status_(status) {}

    [[nodiscard]] std::string_view name() const override { return "scripted-rotation"; }

    runtime::PhaseOutcome rotate(state::StateStore& store) override {
        ++calls;
        if (store.check() == state::StateAccess::Absent) store.initialize();
        if (throwCorrupt) throw state::StateStoreError("corrupt state", throwCorrupt);
        return runtime::PhaseOutcome::fromStatus(status_);
    }

    int calls = 0;
    int throwCorrupt = 0;

private:
    int status_;
};

class ScriptedCleanupPass final : public retention::CleanupPass {
public:
    explicit ScriptedCleanupPass(const int status = 0) : status_(status) {}

    [[nodiscard]] std::string_view name() const override { return "scripted-cleanup"; }

    runtime::PhaseOutcome cleanup() override {
        ++calls;
        return runtime::PhaseOutcome::fromStatus(status_);
    }

    int calls = 0;

private:
    int status_;
};

}
