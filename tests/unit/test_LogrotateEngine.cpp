#include <gtest/gtest.h>

#include "rotation/LogrotateEngine.hpp"
#include "config/Config.hpp"
#include "runtime/ExitCode.hpp"
#include "Fakes.hpp"
#include "TestHelpers.hpp"

#include <csignal>

using namespace lw::rotation;
using namespace lw::runtime;
using namespace lw::state;
using namespace lw::test;

// The "logrotate" under test is a shell script run through the command prefix,
// so nothing needs the exec bit on the temp filesystem.
class LogrotateEngineTest : public ::testing::Test {
protected:
    TempDir tmp;
    MemoryStateStore store{"/var/lib/logrotate/status"};

    void SetUp() override { writeFile(tmp / "rules.conf", "/app/logs/*.log { daily }\n"); }

    LogrotateEngine withScript(const std::string& body) const {
        writeFile(tmp / "logrotate.sh", body);
        return LogrotateEngine({
            .binary = "/usr/sbin/logrotate",
            .rules_path = tmp / "rules.conf",
            .command_prefix = {"/bin/sh", (tmp / "logrotate.sh").string()}
        });
    }
};

TEST_F(LogrotateEngineTest, CommandLinePassesStateAndRules) {
    auto engine = LogrotateEngine({
        .binary = "/usr/sbin/logrotate",
        .rules_path = "/etc/logrotate.d/markitdown",
        .command_prefix = {"sudo", "-n"},
        .verbose = true,
        .force = true
    });

    const std::vector<std::string> expected = {
        "sudo", "-n", "/usr/sbin/logrotate", "-v", "-f",
        "-s", "/var/lib/logrotate/status", "/etc/logrotate.d/markitdown"
    };
    EXPECT_EQ(engine.commandLine(store), expected);
}

TEST_F(LogrotateEngineTest, SuccessStatus) {
    auto engine = withScript("printf '%s\\n' \"$@\" > \"$(dirname \"$0\")/args\"\nexit 0\n");
    store.content = "";

    const auto outcome = engine.rotate(store);
    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(readFile(tmp / "args"),
              "/usr/sbin/logrotate\n-s\n/var/lib/logrotate/status\n" + (tmp / "rules.conf").string() + "\n");
}

TEST_F(LogrotateEngineTest, FailureStatusPassesThrough) {
    auto engine = withScript("exit 3\n");
    store.content = "";

    const auto outcome = engine.rotate(store);
    EXPECT_EQ(outcome.kind(), PhaseOutcome::Kind::Failure);
    EXPECT_EQ(outcome.status(), 3);
}

TEST_F(LogrotateEngineTest, SignalDeathMapsToShellConvention) {
    auto engine = withScript("kill -TERM $$\n");
    store.content = "";

    EXPECT_EQ(engine.rotate(store).status(), signalStatus(SIGTERM));
}

TEST_F(LogrotateEngineTest, MissingBinaryIs127) {
    auto engine = LogrotateEngine({
        .binary = tmp / "no-such-logrotate",
        .rules_path = tmp / "rules.conf"
    });
    store.content = "";

    EXPECT_EQ(engine.rotate(store).status(), toInt(ExitCode::ExecFailed));
}

TEST_F(LogrotateEngineTest, MissingRuleFileFailsWithoutRunning) {
    auto engine = withScript("touch \"$(dirname \"$0\")/ran\"\nexit 0\n");
    fs::remove(tmp / "rules.conf");
    store.content = "";

    EXPECT_EQ(engine.rotate(store).status(), toInt(ExitCode::Config));
    EXPECT_FALSE(fs::exists(tmp / "ran"));
}

TEST_F(LogrotateEngineTest, InitializesAbsentState) {
    auto engine = withScript("exit 0\n");

    ASSERT_EQ(store.check(), StateAccess::Absent);
    EXPECT_TRUE(engine.rotate(store).ok());
    EXPECT_EQ(store.initializeCalls, 1);
    EXPECT_EQ(store.check(), StateAccess::Ready);
}

TEST_F(LogrotateEngineTest, CorruptStateIsRefused) {
    auto engine = withScript("touch \"$(dirname \"$0\")/ran\"\nexit 0\n");
    store.content = std::string("\x00\x13garbage", 9);

    try {
        (void)engine.rotate(store);
        FAIL() << "rotate() ran on a corrupt state store";
    } catch (const StateStoreError& e) {
        EXPECT_EQ(e.exitCode(), toInt(ExitCode::DataError));
    }
    EXPECT_FALSE(fs::exists(tmp / "ran"));
}

TEST(LogrotateStateFormatTest, Signature) {
    EXPECT_TRUE(LogrotateEngine::isValidState(""));
    EXPECT_TRUE(LogrotateEngine::isValidState("\n"));
    EXPECT_TRUE(LogrotateEngine::isValidState("logrotate state -- version 2\n\"/app/logs/app.log\" 2026-10-19-0:0:0\n"));
    EXPECT_FALSE(LogrotateEngine::isValidState("\"/app/logs/app.log\" 2026-10-19-0:0:0\n"));
}

TEST(LogrotateOptionsTest, FromConfig) {
    lw::config::RotationConfig cfg;
    cfg.command_prefix = {"sudo", "-n"};
    cfg.verbose = true;

    const auto opts = LogrotateEngine::optionsFrom(cfg);
    EXPECT_EQ(opts.binary.string(), "/usr/sbin/logrotate");
    EXPECT_EQ(opts.rules_path.string(), "/etc/logrotate.d/markitdown");
    EXPECT_EQ(opts.command_prefix, cfg.command_prefix);
    EXPECT_TRUE(opts.verbose);
    EXPECT_FALSE(opts.force);
}
