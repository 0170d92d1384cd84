#include <gtest/gtest.h>

#include "state/FileStateStore.hpp"
#include "runtime/ExitCode.hpp"
#include "TestHelpers.hpp"

#include <sys/stat.h>
#include <unistd.h>

using namespace lw::state;
using namespace lw::runtime;
using namespace lw::test;

class FileStateStoreTest : public ::testing::Test {
protected:
    TempDir tmp;

    FileStateStore make(const fs::path& path, const std::optional<uid_t> owner) const {
        return FileStateStore({.path = path, .expected_owner = owner});
    }
};

TEST_F(FileStateStoreTest, AbsentUntilInitialized) {
    auto store = make(tmp / "lib" / "status", ::geteuid());

    EXPECT_EQ(store.check(), StateAccess::Absent);
    EXPECT_EQ(store.read(), std::nullopt);

    store.initialize();
    EXPECT_EQ(store.check(), StateAccess::Ready);
    EXPECT_EQ(store.read(), "");

    struct stat st{};
    ASSERT_EQ(::stat((tmp / "lib" / "status").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 07777, 0644u);
    ASSERT_EQ(::stat((tmp / "lib").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 07777, 0755u);
}

TEST_F(FileStateStoreTest, InitializeKeepsExistingContent) {
    auto store = make(tmp / "status", ::geteuid());
    store.write("logrotate state -- version 2\n");
    store.initialize();
    EXPECT_EQ(store.read(), "logrotate state -- version 2\n");
}

TEST_F(FileStateStoreTest, WriteReplacesAtomically) {
    auto store = make(tmp / "status", std::nullopt);
    store.write("first");
    store.write("second");

    EXPECT_EQ(store.read(), "second");
    EXPECT_FALSE(fs::exists(tmp / "status.tmp"));
}

TEST_F(FileStateStoreTest, WrongOwnerIsRejected) {
    auto store = make(tmp / "status", ::geteuid() + 1);
    writeFile(tmp / "status", "");

    // the containing directory already fails the owner check
    EXPECT_EQ(store.check(), StateAccess::BadOwner);

    try {
        store.initialize();
        FAIL() << "initialize() accepted a store with the wrong owner";
    } catch (const StateStoreError& e) {
        EXPECT_EQ(e.exitCode(), toInt(ExitCode::NoPerm));
    }
}

TEST_F(FileStateStoreTest, WritableByOthersIsRejected) {
    auto store = make(tmp / "status", ::geteuid());
    writeFile(tmp / "status", "");
    fs::permissions(tmp / "status", fs::perms(0666));

    EXPECT_EQ(store.check(), StateAccess::BadPermissions);
    EXPECT_EQ(exitCodeFor(store.check()), toInt(ExitCode::NoPerm));

    fs::permissions(tmp / "status", fs::perms(0644));
    EXPECT_EQ(store.check(), StateAccess::Ready);
}

TEST_F(FileStateStoreTest, GroupWritableDirectoryIsRejected) {
    fs::create_directories(tmp / "lib");
    fs::permissions(tmp / "lib", fs::perms(0775));
    auto store = make(tmp / "lib" / "status", ::geteuid());

    EXPECT_EQ(store.check(), StateAccess::BadPermissions);
}

TEST_F(FileStateStoreTest, DirectoryInPlaceOfFileIsUnreadable) {
    fs::create_directories(tmp / "status");
    auto store = make(tmp / "status", ::geteuid());

    EXPECT_EQ(store.check(), StateAccess::Unreadable);
    EXPECT_EQ(exitCodeFor(StateAccess::Unreadable), toInt(ExitCode::IoError));
}

TEST_F(FileStateStoreTest, OwnerCheckCanBeDisabled) {
    writeFile(tmp / "status", "x");
    auto store = make(tmp / "status", std::nullopt);
    EXPECT_EQ(store.check(), StateAccess::Ready);
}

TEST_F(FileStateStoreTest, InitializeHandsCreatedDirectoryToOwner) {
    if (::geteuid() != 0) GTEST_SKIP() << "chown to another uid needs root";

    constexpr uid_t nobody = 65534;
    auto store = make(tmp / "lib" / "status", nobody);

    store.initialize();
    EXPECT_EQ(store.check(), StateAccess::Ready);

    struct stat st{};
    ASSERT_EQ(::stat((tmp / "lib").c_str(), &st), 0);
    EXPECT_EQ(st.st_uid, nobody);
    ASSERT_EQ(::stat((tmp / "lib" / "status").c_str(), &st), 0);
    EXPECT_EQ(st.st_uid, nobody);

    // the next run sees the same store as usable
    store.initialize();
    EXPECT_EQ(store.check(), StateAccess::Ready);
}

TEST_F(FileStateStoreTest, InitializeFailsWhenOwnerCannotBeSatisfied) {
    if (::geteuid() == 0) GTEST_SKIP() << "root can always chown";

    auto store = make(tmp / "lib" / "status", ::geteuid() + 1);
    ASSERT_EQ(store.check(), StateAccess::Absent);

    try {
        store.initialize();
        FAIL() << "initialize() produced a store its own check() rejects";
    } catch (const StateStoreError& e) {
        EXPECT_EQ(e.exitCode(), toInt(ExitCode::NoPerm));
    }
}

TEST(FileStateStoreOptionsTest, EmptyPathRejected) {
    EXPECT_THROW(FileStateStore({.path = ""}), std::invalid_argument);
}
