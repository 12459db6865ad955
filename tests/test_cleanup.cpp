#include <gtest/gtest.h>
#include "cleanup.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "test_support.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

class CleanupTest : public ::testing::Test {
protected:
    fs::path tmp_root;

    void SetUp() override {
        init_localization();
        clear_interrupt();
        tmp_root = fs::absolute("tmp_cleanup_test");
        if (fs::exists(tmp_root)) fs::remove_all(tmp_root);
        fs::create_directories(tmp_root);
    }

    void TearDown() override {
        clear_interrupt();
        if (fs::exists(tmp_root)) fs::remove_all(tmp_root);
    }
};

TEST_F(CleanupTest, WorkDirIsRemoved) {
    fs::path path;
    {
        WorkDir work(tmp_root, false);
        path = work.path();
        EXPECT_EQ(path.parent_path().string(), tmp_root.string());
        EXPECT_TRUE(path.filename().string().starts_with("mboot_"));
        ASSERT_TRUE(fs::is_directory(path));
        write_text(path / "extract" / "deep" / "file", "x");
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(CleanupTest, WorkDirIsPrivateToOwner) {
    WorkDir work(tmp_root, false);
    struct stat st;
    ASSERT_EQ(lstat(work.path().c_str(), &st), 0);
    EXPECT_TRUE(S_ISDIR(st.st_mode));
    EXPECT_EQ(st.st_uid, geteuid());
    EXPECT_EQ(st.st_mode & 07777, 0700u);
}

TEST_F(CleanupTest, EachWorkDirIsNew) {
    WorkDir first(tmp_root, false);
    WorkDir second(tmp_root, false);
    EXPECT_NE(first.path().string(), second.path().string());
}

TEST_F(CleanupTest, WorkDirRemovedOnException) {
    fs::path path;
    try {
        WorkDir work(tmp_root, false);
        path = work.path();
        throw MbootException("boom");
    } catch (const MbootException&) {
    }
    EXPECT_FALSE(path.empty());
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(CleanupTest, WorkDirKept) {
    fs::path path;
    {
        WorkDir work(tmp_root, true);
        path = work.path();
    }
    EXPECT_TRUE(fs::is_directory(path));
}

TEST_F(CleanupTest, ExistingDirectoriesAreNeverAdopted) {
    // Directories planted ahead of the run, including one named after our
    // pid, are never used and stay untouched.
    std::vector<fs::path> planted = {tmp_root / ("mboot_" + std::to_string(getpid()))};
    for (int i = 0; i < 8; ++i) {
        planted.push_back(tmp_root / ("mboot_planted" + std::to_string(i)));
    }
    for (const auto& dir : planted) {
        write_text(dir / "script" / "install.sh", "#!/bin/sh\n");
        fs::permissions(dir, fs::perms::all, fs::perm_options::replace);
    }

    fs::path used;
    {
        WorkDir work(tmp_root, false);
        used = work.path();
        for (const auto& dir : planted) {
            EXPECT_NE(used.string(), dir.string());
        }
        EXPECT_TRUE(fs::is_empty(used));
    }
    for (const auto& dir : planted) {
        EXPECT_TRUE(fs::exists(dir / "script" / "install.sh")) << dir.string();
    }
}

TEST_F(CleanupTest, UnusableTmpRootIsFatal) {
    const fs::path file_root = tmp_root / "not_a_dir";
    write_text(file_root, "x");
    EXPECT_THROW(WorkDir(file_root, false), MbootException);
}

TEST_F(CleanupTest, StaleWorkDirsAreRemoved) {
    const fs::path old_dir = tmp_root / "mboot_999999";
    const fs::path fresh_dir = tmp_root / "mboot_999998";
    const fs::path unrelated = tmp_root / "other_999997";
    fs::create_directories(old_dir);
    fs::create_directories(fresh_dir);
    fs::create_directories(unrelated);
    const auto two_days_ago = fs::file_time_type::clock::now() - std::chrono::hours(48);
    fs::last_write_time(old_dir, two_days_ago);
    fs::last_write_time(unrelated, two_days_ago);

    cleanup_stale_work_dirs(tmp_root);

    EXPECT_FALSE(fs::exists(old_dir));
    EXPECT_TRUE(fs::exists(fresh_dir));
    EXPECT_TRUE(fs::exists(unrelated));
}

TEST_F(CleanupTest, StaleCleanupToleratesMissingRoot) {
    EXPECT_NO_THROW(cleanup_stale_work_dirs(tmp_root / "does_not_exist"));
}

TEST_F(CleanupTest, SettleKeepsVerifiedArtifact) {
    const fs::path artifact = tmp_root / "cache" / "mits11-5.0.1-linux-x64.zip";
    write_text(artifact, "payload");

    EXPECT_TRUE(settle_cached_artifact(artifact, calculate_sha256(artifact)));
    EXPECT_TRUE(fs::exists(artifact));
}

TEST_F(CleanupTest, SettleRemovesChangedArtifact) {
    const fs::path artifact = tmp_root / "cache" / "mits11-5.0.1-linux-x64.zip";
    write_text(artifact, "payload");
    const std::string sha = calculate_sha256(artifact);
    write_text(artifact, "tampered");

    EXPECT_FALSE(settle_cached_artifact(artifact, sha));
    EXPECT_FALSE(fs::exists(artifact));
}

TEST_F(CleanupTest, SettleMissingArtifact) {
    EXPECT_FALSE(settle_cached_artifact(tmp_root / "absent.zip", std::string(64, '0')));
}

TEST_F(CleanupTest, InterruptGuardRecordsSignal) {
    {
        InterruptGuard guard;
        EXPECT_FALSE(interrupt_requested());
        EXPECT_NO_THROW(throw_if_interrupted());

        raise(SIGTERM);
        EXPECT_TRUE(interrupt_requested());
        EXPECT_EQ(pending_signal(), SIGTERM);
        try {
            throw_if_interrupted();
            FAIL() << "expected InterruptedException";
        } catch (const InterruptedException& e) {
            EXPECT_EQ(e.signal(), SIGTERM);
        }
    }
    clear_interrupt();
    EXPECT_FALSE(interrupt_requested());
}
