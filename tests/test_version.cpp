#include <gtest/gtest.h>
#include "version.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "test_support.hpp"

#include <filesystem>

namespace fs = std::filesystem;

class VersionTest : public ::testing::Test {
protected:
    fs::path work_dir;

    void SetUp() override {
        init_localization();
        work_dir = fs::absolute("tmp_version_test");
        if (fs::exists(work_dir)) fs::remove_all(work_dir);
        fs::create_directories(work_dir);
    }

    void TearDown() override {
        if (fs::exists(work_dir)) fs::remove_all(work_dir);
    }
};

TEST_F(VersionTest, TargetValidation) {
    for (const char* ok : {"", "stable", "latest", "alpha", "nightly", "5.0.1", "10.20.30", "5.0.1-rc.1", "5.0.1+build.7"}) {
        EXPECT_TRUE(is_valid_target(ok)) << ok;
        EXPECT_NO_THROW(validate_target(ok));
    }
    for (const char* bad : {"beta", "Stable", "5.0", "5", "v5.0.1", "5.0.1-", "5.0.1 ", " 5.0.1", "5.0.1-rc 1", "../etc", "5.0.x"}) {
        EXPECT_FALSE(is_valid_target(bad)) << bad;
        EXPECT_THROW(validate_target(bad), InvalidTargetException) << bad;
    }
}

TEST_F(VersionTest, ChannelMapping) {
    EXPECT_EQ(channel_for_target(""), "stable");
    EXPECT_EQ(channel_for_target("stable"), "stable");
    EXPECT_EQ(channel_for_target("latest"), "stable");
    EXPECT_EQ(channel_for_target("alpha"), "alpha");
    EXPECT_EQ(channel_for_target("nightly"), "nightly");
    EXPECT_FALSE(channel_for_target("5.0.1").has_value());
}

TEST_F(VersionTest, ExplicitVersionNeverTouchesNetwork) {
    // The endpoint does not exist; any request would fail.
    const std::string base = file_url(work_dir / "missing");
    EXPECT_EQ(resolve_version("5.0.1", base), "5.0.1");
    EXPECT_EQ(resolve_version("5.0.1-rc.2+b3", base), "5.0.1-rc.2+b3");
}

TEST_F(VersionTest, ChannelBodyIsTrimmed) {
    FakeReleaseServer server(work_dir / "server");
    server.set_channel("stable", "  5.0.1\n");
    server.set_channel("alpha", "\t5.1.0-alpha.3\r\n\n");
    server.set_channel("nightly", "5.2.0-nightly.20260101");

    EXPECT_EQ(resolve_version("", server.base_url()), "5.0.1");
    EXPECT_EQ(resolve_version("stable", server.base_url()), "5.0.1");
    EXPECT_EQ(resolve_version("latest", server.base_url()), "5.0.1");
    EXPECT_EQ(resolve_version("alpha", server.base_url()), "5.1.0-alpha.3");
    EXPECT_EQ(resolve_version("nightly", server.base_url()), "5.2.0-nightly.20260101");
}

TEST_F(VersionTest, EmptyPointerFails) {
    FakeReleaseServer server(work_dir / "server");
    server.set_channel("alpha", " \n\t ");
    try {
        resolve_version("alpha", server.base_url());
        FAIL() << "expected NetworkException";
    } catch (const NetworkException& e) {
        EXPECT_NE(std::string(e.what()).find("alpha"), std::string::npos);
    }
}

TEST_F(VersionTest, MissingPointerNamesTarget) {
    FakeReleaseServer server(work_dir / "server");
    try {
        resolve_version("latest", server.base_url());
        FAIL() << "expected NetworkException";
    } catch (const NetworkException& e) {
        EXPECT_NE(std::string(e.what()).find("latest"), std::string::npos);
    }
}

TEST_F(VersionTest, InvalidTargetFailsBeforeFetch) {
    FakeReleaseServer server(work_dir / "server");
    server.set_channel("stable", "5.0.1");
    EXPECT_THROW(resolve_version("beta", server.base_url()), InvalidTargetException);
}

TEST_F(VersionTest, PublishedVersionShape) {
    for (const char* ok : {"5.0.1", "5.1.0-alpha.3", "5.2.0-nightly.20260101", "5.0.1+build-7"}) {
        EXPECT_TRUE(is_valid_published_version(ok)) << ok;
    }
    for (const char* bad : {"", "5.0", "5.0.1/../x", "5.0.1-a/b", "5.0.1-..", "5.0.1-a..b", "latest", "5.0.1-a\x01", "../5.0.1"}) {
        EXPECT_FALSE(is_valid_published_version(bad)) << bad;
    }
}

TEST_F(VersionTest, ChannelPointingOutsideReleaseTreeFails) {
    FakeReleaseServer server(work_dir / "server");
    for (const char* body : {"5.0.1/../../etc", "5.0.1-x/y", "../5.0.1", "stable", "5.0.1-a\x7f"}) {
        server.set_channel("nightly", body);
        try {
            resolve_version("nightly", server.base_url());
            FAIL() << "expected NetworkException for " << body;
        } catch (const NetworkException& e) {
            EXPECT_NE(std::string(e.what()).find("nightly"), std::string::npos);
        }
    }
}
