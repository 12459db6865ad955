#include <gtest/gtest.h>
#include "hash.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "test_support.hpp"

#include <filesystem>

namespace fs = std::filesystem;

class HashTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        init_localization();
        test_dir = fs::absolute("tmp_hash_test");
        if (fs::exists(test_dir)) fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        if (fs::exists(test_dir)) fs::remove_all(test_dir);
    }
};

TEST_F(HashTest, CalculateSHA256) {
    fs::path test_file = test_dir / "test.txt";
    write_text(test_file, "hello world");

    EXPECT_EQ(calculate_sha256(test_file), "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST_F(HashTest, EmptyFile) {
    fs::path test_file = test_dir / "empty";
    write_text(test_file, "");

    EXPECT_EQ(calculate_sha256(test_file), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(HashTest, LargerThanReadBuffer) {
    fs::path test_file = test_dir / "big";
    write_text(test_file, std::string(20000, 'a'));
    fs::path copy = test_dir / "big_copy";
    fs::copy_file(test_file, copy);

    const std::string digest = calculate_sha256(test_file);
    EXPECT_TRUE(is_valid_sha256(digest));
    EXPECT_EQ(digest, calculate_sha256(copy));
    write_text(copy, std::string(19999, 'a') + "b");
    EXPECT_NE(digest, calculate_sha256(copy));
}

TEST_F(HashTest, MissingFileThrows) {
    EXPECT_THROW(calculate_sha256(test_dir / "nope"), MbootException);
}

TEST_F(HashTest, EqualsIgnoresCase) {
    EXPECT_TRUE(sha256_equals("b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9",
                              "B94D27B9934D3E08A52E52D7DA7DABFAC484EFE37A5380EE9088F7ACE2EFCDE9"));
    EXPECT_FALSE(sha256_equals("b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9",
                               "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde8"));
    EXPECT_FALSE(sha256_equals("abc", "abcd"));
}

TEST_F(HashTest, ValidDigestShape) {
    EXPECT_TRUE(is_valid_sha256("b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9"));
    EXPECT_FALSE(is_valid_sha256("B94D27B9934D3E08A52E52D7DA7DABFAC484EFE37A5380EE9088F7ACE2EFCDE9"));
    EXPECT_FALSE(is_valid_sha256("b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde"));
    EXPECT_FALSE(is_valid_sha256(""));
    EXPECT_FALSE(is_valid_sha256(std::string(64, 'z')));
}
