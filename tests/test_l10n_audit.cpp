#include <gtest/gtest.h>
#include "localization.hpp"
#include <filesystem>
#include <fstream>
#include <regex>
#include <set>

namespace fs = std::filesystem;

class L10nIntegrityTest : public ::testing::Test {
protected:
    const fs::path project_root{MBOOT_SOURCE_DIR};

    void SetUp() override {
        init_localization();
    }

    std::set<std::string> extract_keys_from_source(const fs::path& src_dir) {
        std::set<std::string> keys;
        std::regex key_regex("(?:get_string|string_format)\\s*\\(\\s*\"([^\"]+)\"");

        for (auto const& dir_entry : fs::recursive_directory_iterator(src_dir)) {
            if (dir_entry.is_regular_file() && (dir_entry.path().extension() == ".cpp" || dir_entry.path().extension() == ".hpp")) {
                std::ifstream f(dir_entry.path());
                std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
                auto words_begin = std::sregex_iterator(content.begin(), content.end(), key_regex);
                auto words_end = std::sregex_iterator();
                for (std::sregex_iterator i = words_begin; i != words_end; ++i) {
                    keys.insert((*i)[1].str());
                }
            }
        }
        return keys;
    }

    std::set<std::string> keys_in_file(const fs::path& file) {
        std::set<std::string> keys;
        std::ifstream f(file);
        std::string line;
        while (std::getline(f, line)) {
            if (line.empty() || line[0] == '#') continue;
            auto pos = line.find('=');
            if (pos != std::string::npos) keys.insert(line.substr(0, pos));
        }
        return keys;
    }
};

TEST_F(L10nIntegrityTest, AllSourceKeysExistInTranslations) {
    auto source_keys = extract_keys_from_source(project_root / "src");
    ASSERT_FALSE(source_keys.empty());

    std::vector<std::string> missing_keys;
    for (const auto& key : source_keys) {
        std::string val = get_string(key);
        if (val.find("[MISSING_STRING:") != std::string::npos) {
            missing_keys.push_back(key);
        }
    }

    std::string error_msg = "The following keys are missing in localization files: ";
    for(const auto& k : missing_keys) error_msg += k + ", ";

    EXPECT_TRUE(missing_keys.empty()) << error_msg;
}

TEST_F(L10nIntegrityTest, LanguagesDefineSameKeys) {
    auto en = keys_in_file(project_root / "l10n" / "en.txt");
    auto zh = keys_in_file(project_root / "l10n" / "zh.txt");
    ASSERT_FALSE(en.empty());

    std::string diff;
    for (const auto& k : en) if (!zh.count(k)) diff += "zh lacks " + k + ", ";
    for (const auto& k : zh) if (!en.count(k)) diff += "en lacks " + k + ", ";
    EXPECT_TRUE(diff.empty()) << diff;
}
