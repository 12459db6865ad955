#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

inline constexpr std::string_view DEFAULT_BASE_URL = "https://arbin-com.github.io/mits11-release";
inline constexpr std::chrono::milliseconds ELEVATION_POLL_INTERVAL{1000};
inline constexpr std::chrono::milliseconds ELEVATION_MAX_WAIT = std::chrono::hours(4);

enum class ManifestParserKind {
    Json,
    Pattern
};

// Everything the run reads from the environment, resolved once in main().
struct Config {
    std::string base_url{DEFAULT_BASE_URL};
    std::filesystem::path cache_dir;
    std::filesystem::path tmp_root{"/tmp"};
    bool keep_temp = false;
    ManifestParserKind manifest_parser = ManifestParserKind::Json;
    std::chrono::milliseconds poll_interval = ELEVATION_POLL_INTERVAL;
    std::chrono::milliseconds max_elevation_wait = ELEVATION_MAX_WAIT;
    // Empty means: search PATH when elevation is needed
    std::vector<std::string> elevation_command;
};

Config load_config();
ManifestParserKind parse_manifest_parser_kind(const std::string& value);
