#include "config.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace {
    std::string env_or_empty(const char* name) {
        const char* value = getenv(name);
        return value ? std::string(value) : std::string();
    }

    fs::path default_cache_dir(const fs::path& tmp_root) {
        if (auto xdg = env_or_empty("XDG_CACHE_HOME"); !xdg.empty()) {
            return fs::path(xdg) / "mboot";
        }
        if (auto home = env_or_empty("HOME"); !home.empty()) {
            return fs::path(home) / ".cache" / "mboot";
        }
        return tmp_root / "mboot-cache";
    }
}

ManifestParserKind parse_manifest_parser_kind(const std::string& value) {
    if (value.empty() || value == "json") {
        return ManifestParserKind::Json;
    }
    if (value == "pattern") {
        return ManifestParserKind::Pattern;
    }
    log_warning(string_format("warning.unknown_manifest_parser", value));
    return ManifestParserKind::Json;
}

Config load_config() {
    Config config;

    if (auto base = env_or_empty("MBOOT_BASE_URL"); !base.empty()) {
        while (base.size() > 1 && base.back() == '/') base.pop_back();
        config.base_url = base;
    }

    if (auto tmp = env_or_empty("MBOOT_TMPDIR"); !tmp.empty()) {
        config.tmp_root = tmp;
    } else if (auto sys_tmp = env_or_empty("TMPDIR"); !sys_tmp.empty()) {
        config.tmp_root = sys_tmp;
    }

    if (auto cache = env_or_empty("MBOOT_CACHE_DIR"); !cache.empty()) {
        config.cache_dir = cache;
    } else {
        config.cache_dir = default_cache_dir(config.tmp_root);
    }

    config.keep_temp = is_truthy(getenv("MBOOT_KEEP_TEMP"));
    config.manifest_parser = parse_manifest_parser_kind(env_or_empty("MBOOT_MANIFEST_PARSER"));

    if (auto cmd = env_or_empty("MBOOT_ELEVATE_CMD"); !cmd.empty()) {
        std::istringstream iss(cmd);
        std::string word;
        while (iss >> word) config.elevation_command.push_back(word);
    }

    return config;
}
