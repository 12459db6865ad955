#include "version.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <regex>

namespace {
    const std::regex& target_regex() {
        static const std::regex re(R"(^(stable|latest|alpha|nightly|[0-9]+\.[0-9]+\.[0-9]+([-+][^\s]+)?)$)");
        return re;
    }

    // Versions published through a channel also name cache files and URL
    // path segments.
    const std::regex& published_version_regex() {
        static const std::regex re(R"(^[0-9]+\.[0-9]+\.[0-9]+([-+][0-9A-Za-z.+-]+)?$)");
        return re;
    }
}

bool is_valid_published_version(std::string_view version) {
    return version.find("..") == std::string_view::npos &&
           std::regex_match(version.begin(), version.end(), published_version_regex());
}

bool is_valid_target(std::string_view target) {
    if (target.empty()) return true;
    return std::regex_match(target.begin(), target.end(), target_regex());
}

void validate_target(std::string_view target) {
    if (!is_valid_target(target)) {
        throw InvalidTargetException(string_format("error.invalid_target", target));
    }
}

std::optional<std::string> channel_for_target(std::string_view target) {
    if (target.empty() || target == "stable" || target == "latest") return "stable";
    if (target == "alpha") return "alpha";
    if (target == "nightly") return "nightly";
    return std::nullopt;
}

std::string resolve_version(const std::string& target, const std::string& base_url) {
    validate_target(target);

    const auto channel = channel_for_target(target);
    if (!channel) {
        return target;
    }

    const std::string display_target = target.empty() ? *channel : target;
    std::string version;
    try {
        version = strip_whitespace(fetch_text(base_url + "/" + *channel));
    } catch (const NetworkException& e) {
        throw NetworkException(string_format("error.resolve_version_failed", display_target) + ": " + e.what());
    }

    if (version.empty()) {
        throw NetworkException(string_format("error.resolve_version_failed", display_target));
    }
    if (!is_valid_published_version(version)) {
        throw NetworkException(string_format("error.invalid_published_version", display_target, version));
    }
    log_info(string_format("info.resolved_version", display_target, version));
    return version;
}
