#include "manifest.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <regex>
#include <string_view>
#include <utility>

namespace {

using Span = std::pair<size_t, size_t>; // [begin, end) of an object, braces included

PlatformEntry checked_entry(std::optional<std::string> url, std::optional<std::string> sha256,
                            const std::string& platform, const std::string& version) {
    if (!url || url->empty()) {
        throw ManifestException(string_format("error.manifest_field_missing", "url", platform, version));
    }
    if (!sha256 || sha256->empty()) {
        throw ManifestException(string_format("error.manifest_field_missing", "sha256", platform, version));
    }
    if (!is_valid_sha256(*sha256)) {
        throw ManifestException(string_format("error.manifest_invalid_checksum", platform, version));
    }
    return PlatformEntry{std::move(*url), std::move(*sha256)};
}

[[noreturn]] void throw_platform_missing(const std::string& platform, const std::string& version) {
    throw ManifestException(string_format("error.platform_not_in_manifest", platform, version));
}

// --- pattern backend helpers ---

std::string normalize_whitespace(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '\n' || c == '\r' || c == '\t') continue;
        if (c == ' ' && !out.empty() && out.back() == ' ') continue;
        out.push_back(c);
    }
    return out;
}

// Index of the closing quote of the string opening at text[open].
size_t string_end(std::string_view text, size_t open) {
    for (size_t i = open + 1; i < text.size(); ++i) {
        if (text[i] == '\\') ++i;
        else if (text[i] == '"') return i;
    }
    return std::string_view::npos;
}

// One past the bracket closing the one at text[open]; strings are skipped.
size_t match_bracket(std::string_view text, size_t open) {
    int depth = 0;
    for (size_t i = open; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '"') {
            i = string_end(text, i);
            if (i == std::string_view::npos) return i;
        } else if (c == '{' || c == '[') {
            ++depth;
        } else if (c == '}' || c == ']') {
            if (--depth == 0) return i + 1;
        }
    }
    return std::string_view::npos;
}

size_t skip_spaces(std::string_view text, size_t pos) {
    while (pos < text.size() && text[pos] == ' ') ++pos;
    return pos;
}

// Finds `"key": {...}` directly inside the object spanning obj.
std::optional<Span> find_member_object(std::string_view text, Span obj, std::string_view key) {
    int depth = 0;
    for (size_t i = obj.first + 1; i + 1 < obj.second; ++i) {
        const char c = text[i];
        if (c == '{' || c == '[') {
            ++depth;
        } else if (c == '}' || c == ']') {
            --depth;
        } else if (c == '"') {
            const size_t close = string_end(text, i);
            if (close == std::string_view::npos) return std::nullopt;
            const std::string_view name = text.substr(i + 1, close - i - 1);
            i = close;
            if (depth != 0 || name != key) continue;

            size_t pos = skip_spaces(text, close + 1);
            if (pos >= text.size() || text[pos] != ':') continue;
            pos = skip_spaces(text, pos + 1);
            if (pos >= text.size() || text[pos] != '{') return std::nullopt;
            const size_t end = match_bracket(text, pos);
            if (end == std::string_view::npos || end > obj.second) return std::nullopt;
            return Span{pos, end};
        }
    }
    return std::nullopt;
}

std::optional<unsigned long> hex4(std::string_view raw, size_t pos) {
    if (pos + 4 > raw.size() ||
        !std::all_of(raw.begin() + pos, raw.begin() + pos + 4, [](unsigned char h) { return std::isxdigit(h) != 0; })) {
        return std::nullopt;
    }
    return std::stoul(std::string(raw.substr(pos, 4)), nullptr, 16);
}

// Lone surrogates become U+FFFD.
void append_utf8(std::string& out, unsigned long cp) {
    if (cp >= 0xD800 && cp <= 0xDFFF) cp = 0xFFFD;
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Decodes JSON string escapes, \uXXXX (with surrogate pairs) as UTF-8.
std::string unescape(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] != '\\' || i + 1 == raw.size()) {
            out.push_back(raw[i]);
            continue;
        }
        const char e = raw[++i];
        switch (e) {
            case 'n': out.push_back('\n'); break;
            case 't': out.push_back('\t'); break;
            case 'r': out.push_back('\r'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'u': {
                const auto high = hex4(raw, i + 1);
                if (!high) {
                    out += "\\u";
                    break;
                }
                unsigned long cp = *high;
                i += 4;
                if (cp >= 0xD800 && cp <= 0xDBFF && i + 2 < raw.size() && raw[i + 1] == '\\' && raw[i + 2] == 'u') {
                    const auto low = hex4(raw, i + 3);
                    if (low && *low >= 0xDC00 && *low <= 0xDFFF) {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (*low - 0xDC00);
                        i += 6;
                    }
                }
                append_utf8(out, cp);
                break;
            }
            default: out.push_back(e); break; // \" \\ \/
        }
    }
    return out;
}

std::optional<std::string> find_string_field(const std::string& section, const std::string& field) {
    const std::regex re("\"" + field + R"re(" ?: ?"((?:[^"\\]|\\.)*)")re");
    std::smatch match;
    if (std::regex_search(section, match, re)) {
        return unescape(match[1].str());
    }
    return std::nullopt;
}

} // anonymous namespace

PlatformEntry JsonManifestParser::find_platform(const std::string& manifest, const std::string& platform, const std::string& version) const {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(manifest);
    } catch (const nlohmann::json::parse_error& e) {
        throw ManifestException(string_format("error.manifest_malformed", version) + ": " + e.what());
    }

    if (!doc.is_object()) {
        throw ManifestException(string_format("error.manifest_malformed", version));
    }
    auto platforms = doc.find("platforms");
    if (platforms == doc.end() || !platforms->is_object()) {
        throw_platform_missing(platform, version);
    }
    auto entry = platforms->find(platform);
    if (entry == platforms->end() || !entry->is_object()) {
        throw_platform_missing(platform, version);
    }

    auto string_field = [&](const char* key) -> std::optional<std::string> {
        auto it = entry->find(key);
        if (it == entry->end() || !it->is_string()) return std::nullopt;
        return it->get<std::string>();
    };
    return checked_entry(string_field("url"), string_field("sha256"), platform, version);
}

PlatformEntry PatternManifestParser::find_platform(const std::string& manifest, const std::string& platform, const std::string& version) const {
    const std::string text = normalize_whitespace(manifest);

    const size_t root_open = skip_spaces(text, 0);
    if (root_open >= text.size() || text[root_open] != '{') {
        throw ManifestException(string_format("error.manifest_malformed", version));
    }
    const size_t root_close = match_bracket(text, root_open);
    if (root_close == std::string::npos) {
        throw ManifestException(string_format("error.manifest_malformed", version));
    }

    const auto platforms = find_member_object(text, {root_open, root_close}, "platforms");
    if (!platforms) {
        throw_platform_missing(platform, version);
    }
    const auto section = find_member_object(text, *platforms, platform);
    if (!section) {
        throw_platform_missing(platform, version);
    }

    // Fields of nested objects inside the entry must not match.
    std::string body = text.substr(section->first, section->second - section->first);
    std::string top_level;
    int depth = 0;
    for (size_t i = 0; i < body.size(); ++i) {
        const char c = body[i];
        if (c == '"') {
            const size_t close = string_end(body, i);
            if (depth <= 1) top_level.append(body, i, close - i + 1);
            i = close;
            continue;
        }
        if (c == '{' || c == '[') ++depth;
        if (depth <= 1) top_level.push_back(c);
        if (c == '}' || c == ']') --depth;
    }

    return checked_entry(find_string_field(top_level, "url"), find_string_field(top_level, "sha256"), platform, version);
}

std::unique_ptr<ManifestParser> make_manifest_parser(ManifestParserKind kind) {
    switch (kind) {
        case ManifestParserKind::Pattern:
            return std::make_unique<PatternManifestParser>();
        case ManifestParserKind::Json:
        default:
            return std::make_unique<JsonManifestParser>();
    }
}

std::string manifest_url(const std::string& base_url, const std::string& version) {
    return base_url + "/" + version + "/manifest.json";
}

PlatformEntry fetch_platform_entry(const std::string& base_url, const std::string& version,
                                   const std::string& platform, const ManifestParser& parser) {
    const std::string url = manifest_url(base_url, version);
    std::string body;
    try {
        body = fetch_text(url);
    } catch (const NetworkException& e) {
        throw NetworkException(string_format("error.manifest_fetch_failed", version, platform) + ": " + e.what());
    }
    return parser.find_platform(body, platform, version);
}
