#pragma once

#include "config.hpp"

#include <memory>
#include <string>

struct PlatformEntry {
    std::string url;
    std::string sha256;
};

// Extracts the {url, sha256} pair for one platform from a manifest document
// of the form {"platforms": {"<os>-<arch>": {"url": ..., "sha256": ...}}}.
// Implementations throw ManifestException naming platform and version when the
// platform, either field, or a well-formed digest is missing.
class ManifestParser {
public:
    virtual ~ManifestParser() = default;
    virtual PlatformEntry find_platform(const std::string& manifest, const std::string& platform, const std::string& version) const = 0;
    virtual const char* name() const = 0;
};

// Structured backend on nlohmann::json.
class JsonManifestParser : public ManifestParser {
public:
    PlatformEntry find_platform(const std::string& manifest, const std::string& platform, const std::string& version) const override;
    const char* name() const override { return "json"; }
};

// Text backend: normalizes whitespace, cuts the platform object out with
// bracket matching and reads the two string fields with regular expressions.
// Does not need a JSON library and tolerates documents a strict parser rejects.
class PatternManifestParser : public ManifestParser {
public:
    PlatformEntry find_platform(const std::string& manifest, const std::string& platform, const std::string& version) const override;
    const char* name() const override { return "pattern"; }
};

std::unique_ptr<ManifestParser> make_manifest_parser(ManifestParserKind kind);

std::string manifest_url(const std::string& base_url, const std::string& version);

// Fetches {base_url}/{version}/manifest.json and returns the platform entry.
PlatformEntry fetch_platform_entry(const std::string& base_url, const std::string& version,
                                   const std::string& platform, const ManifestParser& parser);
