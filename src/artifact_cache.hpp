#pragma once

#include "manifest.hpp"

#include <filesystem>
#include <string>

struct AcquireResult {
    std::filesystem::path path;
    bool cache_hit = false;
    int downloads = 0;
};

// Content-addressed store of release archives. A file is addressed by
// (version, platform) and trusted only while its SHA256 equals the digest the
// manifest declares for it; there is no expiry.
class ArtifactCache {
public:
    explicit ArtifactCache(std::filesystem::path cache_dir);

    std::filesystem::path path_for(const std::string& version, const std::string& platform) const;

    // Returns a verified archive for the entry, reusing the cached copy when
    // its digest matches and downloading at most once otherwise. A download
    // whose digest does not match is deleted and ChecksumMismatchException is
    // thrown.
    AcquireResult acquire(const PlatformEntry& entry, const std::string& version, const std::string& platform) const;

    const std::filesystem::path& dir() const { return cache_dir_; }

private:
    std::filesystem::path cache_dir_;
};
