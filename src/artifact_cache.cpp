#include "artifact_cache.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <unistd.h>

#include <utility>

namespace fs = std::filesystem;

ArtifactCache::ArtifactCache(fs::path cache_dir) : cache_dir_(std::move(cache_dir)) {}

fs::path ArtifactCache::path_for(const std::string& version, const std::string& platform) const {
    return cache_dir_ / ("mits11-" + version + "-" + platform + ".zip");
}

AcquireResult ArtifactCache::acquire(const PlatformEntry& entry, const std::string& version, const std::string& platform) const {
    const fs::path target = path_for(version, platform);
    std::error_code ec;

    if (fs::is_regular_file(target, ec)) {
        if (sha256_equals(calculate_sha256(target), entry.sha256)) {
            log_info(string_format("info.using_cached", target.string()));
            return AcquireResult{target, true, 0};
        }
        log_warning(string_format("warning.cache_stale", target.string()));
        if (!fs::remove(target, ec) && ec) {
            throw MbootException(string_format("error.remove_file_failed", target.string()) + ": " + ec.message());
        }
    }

    ensure_dir_exists(cache_dir_);

    // One part file per process; only verified bytes are renamed into place.
    const fs::path part = target.string() + "." + std::to_string(getpid()) + ".part";
    log_info(string_format("info.downloading_release", version, platform));
    try {
        download_file(entry.url, part, true);
    } catch (...) {
        fs::remove(part, ec);
        throw;
    }

    const std::string actual = calculate_sha256(part);
    if (!sha256_equals(actual, entry.sha256)) {
        fs::remove(part, ec);
        throw ChecksumMismatchException(string_format("error.checksum_mismatch", entry.sha256, actual));
    }

    fs::rename(part, target, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(part, ec);
        throw MbootException(string_format("error.cache_store_failed", target.string()) + ": " + reason);
    }
    return AcquireResult{target, false, 1};
}
