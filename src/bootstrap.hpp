#pragma once

#include "config.hpp"
#include "launcher.hpp"

#include <filesystem>
#include <string>

struct BootstrapOptions {
    std::string target;   // channel name, explicit version, or empty for stable
    bool silent = false;
};

struct BootstrapResult {
    std::string version;
    std::string platform;
    std::filesystem::path artifact;
    bool cache_hit = false;
    bool elevated = false;
};

// Resolves, verifies, extracts and launches the release installer for target.
// Every failure is reported by exception; the temporary working directory is
// gone by the time this returns or throws (unless config.keep_temp is set).
BootstrapResult run_bootstrap(const BootstrapOptions& options, const Config& config, PrivilegeProbe probe = is_privileged);
