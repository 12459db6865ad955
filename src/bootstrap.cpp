#include "bootstrap.hpp"
#include "archive.hpp"
#include "artifact_cache.hpp"
#include "cleanup.hpp"
#include "localization.hpp"
#include "manifest.hpp"
#include "platform.hpp"
#include "utils.hpp"
#include "version.hpp"

#include <utility>

namespace fs = std::filesystem;

BootstrapResult run_bootstrap(const BootstrapOptions& options, const Config& config, PrivilegeProbe probe) {
    // Local checks run before any network access.
    validate_target(options.target);
    const std::string platform = detect_platform();
    const auto parser = make_manifest_parser(config.manifest_parser);

    InterruptGuard interrupt_guard;
    WorkDir work(config.tmp_root, config.keep_temp);

    LaunchOptions launch_options;
    launch_options.silent = options.silent;
    launch_options.work_dir = work.path();
    launch_options.poll_interval = config.poll_interval;
    launch_options.max_wait = config.max_elevation_wait;
    launch_options.elevation_command = config.elevation_command;
    LaunchController launcher(std::move(launch_options), std::move(probe));
    launcher.prepare();

    BootstrapResult result;
    result.platform = platform;
    result.version = resolve_version(options.target, config.base_url);
    throw_if_interrupted();

    const PlatformEntry entry = fetch_platform_entry(config.base_url, result.version, platform, *parser);
    throw_if_interrupted();

    ArtifactCache cache(config.cache_dir);
    const AcquireResult acquired = cache.acquire(entry, result.version, platform);
    result.artifact = acquired.path;
    result.cache_hit = acquired.cache_hit;
    throw_if_interrupted();

    const fs::path extract_root = work.path() / "extract";
    log_info(get_string("info.extracting"));
    extract_archive(acquired.path, extract_root);
    throw_if_interrupted();

    const fs::path installer = find_installer(extract_root);
    make_executable(installer);

    launcher.run(installer);
    result.elevated = launcher.elevated();

    if (result.elevated) {
        settle_cached_artifact(acquired.path, entry.sha256);
    }

    log_info(get_string("info.done"));
    return result;
}
