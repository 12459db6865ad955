#pragma once

#include "config.hpp"

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

enum class LaunchState {
    Start,
    ElevationRequired,
    Privileged,
    WaitingForSentinel,
    Success,
    Failure
};

struct LaunchOptions {
    bool silent = false;
    // Holds the sentinel file; must outlive the elevated child.
    std::filesystem::path work_dir;
    std::chrono::milliseconds poll_interval = ELEVATION_POLL_INTERVAL;
    std::chrono::milliseconds max_wait = ELEVATION_MAX_WAIT;
    // Prefix used to gain privileges, e.g. {"sudo"}. Empty: search PATH.
    std::vector<std::string> elevation_command;
};

using PrivilegeProbe = std::function<bool()>;

bool is_privileged();

// First of sudo, doas, pkexec found on PATH. Throws EnvironmentException.
std::vector<std::string> find_elevation_command();

// Exit code written by the elevated wrapper. Throws MbootException when the
// text is not a single decimal integer in 0..255.
int parse_sentinel(const std::string& text);

// Runs the nested installer and turns its exit status into ours.
//
//   Start -> Privileged ----------------------------> Success | Failure
//         -> ElevationRequired -> WaitingForSentinel -> Success | Failure
//
// An unprivileged process cannot wait on a child across the privilege
// boundary, so the elevated side runs the installer through a small shell
// wrapper that writes its exit code to a sentinel file; this side polls for
// that file until max_wait elapses.
class LaunchController {
public:
    explicit LaunchController(LaunchOptions options, PrivilegeProbe probe = is_privileged);

    // Probes privileges and, when elevation will be needed, resolves the
    // elevation command so a missing helper fails before any download.
    LaunchState prepare();

    // Returns 0 when the installer succeeds. Throws InstallerExitException
    // with the installer's code, ElevationTimeoutException,
    // ElevationFailedException or InterruptedException otherwise.
    int run(const std::filesystem::path& installer);

    LaunchState state() const { return state_; }
    bool elevated() const { return elevated_; }
    std::filesystem::path sentinel_path() const;

private:
    int run_direct(const std::filesystem::path& installer);
    int run_elevated(const std::filesystem::path& installer);
    int wait_for_sentinel(pid_t helper_pid);
    std::vector<std::string> installer_args(const std::filesystem::path& installer) const;

    LaunchOptions options_;
    PrivilegeProbe probe_;
    LaunchState state_ = LaunchState::Start;
    bool elevated_ = false;
};
