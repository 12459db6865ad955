#include "launcher.hpp"
#include "cleanup.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace {

constexpr std::chrono::seconds HELPER_STOP_GRACE{5};

// $1 is the sentinel, the rest is the installer command line. The rename
// makes the sentinel appear only once it is complete.
constexpr const char* ELEVATED_WRAPPER =
    "sentinel=\"$1\"; shift; "
    "\"$@\"; status=$?; "
    "printf '%d\\n' \"$status\" > \"$sentinel.tmp\" && mv -f \"$sentinel.tmp\" \"$sentinel\"";

std::vector<char*> to_argv(std::vector<std::string>& args) {
    std::vector<char*> c_args;
    for (auto& arg : args) c_args.push_back(arg.data());
    c_args.push_back(nullptr);
    return c_args;
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Blocks until pid exits. Signals delivered meanwhile reach the child through
// the terminal's process group, so the wait simply resumes.
int wait_child(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw MbootException(string_format("error.wait_failed", strerror(errno)));
        }
    }
    return decode_status(status);
}

pid_t spawn(std::vector<std::string> args, bool attach_tty) {
    std::vector<char*> c_args = to_argv(args);

    pid_t pid = fork();
    if (pid == -1) {
        throw MbootException(string_format("error.fork_failed", strerror(errno)));
    }
    if (pid == 0) {
        if (attach_tty) {
            int fd = open("/dev/tty", O_RDONLY);
            if (fd >= 0) {
                dup2(fd, STDIN_FILENO);
                close(fd);
            }
        }
        execvp(c_args[0], c_args.data());
        _exit(127);
    }
    return pid;
}

// Asks the elevation helper to stop (sudo and doas forward SIGTERM to the
// installer) and reaps it, escalating to SIGKILL after a grace period.
void stop_helper(pid_t pid) {
    if (kill(pid, SIGTERM) == -1) {
        log_warning(string_format("warning.helper_not_stopped", pid, strerror(errno)));
        return;
    }

    const auto deadline = std::chrono::steady_clock::now() + HELPER_STOP_GRACE;
    while (true) {
        const pid_t r = waitpid(pid, nullptr, WNOHANG);
        if (r == pid || (r == -1 && errno != EINTR)) {
            return;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    if (kill(pid, SIGKILL) == -1) {
        log_warning(string_format("warning.helper_not_stopped", pid, strerror(errno)));
        return;
    }
    while (waitpid(pid, nullptr, 0) == -1 && errno == EINTR) {
    }
}

bool on_path(const std::string& name) {
    const char* path_env = getenv("PATH");
    if (!path_env) return false;
    std::istringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) continue;
        const fs::path candidate = fs::path(dir) / name;
        if (access(candidate.c_str(), X_OK) == 0) return true;
    }
    return false;
}

} // anonymous namespace

bool is_privileged() {
    return geteuid() == 0;
}

std::vector<std::string> find_elevation_command() {
    for (const char* tool : {"sudo", "doas", "pkexec"}) {
        if (on_path(tool)) return {tool};
    }
    throw EnvironmentException(get_string("error.no_elevation_tool"));
}

int parse_sentinel(const std::string& text) {
    const std::string value = trim(text);
    int code = 0;
    const char* begin = value.data();
    const char* end = begin + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, code);
    if (value.empty() || ec != std::errc() || ptr != end || code < 0 || code > 255) {
        throw MbootException(string_format("error.invalid_sentinel", value));
    }
    return code;
}

LaunchController::LaunchController(LaunchOptions options, PrivilegeProbe probe)
    : options_(std::move(options)), probe_(std::move(probe)) {}

fs::path LaunchController::sentinel_path() const {
    return options_.work_dir / "elevated.exit";
}

LaunchState LaunchController::prepare() {
    if (probe_()) {
        state_ = LaunchState::Privileged;
    } else {
        state_ = LaunchState::ElevationRequired;
        if (options_.elevation_command.empty()) {
            options_.elevation_command = find_elevation_command();
        }
    }
    return state_;
}

int LaunchController::run(const fs::path& installer) {
    if (state_ == LaunchState::Start) {
        prepare();
    }

    try {
        // Privileges may have changed since prepare()
        const bool privileged = probe_();
        if (state_ == LaunchState::Privileged && !privileged) {
            log_warning(get_string("warning.privilege_lost"));
            state_ = LaunchState::ElevationRequired;
            if (options_.elevation_command.empty()) {
                options_.elevation_command = find_elevation_command();
            }
        } else if (state_ == LaunchState::ElevationRequired && privileged) {
            state_ = LaunchState::Privileged;
        }

        const int code = (state_ == LaunchState::Privileged) ? run_direct(installer) : run_elevated(installer);
        throw_if_interrupted();
        if (code != 0) {
            throw InstallerExitException(string_format("error.installer_failed", code), code);
        }
        state_ = LaunchState::Success;
        return 0;
    } catch (const std::exception&) {
        state_ = LaunchState::Failure;
        throw;
    }
}

std::vector<std::string> LaunchController::installer_args(const fs::path& installer) const {
    std::vector<std::string> args = {installer.string()};
    if (options_.silent) {
        args.push_back("--silent");
    }
    return args;
}

int LaunchController::run_direct(const fs::path& installer) {
    log_info(get_string("info.running_installer"));
    // Lets the installer prompt even when we were piped in (curl ... | sh)
    const bool attach_tty = !options_.silent && !isatty(STDIN_FILENO);
    return wait_child(spawn(installer_args(installer), attach_tty));
}

int LaunchController::run_elevated(const fs::path& installer) {
    const fs::path sentinel = sentinel_path();
    std::error_code ec;
    fs::remove(sentinel, ec);

    std::vector<std::string> args = options_.elevation_command;
    for (const char* part : {"/bin/sh", "-c", ELEVATED_WRAPPER, "mboot-elevated"}) {
        args.emplace_back(part);
    }
    args.push_back(sentinel.string());
    for (auto& arg : installer_args(installer)) {
        args.push_back(std::move(arg));
    }

    log_info(string_format("info.requesting_elevation", options_.elevation_command.front()));
    const pid_t helper = spawn(std::move(args), false);
    elevated_ = true;
    state_ = LaunchState::WaitingForSentinel;
    return wait_for_sentinel(helper);
}

int LaunchController::wait_for_sentinel(pid_t helper_pid) {
    const fs::path sentinel = sentinel_path();
    const auto deadline = std::chrono::steady_clock::now() + options_.max_wait;
    bool helper_done = false;
    int helper_code = 0;

    while (true) {
        std::error_code ec;
        if (fs::exists(sentinel, ec)) {
            if (!helper_done) {
                wait_child(helper_pid);
            }
            return parse_sentinel(read_file(sentinel));
        }
        if (interrupt_requested() && !helper_done) {
            stop_helper(helper_pid);
            helper_done = true;
        }
        throw_if_interrupted();

        if (helper_done) {
            // The helper is gone without a sentinel: privileges were never granted
            throw ElevationFailedException(string_format("error.elevation_failed", options_.elevation_command.front(), helper_code));
        }

        int status = 0;
        const pid_t r = waitpid(helper_pid, &status, WNOHANG);
        if (r == helper_pid) {
            helper_done = true;
            helper_code = decode_status(status);
            continue;
        }
        if (r == -1 && errno != EINTR) {
            helper_done = true;
            helper_code = -1;
            continue;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            stop_helper(helper_pid);
            const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(options_.max_wait).count();
            throw ElevationTimeoutException(string_format("error.elevation_timeout", seconds));
        }
        std::this_thread::sleep_for(options_.poll_interval);
    }
}
