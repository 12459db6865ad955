#include "cleanup.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <string>

namespace fs = std::filesystem;

namespace {
    volatile std::sig_atomic_t g_pending_signal = 0;

    void record_signal(int sig) {
        g_pending_signal = sig;
    }

    void install(int sig, struct sigaction* old) {
        struct sigaction sa{};
        sa.sa_handler = record_signal;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0; // no SA_RESTART: blocking waits return EINTR
        sigaction(sig, &sa, old);
    }
}

WorkDir::WorkDir(const fs::path& tmp_root, bool keep) : keep_(keep) {
    cleanup_stale_work_dirs(tmp_root);
    ensure_dir_exists(tmp_root);

    // mkdtemp creates a fresh 0700 directory and never reuses an existing path
    std::string templ = (tmp_root / "mboot_XXXXXX").string();
    if (mkdtemp(templ.data()) == nullptr) {
        throw MbootException(string_format("error.create_dir_failed", templ) + ": " + strerror(errno));
    }
    path_ = templ;
}

WorkDir::~WorkDir() {
    if (keep_) {
        log_info(string_format("info.keeping_temp", path_.string()));
        return;
    }
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        log_warning(string_format("warning.remove_temp_failed", path_.string(), ec.message()));
    }
}

InterruptGuard::InterruptGuard() {
    g_pending_signal = 0;
    install(SIGINT, &old_int_);
    install(SIGTERM, &old_term_);
    install(SIGHUP, &old_hup_);
}

InterruptGuard::~InterruptGuard() {
    sigaction(SIGINT, &old_int_, nullptr);
    sigaction(SIGTERM, &old_term_, nullptr);
    sigaction(SIGHUP, &old_hup_, nullptr);
}

bool interrupt_requested() {
    return g_pending_signal != 0;
}

int pending_signal() {
    return g_pending_signal;
}

void clear_interrupt() {
    g_pending_signal = 0;
}

void throw_if_interrupted() {
    if (const int sig = g_pending_signal; sig != 0) {
        throw InterruptedException(string_format("error.interrupted", sig), sig);
    }
}

bool settle_cached_artifact(const fs::path& artifact, const std::string& sha256) {
    std::error_code ec;
    if (!fs::exists(artifact, ec)) {
        return false;
    }
    try {
        if (sha256_equals(calculate_sha256(artifact), sha256)) {
            return true;
        }
    } catch (const MbootException& e) {
        log_warning(e.what());
    }
    log_warning(string_format("warning.cache_invalidated", artifact.string()));
    fs::remove(artifact, ec);
    return false;
}

void cleanup_stale_work_dirs(const fs::path& tmp_root) {
    const auto max_age = std::chrono::hours(24);
    const auto now = fs::file_time_type::clock::now();
    const uid_t current_uid = geteuid();

    std::error_code ec;
    if (!fs::is_directory(tmp_root, ec)) {
        return;
    }

    try {
        for (const auto& entry : fs::directory_iterator(tmp_root)) {
            const std::string name = entry.path().filename().string();
            if (!name.starts_with("mboot_") || entry.is_symlink() || !entry.is_directory()) {
                continue;
            }
            struct stat st;
            if (lstat(entry.path().c_str(), &st) != 0 || st.st_uid != current_uid) {
                continue;
            }
            if (now - fs::last_write_time(entry.path()) > max_age) {
                fs::remove_all(entry.path());
            }
        }
    } catch (const fs::filesystem_error& e) {
        log_warning(string_format("warning.stale_cleanup_failed", tmp_root.string(), e.what()));
    }
}
