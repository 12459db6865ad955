#pragma once

#include <csignal>
#include <filesystem>
#include <string>

// Process-private working directory ({tmp_root}/mboot_XXXXXX, mode 0700),
// newly created by mkdtemp and removed with everything below it when the
// object goes out of scope unless keep is set.
class WorkDir {
public:
    WorkDir(const std::filesystem::path& tmp_root, bool keep);
    ~WorkDir();
    WorkDir(const WorkDir&) = delete;
    WorkDir& operator=(const WorkDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    bool keep_;
};

// Records SIGINT/SIGTERM/SIGHUP instead of dying, so the run unwinds through
// the RAII cleanup above. Previous handlers are restored on destruction.
class InterruptGuard {
public:
    InterruptGuard();
    ~InterruptGuard();
    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

private:
    struct sigaction old_int_{};
    struct sigaction old_term_{};
    struct sigaction old_hup_{};
};

bool interrupt_requested();
int pending_signal();
void clear_interrupt();
// Throws InterruptedException when a signal has been recorded.
void throw_if_interrupted();

// Keeps the cached artifact only if it still matches sha256; otherwise
// removes it. Returns true when the file was kept.
bool settle_cached_artifact(const std::filesystem::path& artifact, const std::string& sha256);

// Removes mboot_* directories older than a day left behind by killed runs.
void cleanup_stale_work_dirs(const std::filesystem::path& tmp_root);
