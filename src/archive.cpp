#include "archive.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_read_close(a);
            archive_read_free(a);
        }
    }
};

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_write_close(a);
            archive_write_free(a);
        }
    }
};

using ArchiveReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

std::string archive_error(struct archive* a, const std::string& fallback_key) {
    const char* err = archive_error_string(a);
    return err ? std::string(err) : get_string(fallback_key);
}

bool ends_with_components(const fs::path& path, const fs::path& suffix) {
    std::vector<fs::path> p(path.begin(), path.end());
    std::vector<fs::path> s(suffix.begin(), suffix.end());
    if (s.empty() || s.size() > p.size()) return false;
    return std::equal(s.rbegin(), s.rend(), p.rbegin());
}

} // anonymous namespace

void extract_archive(const fs::path& archive_path, const fs::path& raw_output_dir) {
    ensure_dir_exists(raw_output_dir);
    // SECURE_SYMLINKS rejects symlinked components in the output prefix too
    const fs::path output_dir = fs::canonical(raw_output_dir);

    ArchiveReadHandle a(archive_read_new());
    archive_read_support_filter_all(a.get());
    archive_read_support_format_all(a.get());

    ArchiveWriteHandle ext(archive_write_disk_new());
    archive_write_disk_set_options(ext.get(),
        ARCHIVE_EXTRACT_TIME |
        ARCHIVE_EXTRACT_PERM |
        ARCHIVE_EXTRACT_SECURE_SYMLINKS |
        ARCHIVE_EXTRACT_SECURE_NODOTDOT |
        ARCHIVE_EXTRACT_UNLINK
    );

    if (archive_read_open_filename(a.get(), archive_path.c_str(), 10240) != ARCHIVE_OK) {
        throw MbootException(string_format("error.extract_failed", archive_path.string()) + ": " + archive_error(a.get(), "error.unknown"));
    }

    struct archive_entry* entry;
    long long count = 0;
    while (true) {
        int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_OK) {
            if (r < ARCHIVE_WARN) {
                throw MbootException(string_format("error.extract_failed", archive_path.string()) + ": " + archive_error(a.get(), "error.fatal_read"));
            }
            log_warning(archive_error(a.get(), "error.unknown"));
        }

        const char* current_path = archive_entry_pathname(entry);
        if (!current_path) continue;

        fs::path dest_path;
        try {
            dest_path = validate_path(current_path, output_dir);
        } catch (const MbootException&) {
            throw MbootException(string_format("error.malicious_path_in_archive", current_path));
        }
        archive_entry_set_pathname(entry, dest_path.c_str());

        if (const char* hardlink = archive_entry_hardlink(entry)) {
            try {
                archive_entry_set_hardlink(entry, validate_path(hardlink, output_dir).c_str());
            } catch (const MbootException&) {
                throw MbootException(string_format("error.malicious_path_in_archive", hardlink));
            }
        }

        r = archive_write_header(ext.get(), entry);
        if (r < ARCHIVE_OK) {
            if (r < ARCHIVE_WARN) {
                throw MbootException(string_format("error.extract_failed", archive_path.string()) + ": " + archive_error(ext.get(), "error.fatal_write"));
            }
            log_warning(archive_error(ext.get(), "error.unknown"));
        } else {
            const void* buff;
            size_t size;
            la_int64_t offset;
            while (true) {
                r = archive_read_data_block(a.get(), &buff, &size, &offset);
                if (r == ARCHIVE_EOF) break;
                if (r < ARCHIVE_OK) {
                    if (r < ARCHIVE_WARN) {
                        throw MbootException(string_format("error.extract_failed", archive_path.string()) + ": " + archive_error(a.get(), "error.data_block_read"));
                    }
                    log_warning(archive_error(a.get(), "error.unknown"));
                    break;
                }

                if (archive_write_data_block(ext.get(), buff, size, offset) < ARCHIVE_OK) {
                    throw MbootException(string_format("error.extract_failed", archive_path.string()) + ": " + archive_error(ext.get(), "error.data_block_write"));
                }
            }
        }
        if (archive_write_finish_entry(ext.get()) < ARCHIVE_WARN) {
            throw MbootException(string_format("error.extract_failed", archive_path.string()) + ": " + archive_error(ext.get(), "error.fatal_write"));
        }
        ++count;
    }

    log_info(string_format("info.extract_complete", count));
}

fs::path find_installer(const fs::path& root, std::string_view relative) {
    const fs::path suffix(relative);
    std::vector<fs::path> matches;

    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (entry.is_regular_file() && ends_with_components(entry.path().lexically_relative(root), suffix)) {
            matches.push_back(entry.path());
        }
    }

    if (matches.empty()) {
        throw InstallerNotFoundException(get_string("error.installer_not_found"));
    }
    if (matches.size() > 1) {
        std::sort(matches.begin(), matches.end());
        std::string listing;
        for (const auto& m : matches) {
            listing += "\n  " + m.lexically_relative(root).string();
        }
        throw AmbiguousInstallerException(string_format("error.installer_ambiguous", matches.size()) + listing);
    }
    return matches.front();
}

void make_executable(const fs::path& file) {
    std::error_code ec;
    fs::permissions(file, fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec, fs::perm_options::add, ec);
    if (ec) {
        throw MbootException(string_format("error.chmod_failed", file.string()) + ": " + ec.message());
    }
}
