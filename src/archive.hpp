#pragma once

#include <string>
#include <string_view>
#include <filesystem>

inline constexpr std::string_view INSTALLER_RELATIVE_PATH = "script/install.sh";

// Unpacks every entry of archive_path below output_dir. Entries with absolute
// paths or ".." components abort the extraction.
void extract_archive(const std::filesystem::path& archive_path, const std::filesystem::path& output_dir);

// Returns the single regular file below root whose path ends with relative.
// Throws InstallerNotFoundException when there is none and
// AmbiguousInstallerException when there is more than one.
std::filesystem::path find_installer(const std::filesystem::path& root, std::string_view relative = INSTALLER_RELATIVE_PATH);

void make_executable(const std::filesystem::path& file);
