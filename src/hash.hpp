#pragma once

#include <string>
#include <string_view>
#include <filesystem>

// Calculates the lower-case hex SHA256 digest of a file's full contents.
// Throws MbootException if the file cannot be read.
std::string calculate_sha256(const std::filesystem::path& file_path);

// Case-insensitive digest comparison.
bool sha256_equals(std::string_view a, std::string_view b);

// True for exactly 64 lower-case hex characters, the manifest's canonical form.
bool is_valid_sha256(std::string_view digest);
