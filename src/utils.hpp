#pragma once

#include "exception.hpp"
#include <string>
#include <string_view>
#include <filesystem>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);
void log_progress(const std::string& msg, double percentage, int bar_width = 50);
void end_progress();

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);
std::string read_file(const fs::path& path);

// Resolves an archive member path under root.
// Throws MbootException for absolute paths or paths escaping root.
fs::path validate_path(const fs::path& path, const fs::path& root);

// String helpers
std::string strip_whitespace(std::string_view s);
std::string trim(std::string_view s);
bool is_truthy(const char* value);
