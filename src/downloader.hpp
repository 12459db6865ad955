#pragma once

#include <string>
#include <filesystem>

// Downloads url into output_path. Throws NetworkException on any transfer
// failure (HTTP errors included); output_path may be left partially written.
void download_file(const std::string& url, const std::filesystem::path& output_path, bool show_progress = true);

// Fetches a small text resource (channel pointer, manifest) into memory.
std::string fetch_text(const std::string& url);
