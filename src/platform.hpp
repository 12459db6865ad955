#pragma once

#include <string>
#include <string_view>

// Maps a kernel name (uname -s) to linux, osx or win.
// Throws UnsupportedPlatformException for anything else.
std::string os_token(std::string_view kernel_name);

// Maps a machine name (uname -m) to x64 or arm64. 32-bit hosts are rejected.
std::string arch_token(std::string_view machine);

std::string platform_id(std::string_view kernel_name, std::string_view machine);

// Platform identifier of the running host, e.g. "linux-x64".
std::string detect_platform();
