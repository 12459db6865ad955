#include "platform.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <sys/utsname.h>

#include <array>
#include <string>

namespace {
    struct TokenMapping {
        std::string_view name;
        std::string_view token;
    };

    constexpr std::array<TokenMapping, 2> KERNELS = {{
        {"Linux", "linux"},
        {"Darwin", "osx"},
    }};

    // Kernel names reported by POSIX layers running on Windows
    constexpr std::array<std::string_view, 3> WINDOWS_KERNEL_PREFIXES = {"MINGW", "MSYS", "CYGWIN"};

    constexpr std::array<TokenMapping, 4> MACHINES = {{
        {"x86_64", "x64"},
        {"amd64", "x64"},
        {"arm64", "arm64"},
        {"aarch64", "arm64"},
    }};
}

std::string os_token(std::string_view kernel_name) {
    for (const auto& [name, token] : KERNELS) {
        if (kernel_name == name) return std::string(token);
    }
    if (kernel_name == "Windows_NT") return "win";
    for (auto prefix : WINDOWS_KERNEL_PREFIXES) {
        if (kernel_name.starts_with(prefix)) return "win";
    }
    throw UnsupportedPlatformException(string_format("error.unsupported_os", kernel_name));
}

std::string arch_token(std::string_view machine) {
    for (const auto& [name, token] : MACHINES) {
        if (machine == name) return std::string(token);
    }
    throw UnsupportedPlatformException(string_format("error.unsupported_arch", machine));
}

std::string platform_id(std::string_view kernel_name, std::string_view machine) {
    return os_token(kernel_name) + "-" + arch_token(machine);
}

std::string detect_platform() {
    struct utsname buf;
    if (uname(&buf) != 0) {
        throw UnsupportedPlatformException(get_string("error.uname_failed"));
    }
    return platform_id(buf.sysname, buf.machine);
}
