#pragma once

#include <optional>
#include <string>
#include <string_view>

bool is_valid_target(std::string_view target);

// X.Y.Z with an optional [-+] suffix of [0-9A-Za-z.+-] and no "..".
bool is_valid_published_version(std::string_view version);

// Throws InvalidTargetException. Runs before any network activity.
void validate_target(std::string_view target);

// Channel pointer name for a floating target ("" and "latest" mean stable),
// or nullopt for an explicit version.
std::optional<std::string> channel_for_target(std::string_view target);

// Resolves a validated target to a concrete version. Explicit versions are
// returned unchanged without touching the network; channels are read from
// {base_url}/{channel} with all whitespace stripped and must hold a valid
// published version; anything else throws NetworkException.
std::string resolve_version(const std::string& target, const std::string& base_url);
