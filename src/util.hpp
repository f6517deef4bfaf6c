#pragma once
#include <string>

namespace turnstile {

// Trim whitespace
std::string trim(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// "1", "true", "yes", "on" / "0", "false", "no", "off" (case-insensitive).
// Anything else returns fallback.
bool parse_bool(const std::string& value, bool fallback);

} // namespace turnstile
