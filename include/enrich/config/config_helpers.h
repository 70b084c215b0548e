#pragma once

#include <enrich/core/types.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace enrich::config {

// section -> key -> raw value
using ConfigSections = std::map<std::string, std::map<std::string, std::string>>;

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

// Accepts true/false, 1/0, yes/no, on/off (case-insensitive)
std::optional<bool> parse_bool(std::string_view value);

// Parse a TOML-style file ([section] headers, key = value lines, # comments) into sections.
// Keys outside any section land in the "" section.
Result<ConfigSections> parse_config_file(const std::filesystem::path& path);

// Same grammar as parse_config_file, from an in-memory string.
ConfigSections parse_config_text(std::string_view text);

// Get standard config path: override, then $XDG_CONFIG_HOME/enrich/config.toml, then
// ~/.config/enrich/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace enrich::config
