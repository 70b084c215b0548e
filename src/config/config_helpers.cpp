#include <enrich/config/config_helpers.h>

#include <fstream>
#include <sstream>

namespace enrich::config {

std::optional<bool> parse_bool(std::string_view value) {
    std::string lowered(value);
    trim(lowered);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
        return false;
    }
    return std::nullopt;
}

ConfigSections parse_config_text(std::string_view text) {
    ConfigSections config;
    std::istringstream input{std::string(text)};
    std::string line;
    std::string currentSection;

    while (std::getline(input, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        trim(key);
        trim(value);

        // Remove inline comments outside of quotes
        if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
            size_t close = value.find(value.front(), 1);
            if (close != std::string::npos) {
                value = value.substr(0, close + 1);
            }
        } else {
            size_t comment = value.find('#');
            if (comment != std::string::npos) {
                value = value.substr(0, comment);
                trim(value);
            }
        }

        config[currentSection][key] = unquote(value);
    }

    return config;
}

Result<ConfigSections> parse_config_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "Cannot open config file: " + path.string()};
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_config_text(contents.str());
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "enrich" / "config.toml";
    }

    return configHome / "enrich" / "config.toml";
}

} // namespace enrich::config
