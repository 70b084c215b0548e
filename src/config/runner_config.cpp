#include <enrich/config/runner_config.h>

#include <charconv>

namespace enrich::config {

namespace {

const std::string* find_value(const ConfigSections& sections, const std::string& section,
                              const std::string& key) {
    auto sec = sections.find(section);
    if (sec == sections.end()) {
        return nullptr;
    }
    auto it = sec->second.find(key);
    return it == sec->second.end() ? nullptr : &it->second;
}

Error invalid_value(const std::string& section, const std::string& key, const std::string& raw,
                    const char* expected) {
    return Error{ErrorCode::InvalidData, "[" + section + "] " + key + " = '" + raw +
                                             "' is not a valid " + expected};
}

Result<void> read_bool(const ConfigSections& sections, const std::string& section,
                       const std::string& key, bool& out) {
    if (const auto* raw = find_value(sections, section, key)) {
        auto parsed = parse_bool(*raw);
        if (!parsed) {
            return invalid_value(section, key, *raw, "boolean");
        }
        out = *parsed;
    }
    return {};
}

template <typename Int>
Result<void> read_int(const ConfigSections& sections, const std::string& section,
                      const std::string& key, Int& out) {
    if (const auto* raw = find_value(sections, section, key)) {
        Int parsed{};
        auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), parsed);
        if (ec != std::errc{} || ptr != raw->data() + raw->size()) {
            return invalid_value(section, key, *raw, "integer");
        }
        out = parsed;
    }
    return {};
}

void read_string(const ConfigSections& sections, const std::string& section,
                 const std::string& key, std::string& out) {
    if (const auto* raw = find_value(sections, section, key)) {
        out = *raw;
    }
}

} // namespace

Result<RunnerConfig> load_runner_config(const ConfigSections& sections) {
    RunnerConfig config;

    read_string(sections, "logging", "level", config.logLevel);

    if (auto r = read_int(sections, "runner", "worker_threads", config.workerThreads); !r) {
        return r.error();
    }
    std::string path;
    read_string(sections, "runner", "policies_file", path);
    if (!path.empty()) {
        config.policiesFile = expand_tilde(path);
    }
    path.clear();
    read_string(sections, "runner", "reference_data_file", path);
    if (!path.empty()) {
        config.referenceDataFile = expand_tilde(path);
    }
    if (auto r = read_bool(sections, "runner", "ignore_failure", config.ignoreFailure); !r) {
        return r.error();
    }

    auto& processor = config.processor;
    read_string(sections, "processor", "policy_name", processor.policyName);
    read_string(sections, "processor", "field", processor.field);
    read_string(sections, "processor", "target_field", processor.targetField);
    read_string(sections, "processor", "tag", processor.tag);
    if (auto r = read_bool(sections, "processor", "ignore_missing", processor.ignoreMissing); !r) {
        return r.error();
    }
    if (auto r = read_bool(sections, "processor", "override", processor.overrideEnabled); !r) {
        return r.error();
    }
    if (auto r = read_int(sections, "processor", "max_matches", processor.maxMatches); !r) {
        return r.error();
    }

    return config;
}

Result<RunnerConfig> load_runner_config(const std::filesystem::path& path) {
    auto sections = parse_config_file(path);
    if (!sections) {
        return sections.error();
    }
    return load_runner_config(sections.value());
}

nlohmann::json processor_config_json(const ProcessorSettings& settings) {
    nlohmann::json out = nlohmann::json::object();
    // Empty required values are left out so the factory reports them as missing
    if (!settings.policyName.empty()) {
        out["policy_name"] = settings.policyName;
    }
    if (!settings.field.empty()) {
        out["field"] = settings.field;
    }
    if (!settings.targetField.empty()) {
        out["target_field"] = settings.targetField;
    }
    if (!settings.tag.empty()) {
        out["tag"] = settings.tag;
    }
    out["ignore_missing"] = settings.ignoreMissing;
    out["override"] = settings.overrideEnabled;
    out["max_matches"] = settings.maxMatches;
    return out;
}

} // namespace enrich::config
