/**
 * @file config.cpp
 * @brief Configuration loading and environment overrides
 */

#include "linkdiff/config.hpp"

#include "linkdiff/document.hpp"
#include "linkdiff/schema_validate.hpp"

#include <charconv>
#include <cstdlib>
#include <format>

namespace linkdiff::config {

namespace {

[[nodiscard]] Result<bool> parse_flag(std::string_view name, std::string_view value)
{
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off" || value.empty()) {
        return false;
    }
    return fail(errc::kConfigError, std::format("{}: expected a boolean, got '{}'", name, value));
}

[[nodiscard]] Result<std::size_t> parse_capacity(std::string_view value)
{
    std::size_t parsed = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc{} || ptr != value.data() + value.size() || parsed == 0) {
        return fail(errc::kConfigError,
                    std::format("LINKDIFF_CACHE_CAPACITY: expected a positive integer, got '{}'", value));
    }
    return parsed;
}

[[nodiscard]] Result<log::Level> parse_log_level(std::string_view value)
{
    auto level = log::parse_level(value);
    if (!level) {
        return fail(errc::kConfigError, std::format("Unknown log level: {}", value));
    }
    return *level;
}

}  // namespace

std::optional<std::string> process_env(std::string_view name)
{
    const char* value = std::getenv(std::string(name).c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

Result<Config> config_from_json(const nlohmann::json& j)
{
    if (!j.is_object()) {
        return fail(errc::kConfigError, "Configuration must be a JSON object");
    }
    Config config;
    try {
        if (auto it = j.find("canon_provider"); it != j.end() && !it->is_null()) {
            config.canon_provider = it->get<std::string>();
        }
        if (auto it = j.find("cache_capacity"); it != j.end()) {
            config.cache_capacity = it->get<std::size_t>();
            if (config.cache_capacity == 0) {
                return fail(errc::kConfigError, "cache_capacity must be positive");
            }
        }
        if (auto it = j.find("verify_acceleration"); it != j.end()) {
            config.verify_acceleration = it->get<bool>();
        }
        if (auto it = j.find("log_level"); it != j.end()) {
            auto level = parse_log_level(it->get<std::string>());
            if (!level) {
                return std::unexpected(level.error());
            }
            config.log_level = *level;
        }
        if (auto it = j.find("default_conflict_resolution"); it != j.end()) {
            config.default_conflict_resolution = it->get<std::string>();
        }
    } catch (const nlohmann::json::exception& ex) {
        return fail(errc::kConfigError, std::string("Invalid configuration: ") + ex.what());
    }
    return config;
}

nlohmann::json config_to_json(const Config& config)
{
    nlohmann::json j = {
        {"cache_capacity", config.cache_capacity},
        {"verify_acceleration", config.verify_acceleration},
        {"log_level", std::string(log::level_name(config.log_level))},
        {"default_conflict_resolution", config.default_conflict_resolution},
    };
    if (config.canon_provider) {
        j["canon_provider"] = *config.canon_provider;
    }
    return j;
}

Result<Config> load_config(const std::string& path, const std::string& schema_dir)
{
    auto payload = common::read_json_file_validated(path, schema_dir, common::kConfigSchema);
    if (!payload) {
        return std::unexpected(payload.error());
    }
    return config_from_json(*payload);
}

Result<Config> apply_environment(Config config, const EnvLookup& env)
{
    if (auto provider = env("LINKDIFF_CANON_PROVIDER"); provider && !provider->empty()) {
        config.canon_provider = *provider;
    }
    if (auto capacity = env("LINKDIFF_CACHE_CAPACITY"); capacity) {
        auto parsed = parse_capacity(*capacity);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        config.cache_capacity = *parsed;
    }
    if (auto verify = env("LINKDIFF_VERIFY_ACCEL"); verify) {
        auto parsed = parse_flag("LINKDIFF_VERIFY_ACCEL", *verify);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        config.verify_acceleration = *parsed;
    }
    if (auto level = env("LINKDIFF_LOG_LEVEL"); level) {
        auto parsed = parse_log_level(*level);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        config.log_level = *parsed;
    }
    return config;
}

}  // namespace linkdiff::config
