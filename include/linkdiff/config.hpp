#pragma once

/**
 * @file config.hpp
 * @brief Library configuration: defaults < JSON file < environment
 *
 * Environment variables:
 *   LINKDIFF_CANON_PROVIDER   canonicalization provider name
 *   LINKDIFF_CACHE_CAPACITY   canonicalization cache capacity (entries)
 *   LINKDIFF_VERIFY_ACCEL     "1"/"true" enables acceleration verify mode
 *   LINKDIFF_LOG_LEVEL        debug|info|warn|error|off
 */

#include "linkdiff/common.hpp"
#include "linkdiff/log.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace linkdiff::config {

inline constexpr std::size_t kDefaultCacheCapacity = 1024;

struct Config
{
    std::optional<std::string> canon_provider;
    std::size_t cache_capacity = kDefaultCacheCapacity;
    bool verify_acceleration = false;
    log::Level log_level = log::Level::kWarn;
    std::string default_conflict_resolution = "last_write_wins";
};

/// Returns the value of an environment variable, if set.
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

/// EnvLookup backed by std::getenv.
[[nodiscard]] std::optional<std::string> process_env(std::string_view name);

/**
 * Decode a configuration object. Unknown keys are rejected by the schema,
 * not here; missing keys keep their defaults.
 */
[[nodiscard]] Result<Config> config_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json config_to_json(const Config& config);

/**
 * Read a JSON config file and validate it against config.v1.schema.json.
 * @param path Config file
 * @param schema_dir Directory holding the schemas
 */
[[nodiscard]] Result<Config> load_config(const std::string& path, const std::string& schema_dir);

/**
 * Overlay LINKDIFF_* environment variables on a config.
 * @return ConfigError when a variable holds an unusable value
 */
[[nodiscard]] Result<Config> apply_environment(Config config,
                                               const EnvLookup& env = process_env);

}  // namespace linkdiff::config
