/**
 * @file diff.cpp
 * @brief Strategy facade and process-wide configuration
 */

#include "linkdiff/diff.hpp"

#include "linkdiff/c14n.hpp"
#include "linkdiff/log.hpp"

#include <format>
#include <mutex>
#include <vector>

namespace linkdiff {

namespace {

std::mutex g_config_mutex;
std::optional<operational::ConflictResolution> g_conflict_resolution;

[[nodiscard]] std::optional<operational::ConflictResolution> configured_conflict_resolution()
{
    std::lock_guard<std::mutex> lock(g_config_mutex);
    return g_conflict_resolution;
}

/// Decode every delta with the given codec, stopping at the first failure.
template <typename T, typename Decode>
[[nodiscard]] Result<std::vector<T>> decode_all(std::span<const nlohmann::json> deltas, Decode decode)
{
    std::vector<T> decoded;
    decoded.reserve(deltas.size());
    for (const auto& delta : deltas) {
        auto value = decode(delta);
        if (!value) {
            return std::unexpected(value.error());
        }
        decoded.push_back(std::move(*value));
    }
    return decoded;
}

/// Wrap an engine result in its wire encoding.
template <typename T, typename Encode>
[[nodiscard]] Result<nlohmann::json> encoded(Result<T> result, Encode encode)
{
    if (!result) {
        return std::unexpected(result.error());
    }
    return encode(*result);
}

}  // namespace

std::string_view strategy_name(Strategy strategy)
{
    switch (strategy) {
        case Strategy::kStructural:
            return "structural";
        case Strategy::kOperational:
            return "operational";
        case Strategy::kSemantic:
            return "semantic";
    }
    return "structural";
}

Result<Strategy> parse_strategy(std::string_view name)
{
    if (name == "structural") {
        return Strategy::kStructural;
    }
    if (name == "operational") {
        return Strategy::kOperational;
    }
    if (name == "semantic") {
        return Strategy::kSemantic;
    }
    return fail(errc::kInvalidStrategy, std::format("Unknown diff strategy: {}", name));
}

Result<nlohmann::json> diff(const Document& old_doc, const Document& new_doc, const DiffOptions& options)
{
    auto strategy = parse_strategy(options.strategy);
    if (!strategy) {
        return std::unexpected(strategy.error());
    }
    switch (*strategy) {
        case Strategy::kStructural:
            return encoded(accel::structural_diff(old_doc, new_doc, options.structural, options.dispatch),
                           [](const structural::Delta& d) { return structural::to_json(d); });
        case Strategy::kOperational:
            return encoded(accel::operational_diff(old_doc, new_doc, options.operational, options.dispatch),
                           [](const operational::OperationalDiff& d) { return operational::to_json(d); });
        case Strategy::kSemantic:
            return encoded(accel::semantic_diff(old_doc, new_doc, options.semantic, options.dispatch),
                           [](const semantic::SemanticDiff& d) { return semantic::to_json(d); });
    }
    return fail(errc::kInvalidStrategy, std::format("Unknown diff strategy: {}", options.strategy));
}

Result<Document> patch(const Document& doc, const nlohmann::json& delta, const DiffOptions& options)
{
    auto strategy = parse_strategy(options.strategy);
    if (!strategy) {
        return std::unexpected(strategy.error());
    }
    switch (*strategy) {
        case Strategy::kStructural: {
            auto decoded = structural::delta_from_json(delta);
            if (!decoded) {
                return std::unexpected(decoded.error());
            }
            return accel::structural_patch(doc, *decoded, options.dispatch);
        }
        case Strategy::kOperational: {
            auto decoded = operational::diff_from_json(delta);
            if (!decoded) {
                return std::unexpected(decoded.error());
            }
            return accel::operational_patch(doc, *decoded, options.dispatch);
        }
        case Strategy::kSemantic: {
            auto decoded = semantic::diff_from_json(delta);
            if (!decoded) {
                return std::unexpected(decoded.error());
            }
            return accel::semantic_patch(doc, *decoded, options.semantic, options.dispatch);
        }
    }
    return fail(errc::kInvalidStrategy, std::format("Unknown diff strategy: {}", options.strategy));
}

bool validate_patch(const Document& doc, const nlohmann::json& delta, const DiffOptions& options)
{
    auto strategy = parse_strategy(options.strategy);
    if (!strategy) {
        return false;
    }
    switch (*strategy) {
        case Strategy::kStructural: {
            auto decoded = structural::delta_from_json(delta);
            return decoded && structural::validate_patch(doc, *decoded);
        }
        case Strategy::kOperational: {
            auto decoded = operational::diff_from_json(delta);
            return decoded && operational::validate_patch(doc, *decoded);
        }
        case Strategy::kSemantic: {
            auto decoded = semantic::diff_from_json(delta);
            return decoded && semantic::validate_patch(doc, *decoded, options.semantic);
        }
    }
    return false;
}

Result<nlohmann::json> merge_diffs(std::span<const nlohmann::json> deltas, const MergeOptions& options)
{
    auto strategy = parse_strategy(options.strategy);
    if (!strategy) {
        return std::unexpected(strategy.error());
    }
    switch (*strategy) {
        case Strategy::kStructural: {
            auto decoded = decode_all<structural::Delta>(deltas, structural::delta_from_json);
            if (!decoded) {
                return std::unexpected(decoded.error());
            }
            return encoded(structural::merge_diffs(*decoded),
                           [](const structural::Delta& d) { return structural::to_json(d); });
        }
        case Strategy::kOperational: {
            auto decoded = decode_all<operational::OperationalDiff>(deltas, operational::diff_from_json);
            if (!decoded) {
                return std::unexpected(decoded.error());
            }
            const operational::MergeOptions merge_options{
                .conflict_resolution = options.conflict_resolution ? options.conflict_resolution
                                                                   : configured_conflict_resolution()};
            return encoded(accel::operational_merge(*decoded, merge_options, options.dispatch),
                           [](const operational::OperationalDiff& d) { return operational::to_json(d); });
        }
        case Strategy::kSemantic: {
            auto decoded = decode_all<semantic::SemanticDiff>(deltas, semantic::diff_from_json);
            if (!decoded) {
                return std::unexpected(decoded.error());
            }
            return encoded(semantic::merge_diffs(*decoded),
                           [](const semantic::SemanticDiff& d) { return semantic::to_json(d); });
        }
    }
    return fail(errc::kInvalidStrategy, std::format("Unknown diff strategy: {}", options.strategy));
}

Result<nlohmann::json> inverse(const nlohmann::json& delta, const DiffOptions& options)
{
    auto strategy = parse_strategy(options.strategy);
    if (!strategy) {
        return std::unexpected(strategy.error());
    }
    switch (*strategy) {
        case Strategy::kStructural: {
            auto decoded = structural::delta_from_json(delta);
            if (!decoded) {
                return std::unexpected(decoded.error());
            }
            return encoded(structural::inverse(*decoded),
                           [](const structural::Delta& d) { return structural::to_json(d); });
        }
        case Strategy::kOperational: {
            auto decoded = operational::diff_from_json(delta);
            if (!decoded) {
                return std::unexpected(decoded.error());
            }
            return encoded(operational::inverse(*decoded),
                           [](const operational::OperationalDiff& d) { return operational::to_json(d); });
        }
        case Strategy::kSemantic: {
            auto decoded = semantic::diff_from_json(delta);
            if (!decoded) {
                return std::unexpected(decoded.error());
            }
            return encoded(semantic::inverse(*decoded),
                           [](const semantic::SemanticDiff& d) { return semantic::to_json(d); });
        }
    }
    return fail(errc::kInvalidStrategy, std::format("Unknown diff strategy: {}", options.strategy));
}

VoidResult apply_config(const config::Config& config)
{
    auto policy = operational::parse_conflict_resolution(config.default_conflict_resolution);
    if (!policy) {
        return fail(errc::kConfigError, std::format("Unknown conflict resolution: {}", config.default_conflict_resolution));
    }
    {
        std::lock_guard<std::mutex> lock(g_config_mutex);
        g_conflict_resolution = *policy;
    }
    c14n::set_configured_provider(config.canon_provider);
    c14n::set_cache_capacity(config.cache_capacity);
    accel::set_verify(config.verify_acceleration);
    log::set_level(config.log_level);
    log::debug(std::format("Configuration applied (cache capacity {})", config.cache_capacity));
    return {};
}

operational::ConflictResolution default_conflict_resolution()
{
    return configured_conflict_resolution().value_or(operational::ConflictResolution::kLastWriteWins);
}

}  // namespace linkdiff
