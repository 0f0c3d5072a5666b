/**
 * @file canonical_json.cpp
 * @brief Canonical JSON serialization
 */

#include "linkdiff/canonical_json.hpp"

#include "linkdiff/common.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <format>
#include <string_view>
#include <vector>

namespace linkdiff::canonical {

namespace {

constexpr double kMaxExactInteger = 9007199254740992.0;  // 2^53

linkdiff::VoidResult validate_finite(const nlohmann::json& j, const std::string& path)
{
    if (j.is_number_float() && !std::isfinite(j.get<double>())) {
        return fail(errc::kCanonicalizationFailed,
                    std::format("Non-finite number not allowed in canonical JSON at: {}", path));
    }
    if (j.is_object()) {
        for (const auto& [key, val] : j.items()) {
            if (auto result = validate_finite(val, std::format("{}.{}", path, key)); !result) {
                return result;
            }
        }
    } else if (j.is_array()) {
        std::size_t i = 0;
        for (const auto& elem : j) {
            if (auto result = validate_finite(elem, std::format("{}[{}]", path, i));
                !result) {
                return result;
            }
            ++i;
        }
    }
    return {};
}

[[nodiscard]] nlohmann::json canonical_number(const nlohmann::json& j)
{
    const double value = j.get<double>();
    if (std::trunc(value) == value && std::fabs(value) <= kMaxExactInteger) {
        return static_cast<std::int64_t>(value);
    }
    return j;
}

/**
 * @brief Recursively create a sorted copy of JSON (keys in lexicographic order)
 */
[[nodiscard]] nlohmann::json make_sorted_copy(const nlohmann::json& j)
{
    if (j.is_object()) {
        std::vector<std::string> keys;
        keys.reserve(j.size());
        for (const auto& [key, _] : j.items()) {
            keys.push_back(key);
        }
        std::ranges::sort(keys);

        nlohmann::json result = nlohmann::json::object();
        for (const auto& key : keys) {
            result[key] = make_sorted_copy(j.at(key));
        }
        return result;
    }
    if (j.is_array()) {
        nlohmann::json result = nlohmann::json::array();
        result.get_ref<nlohmann::json::array_t&>().reserve(j.size());
        for (const auto& elem : j) {
            result.push_back(make_sorted_copy(elem));
        }
        return result;
    }
    if (j.is_number_float()) {
        return canonical_number(j);
    }
    return j;
}

}  // namespace

linkdiff::Result<std::string> canonicalize(const nlohmann::json& j)
{
    if (auto result = validate_finite(j, "$"); !result) {
        return std::unexpected(result.error());
    }

    nlohmann::json sorted = make_sorted_copy(j);

    try {
        return sorted.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const nlohmann::json::exception& ex) {
        return fail(errc::kCanonicalizationFailed,
                    std::string("Failed to encode canonical JSON: ") + ex.what());
    }
}

linkdiff::Result<std::string> hash_canonical(const nlohmann::json& j)
{
    auto canonical = canonicalize(j);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return common::sha256_prefixed(*canonical);
}

linkdiff::VoidResult validate_for_canonical(const nlohmann::json& j)
{
    return validate_finite(j, "$");
}

}  // namespace linkdiff::canonical
