#pragma once

/**
 * @file c14n.hpp
 * @brief Canonical forms, content hashes and the canonicalization cache
 *
 * Two canonical forms are supported:
 * - stable_json: canonical JSON (see canonical_json.hpp), purely structural
 * - urdna2015_nquads: RDF dataset canonicalization through a registered
 *   CanonicalizationProvider. Without one, the sorted N-Quads of the
 *   document's normalized triple projection are used instead; that
 *   fallback is deterministic but not a conformant URDNA2015 result.
 */

#include "linkdiff/collaborators.hpp"
#include "linkdiff/common.hpp"
#include "linkdiff/config.hpp"
#include "linkdiff/document.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace linkdiff::c14n {

inline constexpr std::string_view kDefaultAlgorithm = "urdna2015";
inline constexpr std::string_view kNoProvider = "none";

/// Provider inferred when LINKDIFF_NATIVE_FEATURES lists ssi_urdna2015.
inline constexpr std::string_view kSsiProvider = "ssi";

/**
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class HashForm {
    kStableJson,
    kUrdna2015Nquads,
};

[[nodiscard]] std::string_view form_name(HashForm form);
[[nodiscard]] std::optional<HashForm> parse_form(std::string_view name);

struct RdfOptions
{
    std::optional<std::string> provider;  ///< explicit override
    config::EnvLookup env = config::process_env;
    ProviderRegistry* registry = nullptr;  ///< default_registry() when null
};

struct RdfCanonicalForm
{
    std::string nquads;
    std::string provider;  ///< provider that produced the text, or "none"
    bool conformant = false;
};

struct Hash
{
    std::string algorithm = "sha256";
    HashForm form = HashForm::kStableJson;
    std::string hex;  ///< 64 lowercase hex characters
    std::size_t quad_count = 0;
};

struct CacheStats
{
    std::size_t size = 0;
    std::size_t capacity = 0;
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t evictions = 0;
};

/// Canonical JSON of a document (stable_json form).
[[nodiscard]] Result<std::string> canonical_json(const Document& doc);

/**
 * Provider name by precedence: explicit option > stored configuration >
 * LINKDIFF_CANON_PROVIDER > "ssi" when LINKDIFF_NATIVE_FEATURES contains
 * ssi_urdna2015 > "none".
 */
[[nodiscard]] std::string resolve_provider(const RdfOptions& options = {});

/**
 * Canonicalize the RDF projection of a document.
 *
 * A missing or failing provider is logged and replaced by the built-in
 * fallback (conformant = false). Results are cached.
 * @return CanonicalizationFailed when even the fallback cannot run
 */
[[nodiscard]] Result<RdfCanonicalForm> canonicalize_rdf(const Document& doc,
                                                        std::string_view algorithm = kDefaultAlgorithm,
                                                        const RdfOptions& options = {});

/**
 * sha256 of the chosen canonical form. urdna2015_nquads falls back to
 * canonical JSON when RDF canonicalization fails.
 */
[[nodiscard]] Result<Hash> hash(const Document& doc, HashForm form = HashForm::kStableJson);

/// Hash both documents under the same form and compare.
[[nodiscard]] Result<bool> equal(const Document& a, const Document& b, HashForm form = HashForm::kStableJson);

[[nodiscard]] nlohmann::json hash_to_json(const Hash& hash);

/// Stored configuration consulted by resolve_provider().
void set_configured_provider(std::optional<std::string> name);
[[nodiscard]] std::optional<std::string> configured_provider();

[[nodiscard]] CacheStats cache_stats();
void clear_cache();

/// Shrinks the cache immediately when needed; 0 disables caching.
void set_cache_capacity(std::size_t capacity);

}  // namespace linkdiff::c14n
