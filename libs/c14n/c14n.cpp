/**
 * @file c14n.cpp
 * @brief Canonicalization provider selection, fallback, hashing and cache
 */

#include "linkdiff/c14n.hpp"

#include "linkdiff/canonical_json.hpp"
#include "linkdiff/log.hpp"
#include "linkdiff/rdf.hpp"
#include "linkdiff/semantic.hpp"

#include <algorithm>
#include <format>
#include <list>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace linkdiff::c14n {

namespace {

/**
 * Least-recently-used map from cache key to canonical form.
 * Values are computed outside the lock; concurrent misses may compute the
 * same entry twice and the later put() wins.
 */
class LruCache
{
public:
    explicit LruCache(std::size_t capacity)
        : m_capacity(capacity)
    {}

    [[nodiscard]] std::optional<RdfCanonicalForm> get(const std::string& key)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_index.find(key);
        if (it == m_index.end()) {
            ++m_misses;
            return std::nullopt;
        }
        ++m_hits;
        m_entries.splice(m_entries.begin(), m_entries, it->second);
        return it->second->second;
    }

    void put(const std::string& key, RdfCanonicalForm value)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_capacity == 0) {
            return;
        }
        if (auto it = m_index.find(key); it != m_index.end()) {
            it->second->second = std::move(value);
            m_entries.splice(m_entries.begin(), m_entries, it->second);
            return;
        }
        m_entries.emplace_front(key, std::move(value));
        m_index[key] = m_entries.begin();
        evict_locked();
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.clear();
        m_index.clear();
        m_hits = 0;
        m_misses = 0;
        m_evictions = 0;
    }

    void set_capacity(std::size_t capacity)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_capacity = capacity;
        evict_locked();
    }

    [[nodiscard]] CacheStats stats() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return CacheStats{.size = m_entries.size(),
                          .capacity = m_capacity,
                          .hits = m_hits,
                          .misses = m_misses,
                          .evictions = m_evictions};
    }

private:
    void evict_locked()
    {
        while (m_entries.size() > m_capacity) {
            m_index.erase(m_entries.back().first);
            m_entries.pop_back();
            ++m_evictions;
        }
    }

    using Entry = std::pair<std::string, RdfCanonicalForm>;

    mutable std::mutex m_mutex;
    std::size_t m_capacity;
    std::list<Entry> m_entries;
    std::unordered_map<std::string, std::list<Entry>::iterator> m_index;
    std::uint64_t m_hits = 0;
    std::uint64_t m_misses = 0;
    std::uint64_t m_evictions = 0;
};

LruCache& cache()
{
    static LruCache instance(config::kDefaultCacheCapacity);
    return instance;
}

std::mutex g_provider_mutex;
std::optional<std::string> g_configured_provider;

[[nodiscard]] std::string cache_key(std::string_view provider, std::string_view algorithm, std::string_view digest)
{
    std::string key(provider);
    key += '|';
    key += algorithm;
    key += '|';
    key += digest;
    return key;
}

/// Sorted N-Quads of the normalized built-in projection.
[[nodiscard]] Result<std::string> fallback_nquads(const Document& doc)
{
    auto triples = semantic::project(doc);
    if (!triples) {
        return fail(errc::kCanonicalizationFailed, triples.error().message);
    }
    const std::string text = rdf::to_nquads(*triples);
    std::vector<std::string> lines;
    std::string_view rest = text;
    while (!rest.empty()) {
        const auto newline = rest.find('\n');
        lines.emplace_back(rest.substr(0, newline));
        rest.remove_prefix(newline == std::string_view::npos ? rest.size() : newline + 1);
    }
    std::ranges::sort(lines);
    std::string out;
    for (const auto& line : lines) {
        out += line;
        out += '\n';
    }
    return out;
}

[[nodiscard]] Result<RdfCanonicalForm> cached_fallback(const Document& doc,
                                                       std::string_view algorithm,
                                                       const std::string& digest)
{
    const auto key = cache_key(kNoProvider, algorithm, digest);
    if (auto hit = cache().get(key)) {
        return *hit;
    }
    auto nquads = fallback_nquads(doc);
    if (!nquads) {
        return std::unexpected(nquads.error());
    }
    RdfCanonicalForm form{.nquads = std::move(*nquads), .provider = std::string(kNoProvider), .conformant = false};
    cache().put(key, form);
    return form;
}

}  // namespace

std::string_view form_name(HashForm form)
{
    switch (form) {
        case HashForm::kStableJson:
            return "stable_json";
        case HashForm::kUrdna2015Nquads:
            return "urdna2015_nquads";
    }
    return "stable_json";
}

std::optional<HashForm> parse_form(std::string_view name)
{
    if (name == "stable_json") {
        return HashForm::kStableJson;
    }
    if (name == "urdna2015_nquads") {
        return HashForm::kUrdna2015Nquads;
    }
    return std::nullopt;
}

Result<std::string> canonical_json(const Document& doc)
{
    return canonical::canonicalize(doc);
}

void set_configured_provider(std::optional<std::string> name)
{
    std::lock_guard<std::mutex> lock(g_provider_mutex);
    g_configured_provider = std::move(name);
}

std::optional<std::string> configured_provider()
{
    std::lock_guard<std::mutex> lock(g_provider_mutex);
    return g_configured_provider;
}

std::string resolve_provider(const RdfOptions& options)
{
    if (options.provider) {
        return *options.provider;
    }
    if (auto stored = configured_provider()) {
        return *stored;
    }
    if (options.env) {
        if (auto env = options.env("LINKDIFF_CANON_PROVIDER"); env && !env->empty()) {
            return *env;
        }
        if (auto features = options.env("LINKDIFF_NATIVE_FEATURES");
            features && features->find("ssi_urdna2015") != std::string::npos) {
            return std::string(kSsiProvider);
        }
    }
    return std::string(kNoProvider);
}

Result<RdfCanonicalForm> canonicalize_rdf(const Document& doc, std::string_view algorithm, const RdfOptions& options)
{
    auto canonical = canonical::canonicalize(doc);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    const std::string digest = common::sha256(*canonical);
    const std::string provider_name = resolve_provider(options);
    if (provider_name == kNoProvider) {
        return cached_fallback(doc, algorithm, digest);
    }

    const auto key = cache_key(provider_name, algorithm, digest);
    if (auto hit = cache().get(key)) {
        return *hit;
    }
    ProviderRegistry& registry = options.registry != nullptr ? *options.registry : default_registry();
    auto provider = registry.find(provider_name);
    if (!provider) {
        log::debug(std::format("{}: canonicalization provider '{}' is not registered, using fallback ordering",
                               errc::kProviderUnavailable,
                               provider_name));
        return cached_fallback(doc, algorithm, digest);
    }
    auto nquads = provider->canonicalize(doc, algorithm);
    if (!nquads) {
        log::warn(std::format("{}: canonicalization provider '{}' failed ({}), using fallback ordering",
                              errc::kProviderUnavailable,
                              provider_name,
                              nquads.error().message));
        return cached_fallback(doc, algorithm, digest);
    }
    RdfCanonicalForm form{.nquads = std::move(*nquads), .provider = provider_name, .conformant = true};
    cache().put(key, form);
    return form;
}

Result<Hash> hash(const Document& doc, HashForm form)
{
    std::optional<std::string> text;
    if (form == HashForm::kUrdna2015Nquads) {
        auto rdf_form = canonicalize_rdf(doc);
        if (rdf_form) {
            text = std::move(rdf_form->nquads);
        } else {
            log::debug(std::format("RDF canonicalization failed, hashing canonical JSON: {}", rdf_form.error().message));
        }
    }
    if (!text) {
        auto canonical = canonical::canonicalize(doc);
        if (!canonical) {
            return std::unexpected(canonical.error());
        }
        text = std::move(*canonical);
    }
    return Hash{.algorithm = "sha256",
                .form = form,
                .hex = common::sha256(*text),
                .quad_count = common::count_nonempty_lines(*text)};
}

Result<bool> equal(const Document& a, const Document& b, HashForm form)
{
    auto left = hash(a, form);
    if (!left) {
        return std::unexpected(left.error());
    }
    auto right = hash(b, form);
    if (!right) {
        return std::unexpected(right.error());
    }
    return left->hex == right->hex;
}

nlohmann::json hash_to_json(const Hash& hash)
{
    return nlohmann::json{
        {"algorithm", hash.algorithm},
        {"form", std::string(form_name(hash.form))},
        {"hash", hash.hex},
        {"quad_count", hash.quad_count},
    };
}

CacheStats cache_stats()
{
    return cache().stats();
}

void clear_cache()
{
    cache().clear();
}

void set_cache_capacity(std::size_t capacity)
{
    cache().set_capacity(capacity);
}

}  // namespace linkdiff::c14n
