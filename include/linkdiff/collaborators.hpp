#pragma once

/**
 * @file collaborators.hpp
 * @brief Seams to external linked-data processors
 *
 * linkdiff does not implement JSON-LD expansion, conformant RDF
 * serialization or URDNA2015. Embedders plug those in through the abstract
 * classes below; without them the built-in approximations are used.
 */

#include "linkdiff/common.hpp"
#include "linkdiff/document.hpp"
#include "linkdiff/rdf.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace linkdiff {

struct ExpandOptions
{
    std::optional<std::string> base;
    bool expand_contexts = true;
};

/**
 * JSON-LD expansion processor.
 */
class Expander
{
public:
    virtual ~Expander() = default;

    /// @return an error for syntactically invalid linked data
    [[nodiscard]] virtual Result<Document> expand(const Document& document,
                                                  const ExpandOptions& options) const = 0;
};

/**
 * Conversion between expanded documents and RDF triples.
 */
class RdfSerializer
{
public:
    virtual ~RdfSerializer() = default;

    [[nodiscard]] virtual Result<std::vector<rdf::Triple>> to_triples(const Document& expanded) const = 0;
    [[nodiscard]] virtual Result<Document> from_triples(std::span<const rdf::Triple> triples) const = 0;
};

/**
 * RDF dataset canonicalization (e.g. URDNA2015) producing N-Quads text.
 */
class CanonicalizationProvider
{
public:
    virtual ~CanonicalizationProvider() = default;

    [[nodiscard]] virtual Result<std::string> canonicalize(const Document& document,
                                                           std::string_view algorithm) const = 0;
};

/**
 * Named canonicalization providers. Thread-safe.
 */
class ProviderRegistry
{
public:
    /// Register or replace the provider stored under name.
    void register_provider(std::string name, std::shared_ptr<const CanonicalizationProvider> provider);

    /// @return true if a provider was removed
    bool unregister_provider(std::string_view name);

    [[nodiscard]] std::shared_ptr<const CanonicalizationProvider> find(std::string_view name) const;

    /// Registered names in sorted order.
    [[nodiscard]] std::vector<std::string> names() const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<const CanonicalizationProvider>, std::less<>> m_providers;
};

/// Process-wide registry consulted by c14n::canonicalize_rdf.
[[nodiscard]] ProviderRegistry& default_registry();

}  // namespace linkdiff
