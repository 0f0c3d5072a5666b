#pragma once

/**
 * @file rdf.hpp
 * @brief Triples, the built-in linked-data projection and N-Quads text
 *
 * The projection is an approximation of JSON-LD to RDF: it resolves keys
 * against the document's own @context and never fetches remote contexts.
 */

#include "linkdiff/common.hpp"
#include "linkdiff/document.hpp"

#include <compare>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace linkdiff::rdf {

inline constexpr std::string_view kRdfNs = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
inline constexpr std::string_view kRdfsNs = "http://www.w3.org/2000/01/rdf-schema#";
inline constexpr std::string_view kXsdNs = "http://www.w3.org/2001/XMLSchema#";
inline constexpr std::string_view kSchemaNs = "http://schema.org/";
inline constexpr std::string_view kDefaultVocab = "http://example.org/";

inline constexpr std::string_view kRdfType = "http://www.w3.org/1999/02/22-rdf-syntax-ns#type";
inline constexpr std::string_view kXsdString = "http://www.w3.org/2001/XMLSchema#string";
inline constexpr std::string_view kXsdInteger = "http://www.w3.org/2001/XMLSchema#integer";
inline constexpr std::string_view kXsdDouble = "http://www.w3.org/2001/XMLSchema#double";
inline constexpr std::string_view kXsdBoolean = "http://www.w3.org/2001/XMLSchema#boolean";

/**
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class TermKind {
    kIri,
    kBlank,
    kLiteral,
};

/**
 * Object position of a triple. Literals carry a datatype or a language tag.
 * Ordered by (kind, value, datatype, language).
 */
struct Term
{
    TermKind kind = TermKind::kIri;
    std::string value;
    std::string datatype;
    std::string language;

    friend auto operator<=>(const Term&, const Term&) = default;
};

/// Ordered by (subject, predicate, object).
struct Triple
{
    std::string subject;  ///< IRI or "_:label"
    std::string predicate;
    Term object;

    friend auto operator<=>(const Triple&, const Triple&) = default;
};

[[nodiscard]] Term iri(std::string value);
[[nodiscard]] Term blank(std::string label);
[[nodiscard]] Term literal(std::string value, std::string datatype = std::string(kXsdString));
[[nodiscard]] Term lang_literal(std::string value, std::string language);

[[nodiscard]] bool is_blank_label(std::string_view id);

/// IRI or blank term for a node reference.
[[nodiscard]] Term node_term(std::string id);

/**
 * Built-in extractor: one triple per property value of every node of an
 * expanded (or self-contained compact) document. Nodes without @id get a
 * content fingerprint label "_:b" + 16 hex chars.
 */
[[nodiscard]] std::vector<Triple> extract_triples(const Document& doc);

/**
 * Relabel blank nodes to "_:c14n<N>" by one-hop fingerprint, then sort and
 * deduplicate. Labels of structurally identical graphs coincide unless two
 * blank nodes are only distinguishable beyond their direct neighbours.
 */
[[nodiscard]] std::vector<Triple> normalize_blank_nodes(std::vector<Triple> triples);

/// N-Triples/N-Quads term syntax (literals escaped, xsd:string implicit).
[[nodiscard]] std::string term_to_nquads(const Term& term);

/// One "s p o ." line per triple, in the given order.
[[nodiscard]] std::string to_nquads(std::span<const Triple> triples);

/**
 * Parse N-Triples / N-Quads lines (a graph label, if present, is ignored).
 * @return ParseError on malformed lines
 */
[[nodiscard]] Result<std::vector<Triple>> parse_nquads(std::string_view text);

/**
 * Built-in reserializer: group triples by subject and compact them against
 * the context. One node yields a node object, several yield "@graph".
 * @param context value placed in "@context" (null for none)
 */
[[nodiscard]] Document from_triples(std::span<const Triple> triples, const Document& context);

}  // namespace linkdiff::rdf
