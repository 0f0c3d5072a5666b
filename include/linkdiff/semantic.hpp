#pragma once

/**
 * @file semantic.hpp
 * @brief RDF graph diff of linked-data documents
 *
 * Documents are compared as sets of triples after blank-node
 * normalization, so re-ordered or re-labelled but equivalent graphs yield
 * an empty diff. Changes to the @context are reported separately.
 */

#include "linkdiff/collaborators.hpp"
#include "linkdiff/common.hpp"
#include "linkdiff/document.hpp"
#include "linkdiff/rdf.hpp"

#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace linkdiff::semantic {

/// Optional external processors; missing ones fall back to the built-ins.
struct Collaborators
{
    std::shared_ptr<const Expander> expander;
    std::shared_ptr<const RdfSerializer> serializer;
};

struct Options
{
    bool context_aware = true;
    bool expand_contexts = true;
    std::string normalization_algorithm = "urdna2015";
    std::string blank_node_strategy = "hash";
    Collaborators collaborators;
};

struct PropertyChange
{
    std::string property;  ///< predicate IRI
    std::optional<rdf::Term> old_value;
    std::optional<rdf::Term> new_value;
};

struct NodeDiff
{
    std::string node_id;
    std::vector<PropertyChange> added_properties;
    std::vector<PropertyChange> removed_properties;
    std::vector<PropertyChange> modified_properties;
};

struct BaseChange
{
    std::optional<std::string> old_base;
    std::optional<std::string> new_base;
};

/**
 * Flattened @context comparison. Non-string mapping values are stored as
 * their canonical JSON text.
 */
struct ContextDiff
{
    std::map<std::string, std::string> added_mappings;
    std::map<std::string, std::string> removed_mappings;
    std::map<std::string, std::pair<std::string, std::string>> changed_mappings;  ///< key -> (old, new)
    BaseChange base_changes;
};

struct Metadata
{
    std::string normalization_algorithm = "urdna2015";
    std::string blank_node_handling = "hash";
    bool semantic_equivalence = true;
};

struct SemanticDiff
{
    std::vector<rdf::Triple> added_triples;    ///< sorted
    std::vector<rdf::Triple> removed_triples;  ///< sorted
    std::vector<NodeDiff> modified_nodes;
    ContextDiff context_changes;
    Metadata metadata;
};

/**
 * Expand (if an expander is registered), convert to triples (serializer,
 * else the built-in extractor) and normalize blank nodes.
 * @return DiffFailed when the expander rejects the document
 */
[[nodiscard]] Result<std::vector<rdf::Triple>> project(const Document& doc, const Options& options = {});

[[nodiscard]] Result<SemanticDiff> diff(const Document& old_doc,
                                        const Document& new_doc,
                                        const Options& options = {});

/// True iff both documents project to the same normalized triple set.
[[nodiscard]] Result<bool> semantic_equivalence(const Document& old_doc,
                                                const Document& new_doc,
                                                const Options& options = {});

/**
 * Apply triple removals and additions to the document's projection,
 * reserialize, then apply the context changes to @context.
 */
[[nodiscard]] Result<Document> patch(const Document& doc, const SemanticDiff& diff, const Options& options = {});

/// Every removed triple is present in the document's projection. Never fails.
[[nodiscard]] bool validate_patch(const Document& doc, const SemanticDiff& diff, const Options& options = {});

/**
 * Concatenate triple and node lists, merge mappings last-writer-wins, keep
 * the last diff's base change and the first diff's metadata.
 */
[[nodiscard]] Result<SemanticDiff> merge_diffs(std::span<const SemanticDiff> diffs);

[[nodiscard]] Result<SemanticDiff> inverse(const SemanticDiff& diff);

/**
 * Mapping table of a @context value: arrays merge left to right, a string
 * context becomes {"@import": string}, @base is excluded.
 */
[[nodiscard]] std::map<std::string, std::string> flatten_context(const Document& context);

// ============================================================================
// Wire codec
// ============================================================================

[[nodiscard]] nlohmann::json term_to_json(const rdf::Term& term);
[[nodiscard]] Result<rdf::Term> term_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json to_json(const SemanticDiff& diff);
[[nodiscard]] Result<SemanticDiff> diff_from_json(const nlohmann::json& j);

/**
 * Read a diff file, validate it against semantic_diff.v1 and decode it.
 */
[[nodiscard]] Result<SemanticDiff> load_diff(const std::string& path, const std::string& schema_dir);

}  // namespace linkdiff::semantic
