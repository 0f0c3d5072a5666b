/**
 * @file semantic.cpp
 * @brief Triple-set diff, patch, merge and inverse
 */

#include "linkdiff/semantic.hpp"

#include "linkdiff/canonical_json.hpp"
#include "linkdiff/log.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <set>

namespace linkdiff::semantic {

namespace {

using rdf::Term;
using rdf::Triple;

[[nodiscard]] Document context_of(const Document& doc)
{
    if (doc.is_object()) {
        if (auto it = doc.find("@context"); it != doc.end()) {
            return *it;
        }
    }
    return nullptr;
}

[[nodiscard]] std::optional<std::string> base_of(const Document& context)
{
    if (context.is_array()) {
        std::optional<std::string> base;
        for (const auto& entry : context) {
            if (auto inner = base_of(entry)) {
                base = std::move(inner);
            }
        }
        return base;
    }
    if (context.is_object()) {
        if (auto it = context.find("@base"); it != context.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

void flatten_into(const Document& context, std::map<std::string, std::string>& out)
{
    if (context.is_string()) {
        out["@import"] = context.get<std::string>();
    } else if (context.is_array()) {
        for (const auto& entry : context) {
            flatten_into(entry, out);
        }
    } else if (context.is_object()) {
        for (const auto& [key, value] : context.items()) {
            if (key == "@base") {
                continue;
            }
            if (value.is_string()) {
                out[key] = value.get<std::string>();
            } else {
                auto encoded = canonical::canonicalize(value);
                out[key] = encoded ? *encoded : value.dump();
            }
        }
    }
}

/// Inverse of the flattening: JSON-looking mapping text becomes JSON again.
[[nodiscard]] Document decode_mapping(const std::string& text)
{
    if (text.starts_with('{') || text.starts_with('[')) {
        auto parsed = Document::parse(text, nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }
    return text;
}

[[nodiscard]] bool has_context_changes(const ContextDiff& changes)
{
    return !changes.added_mappings.empty() || !changes.removed_mappings.empty()
           || !changes.changed_mappings.empty()
           || changes.base_changes.old_base != changes.base_changes.new_base;
}

[[nodiscard]] Document apply_context_changes(const Document& context, const ContextDiff& changes)
{
    if (!has_context_changes(changes)) {
        return context;
    }
    Document updated = Document::object();
    if (context.is_object()) {
        updated = context;
    } else if (!context.is_null()) {
        std::map<std::string, std::string> flat;
        flatten_into(context, flat);
        for (const auto& [key, value] : flat) {
            updated[key] = decode_mapping(value);
        }
        if (auto base = base_of(context)) {
            updated["@base"] = *base;
        }
    }
    for (const auto& [key, value] : changes.added_mappings) {
        updated[key] = decode_mapping(value);
    }
    for (const auto& [key, value] : changes.removed_mappings) {
        updated.erase(key);
    }
    for (const auto& [key, values] : changes.changed_mappings) {
        updated[key] = decode_mapping(values.second);
    }
    if (changes.base_changes.old_base != changes.base_changes.new_base) {
        if (changes.base_changes.new_base) {
            updated["@base"] = *changes.base_changes.new_base;
        } else {
            updated.erase("@base");
        }
    }
    if (updated.empty() && context.is_null()) {
        return nullptr;
    }
    return updated;
}

[[nodiscard]] ContextDiff compare_contexts(const Document& old_doc, const Document& new_doc)
{
    const Document old_context = context_of(old_doc);
    const Document new_context = context_of(new_doc);
    const auto old_mappings = flatten_context(old_context);
    const auto new_mappings = flatten_context(new_context);

    ContextDiff result;
    for (const auto& [key, value] : new_mappings) {
        auto it = old_mappings.find(key);
        if (it == old_mappings.end()) {
            result.added_mappings[key] = value;
        } else if (it->second != value) {
            result.changed_mappings[key] = {it->second, value};
        }
    }
    for (const auto& [key, value] : old_mappings) {
        if (!new_mappings.contains(key)) {
            result.removed_mappings[key] = value;
        }
    }
    result.base_changes = BaseChange{.old_base = base_of(old_context), .new_base = base_of(new_context)};
    return result;
}

/**
 * Group added/removed triples by subject. Per (subject, predicate) the
 * first unused removed and added triples pair up as one modification.
 */
[[nodiscard]] std::vector<NodeDiff> group_by_node(const std::vector<Triple>& added,
                                                  const std::vector<Triple>& removed)
{
    std::vector<std::string> subjects;
    std::set<std::string> seen;
    for (const auto* list : {&added, &removed}) {
        for (const auto& triple : *list) {
            if (seen.insert(triple.subject).second) {
                subjects.push_back(triple.subject);
            }
        }
    }

    std::vector<NodeDiff> nodes;
    nodes.reserve(subjects.size());
    for (const auto& subject : subjects) {
        std::vector<const Triple*> node_added;
        std::vector<const Triple*> node_removed;
        for (const auto& triple : added) {
            if (triple.subject == subject) {
                node_added.push_back(&triple);
            }
        }
        for (const auto& triple : removed) {
            if (triple.subject == subject) {
                node_removed.push_back(&triple);
            }
        }

        std::vector<std::string> predicates;
        std::set<std::string> seen_predicates;
        for (const auto* list : {&node_added, &node_removed}) {
            for (const auto* triple : *list) {
                if (seen_predicates.insert(triple->predicate).second) {
                    predicates.push_back(triple->predicate);
                }
            }
        }

        NodeDiff node{.node_id = subject, .added_properties = {}, .removed_properties = {}, .modified_properties = {}};
        std::set<const Triple*> used;
        for (const auto& predicate : predicates) {
            auto by_predicate = [&predicate](const Triple* t) { return t->predicate == predicate; };
            auto add = std::ranges::find_if(node_added, by_predicate);
            auto rem = std::ranges::find_if(node_removed, by_predicate);
            if (add != node_added.end() && rem != node_removed.end()) {
                node.modified_properties.push_back(PropertyChange{
                    .property = predicate, .old_value = (*rem)->object, .new_value = (*add)->object});
                used.insert(*add);
                used.insert(*rem);
            }
        }
        for (const auto* triple : node_added) {
            if (!used.contains(triple)) {
                node.added_properties.push_back(
                    PropertyChange{.property = triple->predicate, .old_value = std::nullopt, .new_value = triple->object});
            }
        }
        for (const auto* triple : node_removed) {
            if (!used.contains(triple)) {
                node.removed_properties.push_back(
                    PropertyChange{.property = triple->predicate, .old_value = triple->object, .new_value = std::nullopt});
            }
        }
        nodes.push_back(std::move(node));
    }
    return nodes;
}

[[nodiscard]] std::vector<Triple> sorted_unique(std::vector<Triple> triples)
{
    std::ranges::sort(triples);
    auto [first, last] = std::ranges::unique(triples);
    triples.erase(first, last);
    return triples;
}

[[nodiscard]] Result<Document> reserialize(const std::vector<Triple>& triples,
                                           const Document& context,
                                           const Options& options)
{
    if (const auto& serializer = options.collaborators.serializer) {
        auto document = serializer->from_triples(triples);
        if (document && document->is_object()) {
            if (!context.is_null()) {
                (*document)["@context"] = context;
            }
            return document;
        }
        log::warn("RDF serializer could not rebuild the document, using built-in reserializer: "
                  + (document ? std::string("result is not an object") : document.error().message));
    }
    return rdf::from_triples(triples, context);
}

PropertyChange invert_change(const PropertyChange& change)
{
    return PropertyChange{.property = change.property, .old_value = change.new_value, .new_value = change.old_value};
}

}  // namespace

std::map<std::string, std::string> flatten_context(const Document& context)
{
    std::map<std::string, std::string> result;
    flatten_into(context, result);
    return result;
}

Result<std::vector<Triple>> project(const Document& doc, const Options& options)
{
    try {
        Document expanded = doc;
        if (options.expand_contexts && options.collaborators.expander) {
            const ExpandOptions expand_options{.base = base_of(context_of(doc)),
                                               .expand_contexts = options.expand_contexts};
            auto result = options.collaborators.expander->expand(doc, expand_options);
            if (!result) {
                return fail(errc::kDiffFailed, std::format("Expansion failed: {}", result.error().message));
            }
            expanded = std::move(*result);
        }

        std::vector<Triple> triples;
        if (const auto& serializer = options.collaborators.serializer) {
            auto result = serializer->to_triples(expanded);
            if (result && !result->empty()) {
                triples = std::move(*result);
            } else {
                log::debug(result ? std::string("RDF serializer produced no triples, using built-in extractor")
                                  : std::format("RDF serializer failed, using built-in extractor: {}",
                                                result.error().message));
            }
        }
        if (triples.empty()) {
            triples = rdf::extract_triples(expanded);
        }
        return rdf::normalize_blank_nodes(std::move(triples));
    } catch (const nlohmann::json::exception& ex) {
        return fail(errc::kDiffFailed, std::string("Triple projection failed: ") + ex.what());
    }
}

Result<SemanticDiff> diff(const Document& old_doc, const Document& new_doc, const Options& options)
{
    auto old_triples = project(old_doc, options);
    if (!old_triples) {
        return std::unexpected(old_triples.error());
    }
    auto new_triples = project(new_doc, options);
    if (!new_triples) {
        return std::unexpected(new_triples.error());
    }

    SemanticDiff result;
    std::ranges::set_difference(*new_triples, *old_triples, std::back_inserter(result.added_triples));
    std::ranges::set_difference(*old_triples, *new_triples, std::back_inserter(result.removed_triples));
    result.modified_nodes = group_by_node(result.added_triples, result.removed_triples);
    if (options.context_aware) {
        try {
            result.context_changes = compare_contexts(old_doc, new_doc);
        } catch (const nlohmann::json::exception& ex) {
            return fail(errc::kDiffFailed, std::string("Context comparison failed: ") + ex.what());
        }
    }
    result.metadata = Metadata{.normalization_algorithm = options.normalization_algorithm,
                               .blank_node_handling = options.blank_node_strategy,
                               .semantic_equivalence =
                                   result.added_triples.empty() && result.removed_triples.empty()};
    return result;
}

Result<bool> semantic_equivalence(const Document& old_doc, const Document& new_doc, const Options& options)
{
    auto old_triples = project(old_doc, options);
    if (!old_triples) {
        return std::unexpected(old_triples.error());
    }
    auto new_triples = project(new_doc, options);
    if (!new_triples) {
        return std::unexpected(new_triples.error());
    }
    return *old_triples == *new_triples;
}

Result<Document> patch(const Document& doc, const SemanticDiff& diff, const Options& options)
{
    auto current = project(doc, options);
    if (!current) {
        return fail(errc::kPatchFailed, current.error().message);
    }
    const auto removed = sorted_unique(diff.removed_triples);
    std::vector<Triple> kept;
    std::ranges::set_difference(*current, removed, std::back_inserter(kept));
    kept.insert(kept.end(), diff.added_triples.begin(), diff.added_triples.end());
    const auto triples = sorted_unique(std::move(kept));

    try {
        const Document context = apply_context_changes(context_of(doc), diff.context_changes);
        auto result = reserialize(triples, context, options);
        if (!result) {
            return fail(errc::kPatchFailed, result.error().message);
        }
        return result;
    } catch (const nlohmann::json::exception& ex) {
        return fail(errc::kPatchFailed, std::string("Semantic patch failed: ") + ex.what());
    }
}

bool validate_patch(const Document& doc, const SemanticDiff& diff, const Options& options)
{
    auto current = project(doc, options);
    if (!current) {
        return false;
    }
    return std::ranges::all_of(diff.removed_triples,
                               [&current](const Triple& t) { return std::ranges::binary_search(*current, t); });
}

Result<SemanticDiff> merge_diffs(std::span<const SemanticDiff> diffs)
{
    SemanticDiff merged;
    if (diffs.empty()) {
        return merged;
    }
    merged.metadata = diffs.front().metadata;
    for (const auto& diff : diffs) {
        merged.added_triples.insert(merged.added_triples.end(), diff.added_triples.begin(), diff.added_triples.end());
        merged.removed_triples.insert(merged.removed_triples.end(),
                                      diff.removed_triples.begin(),
                                      diff.removed_triples.end());
        merged.modified_nodes.insert(merged.modified_nodes.end(), diff.modified_nodes.begin(), diff.modified_nodes.end());
        auto& context = merged.context_changes;
        for (const auto& [key, value] : diff.context_changes.added_mappings) {
            context.added_mappings[key] = value;
        }
        for (const auto& [key, value] : diff.context_changes.removed_mappings) {
            context.removed_mappings[key] = value;
        }
        for (const auto& [key, value] : diff.context_changes.changed_mappings) {
            context.changed_mappings[key] = value;
        }
        context.base_changes = diff.context_changes.base_changes;
    }
    return merged;
}

Result<SemanticDiff> inverse(const SemanticDiff& diff)
{
    SemanticDiff result;
    result.added_triples = diff.removed_triples;
    result.removed_triples = diff.added_triples;
    for (const auto& node : diff.modified_nodes) {
        NodeDiff inverted{.node_id = node.node_id, .added_properties = {}, .removed_properties = {}, .modified_properties = {}};
        std::ranges::transform(node.removed_properties, std::back_inserter(inverted.added_properties), invert_change);
        std::ranges::transform(node.added_properties, std::back_inserter(inverted.removed_properties), invert_change);
        std::ranges::transform(node.modified_properties, std::back_inserter(inverted.modified_properties), invert_change);
        result.modified_nodes.push_back(std::move(inverted));
    }
    const auto& context = diff.context_changes;
    result.context_changes.added_mappings = context.removed_mappings;
    result.context_changes.removed_mappings = context.added_mappings;
    for (const auto& [key, values] : context.changed_mappings) {
        result.context_changes.changed_mappings[key] = {values.second, values.first};
    }
    result.context_changes.base_changes =
        BaseChange{.old_base = context.base_changes.new_base, .new_base = context.base_changes.old_base};
    result.metadata = diff.metadata;
    result.metadata.semantic_equivalence = false;
    return result;
}

}  // namespace linkdiff::semantic
