/**
 * @file semantic_json.cpp
 * @brief Wire format for semantic diffs
 */

#include "linkdiff/schema_validate.hpp"
#include "linkdiff/semantic.hpp"

#include <format>

namespace linkdiff::semantic {

namespace {

[[nodiscard]] nlohmann::json triple_to_json(const rdf::Triple& triple)
{
    return nlohmann::json{
        {"subject", triple.subject},
        {"predicate", triple.predicate},
        {"object", term_to_json(triple.object)},
    };
}

[[nodiscard]] Result<std::vector<rdf::Triple>> triples_from_json(const nlohmann::json& j)
{
    std::vector<rdf::Triple> triples;
    for (const auto& entry : j) {
        auto object = term_from_json(entry.at("object"));
        if (!object) {
            return std::unexpected(object.error());
        }
        triples.push_back(rdf::Triple{.subject = entry.at("subject").get<std::string>(),
                                      .predicate = entry.at("predicate").get<std::string>(),
                                      .object = std::move(*object)});
    }
    return triples;
}

[[nodiscard]] nlohmann::json changes_to_json(const std::vector<PropertyChange>& changes)
{
    nlohmann::json result = nlohmann::json::array();
    for (const auto& change : changes) {
        nlohmann::json entry = {{"property", change.property}};
        if (change.old_value) {
            entry["old_value"] = term_to_json(*change.old_value);
        }
        if (change.new_value) {
            entry["new_value"] = term_to_json(*change.new_value);
        }
        result.push_back(std::move(entry));
    }
    return result;
}

[[nodiscard]] Result<std::vector<PropertyChange>> changes_from_json(const nlohmann::json& j)
{
    std::vector<PropertyChange> changes;
    for (const auto& entry : j) {
        PropertyChange change{.property = entry.at("property").get<std::string>(),
                              .old_value = std::nullopt,
                              .new_value = std::nullopt};
        for (auto [key, slot] : {std::pair{"old_value", &change.old_value}, std::pair{"new_value", &change.new_value}}) {
            if (auto it = entry.find(key); it != entry.end() && !it->is_null()) {
                auto term = term_from_json(*it);
                if (!term) {
                    return std::unexpected(term.error());
                }
                *slot = std::move(*term);
            }
        }
        changes.push_back(std::move(change));
    }
    return changes;
}

[[nodiscard]] nlohmann::json optional_string(const std::optional<std::string>& value)
{
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

[[nodiscard]] std::optional<std::string> optional_string_from(const nlohmann::json& j)
{
    if (j.is_null()) {
        return std::nullopt;
    }
    return j.get<std::string>();
}

}  // namespace

nlohmann::json term_to_json(const rdf::Term& term)
{
    if (term.kind != rdf::TermKind::kLiteral) {
        return term.value;
    }
    if (!term.language.empty()) {
        return nlohmann::json{{"value", term.value}, {"language", term.language}};
    }
    return nlohmann::json{{"value", term.value}, {"type", term.datatype}};
}

Result<rdf::Term> term_from_json(const nlohmann::json& j)
{
    if (j.is_string()) {
        return rdf::node_term(j.get<std::string>());
    }
    if (!j.is_object() || !j.contains("value") || !j["value"].is_string()) {
        return fail(errc::kInvalidDelta, std::format("Invalid RDF term: {}", j.dump()));
    }
    auto value = j["value"].get<std::string>();
    if (auto language = j.find("language"); language != j.end() && language->is_string()) {
        return rdf::lang_literal(std::move(value), language->get<std::string>());
    }
    if (auto type = j.find("type"); type != j.end() && type->is_string()) {
        return rdf::literal(std::move(value), type->get<std::string>());
    }
    return rdf::literal(std::move(value));
}

nlohmann::json to_json(const SemanticDiff& diff)
{
    nlohmann::json added = nlohmann::json::array();
    for (const auto& triple : diff.added_triples) {
        added.push_back(triple_to_json(triple));
    }
    nlohmann::json removed = nlohmann::json::array();
    for (const auto& triple : diff.removed_triples) {
        removed.push_back(triple_to_json(triple));
    }
    nlohmann::json nodes = nlohmann::json::array();
    for (const auto& node : diff.modified_nodes) {
        nodes.push_back({
            {"node_id", node.node_id},
            {"added_properties", changes_to_json(node.added_properties)},
            {"removed_properties", changes_to_json(node.removed_properties)},
            {"modified_properties", changes_to_json(node.modified_properties)},
        });
    }
    nlohmann::json changed = nlohmann::json::object();
    for (const auto& [key, values] : diff.context_changes.changed_mappings) {
        changed[key] = nlohmann::json::array({values.first, values.second});
    }
    const auto& base = diff.context_changes.base_changes;
    return nlohmann::json{
        {"added_triples", std::move(added)},
        {"removed_triples", std::move(removed)},
        {"modified_nodes", std::move(nodes)},
        {"context_changes",
         {
             {"added_mappings", diff.context_changes.added_mappings},
             {"removed_mappings", diff.context_changes.removed_mappings},
             {"changed_mappings", std::move(changed)},
             {"base_changes", nlohmann::json::array({optional_string(base.old_base), optional_string(base.new_base)})},
         }},
        {"metadata",
         {
             {"normalization_algorithm", diff.metadata.normalization_algorithm},
             {"blank_node_handling", diff.metadata.blank_node_handling},
             {"semantic_equivalence", diff.metadata.semantic_equivalence},
         }},
    };
}

Result<SemanticDiff> diff_from_json(const nlohmann::json& j)
{
    try {
        SemanticDiff diff;
        auto added = triples_from_json(j.at("added_triples"));
        if (!added) {
            return std::unexpected(added.error());
        }
        diff.added_triples = std::move(*added);
        auto removed = triples_from_json(j.at("removed_triples"));
        if (!removed) {
            return std::unexpected(removed.error());
        }
        diff.removed_triples = std::move(*removed);

        for (const auto& entry : j.value("modified_nodes", nlohmann::json::array())) {
            NodeDiff node{.node_id = entry.at("node_id").get<std::string>(),
                          .added_properties = {},
                          .removed_properties = {},
                          .modified_properties = {}};
            for (auto [key, slot] : {std::pair{"added_properties", &node.added_properties},
                                     std::pair{"removed_properties", &node.removed_properties},
                                     std::pair{"modified_properties", &node.modified_properties}}) {
                auto changes = changes_from_json(entry.value(key, nlohmann::json::array()));
                if (!changes) {
                    return std::unexpected(changes.error());
                }
                *slot = std::move(*changes);
            }
            diff.modified_nodes.push_back(std::move(node));
        }

        if (auto context = j.find("context_changes"); context != j.end()) {
            auto& changes = diff.context_changes;
            changes.added_mappings =
                context->value("added_mappings", nlohmann::json::object()).get<std::map<std::string, std::string>>();
            changes.removed_mappings =
                context->value("removed_mappings", nlohmann::json::object()).get<std::map<std::string, std::string>>();
            for (const auto& [key, values] : context->value("changed_mappings", nlohmann::json::object()).items()) {
                changes.changed_mappings[key] = {values.at(0).get<std::string>(), values.at(1).get<std::string>()};
            }
            if (auto base = context->find("base_changes"); base != context->end()) {
                changes.base_changes = BaseChange{.old_base = optional_string_from(base->at(0)),
                                                  .new_base = optional_string_from(base->at(1))};
            }
        }

        if (auto metadata = j.find("metadata"); metadata != j.end()) {
            diff.metadata.normalization_algorithm = metadata->value("normalization_algorithm", std::string("urdna2015"));
            diff.metadata.blank_node_handling = metadata->value("blank_node_handling", std::string("hash"));
            diff.metadata.semantic_equivalence = metadata->value(
                "semantic_equivalence", diff.added_triples.empty() && diff.removed_triples.empty());
        }
        return diff;
    } catch (const nlohmann::json::exception& ex) {
        return fail(errc::kInvalidDelta, std::string("Invalid semantic diff: ") + ex.what());
    }
}

Result<SemanticDiff> load_diff(const std::string& path, const std::string& schema_dir)
{
    auto payload = common::read_json_file_validated(path, schema_dir, common::kSemanticDiffSchema);
    if (!payload) {
        return std::unexpected(payload.error());
    }
    return diff_from_json(*payload);
}

}  // namespace linkdiff::semantic
