/**
 * @file structural_json.cpp
 * @brief jsondiffpatch wire format for structural deltas
 */

#include "linkdiff/schema_validate.hpp"
#include "linkdiff/structural.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <format>
#include <optional>

namespace linkdiff::structural {

namespace {

constexpr int kRemovedMarker = 0;
constexpr int kTextMarker = 2;
constexpr int kMovedMarker = 3;

[[nodiscard]] std::unexpected<Error> invalid(const std::string& what, const nlohmann::json& j)
{
    return fail(errc::kInvalidDelta, std::format("{}: {}", what, j.dump()));
}

[[nodiscard]] std::optional<std::size_t> parse_index(std::string_view text)
{
    std::size_t index = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), index);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return index;
}

[[nodiscard]] bool has_marker(const nlohmann::json& j, int marker)
{
    return j.size() == 3 && j[2].is_number_integer() && j[2].get<int>() == marker;
}

Result<Delta> decode(const nlohmann::json& j);

Result<Delta> decode_array_delta(const nlohmann::json& j)
{
    ArrayDelta result;
    for (const auto& [key, value] : j.items()) {
        if (key == "_t") {
            continue;
        }
        if (key.starts_with('_')) {
            auto from = parse_index(std::string_view(key).substr(1));
            if (!from || !value.is_array()) {
                return invalid(std::format("Invalid array removal entry '{}'", key), value);
            }
            if (has_marker(value, kRemovedMarker) && value[1] == 0) {
                result.removed.push_back(RemovedEntry{.index = *from, .removed = Removed{.value = value[0]}});
            } else if (has_marker(value, kMovedMarker) && value[1].is_number_integer()
                       && value[1].get<std::int64_t>() >= 0) {
                result.changed.push_back(ArrayEntry{.index = value[1].get<std::size_t>(),
                                                    .delta = Delta{.node = Moved{.from_index = *from}}});
            } else {
                return invalid(std::format("Expected [old, 0, 0] or [\"\", to, 3] under '{}'", key), value);
            }
            continue;
        }
        auto index = parse_index(key);
        if (!index) {
            return invalid(std::format("Invalid array index '{}'", key), j);
        }
        auto sub = decode(value);
        if (!sub) {
            return std::unexpected(sub.error());
        }
        if (std::holds_alternative<Removed>(sub->node) || std::holds_alternative<Moved>(sub->node)) {
            return invalid(std::format("Removal or move keyed by new index '{}'", key), value);
        }
        result.changed.push_back(ArrayEntry{.index = *index, .delta = std::move(*sub)});
    }

    std::ranges::sort(result.removed, {}, &RemovedEntry::index);
    std::ranges::sort(result.changed, {}, &ArrayEntry::index);
    auto duplicate = std::ranges::adjacent_find(result.changed, {}, &ArrayEntry::index);
    if (duplicate != result.changed.end()) {
        return invalid(std::format("Two entries for new index {}", duplicate->index), j);
    }
    return Delta{.node = std::move(result)};
}

Result<Delta> decode(const nlohmann::json& j)
{
    if (j.is_array()) {
        if (j.size() == 1) {
            return Delta{.node = Added{.value = j[0]}};
        }
        if (j.size() == 2) {
            return Delta{.node = Changed{.old_value = j[0], .new_value = j[1]}};
        }
        if (has_marker(j, kRemovedMarker) && j[1] == 0) {
            return Delta{.node = Removed{.value = j[0]}};
        }
        if (has_marker(j, kTextMarker) && j[1] == 0) {
            auto ops = text_ops_from_json(j[0]);
            if (!ops) {
                return std::unexpected(ops.error());
            }
            return Delta{.node = TextPatch{.ops = std::move(*ops)}};
        }
        return invalid("Unrecognized delta array", j);
    }
    if (j.is_object()) {
        // A key delta is never a bare string, so only "_t": "a" tags an array.
        if (auto tag = j.find("_t"); tag != j.end() && *tag == "a") {
            return decode_array_delta(j);
        }
        ObjectDelta result;
        for (const auto& [key, value] : j.items()) {
            auto sub = decode(value);
            if (!sub) {
                return std::unexpected(sub.error());
            }
            if (std::holds_alternative<Moved>(sub->node)) {
                return invalid("Move inside an object delta", value);
            }
            result.entries.push_back(ObjectEntry{.key = key, .delta = std::move(*sub)});
        }
        return Delta{.node = std::move(result)};
    }
    return invalid("Delta must be an array or object", j);
}

}  // namespace

nlohmann::json text_ops_to_json(std::span<const lcs::TextOp> ops)
{
    nlohmann::json result = nlohmann::json::array();
    for (const auto& op : ops) {
        nlohmann::json entry = {{"op", std::string(lcs::text_op_name(op.kind))}};
        switch (op.kind) {
            case lcs::TextOpKind::kDelete:
                entry["start"] = op.start;
                entry["end"] = op.end;
                entry["old_text"] = op.old_text;
                break;
            case lcs::TextOpKind::kInsert:
                entry["at"] = op.start;
                entry["text"] = op.text;
                break;
            case lcs::TextOpKind::kReplace:
                entry["start"] = op.start;
                entry["end"] = op.end;
                entry["old_text"] = op.old_text;
                entry["text"] = op.text;
                break;
        }
        result.push_back(std::move(entry));
    }
    return result;
}

Result<std::vector<lcs::TextOp>> text_ops_from_json(const nlohmann::json& j)
{
    if (!j.is_array()) {
        return invalid("Text ops must be an array", j);
    }
    std::vector<lcs::TextOp> ops;
    try {
        for (const auto& entry : j) {
            const auto name = entry.at("op").get<std::string>();
            lcs::TextOp op{.kind = lcs::TextOpKind::kReplace, .start = 0, .end = 0, .old_text = {}, .text = {}};
            if (name == "delete") {
                op.kind = lcs::TextOpKind::kDelete;
                op.start = entry.at("start").get<std::size_t>();
                op.end = entry.at("end").get<std::size_t>();
                op.old_text = entry.value("old_text", std::string());
            } else if (name == "insert") {
                op.kind = lcs::TextOpKind::kInsert;
                op.start = entry.at("at").get<std::size_t>();
                op.end = op.start;
                op.text = entry.at("text").get<std::string>();
            } else if (name == "replace") {
                op.start = entry.at("start").get<std::size_t>();
                op.end = entry.at("end").get<std::size_t>();
                op.old_text = entry.value("old_text", std::string());
                op.text = entry.at("text").get<std::string>();
            } else {
                return invalid(std::format("Unknown text op '{}'", name), entry);
            }
            if (op.end < op.start || (!ops.empty() && op.start < ops.back().end)) {
                return invalid("Text ops must be ordered and non-overlapping", entry);
            }
            ops.push_back(std::move(op));
        }
    } catch (const nlohmann::json::exception& ex) {
        return fail(errc::kInvalidDelta, std::string("Invalid text op: ") + ex.what());
    }
    return ops;
}

nlohmann::json to_json(const Delta& delta)
{
    if (const auto* added = std::get_if<Added>(&delta.node)) {
        return nlohmann::json::array({added->value});
    }
    if (const auto* removed = std::get_if<Removed>(&delta.node)) {
        return nlohmann::json::array({removed->value, kRemovedMarker, kRemovedMarker});
    }
    if (const auto* changed = std::get_if<Changed>(&delta.node)) {
        return nlohmann::json::array({changed->old_value, changed->new_value});
    }
    if (const auto* text = std::get_if<TextPatch>(&delta.node)) {
        return nlohmann::json::array({text_ops_to_json(text->ops), 0, kTextMarker});
    }
    if (const auto* moved = std::get_if<Moved>(&delta.node)) {
        return nlohmann::json::array({"", moved->from_index, kMovedMarker});
    }
    if (const auto* object = std::get_if<ObjectDelta>(&delta.node)) {
        nlohmann::json result = nlohmann::json::object();
        for (const auto& entry : object->entries) {
            result[entry.key] = to_json(entry.delta);
        }
        return result;
    }

    const auto& array = std::get<ArrayDelta>(delta.node);
    nlohmann::json result = {{"_t", "a"}};
    for (const auto& entry : array.removed) {
        result[std::format("_{}", entry.index)] =
            nlohmann::json::array({entry.removed.value, kRemovedMarker, kRemovedMarker});
    }
    for (const auto& entry : array.changed) {
        if (const auto* moved = std::get_if<Moved>(&entry.delta.node)) {
            result[std::format("_{}", moved->from_index)] =
                nlohmann::json::array({"", entry.index, kMovedMarker});
        } else {
            result[std::to_string(entry.index)] = to_json(entry.delta);
        }
    }
    return result;
}

Result<Delta> delta_from_json(const nlohmann::json& j)
{
    try {
        return decode(j);
    } catch (const nlohmann::json::exception& ex) {
        return fail(errc::kInvalidDelta, std::string("Invalid structural delta: ") + ex.what());
    }
}

Result<Delta> load_delta(const std::string& path, const std::string& schema_dir)
{
    auto payload = common::read_json_file_validated(path, schema_dir, common::kStructuralDeltaSchema);
    if (!payload) {
        return std::unexpected(payload.error());
    }
    return delta_from_json(*payload);
}

}  // namespace linkdiff::structural
