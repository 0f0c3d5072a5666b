/**
 * @file structural.cpp
 * @brief Structural diff, patch, merge and inverse
 */

#include "linkdiff/structural.hpp"

#include <algorithm>
#include <format>
#include <functional>
#include <iterator>
#include <map>
#include <optional>
#include <set>

namespace linkdiff::structural {

namespace {

[[nodiscard]] Delta empty_delta()
{
    return Delta{.node = ObjectDelta{}};
}

template <typename Entry>
void sort_by_index(std::vector<Entry>& entries)
{
    std::ranges::sort(entries, {}, &Entry::index);
}

// ============================================================================
// Diff
// ============================================================================

class Differ
{
public:
    explicit Differ(const Options& options)
        : m_options(options)
    {}

    /// nullopt when the values are equal.
    [[nodiscard]] std::optional<Delta> diff_value(const Document& old_doc,
                                                  const Document& new_doc) const
    {
        if (old_doc == new_doc) {
            return std::nullopt;
        }
        if (old_doc.is_object() && new_doc.is_object()) {
            return diff_object(old_doc, new_doc);
        }
        if (old_doc.is_array() && new_doc.is_array()) {
            return diff_array(old_doc, new_doc);
        }
        if (old_doc.is_string() && new_doc.is_string()) {
            return diff_string(old_doc.get_ref<const std::string&>(),
                               new_doc.get_ref<const std::string&>());
        }
        return Delta{.node = Changed{.old_value = old_doc, .new_value = new_doc}};
    }

private:
    [[nodiscard]] std::optional<Delta> diff_object(const Document& old_doc,
                                                   const Document& new_doc) const
    {
        ObjectDelta result;
        for (const auto& [key, old_value] : old_doc.items()) {
            auto it = new_doc.find(key);
            if (it == new_doc.end()) {
                result.entries.push_back(
                    ObjectEntry{.key = key, .delta = Delta{.node = Removed{.value = old_value}}});
                continue;
            }
            if (auto sub = diff_value(old_value, *it)) {
                result.entries.push_back(ObjectEntry{.key = key, .delta = std::move(*sub)});
            }
        }
        for (const auto& [key, new_value] : new_doc.items()) {
            if (!old_doc.contains(key)) {
                result.entries.push_back(
                    ObjectEntry{.key = key, .delta = Delta{.node = Added{.value = new_value}}});
            }
        }
        if (result.entries.empty()) {
            return std::nullopt;
        }
        std::ranges::sort(result.entries, {}, &ObjectEntry::key);
        return Delta{.node = std::move(result)};
    }

    [[nodiscard]] lcs::Alignment positional_alignment(std::span<const Document> old_seq,
                                                      std::span<const Document> new_seq) const
    {
        lcs::Alignment alignment;
        const std::size_t common = std::min(old_seq.size(), new_seq.size());
        for (std::size_t i = 0; i < common; ++i) {
            if (old_seq[i] == new_seq[i]) {
                alignment.matches.push_back(lcs::Match{.old_index = i, .new_index = i});
            } else {
                alignment.deletes.push_back(i);
                alignment.inserts.push_back(i);
            }
        }
        for (std::size_t i = common; i < old_seq.size(); ++i) {
            alignment.deletes.push_back(i);
        }
        for (std::size_t j = common; j < new_seq.size(); ++j) {
            alignment.inserts.push_back(j);
        }
        return alignment;
    }

    [[nodiscard]] std::optional<Delta> diff_array(const Document& old_doc,
                                                  const Document& new_doc) const
    {
        const auto& old_arr = old_doc.get_ref<const nlohmann::json::array_t&>();
        const auto& new_arr = new_doc.get_ref<const nlohmann::json::array_t&>();
        std::span<const Document> old_seq(old_arr);
        std::span<const Document> new_seq(new_arr);

        lcs::Alignment alignment = m_options.array_diff == ArrayDiffMode::kLcs
                                       ? lcs::align(old_seq, new_seq)
                                       : positional_alignment(old_seq, new_seq);
        std::vector<lcs::MovePair> moves;
        if (m_options.include_moves) {
            moves = lcs::pair_moves(alignment, old_seq, new_seq);
        }
        const auto changes = lcs::pair_changes(alignment);

        ArrayDelta result;
        for (std::size_t i : alignment.deletes) {
            result.removed.push_back(RemovedEntry{.index = i, .removed = Removed{.value = old_seq[i]}});
        }
        for (std::size_t j : alignment.inserts) {
            result.changed.push_back(
                ArrayEntry{.index = j, .delta = Delta{.node = Added{.value = new_seq[j]}}});
        }
        for (const auto& move : moves) {
            result.changed.push_back(
                ArrayEntry{.index = move.to, .delta = Delta{.node = Moved{.from_index = move.from}}});
        }
        for (const auto& change : changes) {
            if (auto sub = diff_value(old_seq[change.old_index], new_seq[change.new_index])) {
                result.changed.push_back(ArrayEntry{.index = change.new_index, .delta = std::move(*sub)});
            }
        }
        if (result.removed.empty() && result.changed.empty()) {
            return std::nullopt;
        }
        sort_by_index(result.removed);
        sort_by_index(result.changed);
        return Delta{.node = std::move(result)};
    }

    [[nodiscard]] Delta diff_string(const std::string& old_text, const std::string& new_text) const
    {
        if (m_options.text_diff && lcs::code_point_length(old_text) > m_options.text_min_length) {
            auto text = lcs::diff_text(old_text, new_text);
            if (text.similarity >= m_options.text_similarity_threshold) {
                return Delta{.node = TextPatch{.ops = std::move(text.ops)}};
            }
        }
        return Delta{.node = Changed{.old_value = old_text, .new_value = new_text}};
    }

    const Options& m_options;
};

// ============================================================================
// Patch
// ============================================================================

VoidResult apply_delta(Document& target, const Delta& delta, const std::string& where);

[[nodiscard]] std::unexpected<Error> patch_error(const std::string& where, const std::string& what)
{
    return fail(errc::kPatchFailed, std::format("{}: {}", where.empty() ? "/" : where, what));
}

VoidResult apply_object(Document& target, const ObjectDelta& delta, const std::string& where)
{
    if (!target.is_object()) {
        return patch_error(where, std::format("expected object, found {}", common::kind_name(target)));
    }
    for (const auto& entry : delta.entries) {
        const std::string child = where + "/" + entry.key;
        if (const auto* added = std::get_if<Added>(&entry.delta.node)) {
            target[entry.key] = added->value;
            continue;
        }
        auto it = target.find(entry.key);
        if (it == target.end()) {
            return patch_error(child, "key does not exist");
        }
        if (std::holds_alternative<Removed>(entry.delta.node)) {
            target.erase(it);
            continue;
        }
        if (auto result = apply_delta(*it, entry.delta, child); !result) {
            return result;
        }
    }
    return {};
}

VoidResult apply_array(Document& target, const ArrayDelta& delta, const std::string& where)
{
    if (!target.is_array()) {
        return patch_error(where, std::format("expected array, found {}", common::kind_name(target)));
    }
    auto& arr = target.get_ref<nlohmann::json::array_t&>();

    std::vector<std::size_t> removals;
    for (const auto& entry : delta.removed) {
        removals.push_back(entry.index);
    }
    std::vector<const ArrayEntry*> insertions;
    std::vector<const ArrayEntry*> changes;
    for (const auto& entry : delta.changed) {
        if (const auto* moved = std::get_if<Moved>(&entry.delta.node)) {
            removals.push_back(moved->from_index);
            insertions.push_back(&entry);
        } else if (std::holds_alternative<Added>(entry.delta.node)) {
            insertions.push_back(&entry);
        } else if (std::holds_alternative<Removed>(entry.delta.node)) {
            return patch_error(std::format("{}/{}", where, entry.index), "removal keyed by new index");
        } else {
            changes.push_back(&entry);
        }
    }

    std::ranges::sort(removals, std::greater<>{});
    if (std::ranges::adjacent_find(removals) != removals.end()) {
        return patch_error(where, "old index removed twice");
    }
    std::map<std::size_t, Document> taken;
    for (std::size_t index : removals) {
        if (index >= arr.size()) {
            return patch_error(std::format("{}/{}", where, index),
                               std::format("index out of range for array of size {}", arr.size()));
        }
        taken.emplace(index, std::move(arr[index]));
        arr.erase(arr.begin() + static_cast<std::ptrdiff_t>(index));
    }

    std::ranges::sort(insertions, {}, &ArrayEntry::index);
    for (const auto* entry : insertions) {
        if (entry->index > arr.size()) {
            return patch_error(std::format("{}/{}", where, entry->index),
                               std::format("insert position beyond array of size {}", arr.size()));
        }
        Document value;
        if (const auto* moved = std::get_if<Moved>(&entry->delta.node)) {
            value = taken.at(moved->from_index);
        } else {
            value = std::get<Added>(entry->delta.node).value;
        }
        arr.insert(arr.begin() + static_cast<std::ptrdiff_t>(entry->index), std::move(value));
    }

    std::ranges::sort(changes, {}, &ArrayEntry::index);
    for (const auto* entry : changes) {
        const std::string child = std::format("{}/{}", where, entry->index);
        if (entry->index >= arr.size()) {
            return patch_error(child, std::format("index out of range for array of size {}", arr.size()));
        }
        if (auto result = apply_delta(arr[entry->index], entry->delta, child); !result) {
            return result;
        }
    }
    return {};
}

VoidResult apply_delta(Document& target, const Delta& delta, const std::string& where)
{
    if (const auto* added = std::get_if<Added>(&delta.node)) {
        target = added->value;
        return {};
    }
    if (const auto* changed = std::get_if<Changed>(&delta.node)) {
        target = changed->new_value;
        return {};
    }
    if (const auto* text = std::get_if<TextPatch>(&delta.node)) {
        if (!target.is_string()) {
            return patch_error(where, std::format("text patch on {}", common::kind_name(target)));
        }
        auto patched = lcs::apply_text(target.get_ref<const std::string&>(), text->ops);
        if (!patched) {
            return patch_error(where, patched.error().message);
        }
        target = std::move(*patched);
        return {};
    }
    if (const auto* object = std::get_if<ObjectDelta>(&delta.node)) {
        if (object->entries.empty()) {
            return {};
        }
        return apply_object(target, *object, where);
    }
    if (const auto* array = std::get_if<ArrayDelta>(&delta.node)) {
        if (array->removed.empty() && array->changed.empty()) {
            return {};
        }
        return apply_array(target, *array, where);
    }
    if (std::holds_alternative<Removed>(delta.node)) {
        return patch_error(where, "removal outside an object or array");
    }
    return patch_error(where, "move outside an array");
}

// ============================================================================
// Merge
// ============================================================================

[[nodiscard]] Delta merge_two(const Delta& earlier, const Delta& later)
{
    const auto* old_object = std::get_if<ObjectDelta>(&earlier.node);
    const auto* new_object = std::get_if<ObjectDelta>(&later.node);
    if (old_object != nullptr && new_object != nullptr) {
        std::map<std::string, Delta> merged;
        for (const auto& entry : old_object->entries) {
            merged.insert_or_assign(entry.key, entry.delta);
        }
        for (const auto& entry : new_object->entries) {
            auto it = merged.find(entry.key);
            if (it == merged.end()) {
                merged.emplace(entry.key, entry.delta);
            } else {
                it->second = merge_two(it->second, entry.delta);
            }
        }
        ObjectDelta result;
        for (auto& [key, delta] : merged) {
            result.entries.push_back(ObjectEntry{.key = key, .delta = std::move(delta)});
        }
        return Delta{.node = std::move(result)};
    }

    const auto* old_array = std::get_if<ArrayDelta>(&earlier.node);
    const auto* new_array = std::get_if<ArrayDelta>(&later.node);
    if (old_array != nullptr && new_array != nullptr) {
        std::map<std::size_t, Removed> removed;
        for (const auto* source : {old_array, new_array}) {
            for (const auto& entry : source->removed) {
                removed.insert_or_assign(entry.index, entry.removed);
            }
        }
        std::map<std::size_t, Delta> changed;
        for (const auto& entry : old_array->changed) {
            changed.insert_or_assign(entry.index, entry.delta);
        }
        for (const auto& entry : new_array->changed) {
            auto it = changed.find(entry.index);
            if (it == changed.end()) {
                changed.emplace(entry.index, entry.delta);
            } else {
                it->second = merge_two(it->second, entry.delta);
            }
        }
        ArrayDelta result;
        for (auto& [index, value] : removed) {
            result.removed.push_back(RemovedEntry{.index = index, .removed = std::move(value)});
        }
        for (auto& [index, delta] : changed) {
            result.changed.push_back(ArrayEntry{.index = index, .delta = std::move(delta)});
        }
        return Delta{.node = std::move(result)};
    }

    return later;
}

// ============================================================================
// Inverse
// ============================================================================

Result<Delta> invert(const Delta& delta);

/// Old index of the element kept at rank `rank` once `removed_old` are gone.
[[nodiscard]] std::size_t old_index_for_rank(std::size_t rank, const std::set<std::size_t>& removed_old)
{
    std::size_t index = 0;
    std::size_t seen = 0;
    while (true) {
        if (!removed_old.contains(index)) {
            if (seen == rank) {
                return index;
            }
            ++seen;
        }
        ++index;
    }
}

Result<Delta> invert_array(const ArrayDelta& delta)
{
    std::set<std::size_t> removed_old;
    std::set<std::size_t> inserted_new;
    for (const auto& entry : delta.removed) {
        removed_old.insert(entry.index);
    }
    for (const auto& entry : delta.changed) {
        if (const auto* moved = std::get_if<Moved>(&entry.delta.node)) {
            removed_old.insert(moved->from_index);
            inserted_new.insert(entry.index);
        } else if (std::holds_alternative<Added>(entry.delta.node)) {
            inserted_new.insert(entry.index);
        }
    }

    ArrayDelta result;
    for (const auto& entry : delta.removed) {
        result.changed.push_back(
            ArrayEntry{.index = entry.index, .delta = Delta{.node = Added{.value = entry.removed.value}}});
    }
    for (const auto& entry : delta.changed) {
        if (const auto* added = std::get_if<Added>(&entry.delta.node)) {
            result.removed.push_back(RemovedEntry{.index = entry.index, .removed = Removed{.value = added->value}});
            continue;
        }
        if (const auto* moved = std::get_if<Moved>(&entry.delta.node)) {
            result.changed.push_back(ArrayEntry{.index = moved->from_index,
                                                .delta = Delta{.node = Moved{.from_index = entry.index}}});
            continue;
        }
        if (std::holds_alternative<Removed>(entry.delta.node)) {
            return fail(errc::kInverseFailed, std::format("removal keyed by new index {}", entry.index));
        }
        const auto inserted_before = static_cast<std::size_t>(
            std::distance(inserted_new.begin(), inserted_new.lower_bound(entry.index)));
        const std::size_t old_index = old_index_for_rank(entry.index - inserted_before, removed_old);
        auto inverted = invert(entry.delta);
        if (!inverted) {
            return std::unexpected(inverted.error());
        }
        result.changed.push_back(ArrayEntry{.index = old_index, .delta = std::move(*inverted)});
    }
    sort_by_index(result.removed);
    sort_by_index(result.changed);
    return Delta{.node = std::move(result)};
}

Result<Delta> invert(const Delta& delta)
{
    if (const auto* added = std::get_if<Added>(&delta.node)) {
        return Delta{.node = Removed{.value = added->value}};
    }
    if (const auto* removed = std::get_if<Removed>(&delta.node)) {
        return Delta{.node = Added{.value = removed->value}};
    }
    if (const auto* changed = std::get_if<Changed>(&delta.node)) {
        return Delta{.node = Changed{.old_value = changed->new_value, .new_value = changed->old_value}};
    }
    if (const auto* text = std::get_if<TextPatch>(&delta.node)) {
        return Delta{.node = TextPatch{.ops = lcs::invert_text(text->ops)}};
    }
    if (const auto* object = std::get_if<ObjectDelta>(&delta.node)) {
        ObjectDelta result;
        for (const auto& entry : object->entries) {
            auto inverted = invert(entry.delta);
            if (!inverted) {
                return std::unexpected(inverted.error());
            }
            result.entries.push_back(ObjectEntry{.key = entry.key, .delta = std::move(*inverted)});
        }
        return Delta{.node = std::move(result)};
    }
    if (const auto* array = std::get_if<ArrayDelta>(&delta.node)) {
        return invert_array(*array);
    }
    return fail(errc::kInverseFailed, "move outside an array");
}

}  // namespace

bool is_empty(const Delta& delta)
{
    if (const auto* object = std::get_if<ObjectDelta>(&delta.node)) {
        return object->entries.empty();
    }
    if (const auto* array = std::get_if<ArrayDelta>(&delta.node)) {
        return array->removed.empty() && array->changed.empty();
    }
    return false;
}

Result<Delta> diff(const Document& old_doc, const Document& new_doc, const Options& options)
{
    try {
        auto delta = Differ(options).diff_value(old_doc, new_doc);
        return delta ? std::move(*delta) : empty_delta();
    } catch (const nlohmann::json::exception& ex) {
        return fail(errc::kDiffFailed, std::string("Structural diff failed: ") + ex.what());
    }
}

Result<Document> patch(const Document& doc, const Delta& delta)
{
    try {
        Document result = doc;
        if (auto applied = apply_delta(result, delta, ""); !applied) {
            return std::unexpected(applied.error());
        }
        return result;
    } catch (const nlohmann::json::exception& ex) {
        return fail(errc::kPatchFailed, std::string("Structural patch failed: ") + ex.what());
    }
}

bool validate_patch(const Document& doc, const Delta& delta)
{
    return patch(doc, delta).has_value();
}

Result<Delta> merge_diffs(std::span<const Delta> deltas)
{
    Delta merged = empty_delta();
    for (const auto& delta : deltas) {
        merged = is_empty(merged) ? delta : merge_two(merged, delta);
    }
    return merged;
}

Result<Delta> inverse(const Delta& delta)
{
    return invert(delta);
}

}  // namespace linkdiff::structural
