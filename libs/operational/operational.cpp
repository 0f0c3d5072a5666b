/**
 * @file operational.cpp
 * @brief Operation emission, replay, merge and inverse
 */

#include "linkdiff/operational.hpp"

#include "linkdiff/lcs.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <map>
#include <numeric>
#include <random>
#include <ranges>

namespace linkdiff::operational {

namespace {

// ============================================================================
// Emission
// ============================================================================

class Emitter
{
public:
    Emitter(std::string actor_id, std::uint64_t first_timestamp)
        : m_actor_id(std::move(actor_id))
        , m_clock(first_timestamp)
    {}

    void diff_value(const Document& old_doc, const Document& new_doc, const Path& path)
    {
        if (old_doc == new_doc) {
            return;
        }
        if (old_doc.is_object() && new_doc.is_object()) {
            diff_object(old_doc, new_doc, path);
        } else if (old_doc.is_array() && new_doc.is_array()) {
            diff_array(old_doc, new_doc, path);
        } else {
            emit(OpType::kSet, path, new_doc);
        }
    }

    [[nodiscard]] std::vector<Operation> take_operations() { return std::move(m_operations); }

private:
    void emit(OpType type,
              Path path,
              std::optional<Document> value = std::nullopt,
              std::optional<std::size_t> from = std::nullopt)
    {
        m_operations.push_back(Operation{.type = type,
                                         .path = std::move(path),
                                         .value = std::move(value),
                                         .from = from,
                                         .timestamp = m_clock++,
                                         .actor_id = m_actor_id});
    }

    void diff_object(const Document& old_doc, const Document& new_doc, const Path& path)
    {
        // nlohmann objects iterate in key order, so the merge below is ordered.
        auto old_it = old_doc.begin();
        auto new_it = new_doc.begin();
        while (old_it != old_doc.end() || new_it != new_doc.end()) {
            if (new_it == new_doc.end() || (old_it != old_doc.end() && old_it.key() < new_it.key())) {
                emit(OpType::kDelete, common::child_path(path, old_it.key()));
                ++old_it;
            } else if (old_it == old_doc.end() || new_it.key() < old_it.key()) {
                emit(OpType::kSet, common::child_path(path, new_it.key()), *new_it);
                ++new_it;
            } else {
                diff_value(*old_it, *new_it, common::child_path(path, old_it.key()));
                ++old_it;
                ++new_it;
            }
        }
    }

    void diff_array(const Document& old_doc, const Document& new_doc, const Path& path)
    {
        const auto& old_arr = old_doc.get_ref<const nlohmann::json::array_t&>();
        const auto& new_arr = new_doc.get_ref<const nlohmann::json::array_t&>();
        std::span<const Document> old_seq(old_arr);
        std::span<const Document> new_seq(new_arr);

        lcs::Alignment alignment = lcs::align(old_seq, new_seq);
        auto moves = lcs::pair_moves(alignment, old_seq, new_seq);
        auto changes = lcs::pair_changes(alignment);
        std::ranges::sort(moves, [](const lcs::MovePair& a, const lcs::MovePair& b) {
            return a.from != b.from ? a.from < b.from : a.to < b.to;
        });
        std::ranges::sort(changes, {}, &lcs::ChangePair::new_index);

        // Working copy of the array as old element ids; settled ids know their new index.
        std::vector<std::size_t> working(old_seq.size());
        std::iota(working.begin(), working.end(), 0UZ);
        std::vector<std::optional<std::size_t>> settled(old_seq.size());
        for (const auto& match : alignment.matches) {
            settled[match.old_index] = match.new_index;
        }
        for (const auto& change : changes) {
            settled[change.old_index] = change.new_index;
        }
        const auto position_of = [&working](std::size_t id) {
            return static_cast<std::size_t>(std::ranges::find(working, id) - working.begin());
        };

        for (const auto& move : moves) {
            const std::size_t from = position_of(move.from);
            working.erase(working.begin() + static_cast<std::ptrdiff_t>(from));
            std::size_t slot = 0;
            for (std::size_t k = 0; k < working.size(); ++k) {
                if (settled[working[k]] && *settled[working[k]] < move.to) {
                    slot = k + 1;
                }
            }
            working.insert(working.begin() + static_cast<std::ptrdiff_t>(slot), move.from);
            settled[move.from] = move.to;
            // Replay removes `from` first and decrements the target when from < to.
            const std::size_t to = slot >= from ? slot + 1 : slot;
            emit(OpType::kMove, common::child_path(path, to), std::nullopt, from);
        }

        for (std::size_t id : alignment.deletes | std::views::reverse) {
            const std::size_t at = position_of(id);
            working.erase(working.begin() + static_cast<std::ptrdiff_t>(at));
            emit(OpType::kDelete, common::child_path(path, at));
        }

        for (const auto& change : changes) {
            diff_value(old_seq[change.old_index],
                       new_seq[change.new_index],
                       common::child_path(path, position_of(change.old_index)));
        }

        for (std::size_t j : alignment.inserts) {
            emit(OpType::kInsert, common::child_path(path, j), new_seq[j]);
        }
    }

    std::string m_actor_id;
    std::uint64_t m_clock;
    std::vector<Operation> m_operations;
};

// ============================================================================
// Replay
// ============================================================================

[[nodiscard]] std::unexpected<Error> replay_error(const Operation& op, const std::string& what)
{
    return fail(errc::kPatchFailed,
                std::format("{} {}: {}", op_type_name(op.type), common::to_pointer(op.path), what));
}

struct Target
{
    Document* parent;
    const PathToken* token;
};

[[nodiscard]] Result<Target> locate_parent(Document& doc, const Operation& op)
{
    Path parent_path(op.path.begin(), op.path.end() - 1);
    Document* parent = common::find_at(doc, parent_path);
    if (parent == nullptr) {
        return replay_error(op, "parent does not exist");
    }
    const PathToken& token = op.path.back();
    const bool key_token = std::holds_alternative<std::string>(token);
    if ((parent->is_object() && !key_token) || (parent->is_array() && key_token)) {
        return replay_error(op, std::format("path token does not match a {}", common::kind_name(*parent)));
    }
    if (!parent->is_object() && !parent->is_array()) {
        return replay_error(op, std::format("parent is a {}", common::kind_name(*parent)));
    }
    return Target{.parent = parent, .token = &token};
}

VoidResult apply_set(Document& doc, const Operation& op)
{
    const Document value = op.value.value_or(Document());
    if (op.path.empty()) {
        doc = value;
        return {};
    }
    auto target = locate_parent(doc, op);
    if (!target) {
        return std::unexpected(target.error());
    }
    if (target->parent->is_object()) {
        (*target->parent)[std::get<std::string>(*target->token)] = value;
        return {};
    }
    const std::size_t index = std::get<std::size_t>(*target->token);
    if (index >= target->parent->size()) {
        return replay_error(op, "index out of range");
    }
    (*target->parent)[index] = value;
    return {};
}

VoidResult apply_delete(Document& doc, const Operation& op)
{
    if (op.path.empty()) {
        doc = nullptr;
        return {};
    }
    auto target = locate_parent(doc, op);
    if (!target) {
        return std::unexpected(target.error());
    }
    if (target->parent->is_object()) {
        target->parent->erase(std::get<std::string>(*target->token));
        return {};
    }
    const std::size_t index = std::get<std::size_t>(*target->token);
    if (index < target->parent->size()) {
        target->parent->erase(index);
    }
    return {};
}

VoidResult apply_insert(Document& doc, const Operation& op)
{
    const Document value = op.value.value_or(Document());
    if (op.path.empty()) {
        doc = value;
        return {};
    }
    auto target = locate_parent(doc, op);
    if (!target) {
        return std::unexpected(target.error());
    }
    if (target->parent->is_object()) {
        (*target->parent)[std::get<std::string>(*target->token)] = value;
        return {};
    }
    auto& arr = target->parent->get_ref<nlohmann::json::array_t&>();
    const std::size_t index = std::get<std::size_t>(*target->token);
    if (index > arr.size()) {
        return replay_error(op, std::format("insert position beyond array of size {}", arr.size()));
    }
    arr.insert(arr.begin() + static_cast<std::ptrdiff_t>(index), value);
    return {};
}

VoidResult apply_move(Document& doc, const Operation& op)
{
    if (op.path.empty() || !op.from) {
        return replay_error(op, "move needs a destination index and a source index");
    }
    auto target = locate_parent(doc, op);
    if (!target) {
        return std::unexpected(target.error());
    }
    if (!target->parent->is_array()) {
        return replay_error(op, "move target is not an array");
    }
    auto& arr = target->parent->get_ref<nlohmann::json::array_t&>();
    const std::size_t from = *op.from;
    std::size_t to = std::get<std::size_t>(*target->token);
    if (from >= arr.size() || to > arr.size()) {
        return replay_error(op,
                            std::format("move {} -> {} out of range for array of size {}", from, to, arr.size()));
    }
    Document value = std::move(arr[from]);
    arr.erase(arr.begin() + static_cast<std::ptrdiff_t>(from));
    if (from < to) {
        --to;
    }
    arr.insert(arr.begin() + static_cast<std::ptrdiff_t>(to), std::move(value));
    return {};
}

VoidResult apply_operation(Document& doc, const Operation& op)
{
    switch (op.type) {
        case OpType::kSet:
            return apply_set(doc, op);
        case OpType::kDelete:
            return apply_delete(doc, op);
        case OpType::kInsert:
            return apply_insert(doc, op);
        case OpType::kMove:
            return apply_move(doc, op);
    }
    return replay_error(op, "unknown operation type");
}

[[nodiscard]] TimestampRange range_of(const std::vector<Operation>& operations)
{
    if (operations.empty()) {
        return TimestampRange{};
    }
    auto [min_it, max_it] = std::ranges::minmax_element(operations, {}, &Operation::timestamp);
    return TimestampRange{.min = min_it->timestamp, .max = max_it->timestamp};
}

}  // namespace

Result<OperationalDiff> diff(const Document& old_doc, const Document& new_doc, const Options& options)
{
    const std::uint64_t first_timestamp = options.timestamp.value_or(now_nanoseconds());
    std::string actor_id = options.actor_id ? *options.actor_id : generate_actor_id();
    try {
        Emitter emitter(actor_id, first_timestamp);
        emitter.diff_value(old_doc, new_doc, Path{});
        OperationalDiff result;
        result.operations = emitter.take_operations();
        result.metadata.actors = {std::move(actor_id)};
        result.metadata.timestamp_range = result.operations.empty()
                                              ? TimestampRange{.min = first_timestamp, .max = first_timestamp}
                                              : range_of(result.operations);
        result.metadata.conflict_resolution = options.conflict_resolution;
        return result;
    } catch (const nlohmann::json::exception& ex) {
        return fail(errc::kDiffFailed, std::string("Operational diff failed: ") + ex.what());
    }
}

Result<Document> patch(const Document& doc, const OperationalDiff& diff)
{
    try {
        Document result = doc;
        for (const auto& op : diff.operations) {
            if (auto applied = apply_operation(result, op); !applied) {
                return std::unexpected(applied.error());
            }
        }
        return result;
    } catch (const nlohmann::json::exception& ex) {
        return fail(errc::kPatchFailed, std::string("Operational patch failed: ") + ex.what());
    }
}

bool validate_patch(const Document& doc, const OperationalDiff& diff)
{
    return patch(doc, diff).has_value();
}

Result<OperationalDiff> merge_diffs(std::span<const OperationalDiff> diffs, const MergeOptions& options)
{
    ConflictResolution policy = ConflictResolution::kLastWriteWins;
    if (options.conflict_resolution) {
        policy = *options.conflict_resolution;
    } else if (!diffs.empty()) {
        policy = diffs.front().metadata.conflict_resolution;
    }

    OperationalDiff result;
    for (const auto& diff : diffs) {
        result.operations.insert(result.operations.end(), diff.operations.begin(), diff.operations.end());
        for (const auto& actor : diff.metadata.actors) {
            if (std::ranges::find(result.metadata.actors, actor) == result.metadata.actors.end()) {
                result.metadata.actors.push_back(actor);
            }
        }
    }
    std::ranges::stable_sort(result.operations, {}, &Operation::timestamp);

    if (policy == ConflictResolution::kLastWriteWins) {
        std::map<std::string, std::size_t> newest;
        for (std::size_t i = 0; i < result.operations.size(); ++i) {
            newest.insert_or_assign(common::to_pointer(result.operations[i].path), i);
        }
        std::vector<Operation> kept;
        for (std::size_t i = 0; i < result.operations.size(); ++i) {
            if (newest.at(common::to_pointer(result.operations[i].path)) == i) {
                kept.push_back(std::move(result.operations[i]));
            }
        }
        result.operations = std::move(kept);
    }

    result.metadata.timestamp_range = range_of(result.operations);
    result.metadata.conflict_resolution = policy;
    return result;
}

Result<OperationalDiff> inverse(const OperationalDiff& diff)
{
    OperationalDiff result;
    result.metadata = diff.metadata;
    result.metadata.conflict_resolution = ConflictResolution::kInverse;

    for (const auto& op : diff.operations | std::views::reverse) {
        Operation back{.type = OpType::kDelete,
                       .path = op.path,
                       .value = std::nullopt,
                       .from = std::nullopt,
                       .timestamp = op.timestamp,
                       .actor_id = op.actor_id};
        switch (op.type) {
            case OpType::kSet:
            case OpType::kInsert:
                break;
            case OpType::kDelete:
                back.type = OpType::kSet;
                back.value = Document();
                break;
            case OpType::kMove: {
                if (op.path.empty() || !op.from || !std::holds_alternative<std::size_t>(op.path.back())) {
                    return fail(errc::kInverseFailed, std::format("Move without array indices at {}", common::to_pointer(op.path)));
                }
                // Undo the replayed move: the element now sits at `landed`.
                const std::size_t source = *op.from;
                const std::size_t target = std::get<std::size_t>(op.path.back());
                const std::size_t landed = source < target ? target - 1 : target;
                back.type = OpType::kMove;
                back.from = landed;
                back.path.back() = landed < source ? source + 1 : source;
                break;
            }
        }
        result.operations.push_back(std::move(back));
    }
    return result;
}

std::string generate_actor_id()
{
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    const std::uint64_t value = engine();
    constexpr char kHexDigits[] = "0123456789abcdef";
    std::string id(16, '0');
    for (std::size_t i = 0; i < id.size(); ++i) {
        id[i] = kHexDigits[(value >> (60U - 4U * i)) & 0x0FU];
    }
    return id;
}

std::uint64_t now_nanoseconds()
{
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count());
}

std::string_view op_type_name(OpType type)
{
    switch (type) {
        case OpType::kSet:
            return "set";
        case OpType::kDelete:
            return "delete";
        case OpType::kInsert:
            return "insert";
        case OpType::kMove:
            return "move";
    }
    return "unknown";
}

std::optional<OpType> parse_op_type(std::string_view name)
{
    for (OpType type : {OpType::kSet, OpType::kDelete, OpType::kInsert, OpType::kMove}) {
        if (op_type_name(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

std::string_view conflict_resolution_name(ConflictResolution policy)
{
    switch (policy) {
        case ConflictResolution::kLastWriteWins:
            return "last_write_wins";
        case ConflictResolution::kMerge:
            return "merge";
        case ConflictResolution::kInverse:
            return "inverse";
    }
    return "unknown";
}

std::optional<ConflictResolution> parse_conflict_resolution(std::string_view name)
{
    for (ConflictResolution policy :
         {ConflictResolution::kLastWriteWins, ConflictResolution::kMerge, ConflictResolution::kInverse}) {
        if (conflict_resolution_name(policy) == name) {
            return policy;
        }
    }
    return std::nullopt;
}

}  // namespace linkdiff::operational
