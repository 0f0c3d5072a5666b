/**
 * @file operational_json.cpp
 * @brief Wire format for operational diffs
 */

#include "linkdiff/operational.hpp"
#include "linkdiff/schema_validate.hpp"

#include <format>

namespace linkdiff::operational {

namespace {

[[nodiscard]] nlohmann::json operation_to_json(const Operation& op)
{
    nlohmann::json j = {
        {"type", std::string(op_type_name(op.type))},
        {"path", common::path_to_json(op.path)},
        {"timestamp", op.timestamp},
        {"actor_id", op.actor_id},
    };
    if (op.value) {
        j["value"] = *op.value;
    }
    if (op.from) {
        j["from"] = *op.from;
    }
    return j;
}

[[nodiscard]] Result<Operation> operation_from_json(const nlohmann::json& j)
{
    auto type = parse_op_type(j.at("type").get<std::string>());
    if (!type) {
        return fail(errc::kInvalidDelta, std::format("Unknown operation type: {}", j.at("type").dump()));
    }
    auto path = common::path_from_json(j.at("path"));
    if (!path) {
        return std::unexpected(path.error());
    }
    Operation op{.type = *type,
                 .path = std::move(*path),
                 .value = std::nullopt,
                 .from = std::nullopt,
                 .timestamp = j.at("timestamp").get<std::uint64_t>(),
                 .actor_id = j.value("actor_id", std::string())};
    if (auto it = j.find("value"); it != j.end()) {
        op.value = *it;
    } else if (op.type == OpType::kSet || op.type == OpType::kInsert) {
        return fail(errc::kInvalidDelta, std::format("{} without a value", op_type_name(op.type)));
    }
    if (auto it = j.find("from"); it != j.end() && !it->is_null()) {
        op.from = it->get<std::size_t>();
    } else if (op.type == OpType::kMove) {
        return fail(errc::kInvalidDelta, "move without a source index");
    }
    return op;
}

}  // namespace

nlohmann::json to_json(const OperationalDiff& diff)
{
    nlohmann::json operations = nlohmann::json::array();
    for (const auto& op : diff.operations) {
        operations.push_back(operation_to_json(op));
    }
    return nlohmann::json{
        {"operations", std::move(operations)},
        {"metadata",
         {
             {"actors", diff.metadata.actors},
             {"timestamp_range",
              nlohmann::json::array({diff.metadata.timestamp_range.min, diff.metadata.timestamp_range.max})},
             {"conflict_resolution", std::string(conflict_resolution_name(diff.metadata.conflict_resolution))},
         }},
    };
}

Result<OperationalDiff> diff_from_json(const nlohmann::json& j)
{
    try {
        OperationalDiff diff;
        for (const auto& entry : j.at("operations")) {
            auto op = operation_from_json(entry);
            if (!op) {
                return std::unexpected(op.error());
            }
            diff.operations.push_back(std::move(*op));
        }
        const auto& metadata = j.at("metadata");
        diff.metadata.actors = metadata.value("actors", std::vector<std::string>{});
        if (auto range = metadata.find("timestamp_range"); range != metadata.end()) {
            diff.metadata.timestamp_range = TimestampRange{.min = range->at(0).get<std::uint64_t>(),
                                                           .max = range->at(1).get<std::uint64_t>()};
        }
        const auto policy_name = metadata.value("conflict_resolution", std::string("last_write_wins"));
        auto policy = parse_conflict_resolution(policy_name);
        if (!policy) {
            return fail(errc::kInvalidDelta, std::format("Unknown conflict_resolution: {}", policy_name));
        }
        diff.metadata.conflict_resolution = *policy;
        return diff;
    } catch (const nlohmann::json::exception& ex) {
        return fail(errc::kInvalidDelta, std::string("Invalid operational diff: ") + ex.what());
    }
}

Result<OperationalDiff> load_diff(const std::string& path, const std::string& schema_dir)
{
    auto payload = common::read_json_file_validated(path, schema_dir, common::kOperationalDiffSchema);
    if (!payload) {
        return std::unexpected(payload.error());
    }
    return diff_from_json(*payload);
}

}  // namespace linkdiff::operational
