/**
 * @file json_io.cpp
 * @brief JSON file loading for documents and persisted deltas
 */

#include "linkdiff/document.hpp"
#include "linkdiff/schema_validate.hpp"

#include <format>
#include <fstream>

namespace linkdiff::common {

Result<nlohmann::json> read_json_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        return fail(errc::kIOError, std::format("Failed to open JSON file: {}", path));
    }
    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const nlohmann::json::exception& ex) {
        return fail(errc::kParseError, std::format("Failed to parse JSON file: {}: {}", path, ex.what()));
    }
    return payload;
}

Result<nlohmann::json> read_json_file_validated(const std::string& path,
                                                const std::string& schema_dir,
                                                std::string_view schema_name)
{
    auto payload = read_json_file(path);
    if (!payload) {
        return std::unexpected(payload.error());
    }
    if (auto valid = validate_json_named(*payload, schema_dir, schema_name); !valid) {
        return std::unexpected(Error::make(valid.error().code,
                                           path + ": " + valid.error().message));
    }
    return payload;
}

}  // namespace linkdiff::common
