#pragma once

/**
 * @file document.hpp
 * @brief Document and Path types shared by every engine
 *
 * A Document is an nlohmann::json value. Engines never mutate their inputs;
 * every operation returns a new Document.
 */

#include "linkdiff/common.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace linkdiff {

using Document = nlohmann::json;

/// One step into a Document: object key or array index.
using PathToken = std::variant<std::string, std::size_t>;

/// Location inside a Document; empty path is the root.
using Path = std::vector<PathToken>;

}  // namespace linkdiff

namespace linkdiff::common {

/**
 * Render a path as an RFC 6901 JSON Pointer ("" for the root).
 */
[[nodiscard]] std::string to_pointer(const Path& path);

/**
 * Parse an RFC 6901 JSON Pointer. Tokens made only of digits (without a
 * leading zero) become array indices.
 */
[[nodiscard]] Result<Path> parse_pointer(std::string_view pointer);

/// Path as a JSON array of string and integer tokens.
[[nodiscard]] nlohmann::json path_to_json(const Path& path);

[[nodiscard]] Result<Path> path_from_json(const nlohmann::json& j);

/// Append a token, returning the extended path.
[[nodiscard]] Path child_path(const Path& parent, PathToken token);

/**
 * Resolve a path inside a document.
 * @return Pointer to the addressed value, or nullptr when it does not exist
 */
[[nodiscard]] const Document* find_at(const Document& doc, const Path& path);
[[nodiscard]] Document* find_at(Document& doc, const Path& path);

/// True when both values are objects, or both are arrays.
[[nodiscard]] bool same_container_kind(const Document& a, const Document& b);

/// Stable name of a Document's kind ("object", "array", "string", ...).
[[nodiscard]] std::string_view kind_name(const Document& doc);

/**
 * Read and parse a JSON file.
 * @return IOError when the file cannot be opened, ParseError on bad JSON
 */
[[nodiscard]] Result<nlohmann::json> read_json_file(const std::string& path);

/**
 * Read a JSON file and validate it against a named schema.
 */
[[nodiscard]] Result<nlohmann::json> read_json_file_validated(const std::string& path,
                                                              const std::string& schema_dir,
                                                              std::string_view schema_name);

}  // namespace linkdiff::common
