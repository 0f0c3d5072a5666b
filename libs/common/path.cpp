/**
 * @file path.cpp
 * @brief Document paths and RFC 6901 JSON Pointers
 */

#include "linkdiff/document.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <ranges>
#include <string>
#include <vector>

namespace linkdiff::common {

namespace {

/**
 * @brief Split a pointer body into raw (still escaped) reference tokens
 */
[[nodiscard]] std::vector<std::string> split_pointer(std::string_view body)
{
    std::vector<std::string> parts;
    for (auto part : body | std::views::split('/')) {
        parts.emplace_back(part.begin(), part.end());
    }
    return parts;
}

[[nodiscard]] std::string escape_token(std::string_view token)
{
    std::string out;
    out.reserve(token.size());
    for (char c : token) {
        if (c == '~') {
            out += "~0";
        } else if (c == '/') {
            out += "~1";
        } else {
            out += c;
        }
    }
    return out;
}

[[nodiscard]] Result<std::string> unescape_token(std::string_view token)
{
    std::string out;
    out.reserve(token.size());
    for (std::size_t i = 0; i < token.size(); ++i) {
        if (token[i] != '~') {
            out += token[i];
            continue;
        }
        if (i + 1 >= token.size() || (token[i + 1] != '0' && token[i + 1] != '1')) {
            return fail(errc::kParseError, std::format("Invalid escape in JSON pointer token: {}", token));
        }
        out += token[i + 1] == '0' ? '~' : '/';
        ++i;
    }
    return out;
}

[[nodiscard]] bool is_index_token(std::string_view token)
{
    if (token.empty() || !std::ranges::all_of(token, [](char c) { return c >= '0' && c <= '9'; })) {
        return false;
    }
    return token.size() == 1 || token.front() != '0';
}

template <typename Doc>
[[nodiscard]] Doc* find_impl(Doc& doc, const Path& path)
{
    Doc* current = &doc;
    for (const auto& token : path) {
        if (const auto* key = std::get_if<std::string>(&token)) {
            if (!current->is_object()) {
                return nullptr;
            }
            auto it = current->find(*key);
            if (it == current->end()) {
                return nullptr;
            }
            current = &*it;
        } else {
            const std::size_t index = std::get<std::size_t>(token);
            if (!current->is_array() || index >= current->size()) {
                return nullptr;
            }
            current = &(*current)[index];
        }
    }
    return current;
}

}  // namespace

std::string to_pointer(const Path& path)
{
    std::string result;
    for (const auto& token : path) {
        result += '/';
        if (const auto* key = std::get_if<std::string>(&token)) {
            result += escape_token(*key);
        } else {
            result += std::to_string(std::get<std::size_t>(token));
        }
    }
    return result;
}

Result<Path> parse_pointer(std::string_view pointer)
{
    Path path;
    if (pointer.empty()) {
        return path;
    }
    if (pointer.front() != '/') {
        return fail(errc::kParseError, std::format("JSON pointer must start with '/': {}", pointer));
    }
    for (const auto& raw : split_pointer(pointer.substr(1))) {
        if (is_index_token(raw)) {
            std::size_t index = 0;
            auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), index);
            if (ec != std::errc{} || ptr != raw.data() + raw.size()) {
                return fail(errc::kParseError, std::format("Array index out of range in JSON pointer: {}", raw));
            }
            path.emplace_back(index);
            continue;
        }
        auto key = unescape_token(raw);
        if (!key) {
            return std::unexpected(key.error());
        }
        path.emplace_back(std::move(*key));
    }
    return path;
}

nlohmann::json path_to_json(const Path& path)
{
    nlohmann::json result = nlohmann::json::array();
    for (const auto& token : path) {
        if (const auto* key = std::get_if<std::string>(&token)) {
            result.push_back(*key);
        } else {
            result.push_back(std::get<std::size_t>(token));
        }
    }
    return result;
}

Result<Path> path_from_json(const nlohmann::json& j)
{
    if (!j.is_array()) {
        return fail(errc::kInvalidDelta, "Path must be an array of keys and indices");
    }
    Path path;
    path.reserve(j.size());
    for (const auto& token : j) {
        if (token.is_string()) {
            path.emplace_back(token.get<std::string>());
        } else if (token.is_number_unsigned()
                   || (token.is_number_integer() && token.get<std::int64_t>() >= 0)) {
            path.emplace_back(token.get<std::size_t>());
        } else {
            return fail(errc::kInvalidDelta, std::format("Invalid path token: {}", token.dump()));
        }
    }
    return path;
}

Path child_path(const Path& parent, PathToken token)
{
    Path path = parent;
    path.push_back(std::move(token));
    return path;
}

const Document* find_at(const Document& doc, const Path& path)
{
    return find_impl(doc, path);
}

Document* find_at(Document& doc, const Path& path)
{
    return find_impl(doc, path);
}

bool same_container_kind(const Document& a, const Document& b)
{
    return (a.is_object() && b.is_object()) || (a.is_array() && b.is_array());
}

std::string_view kind_name(const Document& doc)
{
    switch (doc.type()) {
        case nlohmann::json::value_t::object:
            return "object";
        case nlohmann::json::value_t::array:
            return "array";
        case nlohmann::json::value_t::string:
            return "string";
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
            return "integer";
        case nlohmann::json::value_t::number_float:
            return "float";
        case nlohmann::json::value_t::boolean:
            return "boolean";
        case nlohmann::json::value_t::null:
            return "null";
        case nlohmann::json::value_t::binary:
            return "binary";
        case nlohmann::json::value_t::discarded:
            return "discarded";
    }
    return "unknown";
}

}  // namespace linkdiff::common
