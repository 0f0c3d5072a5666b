/**
 * @file nquads.cpp
 * @brief N-Quads term syntax and blank-node relabelling
 */

#include "linkdiff/rdf.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <map>
#include <utility>

namespace linkdiff::rdf {

namespace {

[[nodiscard]] std::string escape_literal(std::string_view text)
{
    std::string out;
    out.reserve(text.size() + 2);
    for (char c : text) {
        switch (c) {
            case '\\':
                out += "\\\\";
                break;
            case '"':
                out += "\\\"";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
        }
    }
    return out;
}

void append_utf8(std::string& out, std::uint32_t cp)
{
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

/**
 * Cursor over one N-Quads line.
 */
class LineParser
{
public:
    LineParser(std::string_view line, std::size_t line_number)
        : m_line(line),
          m_line_number(line_number)
    {}

    [[nodiscard]] Result<Triple> parse()
    {
        auto subject = parse_term();
        if (!subject) {
            return std::unexpected(subject.error());
        }
        if (subject->kind == TermKind::kLiteral) {
            return error("literal in subject position");
        }
        auto predicate = parse_term();
        if (!predicate) {
            return std::unexpected(predicate.error());
        }
        if (predicate->kind != TermKind::kIri) {
            return error("predicate must be an IRI");
        }
        auto object = parse_term();
        if (!object) {
            return std::unexpected(object.error());
        }
        skip_spaces();
        if (peek() != '.') {
            auto graph = parse_term();
            if (!graph) {
                return std::unexpected(graph.error());
            }
            if (graph->kind == TermKind::kLiteral) {
                return error("literal in graph position");
            }
            skip_spaces();
        }
        if (peek() != '.') {
            return error("expected '.'");
        }
        ++m_pos;
        skip_spaces();
        if (m_pos < m_line.size() && m_line[m_pos] != '#') {
            return error("trailing characters");
        }
        return Triple{.subject = std::move(subject->value),
                      .predicate = std::move(predicate->value),
                      .object = std::move(*object)};
    }

private:
    [[nodiscard]] std::unexpected<Error> error(const std::string& what) const
    {
        return fail(errc::kParseError, std::format("N-Quads line {}: {}", m_line_number, what));
    }

    [[nodiscard]] char peek() const { return m_pos < m_line.size() ? m_line[m_pos] : '\0'; }

    void skip_spaces()
    {
        while (m_pos < m_line.size() && (m_line[m_pos] == ' ' || m_line[m_pos] == '\t')) {
            ++m_pos;
        }
    }

    [[nodiscard]] std::string_view take_until_space()
    {
        const auto start = m_pos;
        while (m_pos < m_line.size() && m_line[m_pos] != ' ' && m_line[m_pos] != '\t') {
            ++m_pos;
        }
        return m_line.substr(start, m_pos - start);
    }

    [[nodiscard]] Result<std::string> parse_iri()
    {
        ++m_pos;
        const auto close = m_line.find('>', m_pos);
        if (close == std::string_view::npos) {
            return error("unterminated IRI");
        }
        std::string value(m_line.substr(m_pos, close - m_pos));
        m_pos = close + 1;
        return value;
    }

    [[nodiscard]] Result<std::uint32_t> parse_hex(std::size_t digits)
    {
        if (m_pos + digits > m_line.size()) {
            return error("truncated unicode escape");
        }
        std::uint32_t cp = 0;
        for (std::size_t i = 0; i < digits; ++i) {
            const char c = m_line[m_pos++];
            cp <<= 4;
            if (c >= '0' && c <= '9') {
                cp |= static_cast<std::uint32_t>(c - '0');
            } else if (c >= 'a' && c <= 'f') {
                cp |= static_cast<std::uint32_t>(c - 'a' + 10);
            } else if (c >= 'A' && c <= 'F') {
                cp |= static_cast<std::uint32_t>(c - 'A' + 10);
            } else {
                return error("invalid unicode escape");
            }
        }
        return cp;
    }

    [[nodiscard]] Result<Term> parse_literal()
    {
        ++m_pos;
        std::string value;
        while (true) {
            if (m_pos >= m_line.size()) {
                return error("unterminated literal");
            }
            const char c = m_line[m_pos++];
            if (c == '"') {
                break;
            }
            if (c != '\\') {
                value += c;
                continue;
            }
            if (m_pos >= m_line.size()) {
                return error("dangling escape");
            }
            const char e = m_line[m_pos++];
            switch (e) {
                case 't':
                    value += '\t';
                    break;
                case 'n':
                    value += '\n';
                    break;
                case 'r':
                    value += '\r';
                    break;
                case 'b':
                    value += '\b';
                    break;
                case 'f':
                    value += '\f';
                    break;
                case '"':
                case '\'':
                case '\\':
                    value += e;
                    break;
                case 'u':
                case 'U': {
                    auto cp = parse_hex(e == 'u' ? 4 : 8);
                    if (!cp) {
                        return std::unexpected(cp.error());
                    }
                    append_utf8(value, *cp);
                    break;
                }
                default:
                    return error(std::string("unknown escape \\") + e);
            }
        }
        if (peek() == '@') {
            ++m_pos;
            std::string language(take_until_space());
            if (language.empty()) {
                return error("empty language tag");
            }
            return lang_literal(std::move(value), std::move(language));
        }
        if (m_line.substr(m_pos).starts_with("^^")) {
            m_pos += 2;
            if (peek() != '<') {
                return error("expected datatype IRI");
            }
            auto datatype = parse_iri();
            if (!datatype) {
                return std::unexpected(datatype.error());
            }
            return literal(std::move(value), std::move(*datatype));
        }
        return literal(std::move(value));
    }

    [[nodiscard]] Result<Term> parse_term()
    {
        skip_spaces();
        const char c = peek();
        if (c == '<') {
            auto value = parse_iri();
            if (!value) {
                return std::unexpected(value.error());
            }
            return iri(std::move(*value));
        }
        if (c == '_' && m_line.substr(m_pos).starts_with("_:")) {
            std::string label(take_until_space());
            if (label.size() <= 2) {
                return error("empty blank node label");
            }
            return blank(std::move(label));
        }
        if (c == '"') {
            return parse_literal();
        }
        return error("expected a term");
    }

    std::string_view m_line;
    std::size_t m_line_number;
    std::size_t m_pos = 0;
};

[[nodiscard]] std::string_view trim(std::string_view text)
{
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t' || text.front() == '\r')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    return text;
}

/// Sorted one-hop neighbourhood of each blank node, with blank neighbours masked.
[[nodiscard]] std::map<std::string, std::vector<std::string>> neighbourhoods(const std::vector<Triple>& triples)
{
    std::map<std::string, std::vector<std::string>> result;
    for (const auto& triple : triples) {
        const bool blank_subject = is_blank_label(triple.subject);
        const bool blank_object = triple.object.kind == TermKind::kBlank;
        if (blank_subject) {
            result[triple.subject].push_back("s|" + triple.predicate + "|"
                                             + (blank_object ? std::string("_") : term_to_nquads(triple.object)));
        }
        if (blank_object) {
            result[triple.object.value].push_back("o|" + triple.predicate + "|"
                                                  + (blank_subject ? std::string("_") : triple.subject));
        }
    }
    for (auto& [label, entries] : result) {
        std::ranges::sort(entries);
    }
    return result;
}

}  // namespace

std::string term_to_nquads(const Term& term)
{
    switch (term.kind) {
        case TermKind::kIri:
            return "<" + term.value + ">";
        case TermKind::kBlank:
            return term.value;
        case TermKind::kLiteral:
            break;
    }
    std::string out = "\"" + escape_literal(term.value) + "\"";
    if (!term.language.empty()) {
        out += "@" + term.language;
    } else if (!term.datatype.empty() && term.datatype != kXsdString) {
        out += "^^<" + term.datatype + ">";
    }
    return out;
}

std::string to_nquads(std::span<const Triple> triples)
{
    std::string out;
    for (const auto& triple : triples) {
        out += is_blank_label(triple.subject) ? triple.subject : "<" + triple.subject + ">";
        out += " <" + triple.predicate + "> ";
        out += term_to_nquads(triple.object);
        out += " .\n";
    }
    return out;
}

Result<std::vector<Triple>> parse_nquads(std::string_view text)
{
    std::vector<Triple> triples;
    std::size_t line_number = 0;
    while (!text.empty()) {
        const auto newline = text.find('\n');
        const std::string_view line = trim(text.substr(0, newline));
        text.remove_prefix(newline == std::string_view::npos ? text.size() : newline + 1);
        ++line_number;
        if (line.empty() || line.front() == '#') {
            continue;
        }
        auto triple = LineParser(line, line_number).parse();
        if (!triple) {
            return std::unexpected(triple.error());
        }
        triples.push_back(std::move(*triple));
    }
    return triples;
}

std::vector<Triple> normalize_blank_nodes(std::vector<Triple> triples)
{
    auto hoods = neighbourhoods(triples);

    std::vector<std::pair<std::string, std::string>> ranked;  // (fingerprint, label)
    ranked.reserve(hoods.size());
    for (const auto& [label, entries] : hoods) {
        common::Sha256 hasher;
        for (const auto& entry : entries) {
            hasher.update(entry);
            hasher.update(std::string_view("\n"));
        }
        ranked.emplace_back(hasher.hex_digest(), label);
    }
    std::ranges::sort(ranked);

    std::map<std::string, std::string> relabel;
    for (std::size_t i = 0; i < ranked.size(); ++i) {
        relabel[ranked[i].second] = std::format("_:c14n{}", i);
    }
    for (auto& triple : triples) {
        if (auto it = relabel.find(triple.subject); it != relabel.end()) {
            triple.subject = it->second;
        }
        if (triple.object.kind == TermKind::kBlank) {
            if (auto it = relabel.find(triple.object.value); it != relabel.end()) {
                triple.object.value = it->second;
            }
        }
    }
    std::ranges::sort(triples);
    auto [first, last] = std::ranges::unique(triples);
    triples.erase(first, last);
    return triples;
}

}  // namespace linkdiff::rdf
