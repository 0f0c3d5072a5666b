/**
 * @file rdf.cpp
 * @brief Context resolution, triple extraction and reserialization
 */

#include "linkdiff/rdf.hpp"

#include "linkdiff/canonical_json.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdint>
#include <map>
#include <optional>
#include <utility>

namespace linkdiff::rdf {

namespace {

struct KnownPrefix
{
    std::string_view prefix;
    std::string_view ns;
};

constexpr std::array<KnownPrefix, 4> kKnownPrefixes = {
    {
     {"rdf", kRdfNs},
     {"rdfs", kRdfsNs},
     {"xsd", kXsdNs},
     {"schema", kSchemaNs},
     }
};

[[nodiscard]] bool is_absolute_iri(std::string_view value)
{
    return value.find("://") != std::string_view::npos || value.starts_with("urn:")
           || value.starts_with("mailto:");
}

[[nodiscard]] std::string vocab_prefix(std::string_view value)
{
    std::string prefix(value);
    if (!prefix.empty() && !prefix.ends_with('/') && !prefix.ends_with('#')) {
        prefix += '/';
    }
    return prefix;
}

/**
 * Term definitions, @vocab and @base of one document's @context.
 */
class Context
{
public:
    explicit Context(const Document& context) { load(context); }

    [[nodiscard]] std::string expand_key(std::string_view key) const
    {
        if (auto it = m_terms.find(std::string(key)); it != m_terms.end()) {
            return resolve(it->second);
        }
        return resolve(key);
    }

    [[nodiscard]] std::string expand_type(std::string_view value) const { return expand_key(value); }

    [[nodiscard]] std::string expand_id(std::string_view value) const
    {
        if (is_blank_label(value) || is_absolute_iri(value)) {
            return std::string(value);
        }
        if (auto expanded = expand_compact(value)) {
            return *expanded;
        }
        if (!m_base.empty()) {
            return m_base + std::string(value);
        }
        return std::string(value);
    }

    /// "@id" for IRI-valued terms, a datatype IRI, or nothing.
    [[nodiscard]] std::optional<std::string> coercion(std::string_view key) const
    {
        auto it = m_coercions.find(std::string(key));
        if (it == m_coercions.end()) {
            return std::nullopt;
        }
        if (it->second == "@id" || it->second == "@vocab") {
            return std::string("@id");
        }
        return expand_type(it->second);
    }

    [[nodiscard]] std::string compact_key(const std::string& iri) const
    {
        for (const auto& candidate : candidates(iri)) {
            if (!m_coercions.contains(candidate) && expand_key(candidate) == iri) {
                return candidate;
            }
        }
        return iri;
    }

    [[nodiscard]] std::string compact_type(const std::string& iri) const
    {
        for (const auto& candidate : candidates(iri)) {
            if (expand_type(candidate) == iri) {
                return candidate;
            }
        }
        return iri;
    }

private:
    void load(const Document& context)
    {
        if (context.is_string()) {
            m_vocab = vocab_prefix(context.get<std::string>());
            return;
        }
        if (context.is_array()) {
            for (const auto& entry : context) {
                load(entry);
            }
            return;
        }
        if (!context.is_object()) {
            return;
        }
        for (const auto& [key, value] : context.items()) {
            if (key == "@vocab" && value.is_string()) {
                m_vocab = value.get<std::string>();
            } else if (key == "@base" && value.is_string()) {
                m_base = value.get<std::string>();
            } else if (key == "@import" && value.is_string() && !context.contains("@vocab")) {
                m_vocab = vocab_prefix(value.get<std::string>());
            } else if (key.starts_with('@')) {
                continue;
            } else if (value.is_string()) {
                m_terms[key] = value.get<std::string>();
            } else if (value.is_object()) {
                if (auto id = value.find("@id"); id != value.end() && id->is_string()) {
                    m_terms[key] = id->get<std::string>();
                }
                if (auto type = value.find("@type"); type != value.end() && type->is_string()) {
                    m_coercions[key] = type->get<std::string>();
                }
            }
        }
    }

    [[nodiscard]] std::string effective_vocab() const
    {
        return m_vocab.empty() ? std::string(kDefaultVocab) : m_vocab;
    }

    [[nodiscard]] std::optional<std::string> expand_compact(std::string_view value) const
    {
        const auto colon = value.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return std::nullopt;
        }
        const std::string prefix(value.substr(0, colon));
        const std::string_view suffix = value.substr(colon + 1);
        if (prefix == "_" || suffix.starts_with("//")) {
            return std::nullopt;
        }
        if (auto it = m_terms.find(prefix); it != m_terms.end() && is_absolute_iri(it->second)) {
            return it->second + std::string(suffix);
        }
        for (const auto& known : kKnownPrefixes) {
            if (known.prefix == prefix) {
                return std::string(known.ns) + std::string(suffix);
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] std::string resolve(std::string_view value) const
    {
        if (is_absolute_iri(value)) {
            return std::string(value);
        }
        if (auto expanded = expand_compact(value)) {
            return *expanded;
        }
        return effective_vocab() + std::string(value);
    }

    /// Short forms to try when compacting, most specific first.
    [[nodiscard]] std::vector<std::string> candidates(const std::string& iri) const
    {
        std::vector<std::string> result;
        for (const auto& [term, definition] : m_terms) {
            if (resolve(definition) == iri) {
                result.push_back(term);
            }
        }
        const std::string vocab = effective_vocab();
        if (iri.starts_with(vocab) && iri.size() > vocab.size()) {
            std::string rest = iri.substr(vocab.size());
            if (rest.find(':') == std::string::npos && !rest.starts_with('@')) {
                result.push_back(std::move(rest));
            }
        }
        for (const auto& [term, definition] : m_terms) {
            if (is_absolute_iri(definition) && iri.starts_with(definition) && iri.size() > definition.size()) {
                result.push_back(term + ":" + iri.substr(definition.size()));
            }
        }
        for (const auto& known : kKnownPrefixes) {
            if (iri.starts_with(known.ns) && iri.size() > known.ns.size()) {
                result.push_back(std::string(known.prefix) + ":" + iri.substr(known.ns.size()));
            }
        }
        return result;
    }

    std::map<std::string, std::string> m_terms;
    std::map<std::string, std::string> m_coercions;
    std::string m_vocab;
    std::string m_base;
};

[[nodiscard]] std::string scalar_text(const Document& value)
{
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    return value.dump();
}

[[nodiscard]] std::optional<Term> native_literal(const Document& value)
{
    if (value.is_string()) {
        return literal(value.get<std::string>());
    }
    if (value.is_number_integer()) {
        return literal(value.dump(), std::string(kXsdInteger));
    }
    if (value.is_number_float()) {
        return literal(value.dump(), std::string(kXsdDouble));
    }
    if (value.is_boolean()) {
        return literal(scalar_text(value), std::string(kXsdBoolean));
    }
    return std::nullopt;
}

/**
 * Walks node objects and collects their triples.
 */
class Extractor
{
public:
    explicit Extractor(const Context& context)
        : m_context(context)
    {}

    std::string walk_node(const Document& node)
    {
        std::string subject = subject_of(node);
        if (auto types = node.find("@type"); types != node.end()) {
            for (const auto& type : types->is_array() ? *types : Document::array({*types})) {
                if (type.is_string()) {
                    m_triples.push_back(Triple{.subject = subject,
                                               .predicate = std::string(kRdfType),
                                               .object = iri(m_context.expand_type(type.get<std::string>()))});
                }
            }
        }
        for (const auto& [key, value] : node.items()) {
            if (key == "@graph") {
                for (const auto& child : value.is_array() ? value : Document::array({value})) {
                    if (child.is_object()) {
                        walk_node(child);
                    }
                }
                continue;
            }
            if (key.starts_with('@')) {
                continue;
            }
            emit_value(subject, m_context.expand_key(key), value, m_context.coercion(key));
        }
        return subject;
    }

    [[nodiscard]] std::vector<Triple> take_triples() { return std::move(m_triples); }

private:
    [[nodiscard]] std::string subject_of(const Document& node) const
    {
        if (auto id = node.find("@id"); id != node.end() && id->is_string()) {
            return m_context.expand_id(id->get<std::string>());
        }
        Document content = node;
        content.erase("@context");
        auto canonical = canonical::canonicalize(content);
        const std::string digest = common::sha256(canonical ? *canonical : content.dump());
        return "_:b" + digest.substr(0, 16);
    }

    void add(const std::string& subject, const std::string& predicate, Term object)
    {
        m_triples.push_back(Triple{.subject = subject, .predicate = predicate, .object = std::move(object)});
    }

    void emit_value(const std::string& subject,
                    const std::string& predicate,
                    const Document& value,
                    const std::optional<std::string>& coercion)
    {
        if (value.is_null()) {
            return;
        }
        if (value.is_array()) {
            for (const auto& element : value) {
                emit_value(subject, predicate, element, coercion);
            }
            return;
        }
        if (value.is_object()) {
            emit_object(subject, predicate, value, coercion);
            return;
        }
        if (value.is_string() && coercion) {
            if (*coercion == "@id") {
                add(subject, predicate, node_term(m_context.expand_id(value.get<std::string>())));
            } else {
                add(subject, predicate, literal(value.get<std::string>(), *coercion));
            }
            return;
        }
        if (auto term = native_literal(value)) {
            add(subject, predicate, std::move(*term));
        }
    }

    void emit_object(const std::string& subject,
                     const std::string& predicate,
                     const Document& value,
                     const std::optional<std::string>& coercion)
    {
        for (const char* container : {"@list", "@set"}) {
            if (auto members = value.find(container); members != value.end()) {
                emit_value(subject, predicate, *members, coercion);
                return;
            }
        }
        if (auto inner = value.find("@value"); inner != value.end()) {
            if (inner->is_null()) {
                return;
            }
            if (auto language = value.find("@language"); language != value.end() && language->is_string()) {
                add(subject, predicate, lang_literal(scalar_text(*inner), language->get<std::string>()));
            } else if (auto type = value.find("@type"); type != value.end() && type->is_string()) {
                add(subject, predicate, literal(scalar_text(*inner), m_context.expand_type(type->get<std::string>())));
            } else if (auto term = native_literal(*inner)) {
                add(subject, predicate, std::move(*term));
            }
            return;
        }
        if (value.size() == 1 && value.contains("@id") && value["@id"].is_string()) {
            add(subject, predicate, node_term(m_context.expand_id(value["@id"].get<std::string>())));
            return;
        }
        add(subject, predicate, node_term(walk_node(value)));
    }

    const Context& m_context;
    std::vector<Triple> m_triples;
};

void extract_into(const Document& doc, std::vector<Triple>& out)
{
    if (doc.is_array()) {
        for (const auto& element : doc) {
            extract_into(element, out);
        }
        return;
    }
    if (!doc.is_object()) {
        return;
    }
    const Context context(doc.contains("@context") ? doc["@context"] : Document());
    Extractor extractor(context);
    if (auto graph = doc.find("@graph"); graph != doc.end() && !doc.contains("@id")) {
        for (const auto& node : graph->is_array() ? *graph : Document::array({*graph})) {
            if (node.is_object()) {
                extractor.walk_node(node);
            }
        }
    } else {
        extractor.walk_node(doc);
    }
    auto triples = extractor.take_triples();
    out.insert(out.end(), std::make_move_iterator(triples.begin()), std::make_move_iterator(triples.end()));
}

[[nodiscard]] Document literal_to_json(const Term& term, const Context& context)
{
    if (!term.language.empty()) {
        return Document{{"@value", term.value}, {"@language", term.language}};
    }
    if (term.datatype.empty() || term.datatype == kXsdString) {
        return term.value;
    }
    const char* begin = term.value.data();
    const char* end = term.value.data() + term.value.size();
    if (term.datatype == kXsdInteger) {
        std::int64_t parsed = 0;
        auto [ptr, ec] = std::from_chars(begin, end, parsed);
        if (ec == std::errc{} && ptr == end) {
            return parsed;
        }
    } else if (term.datatype == kXsdDouble) {
        double parsed = 0.0;
        auto [ptr, ec] = std::from_chars(begin, end, parsed);
        if (ec == std::errc{} && ptr == end && term.value.find_first_of(".eE") != std::string::npos) {
            return parsed;
        }
    } else if (term.datatype == kXsdBoolean && (term.value == "true" || term.value == "false")) {
        return term.value == "true";
    }
    return Document{{"@value", term.value}, {"@type", context.compact_type(term.datatype)}};
}

}  // namespace

Term iri(std::string value)
{
    return Term{.kind = TermKind::kIri, .value = std::move(value), .datatype = {}, .language = {}};
}

Term blank(std::string label)
{
    return Term{.kind = TermKind::kBlank, .value = std::move(label), .datatype = {}, .language = {}};
}

Term literal(std::string value, std::string datatype)
{
    return Term{.kind = TermKind::kLiteral, .value = std::move(value), .datatype = std::move(datatype), .language = {}};
}

Term lang_literal(std::string value, std::string language)
{
    return Term{.kind = TermKind::kLiteral,
                .value = std::move(value),
                .datatype = std::string(kRdfNs) + "langString",
                .language = std::move(language)};
}

bool is_blank_label(std::string_view id)
{
    return id.starts_with("_:");
}

Term node_term(std::string id)
{
    return is_blank_label(id) ? blank(std::move(id)) : iri(std::move(id));
}

std::vector<Triple> extract_triples(const Document& doc)
{
    std::vector<Triple> triples;
    extract_into(doc, triples);
    std::ranges::sort(triples);
    auto [first, last] = std::ranges::unique(triples);
    triples.erase(first, last);
    return triples;
}

Document from_triples(std::span<const Triple> triples, const Document& context)
{
    const Context resolver(context);
    std::map<std::string, std::vector<const Triple*>> by_subject;
    for (const auto& triple : triples) {
        by_subject[triple.subject].push_back(&triple);
    }

    Document nodes = Document::array();
    for (const auto& [subject, subject_triples] : by_subject) {
        Document node = {{"@id", subject}};
        Document types = Document::array();
        std::map<std::string, Document> properties;
        for (const auto* triple : subject_triples) {
            if (triple->predicate == kRdfType && triple->object.kind == TermKind::kIri) {
                types.push_back(resolver.compact_type(triple->object.value));
                continue;
            }
            Document value = triple->object.kind == TermKind::kLiteral
                                 ? literal_to_json(triple->object, resolver)
                                 : Document{{"@id", triple->object.value}};
            auto& slot = properties[resolver.compact_key(triple->predicate)];
            if (slot.is_null()) {
                slot = Document::array();
            }
            slot.push_back(std::move(value));
        }
        if (!types.empty()) {
            node["@type"] = types.size() == 1 ? types[0] : types;
        }
        for (auto& [key, values] : properties) {
            node[key] = values.size() == 1 ? values[0] : values;
        }
        nodes.push_back(std::move(node));
    }

    Document result = nodes.size() == 1 ? nodes[0] : Document::object();
    if (nodes.size() > 1) {
        result["@graph"] = std::move(nodes);
    }
    if (!context.is_null()) {
        result["@context"] = context;
    }
    return result;
}

}  // namespace linkdiff::rdf
