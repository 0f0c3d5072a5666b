/**
 * @file text_diff.cpp
 * @brief Code-point text diff, apply and inverse
 *
 * Invalid UTF-8 bytes decode to U+DC80..U+DCFF and encode back to the same
 * byte, so every string round-trips.
 */

#include "linkdiff/lcs.hpp"

#include <algorithm>
#include <format>

namespace linkdiff::lcs {

namespace {

constexpr char32_t kEscapeBase = 0xDC00;

[[nodiscard]] std::u32string decode_utf8(std::string_view text)
{
    std::u32string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t len = 0;
        char32_t cp = 0;
        if (lead < 0x80) {
            len = 1;
            cp = lead;
        } else if ((lead & 0xE0U) == 0xC0 && lead >= 0xC2) {
            len = 2;
            cp = lead & 0x1FU;
        } else if ((lead & 0xF0U) == 0xE0) {
            len = 3;
            cp = lead & 0x0FU;
        } else if ((lead & 0xF8U) == 0xF0 && lead <= 0xF4) {
            len = 4;
            cp = lead & 0x07U;
        }

        bool valid = len > 0 && i + len <= text.size();
        for (std::size_t k = 1; valid && k < len; ++k) {
            const auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0U) != 0x80) {
                valid = false;
            } else {
                cp = (cp << 6U) | (cont & 0x3FU);
            }
        }
        if (valid) {
            const bool overlong = (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000);
            const bool surrogate = cp >= 0xD800 && cp <= 0xDFFF;
            valid = !overlong && !surrogate && cp <= 0x10FFFF;
        }

        if (valid) {
            out.push_back(cp);
            i += len;
        } else {
            out.push_back(kEscapeBase + lead);
            ++i;
        }
    }
    return out;
}

void append_utf8(std::string& out, char32_t cp)
{
    if (cp >= kEscapeBase + 0x80 && cp <= kEscapeBase + 0xFF) {
        out.push_back(static_cast<char>(cp - kEscapeBase));
    } else if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
        out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
        out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    } else {
        out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
        out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    }
}

[[nodiscard]] std::string encode_range(const std::u32string& cps, std::size_t start, std::size_t end)
{
    std::string out;
    out.reserve(end - start);
    for (std::size_t k = start; k < end; ++k) {
        append_utf8(out, cps[k]);
    }
    return out;
}

[[nodiscard]] TextOp make_gap_op(const std::u32string& old_cps,
                                 const std::u32string& new_cps,
                                 Match from,
                                 Match to)
{
    // Gap covers old [from.old_index, to.old_index) and new [from.new_index, to.new_index).
    const bool has_old = to.old_index > from.old_index;
    const bool has_new = to.new_index > from.new_index;
    TextOp op{.kind = TextOpKind::kReplace,
              .start = from.old_index,
              .end = to.old_index,
              .old_text = encode_range(old_cps, from.old_index, to.old_index),
              .text = encode_range(new_cps, from.new_index, to.new_index)};
    if (!has_new) {
        op.kind = TextOpKind::kDelete;
    } else if (!has_old) {
        op.kind = TextOpKind::kInsert;
    }
    return op;
}

}  // namespace

TextDiff diff_text(std::string_view old_text, std::string_view new_text)
{
    const std::u32string old_cps = decode_utf8(old_text);
    const std::u32string new_cps = decode_utf8(new_text);
    const std::size_t n = old_cps.size();
    const std::size_t m = new_cps.size();

    TextDiff result{.ops = {}, .similarity = 1.0};
    if (n + m == 0) {
        return result;
    }

    std::size_t prefix = 0;
    while (prefix < n && prefix < m && old_cps[prefix] == new_cps[prefix]) {
        ++prefix;
    }
    std::size_t suffix = 0;
    while (suffix < n - prefix && suffix < m - prefix
           && old_cps[n - 1 - suffix] == new_cps[m - 1 - suffix]) {
        ++suffix;
    }

    std::vector<Match> anchors;
    const std::size_t rows = n - prefix - suffix;
    const std::size_t cols = m - prefix - suffix;
    if (rows > 0 && cols > 0 && rows * cols <= kTextCellBudget) {
        auto middle = align_with(rows, cols, [&](std::size_t i, std::size_t j) {
            return old_cps[prefix + i] == new_cps[prefix + j];
        });
        for (const auto& match : middle.matches) {
            anchors.push_back(Match{.old_index = prefix + match.old_index,
                                    .new_index = prefix + match.new_index});
        }
    }

    const std::size_t common = prefix + suffix + anchors.size();
    result.similarity = 2.0 * static_cast<double>(common) / static_cast<double>(n + m);

    // Walk the gaps between anchors; prefix and suffix act as outer anchors.
    Match cursor{.old_index = prefix, .new_index = prefix};
    anchors.push_back(Match{.old_index = n - suffix, .new_index = m - suffix});
    for (const auto& anchor : anchors) {
        if (anchor.old_index > cursor.old_index || anchor.new_index > cursor.new_index) {
            result.ops.push_back(make_gap_op(old_cps, new_cps, cursor, anchor));
        }
        cursor = Match{.old_index = anchor.old_index + 1, .new_index = anchor.new_index + 1};
    }
    return result;
}

Result<std::string> apply_text(std::string_view text, std::span<const TextOp> ops)
{
    const std::u32string cps = decode_utf8(text);
    std::u32string out;
    out.reserve(cps.size());

    std::size_t cursor = 0;
    for (const auto& op : ops) {
        const std::size_t end = op.kind == TextOpKind::kInsert ? op.start : op.end;
        if (op.start < cursor || end < op.start || end > cps.size()) {
            return fail(errc::kPatchFailed,
                        std::format("Text op {} [{}, {}) out of range for text of length {}",
                                    text_op_name(op.kind),
                                    op.start,
                                    end,
                                    cps.size()));
        }
        out.append(cps, cursor, op.start - cursor);
        if (op.kind != TextOpKind::kDelete) {
            out += decode_utf8(op.text);
        }
        cursor = end;
    }
    out.append(cps, cursor, std::u32string::npos);

    std::string encoded;
    encoded.reserve(out.size());
    for (char32_t cp : out) {
        append_utf8(encoded, cp);
    }
    return encoded;
}

std::vector<TextOp> invert_text(std::span<const TextOp> ops)
{
    std::vector<TextOp> inverted;
    inverted.reserve(ops.size());
    std::ptrdiff_t offset = 0;
    for (const auto& op : ops) {
        const auto start = static_cast<std::size_t>(static_cast<std::ptrdiff_t>(op.start) + offset);
        const std::size_t removed = op.kind == TextOpKind::kInsert ? 0 : op.end - op.start;
        const std::size_t added = op.kind == TextOpKind::kDelete ? 0 : code_point_length(op.text);

        TextOp back{.kind = TextOpKind::kReplace,
                    .start = start,
                    .end = start + added,
                    .old_text = op.kind == TextOpKind::kDelete ? std::string() : op.text,
                    .text = op.kind == TextOpKind::kInsert ? std::string() : op.old_text};
        if (op.kind == TextOpKind::kDelete) {
            back.kind = TextOpKind::kInsert;
        } else if (op.kind == TextOpKind::kInsert) {
            back.kind = TextOpKind::kDelete;
        }
        inverted.push_back(std::move(back));
        offset += static_cast<std::ptrdiff_t>(added) - static_cast<std::ptrdiff_t>(removed);
    }
    return inverted;
}

std::size_t code_point_length(std::string_view text)
{
    return decode_utf8(text).size();
}

std::string_view text_op_name(TextOpKind kind)
{
    switch (kind) {
        case TextOpKind::kDelete:
            return "delete";
        case TextOpKind::kInsert:
            return "insert";
        case TextOpKind::kReplace:
            return "replace";
    }
    return "unknown";
}

}  // namespace linkdiff::lcs
