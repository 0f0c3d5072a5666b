#pragma once

/**
 * @file accel.hpp
 * @brief Try-native-else-local dispatch for every engine
 *
 * An AccelerationProvider may implement any engine operation natively. The
 * dispatch functions below try the registered provider first and fall back
 * to the in-process engine when it reports Unavailable. In verify mode both
 * paths run and their serialized results must match byte for byte.
 */

#include "linkdiff/c14n.hpp"
#include "linkdiff/common.hpp"
#include "linkdiff/document.hpp"
#include "linkdiff/operational.hpp"
#include "linkdiff/semantic.hpp"
#include "linkdiff/structural.hpp"

#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace linkdiff::accel {

/**
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class AccelErrorKind {
    kUnavailable,  ///< not built, not implemented or failed at runtime
    kMismatch,     ///< native result disagrees with the local engine
};

struct AccelError
{
    AccelErrorKind kind = AccelErrorKind::kUnavailable;
    std::string detail;
};

template <typename T>
using AccelResult = std::expected<T, AccelError>;

[[nodiscard]] std::unexpected<AccelError> unavailable(std::string detail = {});

/**
 * Native implementations of engine operations. Every method of the base
 * class reports Unavailable; providers override what they support.
 */
class AccelerationProvider
{
public:
    virtual ~AccelerationProvider() = default;

    [[nodiscard]] virtual std::string name() const;

    [[nodiscard]] virtual AccelResult<structural::Delta> structural_diff(const Document& old_doc,
                                                                         const Document& new_doc,
                                                                         const structural::Options& options) const;
    [[nodiscard]] virtual AccelResult<Document> structural_patch(const Document& doc,
                                                                 const structural::Delta& delta) const;

    [[nodiscard]] virtual AccelResult<operational::OperationalDiff> operational_diff(
        const Document& old_doc,
        const Document& new_doc,
        const operational::Options& options) const;
    [[nodiscard]] virtual AccelResult<Document> operational_patch(const Document& doc,
                                                                  const operational::OperationalDiff& diff) const;
    [[nodiscard]] virtual AccelResult<operational::OperationalDiff> operational_merge(
        std::span<const operational::OperationalDiff> diffs,
        const operational::MergeOptions& options) const;

    [[nodiscard]] virtual AccelResult<semantic::SemanticDiff> semantic_diff(const Document& old_doc,
                                                                            const Document& new_doc,
                                                                            const semantic::Options& options) const;
    [[nodiscard]] virtual AccelResult<Document> semantic_patch(const Document& doc,
                                                               const semantic::SemanticDiff& diff,
                                                               const semantic::Options& options) const;

    [[nodiscard]] virtual AccelResult<std::string> canonical_json(const Document& doc) const;
    [[nodiscard]] virtual AccelResult<c14n::RdfCanonicalForm> canonicalize_rdf(const Document& doc,
                                                                               std::string_view algorithm) const;
};

/// Install the process-wide provider (nullptr removes it).
void set_provider(std::shared_ptr<const AccelerationProvider> provider);
[[nodiscard]] std::shared_ptr<const AccelerationProvider> provider();

/// Process-wide verify mode, normally set from configuration.
void set_verify(bool enabled);
[[nodiscard]] bool verify_enabled();

struct DispatchOptions
{
    std::optional<bool> verify;  ///< overrides verify_enabled() for one call
};

[[nodiscard]] Result<structural::Delta> structural_diff(const Document& old_doc,
                                                        const Document& new_doc,
                                                        const structural::Options& options = {},
                                                        const DispatchOptions& dispatch = {});
[[nodiscard]] Result<Document> structural_patch(const Document& doc,
                                                const structural::Delta& delta,
                                                const DispatchOptions& dispatch = {});

/**
 * Missing actor id and timestamp are fixed before dispatch so that both
 * paths see the same values.
 */
[[nodiscard]] Result<operational::OperationalDiff> operational_diff(const Document& old_doc,
                                                                    const Document& new_doc,
                                                                    const operational::Options& options = {},
                                                                    const DispatchOptions& dispatch = {});
[[nodiscard]] Result<Document> operational_patch(const Document& doc,
                                                 const operational::OperationalDiff& diff,
                                                 const DispatchOptions& dispatch = {});
[[nodiscard]] Result<operational::OperationalDiff> operational_merge(
    std::span<const operational::OperationalDiff> diffs,
    const operational::MergeOptions& options = {},
    const DispatchOptions& dispatch = {});

[[nodiscard]] Result<semantic::SemanticDiff> semantic_diff(const Document& old_doc,
                                                           const Document& new_doc,
                                                           const semantic::Options& options = {},
                                                           const DispatchOptions& dispatch = {});
[[nodiscard]] Result<Document> semantic_patch(const Document& doc,
                                              const semantic::SemanticDiff& diff,
                                              const semantic::Options& options = {},
                                              const DispatchOptions& dispatch = {});

[[nodiscard]] Result<std::string> canonical_json(const Document& doc, const DispatchOptions& dispatch = {});
[[nodiscard]] Result<c14n::RdfCanonicalForm> canonicalize_rdf(const Document& doc,
                                                              std::string_view algorithm = c14n::kDefaultAlgorithm,
                                                              const DispatchOptions& dispatch = {});

}  // namespace linkdiff::accel
