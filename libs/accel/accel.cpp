/**
 * @file accel.cpp
 * @brief Acceleration provider registry and fallback dispatch
 */

#include "linkdiff/accel.hpp"

#include "linkdiff/log.hpp"

#include <atomic>
#include <format>
#include <mutex>
#include <utility>

namespace linkdiff::accel {

namespace {

std::mutex g_provider_mutex;
std::shared_ptr<const AccelerationProvider> g_provider;
std::atomic<bool> g_verify{false};

/**
 * Run the native path, fall back to the local engine on Unavailable, and
 * compare serialized results in verify mode.
 */
template <typename T, typename NativeCall, typename LocalCall, typename Serialize>
[[nodiscard]] Result<T> dispatch(std::string_view operation,
                                 const DispatchOptions& options,
                                 NativeCall&& native,
                                 LocalCall&& local,
                                 Serialize&& serialize)
{
    const auto current = provider();
    AccelResult<T> accelerated = current ? native(*current) : AccelResult<T>(unavailable("no provider registered"));
    if (!accelerated) {
        if (accelerated.error().kind == AccelErrorKind::kMismatch) {
            return fail(errc::kAccelerationMismatch, std::format("{}: {}", operation, accelerated.error().detail));
        }
        const auto& detail = accelerated.error().detail;
        log::debug(detail.empty() ? std::format("{}: native path unavailable, using local engine", operation)
                                  : std::format("{}: native path unavailable, using local engine ({})", operation, detail));
        return local();
    }
    if (!options.verify.value_or(verify_enabled())) {
        return std::move(*accelerated);
    }

    Result<T> reference = local();
    if (!reference) {
        return fail(errc::kAccelerationMismatch,
                    std::format("{}: native path succeeded but local engine failed: {}",
                                operation,
                                reference.error().message));
    }
    if (serialize(*accelerated) != serialize(*reference)) {
        return fail(errc::kAccelerationMismatch,
                    std::format("{}: native and local results differ (provider '{}')", operation, current->name()));
    }
    return std::move(*accelerated);
}

[[nodiscard]] std::string dump_document(const Document& doc)
{
    return doc.dump();
}

}  // namespace

std::unexpected<AccelError> unavailable(std::string detail)
{
    return std::unexpected(AccelError{.kind = AccelErrorKind::kUnavailable, .detail = std::move(detail)});
}

// ============================================================================
// Base provider: nothing is accelerated
// ============================================================================

std::string AccelerationProvider::name() const
{
    return "none";
}

AccelResult<structural::Delta> AccelerationProvider::structural_diff(const Document& /*old_doc*/,
                                                                     const Document& /*new_doc*/,
                                                                     const structural::Options& /*options*/) const
{
    return unavailable();
}

AccelResult<Document> AccelerationProvider::structural_patch(const Document& /*doc*/,
                                                             const structural::Delta& /*delta*/) const
{
    return unavailable();
}

AccelResult<operational::OperationalDiff> AccelerationProvider::operational_diff(
    const Document& /*old_doc*/,
    const Document& /*new_doc*/,
    const operational::Options& /*options*/) const
{
    return unavailable();
}

AccelResult<Document> AccelerationProvider::operational_patch(const Document& /*doc*/,
                                                              const operational::OperationalDiff& /*diff*/) const
{
    return unavailable();
}

AccelResult<operational::OperationalDiff> AccelerationProvider::operational_merge(
    std::span<const operational::OperationalDiff> /*diffs*/,
    const operational::MergeOptions& /*options*/) const
{
    return unavailable();
}

AccelResult<semantic::SemanticDiff> AccelerationProvider::semantic_diff(const Document& /*old_doc*/,
                                                                        const Document& /*new_doc*/,
                                                                        const semantic::Options& /*options*/) const
{
    return unavailable();
}

AccelResult<Document> AccelerationProvider::semantic_patch(const Document& /*doc*/,
                                                           const semantic::SemanticDiff& /*diff*/,
                                                           const semantic::Options& /*options*/) const
{
    return unavailable();
}

AccelResult<std::string> AccelerationProvider::canonical_json(const Document& /*doc*/) const
{
    return unavailable();
}

AccelResult<c14n::RdfCanonicalForm> AccelerationProvider::canonicalize_rdf(const Document& /*doc*/,
                                                                           std::string_view /*algorithm*/) const
{
    return unavailable();
}

// ============================================================================
// Registration
// ============================================================================

void set_provider(std::shared_ptr<const AccelerationProvider> provider)
{
    std::lock_guard<std::mutex> lock(g_provider_mutex);
    g_provider = std::move(provider);
}

std::shared_ptr<const AccelerationProvider> provider()
{
    std::lock_guard<std::mutex> lock(g_provider_mutex);
    return g_provider;
}

void set_verify(bool enabled)
{
    g_verify.store(enabled);
}

bool verify_enabled()
{
    return g_verify.load();
}

// ============================================================================
// Dispatch
// ============================================================================

Result<structural::Delta> structural_diff(const Document& old_doc,
                                          const Document& new_doc,
                                          const structural::Options& options,
                                          const DispatchOptions& dispatch_options)
{
    return dispatch<structural::Delta>(
        "structural_diff",
        dispatch_options,
        [&](const AccelerationProvider& p) { return p.structural_diff(old_doc, new_doc, options); },
        [&] { return structural::diff(old_doc, new_doc, options); },
        [](const structural::Delta& delta) { return structural::to_json(delta).dump(); });
}

Result<Document> structural_patch(const Document& doc,
                                  const structural::Delta& delta,
                                  const DispatchOptions& dispatch_options)
{
    return dispatch<Document>(
        "structural_patch",
        dispatch_options,
        [&](const AccelerationProvider& p) { return p.structural_patch(doc, delta); },
        [&] { return structural::patch(doc, delta); },
        dump_document);
}

Result<operational::OperationalDiff> operational_diff(const Document& old_doc,
                                                      const Document& new_doc,
                                                      const operational::Options& options,
                                                      const DispatchOptions& dispatch_options)
{
    operational::Options pinned = options;
    if (!pinned.actor_id) {
        pinned.actor_id = operational::generate_actor_id();
    }
    if (!pinned.timestamp) {
        pinned.timestamp = operational::now_nanoseconds();
    }
    return dispatch<operational::OperationalDiff>(
        "operational_diff",
        dispatch_options,
        [&](const AccelerationProvider& p) { return p.operational_diff(old_doc, new_doc, pinned); },
        [&] { return operational::diff(old_doc, new_doc, pinned); },
        [](const operational::OperationalDiff& diff) { return operational::to_json(diff).dump(); });
}

Result<Document> operational_patch(const Document& doc,
                                   const operational::OperationalDiff& diff,
                                   const DispatchOptions& dispatch_options)
{
    return dispatch<Document>(
        "operational_patch",
        dispatch_options,
        [&](const AccelerationProvider& p) { return p.operational_patch(doc, diff); },
        [&] { return operational::patch(doc, diff); },
        dump_document);
}

Result<operational::OperationalDiff> operational_merge(std::span<const operational::OperationalDiff> diffs,
                                                       const operational::MergeOptions& options,
                                                       const DispatchOptions& dispatch_options)
{
    return dispatch<operational::OperationalDiff>(
        "operational_merge",
        dispatch_options,
        [&](const AccelerationProvider& p) { return p.operational_merge(diffs, options); },
        [&] { return operational::merge_diffs(diffs, options); },
        [](const operational::OperationalDiff& diff) { return operational::to_json(diff).dump(); });
}

Result<semantic::SemanticDiff> semantic_diff(const Document& old_doc,
                                             const Document& new_doc,
                                             const semantic::Options& options,
                                             const DispatchOptions& dispatch_options)
{
    return dispatch<semantic::SemanticDiff>(
        "semantic_diff",
        dispatch_options,
        [&](const AccelerationProvider& p) { return p.semantic_diff(old_doc, new_doc, options); },
        [&] { return semantic::diff(old_doc, new_doc, options); },
        [](const semantic::SemanticDiff& diff) { return semantic::to_json(diff).dump(); });
}

Result<Document> semantic_patch(const Document& doc,
                                const semantic::SemanticDiff& diff,
                                const semantic::Options& options,
                                const DispatchOptions& dispatch_options)
{
    return dispatch<Document>(
        "semantic_patch",
        dispatch_options,
        [&](const AccelerationProvider& p) { return p.semantic_patch(doc, diff, options); },
        [&] { return semantic::patch(doc, diff, options); },
        dump_document);
}

Result<std::string> canonical_json(const Document& doc, const DispatchOptions& dispatch_options)
{
    return dispatch<std::string>(
        "canonical_json",
        dispatch_options,
        [&](const AccelerationProvider& p) { return p.canonical_json(doc); },
        [&] { return c14n::canonical_json(doc); },
        [](const std::string& text) { return text; });
}

Result<c14n::RdfCanonicalForm> canonicalize_rdf(const Document& doc,
                                                std::string_view algorithm,
                                                const DispatchOptions& dispatch_options)
{
    return dispatch<c14n::RdfCanonicalForm>(
        "canonicalize_rdf",
        dispatch_options,
        [&](const AccelerationProvider& p) { return p.canonicalize_rdf(doc, algorithm); },
        [&] { return c14n::canonicalize_rdf(doc, algorithm); },
        [](const c14n::RdfCanonicalForm& form) { return form.nquads; });
}

}  // namespace linkdiff::accel
