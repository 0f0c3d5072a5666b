#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: result types, error codes, SHA-256
 */

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace linkdiff {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

/**
 * Error codes shared by every engine.
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */
namespace errc {

inline constexpr std::string_view kDiffFailed = "DiffFailed";
inline constexpr std::string_view kPatchFailed = "PatchFailed";
inline constexpr std::string_view kMergeFailed = "MergeFailed";
inline constexpr std::string_view kInverseFailed = "InverseFailed";
inline constexpr std::string_view kCanonicalizationFailed = "CanonicalizationFailed";
inline constexpr std::string_view kProviderUnavailable = "ProviderUnavailable";
inline constexpr std::string_view kAccelerationMismatch = "AccelerationMismatch";
inline constexpr std::string_view kInvalidStrategy = "InvalidStrategy";
inline constexpr std::string_view kInvalidDelta = "InvalidDelta";
inline constexpr std::string_view kConfigError = "ConfigError";
inline constexpr std::string_view kIOError = "IOError";
inline constexpr std::string_view kParseError = "ParseError";

}  // namespace errc

/**
 * Build an unexpected Error from a code constant and a message.
 */
[[nodiscard]] inline std::unexpected<Error> fail(std::string_view code, std::string message)
{
    return std::unexpected(Error::make(std::string(code), std::move(message)));
}

}  // namespace linkdiff

namespace linkdiff::common {

// ============================================================================
// SHA-256 Hash
// ============================================================================

/**
 * Incremental SHA-256 hasher.
 *
 * Feed bytes with update() as many times as needed, then call hex_digest()
 * once. Used directly where a fingerprint is built from several parts.
 */
class Sha256
{
public:
    Sha256();

    void update(std::span<const std::uint8_t> data);
    void update(std::string_view data);

    /// Finish hashing and return the 32-byte digest.
    [[nodiscard]] std::array<std::uint8_t, 32> digest();

    /// Finish hashing and return 64 lowercase hex characters.
    [[nodiscard]] std::string hex_digest();

private:
    void compress();

    std::array<std::uint32_t, 8> m_state;
    std::array<std::uint8_t, 64> m_block;
    std::size_t m_block_len;
    std::uint64_t m_total_len;
};

/**
 * Compute SHA-256 hash of data
 * @param data Input bytes
 * @return Hex-encoded hash string (64 characters)
 */
[[nodiscard]] std::string sha256(std::string_view data);

/**
 * Compute SHA-256 hash of data with prefix
 * @param data Input bytes
 * @return "sha256:" + hex-encoded hash
 */
[[nodiscard]] std::string sha256_prefixed(std::string_view data);

/**
 * Number of non-empty lines in text (N-Quads statement count).
 */
[[nodiscard]] std::size_t count_nonempty_lines(std::string_view text);

}  // namespace linkdiff::common
