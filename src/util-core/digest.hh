#pragma once

#include <util-core/fixed_array.hh>
#include <util-core/fwd.hh>
#include <util-core/span.hh>

#include <iosfwd>
#include <stdexcept>
#include <string>
#include <string_view>

// =========================================================================================================
// Content digests
// =========================================================================================================
//
// Algorithms:
//   sha256                                 - incremental SHA-256 (FIPS 180-4), 32 byte digest
//   md5                                    - incremental MD5 (RFC 1321), 16 byte digest
//
// Both are computed by OpenSSL (libcrypto, EVP interface).
//
// One-shot raw digests:
//   compute_sha256(bytes) / compute_md5(bytes)
//   compute_sha256(stream) / compute_md5(stream)
//
// Lower-case hex digests (64 / 32 characters):
//   sha256_hex(text) / md5_hex(text)       - over the UTF-8 bytes of text, no BOM
//   sha256_hex(stream) / md5_hex(stream)   - over the whole stream, see below
//   to_hex(bytes)                          - two lower-case hex characters per byte, no separators
//
// Stream digests are non-destructive with respect to the read position:
// the stream is rewound to offset 0, read to its end, and rewound to offset 0 again.
// This requires a seekable stream. A stream that cannot seek (or fails while reading)
// raises uc::io_error; nothing else in this header throws.
// The stream's exceptions() mask is ignored while digesting and restored afterwards.
//
// Every call constructs its own hasher; there is no shared hashing state between calls.
//

namespace uc
{
using sha256_digest = fixed_array<u8, 32>;
using md5_digest = fixed_array<u8, 16>;

/// Raised when a stream cannot be repositioned or read.
/// Callers can catch it to fall back to a non-seekable strategy or to report the failure.
struct io_error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};
} // namespace uc

// OpenSSL's EVP_MD_CTX, kept out of every util-core header
struct evp_md_ctx_st;

namespace uc::impl
{
enum class digest_algorithm
{
    sha256,
    md5,
};

/// Owns one OpenSSL message digest context.
/// Movable, not copyable. A moved-from context must not be used anymore.
struct digest_context
{
    explicit digest_context(digest_algorithm algorithm);
    ~digest_context();

    digest_context(digest_context&& rhs) noexcept;
    digest_context& operator=(digest_context&& rhs) noexcept;
    digest_context(digest_context const&) = delete;
    digest_context& operator=(digest_context const&) = delete;

    void update(span<u8 const> bytes);

    /// Writes the digest to out, which must be exactly the digest size.
    void finalize(span<u8> out);

private:
    evp_md_ctx_st* _ctx = nullptr;
    bool _finalized = false;
};
} // namespace uc::impl

/// Incremental SHA-256.
/// Feed data with update() in as many pieces as needed, then call finalize() exactly once.
/// Usage:
///   uc::sha256 h;
///   h.update(header_bytes);
///   h.update(payload_bytes);
///   uc::sha256_digest d = h.finalize();
struct uc::sha256
{
    static constexpr isize digest_size = 32;

    sha256();

    void update(span<u8 const> bytes) { _context.update(bytes); }
    void update(std::string_view text);

    /// Applies the final padding and returns the digest.
    /// Precondition: finalize() has not been called before.
    [[nodiscard]] sha256_digest finalize();

private:
    impl::digest_context _context;
};

/// Incremental MD5.
/// Same protocol as uc::sha256. MD5 is kept for content identity and compatibility only.
struct uc::md5
{
    static constexpr isize digest_size = 16;

    md5();

    void update(span<u8 const> bytes) { _context.update(bytes); }
    void update(std::string_view text);

    /// Precondition: finalize() has not been called before.
    [[nodiscard]] md5_digest finalize();

private:
    impl::digest_context _context;
};

namespace uc
{
// raw digests

[[nodiscard]] sha256_digest compute_sha256(span<u8 const> bytes);
[[nodiscard]] md5_digest compute_md5(span<u8 const> bytes);

/// Throws uc::io_error if the stream cannot be rewound or read.
[[nodiscard]] sha256_digest compute_sha256(std::istream& stream);
/// Throws uc::io_error if the stream cannot be rewound or read.
[[nodiscard]] md5_digest compute_md5(std::istream& stream);

// hex digests

[[nodiscard]] std::string sha256_hex(std::string_view text);
[[nodiscard]] std::string sha256_hex(std::u8string_view text);
[[nodiscard]] std::string sha256_hex(std::istream& stream);

[[nodiscard]] std::string md5_hex(std::string_view text);
[[nodiscard]] std::string md5_hex(std::u8string_view text);
[[nodiscard]] std::string md5_hex(std::istream& stream);

// formatting

/// Renders bytes as lower-case hex, two characters per byte, no separators or prefix.
[[nodiscard]] std::string to_hex(span<u8 const> bytes);

template <isize N>
[[nodiscard]] std::string to_hex(fixed_array<u8, N> const& bytes)
{
    return to_hex(span<u8 const>(bytes));
}
} // namespace uc
