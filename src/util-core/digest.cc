#include "digest.hh"

#include <util-core/assert.hh>
#include <util-core/utility.hh>

#include <openssl/evp.h>

#include <istream>

namespace
{
using uc::isize;
using uc::u8;

uc::span<u8 const> text_bytes(std::string_view text)
{
    return uc::span<u8 const>(reinterpret_cast<u8 const*>(text.data()), isize(text.size()));
}

uc::span<u8 const> text_bytes(std::u8string_view text)
{
    return uc::span<u8 const>(reinterpret_cast<u8 const*>(text.data()), isize(text.size()));
}

EVP_MD const* message_digest(uc::impl::digest_algorithm algorithm)
{
    switch (algorithm)
    {
    case uc::impl::digest_algorithm::sha256:
        return EVP_sha256();
    case uc::impl::digest_algorithm::md5:
        return EVP_md5();
    }
    return nullptr;
}

void rewind_stream(std::istream& stream)
{
    // a failed or exhausted stream refuses to seek, so the state has to go first
    stream.clear();
    stream.seekg(0, std::ios_base::beg);
    if (stream.fail())
        throw uc::io_error("cannot rewind stream: stream does not support seeking");
}

// turns stream exceptions off while a digest reads, reaching eof sets failbit
struct exception_mask_guard
{
    explicit exception_mask_guard(std::istream& stream) : _stream(stream), _saved(stream.exceptions())
    {
        stream.exceptions(std::ios_base::goodbit);
    }

    ~exception_mask_guard()
    {
        try
        {
            _stream.exceptions(_saved);
        }
        catch (std::ios_base::failure const&)
        {
            // the mask is restored before clear() throws, and the io_error in flight already reports the failure
        }
    }

    exception_mask_guard(exception_mask_guard const&) = delete;
    exception_mask_guard& operator=(exception_mask_guard const&) = delete;

private:
    std::istream& _stream;
    std::ios_base::iostate _saved;
};

template <class Hasher>
auto digest_stream(std::istream& stream)
{
    exception_mask_guard guard(stream);
    rewind_stream(stream);

    Hasher hasher;
    char chunk[4096];
    while (stream)
    {
        stream.read(chunk, sizeof(chunk));
        if (stream.gcount() > 0)
            hasher.update(uc::span<u8 const>(reinterpret_cast<u8 const*>(chunk), isize(stream.gcount())));
    }

    if (stream.bad())
        throw uc::io_error("cannot digest stream: read failed");

    rewind_stream(stream);
    return hasher.finalize();
}
} // namespace

//
// digest_context
//

uc::impl::digest_context::digest_context(digest_algorithm algorithm)
{
    auto const* md = message_digest(algorithm);
    UC_ASSERT_ALWAYS(md != nullptr, "unknown digest algorithm");

    // failing here means libcrypto is out of memory or the algorithm is disabled by the provider
    _ctx = EVP_MD_CTX_new();
    UC_ASSERT_ALWAYS(_ctx != nullptr, "cannot allocate digest context");
    UC_ASSERT_ALWAYS(EVP_DigestInit_ex(_ctx, md, nullptr) == 1, "cannot initialize digest");
}

uc::impl::digest_context::~digest_context()
{
    if (_ctx)
        EVP_MD_CTX_free(_ctx);
}

uc::impl::digest_context::digest_context(digest_context&& rhs) noexcept
  : _ctx(uc::exchange(rhs._ctx, nullptr)), _finalized(rhs._finalized)
{
}

uc::impl::digest_context& uc::impl::digest_context::operator=(digest_context&& rhs) noexcept
{
    if (this != &rhs)
    {
        if (_ctx)
            EVP_MD_CTX_free(_ctx);
        _ctx = uc::exchange(rhs._ctx, nullptr);
        _finalized = rhs._finalized;
    }
    return *this;
}

void uc::impl::digest_context::update(span<u8 const> bytes)
{
    UC_ASSERT(_ctx != nullptr, "digest context was moved from");
    UC_ASSERT(!_finalized, "digest updated after finalize");

    if (bytes.empty())
        return;

    UC_ASSERT_ALWAYS(EVP_DigestUpdate(_ctx, bytes.data(), std::size_t(bytes.size())) == 1, "digest update failed");
}

void uc::impl::digest_context::finalize(span<u8> out)
{
    UC_ASSERT(_ctx != nullptr, "digest context was moved from");
    UC_ASSERT_ALWAYS(!_finalized, "digest finalized twice");
    _finalized = true;

    unsigned char buffer[EVP_MAX_MD_SIZE];
    unsigned int size = 0;
    UC_ASSERT_ALWAYS(EVP_DigestFinal_ex(_ctx, buffer, &size) == 1, "digest finalize failed");
    UC_ASSERT(isize(size) == out.size(), "digest size mismatch");

    for (isize i = 0; i < out.size(); ++i)
        out[i] = buffer[i];
}

//
// sha256 / md5
//

uc::sha256::sha256() : _context(impl::digest_algorithm::sha256) {}

void uc::sha256::update(std::string_view text)
{
    _context.update(text_bytes(text));
}

uc::sha256_digest uc::sha256::finalize()
{
    sha256_digest digest;
    _context.finalize(span<u8>(digest));
    return digest;
}

uc::md5::md5() : _context(impl::digest_algorithm::md5) {}

void uc::md5::update(std::string_view text)
{
    _context.update(text_bytes(text));
}

uc::md5_digest uc::md5::finalize()
{
    md5_digest digest;
    _context.finalize(span<u8>(digest));
    return digest;
}

//
// free functions
//

uc::sha256_digest uc::compute_sha256(span<u8 const> bytes)
{
    sha256 hasher;
    hasher.update(bytes);
    return hasher.finalize();
}

uc::md5_digest uc::compute_md5(span<u8 const> bytes)
{
    md5 hasher;
    hasher.update(bytes);
    return hasher.finalize();
}

uc::sha256_digest uc::compute_sha256(std::istream& stream)
{
    return digest_stream<sha256>(stream);
}

uc::md5_digest uc::compute_md5(std::istream& stream)
{
    return digest_stream<md5>(stream);
}

std::string uc::sha256_hex(std::string_view text)
{
    return to_hex(compute_sha256(text_bytes(text)));
}

std::string uc::sha256_hex(std::u8string_view text)
{
    return to_hex(compute_sha256(text_bytes(text)));
}

std::string uc::sha256_hex(std::istream& stream)
{
    return to_hex(compute_sha256(stream));
}

std::string uc::md5_hex(std::string_view text)
{
    return to_hex(compute_md5(text_bytes(text)));
}

std::string uc::md5_hex(std::u8string_view text)
{
    return to_hex(compute_md5(text_bytes(text)));
}

std::string uc::md5_hex(std::istream& stream)
{
    return to_hex(compute_md5(stream));
}

std::string uc::to_hex(span<u8 const> bytes)
{
    static constexpr char digits[] = "0123456789abcdef";

    std::string out;
    out.resize(std::size_t(bytes.size() * 2));
    for (isize i = 0; i < bytes.size(); ++i)
    {
        out[std::size_t(2 * i)] = digits[bytes[i] >> 4];
        out[std::size_t(2 * i + 1)] = digits[bytes[i] & 0xF];
    }
    return out;
}
