//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements BN254 scalar field arithmetic on top of OpenSSL's BIGNUM.  Values
// are kept in a canonical 32-byte big-endian encoding so they can be compared,
// copied and stored in ordered containers without touching OpenSSL; BIGNUM
// temporaries only live for the duration of one arithmetic operation.
//
//===----------------------------------------------------------------------===//

#include "support/field_element.hpp"

#include <openssl/bn.h>
#include <openssl/crypto.h>

#include <cctype>
#include <memory>
#include <new>
#include <stdexcept>

namespace strata::support
{
namespace
{
constexpr const char kModulusDecimal[] =
    "21888242871839275222246405745257275088548364400416034343698204186575808495617";

struct BignumDeleter
{
    void operator()(BIGNUM *bn) const
    {
        BN_free(bn);
    }
};

struct BignumCtxDeleter
{
    void operator()(BN_CTX *ctx) const
    {
        BN_CTX_free(ctx);
    }
};

using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;
using BignumCtxPtr = std::unique_ptr<BN_CTX, BignumCtxDeleter>;

BignumPtr newBignum()
{
    BignumPtr bn(BN_new());
    if (!bn)
        throw std::bad_alloc();
    return bn;
}

BignumCtxPtr newCtx()
{
    BignumCtxPtr ctx(BN_CTX_new());
    if (!ctx)
        throw std::bad_alloc();
    return ctx;
}

/// @brief Lazily parsed modulus shared by every operation.
const BIGNUM *modulus()
{
    static const BignumPtr p = [] {
        BIGNUM *raw = nullptr;
        if (BN_dec2bn(&raw, kModulusDecimal) == 0)
            throw std::runtime_error("failed to initialise field modulus");
        return BignumPtr(raw);
    }();
    return p.get();
}

BignumPtr toBignum(const FieldElement::Bytes &bytes)
{
    BignumPtr bn(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr));
    if (!bn)
        throw std::bad_alloc();
    return bn;
}

/// @brief Encode a reduced BIGNUM as canonical bytes.
FieldElement::Bytes toBytes(const BIGNUM *bn)
{
    FieldElement::Bytes out{};
    if (BN_bn2binpad(bn, out.data(), static_cast<int>(out.size())) < 0)
        throw std::runtime_error("field element does not fit in 32 bytes");
    return out;
}

/// @brief Reduce @p bn into [0, p) in place.
void reduce(BIGNUM *bn, BN_CTX *ctx)
{
    BignumPtr tmp = newBignum();
    if (BN_nnmod(tmp.get(), bn, modulus(), ctx) == 0 || BN_copy(bn, tmp.get()) == nullptr)
        throw std::runtime_error("BIGNUM reduction failed");
}

using ModBinaryOp = int (*)(BIGNUM *, const BIGNUM *, const BIGNUM *, const BIGNUM *, BN_CTX *);

FieldElement::Bytes applyMod(const FieldElement::Bytes &lhs,
                             const FieldElement::Bytes &rhs,
                             ModBinaryOp op)
{
    BignumCtxPtr ctx = newCtx();
    BignumPtr a = toBignum(lhs);
    BignumPtr b = toBignum(rhs);
    BignumPtr r = newBignum();
    if (op(r.get(), a.get(), b.get(), modulus(), ctx.get()) == 0)
        throw std::runtime_error("BIGNUM modular arithmetic failed");
    return toBytes(r.get());
}

std::string_view trim(std::string_view text)
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);
    return text;
}
} // namespace

FieldElement FieldElement::fromCanonical(const Bytes &bytes)
{
    FieldElement f;
    f.bytes_ = bytes;
    return f;
}

FieldElement FieldElement::fromU64(uint64_t value)
{
    Bytes bytes{};
    for (size_t i = 0; i < 8; ++i)
        bytes[kByteWidth - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
    return fromCanonical(bytes);
}

FieldElement FieldElement::fromBytes(const Bytes &bytes)
{
    BignumCtxPtr ctx = newCtx();
    BignumPtr bn = toBignum(bytes);
    reduce(bn.get(), ctx.get());
    return fromCanonical(toBytes(bn.get()));
}

/// @brief Parse a field literal.
///
/// @details Decimal and 0x-prefixed hexadecimal inputs are accepted.  The
///          parser rejects empty digit strings and trailing garbage by
///          checking that OpenSSL consumed every character.
std::optional<FieldElement> FieldElement::fromString(std::string_view text)
{
    text = trim(text);
    bool negate = false;
    if (!text.empty() && text.front() == '-')
    {
        negate = true;
        text.remove_prefix(1);
    }
    bool hex = text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X');
    if (hex)
        text.remove_prefix(2);
    if (text.empty())
        return std::nullopt;
    for (char c : text)
    {
        const auto uc = static_cast<unsigned char>(c);
        if (hex ? !std::isxdigit(uc) : !std::isdigit(uc))
            return std::nullopt;
    }

    std::string digits(text);
    BIGNUM *raw = nullptr;
    int consumed = hex ? BN_hex2bn(&raw, digits.c_str()) : BN_dec2bn(&raw, digits.c_str());
    BignumPtr bn(raw);
    if (!bn || consumed != static_cast<int>(digits.size()))
        return std::nullopt;

    BignumCtxPtr ctx = newCtx();
    reduce(bn.get(), ctx.get());
    FieldElement value = fromCanonical(toBytes(bn.get()));
    return negate ? -value : value;
}

std::string_view FieldElement::modulusString()
{
    return kModulusDecimal;
}

bool FieldElement::isZero() const
{
    for (uint8_t b : bytes_)
        if (b != 0)
            return false;
    return true;
}

bool FieldElement::isOne() const
{
    return *this == one();
}

std::optional<uint64_t> FieldElement::toU64() const
{
    if (bitWidth() > 64)
        return std::nullopt;
    uint64_t value = 0;
    for (size_t i = kByteWidth - 8; i < kByteWidth; ++i)
        value = (value << 8) | bytes_[i];
    return value;
}

unsigned FieldElement::bitWidth() const
{
    for (size_t i = 0; i < kByteWidth; ++i)
    {
        if (bytes_[i] == 0)
            continue;
        unsigned width = static_cast<unsigned>((kByteWidth - i) * 8);
        for (uint8_t mask = 0x80; (bytes_[i] & mask) == 0; mask >>= 1)
            --width;
        return width;
    }
    return 0;
}

std::string FieldElement::toString() const
{
    if (auto small = toU64())
        return std::to_string(*small);
    BignumPtr bn = toBignum(bytes_);
    char *raw = BN_bn2dec(bn.get());
    if (!raw)
        throw std::bad_alloc();
    std::string text(raw);
    OPENSSL_free(raw);
    return text;
}

std::string FieldElement::toHex() const
{
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string text = "0x";
    bool leading = true;
    for (uint8_t b : bytes_)
    {
        for (int shift : {4, 0})
        {
            int nibble = (b >> shift) & 0xF;
            if (leading && nibble == 0)
                continue;
            leading = false;
            text.push_back(kDigits[nibble]);
        }
    }
    if (leading)
        text.push_back('0');
    return text;
}

FieldElement FieldElement::operator+(const FieldElement &rhs) const
{
    return fromCanonical(applyMod(bytes_, rhs.bytes_, BN_mod_add));
}

FieldElement FieldElement::operator-(const FieldElement &rhs) const
{
    return fromCanonical(applyMod(bytes_, rhs.bytes_, BN_mod_sub));
}

FieldElement FieldElement::operator*(const FieldElement &rhs) const
{
    return fromCanonical(applyMod(bytes_, rhs.bytes_, BN_mod_mul));
}

FieldElement FieldElement::operator-() const
{
    return zero() - *this;
}

std::optional<FieldElement> FieldElement::inverse() const
{
    if (isZero())
        return std::nullopt;
    BignumCtxPtr ctx = newCtx();
    BignumPtr a = toBignum(bytes_);
    BignumPtr r = newBignum();
    if (BN_mod_inverse(r.get(), a.get(), modulus(), ctx.get()) == nullptr)
        throw std::runtime_error("BIGNUM modular inverse failed");
    return fromCanonical(toBytes(r.get()));
}

std::optional<FieldElement> FieldElement::divide(const FieldElement &rhs) const
{
    std::optional<FieldElement> inv = rhs.inverse();
    if (!inv)
        return std::nullopt;
    return *this * *inv;
}

std::optional<FieldElement> FieldElement::integerDivide(const FieldElement &rhs) const
{
    if (rhs.isZero())
        return std::nullopt;
    BignumCtxPtr ctx = newCtx();
    BignumPtr a = toBignum(bytes_);
    BignumPtr b = toBignum(rhs.bytes_);
    BignumPtr q = newBignum();
    if (BN_div(q.get(), nullptr, a.get(), b.get(), ctx.get()) == 0)
        throw std::runtime_error("BIGNUM division failed");
    return fromCanonical(toBytes(q.get()));
}

std::ostream &operator<<(std::ostream &os, const FieldElement &value)
{
    return os << value.toString();
}

} // namespace strata::support
