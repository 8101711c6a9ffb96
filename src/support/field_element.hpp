//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/field_element.hpp
// Purpose: Declare the prime-field element used for witness and VM values.
// Key invariants: The stored bytes are always the canonical big-endian encoding
//                 of a value strictly below the BN254 scalar field modulus.
// Ownership/Lifetime: Value type; arithmetic borrows OpenSSL BIGNUM scratch
//                     objects for the duration of a single operation.
// Links: circuit/Witness.hpp, ucvm/Vm.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace strata::support
{

/// @brief Element of the BN254 scalar field.
/// @details Comparison operators order elements by their integer
///          representative in [0, p), which is what the unconstrained VM's
///          integer comparisons rely on.
class FieldElement
{
  public:
    /// @brief Width of the canonical big-endian encoding in bytes.
    static constexpr std::size_t kByteWidth = 32;

    using Bytes = std::array<uint8_t, kByteWidth>;

    /// @brief Construct the zero element.
    FieldElement() = default;

    /// @brief Construct the element representing @p value.
    static FieldElement fromU64(uint64_t value);

    /// @brief Reduce an arbitrary 32-byte big-endian integer modulo p.
    static FieldElement fromBytes(const Bytes &bytes);

    /// @brief Parse decimal or 0x-prefixed hexadecimal text.
    /// @details A leading '-' negates the value.  Values at or above the
    ///          modulus are reduced.  Surrounding whitespace is ignored.
    /// @return Parsed element, or std::nullopt when @p text is malformed.
    static std::optional<FieldElement> fromString(std::string_view text);

    static FieldElement zero()
    {
        return FieldElement();
    }

    static FieldElement one()
    {
        return fromU64(1);
    }

    /// @brief Decimal rendering of the modulus.
    static std::string_view modulusString();

    [[nodiscard]] bool isZero() const;

    [[nodiscard]] bool isOne() const;

    /// @brief Return the value when it fits in 64 bits.
    [[nodiscard]] std::optional<uint64_t> toU64() const;

    /// @brief Number of significant bits of the integer representative.
    [[nodiscard]] unsigned bitWidth() const;

    /// @brief Decimal rendering.
    [[nodiscard]] std::string toString() const;

    /// @brief Hexadecimal rendering with 0x prefix and no leading zeros.
    [[nodiscard]] std::string toHex() const;

    /// @brief Canonical big-endian bytes.
    const Bytes &bytes() const
    {
        return bytes_;
    }

    FieldElement operator+(const FieldElement &rhs) const;
    FieldElement operator-(const FieldElement &rhs) const;
    FieldElement operator*(const FieldElement &rhs) const;
    FieldElement operator-() const;

    /// @brief Multiplicative inverse; std::nullopt for zero.
    [[nodiscard]] std::optional<FieldElement> inverse() const;

    /// @brief Field division; std::nullopt when @p rhs is zero.
    [[nodiscard]] std::optional<FieldElement> divide(const FieldElement &rhs) const;

    /// @brief Truncating division of the integer representatives.
    /// @return Quotient, or std::nullopt when @p rhs is zero.
    [[nodiscard]] std::optional<FieldElement> integerDivide(const FieldElement &rhs) const;

    bool operator==(const FieldElement &rhs) const
    {
        return bytes_ == rhs.bytes_;
    }

    bool operator!=(const FieldElement &rhs) const
    {
        return bytes_ != rhs.bytes_;
    }

    bool operator<(const FieldElement &rhs) const
    {
        return bytes_ < rhs.bytes_;
    }

    bool operator<=(const FieldElement &rhs) const
    {
        return bytes_ <= rhs.bytes_;
    }

  private:
    /// @brief Adopt bytes already known to be canonical.
    static FieldElement fromCanonical(const Bytes &bytes);

    Bytes bytes_{};
};

std::ostream &operator<<(std::ostream &os, const FieldElement &value);

} // namespace strata::support
