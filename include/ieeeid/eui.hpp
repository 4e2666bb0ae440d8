#pragma once

#include <array>
#include <string_view>

#include <cstddef>
#include <cstdint>

#include "detail/identifier_base.hpp"
#include "mac_block.hpp"
#include "oui.hpp"

namespace ieeeid {

// NOTE: No EUI can be constructed from a CompanyId.

/**
 * 48-bit Extended Unique Identifier (EUI-48), the identifier historically
 * called a MAC address.
 *
 * Raw construction keeps all 48 bits as supplied. Text construction also
 * requires the registration bit to read CLEAR; anything else yields zero().
 *
 * Composite construction from an assignment block plus extension:
 * - Oui24 / MacBlockLarge + 3 octets
 * - MacBlockMedium + nibble + 2 octets
 * - Oui36 / MacBlockSmall + nibble + 1 octet
 *
 * The nibble is merged into the block's reserved tail:
 * (block_last & 0xF0) | (nibble & 0x0F).
 */
class Eui48 : public detail::IdentifierBase<Eui48, 6> {
public:
    static constexpr IdentifierKind kind = IdentifierKind::eui48;
    static constexpr std::size_t bit_length = 48;
    static constexpr RegistrationRule text_registration = RegistrationRule::global;

    constexpr Eui48() noexcept = default;

    constexpr explicit Eui48(const bytes_type& bytes) noexcept : IdentifierBase(bytes) {}

    explicit Eui48(std::string_view text) : Eui48(parse(text).value_or(zero())) {}

    constexpr Eui48(const Oui24& oui, const std::array<uint8_t, 3>& extension) noexcept
        : IdentifierBase(detail::concat<6>(oui.bytes(), extension)) {}

    constexpr Eui48(const Oui36& oui, uint8_t nibble, uint8_t extension) noexcept
        : IdentifierBase(detail::concat_merged<6>(oui.bytes(), nibble,
                                                  std::array<uint8_t, 1>{extension})) {}

    constexpr Eui48(const MacBlockLarge& block, const std::array<uint8_t, 3>& extension) noexcept
        : IdentifierBase(detail::concat<6>(block.bytes(), extension)) {}

    constexpr Eui48(const MacBlockMedium& block, uint8_t nibble,
                    const std::array<uint8_t, 2>& extension) noexcept
        : IdentifierBase(detail::concat_merged<6>(block.bytes(), nibble, extension)) {}

    constexpr Eui48(const MacBlockSmall& block, uint8_t nibble, uint8_t extension) noexcept
        : IdentifierBase(detail::concat_merged<6>(block.bytes(), nibble,
                                                  std::array<uint8_t, 1>{extension})) {}
};

/**
 * 60-bit Extended Unique Identifier (EUI-60).
 *
 * Stored in eight octets; the low nibble of the last octet is outside the
 * identifier and always zero. Only an Oui24 may root a composite EUI-60.
 */
class Eui60 : public detail::IdentifierBase<Eui60, 8> {
public:
    static constexpr IdentifierKind kind = IdentifierKind::eui60;
    static constexpr std::size_t bit_length = 60;
    static constexpr RegistrationRule text_registration = RegistrationRule::any;

    constexpr Eui60() noexcept = default;

    constexpr explicit Eui60(const bytes_type& bytes) noexcept
        : IdentifierBase(detail::without_trailing_nibble(bytes)) {}

    explicit Eui60(std::string_view text) : Eui60(parse(text).value_or(zero())) {}

    // The low nibble of extension[4] is dropped
    constexpr Eui60(const Oui24& oui, const std::array<uint8_t, 5>& extension) noexcept
        : Eui60(detail::concat<8>(oui.bytes(), extension)) {}
};

/**
 * 64-bit Extended Unique Identifier (EUI-64).
 *
 * Raw construction keeps all 64 bits as supplied.
 *
 * Composite construction from an assignment block plus extension:
 * - Oui24 / MacBlockLarge + 5 octets
 * - MacBlockMedium + nibble + 4 octets
 * - Oui36 / MacBlockSmall + nibble + 3 octets
 */
class Eui64 : public detail::IdentifierBase<Eui64, 8> {
public:
    static constexpr IdentifierKind kind = IdentifierKind::eui64;
    static constexpr std::size_t bit_length = 64;
    static constexpr RegistrationRule text_registration = RegistrationRule::any;

    constexpr Eui64() noexcept = default;

    constexpr explicit Eui64(const bytes_type& bytes) noexcept : IdentifierBase(bytes) {}

    explicit Eui64(std::string_view text) : Eui64(parse(text).value_or(zero())) {}

    constexpr Eui64(const Oui24& oui, const std::array<uint8_t, 5>& extension) noexcept
        : IdentifierBase(detail::concat<8>(oui.bytes(), extension)) {}

    constexpr Eui64(const Oui36& oui, uint8_t nibble,
                    const std::array<uint8_t, 3>& extension) noexcept
        : IdentifierBase(detail::concat_merged<8>(oui.bytes(), nibble, extension)) {}

    constexpr Eui64(const MacBlockLarge& block, const std::array<uint8_t, 5>& extension) noexcept
        : IdentifierBase(detail::concat<8>(block.bytes(), extension)) {}

    constexpr Eui64(const MacBlockMedium& block, uint8_t nibble,
                    const std::array<uint8_t, 4>& extension) noexcept
        : IdentifierBase(detail::concat_merged<8>(block.bytes(), nibble, extension)) {}

    constexpr Eui64(const MacBlockSmall& block, uint8_t nibble,
                    const std::array<uint8_t, 3>& extension) noexcept
        : IdentifierBase(detail::concat_merged<8>(block.bytes(), nibble, extension)) {}
};

/**
 * Modified EUI-64 (MEUI-64), as used for IPv6 interface identifiers
 * (RFC 4291 Appendix A).
 *
 * Same layout as an EUI-64 with the registration bit inverted: a
 * globally assigned identifier reads SET. Text construction therefore
 * requires the registration bit SET. Composite construction takes the
 * same block forms as Eui64 and inverts the block's registration bit.
 */
class ModifiedEui64 : public detail::IdentifierBase<ModifiedEui64, 8> {
public:
    static constexpr IdentifierKind kind = IdentifierKind::meui64;
    static constexpr std::size_t bit_length = 64;
    static constexpr RegistrationRule text_registration = RegistrationRule::local;

    constexpr ModifiedEui64() noexcept = default;

    constexpr explicit ModifiedEui64(const bytes_type& bytes) noexcept : IdentifierBase(bytes) {}

    explicit ModifiedEui64(std::string_view text) : ModifiedEui64(parse(text).value_or(zero())) {}

    constexpr ModifiedEui64(const Oui24& oui, const std::array<uint8_t, 5>& extension) noexcept
        : IdentifierBase(
              detail::with_inverted_registration(detail::concat<8>(oui.bytes(), extension))) {}

    constexpr ModifiedEui64(const Oui36& oui, uint8_t nibble,
                            const std::array<uint8_t, 3>& extension) noexcept
        : IdentifierBase(detail::with_inverted_registration(
              detail::concat_merged<8>(oui.bytes(), nibble, extension))) {}

    constexpr ModifiedEui64(const MacBlockLarge& block,
                            const std::array<uint8_t, 5>& extension) noexcept
        : IdentifierBase(
              detail::with_inverted_registration(detail::concat<8>(block.bytes(), extension))) {}

    constexpr ModifiedEui64(const MacBlockMedium& block, uint8_t nibble,
                            const std::array<uint8_t, 4>& extension) noexcept
        : IdentifierBase(detail::with_inverted_registration(
              detail::concat_merged<8>(block.bytes(), nibble, extension))) {}

    constexpr ModifiedEui64(const MacBlockSmall& block, uint8_t nibble,
                            const std::array<uint8_t, 3>& extension) noexcept
        : IdentifierBase(detail::with_inverted_registration(
              detail::concat_merged<8>(block.bytes(), nibble, extension))) {}
};

using Meui64 = ModifiedEui64;

} // namespace ieeeid
