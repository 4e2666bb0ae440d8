#pragma once

#include <array>
#include <string_view>

#include <cstddef>
#include <cstdint>

#include "detail/identifier_base.hpp"
#include "mac_block.hpp"
#include "oui.hpp"

namespace ieeeid {

/**
 * 32-bit Context Dependent Identifier (CDI-32).
 *
 * An OUI-24 (or MA-L) followed by an 8-bit extension. Its meaning is
 * fixed by the protocol that carries it. The registration bit is forced
 * CLEAR on raw construction and must read CLEAR for text construction.
 */
class Cdi32 : public detail::IdentifierBase<Cdi32, 4> {
public:
    static constexpr IdentifierKind kind = IdentifierKind::cdi32;
    static constexpr std::size_t bit_length = 32;
    static constexpr RegistrationRule text_registration = RegistrationRule::global;

    constexpr Cdi32() noexcept = default;

    constexpr explicit Cdi32(const bytes_type& bytes) noexcept
        : IdentifierBase(detail::with_registration(bytes, Registration::global)) {}

    explicit Cdi32(std::string_view text) : Cdi32(parse(text).value_or(zero())) {}

    constexpr Cdi32(const Oui24& oui, uint8_t extension) noexcept
        : Cdi32(detail::concat<4>(oui.bytes(), std::array<uint8_t, 1>{extension})) {}

    constexpr Cdi32(const MacBlockLarge& block, uint8_t extension) noexcept
        : Cdi32(detail::concat<4>(block.bytes(), std::array<uint8_t, 1>{extension})) {}
};

/**
 * 40-bit Context Dependent Identifier (CDI-40).
 *
 * Either an OUI-24 followed by a 16-bit extension, or an OUI-36 whose
 * reserved tail nibble carries a 4-bit extension. The registration bit
 * is forced CLEAR on raw construction and must read CLEAR for text
 * construction.
 */
class Cdi40 : public detail::IdentifierBase<Cdi40, 5> {
public:
    static constexpr IdentifierKind kind = IdentifierKind::cdi40;
    static constexpr std::size_t bit_length = 40;
    static constexpr RegistrationRule text_registration = RegistrationRule::global;

    constexpr Cdi40() noexcept = default;

    constexpr explicit Cdi40(const bytes_type& bytes) noexcept
        : IdentifierBase(detail::with_registration(bytes, Registration::global)) {}

    explicit Cdi40(std::string_view text) : Cdi40(parse(text).value_or(zero())) {}

    constexpr Cdi40(const Oui24& oui, const std::array<uint8_t, 2>& extension) noexcept
        : Cdi40(detail::concat<5>(oui.bytes(), extension)) {}

    constexpr Cdi40(const Oui36& oui, uint8_t nibble) noexcept
        : Cdi40(detail::concat_merged<5>(oui.bytes(), nibble, std::array<uint8_t, 0>{})) {}
};

} // namespace ieeeid
