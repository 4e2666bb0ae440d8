#pragma once

#include <string_view>

#include <cstddef>
#include <cstdint>

#include "detail/identifier_base.hpp"

namespace ieeeid {

/**
 * 24-bit Organizationally Unique Identifier (OUI-24).
 *
 * Every OUI the IEEE RA assigns has the M and X bits clear, so an EUI built
 * from one is a globally unique unicast identifier. Though the same size as
 * a Company ID, an OUI-24 is a different thing and cannot be converted to
 * one. It can be relabeled as an MA-L (see conversions.hpp).
 *
 * The registration bit is forced CLEAR by every constructor.
 */
class Oui24 : public detail::IdentifierBase<Oui24, 3> {
public:
    static constexpr IdentifierKind kind = IdentifierKind::oui24;
    static constexpr std::size_t bit_length = 24;
    static constexpr RegistrationRule text_registration = RegistrationRule::any;

    constexpr Oui24() noexcept = default;

    constexpr explicit Oui24(const bytes_type& bytes) noexcept
        : IdentifierBase(detail::with_registration(bytes, Registration::global)) {}

    explicit Oui24(std::string_view text) : Oui24(parse(text).value_or(zero())) {}
};

/**
 * 36-bit Organizationally Unique Identifier (OUI-36).
 *
 * Stored in five octets; the low nibble of the fifth octet is outside the
 * assignment and always zero. The registration bit is forced CLEAR.
 */
class Oui36 : public detail::IdentifierBase<Oui36, 5> {
public:
    static constexpr IdentifierKind kind = IdentifierKind::oui36;
    static constexpr std::size_t bit_length = 36;
    static constexpr RegistrationRule text_registration = RegistrationRule::any;

    constexpr Oui36() noexcept = default;

    constexpr explicit Oui36(const bytes_type& bytes) noexcept
        : IdentifierBase(detail::without_trailing_nibble(
              detail::with_registration(bytes, Registration::global))) {}

    explicit Oui36(std::string_view text) : Oui36(parse(text).value_or(zero())) {}
};

} // namespace ieeeid
