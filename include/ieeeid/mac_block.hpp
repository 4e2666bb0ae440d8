#pragma once

#include <string_view>

#include <cstddef>
#include <cstdint>

#include "detail/identifier_base.hpp"

namespace ieeeid {

// NOTE: The first 24 bits of every MA-M and MA-S are an OUI assigned to the
// IEEE RA itself.

/**
 * MAC address block, large (MA-L): 24-bit assignment.
 *
 * Leaves 24 bits of an EUI-48 (40 of an EUI-64) for the assignee. Shares
 * the numeric space of OUI-24 and may be relabeled as one; it is never a
 * Company ID. The registration bit is forced CLEAR.
 */
class MacBlockLarge : public detail::IdentifierBase<MacBlockLarge, 3> {
public:
    static constexpr IdentifierKind kind = IdentifierKind::ma_l;
    static constexpr std::size_t bit_length = 24;
    static constexpr RegistrationRule text_registration = RegistrationRule::any;

    constexpr MacBlockLarge() noexcept = default;

    constexpr explicit MacBlockLarge(const bytes_type& bytes) noexcept
        : IdentifierBase(detail::with_registration(bytes, Registration::global)) {}

    explicit MacBlockLarge(std::string_view text) : MacBlockLarge(parse(text).value_or(zero())) {}
};

/**
 * MAC address block, medium (MA-M): 28-bit assignment.
 *
 * Stored in four octets with the low nibble of the fourth octet zero.
 * The registration bit is forced CLEAR.
 */
class MacBlockMedium : public detail::IdentifierBase<MacBlockMedium, 4> {
public:
    static constexpr IdentifierKind kind = IdentifierKind::ma_m;
    static constexpr std::size_t bit_length = 28;
    static constexpr RegistrationRule text_registration = RegistrationRule::any;

    constexpr MacBlockMedium() noexcept = default;

    constexpr explicit MacBlockMedium(const bytes_type& bytes) noexcept
        : IdentifierBase(detail::without_trailing_nibble(
              detail::with_registration(bytes, Registration::global))) {}

    explicit MacBlockMedium(std::string_view text)
        : MacBlockMedium(parse(text).value_or(zero())) {}
};

/**
 * MAC address block, small (MA-S): 36-bit assignment.
 *
 * Stored in five octets with the low nibble of the fifth octet zero.
 * Shares the numeric space of OUI-36 and may be relabeled as one.
 * The registration bit is forced CLEAR.
 */
class MacBlockSmall : public detail::IdentifierBase<MacBlockSmall, 5> {
public:
    static constexpr IdentifierKind kind = IdentifierKind::ma_s;
    static constexpr std::size_t bit_length = 36;
    static constexpr RegistrationRule text_registration = RegistrationRule::any;

    constexpr MacBlockSmall() noexcept = default;

    constexpr explicit MacBlockSmall(const bytes_type& bytes) noexcept
        : IdentifierBase(detail::without_trailing_nibble(
              detail::with_registration(bytes, Registration::global))) {}

    explicit MacBlockSmall(std::string_view text) : MacBlockSmall(parse(text).value_or(zero())) {}
};

using MaL = MacBlockLarge;
using MaM = MacBlockMedium;
using MaS = MacBlockSmall;

} // namespace ieeeid
