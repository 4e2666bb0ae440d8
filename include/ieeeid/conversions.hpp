#pragma once

#include <array>

#include <cstdint>

#include "detail/identifier_base.hpp"
#include "eui.hpp"
#include "mac_block.hpp"
#include "oui.hpp"

namespace ieeeid {

// ============================================================================
// Relabeling between assignment blocks of equal width
// ============================================================================
//
// Each target constructor re-applies its own forced bits, so these are
// idempotent. CompanyId deliberately has no conversions.

[[nodiscard]] constexpr Oui24 to_oui24(const MacBlockLarge& block) noexcept {
    return Oui24(block.bytes());
}

[[nodiscard]] constexpr MacBlockLarge to_ma_l(const Oui24& oui) noexcept {
    return MacBlockLarge(oui.bytes());
}

[[nodiscard]] constexpr Oui36 to_oui36(const MacBlockSmall& block) noexcept {
    return Oui36(block.bytes());
}

[[nodiscard]] constexpr MacBlockSmall to_ma_s(const Oui36& oui) noexcept {
    return MacBlockSmall(oui.bytes());
}

// ============================================================================
// EUI-48 widening (one-directional, no narrowing exists)
// ============================================================================

/**
 * Octets inserted between the OUI and extension halves of an EUI-48 when
 * it is widened to 64 bits.
 */
enum class Eui48Padding : uint8_t {
    mac48 = 0, // FF-FF: encapsulated MAC-48 (historical)
    eui48 = 1  // FF-FE: encapsulated EUI-48
};

constexpr std::array<uint8_t, 2> padding_octets(Eui48Padding padding) noexcept {
    return padding == Eui48Padding::eui48 ? std::array<uint8_t, 2>{0xFF, 0xFE}
                                          : std::array<uint8_t, 2>{0xFF, 0xFF};
}

/**
 * Widen an EUI-48 to an EUI-64.
 *
 * Layout: eui[0..2] | pad[0..1] | eui[3..5]
 */
[[nodiscard]] constexpr Eui64 to_eui64(const Eui48& eui,
                                       Eui48Padding padding = Eui48Padding::mac48) noexcept {
    const auto& b = eui.bytes();
    const auto pad = padding_octets(padding);
    return Eui64(Eui64::bytes_type{b[0], b[1], b[2], pad[0], pad[1], b[3], b[4], b[5]});
}

// ============================================================================
// EUI-64 <-> Modified EUI-64 (RFC 4291 Appendix A)
// ============================================================================

[[nodiscard]] constexpr ModifiedEui64 to_modified_eui64(const Eui64& eui) noexcept {
    return ModifiedEui64(detail::with_inverted_registration(eui.bytes()));
}

[[nodiscard]] constexpr Eui64 to_eui64(const ModifiedEui64& meui) noexcept {
    return Eui64(detail::with_inverted_registration(meui.bytes()));
}

// IPv6 interface identifier from an EUI-48: FF-FE insertion, then inversion
[[nodiscard]] constexpr ModifiedEui64 to_modified_eui64(const Eui48& eui) noexcept {
    return to_modified_eui64(to_eui64(eui, Eui48Padding::eui48));
}

} // namespace ieeeid
