#pragma once

#include <cstddef>
#include <cstdint>

namespace ieeeid {

// Identifier kinds defined by the IEEE Registration Authority
enum class IdentifierKind : uint8_t {
    company_id = 0, // Company ID (CID), 24 bits, locally administered
    oui24 = 1,      // Organizationally Unique Identifier, 24 bits
    oui36 = 2,      // Organizationally Unique Identifier, 36 bits
    ma_l = 3,       // MAC address block, large (24-bit assignment)
    ma_m = 4,       // MAC address block, medium (28-bit assignment)
    ma_s = 5,       // MAC address block, small (36-bit assignment)
    eui48 = 6,      // Extended Unique Identifier, 48 bits
    eui60 = 7,      // Extended Unique Identifier, 60 bits
    eui64 = 8,      // Extended Unique Identifier, 64 bits
    meui64 = 9,     // Modified EUI-64 (inverted registration convention)
    cdi32 = 10,     // Context Dependent Identifier, 32 bits
    cdi40 = 11      // Context Dependent Identifier, 40 bits
};

// Broadcast scope (bit 0 of the first octet, the I/G or M bit)
enum class BroadcastScope : uint8_t {
    unicast = 0x00,
    multicast = 0x01
};

// Registration (bit 1 of the first octet, the U/L or X bit)
enum class Registration : uint8_t {
    global = 0x00,
    local = 0x02
};

// Control bit masks within the first octet
inline constexpr uint8_t broadcast_scope_mask = 0x01;
inline constexpr uint8_t registration_mask = 0x02;

// Reserved low nibble of the last octet for 28/36/60-bit identifiers
inline constexpr uint8_t trailing_nibble_mask = 0x0F;
inline constexpr uint8_t leading_nibble_mask = 0xF0;

// Shortest sequence is_valid() accepts
inline constexpr size_t min_valid_bytes = 3;

// Longest canonical text form for an identifier of `bytes` octets:
// two hex digits per octet plus one delimiter between octets
constexpr size_t max_text_length(size_t bytes) noexcept {
    return bytes == 0 ? 0 : bytes * 3 - 1;
}

// Human-readable kind name
constexpr const char* identifier_kind_string(IdentifierKind kind) noexcept {
    switch (kind) {
        case IdentifierKind::company_id:
            return "CID";
        case IdentifierKind::oui24:
            return "OUI-24";
        case IdentifierKind::oui36:
            return "OUI-36";
        case IdentifierKind::ma_l:
            return "MA-L";
        case IdentifierKind::ma_m:
            return "MA-M";
        case IdentifierKind::ma_s:
            return "MA-S";
        case IdentifierKind::eui48:
            return "EUI-48";
        case IdentifierKind::eui60:
            return "EUI-60";
        case IdentifierKind::eui64:
            return "EUI-64";
        case IdentifierKind::meui64:
            return "MEUI-64";
        case IdentifierKind::cdi32:
            return "CDI-32";
        case IdentifierKind::cdi40:
            return "CDI-40";
        default:
            return "Unknown";
    }
}

} // namespace ieeeid
