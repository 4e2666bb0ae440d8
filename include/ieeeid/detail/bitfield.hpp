#pragma once

#include <array>
#include <concepts>
#include <type_traits>

#include <cstddef>
#include <cstdint>

namespace ieeeid::detail {

template <typename T>
concept UnsignedIntegral =
    std::unsigned_integral<T> && (std::same_as<T, uint8_t> || std::same_as<T, uint16_t> ||
                                  std::same_as<T, uint32_t> || std::same_as<T, uint64_t>);

// Mask of Width low bits without UB shift on full-width fields
template <typename StorageType, std::size_t Width>
constexpr StorageType calculate_mask() noexcept {
    if constexpr (Width == sizeof(StorageType) * 8) {
        return static_cast<StorageType>(~StorageType{0});
    } else {
        return static_cast<StorageType>((StorageType{1} << Width) - 1);
    }
}

// BitField: Compile-time metadata for a field inside one octet (or word)
template <typename StorageType, std::size_t Offset, std::size_t Width>
struct BitField {
    static_assert(UnsignedIntegral<StorageType>,
                  "BitField storage type must be an unsigned integral type");
    static_assert(Width > 0 && Width <= sizeof(StorageType) * 8,
                  "BitField width must be between 1 and storage type bit width");
    static_assert(Offset + Width <= sizeof(StorageType) * 8,
                  "BitField extends beyond storage type boundary");

    using storage_type = StorageType;
    using value_type = std::conditional_t<Width == 1, bool, StorageType>;

    static constexpr std::size_t offset = Offset;
    static constexpr std::size_t width = Width;
    static constexpr StorageType mask = calculate_mask<StorageType, Width>();

    // Mask positioned at the field's offset
    static constexpr StorageType placed_mask = static_cast<StorageType>(mask << offset);

    static constexpr value_type extract(StorageType word) noexcept {
        if constexpr (Width == 1) {
            return ((word >> offset) & 1) != 0;
        } else {
            return static_cast<value_type>((word >> offset) & mask);
        }
    }

    static constexpr StorageType insert(StorageType word, value_type value) noexcept {
        const auto cleared = static_cast<StorageType>(word & ~placed_mask);
        const auto shifted =
            static_cast<StorageType>((static_cast<StorageType>(value) & mask) << offset);
        return static_cast<StorageType>(cleared | shifted);
    }
};

template <std::size_t BitPos>
using OctetFlag = BitField<uint8_t, BitPos, 1>;

// ============================================================================
// First octet control bits (IEEE Std 802-2014 Figure 10)
// ============================================================================

// I/G (M) bit: set for group (multicast) addresses
using BroadcastScopeBit = OctetFlag<0>;

// U/L (X) bit: set for locally administered (CID-rooted) identifiers
using RegistrationBit = OctetFlag<1>;

// ============================================================================
// Nibbles of the last octet of 28/36/60-bit identifiers
// ============================================================================

// Reserved tail of an MA-M, MA-S, OUI-36 or EUI-60; always zero
using TrailingNibble = BitField<uint8_t, 0, 4>;

// Assigned high nibble of that same octet
using LeadingNibble = BitField<uint8_t, 4, 4>;

// ============================================================================
// Rules applied by identifier constructors
// ============================================================================

template <std::size_t N>
constexpr void force_registration(std::array<uint8_t, N>& bytes, bool local) noexcept {
    static_assert(N > 0);
    bytes[0] = RegistrationBit::insert(bytes[0], local);
}

template <std::size_t N>
constexpr void clear_trailing_nibble(std::array<uint8_t, N>& bytes) noexcept {
    static_assert(N > 0);
    bytes[N - 1] = TrailingNibble::insert(bytes[N - 1], 0);
}

template <std::size_t N>
constexpr void invert_registration(std::array<uint8_t, N>& bytes) noexcept {
    static_assert(N > 0);
    bytes[0] = RegistrationBit::insert(bytes[0], !RegistrationBit::extract(bytes[0]));
}

// Merge a block's last octet with an extension nibble:
// (block & 0xF0) | (nibble & 0x0F)
constexpr uint8_t merge_nibble(uint8_t block_octet, uint8_t extension_nibble) noexcept {
    return TrailingNibble::insert(static_cast<uint8_t>(block_octet & LeadingNibble::placed_mask),
                                  extension_nibble);
}

} // namespace ieeeid::detail
