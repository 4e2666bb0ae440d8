#pragma once

#include <algorithm>
#include <array>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include <cstddef>
#include <cstdint>
#include <ieeeid/identifier_error.hpp>
#include <ieeeid/types.hpp>

#include "bitfield.hpp"
#include "hex_codec.hpp"

namespace ieeeid {

// Registration bit a text form must carry before it is accepted
enum class RegistrationRule : uint8_t {
    any = 0,    // Constructor forcing decides
    global = 1, // Must read CLEAR (EUI-48, CDI-32, CDI-40)
    local = 2   // Must read SET (CID, MEUI-64)
};

namespace detail {

/**
 * Common capability set shared by every identifier kind.
 *
 * Derived kinds supply:
 *   - static constexpr IdentifierKind kind
 *   - static constexpr std::size_t bit_length
 *   - static constexpr RegistrationRule text_registration
 *   - a constexpr explicit constructor from bytes_type that applies the
 *     kind's forced bits
 *
 * The default-constructed value is all-zero for every kind. It is what a
 * failed text construction yields and is never valid.
 *
 * Equality is defined between two values of the same Derived type only, so
 * comparing a CompanyId with an Oui24 does not compile.
 */
template <typename Derived, std::size_t N>
class IdentifierBase {
    static_assert(N >= 3 && N <= 8, "IEEE identifiers are 3 to 8 octets long");

public:
    using bytes_type = std::array<uint8_t, N>;

    static constexpr std::size_t byte_length = N;
    static constexpr std::size_t max_text_length = ieeeid::max_text_length(N);

    // All-zero value of the kind, bypassing bit forcing
    [[nodiscard]] static constexpr Derived zero() noexcept { return Derived{}; }

    /**
     * Strict text parse.
     *
     * Applies the same decoding as the text constructor but reports why a
     * string was rejected instead of yielding zero().
     */
    [[nodiscard]] static ParseResult<Derived> parse(std::string_view text) {
        if (text.size() > max_text_length) {
            return make_parse_error(IdentifierError::text_too_long, Derived::kind);
        }

        const auto decoded = extract_bytes(text);
        if (decoded.size() != N) {
            return make_parse_error(IdentifierError::byte_count_mismatch, Derived::kind,
                                    decoded.size());
        }

        bytes_type raw{};
        std::copy_n(decoded.begin(), N, raw.begin());
        if (!accepts_registration(raw[0])) {
            return make_parse_error(IdentifierError::registration_mismatch, Derived::kind, N);
        }
        return Derived(raw);
    }

    // Runtime-checked construction from a byte sequence of unknown length
    [[nodiscard]] static ParseResult<Derived> from_bytes(std::span<const uint8_t> raw) noexcept {
        if (raw.size() != N) {
            return make_parse_error(IdentifierError::invalid_length, Derived::kind, raw.size());
        }
        bytes_type copy{};
        std::copy_n(raw.begin(), N, copy.begin());
        return Derived(copy);
    }

    // Accessors
    [[nodiscard]] constexpr const bytes_type& bytes() const noexcept { return bytes_; }
    [[nodiscard]] constexpr std::span<const uint8_t, N> as_bytes() const noexcept {
        return std::span<const uint8_t, N>(bytes_);
    }

    // Big-endian integer value of the stored octets
    [[nodiscard]] constexpr uint64_t to_integer() const noexcept {
        uint64_t value = 0;
        for (auto b : bytes_) {
            value = (value << 8) | b;
        }
        return value;
    }

    [[nodiscard]] constexpr BroadcastScope broadcast_scope() const noexcept {
        return BroadcastScopeBit::extract(bytes_[0]) ? BroadcastScope::multicast
                                                     : BroadcastScope::unicast;
    }

    [[nodiscard]] constexpr Registration registration() const noexcept {
        return RegistrationBit::extract(bytes_[0]) ? Registration::local : Registration::global;
    }

    [[nodiscard]] constexpr bool is_unicast() const noexcept {
        return broadcast_scope() == BroadcastScope::unicast;
    }
    [[nodiscard]] constexpr bool is_multicast() const noexcept {
        return broadcast_scope() == BroadcastScope::multicast;
    }
    [[nodiscard]] constexpr bool is_global() const noexcept {
        return registration() == Registration::global;
    }
    [[nodiscard]] constexpr bool is_local() const noexcept {
        return registration() == Registration::local;
    }

    /**
     * Sanity check, not a registry lookup.
     *
     * False for sequences shorter than three octets and for uniform fills
     * (every octet equal to the first), which covers 00:00:00 and FF:FF:FF.
     */
    [[nodiscard]] constexpr bool is_valid() const noexcept {
        if (N < min_valid_bytes) {
            return false;
        }
        return !std::all_of(bytes_.begin(), bytes_.end(),
                            [first = bytes_[0]](uint8_t b) { return b == first; });
    }

    // Text forms
    [[nodiscard]] std::string to_hex(char delimiter) const { return join_hex(bytes_, delimiter); }
    [[nodiscard]] std::string to_colon_hex() const { return to_hex(':'); }
    [[nodiscard]] std::string to_dash_hex() const { return to_hex('-'); }

    friend constexpr bool operator==(const Derived& lhs, const Derived& rhs) noexcept {
        return lhs.bytes() == rhs.bytes();
    }

    friend std::ostream& operator<<(std::ostream& os, const Derived& id) {
        return os << id.to_colon_hex();
    }

protected:
    constexpr IdentifierBase() noexcept = default;
    constexpr explicit IdentifierBase(const bytes_type& bytes) noexcept : bytes_(bytes) {}

private:
    static constexpr bool accepts_registration(uint8_t first_octet) noexcept {
        const bool local = RegistrationBit::extract(first_octet);
        switch (Derived::text_registration) {
            case RegistrationRule::global:
                return !local;
            case RegistrationRule::local:
                return local;
            case RegistrationRule::any:
                break;
        }
        return true;
    }

    bytes_type bytes_{};
};

// ============================================================================
// Composite construction helpers
// ============================================================================

// Block octets followed by extension octets
template <std::size_t N, std::size_t B, std::size_t E>
constexpr std::array<uint8_t, N> concat(const std::array<uint8_t, B>& block,
                                        const std::array<uint8_t, E>& extension) noexcept {
    static_assert(B + E == N, "block and extension must fill the identifier exactly");
    std::array<uint8_t, N> out{};
    std::copy(block.begin(), block.end(), out.begin());
    std::copy(extension.begin(), extension.end(), out.begin() + B);
    return out;
}

// Block octets with an extension nibble merged into the block's reserved
// tail, followed by extension octets
template <std::size_t N, std::size_t B, std::size_t E>
constexpr std::array<uint8_t, N> concat_merged(const std::array<uint8_t, B>& block,
                                               uint8_t extension_nibble,
                                               const std::array<uint8_t, E>& extension) noexcept {
    auto out = concat<N>(block, extension);
    out[B - 1] = merge_nibble(block[B - 1], extension_nibble);
    return out;
}

template <std::size_t N>
constexpr std::array<uint8_t, N> with_registration(std::array<uint8_t, N> bytes,
                                                   Registration registration) noexcept {
    force_registration(bytes, registration == Registration::local);
    return bytes;
}

template <std::size_t N>
constexpr std::array<uint8_t, N> without_trailing_nibble(std::array<uint8_t, N> bytes) noexcept {
    clear_trailing_nibble(bytes);
    return bytes;
}

template <std::size_t N>
constexpr std::array<uint8_t, N> with_inverted_registration(std::array<uint8_t, N> bytes) noexcept {
    invert_registration(bytes);
    return bytes;
}

} // namespace detail
} // namespace ieeeid
