#pragma once

#include <concepts>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

#include <cstddef>
#include <cstdint>

#include "cdi.hpp"
#include "company_id.hpp"
#include "eui.hpp"
#include "identifier_error.hpp"
#include "mac_block.hpp"
#include "oui.hpp"

namespace ieeeid {

/**
 * Common capability set of every IEEE identifier kind.
 *
 * Generic code (formatting, hashing, bindings) is written against this
 * concept rather than a base class; conversions and composite
 * construction stay on the concrete kinds.
 */
template <typename T>
concept IeeeIdentifier = std::is_trivially_copyable_v<T> && requires(const T& id) {
    { T::kind } -> std::convertible_to<IdentifierKind>;
    { T::byte_length } -> std::convertible_to<std::size_t>;
    { T::bit_length } -> std::convertible_to<std::size_t>;

    { id.bytes() } -> std::convertible_to<std::span<const uint8_t>>;
    { id.as_bytes() } -> std::convertible_to<std::span<const uint8_t>>;
    { id.to_integer() } -> std::same_as<uint64_t>;

    { id.is_unicast() } -> std::same_as<bool>;
    { id.is_multicast() } -> std::same_as<bool>;
    { id.is_global() } -> std::same_as<bool>;
    { id.is_local() } -> std::same_as<bool>;
    { id.is_valid() } -> std::same_as<bool>;

    { id.to_colon_hex() } -> std::same_as<std::string>;
    { id.to_dash_hex() } -> std::same_as<std::string>;
    { id == id } -> std::same_as<bool>;

    { T::zero() } -> std::same_as<T>;
    { T::parse(std::string_view{}) } -> std::same_as<ParseResult<T>>;
};

/**
 * Identifiers whose last octet carries a reserved (always zero) nibble.
 */
template <typename T>
concept NibbleAlignedIdentifier = IeeeIdentifier<T> && (T::bit_length % 8 == 4);

static_assert(IeeeIdentifier<CompanyId>);
static_assert(IeeeIdentifier<Oui24>);
static_assert(IeeeIdentifier<Oui36>);
static_assert(IeeeIdentifier<MacBlockLarge>);
static_assert(IeeeIdentifier<MacBlockMedium>);
static_assert(IeeeIdentifier<MacBlockSmall>);
static_assert(IeeeIdentifier<Eui48>);
static_assert(IeeeIdentifier<Eui60>);
static_assert(IeeeIdentifier<Eui64>);
static_assert(IeeeIdentifier<ModifiedEui64>);
static_assert(IeeeIdentifier<Cdi32>);
static_assert(IeeeIdentifier<Cdi40>);

} // namespace ieeeid

namespace std {

template <ieeeid::IeeeIdentifier T>
struct hash<T> {
    size_t operator()(const T& id) const noexcept { return std::hash<uint64_t>{}(id.to_integer()); }
};

} // namespace std
