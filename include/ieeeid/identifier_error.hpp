#pragma once

#include <cstddef>
#include <cstdint>
#include <ieeeid/types.hpp>

#include "expected.hpp"

namespace ieeeid {

// Error codes for strict and runtime-checked construction
enum class IdentifierError : uint8_t {
    none = 0,              // No error
    invalid_length,        // Raw byte sequence has the wrong number of bytes
    text_too_long,         // Text exceeds the kind's canonical text length
    byte_count_mismatch,   // Text decoded to the wrong number of bytes
    registration_mismatch, // Registration bit contradicts the kind's convention
};

// Convert identifier error to human-readable string
constexpr const char* identifier_error_string(IdentifierError err) noexcept {
    switch (err) {
        case IdentifierError::none:
            return "No error";
        case IdentifierError::invalid_length:
            return "Byte sequence length doesn't match identifier length";
        case IdentifierError::text_too_long:
            return "Text is longer than the canonical form of the identifier";
        case IdentifierError::byte_count_mismatch:
            return "Text doesn't decode to the identifier's byte count";
        case IdentifierError::registration_mismatch:
            return "Registration bit doesn't match the identifier's convention";
        default:
            return "Unknown error";
    }
}

/**
 * @brief Error information from a failed identifier construction
 *
 * Trivially copyable; carries no reference to the rejected input.
 */
struct ParseError {
    IdentifierError code;  ///< What went wrong
    IdentifierKind kind;   ///< Kind that was being constructed
    size_t byte_count{0};  ///< Bytes decoded or supplied (0 if never decoded)

    /**
     * @brief Get a human-readable error message
     * @return Static string describing the error
     */
    [[nodiscard]] const char* message() const noexcept { return identifier_error_string(code); }
};

/**
 * @brief Result type for strict identifier construction
 *
 * Usage:
 * @code
 *   auto eui = Eui48::parse("00-1B-63-84-45-E6");
 *   if (!eui) {
 *       std::cerr << eui.error().message() << "\n";
 *   }
 * @endcode
 */
template <typename T>
using ParseResult = expected<T, ParseError>;

inline auto make_parse_error(IdentifierError code, IdentifierKind kind,
                             size_t byte_count = 0) noexcept {
    return unexpected(ParseError{.code = code, .kind = kind, .byte_count = byte_count});
}

} // namespace ieeeid
