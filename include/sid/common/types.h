// =============================================================================
// saudi-id - Common Type Definitions
// =============================================================================
// Core type definitions for the saudi-id library.
//
// This module defines:
// - Digit, DigitSequence: Decimal digit storage
// - Identifier size and category prefix constants
//
// Naming Conventions (per project style guide):
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef SID_COMMON_TYPES_H
#define SID_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sid {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief A single decimal digit (0-9).
/// @note Values outside 0-9 are representable and rejected by validation.
using Digit = std::uint8_t;

/// @brief Ordered digit sequence, most significant digit first.
using DigitSequence = std::vector<Digit>;

// =============================================================================
// Constants
// =============================================================================

/// @brief Number of digits in a national identifier.
inline constexpr std::size_t kIdSize = 10;

/// @brief Largest value a single digit may hold.
inline constexpr Digit kMaxDigit = 9;

/// @brief Numeric base used for all conversions.
inline constexpr std::uint32_t kRadix = 10;

/// @brief Leading digit of citizen identifiers.
inline constexpr Digit kCitizenPrefix = 1;

/// @brief Leading digit of resident identifiers.
inline constexpr Digit kResidentPrefix = 2;

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Check whether a value is a decimal digit.
[[nodiscard]] constexpr bool isDecimalDigit(Digit value) noexcept {
    return value <= kMaxDigit;
}

/// @brief Check whether a character is an ASCII decimal digit.
[[nodiscard]] constexpr bool isAsciiDigit(char c) noexcept {
    return c >= '0' && c <= '9';
}

/// @brief Convert an ASCII decimal digit to its value.
/// @note Caller must check isAsciiDigit() first.
[[nodiscard]] constexpr Digit digitFromChar(char c) noexcept {
    return static_cast<Digit>(c - '0');
}

/// @brief Convert a digit value to its ASCII character.
[[nodiscard]] constexpr char digitToChar(Digit value) noexcept {
    return static_cast<char>('0' + value);
}

}  // namespace sid

#endif  // SID_COMMON_TYPES_H
