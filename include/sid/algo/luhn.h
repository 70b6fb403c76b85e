// =============================================================================
// saudi-id - Luhn Checksum Module
// =============================================================================
// Luhn (mod 10) checksum over decimal digit sequences.
//
// This module provides:
// - isValid: checksum predicate over sequences of any length
// - computeCheckDigit: digit that completes a payload
// - generateWithPrefix: random checksum-valid sequence with a fixed prefix
//
// Digits are processed from the rightmost position. Every second digit,
// starting with the one left of the check digit, is doubled and reduced
// (d * 2 - 9 when the double exceeds 9). A sequence is valid when the sum is
// a multiple of 10.
// =============================================================================

#ifndef SID_ALGO_LUHN_H
#define SID_ALGO_LUHN_H

#include <cstddef>
#include <cstdint>
#include <random>
#include <span>

#include "sid/common/error.h"
#include "sid/common/types.h"

namespace sid::algo::luhn {

/// @brief Random engine used for generation.
using Engine = std::mt19937_64;

/// @brief Check whether a digit sequence satisfies the Luhn checksum.
/// @param digits Digit sequence, most significant first.
/// @return false for an empty sequence or any element greater than 9.
[[nodiscard]] bool isValid(std::span<const Digit> digits) noexcept;

/// @brief Compute the check digit for a payload.
/// @param payload Digits preceding the check digit.
/// @return Digit that makes payload + digit valid, or kInvalidArgument if an
///         element is out of range.
[[nodiscard]] Result<Digit> computeCheckDigit(std::span<const Digit> payload);

/// @brief Generate a random checksum-valid sequence.
/// @param length Total number of digits, including prefix and check digit.
/// @param prefix Leading digits copied verbatim.
/// @param engine Source of randomness for the digits between prefix and check digit.
/// @return kInvalidArgument when length is zero, the prefix leaves no room for
///         the check digit, or a prefix element is out of range.
[[nodiscard]] Result<DigitSequence> generateWithPrefix(std::size_t length,
                                                       std::span<const Digit> prefix,
                                                       Engine& engine);

/// @brief Generate a random checksum-valid sequence using a per-thread engine.
/// @note The per-thread engine is seeded from std::random_device on first use.
[[nodiscard]] Result<DigitSequence> generateWithPrefix(std::size_t length,
                                                       std::span<const Digit> prefix);

}  // namespace sid::algo::luhn

#endif  // SID_ALGO_LUHN_H
