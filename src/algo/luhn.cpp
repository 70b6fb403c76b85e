// =============================================================================
// saudi-id - Luhn Checksum Module Implementation
// =============================================================================

#include "sid/algo/luhn.h"

#include <array>
#include <format>

namespace sid::algo::luhn {

namespace {

/// @brief Doubled-and-reduced value for each digit: (2 * d) / 10 + (2 * d) % 10.
constexpr std::array<std::uint32_t, 10> kDoubledDigit = {0, 2, 4, 6, 8, 1, 3, 5, 7, 9};

/// @brief Luhn sum of a sequence.
/// @param firstDoubled Whether the rightmost digit is doubled. True when the
///        sequence is a payload still missing its check digit.
/// @note Caller must have checked that every element is a decimal digit.
std::uint32_t weightedSum(std::span<const Digit> digits, bool firstDoubled) noexcept {
    std::uint32_t sum = 0;
    bool doubled = firstDoubled;
    for (std::size_t i = digits.size(); i > 0; --i) {
        const Digit d = digits[i - 1];
        sum += doubled ? kDoubledDigit[d] : d;
        doubled = !doubled;
    }
    return sum;
}

bool allDecimal(std::span<const Digit> digits) noexcept {
    for (Digit d : digits) {
        if (!isDecimalDigit(d)) {
            return false;
        }
    }
    return true;
}

Engine& threadEngine() {
    thread_local Engine engine{std::random_device{}()};
    return engine;
}

}  // namespace

bool isValid(std::span<const Digit> digits) noexcept {
    if (digits.empty() || !allDecimal(digits)) {
        return false;
    }
    return weightedSum(digits, false) % kRadix == 0;
}

Result<Digit> computeCheckDigit(std::span<const Digit> payload) {
    if (!allDecimal(payload)) {
        return makeError<Digit>(ErrorCode::kInvalidArgument,
                                "luhn payload contains a value outside 0-9");
    }
    const std::uint32_t remainder = weightedSum(payload, true) % kRadix;
    return static_cast<Digit>((kRadix - remainder) % kRadix);
}

Result<DigitSequence> generateWithPrefix(std::size_t length,
                                         std::span<const Digit> prefix,
                                         Engine& engine) {
    if (length == 0) {
        return makeError<DigitSequence>(ErrorCode::kInvalidArgument,
                                        "luhn sequence length must be positive");
    }
    if (prefix.size() >= length) {
        return makeError<DigitSequence>(
            ErrorCode::kInvalidArgument,
            std::format("prefix of {} digits leaves no room for a check digit in {} digits",
                        prefix.size(), length));
    }
    if (!allDecimal(prefix)) {
        return makeError<DigitSequence>(ErrorCode::kInvalidArgument,
                                        "luhn prefix contains a value outside 0-9");
    }

    DigitSequence digits(prefix.begin(), prefix.end());
    digits.reserve(length);

    std::uniform_int_distribution<unsigned> dist(0, kMaxDigit);
    while (digits.size() + 1 < length) {
        digits.push_back(static_cast<Digit>(dist(engine)));
    }

    auto check = computeCheckDigit(digits);
    if (!check) {
        return std::unexpected(std::move(check.error()));
    }
    digits.push_back(*check);
    return digits;
}

Result<DigitSequence> generateWithPrefix(std::size_t length, std::span<const Digit> prefix) {
    return generateWithPrefix(length, prefix, threadEngine());
}

}  // namespace sid::algo::luhn
