// =============================================================================
// saudi-id - National Identifier Model
// =============================================================================
// Validated Saudi national identification numbers.
//
// An identifier is exactly kIdSize decimal digits. It is valid when:
// 1. it has exactly kIdSize digits,
// 2. its leading digit is a known category prefix (1 = citizen, 2 = resident),
// 3. the digits satisfy the Luhn checksum.
//
// Id instances can only be obtained through the validating factories below,
// so every live Id satisfies all three rules. Id is an immutable value type.
//
// Usage:
//   auto id = sid::core::Id::parse("1581872353");
//   if (id && id->type() == sid::core::IdType::kCitizen) { ... }
// =============================================================================

#ifndef SID_CORE_ID_H
#define SID_CORE_ID_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "sid/algo/luhn.h"
#include "sid/common/error.h"
#include "sid/common/types.h"

namespace sid::core {

// =============================================================================
// Holder Category
// =============================================================================

/// @brief Holder category encoded in the leading digit.
enum class IdType : std::uint8_t {
    kCitizen = 0,
    kResident = 1
};

/// @brief Leading digit for a category.
[[nodiscard]] constexpr Digit prefixDigit(IdType type) noexcept {
    switch (type) {
        case IdType::kCitizen:
            return kCitizenPrefix;
        case IdType::kResident:
            return kResidentPrefix;
    }
    return kCitizenPrefix;
}

/// @brief Category for a leading digit.
/// @return std::nullopt for any digit that is not a category prefix.
[[nodiscard]] constexpr std::optional<IdType> idTypeFromPrefix(Digit prefix) noexcept {
    switch (prefix) {
        case kCitizenPrefix:
            return IdType::kCitizen;
        case kResidentPrefix:
            return IdType::kResident;
        default:
            return std::nullopt;
    }
}

/// @brief Lowercase category name ("citizen" or "resident").
[[nodiscard]] std::string_view idTypeToString(IdType type) noexcept;

/// @brief Parse a category name (case-insensitive).
[[nodiscard]] std::optional<IdType> idTypeFromString(std::string_view name) noexcept;

std::ostream& operator<<(std::ostream& os, IdType type);

// =============================================================================
// Parse Error
// =============================================================================

/// @brief Error returned by every fallible Id factory.
/// @note There is a single error kind (ErrorCode::kInvalidId); reason()
///       tells which rule the candidate broke.
class ParseError {
public:
    explicit ParseError(InvalidIdReason reason);
    ParseError(InvalidIdReason reason, std::string message);

    /// @brief Always ErrorCode::kInvalidId.
    [[nodiscard]] ErrorCode code() const noexcept { return ErrorCode::kInvalidId; }

    [[nodiscard]] InvalidIdReason reason() const noexcept { return reason_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Convert to the generic Result error type.
    [[nodiscard]] Error toError() const;

    /// @brief Convert to the matching exception.
    [[nodiscard]] InvalidIdError toException() const;

    friend bool operator==(const ParseError& lhs, const ParseError& rhs) noexcept {
        return lhs.reason_ == rhs.reason_;
    }

private:
    InvalidIdReason reason_;
    std::string message_;
};

// =============================================================================
// Id Class
// =============================================================================

/// @brief A validated national identifier.
class Id {
public:
    /// @brief Result type of the fallible factories.
    using ParseResult = Result<Id, ParseError>;

    // -------------------------------------------------------------------------
    // Validation
    // -------------------------------------------------------------------------

    /// @brief Check a digit sequence against the identifier rules.
    /// @return The first rule broken (length, digit range, prefix, checksum
    ///         in that order), or std::nullopt when the sequence is valid.
    [[nodiscard]] static std::optional<InvalidIdReason> check(
        std::span<const Digit> digits) noexcept;

    /// @brief Check whether a digit sequence is a valid identifier.
    [[nodiscard]] static bool isValid(std::span<const Digit> digits) noexcept {
        return !check(digits).has_value();
    }

    // -------------------------------------------------------------------------
    // Factories
    // -------------------------------------------------------------------------

    /// @brief Build from an unsigned integer.
    /// @note Leading zeros cannot be represented; values below 10^9 always
    ///       fail with InvalidIdReason::kWrongLength.
    [[nodiscard]] static ParseResult fromInteger(std::uint32_t value);

    /// @brief Build from a raw digit sequence.
    [[nodiscard]] static ParseResult fromDigits(DigitSequence digits);

    /// @brief Build from text.
    /// @note Only ASCII digits are accepted: no sign, whitespace or separators.
    ///       Leading zeros are kept, so "0123456782" is rejected for its prefix.
    [[nodiscard]] static ParseResult parse(std::string_view text);

    /// @brief Generate a random identifier of the given category.
    /// @throws InternalError if the checksum generator breaks its contract.
    [[nodiscard]] static Id generate(IdType type);

    /// @brief Generate a random identifier using a caller-owned engine.
    /// @note The same engine state always yields the same identifier.
    /// @throws InternalError if the checksum generator breaks its contract.
    [[nodiscard]] static Id generate(IdType type, algo::luhn::Engine& engine);

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    /// @brief Holder category.
    /// @throws InternalError if the leading digit is not a category prefix,
    ///         which construction makes impossible.
    [[nodiscard]] IdType type() const;

    /// @brief Read-only view of the kIdSize digits.
    [[nodiscard]] std::span<const Digit> digits() const noexcept { return digits_; }

    /// @brief Canonical text: kIdSize ASCII digits, nothing else.
    [[nodiscard]] std::string toString() const;

    /// @brief Numeric value. Every valid identifier fits in 32 bits.
    [[nodiscard]] std::uint32_t toInteger() const noexcept;

    friend bool operator==(const Id& lhs, const Id& rhs) noexcept = default;

private:
    explicit Id(DigitSequence digits) noexcept : digits_(std::move(digits)) {}

    static Id fromGenerated(IdType type, Result<DigitSequence> generated);

    DigitSequence digits_;
};

std::ostream& operator<<(std::ostream& os, const Id& id);

}  // namespace sid::core

/// @brief Hash support so identifiers can key unordered containers.
template <>
struct std::hash<sid::core::Id> {
    std::size_t operator()(const sid::core::Id& id) const noexcept {
        return std::hash<std::uint32_t>{}(id.toInteger());
    }
};

#endif  // SID_CORE_ID_H
