// =============================================================================
// saudi-id - National Identifier Model Implementation
// =============================================================================

#include "sid/core/id.h"

#include <algorithm>
#include <cctype>
#include <format>

namespace sid::core {

namespace {

std::string describeDigits(std::span<const Digit> digits) {
    std::string text;
    text.reserve(digits.size());
    for (Digit d : digits) {
        text.push_back(isDecimalDigit(d) ? digitToChar(d) : '?');
    }
    return text;
}

std::string rejectionMessage(InvalidIdReason reason, std::span<const Digit> digits) {
    switch (reason) {
        case InvalidIdReason::kWrongLength:
            return std::format("expected {} digits, got {}", kIdSize, digits.size());
        case InvalidIdReason::kDigitOutOfRange:
            return std::format("digit sequence '{}' contains a value outside 0-9",
                               describeDigits(digits));
        case InvalidIdReason::kUnknownPrefix:
            return std::format("leading digit {} is not a citizen ({}) or resident ({}) prefix",
                               digits.front(), kCitizenPrefix, kResidentPrefix);
        case InvalidIdReason::kChecksumMismatch:
            return std::format("'{}' fails the Luhn checksum", describeDigits(digits));
        case InvalidIdReason::kMalformedText:
            break;
    }
    return std::string(invalidIdReasonToString(reason));
}

Id::ParseResult reject(InvalidIdReason reason, std::span<const Digit> digits) {
    return std::unexpected(ParseError{reason, rejectionMessage(reason, digits)});
}

}  // namespace

// =============================================================================
// IdType
// =============================================================================

std::string_view idTypeToString(IdType type) noexcept {
    switch (type) {
        case IdType::kCitizen:
            return "citizen";
        case IdType::kResident:
            return "resident";
    }
    return "unknown";
}

std::optional<IdType> idTypeFromString(std::string_view name) noexcept {
    std::string lower(name.size(), '\0');
    std::transform(name.begin(), name.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "citizen") {
        return IdType::kCitizen;
    }
    if (lower == "resident") {
        return IdType::kResident;
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, IdType type) {
    return os << idTypeToString(type);
}

// =============================================================================
// ParseError
// =============================================================================

ParseError::ParseError(InvalidIdReason reason)
    : reason_(reason), message_(invalidIdReasonToString(reason)) {}

ParseError::ParseError(InvalidIdReason reason, std::string message)
    : reason_(reason), message_(std::move(message)) {}

Error ParseError::toError() const {
    return Error{code(), message_};
}

InvalidIdError ParseError::toException() const {
    return InvalidIdError{message_, reason_};
}

// =============================================================================
// Id - Validation
// =============================================================================

std::optional<InvalidIdReason> Id::check(std::span<const Digit> digits) noexcept {
    if (digits.size() != kIdSize) {
        return InvalidIdReason::kWrongLength;
    }
    if (!std::all_of(digits.begin(), digits.end(), isDecimalDigit)) {
        return InvalidIdReason::kDigitOutOfRange;
    }
    if (!idTypeFromPrefix(digits.front()).has_value()) {
        return InvalidIdReason::kUnknownPrefix;
    }
    if (!algo::luhn::isValid(digits)) {
        return InvalidIdReason::kChecksumMismatch;
    }
    return std::nullopt;
}

// =============================================================================
// Id - Factories
// =============================================================================

Id::ParseResult Id::fromInteger(std::uint32_t value) {
    DigitSequence digits;
    digits.reserve(kIdSize);

    // Least significant digit first, reversed below
    while (value > 0) {
        digits.push_back(static_cast<Digit>(value % kRadix));
        value /= kRadix;
    }
    std::reverse(digits.begin(), digits.end());

    return fromDigits(std::move(digits));
}

Id::ParseResult Id::fromDigits(DigitSequence digits) {
    if (auto reason = check(digits)) {
        return reject(*reason, digits);
    }
    return Id{std::move(digits)};
}

Id::ParseResult Id::parse(std::string_view text) {
    if (text.empty()) {
        return std::unexpected(ParseError{InvalidIdReason::kMalformedText, "empty id text"});
    }

    DigitSequence digits;
    digits.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (!isAsciiDigit(text[i])) {
            return std::unexpected(ParseError{
                InvalidIdReason::kMalformedText,
                std::format("unexpected character at position {} in '{}'", i, text)});
        }
        digits.push_back(digitFromChar(text[i]));
    }

    return fromDigits(std::move(digits));
}

Id Id::generate(IdType type) {
    const Digit prefix[] = {prefixDigit(type)};
    return fromGenerated(type, algo::luhn::generateWithPrefix(kIdSize, prefix));
}

Id Id::generate(IdType type, algo::luhn::Engine& engine) {
    const Digit prefix[] = {prefixDigit(type)};
    return fromGenerated(type, algo::luhn::generateWithPrefix(kIdSize, prefix, engine));
}

Id Id::fromGenerated(IdType type, Result<DigitSequence> generated) {
    // A fixed-length request with a single valid prefix digit cannot fail
    if (!generated) {
        throw InternalError(std::format("luhn generator rejected a {} request: {}",
                                        idTypeToString(type), generated.error().message()));
    }

    auto id = fromDigits(std::move(*generated));
    if (!id) {
        throw InternalError(std::format("generated {} id is invalid: {}",
                                        idTypeToString(type), id.error().message()));
    }
    return std::move(*id);
}

// =============================================================================
// Id - Accessors
// =============================================================================

IdType Id::type() const {
    if (digits_.empty()) {
        throw InternalError("id has no digits (used after move)");
    }
    if (auto category = idTypeFromPrefix(digits_.front())) {
        return *category;
    }
    throw InternalError(std::format("id {} carries unknown prefix {}", toString(),
                                    digits_.front()));
}

std::string Id::toString() const {
    std::string text;
    text.reserve(digits_.size());
    for (Digit d : digits_) {
        text.push_back(digitToChar(d));
    }
    return text;
}

std::uint32_t Id::toInteger() const noexcept {
    std::uint32_t value = 0;
    for (Digit d : digits_) {
        value = value * kRadix + d;
    }
    return value;
}

std::ostream& operator<<(std::ostream& os, const Id& id) {
    return os << id.toString();
}

}  // namespace sid::core
