// =============================================================================
// saudi-id - National Identifier Tests
// =============================================================================
// Unit tests for Id construction, classification, formatting and value
// semantics, plus the IdType helpers.
// =============================================================================

#include "sid/core/id.h"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <unordered_set>
#include <utility>

namespace sid::core {
namespace {

// Known valid identifiers
constexpr std::uint32_t kCitizenValue = 1581872353;
constexpr std::uint32_t kOtherCitizenValue = 1564437091;
constexpr std::uint32_t kResidentValue = 2000000006;

// =============================================================================
// IdType Tests
// =============================================================================

TEST(IdTypeTest, PrefixMapping) {
    EXPECT_EQ(prefixDigit(IdType::kCitizen), 1);
    EXPECT_EQ(prefixDigit(IdType::kResident), 2);

    EXPECT_EQ(idTypeFromPrefix(1), IdType::kCitizen);
    EXPECT_EQ(idTypeFromPrefix(2), IdType::kResident);
    EXPECT_FALSE(idTypeFromPrefix(0).has_value());
    EXPECT_FALSE(idTypeFromPrefix(3).has_value());
    EXPECT_FALSE(idTypeFromPrefix(9).has_value());
}

TEST(IdTypeTest, PrefixMappingIsBijective) {
    for (IdType type : {IdType::kCitizen, IdType::kResident}) {
        EXPECT_EQ(idTypeFromPrefix(prefixDigit(type)), type);
    }
}

TEST(IdTypeTest, Names) {
    EXPECT_EQ(idTypeToString(IdType::kCitizen), "citizen");
    EXPECT_EQ(idTypeToString(IdType::kResident), "resident");

    EXPECT_EQ(idTypeFromString("citizen"), IdType::kCitizen);
    EXPECT_EQ(idTypeFromString("Resident"), IdType::kResident);
    EXPECT_EQ(idTypeFromString("CITIZEN"), IdType::kCitizen);
    EXPECT_FALSE(idTypeFromString("visitor").has_value());
    EXPECT_FALSE(idTypeFromString("").has_value());
}

// =============================================================================
// Construction From Integer
// =============================================================================

TEST(IdTest, FromIntegerKnownCitizen) {
    auto id = Id::fromInteger(kCitizenValue);
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->type(), IdType::kCitizen);
    EXPECT_EQ(id->toString(), "1581872353");
}

TEST(IdTest, FromIntegerSecondCitizen) {
    auto id = Id::fromInteger(kOtherCitizenValue);
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->type(), IdType::kCitizen);
}

TEST(IdTest, FromIntegerKnownResident) {
    auto id = Id::fromInteger(kResidentValue);
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->type(), IdType::kResident);
}

TEST(IdTest, FromIntegerZeroIsWrongLength) {
    auto id = Id::fromInteger(0);
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code(), ErrorCode::kInvalidId);
    EXPECT_EQ(id.error().reason(), InvalidIdReason::kWrongLength);
}

TEST(IdTest, FromIntegerShortValueIsWrongLength) {
    // 158187235 has nine digits
    auto id = Id::fromInteger(158187235);
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().reason(), InvalidIdReason::kWrongLength);
}

TEST(IdTest, FromIntegerBadChecksum) {
    auto id = Id::fromInteger(1581872354);
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().reason(), InvalidIdReason::kChecksumMismatch);
}

TEST(IdTest, FromIntegerBadPrefix) {
    // 3000000004 and 4000000002 are Luhn-valid but not citizen/resident
    auto id = Id::fromInteger(3000000004);
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().reason(), InvalidIdReason::kUnknownPrefix);

    id = Id::fromInteger(4000000002);
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().reason(), InvalidIdReason::kUnknownPrefix);
}

// =============================================================================
// Construction From Digits
// =============================================================================

TEST(IdTest, FromDigitsValid) {
    auto id = Id::fromDigits({1, 5, 8, 1, 8, 7, 2, 3, 5, 3});
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->toInteger(), kCitizenValue);
}

TEST(IdTest, FromDigitsWrongLength) {
    auto id = Id::fromDigits({1, 2, 3});
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code(), ErrorCode::kInvalidId);
    EXPECT_EQ(id.error().reason(), InvalidIdReason::kWrongLength);

    id = Id::fromDigits({});
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().reason(), InvalidIdReason::kWrongLength);
}

TEST(IdTest, FromDigitsWrongLengthEvenWhenChecksumValid) {
    // 79927398713 is Luhn-valid but has eleven digits
    auto id = Id::fromDigits({7, 9, 9, 2, 7, 3, 9, 8, 7, 1, 3});
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().reason(), InvalidIdReason::kWrongLength);
}

TEST(IdTest, FromDigitsBadPrefix) {
    // 9000000001 is Luhn-valid
    auto id = Id::fromDigits({9, 0, 0, 0, 0, 0, 0, 0, 0, 1});
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().reason(), InvalidIdReason::kUnknownPrefix);
}

TEST(IdTest, FromDigitsBadChecksum) {
    auto id = Id::fromDigits({1, 5, 8, 1, 8, 7, 2, 3, 5, 4});
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().reason(), InvalidIdReason::kChecksumMismatch);
}

TEST(IdTest, FromDigitsOutOfRange) {
    auto id = Id::fromDigits({1, 5, 8, 1, 8, 7, 2, 3, 5, 13});
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().reason(), InvalidIdReason::kDigitOutOfRange);
}

TEST(IdTest, CheckReportsFirstBrokenRule) {
    EXPECT_FALSE(Id::check(DigitSequence{1, 5, 8, 1, 8, 7, 2, 3, 5, 3}).has_value());
    EXPECT_EQ(Id::check(DigitSequence{9, 9}), InvalidIdReason::kWrongLength);
    // Bad prefix and bad checksum: prefix is reported
    EXPECT_EQ(Id::check(DigitSequence{5, 5, 8, 1, 8, 7, 2, 3, 5, 3}),
              InvalidIdReason::kUnknownPrefix);
    EXPECT_TRUE(Id::isValid(DigitSequence{2, 0, 0, 0, 0, 0, 0, 0, 0, 6}));
    EXPECT_FALSE(Id::isValid(DigitSequence{2, 0, 0, 0, 0, 0, 0, 0, 0, 7}));
}

// =============================================================================
// Construction From Text
// =============================================================================

TEST(IdTest, ParseValid) {
    auto id = Id::parse("1581872353");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->type(), IdType::kCitizen);
    EXPECT_EQ(*id, Id::fromInteger(kCitizenValue).value());
}

TEST(IdTest, ParseRejectsMalformedText) {
    for (const char* text : {"", "abc", "15818723a3", " 1581872353", "1581872353 ",
                             "+1581872353", "-1581872353", "1581-872353", "1.581872353e9"}) {
        auto id = Id::parse(text);
        ASSERT_FALSE(id.has_value()) << "text: '" << text << "'";
        EXPECT_EQ(id.error().reason(), InvalidIdReason::kMalformedText) << "text: '" << text << "'";
    }
}

TEST(IdTest, ParseKeepsLeadingZero) {
    // 0123456782 is Luhn-valid; the zero is kept and rejected as a prefix
    auto id = Id::parse("0123456782");
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().reason(), InvalidIdReason::kUnknownPrefix);
}

TEST(IdTest, ParseRejectsWrongLength) {
    EXPECT_EQ(Id::parse("18").error().reason(), InvalidIdReason::kWrongLength);
    EXPECT_EQ(Id::parse("15818723530").error().reason(), InvalidIdReason::kWrongLength);
    // Longer than any 32-bit value
    EXPECT_EQ(Id::parse("158187235315818723531581872353").error().reason(),
              InvalidIdReason::kWrongLength);
}

TEST(IdTest, ParseErrorCarriesMessage) {
    auto id = Id::parse("1581872354");
    ASSERT_FALSE(id.has_value());
    EXPECT_NE(id.error().message().find("Luhn"), std::string::npos);

    auto error = id.error().toError();
    EXPECT_EQ(error.code(), ErrorCode::kInvalidId);

    auto ex = id.error().toException();
    EXPECT_EQ(ex.reason(), InvalidIdReason::kChecksumMismatch);
}

// =============================================================================
// Generation
// =============================================================================

TEST(IdTest, GenerateCitizen) {
    auto id = Id::generate(IdType::kCitizen);
    EXPECT_EQ(id.type(), IdType::kCitizen);
    EXPECT_EQ(id.digits().front(), kCitizenPrefix);
    EXPECT_TRUE(Id::isValid(id.digits()));
}

TEST(IdTest, GenerateResident) {
    auto id = Id::generate(IdType::kResident);
    EXPECT_EQ(id.type(), IdType::kResident);
    EXPECT_EQ(id.digits().front(), kResidentPrefix);
    EXPECT_TRUE(Id::isValid(id.digits()));
}

TEST(IdTest, GenerateWithSeedIsReproducible) {
    algo::luhn::Engine first{2024};
    algo::luhn::Engine second{2024};

    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(Id::generate(IdType::kResident, first), Id::generate(IdType::kResident, second));
    }
}

// =============================================================================
// Formatting
// =============================================================================

TEST(IdTest, ToStringIsTenAsciiDigits) {
    auto id = Id::fromInteger(kResidentValue).value();
    const std::string text = id.toString();

    ASSERT_EQ(text.size(), kIdSize);
    for (std::size_t i = 0; i < text.size(); ++i) {
        ASSERT_TRUE(isAsciiDigit(text[i]));
        EXPECT_EQ(digitFromChar(text[i]), id.digits()[i]);
    }
    EXPECT_EQ(text, "2000000006");
}

TEST(IdTest, StreamOperator) {
    std::ostringstream oss;
    oss << Id::fromInteger(kCitizenValue).value() << ' ' << IdType::kResident;
    EXPECT_EQ(oss.str(), "1581872353 resident");
}

TEST(IdTest, ToIntegerInvertsFromInteger) {
    EXPECT_EQ(Id::fromInteger(kCitizenValue)->toInteger(), kCitizenValue);
    EXPECT_EQ(Id::fromInteger(kResidentValue)->toInteger(), kResidentValue);
}

// =============================================================================
// Value Semantics
// =============================================================================

TEST(IdTest, EqualityComparesDigits) {
    auto a = Id::fromInteger(kCitizenValue).value();
    auto b = Id::parse("1581872353").value();
    auto c = Id::fromInteger(kOtherCitizenValue).value();

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(IdTest, CopiesAreIndependent) {
    const auto original = Id::fromInteger(kCitizenValue).value();
    auto copy = original;

    EXPECT_EQ(copy, original);
    EXPECT_NE(copy.digits().data(), original.digits().data());

    copy = Id::fromInteger(kResidentValue).value();
    EXPECT_EQ(original.toInteger(), kCitizenValue);
    EXPECT_EQ(original.type(), IdType::kCitizen);
    EXPECT_EQ(copy.type(), IdType::kResident);
}

TEST(IdTest, MovedFromIdCannotBeClassified) {
    auto source = Id::fromInteger(kCitizenValue).value();
    const Id target = std::move(source);

    EXPECT_EQ(target.type(), IdType::kCitizen);
    EXPECT_TRUE(source.digits().empty());  // NOLINT(bugprone-use-after-move)
    EXPECT_THROW((void)source.type(), InternalError);
}

TEST(IdTest, HashSupportsUnorderedContainers) {
    std::unordered_set<Id> ids;
    ids.insert(Id::fromInteger(kCitizenValue).value());
    ids.insert(Id::parse("1581872353").value());
    ids.insert(Id::fromInteger(kResidentValue).value());

    EXPECT_EQ(ids.size(), 2u);
}

}  // namespace
}  // namespace sid::core
