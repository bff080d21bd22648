#include "../src/chunk_type.hpp"
#include "../src/errors.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using pngme::ChunkType;
using pngme::ValidationError;

namespace {
struct PropertyExpectation {
    const char* type;
    bool critical;
    bool isPublic;
    bool reservedBitValid;
    bool safeToCopy;
};

void expect_properties(const PropertyExpectation& expected) {
    const auto type = ChunkType::from_string(expected.type);
    EXPECT_EQ(type.is_critical(), expected.critical) << expected.type;
    EXPECT_EQ(type.is_public(), expected.isPublic) << expected.type;
    EXPECT_EQ(type.is_reserved_bit_valid(), expected.reservedBitValid) << expected.type;
    EXPECT_EQ(type.is_safe_to_copy(), expected.safeToCopy) << expected.type;
}

void expect_validation_error(std::string_view text, ValidationError::Kind kind) {
    try {
        (void)ChunkType::from_string(text);
        FAIL() << "Expected ValidationError for \"" << text << "\"";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.kind(), kind) << "Wrong kind for \"" << text << "\"";
    }
}
} // namespace

TEST(ChunkTypeTests, FromBytes) {
    const ChunkType::Bytes expected = {82, 117, 83, 116};
    const auto actual = ChunkType::from_bytes({82, 117, 83, 116});
    EXPECT_EQ(actual.bytes(), expected);
}

TEST(ChunkTypeTests, FromStringMatchesFromBytes) {
    const auto expected = ChunkType::from_bytes({82, 117, 83, 116});
    const auto actual = ChunkType::from_string("RuSt");
    EXPECT_EQ(expected, actual);
}

TEST(ChunkTypeTests, PropertyBits) {
    expect_properties({"RuSt", true, false, true, true});
    expect_properties({"ruSt", false, false, true, true});
    expect_properties({"RUSt", true, true, true, true});
    expect_properties({"RuST", true, false, true, false});
    expect_properties({"Rust", true, false, false, true});
    expect_properties({"IHDR", true, true, true, false});
    expect_properties({"tEXt", false, true, true, true});
}

TEST(ChunkTypeTests, ValidType) {
    EXPECT_TRUE(ChunkType::from_string("RuSt").is_valid());
}

TEST(ChunkTypeTests, ReservedBitSetIsConstructibleButInvalid) {
    const auto type = ChunkType::from_string("Rust");
    EXPECT_FALSE(type.is_reserved_bit_valid());
    EXPECT_FALSE(type.is_valid());
}

TEST(ChunkTypeTests, RejectsNonLetterInEveryPosition) {
    expect_validation_error("1uSt", ValidationError::Kind::InvalidTypeBytes);
    expect_validation_error("R1St", ValidationError::Kind::InvalidTypeBytes);
    expect_validation_error("Ru1t", ValidationError::Kind::InvalidTypeBytes);
    expect_validation_error("RuS1", ValidationError::Kind::InvalidTypeBytes);
}

TEST(ChunkTypeTests, RejectsBytesAdjacentToLetterRanges) {
    // '@' '[' '`' '{' sit just outside A-Z and a-z
    EXPECT_THROW(ChunkType::from_bytes({'@', 'u', 'S', 't'}), ValidationError);
    EXPECT_THROW(ChunkType::from_bytes({'R', '[', 'S', 't'}), ValidationError);
    EXPECT_THROW(ChunkType::from_bytes({'R', 'u', '`', 't'}), ValidationError);
    EXPECT_THROW(ChunkType::from_bytes({'R', 'u', 'S', '{'}), ValidationError);
    EXPECT_THROW(ChunkType::from_bytes({0xC1, 'u', 'S', 't'}), ValidationError);
}

TEST(ChunkTypeTests, ErrorCarriesOffendingBytes) {
    try {
        (void)ChunkType::from_string("Ru1t");
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        const std::vector<uint8_t> expected = {'R', 'u', '1', 't'};
        EXPECT_EQ(e.bytes(), expected);
    }
}

TEST(ChunkTypeTests, RejectsWrongLength) {
    expect_validation_error("", ValidationError::Kind::InvalidLength);
    expect_validation_error("RuS", ValidationError::Kind::InvalidLength);
    expect_validation_error("RuStx", ValidationError::Kind::InvalidLength);
}

TEST(ChunkTypeTests, LengthIsCountedInBytes) {
    // four characters, five bytes ("\xC3\xA9" is e-acute)
    expect_validation_error("Ru\xC3\xA9t", ValidationError::Kind::InvalidLength);
    // two characters, four bytes
    expect_validation_error("\xC3\xA9\xC3\xA9", ValidationError::Kind::InvalidTypeBytes);
}

TEST(ChunkTypeTests, ToString) {
    EXPECT_EQ(ChunkType::from_string("RuSt").to_string(), "RuSt");

    std::ostringstream oss;
    oss << ChunkType::from_bytes({82, 117, 83, 116});
    EXPECT_EQ(oss.str(), "RuSt");
}

TEST(ChunkTypeTests, EqualityIsByteIdentity) {
    EXPECT_EQ(ChunkType::from_string("RuSt"), ChunkType::from_string("RuSt"));
    EXPECT_NE(ChunkType::from_string("RuSt"), ChunkType::from_string("rust"));
}
