/**
 * @file commands_tests.cpp
 * @brief File-level encode / decode / remove / print
 */

#include "test_helpers.hpp"
#include "commands.hpp"
#include <gtest/gtest.h>

// ============================================================================
// File I/O
// ============================================================================

TEST_F(PngFileTest, ReadAll_MissingFile) {
    try {
        (void)pngme::read_all(path("missing.png"));
        FAIL() << "Expected IOError";
    } catch (const pngme::IOError& e) {
        EXPECT_EQ(e.path(), path("missing.png"));
    }
}

TEST_F(PngFileTest, ReadAll_Directory) {
    EXPECT_THROW(pngme::read_all(dir.string()), pngme::IOError);
}

TEST_F(PngFileTest, WriteAll_Truncates) {
    const auto p = path("out.bin");
    pngme::write_all(p, std::vector<uint8_t>(64, 0xAA));
    pngme::write_all(p, {1, 2, 3});
    expectBytes(pngme::read_all(p), {1, 2, 3});
}

TEST_F(PngFileTest, WriteAll_MissingDirectory) {
    EXPECT_THROW(pngme::write_all(path("no/such/dir/out.png"), {1}), pngme::IOError);
}

// ============================================================================
// encode / decode
// ============================================================================

TEST_F(PngFileTest, EncodeThenDecode) {
    const auto src = writeSample("in.png");
    const auto dst = path("out.png");

    pngme::encode(src, dst, "ruSt", TestConstants::MESSAGE);

    EXPECT_EQ(pngme::decode(dst, "ruSt"), TestConstants::MESSAGE);
    expectBytes(pngme::read_all(src), makeSampleBytes(), "source untouched");
}

TEST_F(PngFileTest, EncodeAppendsAfterExistingChunks) {
    const auto src = writeSample("in.png");
    const auto dst = path("out.png");

    pngme::encode(src, dst, "ruSt", "hidden");

    const auto png = pngme::Png::parse(pngme::read_all(dst));
    ASSERT_EQ(png.chunks().size(), 6u);
    EXPECT_EQ(png.chunks().back().chunk_type().to_string(), "ruSt");
}

TEST_F(PngFileTest, EncodeInPlace) {
    const auto src = writeSample("in.png");
    pngme::encode(src, src, "ruSt", "in place");
    EXPECT_EQ(pngme::decode(src, "ruSt"), "in place");
}

TEST_F(PngFileTest, EncodeRejectsBadType) {
    const auto src = writeSample("in.png");
    const auto dst = path("out.png");

    EXPECT_THROW(pngme::encode(src, dst, "ru5t", "x"), pngme::ValidationError);
    EXPECT_FALSE(std::filesystem::exists(dst));
}

TEST_F(PngFileTest, EncodeRejectsNonPngSource) {
    const auto src = path("text.txt");
    pngme::write_all(src, toBytes("plain text, not an image"));

    try {
        pngme::encode(src, path("out.png"), "ruSt", "x");
        FAIL() << "Expected FormatError";
    } catch (const pngme::FormatError& e) {
        EXPECT_EQ(e.kind(), pngme::FormatError::Kind::BadSignature);
    }
}

TEST_F(PngFileTest, DecodeMissingChunk) {
    const auto src = writeSample("in.png");
    EXPECT_THROW(pngme::decode(src, "ruSt"), pngme::NotFoundError);
}

TEST_F(PngFileTest, DecodeBinaryPayload) {
    auto png = makeSamplePng();
    png.append_chunk(makeBinaryChunk("biNa", {0xFF, 0xFE}));
    const auto src = path("in.png");
    pngme::write_all(src, png.serialize());

    EXPECT_THROW(pngme::decode(src, "biNa"), pngme::TextEncodingError);
}

TEST_F(PngFileTest, DecodeMissingFile) {
    EXPECT_THROW(pngme::decode(path("missing.png"), "ruSt"), pngme::IOError);
}

// ============================================================================
// remove
// ============================================================================

TEST_F(PngFileTest, RemoveRewritesSource) {
    const auto src = writeSample("in.png");
    const auto dst = path("out.png");
    pngme::encode(src, dst, "ruSt", "secret");

    const auto removed = pngme::remove(dst, "ruSt");
    EXPECT_EQ(removed.data_as_string(), "secret");

    expectBytes(pngme::read_all(dst), makeSampleBytes(), "after remove");
    EXPECT_THROW(pngme::decode(dst, "ruSt"), pngme::NotFoundError);
}

TEST_F(PngFileTest, RemoveMissingChunkLeavesFileAlone) {
    const auto src = writeSample("in.png");
    EXPECT_THROW(pngme::remove(src, "ruSt"), pngme::NotFoundError);

    expectBytes(pngme::read_all(src), makeSampleBytes(), "unchanged");
}

TEST_F(PngFileTest, RemoveCorruptFileLeavesFileAlone) {
    auto bytes = makeSampleBytes();
    bytes[png::SIGNATURE_SIZE + png::CHUNK_DATA_OFFSET] ^= 0x01;
    const auto src = path("corrupt.png");
    pngme::write_all(src, bytes);

    EXPECT_THROW(pngme::remove(src, "FrSt"), pngme::FormatError);
    expectBytes(pngme::read_all(src), bytes, "unchanged");
}

// ============================================================================
// print
// ============================================================================

TEST_F(PngFileTest, PrintListsChunks) {
    const auto src = writeSample("in.png");
    const auto text = pngme::print(src);

    EXPECT_NE(text.find("Type: IHDR"), std::string::npos) << text;
    EXPECT_NE(text.find("\"I am another chunk\""), std::string::npos) << text;
    EXPECT_NE(text.find("Type: IEND"), std::string::npos) << text;
}
