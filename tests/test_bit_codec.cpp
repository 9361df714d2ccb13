#include <gtest/gtest.h>
#include "quantum/message_cipher.h"
#include <utility>
#include <vector>

using namespace qkdsim;
using namespace qkdsim::quantum;

namespace {

std::string utf8For(unsigned codePoint) {
    if (codePoint < 0x80) return std::string(1, static_cast<char>(codePoint));
    std::string out;
    out += static_cast<char>(0xC0 | (codePoint >> 6));
    out += static_cast<char>(0x80 | (codePoint & 0x3F));
    return out;
}

}

TEST(BitCodecTest, EncodesMostSignificantBitFirst) {
    auto bits = encodeText("HI");
    ASSERT_TRUE(bits.ok());
    EXPECT_EQ(bitsToString(bits.value()), "0100100001001001");
}

TEST(BitCodecTest, EmptyTextIsEmptyBits) {
    auto bits = encodeText("");
    ASSERT_TRUE(bits.ok());
    EXPECT_TRUE(bits.value().empty());

    auto text = decodeBits(BitSequence());
    ASSERT_TRUE(text.ok());
    EXPECT_EQ(text.value(), "");
}

TEST(BitCodecTest, EightBitsPerCharacter) {
    std::string message = "The quick brown fox";
    auto bits = encodeText(message);
    ASSERT_TRUE(bits.ok());
    EXPECT_EQ(bits.value().size(), message.size() * 8);

    auto text = decodeBits(bits.value());
    ASSERT_TRUE(text.ok());
    EXPECT_EQ(text.value(), message);
}

TEST(BitCodecTest, LatinOneCharactersUseOneByte) {
    // U+00E9 and U+00FF
    std::string message = "caf\xC3\xA9 \xC3\xBF";
    auto bits = encodeText(message);
    ASSERT_TRUE(bits.ok());
    EXPECT_EQ(bits.value().size(), 6u * 8);

    BitSequence eAcute(bits.value().begin() + 24, bits.value().begin() + 32);
    EXPECT_EQ(bitsToString(eAcute), "11101001");

    auto text = decodeBits(bits.value());
    ASSERT_TRUE(text.ok());
    EXPECT_EQ(text.value(), message);
}

TEST(BitCodecTest, EveryOneByteCodePointRoundTrips) {
    std::string all;
    for (unsigned cp = 0; cp <= 0xFF; cp++) {
        std::string text = utf8For(cp);
        all += text;

        auto bits = encodeText(text);
        ASSERT_TRUE(bits.ok()) << "U+" << std::hex << cp;
        ASSERT_EQ(bits.value().size(), 8u);
        for (int i = 0; i < 8; i++) {
            EXPECT_EQ(bits.value()[i], (cp >> (7 - i)) & 1) << "U+" << std::hex << cp << " bit " << i;
        }

        auto decoded = decodeBits(bits.value());
        ASSERT_TRUE(decoded.ok());
        EXPECT_EQ(decoded.value(), text) << "U+" << std::hex << cp;
    }

    auto bits = encodeText(all);
    ASSERT_TRUE(bits.ok());
    EXPECT_EQ(bits.value().size(), 256u * 8);
    auto decoded = decodeBits(bits.value());
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.value(), all);
}

TEST(BitCodecTest, RejectsCharactersAboveOneByte) {
    const std::vector<std::pair<std::string, std::string>> cases = {
        {"\xC4\x80", "U+0100"},
        {"\xE2\x82\xAC", "U+20AC"},
        {"ok\xF0\x9F\x98\x80", "U+1F600"},
    };
    for (const auto& c : cases) {
        auto bits = encodeText(c.first);
        ASSERT_TRUE(bits.failed()) << c.second;
        EXPECT_EQ(bits.error().code, ErrorCode::UNSUPPORTED_CHARACTER);
        EXPECT_NE(bits.error().message.find(c.second), std::string::npos) << bits.error().message;
        EXPECT_NE(bits.error().message.find("does not fit in 8 bits"), std::string::npos);
    }

    auto late = encodeText("ok\xF0\x9F\x98\x80");
    ASSERT_TRUE(late.failed());
    EXPECT_NE(late.error().message.find("byte offset 2"), std::string::npos) << late.error().message;
}

TEST(BitCodecTest, RejectsMalformedUtf8) {
    // truncated, missing continuation, overlong, stray continuation, invalid lead bytes
    for (const std::string& text : {std::string("\xC3"), std::string("\xC3\x41"),
                                    std::string("\xC1\x81"), std::string("\x80"),
                                    std::string("a\xBF"), std::string("\xF8\x88\x80\x80\x80"),
                                    std::string("\xFF"), std::string("\xED\xA0\x80")}) {
        auto bits = encodeText(text);
        ASSERT_TRUE(bits.failed());
        EXPECT_EQ(bits.error().code, ErrorCode::UNSUPPORTED_CHARACTER);
        EXPECT_NE(bits.error().message.find("malformed UTF-8"), std::string::npos) << bits.error().message;
        EXPECT_EQ(bits.error().message.find("does not fit"), std::string::npos) << bits.error().message;
    }
}

TEST(BitCodecTest, StrayContinuationByteIsNamed) {
    auto bits = encodeText("a\x80");
    ASSERT_TRUE(bits.failed());
    EXPECT_NE(bits.error().message.find("0x80"), std::string::npos) << bits.error().message;
    EXPECT_NE(bits.error().message.find("byte offset 1"), std::string::npos) << bits.error().message;
}

TEST(BitCodecTest, DecodeRejectsPartialCharacters) {
    for (size_t length : {1u, 7u, 9u, 15u}) {
        auto text = decodeBits(BitSequence(length, 0));
        ASSERT_TRUE(text.failed()) << length << " bits";
        EXPECT_EQ(text.error().code, ErrorCode::MALFORMED_BIT_LENGTH);
    }
}
