#include "quantum/message_cipher.h"
#include <cstdio>

namespace qkdsim {
namespace quantum {

static constexpr size_t BITS_PER_CHAR = 8;

static std::string describeOffset(size_t offset) {
    return "byte offset " + std::to_string(offset);
}

static std::string describeCodePoint(uint32_t codePoint) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(codePoint));
    return buf;
}

// Sequence length announced by a UTF-8 lead byte, or 0 when the byte cannot
// start a sequence (a continuation byte or 0xF8 and above).
static size_t sequenceLength(uint8_t lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

Result<PlaintextBits> encodeText(const std::string& text) {
    static const uint8_t LEAD_MASK[] = {0, 0x7F, 0x1F, 0x0F, 0x07};
    static const uint32_t MIN_CODE_POINT[] = {0, 0, 0x80, 0x800, 0x10000};

    PlaintextBits bits;
    bits.reserve(text.size() * BITS_PER_CHAR);

    size_t i = 0;
    while (i < text.size()) {
        uint8_t lead = static_cast<uint8_t>(text[i]);
        size_t length = sequenceLength(lead);
        if (length == 0) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "0x%02X", static_cast<unsigned>(lead));
            return QKDSIM_ERROR(ErrorCode::UNSUPPORTED_CHARACTER,
                                std::string("malformed UTF-8: unexpected byte ") + buf + " at " + describeOffset(i));
        }
        if (i + length > text.size()) {
            return QKDSIM_ERROR(ErrorCode::UNSUPPORTED_CHARACTER,
                                "malformed UTF-8: truncated sequence at " + describeOffset(i));
        }

        uint32_t codePoint = lead & LEAD_MASK[length];
        for (size_t k = 1; k < length; k++) {
            uint8_t cont = static_cast<uint8_t>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return QKDSIM_ERROR(ErrorCode::UNSUPPORTED_CHARACTER,
                                    "malformed UTF-8: missing continuation byte at " + describeOffset(i + k));
            }
            codePoint = (codePoint << 6) | (cont & 0x3F);
        }

        if (codePoint < MIN_CODE_POINT[length] || codePoint > 0x10FFFF ||
            (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
            return QKDSIM_ERROR(ErrorCode::UNSUPPORTED_CHARACTER,
                                "malformed UTF-8: invalid sequence at " + describeOffset(i));
        }
        if (codePoint > 0xFF) {
            return QKDSIM_ERROR(ErrorCode::UNSUPPORTED_CHARACTER,
                                "character " + describeCodePoint(codePoint) + " at " + describeOffset(i) +
                                " does not fit in 8 bits");
        }
        i += length;

        for (size_t b = 0; b < BITS_PER_CHAR; b++) {
            bits.push_back(static_cast<Bit>((codePoint >> (BITS_PER_CHAR - 1 - b)) & 1));
        }
    }
    return bits;
}

Result<std::string> decodeBits(const BitSequence& bits) {
    if (bits.size() % BITS_PER_CHAR != 0) {
        return QKDSIM_ERROR(ErrorCode::MALFORMED_BIT_LENGTH,
                            std::to_string(bits.size()) + " bits is not a multiple of 8");
    }

    std::string text;
    text.reserve(bits.size() / BITS_PER_CHAR);
    for (size_t i = 0; i < bits.size(); i += BITS_PER_CHAR) {
        uint32_t codePoint = 0;
        for (size_t b = 0; b < BITS_PER_CHAR; b++) {
            codePoint = (codePoint << 1) | (bits[i + b] & 1);
        }
        if (codePoint < 0x80) {
            text += static_cast<char>(codePoint);
        } else {
            text += static_cast<char>(0xC0 | (codePoint >> 6));
            text += static_cast<char>(0x80 | (codePoint & 0x3F));
        }
    }
    return text;
}

}
}
