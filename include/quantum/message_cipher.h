#pragma once

#include "quantum/bb84.h"
#include <string>

namespace qkdsim {
namespace quantum {

// Bit codec. Text is UTF-8; every code point must fit in one byte
// (U+0000..U+00FF) and becomes 8 bits, most significant first.
Result<PlaintextBits> encodeText(const std::string& text);
Result<std::string> decodeBits(const BitSequence& bits);

// Repeats the key cyclically and truncates it to exactly targetLength bits.
Result<ExpandedKey> expandKey(const SiftedKey& siftedKey, size_t targetLength);

// XOR keystream; applying it twice with the same key is the identity.
Result<BitSequence> transform(const BitSequence& bits, const BitSequence& key);

struct EncryptedMessage {
    CipherBits cipherBits;
    ExpandedKey expandedKey;
};

Result<EncryptedMessage> encryptMessageDetailed(const std::string& message, const SiftedKey& siftedKey);
Result<CipherBits> encryptMessage(const std::string& message, const SiftedKey& siftedKey);
Result<std::string> decryptBits(const CipherBits& cipherBits, const ExpandedKey& expandedKey);

}
}
