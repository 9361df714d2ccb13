#include "quantum/message_cipher.h"
#include "utils/logger.h"

namespace qkdsim {
namespace quantum {

Result<EncryptedMessage> encryptMessageDetailed(const std::string& message, const SiftedKey& siftedKey) {
    auto plaintext = encodeText(message);
    if (plaintext.failed()) return plaintext.error();

    auto expanded = expandKey(siftedKey, plaintext.value().size());
    if (expanded.failed()) return expanded.error();

    auto cipher = transform(plaintext.value(), expanded.value());
    if (cipher.failed()) return cipher.error();

    EncryptedMessage out;
    out.cipherBits = std::move(cipher.value());
    out.expandedKey = std::move(expanded.value());

    LOG_DEBUG("encrypted " + std::to_string(message.size()) + " bytes into " +
              std::to_string(out.cipherBits.size()) + " cipher bits");
    return out;
}

Result<CipherBits> encryptMessage(const std::string& message, const SiftedKey& siftedKey) {
    auto encrypted = encryptMessageDetailed(message, siftedKey);
    if (encrypted.failed()) return encrypted.error();
    return std::move(encrypted.value().cipherBits);
}

Result<std::string> decryptBits(const CipherBits& cipherBits, const ExpandedKey& expandedKey) {
    auto plaintext = transform(cipherBits, expandedKey);
    if (plaintext.failed()) return plaintext.error();
    return decodeBits(plaintext.value());
}

}
}
