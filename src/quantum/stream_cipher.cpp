#include "quantum/message_cipher.h"

namespace qkdsim {
namespace quantum {

Result<BitSequence> transform(const BitSequence& bits, const BitSequence& key) {
    if (bits.size() != key.size()) {
        return QKDSIM_ERROR(ErrorCode::LENGTH_MISMATCH,
                            std::to_string(bits.size()) + " data bits against " +
                            std::to_string(key.size()) + " key bits");
    }

    BitSequence out(bits.size());
    for (size_t i = 0; i < bits.size(); i++) {
        out[i] = (bits[i] ^ key[i]) & 1;
    }
    return out;
}

}
}
