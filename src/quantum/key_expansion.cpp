#include "quantum/message_cipher.h"

namespace qkdsim {
namespace quantum {

Result<ExpandedKey> expandKey(const SiftedKey& siftedKey, size_t targetLength) {
    if (siftedKey.empty()) {
        return QKDSIM_ERROR(ErrorCode::KEY_EXPANSION_ERROR,
                            "cannot expand an empty key to " + std::to_string(targetLength) + " bits");
    }
    if (targetLength == 0) {
        return ExpandedKey();
    }

    ExpandedKey expanded(targetLength);
    for (size_t i = 0; i < targetLength; i++) {
        expanded[i] = siftedKey[i % siftedKey.size()] & 1;
    }
    return expanded;
}

}
}
