#pragma once

#include "infrastructure/error_handling.h"
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace qkdsim {
namespace quantum {

using Bit = uint8_t;

enum class Basis : uint8_t {
    RECTILINEAR = 0,
    DIAGONAL = 1
};

using BitSequence = std::vector<Bit>;
using SiftedKey = BitSequence;
using ExpandedKey = BitSequence;
using PlaintextBits = BitSequence;
using CipherBits = BitSequence;

struct SentSymbol {
    Bit bit = 0;
    Basis basis = Basis::RECTILINEAR;
};

struct ReceivedSymbol {
    Basis basis = Basis::RECTILINEAR;
    Bit measuredBit = 0;
};

struct Round {
    size_t index = 0;
    SentSymbol sent;
    ReceivedSymbol received;

    bool basesMatch() const { return sent.basis == received.basis; }
};

using Transcript = std::vector<Round>;

// Stochastic channel between sender and receiver. A measurement in the
// sender's basis must return the sent bit; any other basis returns a fair
// coin independent of it.
class ChannelOracle {
public:
    virtual ~ChannelOracle() = default;

    virtual Bit measure(const SentSymbol& sent, Basis receiverBasis) = 0;

    // Pairs sent[i] with receiverBases[i]. Fails with LENGTH_MISMATCH on
    // unequal inputs.
    virtual Result<BitSequence> measureBatch(const std::vector<SentSymbol>& sent,
                                             const std::vector<Basis>& receiverBases);

    virtual std::string name() const { return "oracle"; }
};

class RandomSource {
public:
    virtual ~RandomSource() = default;

    virtual Bit nextBit() = 0;
    virtual Basis nextBasis();
};

struct KeyAgreementOptions {
    bool batchOracle = false;
    const std::atomic<bool>* cancel = nullptr;
};

struct KeyAgreementResult {
    Transcript transcript;
    SiftedKey siftedKey;
};

Result<KeyAgreementResult> runKeyAgreementDetailed(size_t roundCount,
                                                   ChannelOracle& oracle,
                                                   RandomSource& rng,
                                                   const KeyAgreementOptions& options = KeyAgreementOptions());

Result<SiftedKey> runKeyAgreement(size_t roundCount, ChannelOracle& oracle, RandomSource& rng);

SiftedKey siftKey(const Transcript& transcript);

char basisSymbol(Basis basis);
std::string bitsToString(const BitSequence& bits);

}
}
