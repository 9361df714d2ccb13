#include "quantum/bb84.h"
#include "utils/logger.h"

namespace qkdsim {
namespace quantum {

Result<BitSequence> ChannelOracle::measureBatch(const std::vector<SentSymbol>& sent,
                                                const std::vector<Basis>& receiverBases) {
    if (sent.size() != receiverBases.size()) {
        return QKDSIM_ERROR(ErrorCode::LENGTH_MISMATCH,
                            "batch of " + std::to_string(sent.size()) + " symbols paired with " +
                            std::to_string(receiverBases.size()) + " bases");
    }

    BitSequence results(sent.size());
    for (size_t i = 0; i < sent.size(); i++) {
        results[i] = measure(sent[i], receiverBases[i]) & 1;
    }
    return results;
}

Basis RandomSource::nextBasis() {
    return (nextBit() & 1) ? Basis::DIAGONAL : Basis::RECTILINEAR;
}

static bool cancelled(const KeyAgreementOptions& options) {
    return options.cancel && options.cancel->load();
}

Result<KeyAgreementResult> runKeyAgreementDetailed(size_t roundCount,
                                                   ChannelOracle& oracle,
                                                   RandomSource& rng,
                                                   const KeyAgreementOptions& options) {
    if (roundCount == 0) {
        return QKDSIM_ERROR(ErrorCode::INVALID_ARGUMENT, "round count must be at least 1");
    }

    KeyAgreementResult result;
    result.transcript.resize(roundCount);

    // draw order per round is fixed: sender bit, sender basis, receiver basis
    for (size_t i = 0; i < roundCount; i++) {
        if (cancelled(options)) {
            return QKDSIM_ERROR(ErrorCode::CANCELLED, "key agreement cancelled at round " + std::to_string(i));
        }
        Round& round = result.transcript[i];
        round.index = i;
        round.sent.bit = rng.nextBit() & 1;
        round.sent.basis = rng.nextBasis();
        round.received.basis = rng.nextBasis();

        if (!options.batchOracle) {
            round.received.measuredBit = oracle.measure(round.sent, round.received.basis) & 1;
        }
    }

    if (options.batchOracle) {
        if (cancelled(options)) {
            return QKDSIM_ERROR(ErrorCode::CANCELLED, "key agreement cancelled before transmission");
        }
        std::vector<SentSymbol> sent;
        std::vector<Basis> bases;
        sent.reserve(roundCount);
        bases.reserve(roundCount);
        for (const auto& round : result.transcript) {
            sent.push_back(round.sent);
            bases.push_back(round.received.basis);
        }

        auto measured = oracle.measureBatch(sent, bases);
        if (measured.failed()) return measured.error();
        if (measured.value().size() != roundCount) {
            return QKDSIM_ERROR(ErrorCode::LENGTH_MISMATCH,
                                oracle.name() + " returned " + std::to_string(measured.value().size()) +
                                " results for " + std::to_string(roundCount) + " rounds");
        }
        for (size_t i = 0; i < roundCount; i++) {
            result.transcript[i].received.measuredBit = measured.value()[i] & 1;
        }
    }

    result.siftedKey = siftKey(result.transcript);

    LOG_DEBUG("BB84 over " + oracle.name() + ": " + std::to_string(roundCount) + " rounds, " +
              std::to_string(result.siftedKey.size()) + " matched");

    if (result.siftedKey.empty()) {
        return QKDSIM_ERROR(ErrorCode::KEY_AGREEMENT_FAILURE,
                            "no matching bases in " + std::to_string(roundCount) + " rounds");
    }

    return result;
}

Result<SiftedKey> runKeyAgreement(size_t roundCount, ChannelOracle& oracle, RandomSource& rng) {
    auto detailed = runKeyAgreementDetailed(roundCount, oracle, rng);
    if (detailed.failed()) return detailed.error();
    return std::move(detailed.value().siftedKey);
}

SiftedKey siftKey(const Transcript& transcript) {
    SiftedKey sifted;
    for (const auto& round : transcript) {
        if (round.basesMatch()) {
            sifted.push_back(round.sent.bit & 1);
        }
    }
    return sifted;
}

char basisSymbol(Basis basis) {
    return basis == Basis::DIAGONAL ? 'X' : 'Z';
}

std::string bitsToString(const BitSequence& bits) {
    std::string out;
    out.reserve(bits.size());
    for (Bit b : bits) out += (b & 1) ? '1' : '0';
    return out;
}

}
}
