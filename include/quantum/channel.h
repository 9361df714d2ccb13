#pragma once

#include "quantum/bb84.h"
#include <memory>
#include <cstdint>

namespace qkdsim {
namespace quantum {

// Contract-level oracle: matched bases echo the bit, mismatched bases flip a
// fair coin.
class IdealChannelOracle : public ChannelOracle {
public:
    IdealChannelOracle();
    explicit IdealChannelOracle(uint64_t seed);
    ~IdealChannelOracle() override;

    Bit measure(const SentSymbol& sent, Basis receiverBasis) override;
    std::string name() const override { return "ideal"; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Single-qubit state-vector simulation. The sender prepares |0>, applies X
// for bit 1 and then H for the diagonal basis; the receiver applies H for the
// diagonal basis and samples the Born distribution.
class CircuitChannelOracle : public ChannelOracle {
public:
    CircuitChannelOracle();
    explicit CircuitChannelOracle(uint64_t seed);
    ~CircuitChannelOracle() override;

    Bit measure(const SentSymbol& sent, Basis receiverBasis) override;
    std::string name() const override { return "circuit"; }

    // Probability of reading 1 for the given preparation and measurement.
    static double probabilityOfOne(const SentSymbol& sent, Basis receiverBasis);

    uint64_t getMeasurementCount() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

Result<std::unique_ptr<ChannelOracle>> makeChannelOracle(const std::string& name, bool seeded, uint64_t seed);

class SeededRandomSource : public RandomSource {
public:
    explicit SeededRandomSource(uint64_t seed);
    ~SeededRandomSource() override;

    Bit nextBit() override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Draws from /dev/urandom in blocks, falling back to a std::random_device
// seeded generator when the device cannot be read.
class EntropyRandomSource : public RandomSource {
public:
    EntropyRandomSource();
    ~EntropyRandomSource() override;

    Bit nextBit() override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

struct OracleStatistics {
    uint64_t samples = 0;
    uint64_t matchedSamples = 0;
    uint64_t matchedDisagreements = 0;
    uint64_t mismatchedSamples = 0;
    uint64_t mismatchedZeros = 0;

    double mismatchedZeroFrequency() const {
        return mismatchedSamples == 0 ? 0.0 :
               static_cast<double>(mismatchedZeros) / static_cast<double>(mismatchedSamples);
    }
};

OracleStatistics measureOracleStatistics(ChannelOracle& oracle, RandomSource& rng, uint64_t samples);

}
}
