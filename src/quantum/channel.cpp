#include "quantum/channel.h"
#include "utils/logger.h"
#include <array>
#include <cmath>
#include <complex>
#include <fstream>
#include <mutex>
#include <random>

namespace qkdsim {
namespace quantum {

namespace {

using c64 = std::complex<double>;
using Qubit = std::array<c64, 2>;

constexpr double PROBABILITY_EPSILON = 1e-12;

void applyX(Qubit& q) {
    std::swap(q[0], q[1]);
}

void applyH(Qubit& q) {
    const double s = 1.0 / std::sqrt(2.0);
    c64 a0 = q[0];
    c64 a1 = q[1];
    q[0] = s * (a0 + a1);
    q[1] = s * (a0 - a1);
}

Qubit prepare(const SentSymbol& sent) {
    Qubit q = {c64(1.0, 0.0), c64(0.0, 0.0)};
    if (sent.bit & 1) applyX(q);
    if (sent.basis == Basis::DIAGONAL) applyH(q);
    return q;
}

}

struct IdealChannelOracle::Impl {
    mutable std::mutex mtx;
    std::mt19937_64 rng;

    Impl() : rng(std::random_device{}()) {}
    explicit Impl(uint64_t seed) : rng(seed) {}
};

IdealChannelOracle::IdealChannelOracle() : impl_(std::make_unique<Impl>()) {}
IdealChannelOracle::IdealChannelOracle(uint64_t seed) : impl_(std::make_unique<Impl>(seed)) {}
IdealChannelOracle::~IdealChannelOracle() = default;

Bit IdealChannelOracle::measure(const SentSymbol& sent, Basis receiverBasis) {
    if (sent.basis == receiverBasis) {
        return sent.bit & 1;
    }
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return static_cast<Bit>(impl_->rng() & 1);
}

struct CircuitChannelOracle::Impl {
    mutable std::mutex mtx;
    std::mt19937_64 rng;
    std::uniform_real_distribution<double> uniform{0.0, 1.0};
    uint64_t measurements = 0;

    Impl() : rng(std::random_device{}()) {}
    explicit Impl(uint64_t seed) : rng(seed) {}
};

CircuitChannelOracle::CircuitChannelOracle() : impl_(std::make_unique<Impl>()) {}
CircuitChannelOracle::CircuitChannelOracle(uint64_t seed) : impl_(std::make_unique<Impl>(seed)) {}
CircuitChannelOracle::~CircuitChannelOracle() = default;

double CircuitChannelOracle::probabilityOfOne(const SentSymbol& sent, Basis receiverBasis) {
    Qubit q = prepare(sent);
    if (receiverBasis == Basis::DIAGONAL) applyH(q);

    double p1 = std::norm(q[1]);
    if (p1 < PROBABILITY_EPSILON) return 0.0;
    if (p1 > 1.0 - PROBABILITY_EPSILON) return 1.0;
    return p1;
}

Bit CircuitChannelOracle::measure(const SentSymbol& sent, Basis receiverBasis) {
    double p1 = probabilityOfOne(sent, receiverBasis);

    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->measurements++;
    if (p1 == 0.0) return 0;
    if (p1 == 1.0) return 1;
    return impl_->uniform(impl_->rng) < p1 ? 1 : 0;
}

uint64_t CircuitChannelOracle::getMeasurementCount() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->measurements;
}

Result<std::unique_ptr<ChannelOracle>> makeChannelOracle(const std::string& name, bool seeded, uint64_t seed) {
    // the oracle stream is decorrelated from the symbol stream sharing the same seed
    const uint64_t oracleSeed = seed ^ 0x9e3779b97f4a7c15ULL;
    std::unique_ptr<ChannelOracle> oracle;
    if (name == "ideal") {
        oracle = seeded ? std::make_unique<IdealChannelOracle>(oracleSeed)
                        : std::make_unique<IdealChannelOracle>();
    } else if (name == "circuit") {
        oracle = seeded ? std::make_unique<CircuitChannelOracle>(oracleSeed)
                        : std::make_unique<CircuitChannelOracle>();
    } else {
        return QKDSIM_ERROR(ErrorCode::INVALID_ARGUMENT, "unknown channel oracle '" + name + "'");
    }
    return Result<std::unique_ptr<ChannelOracle>>(std::move(oracle));
}

struct SeededRandomSource::Impl {
    std::mt19937_64 rng;
    explicit Impl(uint64_t seed) : rng(seed) {}
};

SeededRandomSource::SeededRandomSource(uint64_t seed) : impl_(std::make_unique<Impl>(seed)) {}
SeededRandomSource::~SeededRandomSource() = default;

Bit SeededRandomSource::nextBit() {
    return static_cast<Bit>(impl_->rng() & 1);
}

struct EntropyRandomSource::Impl {
    static constexpr size_t BLOCK_SIZE = 256;

    std::mt19937_64 rng;
    std::array<uint8_t, BLOCK_SIZE> block{};
    size_t bitPos = BLOCK_SIZE * 8;
    bool systemDevice = true;

    Impl() : rng(std::random_device{}()) {}

    bool readDevRandom() {
        std::ifstream urandom("/dev/urandom", std::ios::binary);
        if (!urandom.is_open()) return false;
        urandom.read(reinterpret_cast<char*>(block.data()), block.size());
        return urandom.good();
    }

    void refill() {
        if (systemDevice && !readDevRandom()) {
            systemDevice = false;
            LOG_WARN("EntropyRandomSource: /dev/urandom unavailable, using mt19937_64");
        }
        if (!systemDevice) {
            for (auto& b : block) b = static_cast<uint8_t>(rng());
        }
        bitPos = 0;
    }
};

EntropyRandomSource::EntropyRandomSource() : impl_(std::make_unique<Impl>()) {}
EntropyRandomSource::~EntropyRandomSource() = default;

Bit EntropyRandomSource::nextBit() {
    if (impl_->bitPos >= Impl::BLOCK_SIZE * 8) impl_->refill();
    size_t pos = impl_->bitPos++;
    return static_cast<Bit>((impl_->block[pos / 8] >> (7 - pos % 8)) & 1);
}

OracleStatistics measureOracleStatistics(ChannelOracle& oracle, RandomSource& rng, uint64_t samples) {
    OracleStatistics stats;
    for (uint64_t i = 0; i < samples; i++) {
        SentSymbol sent;
        sent.bit = rng.nextBit() & 1;
        sent.basis = rng.nextBasis();
        Basis receiverBasis = rng.nextBasis();
        Bit measured = oracle.measure(sent, receiverBasis) & 1;

        stats.samples++;
        if (receiverBasis == sent.basis) {
            stats.matchedSamples++;
            if (measured != sent.bit) stats.matchedDisagreements++;
        } else {
            stats.mismatchedSamples++;
            if (measured == 0) stats.mismatchedZeros++;
        }
    }
    return stats;
}

}
}
