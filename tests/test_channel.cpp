#include <gtest/gtest.h>
#include "quantum/channel.h"
#include <cmath>

using namespace qkdsim;
using namespace qkdsim::quantum;

namespace {

const uint64_t STATISTICAL_SAMPLES = 100000;
const double FREQUENCY_TOLERANCE = 0.01;

double mismatchedZeroFrequency(ChannelOracle& oracle, uint64_t seed) {
    SeededRandomSource rng(seed);
    uint64_t zeros = 0;
    for (uint64_t i = 0; i < STATISTICAL_SAMPLES; i++) {
        SentSymbol sent;
        sent.bit = rng.nextBit();
        sent.basis = rng.nextBasis();
        Basis receiver = sent.basis == Basis::RECTILINEAR ? Basis::DIAGONAL : Basis::RECTILINEAR;
        if (oracle.measure(sent, receiver) == 0) zeros++;
    }
    return static_cast<double>(zeros) / STATISTICAL_SAMPLES;
}

void expectMatchedBasesEchoBit(ChannelOracle& oracle) {
    for (int i = 0; i < 1000; i++) {
        for (Bit bit : {0, 1}) {
            for (Basis basis : {Basis::RECTILINEAR, Basis::DIAGONAL}) {
                SentSymbol sent;
                sent.bit = bit;
                sent.basis = basis;
                ASSERT_EQ(oracle.measure(sent, basis), bit);
            }
        }
    }
}

}

class ChannelOracleTest : public ::testing::TestWithParam<std::string> {
protected:
    std::unique_ptr<ChannelOracle> makeOracle(uint64_t seed) {
        auto made = makeChannelOracle(GetParam(), true, seed);
        EXPECT_TRUE(made.ok());
        return std::move(made.value());
    }
};

TEST_P(ChannelOracleTest, MatchedBasesReturnSentBit) {
    auto oracle = makeOracle(11);
    ASSERT_NE(oracle, nullptr);
    expectMatchedBasesEchoBit(*oracle);
}

TEST_P(ChannelOracleTest, MismatchedBasesAreFairCoin) {
    auto oracle = makeOracle(12345);
    ASSERT_NE(oracle, nullptr);
    double freq = mismatchedZeroFrequency(*oracle, 777);
    EXPECT_NEAR(freq, 0.5, FREQUENCY_TOLERANCE);
}

TEST_P(ChannelOracleTest, MismatchedOutcomeIsIndependentOfSentBit) {
    auto oracle = makeOracle(31337);
    ASSERT_NE(oracle, nullptr);

    for (Bit bit : {0, 1}) {
        uint64_t zeros = 0;
        const uint64_t samples = STATISTICAL_SAMPLES / 2;
        for (uint64_t i = 0; i < samples; i++) {
            SentSymbol sent;
            sent.bit = bit;
            sent.basis = (i & 1) ? Basis::DIAGONAL : Basis::RECTILINEAR;
            Basis receiver = (i & 1) ? Basis::RECTILINEAR : Basis::DIAGONAL;
            if (oracle->measure(sent, receiver) == 0) zeros++;
        }
        EXPECT_NEAR(static_cast<double>(zeros) / samples, 0.5, FREQUENCY_TOLERANCE) << "sent bit " << int(bit);
    }
}

TEST_P(ChannelOracleTest, StatisticsReportNoMatchedDisagreements) {
    auto oracle = makeOracle(5);
    ASSERT_NE(oracle, nullptr);
    SeededRandomSource rng(6);

    OracleStatistics stats = measureOracleStatistics(*oracle, rng, STATISTICAL_SAMPLES);
    EXPECT_EQ(stats.samples, STATISTICAL_SAMPLES);
    EXPECT_EQ(stats.matchedSamples + stats.mismatchedSamples, STATISTICAL_SAMPLES);
    EXPECT_EQ(stats.matchedDisagreements, 0u);
    EXPECT_NEAR(stats.mismatchedZeroFrequency(), 0.5, FREQUENCY_TOLERANCE);
    EXPECT_NEAR(static_cast<double>(stats.matchedSamples) / STATISTICAL_SAMPLES, 0.5, FREQUENCY_TOLERANCE);
}

INSTANTIATE_TEST_SUITE_P(Backends, ChannelOracleTest, ::testing::Values("ideal", "circuit"));

TEST(CircuitChannelTest, BornProbabilities) {
    for (Bit bit : {0, 1}) {
        SentSymbol z;
        z.bit = bit;
        z.basis = Basis::RECTILINEAR;
        EXPECT_DOUBLE_EQ(CircuitChannelOracle::probabilityOfOne(z, Basis::RECTILINEAR), bit);
        EXPECT_NEAR(CircuitChannelOracle::probabilityOfOne(z, Basis::DIAGONAL), 0.5, 1e-9);

        SentSymbol x;
        x.bit = bit;
        x.basis = Basis::DIAGONAL;
        EXPECT_DOUBLE_EQ(CircuitChannelOracle::probabilityOfOne(x, Basis::DIAGONAL), bit);
        EXPECT_NEAR(CircuitChannelOracle::probabilityOfOne(x, Basis::RECTILINEAR), 0.5, 1e-9);
    }
}

TEST(CircuitChannelTest, CountsMeasurements) {
    CircuitChannelOracle oracle(1);
    SentSymbol sent;
    for (int i = 0; i < 10; i++) oracle.measure(sent, Basis::DIAGONAL);
    EXPECT_EQ(oracle.getMeasurementCount(), 10u);
}

TEST(ChannelFactoryTest, KnownAndUnknownNames) {
    auto ideal = makeChannelOracle("ideal", false, 0);
    ASSERT_TRUE(ideal.ok());
    EXPECT_EQ(ideal.value()->name(), "ideal");

    auto circuit = makeChannelOracle("circuit", true, 3);
    ASSERT_TRUE(circuit.ok());
    EXPECT_EQ(circuit.value()->name(), "circuit");

    auto unknown = makeChannelOracle("photonic", true, 3);
    ASSERT_TRUE(unknown.failed());
    EXPECT_EQ(unknown.error().code, ErrorCode::INVALID_ARGUMENT);
}

TEST(RandomSourceTest, SeededSourceIsReproducible) {
    SeededRandomSource a(42);
    SeededRandomSource b(42);
    for (int i = 0; i < 256; i++) {
        ASSERT_EQ(a.nextBit(), b.nextBit());
        ASSERT_EQ(a.nextBasis(), b.nextBasis());
    }
}

TEST(RandomSourceTest, EntropySourceProducesBothValues) {
    EntropyRandomSource rng;
    int ones = 0;
    const int draws = 4096;
    for (int i = 0; i < draws; i++) {
        Bit b = rng.nextBit();
        ASSERT_LE(b, 1);
        ones += b;
    }
    EXPECT_GT(ones, draws / 4);
    EXPECT_LT(ones, 3 * draws / 4);
}
