#pragma once

#include "quantum/bb84.h"
#include "quantum/message_cipher.h"
#include "utils/config.h"
#include <atomic>
#include <memory>
#include <string>

namespace qkdsim {
namespace quantum {

struct SimulationConfig {
    uint32_t rounds = 8;
    std::string oracle = "ideal";
    bool batchOracle = false;
    bool seeded = false;
    uint64_t seed = 0;
    uint32_t maxAttempts = 1;
    uint32_t roundGrowth = 2;

    static SimulationConfig fromConfig(const utils::Config& config);
    // Rejects protocol and retry values that fromConfig would replace with
    // defaults, such as "5billion" or a non-numeric seed.
    static Result<void> checkConfig(const utils::Config& config);
    Result<void> validate() const;
};

struct SimulationReport {
    std::string message;
    std::string oracle;
    Transcript transcript;
    SiftedKey siftedKey;
    PlaintextBits plaintextBits;
    ExpandedKey expandedKey;
    CipherBits cipherBits;
    std::string decryptedMessage;
    uint32_t attempts = 0;
    size_t roundsUsed = 0;
    bool roundTripOk = false;
};

class QkdSimulator {
public:
    explicit QkdSimulator(const SimulationConfig& config);
    ~QkdSimulator();

    // Replaces the configured backends. Either may be null to keep the default.
    void setOracle(std::shared_ptr<ChannelOracle> oracle);
    void setRandomSource(std::shared_ptr<RandomSource> rng);
    void setCancelFlag(const std::atomic<bool>* cancel);

    Result<SimulationReport> run(const std::string& message);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

std::string basesToString(const Transcript& transcript, bool receiver);
std::string formatReport(const SimulationReport& report);
std::string formatTranscriptTable(const Transcript& transcript);

}
}
