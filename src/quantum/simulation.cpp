#include "quantum/simulation.h"
#include "quantum/channel.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <algorithm>
#include <mutex>
#include <sstream>

namespace qkdsim {
namespace quantum {

static constexpr uint32_t MAX_ROUNDS = 1u << 24;

SimulationConfig SimulationConfig::fromConfig(const utils::Config& config) {
    utils::ProtocolConfig protocol = config.getProtocolConfig();
    utils::RetryConfig retry = config.getRetryConfig();

    SimulationConfig cfg;
    cfg.rounds = protocol.rounds;
    cfg.oracle = protocol.oracle;
    cfg.batchOracle = protocol.batchOracle;
    cfg.seeded = protocol.seeded;
    cfg.seed = protocol.seed;
    cfg.maxAttempts = retry.maxAttempts;
    cfg.roundGrowth = retry.roundGrowth;
    return cfg;
}

Result<void> SimulationConfig::checkConfig(const utils::Config& config) {
    for (const char* key : {"protocol.rounds", "protocol.seed", "retry.max_attempts", "retry.round_growth"}) {
        QKDSIM_CHECK(config.isUnsigned(key), ErrorCode::CONFIG_ERROR,
                     std::string(key) + " must be a decimal integer, got '" + config.getString(key) + "'");
    }
    QKDSIM_CHECK(config.isBool("protocol.batch_oracle"), ErrorCode::CONFIG_ERROR,
                 "protocol.batch_oracle must be true or false, got '" + config.getString("protocol.batch_oracle") + "'");
    return Result<void>();
}

Result<void> SimulationConfig::validate() const {
    QKDSIM_CHECK(rounds >= 1, ErrorCode::INVALID_ARGUMENT, "protocol.rounds must be at least 1");
    QKDSIM_CHECK(rounds <= MAX_ROUNDS, ErrorCode::INVALID_ARGUMENT,
                 "protocol.rounds must not exceed " + std::to_string(MAX_ROUNDS));
    QKDSIM_CHECK(maxAttempts >= 1, ErrorCode::INVALID_ARGUMENT, "retry.max_attempts must be at least 1");
    QKDSIM_CHECK(roundGrowth >= 1, ErrorCode::INVALID_ARGUMENT, "retry.round_growth must be at least 1");
    QKDSIM_CHECK(oracle == "ideal" || oracle == "circuit", ErrorCode::INVALID_ARGUMENT,
                 "protocol.oracle must be 'ideal' or 'circuit', got '" + oracle + "'");
    return Result<void>();
}

struct QkdSimulator::Impl {
    mutable std::mutex mtx;
    SimulationConfig config;
    std::shared_ptr<ChannelOracle> oracle;
    std::shared_ptr<RandomSource> rng;
    const std::atomic<bool>* cancel = nullptr;

    Result<void> ensureBackends();
};

Result<void> QkdSimulator::Impl::ensureBackends() {
    if (!oracle) {
        auto made = makeChannelOracle(config.oracle, config.seeded, config.seed);
        if (made.failed()) return made.error();
        oracle = std::shared_ptr<ChannelOracle>(std::move(made.value()));
    }
    if (!rng) {
        if (config.seeded) {
            rng = std::make_shared<SeededRandomSource>(config.seed);
        } else {
            rng = std::make_shared<EntropyRandomSource>();
        }
    }
    return Result<void>();
}

QkdSimulator::QkdSimulator(const SimulationConfig& config) : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
}

QkdSimulator::~QkdSimulator() = default;

void QkdSimulator::setOracle(std::shared_ptr<ChannelOracle> oracle) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->oracle = oracle;
}

void QkdSimulator::setRandomSource(std::shared_ptr<RandomSource> rng) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->rng = rng;
}

void QkdSimulator::setCancelFlag(const std::atomic<bool>* cancel) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->cancel = cancel;
}

Result<SimulationReport> QkdSimulator::run(const std::string& message) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    QKDSIM_CONTEXT("simulation");

    auto valid = impl_->config.validate();
    if (valid.failed()) {
        ErrorHandler::instance().handle(valid.error());
        return valid.error();
    }

    auto backends = impl_->ensureBackends();
    if (backends.failed()) {
        ErrorHandler::instance().handle(backends.error());
        return backends.error();
    }

    SimulationReport report;
    report.message = message;
    report.oracle = impl_->oracle->name();

    auto plaintext = encodeText(message);
    if (plaintext.failed()) {
        ErrorHandler::instance().handle(plaintext.error());
        return plaintext.error();
    }
    report.plaintextBits = plaintext.value();

    KeyAgreementOptions options;
    options.batchOracle = impl_->config.batchOracle;
    options.cancel = impl_->cancel;

    size_t rounds = impl_->config.rounds;
    for (uint32_t attempt = 1; attempt <= impl_->config.maxAttempts; attempt++) {
        QKDSIM_CONTEXT("attempt " + std::to_string(attempt));
        report.attempts = attempt;
        report.roundsUsed = rounds;

        LOG_INFO("BB84 attempt " + std::to_string(attempt) + " with " + std::to_string(rounds) +
                 " rounds over " + report.oracle + " channel");

        auto agreed = runKeyAgreementDetailed(rounds, *impl_->oracle, *impl_->rng, options);
        if (agreed.ok()) {
            report.transcript = std::move(agreed.value().transcript);
            report.siftedKey = std::move(agreed.value().siftedKey);
            break;
        }

        ErrorHandler::instance().handle(agreed.error());
        bool retryable = agreed.error().code == ErrorCode::KEY_AGREEMENT_FAILURE &&
                         attempt < impl_->config.maxAttempts;
        if (!retryable) {
            return agreed.error();
        }

        LOG_WARN("No matching bases in " + std::to_string(rounds) + " rounds, retrying");
        rounds = std::min<size_t>(rounds * impl_->config.roundGrowth, MAX_ROUNDS);
    }

    LOG_INFO("Sifted " + std::to_string(report.siftedKey.size()) + " of " +
             std::to_string(report.roundsUsed) + " rounds, key " +
             utils::Logger::redactKeyBits(bitsToString(report.siftedKey)));

    auto encrypted = encryptMessageDetailed(message, report.siftedKey);
    if (encrypted.failed()) {
        ErrorHandler::instance().handle(encrypted.error());
        return encrypted.error();
    }
    report.cipherBits = std::move(encrypted.value().cipherBits);
    report.expandedKey = std::move(encrypted.value().expandedKey);

    auto decrypted = decryptBits(report.cipherBits, report.expandedKey);
    if (decrypted.failed()) {
        ErrorHandler::instance().handle(decrypted.error());
        return decrypted.error();
    }
    report.decryptedMessage = decrypted.value();
    report.roundTripOk = report.decryptedMessage == message;

    if (!report.roundTripOk) {
        Error err = QKDSIM_ERROR(ErrorCode::INTERNAL_ERROR, "decrypted message differs from the input");
        err.severity = ErrorSeverity::CRITICAL;
        ErrorHandler::instance().handle(err);
        return err;
    }

    LOG_INFO("Round trip complete: " + std::to_string(report.cipherBits.size()) + " cipher bits");
    return report;
}

std::string basesToString(const Transcript& transcript, bool receiver) {
    std::string out;
    out.reserve(transcript.size());
    for (const auto& round : transcript) {
        out += basisSymbol(receiver ? round.received.basis : round.sent.basis);
    }
    return out;
}

std::string formatReport(const SimulationReport& report) {
    BitSequence senderBits;
    BitSequence receiverResults;
    for (const auto& round : report.transcript) {
        senderBits.push_back(round.sent.bit);
        receiverResults.push_back(round.received.measuredBit);
    }

    const size_t width = 18;
    std::ostringstream ss;
    ss << utils::Formatter::padRight("Sender bits:", width) << bitsToString(senderBits) << "\n";
    ss << utils::Formatter::padRight("Sender bases:", width) << basesToString(report.transcript, false) << "\n";
    ss << utils::Formatter::padRight("Receiver bases:", width) << basesToString(report.transcript, true) << "\n";
    ss << utils::Formatter::padRight("Receiver results:", width) << bitsToString(receiverResults) << "\n";
    ss << utils::Formatter::padRight("Shared key:", width) << bitsToString(report.siftedKey) << "\n";
    ss << utils::Formatter::padRight("Encrypted bits:", width) << bitsToString(report.cipherBits) << "\n";
    ss << utils::Formatter::padRight("Decrypted msg:", width) << report.decryptedMessage << "\n";
    ss << utils::Formatter::padRight("Attempts:", width) << report.attempts
       << " (" << report.roundsUsed << " rounds, " << report.oracle << " channel)\n";
    return ss.str();
}

std::string formatTranscriptTable(const Transcript& transcript) {
    utils::TableFormatter table;
    table.setHeaders({"#", "Bit", "Sent", "Recv", "Result", "Kept"});
    table.setRightAligned(0);
    for (const auto& round : transcript) {
        table.addRow({
            std::to_string(round.index),
            std::to_string(round.sent.bit),
            std::string(1, basisSymbol(round.sent.basis)),
            std::string(1, basisSymbol(round.received.basis)),
            std::to_string(round.received.measuredBit),
            round.basesMatch() ? "yes" : ""
        });
    }
    return table.render();
}

}
}
