#include "error_handling.h"
#include <mutex>
#include <unordered_map>
#include <ctime>

namespace qkdsim {

const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::KEY_AGREEMENT_FAILURE: return "Key agreement failure";
        case ErrorCode::KEY_EXPANSION_ERROR: return "Key expansion error";
        case ErrorCode::LENGTH_MISMATCH: return "Length mismatch";
        case ErrorCode::MALFORMED_BIT_LENGTH: return "Malformed bit length";
        case ErrorCode::UNSUPPORTED_CHARACTER: return "Unsupported character";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::CANCELLED: return "Cancelled";
        case ErrorCode::CONFIG_ERROR: return "Configuration error";
        case ErrorCode::FILE_NOT_FOUND: return "File not found";
        case ErrorCode::INVALID_STATE: return "Invalid state";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";
        default: return "Unknown error";
    }
}

const char* severityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARNING";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

std::string describeError(const Error& error) {
    std::string msg = errorToString(error.code);
    if (!error.message.empty()) {
        msg += ": " + error.message;
    }
    if (!error.context.empty()) {
        msg += " [" + error.context + "]";
    }
    return msg;
}

Error makeError(ErrorCode code, const std::string& message) {
    Error err;
    err.code = code;
    err.severity = ErrorSeverity::ERROR;
    err.message = message;
    err.timestamp = static_cast<uint64_t>(std::time(nullptr));
    return err;
}

Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    Error err = makeError(code, message);
    err.context = context;
    return err;
}

Error makeError(ErrorCode code, const std::string& message, const char* file, int line) {
    Error err = makeError(code, message);
    err.file = file ? file : "";
    err.line = line;
    return err;
}

struct ErrorHandler::Impl {
    std::function<void(const Error&)> handler;
    Error lastError;
    std::vector<std::string> contextStack;
    std::unordered_map<int, uint64_t> errorCounts;
    uint64_t totalErrors = 0;
    mutable std::mutex mtx;

    std::string joinedContext() const {
        std::string ctx;
        for (const auto& c : contextStack) {
            if (!ctx.empty()) ctx += " > ";
            ctx += c;
        }
        return ctx;
    }
};

ErrorHandler::ErrorHandler() : impl_(std::make_unique<Impl>()) {}

ErrorHandler& ErrorHandler::instance() {
    static ErrorHandler inst;
    return inst;
}

void ErrorHandler::setHandler(std::function<void(const Error&)> handler) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->handler = handler;
}

void ErrorHandler::handle(const Error& error) {
    std::function<void(const Error&)> handler;
    Error err = error;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        err.timestamp = static_cast<uint64_t>(std::time(nullptr));
        if (err.context.empty()) {
            err.context = impl_->joinedContext();
        }

        impl_->lastError = err;

        impl_->totalErrors++;
        impl_->errorCounts[static_cast<int>(error.code)]++;
        handler = impl_->handler;
    }

    // the callback may log, which can re-enter the handler through other paths
    if (handler) {
        handler(err);
    }
}

void ErrorHandler::handle(ErrorCode code, const std::string& message) {
    handle(makeError(code, message));
}

void ErrorHandler::pushContext(const std::string& context) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->contextStack.push_back(context);
}

void ErrorHandler::popContext() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->contextStack.empty()) {
        impl_->contextStack.pop_back();
    }
}

std::string ErrorHandler::getContext() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->joinedContext();
}

void ErrorHandler::clearErrors() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->lastError = Error{};
    impl_->errorCounts.clear();
    impl_->totalErrors = 0;
}

uint64_t ErrorHandler::getErrorCount() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->totalErrors;
}

uint64_t ErrorHandler::getErrorCount(ErrorCode code) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->errorCounts.find(static_cast<int>(code));
    return it != impl_->errorCounts.end() ? it->second : 0;
}

Error ErrorHandler::getLastError() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->lastError;
}

bool ErrorHandler::hasErrors() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->totalErrors > 0;
}

ScopedContext::ScopedContext(const std::string& ctx) {
    ErrorHandler::instance().pushContext(ctx);
}

ScopedContext::~ScopedContext() {
    ErrorHandler::instance().popContext();
}

}
