#pragma once

#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <cstdint>

namespace qkdsim {

enum class ErrorCode {
    OK = 0,
    KEY_AGREEMENT_FAILURE,
    KEY_EXPANSION_ERROR,
    LENGTH_MISMATCH,
    MALFORMED_BIT_LENGTH,
    UNSUPPORTED_CHARACTER,
    INVALID_ARGUMENT,
    CANCELLED,
    CONFIG_ERROR,
    FILE_NOT_FOUND,
    INVALID_STATE,
    INTERNAL_ERROR,
    UNKNOWN
};

enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

struct Error {
    ErrorCode code;
    ErrorSeverity severity;
    std::string message;
    std::string context;
    std::string file;
    int line;
    uint64_t timestamp;

    Error() : code(ErrorCode::OK), severity(ErrorSeverity::INFO), line(0), timestamp(0) {}
    Error(ErrorCode c, const std::string& msg) : code(c), severity(ErrorSeverity::ERROR), message(msg), line(0), timestamp(0) {}
};

template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_(), hasValue_(true) {}
    Result(Error error) : value_(), error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }

    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }

    T valueOr(const T& defaultValue) const { return hasValue_ ? value_ : defaultValue; }

private:
    T value_;
    Error error_;
    bool hasValue_;
};

template<>
class Result<void> {
public:
    Result() : error_(), hasValue_(true) {}
    Result(Error error) : error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }
    const Error& error() const { return error_; }

private:
    Error error_;
    bool hasValue_;
};

class ErrorHandler {
public:
    static ErrorHandler& instance();

    void setHandler(std::function<void(const Error&)> handler);
    void handle(const Error& error);
    void handle(ErrorCode code, const std::string& message);

    void pushContext(const std::string& context);
    void popContext();
    std::string getContext() const;

    void clearErrors();

    uint64_t getErrorCount() const;
    uint64_t getErrorCount(ErrorCode code) const;

    Error getLastError() const;
    bool hasErrors() const;

private:
    ErrorHandler();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

class ScopedContext {
public:
    explicit ScopedContext(const std::string& ctx);
    ~ScopedContext();
    ScopedContext(const ScopedContext&) = delete;
    ScopedContext& operator=(const ScopedContext&) = delete;
};

const char* errorToString(ErrorCode code);
const char* severityToString(ErrorSeverity severity);
std::string describeError(const Error& error);

Error makeError(ErrorCode code, const std::string& message);
Error makeError(ErrorCode code, const std::string& message, const std::string& context);
Error makeError(ErrorCode code, const std::string& message, const char* file, int line);

#define QKDSIM_CONCAT_INNER(a, b) a##b
#define QKDSIM_CONCAT(a, b) QKDSIM_CONCAT_INNER(a, b)

#define QKDSIM_ERROR(code, msg) qkdsim::makeError(code, msg, __FILE__, __LINE__)
#define QKDSIM_CHECK(expr, code, msg) if (!(expr)) return QKDSIM_ERROR(code, msg)
#define QKDSIM_CONTEXT(name) qkdsim::ScopedContext QKDSIM_CONCAT(_ctx_, __LINE__)(name)

}
