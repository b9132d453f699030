#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace spendguard {

enum class ErrorCode {
    OK = 0,
    INVALID_ARGUMENT,
    INSUFFICIENT_FUNDS,
    INVALID_SIGNATURE,
    NETWORK_ERROR,
    DATABASE_ERROR,
    ACCESS_DENIED,
    TIMEOUT,
    RATE_LIMITED,
    VALIDATION_FAILED,
    CONFIG_ERROR,
    LIMIT_EXCEEDED,
    NOT_FOUND,
    INVALID_STATE,
    CANCELLED,
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
    Error(ErrorCode c, ErrorSeverity s, const std::string& msg, const std::string& ctx,
          const std::string& f, int l, uint64_t ts)
        : code(c), severity(s), message(msg), context(ctx), file(f), line(l), timestamp(ts) {}

    bool isError() const { return code != ErrorCode::OK; }
    std::string describe() const;
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

// Process-wide record of errors that were observed but not propagated.
class ErrorHandler {
public:
    static ErrorHandler& instance();
    
    void handle(const Error& error);
    void handle(ErrorCode code, const std::string& message);
    
    std::vector<Error> getRecentErrors(size_t count = 10) const;
    uint64_t getErrorCount() const;
    bool hasErrors() const;
    
private:
    ErrorHandler();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

const char* errorToString(ErrorCode code);
Error makeError(ErrorCode code, const std::string& message);

#define SPENDGUARD_ERROR(code, msg) spendguard::Error{code, spendguard::ErrorSeverity::ERROR, msg, "", __FILE__, __LINE__, 0}
#define SPENDGUARD_CHECK(expr, code, msg) if (!(expr)) return spendguard::Result<void>(SPENDGUARD_ERROR(code, msg))

}
