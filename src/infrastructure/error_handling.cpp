#include "infrastructure/error_handling.h"
#include <mutex>
#include <deque>
#include <ctime>

namespace spendguard {

const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::INSUFFICIENT_FUNDS: return "Insufficient funds";
        case ErrorCode::INVALID_SIGNATURE: return "Invalid signature";
        case ErrorCode::NETWORK_ERROR: return "Network error";
        case ErrorCode::DATABASE_ERROR: return "Database error";
        case ErrorCode::ACCESS_DENIED: return "Access denied";
        case ErrorCode::TIMEOUT: return "Timeout";
        case ErrorCode::RATE_LIMITED: return "Rate limited";
        case ErrorCode::VALIDATION_FAILED: return "Validation failed";
        case ErrorCode::CONFIG_ERROR: return "Configuration error";
        case ErrorCode::LIMIT_EXCEEDED: return "Limit exceeded";
        case ErrorCode::NOT_FOUND: return "Not found";
        case ErrorCode::INVALID_STATE: return "Invalid state";
        case ErrorCode::CANCELLED: return "Cancelled";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";
        default: return "Unknown error";
    }
}

std::string Error::describe() const {
    std::string out = errorToString(code);
    if (!message.empty()) out += ": " + message;
    if (!context.empty()) out += " [" + context + "]";
    return out;
}

Error makeError(ErrorCode code, const std::string& message) {
    Error err;
    err.code = code;
    err.severity = ErrorSeverity::ERROR;
    err.message = message;
    err.timestamp = static_cast<uint64_t>(std::time(nullptr));
    return err;
}

struct ErrorHandler::Impl {
    std::deque<Error> recentErrors;
    uint64_t totalErrors = 0;
    mutable std::mutex mtx;
    static constexpr size_t MAX_RECENT_ERRORS = 100;
};

ErrorHandler::ErrorHandler() : impl_(std::make_unique<Impl>()) {}

ErrorHandler& ErrorHandler::instance() {
    static ErrorHandler inst;
    return inst;
}

void ErrorHandler::handle(const Error& error) {
    Error err = error;
    if (err.timestamp == 0) {
        err.timestamp = static_cast<uint64_t>(std::time(nullptr));
    }
    
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->recentErrors.push_back(err);
    if (impl_->recentErrors.size() > Impl::MAX_RECENT_ERRORS) {
        impl_->recentErrors.pop_front();
    }
    impl_->totalErrors++;
}

void ErrorHandler::handle(ErrorCode code, const std::string& message) {
    handle(makeError(code, message));
}

std::vector<Error> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<Error> result;
    size_t start = impl_->recentErrors.size() > count ? 
                   impl_->recentErrors.size() - count : 0;
    for (size_t i = impl_->recentErrors.size(); i > start; i--) {
        result.push_back(impl_->recentErrors[i - 1]);
    }
    return result;
}

uint64_t ErrorHandler::getErrorCount() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->totalErrors;
}

bool ErrorHandler::hasErrors() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return !impl_->recentErrors.empty();
}

}
