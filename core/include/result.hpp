#pragma once

#include <string>
#include <variant>
#include <utility>
#include <stdexcept>

namespace core {

    // Failure classes for runtime (non-bootstrap) operations
    enum class ErrorKind {
        Transport,          // Network failure, timeout, non-200, unparsable body
        ExchangeRejection,  // Exchange answered with an error list
        DataInsufficient,   // Not enough history for an indicator/signal
        InvariantViolation, // Local state disagrees with itself or the exchange
        Storage,            // Persistence failure
        Validation          // Caller input rejected before any side effect
    };

    inline std::string toString(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::Transport: return "TransportError";
            case ErrorKind::ExchangeRejection: return "ExchangeRejection";
            case ErrorKind::DataInsufficient: return "DataInsufficient";
            case ErrorKind::InvariantViolation: return "InvariantViolation";
            case ErrorKind::Storage: return "StorageError";
            case ErrorKind::Validation: return "ValidationError";
        }
        return "UnknownError";
    }

    struct Error {
        ErrorKind kind = ErrorKind::Validation;
        std::string message;

        std::string describe() const { return toString(kind) + ": " + message; }
    };

    // Value-or-error wrapper for every call that can fail at runtime
    template<typename T>
    class Result {
    public:
        Result(T value) : data_(std::move(value)) {}
        Result(Error error) : data_(std::move(error)) {}

        bool ok() const { return std::holds_alternative<T>(data_); }
        explicit operator bool() const { return ok(); }

        const T& value() const {
            if (!ok()) throw std::logic_error("Result::value() called on error: " + error().describe());
            return std::get<T>(data_);
        }
        T& value() {
            if (!ok()) throw std::logic_error("Result::value() called on error: " + error().describe());
            return std::get<T>(data_);
        }
        const Error& error() const { return std::get<Error>(data_); }

    private:
        std::variant<T, Error> data_;
    };

    // Result without a payload
    class Status {
    public:
        Status() = default;
        Status(Error error) : error_(std::move(error)), ok_(false) {}

        static Status success() { return Status(); }

        bool ok() const { return ok_; }
        explicit operator bool() const { return ok_; }
        const Error& error() const { return error_; }

    private:
        Error error_;
        bool ok_ = true;
    };

    inline Error makeError(ErrorKind kind, std::string message) {
        return Error{kind, std::move(message)};
    }

} // namespace core
