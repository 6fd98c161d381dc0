#pragma once

#include <stdexcept>
#include <string>

namespace core {

    // Thrown only on bootstrap paths (config, wiring). Runtime paths return core::Result.
    class TradingPlatformException : public std::runtime_error {
    public:
        explicit TradingPlatformException(const std::string& message)
            : std::runtime_error(message) {}

        explicit TradingPlatformException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

    class DatabaseException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

    class IndicatorCalculationException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

} // namespace core
