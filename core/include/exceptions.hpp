#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class PoosException : public std::runtime_error {
    public:
        explicit PoosException(const std::string& message)
            : std::runtime_error(message) {}

        explicit PoosException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    // Malformed configuration. Fatal, only raised before the simulation loop.
    class ConfigException : public PoosException {
    public: using PoosException::PoosException; };

    class DataLoadException : public PoosException {
    public: using PoosException::PoosException; };

    class ApiRequestException : public PoosException {
    public: using PoosException::PoosException; };

    class IndicatorCalculationException : public PoosException {
    public: using PoosException::PoosException; };

    // No bar for a ticker on the requested date
    class DataGapException : public PoosException {
    public: using PoosException::PoosException; };

    // Indicator still inside its warm-up window
    class InsufficientHistoryException : public PoosException {
    public: using PoosException::PoosException; };

    // Computed size is zero or cannot be paid for
    class InvalidSizingException : public PoosException {
    public: using PoosException::PoosException; };

    // Entry refused by the portfolio heat cap
    class RiskLimitException : public PoosException {
    public: using PoosException::PoosException; };

    class BacktestException : public PoosException {
    public: using PoosException::PoosException; };

} // namespace core
