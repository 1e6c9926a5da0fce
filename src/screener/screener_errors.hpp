#ifndef SCREENER_ERRORS_HPP
#define SCREENER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace TightZone {
namespace Screener {

enum class ErrorKind {
    INVALID_INPUT,
    TRANSPORT_FAILURE,
    DECODE_FAILURE,
    PROVIDER_LOGICAL_ERROR,
    CANCELLED
};

std::string error_kind_to_string(ErrorKind kind);

/**
 * Base for every failure raised by the screening engine.
 * Any of these aborts the scan in progress; no partial rows are returned.
 */
class ScreenerError : public std::runtime_error {
public:
    ScreenerError(ErrorKind error_kind, const std::string& message)
        : std::runtime_error(message), kind_value(error_kind) {}

    ErrorKind kind() const { return kind_value; }

private:
    ErrorKind kind_value;
};

// Malformed market slug, filter definition or request parameter. Raised before any network call.
class InvalidInputError : public ScreenerError {
public:
    explicit InvalidInputError(const std::string& message)
        : ScreenerError(ErrorKind::INVALID_INPUT, message) {}
};

// Network unreachable, timeout or non-success HTTP status.
class TransportError : public ScreenerError {
public:
    explicit TransportError(const std::string& message)
        : ScreenerError(ErrorKind::TRANSPORT_FAILURE, message) {}
};

// Body is not JSON or lacks a required nested field.
class DecodeError : public ScreenerError {
public:
    explicit DecodeError(const std::string& message)
        : ScreenerError(ErrorKind::DECODE_FAILURE, message) {}
};

// Body parsed but the provider flagged the request as failed.
class ProviderLogicalError : public ScreenerError {
public:
    explicit ProviderLogicalError(const std::string& message)
        : ScreenerError(ErrorKind::PROVIDER_LOGICAL_ERROR, message) {}
};

class ScanCancelledError : public ScreenerError {
public:
    explicit ScanCancelledError(const std::string& message)
        : ScreenerError(ErrorKind::CANCELLED, message) {}
};

} // namespace Screener
} // namespace TightZone

#endif // SCREENER_ERRORS_HPP
