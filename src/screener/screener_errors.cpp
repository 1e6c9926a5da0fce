#include "screener_errors.hpp"

namespace TightZone {
namespace Screener {

std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_INPUT: return "InvalidInput";
        case ErrorKind::TRANSPORT_FAILURE: return "TransportFailure";
        case ErrorKind::DECODE_FAILURE: return "DecodeFailure";
        case ErrorKind::PROVIDER_LOGICAL_ERROR: return "ProviderLogicalError";
        case ErrorKind::CANCELLED: return "Cancelled";
    }
    return "Unknown";
}

} // namespace Screener
} // namespace TightZone
