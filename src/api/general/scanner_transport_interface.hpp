#ifndef SCANNER_TRANSPORT_INTERFACE_HPP
#define SCANNER_TRANSPORT_INTERFACE_HPP

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "screener/screener_structures.hpp"

namespace TightZone {
namespace API {

/**
 * Session with the remote scanner. One call submits one page request and
 * returns the decoded response body. Implementations raise
 * Screener::TransportError for network/HTTP failures and
 * Screener::DecodeError when the body is not JSON; interpreting the body is
 * left to the caller.
 */
class ScannerTransportInterface {
public:
    virtual ~ScannerTransportInterface() = default;

    virtual nlohmann::json submit(const Screener::ScreenerRequest& request) = 0;
    virtual std::string get_provider_name() const = 0;
};

using ScannerTransportPtr = std::unique_ptr<ScannerTransportInterface>;

} // namespace API
} // namespace TightZone

#endif // SCANNER_TRANSPORT_INTERFACE_HPP
