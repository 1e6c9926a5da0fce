#ifndef PAGINATED_SCANNER_HPP
#define PAGINATED_SCANNER_HPP

#include <vector>
#include "api/general/scanner_transport_interface.hpp"
#include "screener_structures.hpp"

namespace TightZone {
namespace Screener {

/**
 * Drives one scan across pages. Each page is requested as
 * [offset, offset + page_size - 1]; the loop stops on the first page that
 * returns fewer than page_size rows (including zero). Every page is zipped
 * against its own column list.
 *
 * Any failure, and a cancellation observed between pages, discards the rows
 * gathered so far. Nothing is retried here.
 */
class PaginatedScanner {
public:
    explicit PaginatedScanner(API::ScannerTransportInterface& transport) : transport_ref(transport) {}

    std::vector<Row> scan(const ScreenerRequest& request_template, int page_size,
                          const CancellationToken* cancellation_token = nullptr);

    int get_pages_requested() const { return pages_requested; }

private:
    API::ScannerTransportInterface& transport_ref;
    int pages_requested = 0;

    void throw_if_cancelled(const CancellationToken* cancellation_token, std::size_t accumulated_rows) const;
};

} // namespace Screener
} // namespace TightZone

#endif // PAGINATED_SCANNER_HPP
