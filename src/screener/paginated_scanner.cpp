#include "paginated_scanner.hpp"
#include "scan_response_parser.hpp"
#include "screener_errors.hpp"
#include "logging/logs/screener_logs.hpp"

using TightZone::Logging::ScreenerLogs;

namespace TightZone {
namespace Screener {

void PaginatedScanner::throw_if_cancelled(const CancellationToken* cancellation_token, std::size_t accumulated_rows) const {
    if (cancellation_token && cancellation_token->is_cancelled()) {
        ScreenerLogs::log_scan_cancelled(accumulated_rows);
        throw ScanCancelledError("Scan cancelled after " + std::to_string(pages_requested) + " page(s)");
    }
}

std::vector<Row> PaginatedScanner::scan(const ScreenerRequest& request_template, int page_size,
                                        const CancellationToken* cancellation_token) {
    if (page_size < 1) {
        throw InvalidInputError("page_size must be >= 1, got " + std::to_string(page_size));
    }

    pages_requested = 0;
    std::vector<Row> accumulated_rows;
    ScreenerRequest page_request = request_template;
    int page_offset = 0;

    try {
        while (true) {
            throw_if_cancelled(cancellation_token, accumulated_rows.size());

            page_request.range = PageRange(page_offset, page_offset + page_size - 1);
            ScreenerLogs::log_page_requested(page_request.range.start, page_request.range.end);

            nlohmann::json response = transport_ref.submit(page_request);
            ++pages_requested;
            ScanPage page = parse_scan_response(response);
            ScreenerLogs::log_page_received(page_request.range.start, page_request.range.end, page.rows.size());

            throw_if_cancelled(cancellation_token, accumulated_rows.size() + page.rows.size());

            std::size_t page_row_count = page.rows.size();
            accumulated_rows.insert(accumulated_rows.end(),
                                    std::make_move_iterator(page.rows.begin()),
                                    std::make_move_iterator(page.rows.end()));

            if (page_row_count < static_cast<std::size_t>(page_size)) {
                break;
            }
            page_offset += page_size;
        }
    } catch (const ScanCancelledError&) {
        throw;
    } catch (const ScreenerError& screener_error) {
        ScreenerLogs::log_scan_failed(error_kind_to_string(screener_error.kind()), screener_error.what());
        throw;
    }

    ScreenerLogs::log_scan_completed(accumulated_rows.size(), pages_requested);
    return accumulated_rows;
}

} // namespace Screener
} // namespace TightZone
