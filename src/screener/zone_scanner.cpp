#include "zone_scanner.hpp"
#include "screener_errors.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/zone_logs.hpp"
#include <algorithm>
#include <atomic>
#include <thread>

using TightZone::Logging::ZoneLogs;

namespace TightZone {
namespace Screener {

ZoneScanner::ZoneScanner(const API::HistoryProviderInterface& history_provider, const ZoneScanOptions& scan_options)
    : provider_ref(history_provider), options(scan_options) {
    if (options.segment_count < 1) {
        throw InvalidInputError("segment_count must be >= 1, got " + std::to_string(options.segment_count));
    }
    if (options.max_concurrent_fetches < 1) {
        throw InvalidInputError("max_concurrent_fetches must be >= 1, got " + std::to_string(options.max_concurrent_fetches));
    }
}

SymbolZoneResult ZoneScanner::scan_symbol(const std::string& symbol) const {
    SymbolZoneResult symbol_result;
    symbol_result.symbol = symbol;

    try {
        std::vector<PriceBar> price_series = provider_ref.fetch_history(API::HistoryRequest(symbol, options.period, options.interval));
        symbol_result.bar_count = price_series.size();
        if (price_series.empty()) {
            symbol_result.error_message = NO_PRICE_HISTORY_MESSAGE;
        } else {
            symbol_result.zones = detect_contraction_zones(price_series, options.segment_count);
        }
    } catch (const std::exception& exception_error) {
        symbol_result.error_message = exception_error.what();
    }

    if (symbol_result.succeeded()) {
        ZoneLogs::log_symbol_zones(symbol, symbol_result.bar_count, symbol_result.zones.size());
    } else {
        ZoneLogs::log_symbol_failed(symbol, *symbol_result.error_message);
    }
    return symbol_result;
}

std::vector<SymbolZoneResult> ZoneScanner::scan_symbols(const std::vector<std::string>& symbols,
                                                        const CancellationToken* cancellation_token) const {
    std::vector<SymbolZoneResult> symbol_results(symbols.size());
    if (symbols.empty()) {
        return symbol_results;
    }

    int worker_count = static_cast<int>(std::min<std::size_t>(static_cast<std::size_t>(options.max_concurrent_fetches), symbols.size()));
    ZoneLogs::log_batch_started(symbols.size(), worker_count);

    // Workers log through the caller's context.
    Logging::LoggingContext* parent_logging_context = Logging::get_logging_context();
    std::atomic<std::size_t> next_symbol_index{0};

    auto worker_function = [&]() {
        Logging::set_logging_context(*parent_logging_context);
        Logging::set_log_thread_tag("ZONES");
        while (!(cancellation_token && cancellation_token->is_cancelled())) {
            std::size_t symbol_index = next_symbol_index.fetch_add(1);
            if (symbol_index >= symbols.size()) {
                break;
            }
            symbol_results[symbol_index] = scan_symbol(symbols[symbol_index]);
        }
    };

    std::vector<std::thread> worker_threads;
    worker_threads.reserve(static_cast<std::size_t>(worker_count));
    for (int worker_index = 0; worker_index < worker_count; ++worker_index) {
        worker_threads.emplace_back(worker_function);
    }
    for (auto& worker_thread : worker_threads) {
        if (worker_thread.joinable()) {
            worker_thread.join();
        }
    }

    if (cancellation_token && cancellation_token->is_cancelled()) {
        ZoneLogs::log_batch_cancelled();
        throw ScanCancelledError("Contraction zone scan cancelled");
    }

    std::size_t failed_count = static_cast<std::size_t>(std::count_if(symbol_results.begin(), symbol_results.end(),
        [](const SymbolZoneResult& symbol_result) { return !symbol_result.succeeded(); }));
    ZoneLogs::log_batch_completed(symbol_results.size() - failed_count, failed_count);
    return symbol_results;
}

} // namespace Screener
} // namespace TightZone
