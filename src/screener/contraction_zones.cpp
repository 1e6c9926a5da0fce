#include "contraction_zones.hpp"
#include "screener_errors.hpp"
#include <algorithm>
#include <optional>

namespace TightZone {
namespace Screener {

std::vector<ContractionZone> detect_contraction_zones(const std::vector<double>& closes, int segment_count) {
    if (segment_count < 1) {
        throw InvalidInputError("segment_count must be >= 1, got " + std::to_string(segment_count));
    }

    std::vector<ContractionZone> zones;
    const std::size_t point_count = closes.size();
    const std::size_t segments = static_cast<std::size_t>(segment_count);
    if (point_count < segments * MINIMUM_POINTS_PER_SEGMENT) {
        return zones;
    }

    const std::size_t window = std::max<std::size_t>(point_count / segments, 1);
    const std::size_t covered_points = segments * window;
    const std::size_t start_offset = point_count > covered_points ? point_count - covered_points : 0;

    std::optional<double> previous_range;
    for (std::size_t segment_index = 0; segment_index < segments; ++segment_index) {
        std::size_t window_start = start_offset + segment_index * window;
        std::size_t window_end = std::min(window_start + window, point_count);
        if (window_end <= window_start || window_end - window_start < 2) {
            continue;
        }

        auto extrema = std::minmax_element(closes.begin() + window_start, closes.begin() + window_end);
        double window_low = *extrema.first;
        double window_high = *extrema.second;
        double window_range = window_high - window_low;

        // Negated form so a NaN range is rejected too.
        if (!(window_range > 0.0)) {
            continue;
        }
        if (previous_range && !(window_range < *previous_range)) {
            continue;
        }

        zones.push_back(ContractionZone{window_start, window_end - 1, window_high, window_low});
        previous_range = window_range;
    }

    return zones;
}

std::vector<ContractionZone> detect_contraction_zones(const std::vector<PriceBar>& series, int segment_count) {
    std::vector<double> closes;
    closes.reserve(series.size());
    for (const auto& price_bar : series) {
        closes.push_back(price_bar.close);
    }
    return detect_contraction_zones(closes, segment_count);
}

} // namespace Screener
} // namespace TightZone
