#ifndef CONTRACTION_ZONES_HPP
#define CONTRACTION_ZONES_HPP

#include <vector>
#include "screener_structures.hpp"

namespace TightZone {
namespace Screener {

constexpr int DEFAULT_SEGMENT_COUNT = 4;
constexpr int MINIMUM_POINTS_PER_SEGMENT = 5;

/**
 * Splits the most recent segment_count * window closes into equal windows
 * (window = size / segment_count, any leading remainder is ignored) and
 * walks them oldest first, keeping each window whose high-low range is
 * positive and strictly below the last kept range.
 *
 * Series shorter than segment_count * 5 yield no zones.
 * Throws InvalidInputError when segment_count < 1.
 */
std::vector<ContractionZone> detect_contraction_zones(const std::vector<double>& closes,
                                                      int segment_count = DEFAULT_SEGMENT_COUNT);

std::vector<ContractionZone> detect_contraction_zones(const std::vector<PriceBar>& series,
                                                      int segment_count = DEFAULT_SEGMENT_COUNT);

} // namespace Screener
} // namespace TightZone

#endif // CONTRACTION_ZONES_HPP
