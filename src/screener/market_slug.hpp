#ifndef MARKET_SLUG_HPP
#define MARKET_SLUG_HPP

#include <optional>
#include <string>
#include <vector>

namespace TightZone {
namespace Screener {

/**
 * Maps a free-form market name onto the scanner's canonical slug:
 * trims, lowercases, removes internal spaces and resolves aliases
 * ("us", "usa", "unitedstates" -> "america").
 * Throws InvalidInputError when nothing is left.
 */
std::string normalize_market_slug(const std::string& market);

// Symbol types scanned by default for a canonical slug; empty for unknown markets.
std::vector<std::string> default_symbol_types(const std::string& market_slug);

// An explicit override wins even when empty; blank entries are dropped, order kept.
std::vector<std::string> resolve_symbol_types(const std::string& market_slug,
                                              const std::optional<std::vector<std::string>>& symbol_types_override);

} // namespace Screener
} // namespace TightZone

#endif // MARKET_SLUG_HPP
