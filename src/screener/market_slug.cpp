#include "market_slug.hpp"
#include "screener_errors.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <unordered_map>

namespace TightZone {
namespace Screener {

namespace {

const std::unordered_map<std::string, std::string>& market_aliases() {
    static const std::unordered_map<std::string, std::string> aliases = {
        {"us", "america"},
        {"usa", "america"},
        {"unitedstates", "america"},
    };
    return aliases;
}

const std::unordered_map<std::string, std::vector<std::string>>& market_symbol_types() {
    static const std::unordered_map<std::string, std::vector<std::string>> symbol_types = {
        {"america", {"stock"}},
        {"crypto", {"crypto"}},
        {"forex", {"forex"}},
        {"cfd", {"cfd"}},
        {"futures", {"futures"}},
    };
    return symbol_types;
}

} // namespace

std::string normalize_market_slug(const std::string& market) {
    std::string slug_string;
    slug_string.reserve(market.size());
    for (char market_char : market) {
        unsigned char character = static_cast<unsigned char>(market_char);
        if (std::isspace(character)) {
            continue;
        }
        slug_string.push_back(static_cast<char>(std::tolower(character)));
    }

    if (slug_string.empty()) {
        throw InvalidInputError("Market must be a non-empty string");
    }

    auto alias_iterator = market_aliases().find(slug_string);
    if (alias_iterator != market_aliases().end()) {
        return alias_iterator->second;
    }
    return slug_string;
}

std::vector<std::string> default_symbol_types(const std::string& market_slug) {
    auto types_iterator = market_symbol_types().find(market_slug);
    if (types_iterator == market_symbol_types().end()) {
        return {};
    }
    return types_iterator->second;
}

std::vector<std::string> resolve_symbol_types(const std::string& market_slug,
                                              const std::optional<std::vector<std::string>>& symbol_types_override) {
    if (!symbol_types_override) {
        return default_symbol_types(market_slug);
    }

    std::vector<std::string> resolved_types;
    std::copy_if(symbol_types_override->begin(), symbol_types_override->end(), std::back_inserter(resolved_types),
                 [](const std::string& symbol_type) { return !symbol_type.empty(); });
    return resolved_types;
}

} // namespace Screener
} // namespace TightZone
