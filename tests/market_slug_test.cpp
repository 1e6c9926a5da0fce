#include "screener/market_slug.hpp"
#include "screener/screener_errors.hpp"

#include "gtest/gtest.h"

using namespace TightZone::Screener;

namespace{

TEST(MarketSlug, TrimsAndLowercases){
	EXPECT_EQ("america", normalize_market_slug(" America "));
	EXPECT_EQ("crypto", normalize_market_slug("CRYPTO"));
}

TEST(MarketSlug, RemovesInternalSpaces){
	EXPECT_EQ("america", normalize_market_slug("United States"));
	EXPECT_EQ("unitedkingdom", normalize_market_slug("United Kingdom"));
}

TEST(MarketSlug, ResolvesAliases){
	EXPECT_EQ("america", normalize_market_slug("US"));
	EXPECT_EQ("america", normalize_market_slug("usa"));
	EXPECT_EQ("america", normalize_market_slug("unitedstates"));
}

TEST(MarketSlug, EmptyInputIsInvalid){
	EXPECT_THROW(normalize_market_slug(""), InvalidInputError);
	EXPECT_THROW(normalize_market_slug("   \t "), InvalidInputError);
}

TEST(MarketSlug, InvalidInputCarriesKind){
	try{
		normalize_market_slug(" ");
		FAIL() << "expected InvalidInputError";
	} catch(const ScreenerError& error){
		EXPECT_EQ(ErrorKind::INVALID_INPUT, error.kind());
	}
}

TEST(MarketSlug, DefaultSymbolTypes){
	EXPECT_EQ(std::vector<std::string>({"stock"}), default_symbol_types("america"));
	EXPECT_EQ(std::vector<std::string>({"crypto"}), default_symbol_types("crypto"));
	EXPECT_TRUE(default_symbol_types("germany").empty());
}

TEST(MarketSlug, ExplicitOverrideWinsEvenWhenEmpty){
	EXPECT_EQ(std::vector<std::string>({"stock"}), resolve_symbol_types("america", std::nullopt));
	EXPECT_TRUE(resolve_symbol_types("america", std::vector<std::string>{}).empty());
	EXPECT_EQ(std::vector<std::string>({"fund", "stock"}),
	          resolve_symbol_types("america", std::vector<std::string>{"fund", "", "stock"}));
}

}
