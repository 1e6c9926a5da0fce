#include "screener/filter_builder.hpp"
#include "screener/screener_errors.hpp"

#include "gtest/gtest.h"

using namespace TightZone::Screener;
using json = nlohmann::json;

namespace{

FilterBuildParams base_params(){
	FilterBuildParams params;
	params.market = "america";
	params.columns = {"name", "close"};
	params.page_range = PageRange(0, 49);
	return params;
}

std::vector<std::string> filter_fields(const ScreenerRequest& request){
	std::vector<std::string> fields;
	for(const auto& condition : request.filters){
		fields.push_back(condition.field + ":" + filter_operation_to_string(condition.operation));
	}
	return fields;
}

TEST(FilterBuilder, AbsentBoundsContributeNothing){
	ScreenerRequest request = FilterBuilder::build(base_params());
	EXPECT_TRUE(request.filters.empty());
}

TEST(FilterBuilder, EachBoundIsIndependent){
	FilterBuildParams exchange_only = base_params();
	exchange_only.exchange = "nasdaq";
	ScreenerRequest exchange_request = FilterBuilder::build(exchange_only);
	ASSERT_EQ(1u, exchange_request.filters.size());
	EXPECT_EQ("exchange", exchange_request.filters[0].field);
	EXPECT_EQ(FilterOperation::EQUAL, exchange_request.filters[0].operation);
	EXPECT_EQ(FilterValue(std::string("NASDAQ")), *exchange_request.filters[0].value);

	FilterBuildParams min_price_only = base_params();
	min_price_only.min_price = 10.0;
	EXPECT_EQ(std::vector<std::string>({"close:egreater"}), filter_fields(FilterBuilder::build(min_price_only)));

	FilterBuildParams max_price_only = base_params();
	max_price_only.max_price = 500.0;
	EXPECT_EQ(std::vector<std::string>({"close:eless"}), filter_fields(FilterBuilder::build(max_price_only)));

	FilterBuildParams min_volume_only = base_params();
	min_volume_only.min_volume = 1e6;
	EXPECT_EQ(std::vector<std::string>({"volume:egreater"}), filter_fields(FilterBuilder::build(min_volume_only)));
}

TEST(FilterBuilder, BoundsCombineInFixedOrder){
	FilterBuildParams params = base_params();
	params.min_volume = 1e6;
	params.max_price = 500.0;
	params.exchange = "NYSE";
	params.custom_filters.emplace_back("sector", FilterOperation::EQUAL, FilterValue(std::string("Technology")));
	EXPECT_EQ(std::vector<std::string>({"exchange:equal", "close:eless", "volume:egreater", "sector:equal"}),
	          filter_fields(FilterBuilder::build(params)));
}

TEST(FilterBuilder, EmptyExchangeIsAbsent){
	FilterBuildParams params = base_params();
	params.exchange = std::string("");
	EXPECT_TRUE(FilterBuilder::build(params).filters.empty());
}

TEST(FilterBuilder, ZeroIsAValueNotAbsence){
	FilterBuildParams params = base_params();
	params.min_price = 0.0;
	ScreenerRequest request = FilterBuilder::build(params);
	ASSERT_EQ(1u, request.filters.size());
	EXPECT_EQ(FilterValue(0.0), *request.filters[0].value);
}

TEST(FilterBuilder, CustomComparisonWithoutValueIsDropped){
	FilterBuildParams params = base_params();
	params.custom_filters.emplace_back("close", FilterOperation::GREATER);
	params.custom_filters.emplace_back("SMA200", FilterOperation::NOT_EMPTY);
	EXPECT_EQ(std::vector<std::string>({"SMA200:nempty"}), filter_fields(FilterBuilder::build(params)));
}

TEST(FilterBuilder, QualificationAppendsOnlyMissingColumns){
	FilterBuildParams params = base_params();
	params.columns = {"name", "SMA200", "close"};
	params.required_columns = {"close", "SMA200", "market_cap_basic", "beta_1_year"};
	params.apply_qualification = true;
	EXPECT_EQ(std::vector<std::string>({"name", "SMA200", "close", "market_cap_basic", "beta_1_year"}),
	          FilterBuilder::build(params).columns);
}

TEST(FilterBuilder, ColumnsUntouchedWithoutQualification){
	FilterBuildParams params = base_params();
	params.required_columns = {"market_cap_basic"};
	EXPECT_EQ(std::vector<std::string>({"name", "close"}), FilterBuilder::build(params).columns);
}

TEST(FilterBuilder, PageRangeIsClamped){
	EXPECT_EQ(PageRange(0, 3), FilterBuilder::clamp_page_range(-5, 3));
	EXPECT_EQ(PageRange(5, 5), FilterBuilder::clamp_page_range(5, 2));
	EXPECT_EQ(PageRange(0, 0), FilterBuilder::clamp_page_range(-2, -7));
	EXPECT_EQ(PageRange(10, 19), FilterBuilder::clamp_page_range(10, 19));
}

TEST(FilterBuilder, SymbolTypesFollowMarketUnlessOverridden){
	FilterBuildParams params = base_params();
	params.market = " US ";
	params.exchange = "NYSE";
	ScreenerRequest request = FilterBuilder::build(params);
	EXPECT_EQ("america", request.market);
	EXPECT_EQ(std::vector<std::string>({"stock"}), request.symbol_types);

	params.symbol_types = std::vector<std::string>{};
	EXPECT_TRUE(FilterBuilder::build(params).symbol_types.empty());

	params.symbol_types = std::vector<std::string>{"stock", ""};
	EXPECT_EQ(std::vector<std::string>({"stock"}), FilterBuilder::build(params).symbol_types);
}

TEST(FilterBuilder, InvalidMarketFailsBeforeAnythingElse){
	FilterBuildParams params = base_params();
	params.market = "  ";
	EXPECT_THROW(FilterBuilder::build(params), InvalidInputError);
}

TEST(FilterBuilder, PayloadShape){
	FilterBuildParams params = base_params();
	params.exchange = "nasdaq";
	params.min_price = 10.0;
	params.custom_filters.emplace_back("SMA200", FilterOperation::NOT_EMPTY);
	params.sort = SortSpec("volume", SortOrder::ASCENDING);
	params.language = "";
	params.page_range = PageRange(150, 299);

	json expected = {
		{"markets", {"america"}},
		{"symbols", {{"query", {{"types", {"stock"}}}}, {"tickers", json::array()}}},
		{"columns", {"name", "close"}},
		{"filter", {
			{{"left", "exchange"}, {"operation", "equal"}, {"right", "NASDAQ"}},
			{{"left", "close"}, {"operation", "egreater"}, {"right", 10}},
			{{"left", "SMA200"}, {"operation", "nempty"}},
		}},
		{"sort", {{"sortBy", "volume"}, {"sortOrder", "asc"}}},
		{"options", {{"lang", "en"}}},
		{"range", {150, 299}},
	};
	EXPECT_EQ(expected, FilterBuilder::to_payload(FilterBuilder::build(params)));
}

TEST(FilterBuilder, DefaultSortIsMarketCapDescending){
	json payload = FilterBuilder::to_payload(FilterBuilder::build(base_params()));
	EXPECT_EQ("market_cap_basic", payload["sort"]["sortBy"]);
	EXPECT_EQ("desc", payload["sort"]["sortOrder"]);
}

TEST(FilterBuilder, ParsesFilterDefinitions){
	json filters_json = json::parse(R"([
		{"left": "close", "operation": "greater", "right": 12},
		{"left": "close", "operation": "greater", "right": "SMA200"},
		{"left": "beta_1_year", "operation": "nempty"}
	])");
	std::vector<FilterCondition> conditions = FilterBuilder::parse_filter_conditions(filters_json);
	ASSERT_EQ(3u, conditions.size());
	EXPECT_EQ(FilterValue(12.0), *conditions[0].value);
	EXPECT_EQ(FilterValue(std::string("SMA200")), *conditions[1].value);
	EXPECT_FALSE(conditions[2].value.has_value());
	EXPECT_EQ(FilterOperation::NOT_EMPTY, conditions[2].operation);
}

TEST(FilterBuilder, RejectsMalformedFilterDefinitions){
	EXPECT_THROW(FilterBuilder::parse_filter_conditions(json::object()), InvalidInputError);
	EXPECT_THROW(FilterBuilder::parse_filter_conditions(json::parse(R"([42])")), InvalidInputError);
	EXPECT_THROW(FilterBuilder::parse_filter_conditions(json::parse(R"([{"operation": "equal"}])")), InvalidInputError);
	EXPECT_THROW(FilterBuilder::parse_filter_conditions(json::parse(R"([{"left": "close"}])")), InvalidInputError);
	EXPECT_THROW(FilterBuilder::parse_filter_conditions(json::parse(R"([{"left": "close", "operation": "around"}])")), InvalidInputError);
	EXPECT_THROW(FilterBuilder::parse_filter_conditions(json::parse(R"([{"left": "close", "operation": "equal", "right": [1]}])")), InvalidInputError);
}

}
