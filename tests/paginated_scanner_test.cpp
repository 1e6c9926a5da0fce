#include "screener/filter_builder.hpp"
#include "screener/market_screener.hpp"
#include "screener/paginated_scanner.hpp"
#include "screener/screener_errors.hpp"
#include "fake_providers.hpp"

#include "gtest/gtest.h"

using namespace TightZone::Screener;
using TightZone::Testing::RecordingScannerTransport;
using TightZone::Testing::make_scan_page;
using json = nlohmann::json;

namespace{

ScreenerRequest template_request(){
	FilterBuildParams params;
	params.market = "america";
	params.columns = {"name"};
	return FilterBuilder::build(params);
}

std::vector<std::string> symbols_of(const std::vector<Row>& rows){
	std::vector<std::string> symbols;
	for(const auto& row : rows){
		symbols.push_back(row.symbol);
	}
	return symbols;
}

TEST(PaginatedScanner, StopsOnShortPage){
	RecordingScannerTransport transport;
	transport.add_page(make_scan_page({"name"}, {{"AAA", {"a"}}, {"BBB", {"b"}}}));
	transport.add_page(make_scan_page({"name"}, {{"CCC", {"c"}}}));

	PaginatedScanner scanner(transport);
	std::vector<Row> rows = scanner.scan(template_request(), 2);

	EXPECT_EQ(std::vector<std::string>({"AAA", "BBB", "CCC"}), symbols_of(rows));
	EXPECT_EQ((std::vector<std::pair<int, int>>{{0, 1}, {2, 3}}), transport.requested_ranges());
	EXPECT_EQ(2, scanner.get_pages_requested());
}

TEST(PaginatedScanner, EmptyFinalPageEndsScan){
	RecordingScannerTransport transport;
	transport.add_page(make_scan_page({"name"}, {{"AAA", {"a"}}, {"BBB", {"b"}}}));
	transport.add_page(make_scan_page({"name"}, {}));

	std::vector<Row> rows = PaginatedScanner(transport).scan(template_request(), 2);
	EXPECT_EQ(std::vector<std::string>({"AAA", "BBB"}), symbols_of(rows));
	EXPECT_EQ(2u, transport.requests.size());
}

TEST(PaginatedScanner, NoRowsAtAllIsNotAnError){
	RecordingScannerTransport transport;
	transport.add_page(json::parse(R"({"totalCount": 0, "data": null})"));
	EXPECT_TRUE(PaginatedScanner(transport).scan(template_request(), 50).empty());
	EXPECT_EQ((std::vector<std::pair<int, int>>{{0, 49}}), transport.requested_ranges());
}

TEST(PaginatedScanner, RezipsEveryPageAgainstItsOwnColumns){
	RecordingScannerTransport transport;
	transport.add_page(make_scan_page({"name", "close"}, {{"AAA", {"a", 1}}}));
	transport.add_page(make_scan_page({"close", "name"}, {{"BBB", {2, "b"}}}));

	std::vector<Row> rows = PaginatedScanner(transport).scan(template_request(), 1);
	ASSERT_EQ(2u, rows.size());
	EXPECT_EQ(CellValue(2.0), *rows[1].find("close"));
	EXPECT_EQ(CellValue(std::string("b")), *rows[1].find("name"));
}

TEST(PaginatedScanner, KeepsStaticRequestParts){
	RecordingScannerTransport transport;
	transport.add_page(make_scan_page({"name"}, {{"AAA", {"a"}}}));
	transport.add_page(make_scan_page({"name"}, {}));

	ScreenerRequest request = template_request();
	request.filters.emplace_back("close", FilterOperation::GREATER, FilterValue(5.0));
	PaginatedScanner(transport).scan(request, 1);
	for(const auto& sent_request : transport.requests){
		EXPECT_EQ(request.columns, sent_request.columns);
		EXPECT_EQ(1u, sent_request.filters.size());
		EXPECT_EQ("america", sent_request.market);
	}
}

TEST(PaginatedScanner, TransportFailureAbortsScan){
	RecordingScannerTransport transport;
	transport.add_page(make_scan_page({"name"}, {{"AAA", {"a"}}, {"BBB", {"b"}}}));
	transport.pages.push_back([]() -> json { throw TransportError("connection reset"); });

	EXPECT_THROW(PaginatedScanner(transport).scan(template_request(), 2), TransportError);
	EXPECT_EQ(2u, transport.requests.size());
}

TEST(PaginatedScanner, ProviderErrorAbortsScan){
	RecordingScannerTransport transport;
	transport.add_page(json::parse(R"({"error": "Unknown field \"foo\""})"));
	EXPECT_THROW(PaginatedScanner(transport).scan(template_request(), 2), ProviderLogicalError);
}

TEST(PaginatedScanner, CancellationStopsFurtherRequests){
	RecordingScannerTransport transport;
	CancellationToken token;
	json full_page = make_scan_page({"name"}, {{"AAA", {"a"}}, {"BBB", {"b"}}});
	transport.pages.push_back([&token, full_page](){ token.cancel(); return full_page; });
	transport.add_page(full_page);

	EXPECT_THROW(PaginatedScanner(transport).scan(template_request(), 2, &token), ScanCancelledError);
	EXPECT_EQ(1u, transport.requests.size());
}

TEST(PaginatedScanner, AlreadyCancelledIssuesNoRequest){
	RecordingScannerTransport transport;
	CancellationToken token;
	token.cancel();
	EXPECT_THROW(PaginatedScanner(transport).scan(template_request(), 2, &token), ScanCancelledError);
	EXPECT_TRUE(transport.requests.empty());
}

TEST(PaginatedScanner, RejectsNonPositivePageSize){
	RecordingScannerTransport transport;
	EXPECT_THROW(PaginatedScanner(transport).scan(template_request(), 0), InvalidInputError);
	EXPECT_TRUE(transport.requests.empty());
}

TEST(MarketScreener, RoundTripReproducesMockRows){
	RecordingScannerTransport transport;
	transport.add_page(make_scan_page({"name", "close", "sector"}, {
		{"NASDAQ:AAPL", {"Apple", 190.5, "Technology"}},
		{"NYSE:KO", {"Coca-Cola", 60.25, nullptr}},
	}));

	ScreenerOptions options;
	options.columns = {"name", "close", "sector"};
	options.apply_vcp_filter = false;
	options.page_size = 10;
	MarketScreener screener(options, transport);
	std::vector<Row> rows = screener.scan();

	ASSERT_EQ(2u, rows.size());
	EXPECT_EQ("NASDAQ:AAPL", rows[0].symbol);
	EXPECT_EQ(CellValue(std::string("Technology")), *rows[0].find("sector"));
	EXPECT_EQ("NYSE:KO", rows[1].symbol);
	EXPECT_EQ(CellValue(60.25), *rows[1].find("close"));
	EXPECT_TRUE(is_null_cell(*rows[1].find("sector")));

	ASSERT_EQ(1u, transport.requests.size());
	EXPECT_EQ(options.columns, transport.requests[0].columns);
}

TEST(MarketScreener, VcpModeRequestsAndAppliesQualification){
	RecordingScannerTransport transport;
	std::vector<std::string> columns = {"name", "close", "SMA200", "market_cap_basic", "beta_1_year", "average_volume_30d_calc"};
	transport.add_page(make_scan_page(columns, {
		{"PASS", {"Pass", 50, 40, 3.5e9, 1.2, 3e7}},
		{"FAIL", {"Fail", 11, 15, 5e9, 1.5, 8e6}},
	}));

	ScreenerOptions options;
	options.columns = {"name"};
	options.page_size = 5;
	MarketScreener screener(options, transport);
	std::vector<Row> rows = screener.scan();

	ASSERT_EQ(1u, rows.size());
	EXPECT_EQ("PASS", rows[0].symbol);
	EXPECT_EQ(columns, transport.requests[0].columns);
}

TEST(MarketScreener, PayloadForArbitraryWindow){
	RecordingScannerTransport transport;
	ScreenerOptions options;
	options.market = "USA";
	options.min_price = 12.0;
	MarketScreener screener(options, transport);

	json payload = screener.payload(100, 199);
	EXPECT_EQ(json::array({"america"}), payload["markets"]);
	EXPECT_EQ(json::array({100, 199}), payload["range"]);
	EXPECT_EQ(1u, payload["filter"].size());
	EXPECT_TRUE(transport.requests.empty());
}

TEST(MarketScreener, RejectsBadOptionsUpFront){
	RecordingScannerTransport transport;
	ScreenerOptions blank_market;
	blank_market.market = " ";
	EXPECT_THROW({ MarketScreener screener(blank_market, transport); }, InvalidInputError);

	ScreenerOptions zero_page;
	zero_page.page_size = 0;
	EXPECT_THROW({ MarketScreener screener(zero_page, transport); }, InvalidInputError);
}

}
