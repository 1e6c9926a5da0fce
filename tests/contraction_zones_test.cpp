#include "screener/contraction_zones.hpp"
#include "screener/screener_errors.hpp"
#include "fake_providers.hpp"

#include "gtest/gtest.h"

using namespace TightZone::Screener;
using TightZone::Testing::bars_from_closes;
using TightZone::Testing::narrowing_block_closes;

namespace{

// Ten-point block oscillating between base and base + width.
std::vector<double> block(double base, double width){
	std::vector<double> closes;
	for(int i = 0; i < 10; i++){
		closes.push_back(i % 2 == 0 ? base : base + width);
	}
	return closes;
}

std::vector<double> concat(std::initializer_list<std::vector<double>> blocks){
	std::vector<double> closes;
	for(const auto& b : blocks){
		closes.insert(closes.end(), b.begin(), b.end());
	}
	return closes;
}

std::vector<double> ranges_of(const std::vector<ContractionZone>& zones){
	std::vector<double> ranges;
	for(const auto& zone : zones){
		ranges.push_back(zone.range());
	}
	return ranges;
}

TEST(ContractionZones, NarrowingBlocks){
	std::vector<ContractionZone> zones = detect_contraction_zones(bars_from_closes(narrowing_block_closes()), 4);

	ASSERT_GE(zones.size(), 2u);
	for(size_t i = 1; i < zones.size(); i++){
		EXPECT_LT(zones[i].range(), zones[i - 1].range());
	}

	ASSERT_EQ(4u, zones.size());
	EXPECT_EQ(0u, zones[0].start_index);
	EXPECT_EQ(9u, zones[0].end_index);
	EXPECT_DOUBLE_EQ(104.0, zones[0].high);
	EXPECT_DOUBLE_EQ(100.0, zones[0].low);
	EXPECT_EQ(30u, zones[3].start_index);
	EXPECT_EQ(39u, zones[3].end_index);
	EXPECT_DOUBLE_EQ(1.0, zones[3].range());
}

TEST(ContractionZones, ShortSeriesYieldsNothing){
	std::vector<double> closes = narrowing_block_closes();
	closes.resize(19);
	EXPECT_TRUE(detect_contraction_zones(closes, 4).empty());
	EXPECT_TRUE(detect_contraction_zones(std::vector<double>{}, 4).empty());
	EXPECT_FALSE(detect_contraction_zones(narrowing_block_closes(), 4).empty());
}

TEST(ContractionZones, MinimumDensityScalesWithSegments){
	std::vector<double> closes = narrowing_block_closes();
	EXPECT_TRUE(detect_contraction_zones(closes, 9).empty());
	EXPECT_FALSE(detect_contraction_zones(closes, 8).empty());
}

TEST(ContractionZones, FlatWindowsAreSkipped){
	std::vector<double> closes(40, 100.0);
	EXPECT_TRUE(detect_contraction_zones(closes, 4).empty());

	std::vector<double> partly_flat = concat({block(100, 0), block(100, 3), block(100, 0), block(100, 1)});
	EXPECT_EQ(std::vector<double>({3.0, 1.0}), ranges_of(detect_contraction_zones(partly_flat, 4)));
}

TEST(ContractionZones, TiesAreRejected){
	std::vector<double> closes = concat({block(100, 4), block(100, 4), block(100, 2), block(100, 2)});
	std::vector<ContractionZone> zones = detect_contraction_zones(closes, 4);
	ASSERT_EQ(2u, zones.size());
	EXPECT_EQ(0u, zones[0].start_index);
	EXPECT_EQ(20u, zones[1].start_index);
}

TEST(ContractionZones, GreedyPassKeepsRunningMinimum){
	// The widening second window is skipped and later windows must beat the first.
	std::vector<double> closes = concat({block(100, 2), block(100, 5), block(100, 3), block(100, 1)});
	std::vector<ContractionZone> zones = detect_contraction_zones(closes, 4);
	EXPECT_EQ(std::vector<double>({2.0, 1.0}), ranges_of(zones));
	EXPECT_EQ(30u, zones[1].start_index);
}

TEST(ContractionZones, LeadingRemainderIsIgnored){
	std::vector<double> closes = {500.0, 1.0, 900.0};
	std::vector<double> tail = narrowing_block_closes();
	closes.insert(closes.end(), tail.begin(), tail.end());

	std::vector<ContractionZone> zones = detect_contraction_zones(closes, 4);
	ASSERT_EQ(4u, zones.size());
	EXPECT_EQ(3u, zones[0].start_index);
	EXPECT_EQ(12u, zones[0].end_index);
	EXPECT_DOUBLE_EQ(4.0, zones[0].range());
	EXPECT_EQ(42u, zones[3].end_index);
}

TEST(ContractionZones, SingleSegmentCoversWholeSeries){
	std::vector<double> closes = {1, 2, 3, 4, 5};
	std::vector<ContractionZone> zones = detect_contraction_zones(closes, 1);
	ASSERT_EQ(1u, zones.size());
	EXPECT_EQ(0u, zones[0].start_index);
	EXPECT_EQ(4u, zones[0].end_index);
	EXPECT_DOUBLE_EQ(5.0, zones[0].high);
	EXPECT_DOUBLE_EQ(1.0, zones[0].low);
}

TEST(ContractionZones, RejectsNonPositiveSegmentCount){
	EXPECT_THROW(detect_contraction_zones(narrowing_block_closes(), 0), InvalidInputError);
	EXPECT_THROW(detect_contraction_zones(narrowing_block_closes(), -2), InvalidInputError);
}

}
