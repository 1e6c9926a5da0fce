#include "configs/config_loader.hpp"
#include "configs/system_config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "gtest/gtest.h"

using namespace TightZone::Config;

namespace{

class ConfigLoaderTest: public ::testing::Test{
protected:
	void SetUp() override{
		const ::testing::TestInfo* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
		config_directory = std::filesystem::temp_directory_path() / (std::string("tightzone_config_") + test_info->name());
		std::filesystem::create_directories(config_directory);
	}

	void TearDown() override{
		std::error_code ignored_error;
		std::filesystem::remove_all(config_directory, ignored_error);
	}

	std::string write_file(const std::string& filename, const std::string& content){
		std::filesystem::path file_path = config_directory / filename;
		std::ofstream out(file_path);
		out << content;
		return file_path.string();
	}

	std::filesystem::path config_directory;
};

TEST_F(ConfigLoaderTest, LoadsProviderAndScreenerKeys){
	std::string path = write_file("all.csv",
		"# endpoints\n"
		"\n"
		"scanner.base_url, https://scanner.example.com\n"
		"scanner.endpoint,/{market}/scan\n"
		"scanner.retry_count,3\n"
		"history.base_url,https://history.example.com\n"
		"history.timeout_seconds,10\n"
		"history.enable_ssl_verification,false\n"
		"history.period,1y\n"
		"history.max_concurrent_fetches,8\n"
		"screener.market,crypto\n"
		"screener.page_size,50\n"
		"screener.columns,name| close |SMA200||\n"
		"screener.apply_vcp_filter,no\n"
		"zones.segment_count,6\n"
		"logging.console_enabled,0\n"
		"unknown.key,whatever\n");

	SystemConfig config;
	std::string error_message;
	ASSERT_TRUE(load_config_from_csv(config, path, error_message)) << error_message;

	EXPECT_EQ("https://scanner.example.com", config.api.scanner.base_url);
	EXPECT_EQ("/{market}/scan", config.api.scanner.endpoint);
	EXPECT_EQ(3, config.api.scanner.retry_count);
	EXPECT_EQ(10, config.api.history.timeout_seconds);
	EXPECT_FALSE(config.api.history.enable_ssl_verification);
	EXPECT_EQ("1y", config.zones.history_period);
	EXPECT_EQ("1d", config.zones.history_interval);
	EXPECT_EQ(8, config.zones.max_concurrent_fetches);
	EXPECT_EQ("crypto", config.screener.market);
	EXPECT_EQ(50, config.screener.page_size);
	EXPECT_EQ(std::vector<std::string>({"name", "close", "SMA200"}), config.screener.columns);
	EXPECT_FALSE(config.screener.apply_vcp_filter);
	EXPECT_EQ(6, config.zones.segment_count);
	EXPECT_FALSE(config.logging.console_enabled);
	EXPECT_EQ("desc", config.screener.sort_order);
}

TEST_F(ConfigLoaderTest, BadNumberNamesFileAndLine){
	std::string path = write_file("bad.csv", "screener.market,america\nscreener.page_size,lots\n");
	SystemConfig config;
	std::string error_message;
	EXPECT_FALSE(load_config_from_csv(config, path, error_message));
	EXPECT_NE(std::string::npos, error_message.find("bad.csv:2"));
	EXPECT_NE(std::string::npos, error_message.find("screener.page_size"));
}

TEST_F(ConfigLoaderTest, MissingFileFails){
	SystemConfig config;
	std::string error_message;
	EXPECT_FALSE(load_config_from_csv(config, (config_directory / "absent.csv").string(), error_message));
	EXPECT_NE(std::string::npos, error_message.find("absent.csv"));
	EXPECT_EQ(1, load_system_config(config, config_directory.string(), error_message));
}

TEST_F(ConfigLoaderTest, LoadSystemConfigReadsBothFiles){
	write_file(API_ENDPOINTS_CONFIG_FILENAME, "scanner.base_url,https://s\nhistory.base_url,https://h\n");
	write_file(SCREENER_CONFIG_FILENAME, "screener.market,uk\n");

	SystemConfig config;
	std::string error_message;
	ASSERT_EQ(0, load_system_config(config, config_directory.string(), error_message)) << error_message;
	EXPECT_EQ("https://s", config.api.scanner.base_url);
	EXPECT_EQ("uk", config.screener.market);
	EXPECT_TRUE(validate_config(config, error_message)) << error_message;
}

TEST_F(ConfigLoaderTest, ValidationRejectsBadValues){
	SystemConfig config;
	config.api.scanner.base_url = "https://s";
	config.api.history.base_url = "https://h";
	std::string error_message;
	ASSERT_TRUE(validate_config(config, error_message));

	SystemConfig missing_url = config;
	missing_url.api.history.base_url.clear();
	EXPECT_FALSE(validate_config(missing_url, error_message));

	SystemConfig zero_page = config;
	zero_page.screener.page_size = 0;
	EXPECT_FALSE(validate_config(zero_page, error_message));
	EXPECT_NE(std::string::npos, error_message.find("page_size"));

	SystemConfig bad_order = config;
	bad_order.screener.sort_order = "up";
	EXPECT_FALSE(validate_config(bad_order, error_message));

	SystemConfig zero_segments = config;
	zero_segments.zones.segment_count = 0;
	EXPECT_FALSE(validate_config(zero_segments, error_message));

	SystemConfig blank_market = config;
	blank_market.screener.market = "  ";
	EXPECT_FALSE(validate_config(blank_market, error_message));
}

TEST_F(ConfigLoaderTest, ConfigDirectoryPrecedence){
	setenv(CONFIG_DIRECTORY_ENVIRONMENT_VARIABLE, "/etc/tightzone", 1);
	EXPECT_EQ("/opt/cfg", resolve_config_directory("/opt/cfg"));
	EXPECT_EQ("/etc/tightzone", resolve_config_directory(""));
	unsetenv(CONFIG_DIRECTORY_ENVIRONMENT_VARIABLE);
	EXPECT_EQ(DEFAULT_CONFIG_DIRECTORY, resolve_config_directory(""));
}

}
