#include "strategy_core/apps/bar_csv_loader.h"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace strategy_core::apps {
namespace {

std::filesystem::path WriteTempCsv(const std::string& body) {
    const auto token = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());
    const auto path = std::filesystem::temp_directory_path() /
                      ("strategy_core_bar_csv_loader_test_" + token + ".csv");
    std::ofstream out(path);
    out << body;
    return path;
}

TEST(BarCsvLoaderTest, LoadsColumnsByHeaderName) {
    const auto path = WriteTempCsv(
        "date,close,high,low,volume\n"
        "2024-01-02,9.5,10.0,9.0,100\n"
        "\n"
        "2024-01-03,10.2,10.5,9.2,120\n");

    OhlcColumns bars;
    std::string error;
    ASSERT_TRUE(LoadOhlcCsv(path.string(), &bars, &error)) << error;
    ASSERT_EQ(bars.size(), 2U);
    EXPECT_EQ(bars.high, (std::vector<double>{10.0, 10.5}));
    EXPECT_EQ(bars.low, (std::vector<double>{9.0, 9.2}));
    EXPECT_EQ(bars.close, (std::vector<double>{9.5, 10.2}));

    std::filesystem::remove(path);
}

TEST(BarCsvLoaderTest, AcceptsUpperCaseAliases) {
    const auto path = WriteTempCsv(
        "STOCK_CODE,HIGH_PRICE,LOW_PRICE,CLOSE_PRICE\n"
        "005930,71000,69500,70200\n");

    OhlcColumns bars;
    std::string error;
    ASSERT_TRUE(LoadOhlcCsv(path.string(), &bars, &error)) << error;
    ASSERT_EQ(bars.size(), 1U);
    EXPECT_EQ(bars.close.front(), 70200.0);

    std::filesystem::remove(path);
}

TEST(BarCsvLoaderTest, StripsUtf8ByteOrderMarkFromHeader) {
    const auto path = WriteTempCsv(
        "\xEF\xBB\xBF" "high,low,close\n"
        "10.0,9.0,9.5\n");

    OhlcColumns bars;
    std::string error;
    ASSERT_TRUE(LoadOhlcCsv(path.string(), &bars, &error)) << error;
    ASSERT_EQ(bars.size(), 1U);
    EXPECT_EQ(bars.high.front(), 10.0);

    std::filesystem::remove(path);
}

TEST(BarCsvLoaderTest, RejectsMissingColumn) {
    const auto path = WriteTempCsv("date,high,close\n2024-01-02,10,9.5\n");

    OhlcColumns bars;
    std::string error;
    EXPECT_FALSE(LoadOhlcCsv(path.string(), &bars, &error));
    EXPECT_NE(error.find("low column"), std::string::npos);

    std::filesystem::remove(path);
}

TEST(BarCsvLoaderTest, ReportsLineOfInvalidBar) {
    const auto path = WriteTempCsv(
        "high,low,close\n"
        "10,9,9.5\n"
        "10.5,n/a,10.2\n");

    OhlcColumns bars;
    std::string error;
    EXPECT_FALSE(LoadOhlcCsv(path.string(), &bars, &error));
    EXPECT_NE(error.find("line 3"), std::string::npos);

    std::filesystem::remove(path);
}

TEST(BarCsvLoaderTest, FailsWhenFileIsMissingOrEmpty) {
    OhlcColumns bars;
    std::string error;
    EXPECT_FALSE(LoadOhlcCsv("/nonexistent/bars.csv", &bars, &error));
    EXPECT_NE(error.find("unable to open"), std::string::npos);

    const auto path = WriteTempCsv("");
    EXPECT_FALSE(LoadOhlcCsv(path.string(), &bars, &error));
    EXPECT_NE(error.find("empty"), std::string::npos);
    std::filesystem::remove(path);
}

}  // namespace
}  // namespace strategy_core::apps
