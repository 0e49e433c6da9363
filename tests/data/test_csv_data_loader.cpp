#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "core/test_base.hpp"
#include "macross/data/csv_data_loader.hpp"

using namespace macross;
using namespace macross::testing;

class CsvDataLoaderTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        test_dir = std::filesystem::temp_directory_path() / "macross_csv_loader_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
        TestBase::TearDown();
    }

    std::string write_file(const std::string& name, const std::string& content) {
        auto path = test_dir / name;
        std::ofstream file(path);
        file << content;
        return path.string();
    }

    std::filesystem::path test_dir;
};

TEST_F(CsvDataLoaderTest, LoadsBarsAndIgnoresExtraColumns) {
    auto path = write_file("bars.csv",
                           "timestamp,stock_name,open,close\n"
                           "2024-01-02 09:15:00,AAA,99.0,100.5\n"
                           "2024-01-02 09:15:00,BBB,10.0,10.25\n"
                           "2024-01-02 09:30:00,AAA,100.5,101.0\n");

    CsvDataLoader loader;
    auto result = loader.load_bars(path);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();

    const auto& bars = result.value();
    ASSERT_EQ(bars.size(), 3);
    EXPECT_EQ(bars[0].symbol, "AAA");
    EXPECT_DOUBLE_EQ(bars[0].close, 100.5);
    EXPECT_EQ(bars[1].symbol, "BBB");
    EXPECT_EQ(bars[2].timestamp - bars[0].timestamp, std::chrono::minutes(15));
}

TEST_F(CsvDataLoaderTest, CustomColumnNamesAndFormat) {
    auto path = write_file("custom.csv",
                           "time;ticker;last\n"
                           "02/01/2024 09:15;AAA;5.5\n");

    CsvLoadOptions options;
    options.columns.timestamp = "time";
    options.columns.instrument = "ticker";
    options.columns.close = "last";
    options.delimiter = ';';
    options.timestamp_format = "%d/%m/%Y %H:%M";

    auto result = CsvDataLoader(options).load_bars(path);
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();
    ASSERT_EQ(result.value().size(), 1);
    EXPECT_DOUBLE_EQ(result.value()[0].close, 5.5);
}

TEST_F(CsvDataLoaderTest, MissingFile) {
    auto result = CsvDataLoader().load_bars((test_dir / "absent.csv").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(CsvDataLoaderTest, MissingColumnIsConversionError) {
    auto path = write_file("nocol.csv", "timestamp,stock_name\n2024-01-02 09:15:00,AAA\n");
    auto result = CsvDataLoader().load_bars(path);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONVERSION_ERROR);
}

TEST_F(CsvDataLoaderTest, UnparsableCloseIsConversionError) {
    auto path = write_file("bad.csv", "timestamp,stock_name,close\n2024-01-02 09:15:00,AAA,abc\n");
    auto result = CsvDataLoader().load_bars(path);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONVERSION_ERROR);
}
