#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "core/test_base.hpp"
#include "macross/data/series_preprocessor.hpp"

using namespace macross;
using namespace macross::testing;

class SeriesPreprocessorTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        auto a = make_bars({10.0, 11.0, 12.0}, "AAA");
        auto b = make_bars({50.0, 49.0}, "BBB");
        // Interleave as a multi-instrument file would be
        mixed_ = {b[0], a[0], a[1], b[1], a[2]};
    }

    std::vector<Bar> mixed_;
};

TEST_F(SeriesPreprocessorTest, ListInstrumentsInFirstAppearanceOrder) {
    auto symbols = SeriesPreprocessor::list_instruments(mixed_);
    ASSERT_EQ(symbols.size(), 2);
    EXPECT_EQ(symbols[0], "BBB");
    EXPECT_EQ(symbols[1], "AAA");
}

TEST_F(SeriesPreprocessorTest, SelectInstrumentPreservesOrder) {
    auto selected = SeriesPreprocessor::select_instrument(mixed_, "AAA");
    ASSERT_EQ(selected.size(), 3);
    EXPECT_DOUBLE_EQ(selected[0].close, 10.0);
    EXPECT_DOUBLE_EQ(selected[1].close, 11.0);
    EXPECT_DOUBLE_EQ(selected[2].close, 12.0);

    EXPECT_TRUE(SeriesPreprocessor::select_instrument(mixed_, "ZZZ").empty());
}

TEST_F(SeriesPreprocessorTest, GroupByInstrument) {
    auto groups = SeriesPreprocessor::group_by_instrument(mixed_);
    ASSERT_EQ(groups.size(), 2);
    EXPECT_EQ(groups[0].first, "BBB");
    ASSERT_EQ(groups[0].second.size(), 2);
    EXPECT_DOUBLE_EQ(groups[0].second[1].close, 49.0);
    EXPECT_EQ(groups[1].first, "AAA");
    EXPECT_EQ(groups[1].second.size(), 3);
}

TEST_F(SeriesPreprocessorTest, Closes) {
    auto closes = SeriesPreprocessor::closes(make_bars({1.0, 2.5}));
    ASSERT_EQ(closes.size(), 2);
    EXPECT_DOUBLE_EQ(closes[1], 2.5);
}

TEST_F(SeriesPreprocessorTest, ValidateRejectsNonPositiveAndNonFinite) {
    EXPECT_TRUE(SeriesPreprocessor::validate(make_bars({1.0, 2.0})).is_ok());
    EXPECT_TRUE(SeriesPreprocessor::validate({}).is_ok());

    auto zero = SeriesPreprocessor::validate(make_bars({1.0, 0.0}));
    ASSERT_TRUE(zero.is_error());
    EXPECT_EQ(zero.error()->code(), ErrorCode::INVALID_DATA);

    auto nan = SeriesPreprocessor::validate(make_bars({kUndefined}));
    ASSERT_TRUE(nan.is_error());
    EXPECT_EQ(nan.error()->code(), ErrorCode::INVALID_DATA);

    auto inf = SeriesPreprocessor::validate(
        make_bars({1.0, std::numeric_limits<double>::infinity()}));
    EXPECT_TRUE(inf.is_error());
}
