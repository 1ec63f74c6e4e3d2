#include <gtest/gtest.h>
#include "tabexport/core/ResultMatrix.hpp"
#include "tabexport/core/Exception.hpp"

using namespace tabexport::core;

class ResultMatrixTest : public ::testing::Test {
protected:
    std::vector<ColumnDescriptor> columns{{"id", ColumnType::IntegerLike}, {"description"}};
};

TEST_F(ResultMatrixTest, WidthsStartAtHeaderLength) {
    ResultMatrix page(columns);
    ASSERT_EQ(page.widths().size(), 2u);
    EXPECT_EQ(page.widths()[0], 2u);
    EXPECT_EQ(page.widths()[1], 11u);
    EXPECT_TRUE(page.empty());
    EXPECT_EQ(page.capacity(), Constants::kMaxPageRows);
}

TEST_F(ResultMatrixTest, WidthsTrackLongestValue) {
    ResultMatrix page(columns);
    page.append({"12345", "x"});
    page.append({"1", "a much longer description"});
    EXPECT_EQ(page.widths()[0], 5u);
    EXPECT_EQ(page.widths()[1], 26u);
    EXPECT_EQ(page.rowCount(), 2u);
}

TEST_F(ResultMatrixTest, NullMarkerCountsTowardsWidth) {
    ResultMatrix page({{"n"}});
    page.append({Constants::kNullMarker});
    EXPECT_EQ(page.widths()[0], 6u);
}

TEST_F(ResultMatrixTest, OverflowWhenFull) {
    ResultMatrix page(columns, 2);
    page.append({"1", "a"});
    page.append({"2", "b"});
    EXPECT_TRUE(page.isFull());
    try {
        page.append({"3", "c"});
        FAIL() << "expected an exception";
    } catch (const ResultOverflowException& e) {
        EXPECT_EQ(e.getCapacity(), 2u);
        EXPECT_EQ(e.getErrorCode(), ErrorCode::ResultOverflow);
    }
    EXPECT_EQ(page.rowCount(), 2u);
}

TEST_F(ResultMatrixTest, ColumnCountMismatch) {
    ResultMatrix page(columns);
    try {
        page.append({"only one"});
        FAIL() << "expected an exception";
    } catch (const OperationException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::ColumnCountMismatch);
        EXPECT_EQ(e.getOperation(), "append");
    }
    EXPECT_TRUE(page.empty());
}

// 新的一页重新计算列宽
TEST_F(ResultMatrixTest, WidthsArePerPage) {
    ResultMatrix first(columns, 1);
    first.append({"123456789", "x"});
    ResultMatrix second(columns, 1);
    second.append({"1", "x"});
    EXPECT_EQ(first.widths()[0], 9u);
    EXPECT_EQ(second.widths()[0], 2u);
}
