#include "blobxl/core/Exception.hpp"
#include "blobxl/core/Table.hpp"
#include "blobxl/core/Workbook.hpp"
#include "blobxl/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

namespace blobxl {
namespace core {

class WorkbookTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/workbook_test.log", Logger::Level::DEBUG, false);
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
    }

    // 期望 addSheet 失败
    static void expectRejected(Workbook& workbook, const std::string& name) {
        try {
            workbook.addSheet(name);
            ADD_FAILURE() << "sheet name accepted: " << name;
        } catch (const SerializationException& e) {
            EXPECT_EQ(e.getErrorCode(), ErrorCode::InvalidWorksheet);
        }
    }

    Workbook workbook;
};

TEST_F(WorkbookTest, AddSheet) {
    auto sheet = workbook.addSheet("data");
    ASSERT_NE(sheet, nullptr);
    EXPECT_EQ(sheet->getName(), "data");
    EXPECT_EQ(sheet->getSheetId(), 1u);
    EXPECT_EQ(workbook.getSheetCount(), 1u);
    EXPECT_EQ(workbook.getSheet("data"), sheet);
    EXPECT_EQ(workbook.getSheet("missing"), nullptr);
    EXPECT_EQ(workbook.getSheet(5), nullptr);
}

// 同名工作表被复用
TEST_F(WorkbookTest, ExactNameReusesSheet) {
    auto first = workbook.addSheet("data");
    auto second = workbook.addSheet("data");
    EXPECT_EQ(first, second);
    EXPECT_EQ(workbook.getSheetCount(), 1u);
}

TEST_F(WorkbookTest, CaseInsensitiveDuplicateRejected) {
    workbook.addSheet("Data");
    try {
        workbook.addSheet("DATA");
        FAIL() << "duplicate accepted";
    } catch (const SerializationException& e) {
        EXPECT_STREQ(e.what(), "Sheetname 'DATA', with case ignored, is already in use.");
        EXPECT_EQ(e.getWorksheetName(), "DATA");
    }
    EXPECT_EQ(workbook.getSheetCount(), 1u);
}

// 空名字按调用次数分配 SheetN
TEST_F(WorkbookTest, EmptyNameGetsDefault) {
    workbook.addSheet("first");
    auto sheet = workbook.addSheet("");
    EXPECT_EQ(sheet->getName(), "Sheet2");
    EXPECT_EQ(sheet->getSheetId(), 2u);
}

// 复用已有工作表不影响默认名编号
TEST_F(WorkbookTest, ReusedSheetNotCountedForDefaultName) {
    workbook.addSheet("a");
    workbook.addSheet("a");
    auto sheet = workbook.addSheet("");
    EXPECT_EQ(sheet->getName(), "Sheet2");
    EXPECT_EQ(workbook.getSheetCount(), 2u);
}

TEST_F(WorkbookTest, InvalidNamesRejected) {
    expectRejected(workbook, std::string(32, 'x'));
    expectRejected(workbook, "a/b");
    expectRejected(workbook, "q?");
    expectRejected(workbook, "[x]");
    expectRejected(workbook, "'quoted");
    expectRejected(workbook, "quoted'");
    EXPECT_EQ(workbook.getSheetCount(), 0u);

    EXPECT_NO_THROW(workbook.addSheet(std::string(31, 'x')));
    EXPECT_NO_THROW(workbook.addSheet("it's fine"));
}

TEST_F(WorkbookTest, SheetNamesInOrder) {
    workbook.addSheet("b");
    workbook.addSheet("a");
    const auto names = workbook.getSheetNames();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "b");
    EXPECT_EQ(names[1], "a");
    EXPECT_EQ(workbook.getSheet(1)->getName(), "a");
}

TEST_F(WorkbookTest, DefaultProperties) {
    EXPECT_EQ(workbook.properties().author, "blobxl");
    workbook.properties().title = "report";
    EXPECT_EQ(workbook.properties().title, "report");
}

// TableSet 保持首次插入顺序，替换不改变位置
TEST(TableSetTest, InsertionOrderAndReplace) {
    TableSet set;
    EXPECT_TRUE(set.empty());
    EXPECT_TRUE(set.insertOrAssign("b.csv", Table({"x"}, {})));
    EXPECT_TRUE(set.insertOrAssign("a.csv", Table({"y"}, {})));
    EXPECT_FALSE(set.insertOrAssign("b.csv", Table({"z"}, {})));

    ASSERT_EQ(set.size(), 2u);
    const auto keys = set.keys();
    EXPECT_EQ(keys[0], "b.csv");
    EXPECT_EQ(keys[1], "a.csv");
    EXPECT_EQ(set.at("b.csv").columns()[0], "z");
    EXPECT_TRUE(set.contains("a.csv"));
    EXPECT_THROW(set.at("c.csv"), std::out_of_range);
}

TEST(TableTest, RejectsRaggedRows) {
    std::vector<Table::Row> rows;
    rows.push_back({Cell::number(1)});
    EXPECT_THROW(Table({"a", "b"}, std::move(rows)), BlobxlException);
}

TEST(CellTest, ValuesAndText) {
    EXPECT_TRUE(Cell().isEmpty());
    EXPECT_EQ(Cell::number(42).toString(), "42");
    EXPECT_EQ(Cell::number(0.1).toString(), "0.1");
    EXPECT_EQ(Cell::boolean(true).toString(), "TRUE");
    EXPECT_EQ(Cell::string("x").toString(), "x");
    EXPECT_EQ(Cell::number(1), Cell::number(1));
    EXPECT_NE(Cell::number(1), Cell::string("1"));
}

}} // namespace blobxl::core
