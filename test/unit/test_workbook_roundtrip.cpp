#include "blobxl/archive/ZipReader.hpp"
#include "blobxl/core/CSVProcessor.hpp"
#include "blobxl/core/Exception.hpp"
#include "blobxl/core/ExcelStructureGenerator.hpp"
#include "blobxl/core/WorkbookAssembler.hpp"
#include "blobxl/reader/XLSXReader.hpp"
#include "blobxl/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace blobxl {
namespace core {

class WorkbookRoundTripTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/roundtrip_test.log", Logger::Level::DEBUG, false);
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
    }

    // 解析 CSV 并组装、序列化为 XLSX 字节
    std::vector<uint8_t> buildXlsx(const std::vector<std::pair<std::string, std::string>>& files) {
        TableSet tables;
        CSVProcessor processor;
        for (const auto& [name, content] : files) {
            tables.insertOrAssign(name, processor.parse(content, name));
        }
        WorkbookAssembler assembler;
        auto workbook = assembler.assemble(tables);
        workbook->properties().title = "report";

        ExcelStructureGenerator generator;
        generator.setCreatedTime(1700000000);
        return generator.generate(*workbook);
    }

    static std::string extract(const std::vector<uint8_t>& xlsx, const std::string& part) {
        archive::ZipReader zip;
        EXPECT_TRUE(zip.open(xlsx));
        std::string content;
        EXPECT_EQ(zip.extractFile(part, content), archive::ZipError::Ok) << part;
        return content;
    }
};

// 测试包结构：所有必需部件都存在
TEST_F(WorkbookRoundTripTest, PackageContainsRequiredParts) {
    const auto xlsx = buildXlsx({{"a.csv", "x\n1\n"}, {"b.csv", "y\nhello\n"}});

    archive::ZipReader zip;
    ASSERT_TRUE(zip.open(xlsx));
    for (const char* part : {"[Content_Types].xml", "_rels/.rels", "docProps/app.xml", "docProps/core.xml",
                             "xl/workbook.xml", "xl/_rels/workbook.xml.rels", "xl/styles.xml",
                             "xl/sharedStrings.xml", "xl/worksheets/sheet1.xml", "xl/worksheets/sheet2.xml"}) {
        EXPECT_EQ(zip.fileExists(part), archive::ZipError::Ok) << part;
    }

    const std::string core_xml = extract(xlsx, "docProps/core.xml");
    EXPECT_NE(core_xml.find("<dc:title>report</dc:title>"), std::string::npos);
    EXPECT_NE(core_xml.find("2023-11-14T22:13:20Z"), std::string::npos);

    const std::string sheet1 = extract(xlsx, "xl/worksheets/sheet1.xml");
    EXPECT_NE(sheet1.find("<dimension ref=\"A1:A2\"/>"), std::string::npos);
    EXPECT_NE(sheet1.find("tabSelected=\"1\""), std::string::npos);
    EXPECT_EQ(extract(xlsx, "xl/worksheets/sheet2.xml").find("tabSelected"), std::string::npos);
}

// 测试读回：工作表顺序、值类型、表头样式
TEST_F(WorkbookRoundTripTest, ReadBackValuesAndStyles) {
    const auto xlsx = buildXlsx({
        {"a.csv", "name,qty,ok\nwidget,3,True\n,4.5,False\n"},
        {"b.csv", "note\n\"a & <b>\"\n_x0041_\n"},
    });

    reader::XLSXReader reader(xlsx);
    ASSERT_EQ(reader.open(), ErrorCode::Ok) << reader.getLastError();

    std::vector<std::string> names;
    ASSERT_EQ(reader.getSheetNames(names), ErrorCode::Ok);
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "a");
    EXPECT_EQ(names[1], "b");

    std::unique_ptr<Workbook> workbook;
    ASSERT_EQ(reader.loadWorkbook(workbook), ErrorCode::Ok) << reader.getLastError();

    auto a = workbook->getSheet("a");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->getCell(0, 0)->value.getStringValue(), "name");
    EXPECT_EQ(a->getCell(0, 0)->style, CellStyle::Header);
    EXPECT_EQ(a->getCell(1, 0)->value.getStringValue(), "widget");
    EXPECT_EQ(a->getCell(1, 0)->style, CellStyle::Default);
    EXPECT_DOUBLE_EQ(a->getCell(2, 1)->value.getNumberValue(), 4.5);
    EXPECT_TRUE(a->getCell(1, 2)->value.getBooleanValue());
    EXPECT_FALSE(a->getCell(2, 2)->value.getBooleanValue());
    EXPECT_EQ(a->getCell(2, 0), nullptr);

    auto b = workbook->getSheet("b");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->getCell(1, 0)->value.getStringValue(), "a & <b>");
    EXPECT_EQ(b->getCell(2, 0)->value.getStringValue(), "_x0041_");
}

// 缩短的工作表名带行号列
TEST_F(WorkbookRoundTripTest, ShortenedSheetHasIndexColumn) {
    const auto xlsx = buildXlsx({{"quarterly_regional_sales_breakdown_2024.csv", "region\nnorth\nsouth\n"}});

    reader::XLSXReader reader(xlsx);
    std::unique_ptr<Workbook> workbook;
    ASSERT_EQ(reader.loadWorkbook(workbook), ErrorCode::Ok) << reader.getLastError();
    ASSERT_EQ(workbook->getSheetCount(), 1u);

    auto sheet = workbook->getSheet(0);
    EXPECT_EQ(sheet->getName(), "quarterly_regional_sales_break");
    EXPECT_EQ(sheet->getCell(0, 1)->value.getStringValue(), "region");
    EXPECT_DOUBLE_EQ(sheet->getCell(2, 0)->value.getNumberValue(), 1.0);
    EXPECT_EQ(sheet->getCell(2, 0)->style, CellStyle::Header);
    EXPECT_EQ(sheet->usedRange(), "A1:B3");
}

TEST_F(WorkbookRoundTripTest, EmptyWorkbookCannotBeSerialized) {
    Workbook workbook;
    ExcelStructureGenerator generator;
    EXPECT_THROW(generator.generate(workbook), SerializationException);
}

TEST_F(WorkbookRoundTripTest, ReaderRejectsNonZipData) {
    reader::XLSXReader reader(std::vector<uint8_t>{'h', 'e', 'l', 'l', 'o'});
    EXPECT_EQ(reader.open(), ErrorCode::ZipError);
    EXPECT_FALSE(reader.getLastError().empty());
}

TEST(CellReferenceTest, Parse) {
    uint32_t row = 0;
    uint32_t col = 0;
    ASSERT_TRUE(reader::parseCellReference("B12", row, col));
    EXPECT_EQ(row, 11u);
    EXPECT_EQ(col, 1u);
    ASSERT_TRUE(reader::parseCellReference("AA1", row, col));
    EXPECT_EQ(col, 26u);
    EXPECT_FALSE(reader::parseCellReference("12", row, col));
    EXPECT_FALSE(reader::parseCellReference("B", row, col));
    EXPECT_FALSE(reader::parseCellReference("B0", row, col));
}

}} // namespace blobxl::core
