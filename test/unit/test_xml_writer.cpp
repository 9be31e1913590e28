#include "blobxl/core/Exception.hpp"
#include "blobxl/utils/Logger.hpp"
#include "blobxl/utils/XMLUtils.hpp"
#include "blobxl/xml/SharedStrings.hpp"
#include "blobxl/xml/XMLStreamWriter.hpp"
#include <gtest/gtest.h>
#include <string>

namespace blobxl {
namespace xml {

class XMLStreamWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/xml_writer_test.log", Logger::Level::DEBUG, false);
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
    }

    XMLStreamWriter writer;
};

// 测试基本元素与属性
TEST_F(XMLStreamWriterTest, ElementsAndAttributes) {
    writer.startDocument();
    writer.startElement("root");
    writer.writeAttribute("id", 5);
    writer.startElement("child");
    writer.writeText("text");
    writer.endElement(); // child
    writer.writeEmptyElement("empty");
    writer.endElement(); // root

    EXPECT_EQ(writer.toString(),
              "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
              "<root id=\"5\"><child>text</child><empty/></root>");
    EXPECT_EQ(writer.getDepth(), 0u);
}

// 没有内容的元素写成自闭合
TEST_F(XMLStreamWriterTest, SelfClosingElement) {
    writer.startElement("c");
    writer.writeAttribute("r", "A1");
    writer.endElement(); // c
    EXPECT_EQ(writer.toString(), "<c r=\"A1\"/>");
}

TEST_F(XMLStreamWriterTest, EscapesTextAndAttributes) {
    writer.startElement("t");
    writer.writeAttribute("v", "a\"b<c>&\nd");
    writer.writeText("1 < 2 & 3 > 0");
    writer.endElement(); // t
    EXPECT_EQ(writer.toString(), "<t v=\"a&quot;b&lt;c&gt;&amp;&#xA;d\">1 &lt; 2 &amp; 3 &gt; 0</t>");
}

TEST_F(XMLStreamWriterTest, EndDocumentClosesOpenElements) {
    writer.startElement("a");
    writer.startElement("b");
    writer.endDocument();
    EXPECT_EQ(writer.toString(), "<a><b/></a>");
}

TEST_F(XMLStreamWriterTest, MisuseThrows) {
    EXPECT_THROW(writer.endElement(), core::XMLException);
    EXPECT_THROW(writer.startElement(""), core::XMLException);
    EXPECT_THROW(writer.writeAttribute("x", "y"), core::XMLException);

    writer.startElement("a");
    writer.writeText("x");
    EXPECT_THROW(writer.writeAttribute("late", "y"), core::XMLException);
}

TEST_F(XMLStreamWriterTest, TakeStringResets) {
    writer.startElement("a");
    writer.endElement(); // a
    const std::string out = writer.takeString();
    EXPECT_EQ(out, "<a/>");
    EXPECT_TRUE(writer.isEmpty());
}

// 测试 Excel 控制字符转义
TEST(XMLUtilsTest, ExcelControlEscapes) {
    using utils::XMLUtils;
    EXPECT_EQ(XMLUtils::escapeExcelControls("a\x01" "b"), "a_x0001_b");
    EXPECT_EQ(XMLUtils::escapeExcelControls("tab\tnewline\n"), "tab\tnewline\n");
    EXPECT_EQ(XMLUtils::escapeExcelControls("cr\r"), "cr_x000D_");
    EXPECT_EQ(XMLUtils::escapeExcelControls("_x0000_"), "_x005F_x0000_");

    EXPECT_EQ(XMLUtils::unescapeExcelControls("a_x0001_b"), "a\x01" "b");
    EXPECT_EQ(XMLUtils::unescapeExcelControls("_x005F_x0000_"), "_x0000_");
    EXPECT_EQ(XMLUtils::unescapeExcelControls("cr_x000D_"), "cr\r");
}

TEST(XMLUtilsTest, TextEscapeDropsInvalidControls) {
    EXPECT_EQ(utils::XMLUtils::escapeText("a\x02<b"), "a&lt;b");
    EXPECT_EQ(utils::XMLUtils::escapeText("tab\there"), "tab\there");
}

// 共享字符串表去重并计数引用
TEST(SharedStringsTest, DeduplicatesStrings) {
    SharedStrings sst;
    EXPECT_EQ(sst.addString("north"), 0u);
    EXPECT_EQ(sst.addString("south"), 1u);
    EXPECT_EQ(sst.addString("north"), 0u);
    EXPECT_EQ(sst.size(), 2u);
    EXPECT_EQ(sst.referenceCount(), 3u);
    EXPECT_EQ(sst.getStringIndex("south"), 1);
    EXPECT_EQ(sst.getStringIndex("west"), -1);
    EXPECT_EQ(sst.getString(0), "north");

    const std::string xml = sst.generate();
    EXPECT_NE(xml.find("count=\"3\""), std::string::npos);
    EXPECT_NE(xml.find("uniqueCount=\"2\""), std::string::npos);
    EXPECT_NE(xml.find("<si><t>north</t></si>"), std::string::npos);
}

}} // namespace blobxl::xml
