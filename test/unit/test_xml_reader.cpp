#include "blobxl/core/Exception.hpp"
#include "blobxl/utils/Logger.hpp"
#include "blobxl/xml/XMLStreamReader.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace blobxl {
namespace xml {

class XMLStreamReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/xml_reader_test.log", Logger::Level::DEBUG, false);
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
    }

    XMLStreamReader reader;
};

// 测试流式回调与深度
TEST_F(XMLStreamReaderTest, StreamingCallbacks) {
    std::vector<std::string> events;
    reader.setStartElementCallback([&](std::string_view name, const std::vector<XMLAttribute>& attrs, int depth) {
        std::string event = "start:" + std::string(name) + "@" + std::to_string(depth);
        for (const auto& attr : attrs) {
            event += " " + std::string(attr.name) + "=" + std::string(attr.value);
        }
        events.push_back(event);
    });
    reader.setTextCallback([&](std::string_view text, int depth) {
        events.push_back("text:" + std::string(text) + "@" + std::to_string(depth));
    });
    reader.setEndElementCallback([&](std::string_view name, int depth) {
        events.push_back("end:" + std::string(name) + "@" + std::to_string(depth));
    });

    ASSERT_EQ(reader.parseFromString("<a x=\"1\"><b>hi &amp; bye</b></a>"), XMLParseError::Ok);
    const std::vector<std::string> expected = {
        "start:a@0 x=1", "start:b@1", "text:hi & bye@1", "end:b@1", "end:a@0"};
    EXPECT_EQ(events, expected);
    EXPECT_EQ(reader.getElementsParsed(), 2u);
}

TEST_F(XMLStreamReaderTest, TrimWhitespace) {
    std::vector<std::string> texts;
    reader.setTrimWhitespace(true);
    reader.setTextCallback([&](std::string_view text, int) { texts.emplace_back(text); });
    ASSERT_EQ(reader.parseFromString("<a>\n  <b>  v  </b>\n</a>"), XMLParseError::Ok);
    ASSERT_EQ(texts.size(), 1u);
    EXPECT_EQ(texts[0], "v");
}

TEST_F(XMLStreamReaderTest, MalformedInput) {
    EXPECT_EQ(reader.parseFromString("<a><b></a>"), XMLParseError::ParseFailed);
    EXPECT_FALSE(reader.getLastErrorMessage().empty());
    EXPECT_EQ(reader.parseFromString(""), XMLParseError::InvalidInput);
}

// 回调抛出的异常被转换为 CallbackError
TEST_F(XMLStreamReaderTest, CallbackErrorStopsParsing) {
    reader.setStartElementCallback([](std::string_view name, const std::vector<XMLAttribute>&, int) {
        if (name == "bad") {
            throw std::runtime_error("rejected");
        }
    });
    EXPECT_EQ(reader.parseFromString("<a><bad/><c/></a>"), XMLParseError::CallbackError);
    EXPECT_NE(reader.getLastErrorMessage().find("rejected"), std::string::npos);
}

// 测试 DOM 构建与路径查找
TEST_F(XMLStreamReaderTest, ParseToDom) {
    auto root = reader.parseToDOM(
        "<?xml version=\"1.0\"?>"
        "<EnumerationResults ContainerName=\"c\">"
        "<Blobs><Blob><Name>csvfiles/a.csv</Name></Blob><Blob><Name>csvfiles/b.csv</Name></Blob></Blobs>"
        "<NextMarker/>"
        "</EnumerationResults>");
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->name, "EnumerationResults");
    EXPECT_EQ(root->getAttribute("ContainerName"), "c");
    EXPECT_EQ(root->getAttribute("Missing", "dflt"), "dflt");

    auto* blobs = root->findChild("Blobs");
    ASSERT_NE(blobs, nullptr);
    auto items = blobs->findChildren("Blob");
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[1]->childText("Name"), "csvfiles/b.csv");
    EXPECT_EQ(items[1]->parent, blobs);

    auto* name = root->findChildByPath("Blobs/Blob/Name");
    ASSERT_NE(name, nullptr);
    EXPECT_EQ(name->text, "csvfiles/a.csv");
    EXPECT_EQ(root->findChildByPath("Blobs/Nope"), nullptr);
    EXPECT_EQ(root->childText("NextMarker"), "");
}

TEST_F(XMLStreamReaderTest, ParseToDomThrowsOnBadXml) {
    EXPECT_THROW(reader.parseToDOM("<unclosed>"), core::XMLException);
    EXPECT_THROW(reader.parseToDOM(""), core::XMLException);
}

}} // namespace blobxl::xml
