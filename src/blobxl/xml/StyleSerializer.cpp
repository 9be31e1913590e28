#include "blobxl/xml/StyleSerializer.hpp"
#include "blobxl/xml/XMLStreamWriter.hpp"

namespace blobxl {
namespace xml {

namespace {

void writeFont(XMLStreamWriter& writer, bool bold) {
    writer.startElement("font");
    if (bold) {
        writer.writeEmptyElement("b");
    }
    writer.startElement("sz");
    writer.writeAttribute("val", "11");
    writer.endElement(); // sz
    writer.startElement("name");
    writer.writeAttribute("val", "Calibri");
    writer.endElement(); // name
    writer.startElement("family");
    writer.writeAttribute("val", "2");
    writer.endElement(); // family
    writer.startElement("scheme");
    writer.writeAttribute("val", "minor");
    writer.endElement(); // scheme
    writer.endElement(); // font
}

void writeBorderSide(XMLStreamWriter& writer, const char* side, bool thin) {
    writer.startElement(side);
    if (thin) {
        writer.writeAttribute("style", "thin");
        writer.startElement("color");
        writer.writeAttribute("auto", "1");
        writer.endElement(); // color
    }
    writer.endElement();
}

void writeBorder(XMLStreamWriter& writer, bool thin) {
    writer.startElement("border");
    writeBorderSide(writer, "left", thin);
    writeBorderSide(writer, "right", thin);
    writeBorderSide(writer, "top", thin);
    writeBorderSide(writer, "bottom", thin);
    writer.writeEmptyElement("diagonal");
    writer.endElement(); // border
}

void writeFill(XMLStreamWriter& writer, const char* pattern) {
    writer.startElement("fill");
    writer.startElement("patternFill");
    writer.writeAttribute("patternType", pattern);
    writer.endElement(); // patternFill
    writer.endElement(); // fill
}

} // namespace

std::string StyleSerializer::generate() {
    XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("styleSheet");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/spreadsheetml/2006/main");

    writer.startElement("fonts");
    writer.writeAttribute("count", "2");
    writeFont(writer, false);
    writeFont(writer, true);
    writer.endElement(); // fonts

    writer.startElement("fills");
    writer.writeAttribute("count", "2");
    writeFill(writer, "none");
    writeFill(writer, "gray125");
    writer.endElement(); // fills

    writer.startElement("borders");
    writer.writeAttribute("count", "2");
    writeBorder(writer, false);
    writeBorder(writer, true);
    writer.endElement(); // borders

    writer.startElement("cellStyleXfs");
    writer.writeAttribute("count", "1");
    writer.startElement("xf");
    writer.writeAttribute("numFmtId", "0");
    writer.writeAttribute("fontId", "0");
    writer.writeAttribute("fillId", "0");
    writer.writeAttribute("borderId", "0");
    writer.endElement(); // xf
    writer.endElement(); // cellStyleXfs

    writer.startElement("cellXfs");
    writer.writeAttribute("count", "2");
    writer.startElement("xf");
    writer.writeAttribute("numFmtId", "0");
    writer.writeAttribute("fontId", "0");
    writer.writeAttribute("fillId", "0");
    writer.writeAttribute("borderId", "0");
    writer.writeAttribute("xfId", "0");
    writer.endElement(); // xf
    writer.startElement("xf");
    writer.writeAttribute("numFmtId", "0");
    writer.writeAttribute("fontId", "1");
    writer.writeAttribute("fillId", "0");
    writer.writeAttribute("borderId", "1");
    writer.writeAttribute("xfId", "0");
    writer.writeAttribute("applyFont", "1");
    writer.writeAttribute("applyBorder", "1");
    writer.writeAttribute("applyAlignment", "1");
    writer.startElement("alignment");
    writer.writeAttribute("horizontal", "center");
    writer.writeAttribute("vertical", "top");
    writer.endElement(); // alignment
    writer.endElement(); // xf
    writer.endElement(); // cellXfs

    writer.startElement("cellStyles");
    writer.writeAttribute("count", "1");
    writer.startElement("cellStyle");
    writer.writeAttribute("name", "Normal");
    writer.writeAttribute("xfId", "0");
    writer.writeAttribute("builtinId", "0");
    writer.endElement(); // cellStyle
    writer.endElement(); // cellStyles

    writer.startElement("dxfs");
    writer.writeAttribute("count", "0");
    writer.endElement(); // dxfs

    writer.startElement("tableStyles");
    writer.writeAttribute("count", "0");
    writer.writeAttribute("defaultTableStyle", "TableStyleMedium9");
    writer.writeAttribute("defaultPivotStyle", "PivotStyleLight16");
    writer.endElement(); // tableStyles

    writer.endElement(); // styleSheet
    writer.endDocument();
    return writer.takeString();
}

}} // namespace blobxl::xml
