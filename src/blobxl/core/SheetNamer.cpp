#include "blobxl/core/SheetNamer.hpp"
#include "blobxl/core/Exception.hpp"
#include "blobxl/utils/TextUtils.hpp"
#include <utf8.h>

namespace blobxl {
namespace core {

SheetPlacement SheetNamer::place(const std::string& source_key) const {
    SheetPlacement placement;
    placement.source_key = source_key;
    placement.candidate = utils::TextUtils::stripExtension(source_key);

    try {
        if (utils::TextUtils::codePointLength(placement.candidate) <= kMaxSheetNameLength) {
            placement.sheet_name = placement.candidate;
            return placement;
        }
        placement.sheet_name = utils::TextUtils::shorten(placement.candidate, kShortenWidth, "");
    } catch (const utf8::exception& e) {
        throw SerializationException(fmt::format("Source name is not valid UTF-8: {}", e.what()),
                                     placement.candidate, ErrorCode::InvalidWorksheet, __FILE__, __LINE__);
    }

    placement.shortened = true;
    placement.write_index = true;
    return placement;
}

}} // namespace blobxl::core
