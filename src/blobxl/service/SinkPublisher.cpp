#include "blobxl/service/SinkPublisher.hpp"
#include "blobxl/utils/ModuleLoggers.hpp"
#include "blobxl/utils/TextUtils.hpp"

namespace blobxl {
namespace service {

std::string SinkPublisher::targetName(const std::string& excel_filename) {
    if (utils::TextUtils::endsWith(excel_filename, ".xlsx")) {
        return excel_filename;
    }
    return excel_filename + ".xlsx";
}

std::string SinkPublisher::publish(const std::vector<uint8_t>& workbook, const std::string& excel_filename) {
    const std::string name = targetName(excel_filename);
    SERVICE_INFO("Uploading Excel file {} to container {}", name, store_.containerName());
    std::string url = store_.upload(name, workbook);
    SERVICE_INFO("Excel file uploaded successfully: {}", url);
    return url;
}

}} // namespace blobxl::service
