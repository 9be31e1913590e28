#include "blobxl/service/ConversionService.hpp"
#include "blobxl/core/Exception.hpp"
#include "blobxl/core/ExcelStructureGenerator.hpp"
#include "blobxl/core/WorkbookAssembler.hpp"
#include "blobxl/service/SinkPublisher.hpp"
#include "blobxl/service/SourceEnumerator.hpp"
#include "blobxl/utils/ModuleLoggers.hpp"

namespace blobxl {
namespace service {

ConversionService::ConversionService(ServiceOptions options)
    : options_(std::move(options)) {
}

core::Result<ConversionResult> ConversionService::convert(storage::IBlobStore& store,
                                                          const std::string& excel_filename) {
    try {
        SourceEnumerator enumerator(store, options_.source_prefix, options_.source_extension);
        core::TableSet tables = enumerator.enumerate();
        if (tables.empty()) {
            SERVICE_WARN("No CSV files found under {} in container {}", options_.source_prefix, store.containerName());
            return core::makeError(core::ErrorCode::NotFound,
                                   "No CSV files found in the csvfiles directory of the specified blob container.");
        }

        core::WorkbookAssembler assembler;
        std::unique_ptr<core::Workbook> workbook = assembler.assemble(tables);
        workbook->properties().title = SinkPublisher::targetName(excel_filename);

        core::ExcelStructureGenerator generator(options_.compression_level);
        const std::vector<uint8_t> bytes = generator.generate(*workbook);

        SinkPublisher publisher(store);
        ConversionResult result;
        result.excel_url = publisher.publish(bytes, excel_filename);
        result.blob_name = SinkPublisher::targetName(excel_filename);
        result.file_count = tables.size();
        result.byte_count = bytes.size();
        return result;
    } catch (const core::BlobxlException& e) {
        SERVICE_ERROR("Conversion failed: {}", e.getDetailedMessage());
        return e.toError();
    } catch (const std::exception& e) {
        SERVICE_ERROR("Conversion failed with unexpected error: {}", e.what());
        return core::makeError(core::ErrorCode::InternalError, e.what());
    }
}

}} // namespace blobxl::service
