#include "blobxl/service/RequestHandler.hpp"
#include "blobxl/core/Exception.hpp"
#include "blobxl/storage/AzureBlobStore.hpp"
#include "blobxl/utils/ModuleLoggers.hpp"
#include <nlohmann/json.hpp>

namespace blobxl {
namespace service {

using json = nlohmann::ordered_json;

namespace {

// 必须是非空字符串
bool takeString(json& body, const char* key, std::string& out) {
    auto it = body.find(key);
    if (it == body.end() || !it->is_string()) {
        return false;
    }
    out = std::move(it->get_ref<std::string&>());
    return !out.empty();
}

} // namespace

RequestHandler::RequestHandler(ServiceOptions options, ContextFactory factory)
    : service_(options)
    , factory_(std::move(factory)) {
    if (!factory_) {
        storage::AzureOptions azure = options.storage;
        factory_ = [azure](const storage::SecureString& connection_string) {
            return std::unique_ptr<storage::IStorageContext>(
                std::make_unique<storage::AzureStorageContext>(connection_string, azure));
        };
    }
}

core::Result<RequestParameters> RequestHandler::parseRequest(std::string_view body) {
    json parsed = json::parse(body.begin(), body.end(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return core::makeError(core::ErrorCode::InternalError, kInvalidJsonMessage);
    }

    RequestParameters params;
    std::string connection_string;
    bool complete = takeString(parsed, "excel_filename", params.excel_filename);
    complete = takeString(parsed, "container_name", params.container_name) && complete;
    complete = takeString(parsed, "connection_string", connection_string) && complete;
    params.connection_string = storage::SecureString(std::move(connection_string));
    if (!complete) {
        return core::makeError(core::ErrorCode::ValidationFailed, kMissingFieldsMessage);
    }
    return params;
}

ServiceResponse RequestHandler::errorResponse(const core::Error& error) {
    ServiceResponse response;
    switch (error.code) {
    case core::ErrorCode::ValidationFailed:
        response.status = 400;
        response.content_type = "text/plain";
        response.body = error.message;
        break;
    case core::ErrorCode::NotFound:
        response.status = 404;
        response.content_type = "text/plain";
        response.body = error.message;
        break;
    default:
        response.status = 500;
        response.content_type = "application/json";
        response.body = json{{"status", "error"}, {"message", error.message}}.dump();
        break;
    }
    return response;
}

ServiceResponse RequestHandler::successResponse(const ConversionResult& result) {
    json body;
    body["status"] = "success";
    body["message"] = "Job Complete!";
    body["excel_url"] = result.excel_url;
    body["file_count"] = result.file_count;

    ServiceResponse response;
    response.status = 200;
    response.content_type = "application/json";
    response.body = body.dump();
    return response;
}

ServiceResponse RequestHandler::handle(std::string_view body) {
    SERVICE_INFO("ConvertCsvToExcel processed a request.");

    core::Result<RequestParameters> params = parseRequest(body);
    if (!params) {
        SERVICE_WARN("Rejected request: {}", params.error().message);
        return errorResponse(params.error());
    }

    SERVICE_INFO("Starting CSV to Excel conversion for: {} (container {})",
                 params->excel_filename, params->container_name);

    std::unique_ptr<storage::IBlobStore> store;
    try {
        std::unique_ptr<storage::IStorageContext> context = factory_(params->connection_string);
        store = context->openContainer(params->container_name);
    } catch (const core::BlobxlException& e) {
        SERVICE_ERROR("Cannot open storage: {}", e.what());
        return errorResponse(e.toError());
    } catch (const std::exception& e) {
        SERVICE_ERROR("Unexpected error while opening storage: {}", e.what());
        return errorResponse(core::makeError(core::ErrorCode::InternalError, e.what()));
    }

    core::Result<ConversionResult> result = service_.convert(*store, params->excel_filename);
    if (!result) {
        if (result.error().code != core::ErrorCode::NotFound) {
            SERVICE_ERROR("Error: {}", result.error().message);
        }
        return errorResponse(result.error());
    }

    SERVICE_INFO("Converted {} CSV files into {} ({} bytes)",
                 result->file_count, result->blob_name, result->byte_count);
    return successResponse(*result);
}

}} // namespace blobxl::service
