#include "blobxl/Blobxl.hpp"
#include "blobxl/utils/Logger.hpp"
#include <curl/curl.h>
#include <iostream>

namespace blobxl {

bool initialize(const service::ServiceOptions& options) {
    try {
        Logger::getInstance().initialize(options.log_file, options.log_level, options.log_to_console);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        return false;
    }

    const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
        BLOBXL_LOG_CRITICAL("curl_global_init failed: {}", curl_easy_strerror(rc));
        return false;
    }

    BLOBXL_LOG_DEBUG("blobxl {} initialized (curl {})", getVersion(), curl_version());
    return true;
}

void cleanup() {
    curl_global_cleanup();
    BLOBXL_LOG_DEBUG("blobxl cleanup completed");
    Logger::getInstance().shutdown();
}

} // namespace blobxl
