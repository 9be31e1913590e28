#include "blobxl/service/ServiceOptions.hpp"
#include "blobxl/utils/ModuleLoggers.hpp"
#include "blobxl/utils/TextUtils.hpp"
#include <cerrno>
#include <cstdlib>
#include <optional>

namespace blobxl {
namespace service {

namespace {

std::optional<long long> parseInteger(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    const long long parsed = std::strtoll(value.c_str(), &end, 10);
    if (errno != 0 || end == value.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return parsed;
}

std::optional<bool> parseFlag(const std::string& value) {
    using utils::TextUtils;
    if (value == "1" || TextUtils::equalsIgnoreCase(value, "true") ||
        TextUtils::equalsIgnoreCase(value, "yes") || TextUtils::equalsIgnoreCase(value, "on")) {
        return true;
    }
    if (value == "0" || TextUtils::equalsIgnoreCase(value, "false") ||
        TextUtils::equalsIgnoreCase(value, "no") || TextUtils::equalsIgnoreCase(value, "off")) {
        return false;
    }
    return std::nullopt;
}

} // namespace

bool ServiceOptions::apply(const std::string& name, const std::string& value) {
    bool ok = true;

    if (name == "BLOBXL_LOG_FILE") {
        log_file = value;
    } else if (name == "BLOBXL_LOG_LEVEL") {
        ok = Logger::parseLevel(value, log_level);
    } else if (name == "BLOBXL_LOG_CONSOLE") {
        auto flag = parseFlag(value);
        ok = flag.has_value();
        if (ok) log_to_console = *flag;
    } else if (name == "BLOBXL_SOURCE_PREFIX") {
        source_prefix = value;
    } else if (name == "BLOBXL_SOURCE_EXTENSION") {
        ok = !value.empty();
        if (ok) source_extension = value;
    } else if (name == "BLOBXL_COMPRESSION_LEVEL") {
        auto level = parseInteger(value);
        ok = level && *level >= 0 && *level <= 9;
        if (ok) compression_level = static_cast<int>(*level);
    } else if (name == "BLOBXL_API_VERSION") {
        ok = !value.empty();
        if (ok) storage.api_version = value;
    } else if (name == "BLOBXL_SINGLE_PUT_LIMIT") {
        auto limit = parseInteger(value);
        ok = limit && *limit > 0;
        if (ok) storage.single_put_limit = static_cast<size_t>(*limit);
    } else if (name == "BLOBXL_BLOCK_SIZE") {
        // 单块上限 4000 MiB
        auto size = parseInteger(value);
        ok = size && *size > 0 && *size <= 4000LL * 1024 * 1024;
        if (ok) storage.block_size = static_cast<size_t>(*size);
    } else if (name == "BLOBXL_CONNECT_TIMEOUT") {
        auto seconds = parseInteger(value);
        ok = seconds && *seconds >= 0;
        if (ok) storage.http.connect_timeout_seconds = static_cast<long>(*seconds);
    } else if (name == "BLOBXL_TIMEOUT") {
        auto seconds = parseInteger(value);
        ok = seconds && *seconds >= 0;
        if (ok) storage.http.timeout_seconds = static_cast<long>(*seconds);
    } else if (name == "BLOBXL_VERIFY_TLS") {
        auto flag = parseFlag(value);
        ok = flag.has_value();
        if (ok) storage.http.verify_tls = *flag;
    } else {
        return false;
    }

    if (!ok) {
        SERVICE_WARN("Ignoring invalid value '{}' for {}", value, name);
    }
    return ok;
}

ServiceOptions ServiceOptions::fromEnvironment() {
    return fromLookup([](const char* name) { return std::getenv(name); });
}

}} // namespace blobxl::service
