#include "blobxl/Blobxl.hpp"
#include "blobxl/reader/XLSXReader.hpp"
#include "blobxl/service/ConversionService.hpp"
#include "blobxl/storage/LocalDirectoryStore.hpp"
#include "blobxl/utils/Logger.hpp"
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace {

void printUsage() {
    std::cout <<
        "Usage:\n"
        "  blobxl convert [request.json|-]           Run a ConvertCsvToExcel request (stdin by default)\n"
        "  blobxl convert-dir <directory> <name>     Convert <directory>/csvfiles/*.csv into <directory>/<name>.xlsx\n"
        "  blobxl inspect <file.xlsx>                Print the sheets of a workbook\n"
        "  blobxl --version\n"
        "  blobxl --help\n"
        "\n"
        "Environment: BLOBXL_LOG_FILE, BLOBXL_LOG_LEVEL, BLOBXL_LOG_CONSOLE, BLOBXL_SOURCE_PREFIX,\n"
        "  BLOBXL_SOURCE_EXTENSION, BLOBXL_COMPRESSION_LEVEL, BLOBXL_API_VERSION, BLOBXL_SINGLE_PUT_LIMIT,\n"
        "  BLOBXL_BLOCK_SIZE, BLOBXL_CONNECT_TIMEOUT, BLOBXL_TIMEOUT, BLOBXL_VERIFY_TLS\n";
}

bool readAll(std::istream& in, std::string& out) {
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

int runConvert(const blobxl::service::ServiceOptions& options, const std::string& source) {
    std::string body;
    if (source.empty() || source == "-") {
        if (!readAll(std::cin, body)) {
            std::cerr << "Failed to read request from stdin" << std::endl;
            return 1;
        }
    } else {
        std::ifstream in(source, std::ios::binary);
        if (!in || !readAll(in, body)) {
            std::cerr << "Cannot read request file " << source << std::endl;
            return 1;
        }
    }

    blobxl::service::RequestHandler handler(options);
    const blobxl::service::ServiceResponse response = handler.handle(body);
    std::cerr << "HTTP " << response.status << " (" << response.content_type << ")" << std::endl;
    std::cout << response.body << std::endl;
    return response.status == 200 ? 0 : 1;
}

int runConvertDir(const blobxl::service::ServiceOptions& options, const std::string& directory,
                  const std::string& name) {
    try {
        blobxl::storage::LocalDirectoryStore store(directory);
        blobxl::service::ConversionService service(options);
        auto result = service.convert(store, name);
        if (!result) {
            std::cerr << "Conversion failed: " << result.error().message << std::endl;
            return 1;
        }
        std::cout << fmt::format("Wrote {} ({} CSV files, {} bytes)",
                                 result->excel_url, result->file_count, result->byte_count)
                  << std::endl;
        return 0;
    } catch (const blobxl::core::BlobxlException& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
}

int runInspect(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        std::cerr << "Cannot open " << path << std::endl;
        return 1;
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    blobxl::reader::XLSXReader reader(std::move(data));
    std::unique_ptr<blobxl::core::Workbook> workbook;
    const blobxl::core::ErrorCode rc = reader.loadWorkbook(workbook);
    if (rc != blobxl::core::ErrorCode::Ok) {
        std::cerr << "Cannot read " << path << ": [" << blobxl::core::toString(rc) << "] "
                  << reader.getLastError() << std::endl;
        return 1;
    }

    for (const auto& sheet : workbook->worksheets()) {
        std::cout << "== " << sheet->getName() << " (" << sheet->usedRange() << ")\n";
        for (const auto& [row, cells] : sheet->cells()) {
            std::ostringstream line;
            line << row + 1 << ':';
            for (const auto& [col, cell] : cells) {
                line << '\t' << cell.value.toString();
            }
            std::cout << line.str() << '\n';
        }
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "--help" || args[0] == "-h") {
        printUsage();
        return args.empty() ? 1 : 0;
    }
    if (args[0] == "--version") {
        std::cout << "blobxl " << blobxl::getVersion() << std::endl;
        return 0;
    }

    const blobxl::service::ServiceOptions options = blobxl::service::ServiceOptions::fromEnvironment();

    const std::string& command = args[0];
    if ((command == "convert" && args.size() > 2) ||
        (command == "convert-dir" && args.size() != 3) ||
        (command == "inspect" && args.size() != 2) ||
        (command != "convert" && command != "convert-dir" && command != "inspect")) {
        printUsage();
        return 2;
    }

    if (!blobxl::initialize(options)) {
        return 1;
    }

    int rc = 1;
    if (command == "convert") {
        rc = runConvert(options, args.size() > 1 ? args[1] : std::string());
    } else if (command == "convert-dir") {
        rc = runConvertDir(options, args[1], args[2]);
    } else {
        rc = runInspect(args[1]);
    }

    blobxl::cleanup();
    return rc;
}
