#include "blobxl/core/Exception.hpp"
#include "blobxl/storage/LocalDirectoryStore.hpp"
#include "blobxl/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

namespace blobxl {
namespace storage {

class LocalDirectoryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/local_store_test.log", Logger::Level::DEBUG, false);
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root = fs::temp_directory_path() / (std::string("blobxl_") + info->name());
        fs::remove_all(root);
        fs::create_directories(root / "container" / "csvfiles" / "sub");
        writeFile("container/csvfiles/b.csv", "b\n2\n");
        writeFile("container/csvfiles/a.csv", "a\n1\n");
        writeFile("container/csvfiles/sub/c.csv", "c\n3\n");
        writeFile("container/other.txt", "x");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
        Logger::getInstance().shutdown();
    }

    void writeFile(const std::string& relative, const std::string& content) {
        std::ofstream out(root / relative, std::ios::binary);
        out << content;
    }

    fs::path root;
};

// 测试按前缀递归列举，结果排序
TEST_F(LocalDirectoryStoreTest, ListsFilesWithPrefix) {
    LocalDirectoryStore store(root / "container");
    EXPECT_EQ(store.containerName(), "container");

    const auto blobs = store.listBlobs("csvfiles/");
    ASSERT_EQ(blobs.size(), 3u);
    EXPECT_EQ(blobs[0].name, "csvfiles/a.csv");
    EXPECT_EQ(blobs[1].name, "csvfiles/b.csv");
    EXPECT_EQ(blobs[2].name, "csvfiles/sub/c.csv");
    EXPECT_EQ(blobs[0].content_length, 4u);

    EXPECT_EQ(store.listBlobs("").size(), 4u);
    EXPECT_TRUE(store.listBlobs("nothing/").empty());
}

TEST_F(LocalDirectoryStoreTest, DownloadAndUpload) {
    LocalDirectoryStore store(root / "container/");
    EXPECT_EQ(store.download("csvfiles/a.csv"), "a\n1\n");

    const std::string url = store.upload("out/report.xlsx", {'P', 'K'});
    EXPECT_EQ(url.rfind("file://", 0), 0u);
    EXPECT_NE(url.find("/container/out/report.xlsx"), std::string::npos);
    EXPECT_TRUE(fs::exists(root / "container" / "out" / "report.xlsx"));
    EXPECT_EQ(store.download("out/report.xlsx"), "PK");

    // 覆盖已有对象
    store.upload("out/report.xlsx", {'Z'});
    EXPECT_EQ(store.download("out/report.xlsx"), "Z");
}

TEST_F(LocalDirectoryStoreTest, MissingObject) {
    LocalDirectoryStore store(root / "container");
    try {
        store.download("csvfiles/missing.csv");
        FAIL() << "expected StorageException";
    } catch (const core::StorageException& e) {
        EXPECT_EQ(e.getHttpStatus(), 404);
        EXPECT_EQ(e.getErrorCode(), core::ErrorCode::FileReadError);
    }
}

// 拒绝逃出根目录的名字
TEST_F(LocalDirectoryStoreTest, RejectsEscapingNames) {
    LocalDirectoryStore store(root / "container");
    EXPECT_THROW(store.download("../outside.csv"), core::StorageException);
    EXPECT_THROW(store.download("csvfiles/../../outside.csv"), core::StorageException);
    EXPECT_THROW(store.upload("", {'x'}), core::StorageException);
    EXPECT_THROW(store.upload((root / "abs.xlsx").string(), {'x'}), core::StorageException);
}

TEST_F(LocalDirectoryStoreTest, MissingRootThrows) {
    try {
        LocalDirectoryStore store(root / "nope");
        FAIL() << "expected StorageException";
    } catch (const core::StorageException& e) {
        EXPECT_EQ(e.getHttpStatus(), 404);
    }
}

TEST_F(LocalDirectoryStoreTest, ContextOpensSubdirectories) {
    LocalStorageContext context(root);
    auto store = context.openContainer("container");
    EXPECT_EQ(store->containerName(), "container");
    EXPECT_EQ(store->listBlobs("csvfiles/").size(), 3u);

    EXPECT_THROW(context.openContainer("missing"), core::StorageException);
    EXPECT_THROW(context.openContainer("a/b"), core::StorageException);
    EXPECT_THROW(context.openContainer(""), core::StorageException);
}

}} // namespace blobxl::storage
