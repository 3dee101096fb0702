#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include "../../src/core/logger/logger.hpp"
#include "../../src/core/types/errors.hpp"
#include "../../src/storage/disk_storage.hpp"

using namespace Binder::Storage;
using Binder::Core::PersistenceError;
namespace fs = std::filesystem;

class StorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (fs::exists("test_storage_out"))
            fs::remove_all("test_storage_out");
    }

    void TearDown() override {
        if (fs::exists("test_storage_out"))
            fs::remove_all("test_storage_out");
    }
};

TEST_F(StorageTest, DiskStorageCreation) {
    DiskStorage storage("test_storage_out");
    storage.save("book.html", "<html></html>");

    EXPECT_TRUE(fs::exists("test_storage_out/book.html"));

    std::ifstream file("test_storage_out/book.html");
    std::string   content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "<html></html>");
}

TEST_F(StorageTest, NestedDirectoryCreation) {
    DiskStorage storage("test_storage_out");
    storage.save("deep/path/to/book.html", "<p>x</p>");

    EXPECT_TRUE(fs::exists("test_storage_out/deep/path/to/book.html"));
    EXPECT_EQ(storage.path_for("deep/path/to/book.html"),
              fs::path("test_storage_out") / "deep/path/to/book.html");
}

TEST_F(StorageTest, OverwritesExistingFile) {
    DiskStorage storage("test_storage_out");
    storage.save("book.html", "first version, longer");
    storage.save("book.html", "second");

    std::ifstream file("test_storage_out/book.html");
    std::string   content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "second");
}

TEST_F(StorageTest, UnwritableLocationIsPersistenceError) {
    fs::create_directories("test_storage_out");
    std::ofstream("test_storage_out/blocker") << "a regular file";

    DiskStorage storage("test_storage_out/blocker");
    EXPECT_THROW(storage.save("book.html", "<p>x</p>"), PersistenceError);
}

TEST_F(StorageTest, ReportsEachSaveOnce) {
    Binder::Core::Logger::set_level(Binder::Core::LOG_DEFAULT);
    DiskStorage storage("test_storage_out");

    testing::internal::CaptureStdout();
    storage.save("book.html", "<p>x</p>");
    std::string out = testing::internal::GetCapturedStdout();

    size_t first = out.find("[SUCCESS]");
    ASSERT_NE(first, std::string::npos);
    EXPECT_EQ(out.find("[SUCCESS]", first + 1), std::string::npos);
    EXPECT_NE(out.find("test_storage_out/book.html"), std::string::npos);
}
