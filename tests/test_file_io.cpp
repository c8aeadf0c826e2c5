#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <boost/asio.hpp>
#include "errors.hpp"
#include "file_io.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;

namespace {

class FileIoTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("peerdrop_file_io_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string write_file(const std::string& name, const std::vector<uint8_t>& bytes) {
        fs::path p = dir_ / name;
        std::ofstream out(p, std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        return p.string();
    }

    fs::path dir_;
};

} // namespace

TEST_F(FileIoTest, DiskSourceReportsMetadata) {
    boost::asio::io_context io;
    auto path = write_file("photo.PNG", testing_support::make_bytes(1234));
    auto source = std::make_shared<transfer::DiskFileSource>(io, path);

    EXPECT_EQ(source->metadata().name, "photo.PNG");
    EXPECT_EQ(source->metadata().size, 1234u);
    EXPECT_EQ(source->metadata().mime_type, "image/png");
}

TEST_F(FileIoTest, DiskSourceReadsRanges) {
    boost::asio::io_context io;
    auto bytes = testing_support::make_bytes(1000);
    auto source = std::make_shared<transfer::DiskFileSource>(io, write_file("data.bin", bytes));

    std::vector<uint8_t> middle;
    std::vector<uint8_t> tail;
    bool called_inline = false;
    source->async_read(100, 50, [&](const boost::system::error_code& ec, std::vector<uint8_t> got) {
        ASSERT_FALSE(ec);
        middle = std::move(got);
    });
    source->async_read(900, 500, [&](const boost::system::error_code& ec, std::vector<uint8_t> got) {
        ASSERT_FALSE(ec);
        tail = std::move(got);
    });
    called_inline = !middle.empty() || !tail.empty();
    io.run();

    EXPECT_FALSE(called_inline);
    EXPECT_EQ(middle, std::vector<uint8_t>(bytes.begin() + 100, bytes.begin() + 150));
    EXPECT_EQ(tail, std::vector<uint8_t>(bytes.begin() + 900, bytes.end()));
}

TEST_F(FileIoTest, DiskSourceReadPastEndFails) {
    boost::asio::io_context io;
    auto source = std::make_shared<transfer::DiskFileSource>(io, write_file("small.bin", {1, 2, 3}));

    boost::system::error_code result;
    source->async_read(10, 5, [&](const boost::system::error_code& ec, std::vector<uint8_t>) { result = ec; });
    io.run();

    EXPECT_TRUE(result);
}

TEST_F(FileIoTest, MissingFileThrows) {
    boost::asio::io_context io;
    EXPECT_THROW(std::make_shared<transfer::DiskFileSource>(io, (dir_ / "nope.bin").string()),
                 errors::TransferError);
}

TEST_F(FileIoTest, DirectorySinkWritesFinalFile) {
    transfer::DirectorySink sink((dir_ / "incoming").string());
    auto bytes = testing_support::make_bytes(4096);
    std::string path = sink.deliver({"notes.txt", bytes.size(), "text/plain"}, bytes);

    EXPECT_EQ(fs::path(path).filename().string(), "notes.txt");
    EXPECT_FALSE(fs::exists(path + ".part"));

    std::ifstream in(path, std::ios::binary);
    std::vector<uint8_t> read_back((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(read_back, bytes);
}

TEST_F(FileIoTest, DirectorySinkStaysInsideSaveDir) {
    transfer::DirectorySink sink(dir_.string());
    std::string path = sink.deliver({"../../etc/evil.txt", 1, ""}, {42});

    EXPECT_EQ(fs::path(path).parent_path().string(), dir_.string());
    EXPECT_EQ(fs::path(path).filename().string(), "evil.txt");
}

TEST(FileNames, SafeFilename) {
    EXPECT_EQ(transfer::safe_filename("a/b/c.txt"), "c.txt");
    EXPECT_EQ(transfer::safe_filename("C:\\docs\\x.pdf"), "x.pdf");
    EXPECT_EQ(transfer::safe_filename(""), "downloaded_file");
    EXPECT_EQ(transfer::safe_filename("dir/"), "downloaded_file");
    EXPECT_EQ(transfer::safe_filename(".."), "downloaded_file");
}

TEST(FileNames, GuessMimeType) {
    EXPECT_EQ(transfer::guess_mime_type("a.JPG"), "image/jpeg");
    EXPECT_EQ(transfer::guess_mime_type("archive.zip"), "application/zip");
    EXPECT_EQ(transfer::guess_mime_type("README"), "application/octet-stream");
}
