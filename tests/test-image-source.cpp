/*
 * Unit tests for directory and archive image loading
 */

#include <gtest/gtest.h>

#include <chrono>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

#include <archive.h>
#include <archive_entry.h>

#include "core/collage_driver.h"
#include "core/image_codec.h"
#include "core/image_source.h"

using namespace collager::core;

namespace {

std::vector<unsigned char> read_bytes(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary);
    out << text;
}

void add_tar_entry(struct archive* a, const std::string& name, const std::vector<unsigned char>& bytes) {
    struct archive_entry* entry = archive_entry_new();
    archive_entry_set_pathname(entry, name.c_str());
    archive_entry_set_size(entry, static_cast<la_int64_t>(bytes.size()));
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, 0644);
    ASSERT_EQ(archive_write_header(a, entry), ARCHIVE_OK);
    ASSERT_EQ(archive_write_data(a, bytes.data(), bytes.size()), static_cast<la_ssize_t>(bytes.size()));
    archive_entry_free(entry);
}

class ImageSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        root_ = fs::temp_directory_path() /
                ("collager-test-" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) +
                 "-" + std::to_string(stamp));
        fs::create_directories(root_ / "images" / "nested");

        Error error;
        ASSERT_TRUE(write_png_file(Canvas(30, 20, Color{255, 0, 0, 255}), root_ / "images" / "a.png", error))
            << error.message;
        ASSERT_TRUE(write_png_file(Canvas(16, 40, Color{0, 0, 255, 255}), root_ / "images" / "nested" / "b.png", error))
            << error.message;
        write_text(root_ / "images" / "notes.txt", "not an image");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    fs::path root_;
};

} // namespace

TEST_F(ImageSourceTest, DetectsInputType) {
    EXPECT_EQ(detect_input_type(root_ / "images"), InputType::Directory);
    EXPECT_EQ(detect_input_type(root_ / "images" / "a.png"), InputType::Unknown);
    EXPECT_EQ(detect_input_type(root_ / "missing"), InputType::Unknown);

    write_text(root_ / "bundle.TAR.GZ", "");
    EXPECT_EQ(detect_input_type(root_ / "bundle.TAR.GZ"), InputType::Archive);
}

TEST_F(ImageSourceTest, CollectsFilesRecursivelyInPathOrder) {
    std::vector<fs::path> files;
    Error error;
    ASSERT_TRUE(collect_directory_files(root_ / "images", files, error)) << error.message;
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].filename().string(), "a.png");
    EXPECT_EQ(files[1].filename().string(), "b.png");
    EXPECT_EQ(files[2].filename().string(), "notes.txt");
}

TEST_F(ImageSourceTest, LoadsDirectoryAndSkipsUndecodableFiles) {
    LoadResult result;
    Error error;
    ASSERT_TRUE(load_images(root_ / "images", 4, result, error)) << error.message;
    EXPECT_EQ(result.candidates, 3u);
    EXPECT_EQ(result.skipped, 1u);
    ASSERT_EQ(result.images.size(), 2u);
    EXPECT_EQ(result.images[0]->width(), 30u);
    EXPECT_EQ(result.images[0]->height(), 20u);
    EXPECT_EQ(result.images[0]->pixel(3, 3), (Color{255, 0, 0, 255}));
    EXPECT_EQ(result.images[1]->width(), 16u);
    EXPECT_EQ(result.images[1]->height(), 40u);
}

TEST_F(ImageSourceTest, MissingInputIsTraversalError) {
    LoadResult result;
    Error error;
    EXPECT_FALSE(load_images(root_ / "does-not-exist", 1, result, error));
    EXPECT_EQ(error.code, ErrorCode::TraversalError);
}

TEST_F(ImageSourceTest, EmptyDirectoryLoadsNothing) {
    fs::create_directories(root_ / "empty");
    LoadResult result;
    Error error;
    ASSERT_TRUE(load_images(root_ / "empty", 2, result, error)) << error.message;
    EXPECT_TRUE(result.images.empty());
    EXPECT_EQ(result.candidates, 0u);
}

TEST_F(ImageSourceTest, LoadsTarArchive) {
    const fs::path tar_path = root_ / "bundle.tar";
    struct archive* a = archive_write_new();
    ASSERT_NE(a, nullptr);
    ASSERT_EQ(archive_write_set_format_pax_restricted(a), ARCHIVE_OK);
    ASSERT_EQ(archive_write_open_filename(a, tar_path.string().c_str()), ARCHIVE_OK);
    add_tar_entry(a, "a.png", read_bytes(root_ / "images" / "a.png"));
    add_tar_entry(a, "dir/b.png", read_bytes(root_ / "images" / "nested" / "b.png"));
    add_tar_entry(a, "readme.txt", {'h', 'i'});
    archive_write_close(a);
    archive_write_free(a);

    std::vector<ArchiveEntry> entries;
    Error error;
    ASSERT_TRUE(read_archive_entries(tar_path, entries, error)) << error.message;
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[1].name, "dir/b.png");
    EXPECT_EQ(entries[2].bytes.size(), 2u);

    LoadResult result;
    ASSERT_TRUE(load_images(tar_path, 2, result, error)) << error.message;
    EXPECT_EQ(result.candidates, 3u);
    EXPECT_EQ(result.skipped, 1u);
    ASSERT_EQ(result.images.size(), 2u);
    EXPECT_EQ(result.images[1]->pixel(0, 0), (Color{0, 0, 255, 255}));
}

TEST_F(ImageSourceTest, OversizedArchiveEntriesCountAsSkipped) {
    const fs::path tar_path = root_ / "limits.tar";
    struct archive* a = archive_write_new();
    ASSERT_NE(a, nullptr);
    ASSERT_EQ(archive_write_set_format_pax_restricted(a), ARCHIVE_OK);
    ASSERT_EQ(archive_write_open_filename(a, tar_path.string().c_str()), ARCHIVE_OK);
    add_tar_entry(a, "a.png", read_bytes(root_ / "images" / "a.png"));
    add_tar_entry(a, "empty.png", {});
    add_tar_entry(a, "note.txt", {'o', 'k'});
    archive_write_close(a);
    archive_write_free(a);

    std::vector<ArchiveEntry> entries;
    Error error;
    ASSERT_TRUE(read_archive_entries(tar_path, entries, error, 8)) << error.message;
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].name, "a.png");
    EXPECT_TRUE(entries[0].bytes.empty());
    EXPECT_EQ(entries[2].bytes.size(), 2u);

    LoadResult result;
    ASSERT_TRUE(load_images(tar_path, 1, result, error)) << error.message;
    EXPECT_EQ(result.candidates, 3u);
    EXPECT_EQ(result.skipped, 2u);
    EXPECT_EQ(result.images.size(), 1u);
}

TEST_F(ImageSourceTest, LoadedImagesFeedACollage) {
    LoadResult result;
    Error error;
    ASSERT_TRUE(load_images(root_ / "images", 0, result, error)) << error.message;

    CompositeOptions options;
    options.target_width = 100;
    CompositeJob job;
    ASSERT_TRUE(make_collage(result.images, 1, 100, options, job, error)) << error.message;
    ASSERT_NE(job.canvas, nullptr);

    const fs::path out_path = root_ / "collage.png";
    ASSERT_TRUE(write_png_file(*job.canvas, out_path, error)) << error.message;
    ImagePtr decoded;
    ASSERT_TRUE(decode_image_file(out_path, decoded, error)) << error.message;
    EXPECT_EQ(static_cast<int>(decoded->width()), job.canvas->width());
    EXPECT_EQ(static_cast<int>(decoded->height()), job.canvas->height());
}
