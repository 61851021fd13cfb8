/**
 * @file test_images.cpp
 * @brief Unit tests for image resolution, listing and upload
 */

#include "test_helpers.hpp"
#include "emucore/errors.hpp"
#include "emucore/images.hpp"
#include "emucore/utilities.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <map>
#include <sstream>

using namespace emucore;
using namespace emucore::test;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {
    const std::string HELLO_MD5 = "5eb63bbbe01eeed093cb22bb8f5acdc3";

    std::map<std::string, images::ImageInfo> by_filename(const std::vector<images::ImageInfo>& list) {
        std::map<std::string, images::ImageInfo> result;
        for (const auto& image : list) {
            result[image.filename] = image;
        }
        return result;
    }
}

class ImagesTest : public DeviceFixture {
protected:
    void SetUp() override {
        DeviceFixture::SetUp();
        root_ = test_dir_ / "images";
        qemu_dir_ = root_ / "QEMU";
        qemu_ = make_manager(cfg_);
    }

    void TearDown() override {
        qemu_.reset();
        DeviceFixture::TearDown();
    }

    std::unique_ptr<BackendManager<TestDevice>> make_manager(const config::ServerConfig& cfg) {
        return std::make_unique<BackendManager<TestDevice>>(BackendType::Qemu, cfg, *allocator_, *projects_);
    }

    fs::path put(const fs::path& path, const std::string& content = "hello world") {
        utilities::write_file(path.string(), content);
        return path;
    }

    fs::path root_;
    fs::path qemu_dir_;
    std::unique_ptr<BackendManager<TestDevice>> qemu_;
};

// ============================================================================
// Directory Layout
// ============================================================================

TEST_F(ImagesTest, DirectoryLayout) {
    EXPECT_EQ(qemu_->images_directory(), qemu_dir_);

    auto directories = qemu_->images_directories();
    ASSERT_EQ(directories.size(), 2u);
    EXPECT_EQ(directories[0], qemu_dir_);
    EXPECT_EQ(directories[1], root_);
    EXPECT_TRUE(fs::is_directory(qemu_dir_));
}

TEST_F(ImagesTest, AdditionalDirectoriesSearched) {
    fs::path extra = test_dir_ / "extra";
    put(extra / "extra.img");
    fs::create_directories(qemu_dir_);

    config::ServerConfig cfg = cfg_;
    cfg.additional_images_paths = {extra, test_dir_ / "does-not-exist"};
    auto manager = make_manager(cfg);

    auto directories = manager->images_directories();
    ASSERT_EQ(directories.size(), 3u);
    EXPECT_EQ(directories[1], extra);

    EXPECT_EQ(manager->resolve_image_path("extra.img"), extra / "extra.img");

    auto listed = by_filename(manager->list_images());
    ASSERT_EQ(listed.count("extra.img"), 1u);
    EXPECT_EQ(listed["extra.img"].path, (extra / "extra.img").generic_string());
}

// ============================================================================
// Listing
// ============================================================================

TEST_F(ImagesTest, ListImagesFiltersAndRelativizes) {
    put(qemu_dir_ / "linux.qcow2");
    put(qemu_dir_ / "sub" / "router.img", "router");
    put(qemu_dir_ / ".hidden");
    put(qemu_dir_ / "partial.img.tmp");
    put(root_ / "legacy.img");
    put(root_ / "nested" / "deep.img");

    auto listed = by_filename(qemu_->list_images());

    ASSERT_EQ(listed.size(), 3u);
    EXPECT_EQ(listed["linux.qcow2"].path, "linux.qcow2");
    EXPECT_EQ(listed["linux.qcow2"].md5sum, HELLO_MD5);
    EXPECT_EQ(listed["linux.qcow2"].filesize, 11u);
    EXPECT_EQ(listed["router.img"].path, "sub/router.img");
    EXPECT_EQ(listed["legacy.img"].path, (root_ / "legacy.img").generic_string());
    EXPECT_EQ(listed.count("deep.img"), 0u);

    // Checksum sidecars are written but never listed
    EXPECT_TRUE(fs::exists(qemu_dir_ / "linux.qcow2.md5sum"));
    EXPECT_EQ(qemu_->list_images().size(), 3u);
}

TEST_F(ImagesTest, ListImagesSkipsDuplicateNames) {
    put(qemu_dir_ / "linux.qcow2");
    put(root_ / "linux.qcow2", "other");

    auto listed = qemu_->list_images();
    ASSERT_EQ(listed.size(), 1u);
    EXPECT_EQ(listed[0].path, "linux.qcow2");
}

TEST_F(ImagesTest, ImageListSerializes) {
    put(qemu_dir_ / "linux.qcow2");

    json j = json::parse(images::to_json(qemu_->list_images()));
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 1u);
    EXPECT_EQ(j[0]["filename"], "linux.qcow2");
    EXPECT_EQ(j[0]["md5sum"], HELLO_MD5);
    EXPECT_EQ(j[0]["filesize"], 11);
}

// ============================================================================
// Checksums
// ============================================================================

TEST_F(ImagesTest, ChecksumSidecarIsReused) {
    fs::path image = put(qemu_dir_ / "linux.qcow2");
    const std::string cached = "0123456789abcdef0123456789abcdef";
    put(image.string() + ".md5sum", cached + "\n");

    EXPECT_EQ(images::md5sum(image), std::optional<std::string>(cached));
}

TEST_F(ImagesTest, MalformedSidecarIsRecomputed) {
    fs::path image = put(qemu_dir_ / "linux.qcow2");
    put(image.string() + ".md5sum", "garbage");

    EXPECT_EQ(images::md5sum(image), std::optional<std::string>(HELLO_MD5));
    EXPECT_EQ(*utilities::read_file(image.string() + ".md5sum"), HELLO_MD5);
}

TEST_F(ImagesTest, ChecksumOfMissingFile) {
    EXPECT_FALSE(images::md5sum(qemu_dir_ / "missing.img").has_value());
    EXPECT_FALSE(images::md5sum(fs::path()).has_value());
}

// ============================================================================
// Path Resolution
// ============================================================================

TEST_F(ImagesTest, ResolveRelativeImages) {
    put(qemu_dir_ / "linux.qcow2");
    put(qemu_dir_ / "sub" / "router.img");

    EXPECT_EQ(qemu_->resolve_image_path("linux.qcow2"), qemu_dir_ / "linux.qcow2");
    EXPECT_EQ(qemu_->resolve_image_path("router.img"), qemu_dir_ / "sub" / "router.img");
    EXPECT_EQ(qemu_->resolve_image_path("sub/router.img"), qemu_dir_ / "sub" / "router.img");
    EXPECT_TRUE(qemu_->resolve_image_path("").empty());
}

TEST_F(ImagesTest, ResolveMissingImage) {
    fs::create_directories(qemu_dir_);
    try {
        qemu_->resolve_image_path("missing.qcow2");
        FAIL() << "Expected ImageMissingError";
    } catch (const ImageMissingError& ex) {
        EXPECT_EQ(ex.image(), "missing.qcow2");
    }

    EXPECT_THROW(qemu_->resolve_image_path((qemu_dir_ / "missing.qcow2").string()), ImageMissingError);
}

TEST_F(ImagesTest, DriveLetterPathRejected) {
    EXPECT_THROW(qemu_->resolve_image_path("C:\\images\\linux.qcow2"), ImagePathError);
    EXPECT_THROW(qemu_->resolve_image_path("d:/linux.qcow2"), ImagePathError);
}

TEST_F(ImagesTest, AbsolutePathOnRemoteServer) {
    fs::path inside = put(qemu_dir_ / "linux.qcow2");
    fs::path outside = put(test_dir_ / "elsewhere" / "linux.qcow2");

    EXPECT_EQ(qemu_->resolve_image_path(inside.string()), inside);
    EXPECT_THROW(qemu_->resolve_image_path(outside.string()), ImagePathError);
}

TEST_F(ImagesTest, AbsolutePathOnLocalServer) {
    fs::path outside = put(test_dir_ / "elsewhere" / "linux.qcow2");

    config::ServerConfig cfg = cfg_;
    cfg.local = true;
    auto local = make_manager(cfg);

    EXPECT_EQ(local->resolve_image_path(outside.string()), outside);
}

TEST_F(ImagesTest, RelativeImagePathRoundTrip) {
    put(qemu_dir_ / "linux.qcow2");
    put(qemu_dir_ / "sub" / "router.img");
    put(root_ / "legacy.img");
    put(root_ / "nested" / "deep.img");

    EXPECT_EQ(qemu_->resolve_relative_image_path("linux.qcow2"), "linux.qcow2");
    EXPECT_EQ(qemu_->resolve_relative_image_path((qemu_dir_ / "sub" / "router.img").string()), "sub/router.img");
    EXPECT_EQ(qemu_->resolve_relative_image_path("legacy.img"), "legacy.img");
    EXPECT_EQ(qemu_->resolve_relative_image_path("nested/deep.img"), (root_ / "nested" / "deep.img").string());
    EXPECT_EQ(qemu_->resolve_relative_image_path(""), "");

    for (const std::string image : {"linux.qcow2", "sub/router.img", "legacy.img"}) {
        std::string relative = qemu_->resolve_relative_image_path(image);
        EXPECT_EQ(qemu_->resolve_image_path(relative), qemu_->resolve_image_path(image));
    }
}

// ============================================================================
// Upload
// ============================================================================

TEST_F(ImagesTest, WriteImageStoresFileAndChecksum) {
    std::istringstream data("hello world");
    qemu_->write_image("uploaded.qcow2", data);

    fs::path image = qemu_dir_ / "uploaded.qcow2";
    ASSERT_TRUE(fs::exists(image));
    EXPECT_EQ(*utilities::read_file(image.string()), "hello world");
    EXPECT_EQ(*utilities::read_file(image.string() + ".md5sum"), HELLO_MD5);
    EXPECT_FALSE(fs::exists(image.string() + ".tmp"));
    EXPECT_NE(fs::status(image).permissions() & fs::perms::owner_exec, fs::perms::none);
}

TEST_F(ImagesTest, WriteImageIntoSubdirectory) {
    std::string payload(3 * config::IMAGE_CHUNK_SIZE + 17, 'x');
    std::istringstream data(payload);
    qemu_->write_image("sub/large.img", data);

    fs::path image = qemu_dir_ / "sub" / "large.img";
    ASSERT_TRUE(fs::exists(image));
    EXPECT_EQ(fs::file_size(image), payload.size());
}

TEST_F(ImagesTest, WriteImageRefreshesChecksum) {
    fs::path image = put(qemu_dir_ / "linux.qcow2", "old content");
    images::md5sum(image);

    std::istringstream data("hello world");
    qemu_->write_image("linux.qcow2", data);

    EXPECT_EQ(images::md5sum(image), std::optional<std::string>(HELLO_MD5));
}

TEST_F(ImagesTest, WriteImageOutsideDirectoryForbidden) {
    std::istringstream data("payload");
    EXPECT_THROW(qemu_->write_image("../escape.img", data), ForbiddenError);
    EXPECT_THROW(qemu_->write_image("", data), ForbiddenError);
    EXPECT_FALSE(fs::exists(root_ / "escape.img"));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
