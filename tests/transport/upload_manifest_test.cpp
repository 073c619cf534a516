#include "ingest/transport/upload_manifest.hpp"

#include "temp_directory.hpp"

#include <gtest/gtest.h>

#include <numeric>

namespace fs = std::filesystem;
using ingest::ErrorCode;
using ingest::Ok;
using ingest::Result;
using ingest::testing::TempDirectory;
using ingest::testing::make_ready_directory;
using ingest::testing::pattern_bytes;
using ingest::testing::write_file;
using ingest::transport::FileChunk;
using ingest::transport::build_manifest;
using ingest::transport::for_each_chunk;
using ingest::transport::mime_type_for;
using ingest::transport::slugify;

TEST(UploadManifestTest, CollectsFilesRecursivelyWithoutMarkers) {
    TempDirectory root("manifest_test");
    const fs::path job = make_ready_directory(root.path(), "jobA", {{"b.mp4", 300}, {"a.jpg", 100}});
    fs::create_directories(job / "raw");
    write_file(job / "raw" / "c.dng", std::string(50, 'x'));
    write_file(job / "raw" / "_in_verarbeitung.txt", "");

    auto manifest = build_manifest(job);

    ASSERT_TRUE(manifest.is_ok()) << manifest.error().message;
    const auto& files = manifest.value().files;
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].name, "a.jpg");
    EXPECT_EQ(files[1].name, "b.mp4");
    EXPECT_EQ(files[2].name, "raw/c.dng");
    EXPECT_EQ(files[2].mime_type, "image/x-adobe-dng");
    EXPECT_EQ(manifest.value().total_bytes(), 450u);
    EXPECT_EQ(manifest.value().qualified_name(files[2]), "jobA/raw/c.dng");
}

TEST(UploadManifestTest, MarkerOnlyDirectoryHasNothingToUpload) {
    TempDirectory root("manifest_test");
    const fs::path job = make_ready_directory(root.path(), "empty", {});

    auto manifest = build_manifest(job);

    ASSERT_TRUE(manifest.is_error());
    EXPECT_EQ(manifest.error().code, ErrorCode::TransferFailed);
}

TEST(UploadManifestTest, MissingDirectoryIsIoError) {
    TempDirectory root("manifest_test");
    auto manifest = build_manifest(root.path() / "gone");

    ASSERT_TRUE(manifest.is_error());
    EXPECT_EQ(manifest.error().code, ErrorCode::IoError);
}

TEST(UploadManifestTest, MimeTypesIgnoreCase) {
    EXPECT_EQ(mime_type_for("IMG_0001.JPG"), "image/jpeg");
    EXPECT_EQ(mime_type_for("clip.MOV"), "video/quicktime");
    EXPECT_EQ(mime_type_for("notes"), "application/octet-stream");
    EXPECT_EQ(mime_type_for("archive.tar.xz"), "application/octet-stream");
}

TEST(UploadManifestTest, SlugifyProducesRemoteSafeNames) {
    EXPECT_EQ(slugify("jobA"), "joba");
    EXPECT_EQ(slugify("Tandem 2024-05-01 Müller"), "tandem-2024-05-01-m-ller");
    EXPECT_EQ(slugify("  --weird!!name--  "), "weird-name");
    EXPECT_EQ(slugify("file_v1.2"), "file_v1.2");
    EXPECT_EQ(slugify("###"), "upload");
    EXPECT_EQ(slugify(""), "upload");
}

TEST(UploadManifestTest, ChunksCoverTheFileExactly) {
    TempDirectory root("manifest_test");
    const auto bytes = pattern_bytes(5000, 7);
    write_file(root / "clip.mp4", bytes);

    std::vector<FileChunk> chunks;
    auto result = for_each_chunk(root / "clip.mp4", 1024, [&](FileChunk&& chunk) -> Result<void> {
        chunks.push_back(std::move(chunk));
        return Ok();
    });

    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(chunks.size(), 5u);
    std::vector<std::uint8_t> joined;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].index, i);
        EXPECT_EQ(chunks[i].total, 5u);
        EXPECT_EQ(chunks[i].offset, i * 1024);
        joined.insert(joined.end(), chunks[i].data.begin(), chunks[i].data.end());
    }
    EXPECT_EQ(chunks.back().data.size(), 5000u - 4 * 1024);
    EXPECT_EQ(joined, bytes);
}

TEST(UploadManifestTest, ZeroByteFileYieldsNoChunk) {
    TempDirectory root("manifest_test");
    write_file(root / "empty.jpg", std::string());

    int calls = 0;
    auto result = for_each_chunk(root / "empty.jpg", 1024, [&](FileChunk&&) -> Result<void> {
        ++calls;
        return Ok();
    });

    EXPECT_TRUE(result.is_ok());
    EXPECT_EQ(calls, 0);
}

TEST(UploadManifestTest, SinkErrorStopsChunking) {
    TempDirectory root("manifest_test");
    write_file(root / "clip.mp4", pattern_bytes(4096));

    int calls = 0;
    auto result = for_each_chunk(root / "clip.mp4", 1024, [&](FileChunk&& chunk) -> Result<void> {
        ++calls;
        if (chunk.index == 1) {
            return ingest::Err<void>(ErrorCode::TransferFailed, "HTTP 500: boom");
        }
        return Ok();
    });

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().message, "HTTP 500: boom");
    EXPECT_EQ(calls, 2);
}

TEST(UploadManifestTest, ZeroChunkSizeIsRejected) {
    TempDirectory root("manifest_test");
    write_file(root / "a.jpg", "abc");

    auto result = for_each_chunk(root / "a.jpg", 0, [](FileChunk&&) -> Result<void> { return Ok(); });

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}
