#include <gtest/gtest.h>
#include "chunkstream/storage/manifest.hpp"
#include "chunkstream/crypto/hash.hpp"
#include <vector>

using namespace chunkstream;
using namespace chunkstream::storage;
using namespace chunkstream::crypto;

class ManifestTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto::initialize());
        chunk_bytes_ = {
            std::vector<uint8_t>(100, 0x11),
            std::vector<uint8_t>(100, 0x22),
            std::vector<uint8_t>(50, 0x33)
        };
    }

    std::vector<ChunkDescriptor> descriptors() const {
        std::vector<ChunkDescriptor> chunks;
        for (size_t i = 0; i < chunk_bytes_.size(); ++i) {
            chunks.push_back(ChunkDescriptor{Sha256Hasher::hash(chunk_bytes_[i]),
                                             static_cast<uint32_t>(i),
                                             static_cast<uint32_t>(chunk_bytes_[i].size())});
        }
        return chunks;
    }

    std::vector<std::vector<uint8_t>> chunk_bytes_;
};

TEST_F(ManifestTest, Build_ComputesTotalsAndRoot) {
    Manifest manifest;
    auto result = Manifest::build("file-1", descriptors(), {}, manifest);
    ASSERT_TRUE(result.success()) << result.message;

    EXPECT_EQ(manifest.file_id(), "file-1");
    EXPECT_EQ(manifest.total_size(), 250u);
    EXPECT_EQ(manifest.chunk_count(), 3u);

    std::vector<uint8_t> concatenated;
    for (const auto& chunk : manifest.chunks()) {
        concatenated.insert(concatenated.end(), chunk.chunk_id.begin(), chunk.chunk_id.end());
    }
    EXPECT_EQ(manifest.file_hash(), Sha256Hasher::hash(concatenated));
}

TEST_F(ManifestTest, Build_RejectsEmpty) {
    Manifest manifest;
    auto result = Manifest::build("file-1", {}, {}, manifest);
    EXPECT_EQ(result.error, ErrorCode::EMPTY_MANIFEST);
}

TEST_F(ManifestTest, Build_RejectsOversizeChunk) {
    auto chunks = descriptors();
    chunks[1].size = CHUNK_MAX + 1;

    Manifest manifest;
    auto result = Manifest::build("file-1", chunks, {}, manifest);
    EXPECT_EQ(result.error, ErrorCode::CHUNK_OVERSIZE);
}

TEST_F(ManifestTest, Build_AcceptsChunkOfExactlyMaxSize) {
    std::vector<uint8_t> bytes(CHUNK_MAX, 0x5A);
    std::vector<ChunkDescriptor> chunks{{Sha256Hasher::hash(bytes), 0, CHUNK_MAX}};

    Manifest manifest;
    EXPECT_TRUE(Manifest::build("max", chunks, {}, manifest).success());
    EXPECT_EQ(manifest.total_size(), CHUNK_MAX);
}

TEST_F(ManifestTest, Build_RejectsZeroSizeAndGaps) {
    Manifest manifest;

    auto zero = descriptors();
    zero[2].size = 0;
    EXPECT_EQ(Manifest::build("file-1", zero, {}, manifest).error, ErrorCode::MANIFEST_INVALID);

    auto gap = descriptors();
    gap[2].index = 3;
    EXPECT_EQ(Manifest::build("file-1", gap, {}, manifest).error, ErrorCode::MANIFEST_INVALID);
}

TEST_F(ManifestTest, Build_RejectsBadFileId) {
    Manifest manifest;
    EXPECT_EQ(Manifest::build("", descriptors(), {}, manifest).error, ErrorCode::MANIFEST_INVALID);
    EXPECT_EQ(Manifest::build(std::string(MAX_FILE_ID_LENGTH + 1, 'x'), descriptors(), {}, manifest).error,
              ErrorCode::MANIFEST_INVALID);
    EXPECT_TRUE(Manifest::build(std::string(MAX_FILE_ID_LENGTH, 'x'), descriptors(), {}, manifest).success());
}

TEST_F(ManifestTest, Build_AllowsDuplicateContent) {
    chunk_bytes_[2] = chunk_bytes_[0];

    Manifest manifest;
    ASSERT_TRUE(Manifest::build("dup", descriptors(), {}, manifest).success());
    EXPECT_EQ(manifest.chunk(0).chunk_id, manifest.chunk(2).chunk_id);
}

TEST_F(ManifestTest, FromWire_ChecksAdvertisedValues) {
    Manifest reference;
    ASSERT_TRUE(Manifest::build("file-1", descriptors(), {}, reference).success());

    Manifest manifest;
    EXPECT_TRUE(Manifest::from_wire("file-1", descriptors(), {}, 250, reference.file_hash(), manifest).success());
    EXPECT_EQ(manifest, reference);

    EXPECT_EQ(Manifest::from_wire("file-1", descriptors(), {}, 251, reference.file_hash(), manifest).error,
              ErrorCode::MANIFEST_INVALID);

    auto wrong_hash = reference.file_hash();
    wrong_hash[0] ^= 0xFF;
    EXPECT_EQ(Manifest::from_wire("file-1", descriptors(), {}, 250, wrong_hash, manifest).error,
              ErrorCode::MANIFEST_INVALID);
}

TEST_F(ManifestTest, VerifyChunk) {
    auto chunks = descriptors();

    EXPECT_TRUE(Manifest::verify_chunk(chunks[0], chunk_bytes_[0]));

    auto corrupted = chunk_bytes_[0];
    corrupted[10] ^= 0x01;
    EXPECT_FALSE(Manifest::verify_chunk(chunks[0], corrupted));

    std::vector<uint8_t> short_bytes(chunk_bytes_[0].begin(), chunk_bytes_[0].end() - 1);
    EXPECT_FALSE(Manifest::verify_chunk(chunks[0], short_bytes));
}

TEST_F(ManifestTest, VerifyFile_DependsOnOrder) {
    Manifest manifest;
    ASSERT_TRUE(Manifest::build("file-1", descriptors(), {}, manifest).success());

    auto ids = manifest.chunk_ids();
    EXPECT_TRUE(manifest.verify_file(ids));

    std::swap(ids[0], ids[1]);
    EXPECT_FALSE(manifest.verify_file(ids));
}

TEST_F(ManifestTest, MetadataIsAdvisory) {
    ManifestMetadata metadata;
    metadata.filename = "report.pdf";
    metadata.mime = "application/pdf";

    Manifest with_metadata;
    Manifest without_metadata;
    ASSERT_TRUE(Manifest::build("file-1", descriptors(), metadata, with_metadata).success());
    ASSERT_TRUE(Manifest::build("file-1", descriptors(), {}, without_metadata).success());

    EXPECT_EQ(with_metadata.file_hash(), without_metadata.file_hash());
    EXPECT_EQ(with_metadata.metadata().filename, "report.pdf");

    metadata.filename = std::string(MAX_FILENAME_LENGTH + 1, 'a');
    EXPECT_EQ(Manifest::build("file-1", descriptors(), metadata, with_metadata).error, ErrorCode::MANIFEST_INVALID);
}
