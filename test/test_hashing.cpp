// ============= test/test_hashing.cpp =============
/*
 * Tests de ContentHasher y distancia Hamming
 *
 * - SHA-256 contra vector conocido
 * - pHash estable ante recompresion JPEG y reescalado
 * - Hamming: simetrico, errores distinguibles
 */

#include "rollcall/hashing/content_hasher.hpp"
#include "rollcall/hashing/hash_distance.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <fstream>
#include <sstream>

using namespace rollcall;
using rollcall::test::TempDir;
using rollcall::test::smooth_random_image;

namespace {

cv::Mat jpeg_roundtrip(const cv::Mat& image, int quality) {
    std::vector<unsigned char> buf;
    cv::imencode(".jpg", image, buf, {cv::IMWRITE_JPEG_QUALITY, quality});
    return cv::imdecode(buf, cv::IMREAD_COLOR);
}

} // namespace

// ==================== SHA-256 ====================

TEST(ContentHasher, Sha256KnownVector) {
    std::string abc = "abc";
    EXPECT_EQ(ContentHasher::sha256_bytes(abc.data(), abc.size()),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(ContentHasher, StreamMatchesBytesAcrossChunks) {
    // Mas grande que un bloque de lectura
    std::string data(ContentHasher::CHUNK_SIZE * 3 + 17, 'x');
    std::istringstream in(data);

    auto streamed = ContentHasher::sha256_stream(in);
    ASSERT_TRUE(streamed.has_value());
    EXPECT_EQ(*streamed, ContentHasher::sha256_bytes(data.data(), data.size()));
    EXPECT_EQ(streamed->size(), 64u);
}

TEST(ContentHasher, UnreadableFileHasNoHashes) {
    ContentHasher hasher;
    auto fp = hasher.hash_file("/nonexistent/rollcall/file.jpg", MediaType::Image);
    EXPECT_FALSE(fp.readable());
    EXPECT_FALSE(fp.perceptual_hash.has_value());
}

TEST(ContentHasher, CorruptImageKeepsContentHash) {
    TempDir dir;
    auto path = dir.file("broken.jpg");
    {
        std::ofstream out(path, std::ios::binary);
        out << "esto no es un jpeg";
    }

    ContentHasher hasher;
    auto fp = hasher.hash_file(path, MediaType::Image);
    EXPECT_TRUE(fp.readable());
    EXPECT_FALSE(fp.perceptual_hash.has_value());
    EXPECT_EQ(fp.file_size, 18);
}

// ==================== PHASH ====================

TEST(PerceptualHash, HexLengthFollowsHashSize) {
    ContentHasher hasher(16);
    auto hash = hasher.perceptual_hash(smooth_random_image(12345));
    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ(hash->size(), 64u);   // 256 bits
}

TEST(PerceptualHash, StableUnderReencodeAndResize) {
    ContentHasher hasher;
    cv::Mat original = smooth_random_image(12345);

    cv::Mat resized;
    cv::resize(jpeg_roundtrip(original, 90), resized, cv::Size(300, 300), 0, 0, cv::INTER_AREA);

    auto a = hasher.perceptual_hash(original);
    auto b = hasher.perceptual_hash(resized);
    ASSERT_TRUE(a && b);

    auto d = hamming_distance(*a, *b);
    ASSERT_TRUE(d.ok());
    EXPECT_LE(d.bits, 10);
}

TEST(PerceptualHash, DifferentImagesAreFarApart) {
    ContentHasher hasher;
    auto a = hasher.perceptual_hash(smooth_random_image(12345));
    auto b = hasher.perceptual_hash(smooth_random_image(999));
    ASSERT_TRUE(a && b);

    auto d = hamming_distance(*a, *b);
    ASSERT_TRUE(d.ok());
    EXPECT_GT(d.bits, 10);
}

TEST(PerceptualHash, EmptyImageHasNoHash) {
    ContentHasher hasher;
    EXPECT_FALSE(hasher.perceptual_hash(cv::Mat()).has_value());
}

// ==================== HAMMING ====================

TEST(HammingDistance, CountsBitsAndIsSymmetric) {
    auto ab = hamming_distance("ff00", "0f01");
    auto ba = hamming_distance("0f01", "ff00");
    ASSERT_TRUE(ab.ok());
    EXPECT_EQ(ab.bits, 5);
    EXPECT_EQ(ab.bits, ba.bits);
}

TEST(HammingDistance, CaseInsensitive) {
    auto d = hamming_distance("ABCDEF", "abcdef");
    ASSERT_TRUE(d.ok());
    EXPECT_EQ(d.bits, 0);
}

TEST(HammingDistance, ErrorsAreNotDistances) {
    EXPECT_EQ(hamming_distance("", "ab").error, CompareError::Empty);
    EXPECT_EQ(hamming_distance("abc", "ab").error, CompareError::LengthMismatch);
    EXPECT_EQ(hamming_distance("zz", "ab").error, CompareError::InvalidHex);
    EXPECT_STREQ(to_string(CompareError::InvalidHex), "invalid_hex");
}

TEST(HammingDistance, SimilarityRequiresBothHashes) {
    EXPECT_TRUE(is_perceptually_similar(std::string("ff"), std::string("fe"), 1));
    EXPECT_FALSE(is_perceptually_similar(std::string("ff"), std::string("f0"), 3));
    EXPECT_FALSE(is_perceptually_similar(std::nullopt, std::string("ff"), 10));
    EXPECT_FALSE(is_perceptually_similar(std::string("ff"), std::string("fff"), 10));
}

// ==================== MEDIA TYPE ====================

TEST(MediaType, FromPathAndName) {
    EXPECT_EQ(media_type_from_path("a/b/IMG_001.JPG"), MediaType::Image);
    EXPECT_EQ(media_type_from_path("clip.mp4"), MediaType::Video);
    EXPECT_EQ(media_type_from_path("notes.txt"), MediaType::Other);
    EXPECT_EQ(media_type_from_string("video"), MediaType::Video);
    EXPECT_EQ(media_type_from_string("banana"), MediaType::Other);
}
