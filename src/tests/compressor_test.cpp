#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include "compression/compressor.hpp"
#include "test_utils.hpp"

using namespace flux::compression;

class CompressorTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_test_logging(boost::log::trivial::warning);
    }

    std::string round_trip(const std::string& content) {
        const auto source = dir / "source.bin";
        const auto artifact = dir / "source.bin.z";
        const auto restored = dir / "restored.bin";
        write_file(source, content);

        const auto compressed_size = compressor.compress(source, artifact);
        EXPECT_EQ(compressed_size, std::filesystem::file_size(artifact));

        const auto restored_size = compressor.decompress(artifact, restored);
        EXPECT_EQ(restored_size, content.size());
        return read_file(restored);
    }

    TempDir dir{"flux-compressor"};
    Compressor compressor;
};

TEST_F(CompressorTest, EmptyFileRoundTrip) {
    EXPECT_EQ(round_trip(""), "");
}

TEST_F(CompressorTest, SmallFileRoundTrip) {
    const std::string content = "Hello, World! This is a test of file compression.";
    EXPECT_EQ(round_trip(content), content);
}

TEST_F(CompressorTest, MultiMegabyteRoundTrip) {
    const std::string content = random_content(3 * 1024 * 1024 + 123);
    EXPECT_EQ(round_trip(content), content);
}

TEST_F(CompressorTest, RepetitiveContentShrinks) {
    const std::string content(1024 * 1024, 'a');
    const auto source = dir / "repetitive.txt";
    write_file(source, content);

    const auto artifact = compressor.compress(source);
    EXPECT_EQ(artifact, dir / "repetitive.txt.z");
    EXPECT_LT(std::filesystem::file_size(artifact), content.size() / 100);
}

TEST_F(CompressorTest, StreamRoundTrip) {
    const std::string content = random_content(100000, 7);
    std::stringstream input(content), compressed, restored;

    compressor.compress(input, compressed);
    const auto written = compressor.decompress(compressed, restored);

    EXPECT_EQ(written, content.size());
    EXPECT_EQ(restored.str(), content);
}

TEST_F(CompressorTest, CorruptedArtifactLeavesNoDestination) {
    const auto source = dir / "source.txt";
    const auto artifact = dir / "source.txt.z";
    const auto restored = dir / "restored.txt";
    write_file(source, std::string(50000, 'x') + random_content(50000));
    compressor.compress(source, artifact);

    std::string bytes = read_file(artifact);
    bytes[bytes.size() / 2] ^= 0x55;
    bytes[bytes.size() - 2] ^= 0x55;   // inside the Adler-32 trailer
    write_file(artifact, bytes);

    EXPECT_THROW(compressor.decompress(artifact, restored), CompressionError);
    EXPECT_FALSE(std::filesystem::exists(restored));
}

TEST_F(CompressorTest, TruncatedArtifactFails) {
    const auto source = dir / "source.txt";
    const auto artifact = dir / "source.txt.z";
    const auto restored = dir / "restored.txt";
    write_file(source, random_content(20000));
    compressor.compress(source, artifact);

    std::string bytes = read_file(artifact);
    write_file(artifact, bytes.substr(0, bytes.size() / 2));

    EXPECT_THROW(compressor.decompress(artifact, restored), CompressionError);
    EXPECT_FALSE(std::filesystem::exists(restored));
}

TEST_F(CompressorTest, TrailingGarbageFails) {
    std::stringstream input("payload"), compressed;
    compressor.compress(input, compressed);

    std::stringstream padded(compressed.str() + "garbage"), restored;
    EXPECT_THROW(compressor.decompress(padded, restored), CompressionError);
}

TEST_F(CompressorTest, OutputLimitStopsInflatingEarly) {
    // 64 MiB of zeros compresses to a few dozen KiB
    const auto source = dir / "zeros.bin";
    const auto artifact = dir / "zeros.bin.z";
    const auto restored = dir / "zeros.out";
    write_file(source, std::string(64 * 1024 * 1024, '\0'));
    compressor.compress(source, artifact);

    try {
        compressor.decompress(artifact, restored, 1024);
        FAIL() << "Expected OutputLimitError";
    } catch (const OutputLimitError& e) {
        EXPECT_EQ(e.limit(), 1024u);
    }
    EXPECT_FALSE(std::filesystem::exists(restored));
}

TEST_F(CompressorTest, OutputAtExactLimitSucceeds) {
    const std::string content = random_content(5000, 3);
    std::stringstream input(content), compressed, restored, capped;
    compressor.compress(input, compressed);
    const std::string artifact = compressed.str();

    std::stringstream exact(artifact);
    EXPECT_EQ(compressor.decompress(exact, restored, content.size()), content.size());
    EXPECT_EQ(restored.str(), content);

    std::stringstream short_by_one(artifact);
    EXPECT_THROW(compressor.decompress(short_by_one, capped, content.size() - 1), OutputLimitError);
    EXPECT_LT(capped.str().size(), content.size());
}

TEST_F(CompressorTest, MissingSourceFails) {
    EXPECT_THROW(compressor.compress(dir / "missing.txt", dir / "missing.txt.z"), CompressionError);
}

TEST_F(CompressorTest, InvalidLevelRejected) {
    EXPECT_THROW(Compressor(10), std::invalid_argument);
    EXPECT_THROW(Compressor(-2), std::invalid_argument);
    EXPECT_EQ(Compressor(9).get_level(), 9);
}
