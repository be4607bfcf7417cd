#include <catch2/catch_test_macros.hpp>

#include "audio/chunker.hpp"

#include <vector>

TEST_CASE("Chunker", "[audio]") {
    std::vector<AudioChunk> chunks;
    Chunker chunker(16000, 100);
    chunker.set_emit([&](AudioChunk c) { chunks.push_back(std::move(c)); });

    const CaptureFormat mono16k{16000, 1};

    SECTION("EmitsFullChunksOnly") {
        std::vector<float> block(1000, 0.1f);
        chunker.push(block, mono16k);
        REQUIRE(chunks.empty());
        REQUIRE(chunker.buffered() == 1000);

        chunker.push(block, mono16k);
        REQUIRE(chunks.size() == 1);
        REQUIRE(chunks[0].samples.size() == 1600);
        REQUIRE(chunks[0].sample_rate == 16000);
        REQUIRE(chunker.buffered() == 400);
    }

    SECTION("SequenceNumbersIncrease") {
        std::vector<float> block(1600 * 3, 0.0f);
        chunker.push(block, mono16k);
        REQUIRE(chunks.size() == 3);
        REQUIRE(chunks[0].sequence == 0);
        REQUIRE(chunks[1].sequence == 1);
        REQUIRE(chunks[2].sequence == 2);
        REQUIRE(chunker.emitted() == 3);
    }

    SECTION("StereoIsDownmixed") {
        std::vector<float> stereo(3200, 0.0f);
        for (size_t i = 0; i < stereo.size(); i += 2) stereo[i] = 1.0f;
        chunker.push(stereo, {16000, 2});
        REQUIRE(chunks.size() == 1);
        REQUIRE(chunks[0].samples.front() == 0.5f);
    }

    SECTION("HighRateIsResampled") {
        std::vector<float> block(4800, 0.2f);
        chunker.push(block, {48000, 1});
        REQUIRE(chunks.size() == 1);
        REQUIRE(chunks[0].samples.size() == 1600);
        REQUIRE(chunker.buffered() == 0);
    }

    SECTION("SmallBlocksLoseNoSamples") {
        std::vector<float> block(100, 0.2f);
        for (int i = 0; i < 100; ++i) chunker.push(block, {48000, 1});
        REQUIRE(chunks.size() == 2);
        REQUIRE(chunker.buffered() == 3333 - 2 * 1600);
    }

    SECTION("FlushDrainsResampler") {
        std::vector<float> block = {0.0f, 1.0f};
        chunker.push(block, {8000, 1});
        REQUIRE(chunker.buffered() == 2);

        chunker.flush();
        REQUIRE(chunks.size() == 1);
        REQUIRE(chunks[0].samples == std::vector<float>{0.0f, 0.5f, 1.0f});
    }

    SECTION("FlushEmitsRemainder") {
        std::vector<float> block(700, 0.0f);
        chunker.push(block, mono16k);
        chunker.flush();
        REQUIRE(chunks.size() == 1);
        REQUIRE(chunks[0].samples.size() == 700);
        REQUIRE(chunker.buffered() == 0);

        chunker.flush();
        REQUIRE(chunks.size() == 1);
    }

    SECTION("ResetDiscardsBuffer") {
        std::vector<float> block(1700, 0.0f);
        chunker.push(block, mono16k);
        chunker.reset();
        REQUIRE(chunker.buffered() == 0);
        REQUIRE(chunker.emitted() == 0);
    }

    SECTION("IgnoresUnknownFormat") {
        std::vector<float> block(1600, 0.0f);
        chunker.push(block, {0, 1});
        REQUIRE(chunks.empty());
        REQUIRE(chunker.buffered() == 0);
    }
}
