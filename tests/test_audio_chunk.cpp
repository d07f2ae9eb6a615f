#include <catch2/catch_test_macros.hpp>

#include "audio_chunk.hpp"
#include "fakes.hpp"

TEST_CASE("AudioSource", "[audio_chunk]") {

    SECTION("StringForms") {
        REQUIRE(to_string(AudioSource::Microphone) == "microphone");
        REQUIRE(to_string(AudioSource::Loopback) == "loopback");
    }

    SECTION("Parse") {
        REQUIRE(parse_source("microphone") == AudioSource::Microphone);
        REQUIRE(parse_source("mic") == AudioSource::Microphone);
        REQUIRE(parse_source("loopback") == AudioSource::Loopback);
        REQUIRE_FALSE(parse_source("speaker").has_value());
        REQUIRE_FALSE(parse_source("").has_value());
        REQUIRE_FALSE(parse_source("Microphone").has_value());
    }

    SECTION("OutOfRangeIsInvalid") {
        REQUIRE(is_valid_source(AudioSource::Microphone));
        REQUIRE(is_valid_source(AudioSource::Loopback));
        REQUIRE_FALSE(is_valid_source(static_cast<AudioSource>(7)));
    }

    SECTION("Index") {
        REQUIRE(source_index(AudioSource::Microphone) == 0);
        REQUIRE(source_index(AudioSource::Loopback) == 1);
    }
}

TEST_CASE("validate_chunk", "[audio_chunk]") {
    ChunkShape shape;

    SECTION("WellFormed") {
        REQUIRE_FALSE(validate_chunk(make_chunk(AudioSource::Microphone, 0), shape).has_value());
        REQUIRE_FALSE(validate_chunk(make_chunk(AudioSource::Loopback, 20), shape).has_value());
    }

    SECTION("InvalidSource") {
        auto c = make_chunk(static_cast<AudioSource>(9), 0);
        REQUIRE(validate_chunk(c, shape) == ValidationError::InvalidSource);
    }

    SECTION("WrongChannelCount") {
        auto c = make_chunk(AudioSource::Microphone, 0);
        c.channel_count = 2;
        REQUIRE(validate_chunk(c, shape) == ValidationError::WrongChannelCount);
    }

    SECTION("WrongSampleRate") {
        auto c = make_chunk(AudioSource::Microphone, 0);
        c.sample_rate = 48000;
        REQUIRE(validate_chunk(c, shape) == ValidationError::WrongSampleRate);
    }

    SECTION("WrongBlockSize") {
        auto c = make_chunk(AudioSource::Microphone, 0, 0, "call-test", 319);
        REQUIRE(validate_chunk(c, shape) == ValidationError::WrongBlockSize);
    }

    SECTION("ErrorNames") {
        REQUIRE(to_string(ValidationError::InvalidSource) == "invalid_source");
        REQUIRE(to_string(ValidationError::WrongChannelCount) == "wrong_channel_count");
        REQUIRE(to_string(ValidationError::WrongSampleRate) == "wrong_sample_rate");
        REQUIRE(to_string(ValidationError::WrongBlockSize) == "wrong_block_size");
    }
}
