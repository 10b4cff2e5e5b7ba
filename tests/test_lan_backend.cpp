#include <catch2/catch_test_macros.hpp>

#include "whisper/lan_backend.hpp"

#include <nlohmann/json.hpp>
#include <vector>

using json = nlohmann::json;

TEST_CASE("LanBackend::parse_response", "[backend]") {

    SECTION("PlainText") {
        auto t = LanBackend::parse_response(json{{"text", "  hello world \n"}}, false);
        REQUIRE(t.has_value());
        REQUIRE(t->text == "hello world");
        REQUIRE_FALSE(t->segments.has_value());
    }

    SECTION("VerboseJsonSegments") {
        json j = {
            {"text", " one two"},
            {"segments", json::array({
                {{"start", 0.0}, {"end", 1.2345}, {"text", " one"}},
                {{"start", 1.2345}, {"end", 2.5}, {"text", " two"}},
            })},
        };
        auto t = LanBackend::parse_response(j, true);
        REQUIRE(t.has_value());
        REQUIRE(t->segments.has_value());
        REQUIRE(t->segments->size() == 2);
        REQUIRE((*t->segments)[0].start_time_ms == 0);
        REQUIRE((*t->segments)[0].end_time_ms == 1234);
        REQUIRE((*t->segments)[0].text == "one");
        REQUIRE((*t->segments)[1].end_time_ms == 2500);
    }

    SECTION("SegmentsIgnoredWhenNotWanted") {
        json j = {{"text", "x"}, {"segments", json::array()}};
        auto t = LanBackend::parse_response(j, false);
        REQUIRE(t.has_value());
        REQUIRE_FALSE(t->segments.has_value());
    }

    SECTION("ServerErrorString") {
        auto t = LanBackend::parse_response(json{{"error", "model not loaded"}}, false);
        REQUIRE_FALSE(t.has_value());
        REQUIRE(t.error() == "server error: model not loaded");
    }

    SECTION("OpenAiErrorObject") {
        auto t = LanBackend::parse_response(json{{"error", {{"message", "bad file"}}}}, false);
        REQUIRE_FALSE(t.has_value());
        REQUIRE(t.error() == "server error: bad file");
    }

    SECTION("UnexpectedShape") {
        auto t = LanBackend::parse_response(json{{"foo", 1}}, false);
        REQUIRE_FALSE(t.has_value());
    }
}

TEST_CASE("LanBackend::transcribe", "[backend]") {

    SECTION("EmptyAudio") {
        LanBackend backend("http://127.0.0.1:1");
        auto t = backend.transcribe({}, 16000, TranscribeOptions{});
        REQUIRE_FALSE(t.has_value());
        REQUIRE(t.error() == "empty audio");
    }

    SECTION("UnreachableServer") {
        LanBackend backend("http://127.0.0.1:1", "whisper.cpp", "whisper-1", 5);
        std::vector<int16_t> audio(1600, 0);
        auto t = backend.transcribe(audio, 16000, TranscribeOptions{.language = "en"});
        REQUIRE_FALSE(t.has_value());
        REQUIRE(t.error().starts_with("curl error"));
    }
}
