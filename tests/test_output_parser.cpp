#include <catch2/catch_test_macros.hpp>

#include "sidecar/output_parser.hpp"

TEST_CASE("extract_structured_text", "[sidecar]") {

    SECTION("FindsTextLine") {
        auto text = extract_structured_text("loading model\n{\"lang\":\"en\",\"text\":\"hello\"}\ndone\n");
        REQUIRE(text.has_value());
        REQUIRE(*text == "hello");
    }

    SECTION("CarriageReturns") {
        auto text = extract_structured_text("{\"text\":\"crlf\"}\r\n");
        REQUIRE(text == "crlf");
    }

    SECTION("FirstMatchWins") {
        auto text = extract_structured_text("{\"text\":\"one\"}\n{\"text\":\"two\"}\n");
        REQUIRE(text == "one");
    }

    SECTION("IgnoresNonStringText") {
        REQUIRE_FALSE(extract_structured_text("{\"text\":42}\n[1,2]\nplain\n").has_value());
    }

    SECTION("NoJson") {
        REQUIRE_FALSE(extract_structured_text("").has_value());
        REQUIRE_FALSE(extract_structured_text("{broken\n").has_value());
    }
}

TEST_CASE("recover_transcript", "[sidecar]") {

    SECTION("StderrWins") {
        REQUIRE(recover_transcript("{\"text\":\"out\"}\n", "log line\n{\"text\":\"err\"}\n") == "err");
    }

    SECTION("StdoutJsonFallback") {
        REQUIRE(recover_transcript("{\"text\":\"out\"}\n", "no json here\n") == "out");
    }

    SECTION("RawStdoutFallback") {
        REQUIRE(recover_transcript("  plain words \n", "") == "plain words");
    }

    SECTION("NothingAtAll") {
        REQUIRE(recover_transcript("", "").empty());
    }
}
