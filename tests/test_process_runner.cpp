#include <catch2/catch_test_macros.hpp>

#include "platform/linux/posix_process_runner.hpp"

#include <string>
#include <vector>

TEST_CASE("PosixProcessRunner", "[process]") {
    PosixProcessRunner runner;

    SECTION("CapturesBothStreams") {
        auto out = runner.run("/bin/sh", {"-c", "echo out; echo err >&2"});
        REQUIRE(out.has_value());
        REQUIRE(out->success());
        REQUIRE(out->stdout_text == "out\n");
        REQUIRE(out->stderr_text == "err\n");
    }

    SECTION("ExitCode") {
        auto out = runner.run("/bin/sh", {"-c", "exit 3"});
        REQUIRE(out.has_value());
        REQUIRE_FALSE(out->success());
        REQUIRE(out->exit_code == 3);
    }

    SECTION("KilledBySignal") {
        auto out = runner.run("/bin/sh", {"-c", "kill -9 $$"});
        REQUIRE(out.has_value());
        REQUIRE_FALSE(out->success());
        REQUIRE(out->term_signal == 9);
    }

    SECTION("LargeOutputDoesNotDeadlock") {
        auto out = runner.run("/bin/sh", {"-c", "head -c 200000 /dev/zero | tr '\\0' a; "
                                                "head -c 200000 /dev/zero | tr '\\0' b >&2"});
        REQUIRE(out.has_value());
        REQUIRE(out->stdout_text.size() == 200000);
        REQUIRE(out->stderr_text.size() == 200000);
    }

    SECTION("StdinIsEmpty") {
        auto out = runner.run("/bin/cat", {});
        REQUIRE(out.has_value());
        REQUIRE(out->success());
        REQUIRE(out->stdout_text.empty());
    }

    SECTION("MissingProgram") {
        auto out = runner.run("/nonexistent/vd_no_such_binary", {});
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().kind == ErrorKind::ProcessExecution);
    }
}
