// Copyright (C) 2025 Simon Quigley <tsimonq2@ubuntu.com>
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#include <catch2/catch_test_macros.hpp>

#include "process_runner.h"
#include "test_helpers.h"

#include <chrono>
#include <limits>

namespace {

CommandSpec shell(const std::string &script) {
    CommandSpec cmd;
    cmd.program = "/bin/sh";
    cmd.arguments = {"-c", script};
    return cmd;
}

} // anonymous namespace

TEST_CASE("Output and exit code of a successful command are captured", "[process_runner]") {
    auto result = run_process(shell("echo out; echo err >&2"), std::chrono::seconds(10));

    REQUIRE(result.has_value());
    CHECK(result->exit_code == 0);
    CHECK(result->standard_output == "out\n");
    CHECK(result->standard_error == "err\n");
}

TEST_CASE("A nonzero exit code is a result, not an error", "[process_runner]") {
    auto result = run_process(shell("echo partial; exit 4"), std::chrono::seconds(10));

    REQUIRE(result.has_value());
    CHECK(result->exit_code == 4);
    CHECK(result->standard_output == "partial\n");
}

TEST_CASE("Arguments reach the child verbatim without a shell", "[process_runner]") {
    CommandSpec cmd;
    cmd.program = "/bin/echo";
    cmd.arguments = {"; rm -rf /", "$(id)", "a b"};

    auto result = run_process(cmd, std::chrono::seconds(10));

    REQUIRE(result.has_value());
    CHECK(result->standard_output == "; rm -rf / $(id) a b\n");
}

TEST_CASE("Extra environment variables are visible to the child", "[process_runner]") {
    CommandSpec cmd = shell("printf '%s' \"$PLATFORM_API_TEST_VALUE\"");
    cmd.environment["PLATFORM_API_TEST_VALUE"] = "from-test";

    auto result = run_process(cmd, std::chrono::seconds(10));

    REQUIRE(result.has_value());
    CHECK(result->standard_output == "from-test");
}

TEST_CASE("A missing binary is classified as such", "[process_runner]") {
    CommandSpec cmd;
    cmd.program = "/nonexistent/bin/ansible-playbook";

    auto result = run_process(cmd, std::chrono::seconds(10));

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == PingErrorKind::BinaryMissing);
    CHECK(result.error().message == "Binary not found: /nonexistent/bin/ansible-playbook");
}

TEST_CASE("A binary missing from PATH is classified as such", "[process_runner]") {
    CommandSpec cmd;
    cmd.program = "platform-api-no-such-tool";

    auto result = run_process(cmd, std::chrono::seconds(10));

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == PingErrorKind::BinaryMissing);
}

TEST_CASE("A command that outlives its timeout is killed and reported", "[process_runner]") {
    TempDir dir;
    const fs::path script = write_script(dir.path(), "slow", "exec sleep 30\n");
    CommandSpec cmd;
    cmd.program = script.string();

    const auto started = std::chrono::steady_clock::now();
    auto result = run_process(cmd, std::chrono::seconds(1));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == PingErrorKind::Timeout);
    CHECK(result.error().message == "Command timed out after 1 seconds");
    CHECK(elapsed < std::chrono::seconds(15));
}

TEST_CASE("Wait timeouts are converted to milliseconds without overflowing", "[process_runner]") {
    CHECK(wait_timeout_ms(std::chrono::seconds(120)) == 120000);
    CHECK(wait_timeout_ms(std::chrono::seconds(3000000)) == std::numeric_limits<int>::max());
    CHECK(wait_timeout_ms(std::chrono::seconds(-5)) == 0);
}
