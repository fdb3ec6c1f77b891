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

#include "test_helpers.h"
#include "utilities.h"

#include <iostream>
#include <regex>
#include <string>
#include <vector>

namespace {

// Restores the global verbose flag when the test ends
struct VerboseGuard {
    bool saved = verbose;
    ~VerboseGuard() { verbose = saved; }
};

} // anonymous namespace

TEST_CASE("Log lines carry a UTC timestamp and the level", "[utilities]") {
    const std::regex info_line(R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z \[INFO\] hello\n$)");
    const std::regex error_line(R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z \[ERROR\] broken\n$)");

    CapturedStream out(std::cout);
    CapturedStream err(std::cerr);
    log_info("hello");
    log_error("broken");

    CHECK(std::regex_match(out.str(), info_line));
    CHECK(std::regex_match(err.str(), error_line));
}

TEST_CASE("Verbose messages are printed only when verbose is set", "[utilities]") {
    VerboseGuard guard;

    SECTION("quiet") {
        verbose = false;
        CapturedStream out(std::cout);
        log_verbose("details");
        CHECK(out.str().empty());
    }
    SECTION("verbose") {
        verbose = true;
        CapturedStream out(std::cout);
        log_verbose("details");
        CHECK(out.str().find("[VERBOSE] details\n") != std::string::npos);
    }
}

TEST_CASE("Strings are split and trimmed", "[utilities]") {
    CHECK(split_string("a.b..c", ".") == std::vector<std::string>{"a", "b", "", "c"});
    CHECK(trim("  10.0.0.1 \t\n") == "10.0.0.1");
    CHECK(generate_random_string(12).size() == 12);
}
