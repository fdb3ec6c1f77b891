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

#include "utilities.h"

#include <chrono>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <random>

bool verbose = false;

// Keeps lines from concurrent requests from interleaving
static std::mutex log_mutex;

// Function to generate a random string of given length
std::string generate_random_string(size_t length) {
    const std::string chars =
        "abcdefghijklmnopqrstuvwxyz"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "0123456789";
    thread_local std::mt19937 rg{std::random_device{}()};
    thread_local std::uniform_int_distribution<> pick(0, chars.size() - 1);
    std::string s;
    s.reserve(length);
    while (length--)
        s += chars[pick(rg)];
    return s;
}

// Function to get current UTC time formatted as per the given format string
std::string get_current_utc_time(const std::string& format) {
    auto now = std::chrono::system_clock::now();
    std::time_t now_time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_utc;
    gmtime_r(&now_time, &tm_utc);
    char buf[64];
    std::strftime(buf, sizeof(buf), format.c_str(), &tm_utc);
    return std::string(buf);
}

std::vector<std::string> split_string(const std::string& input, const std::string& delimiter) {
    std::vector<std::string> result;
    size_t start = 0;
    size_t end = 0;

    while ((end = input.find(delimiter, start)) != std::string::npos) {
        result.emplace_back(input.substr(start, end - start));
        start = end + delimiter.length();
    }

    // Add the remaining part of the string
    result.emplace_back(input.substr(start));
    return result;
}

std::string trim(const std::string& input) {
    const auto first = input.find_first_not_of(" \t\r\n\v\f");
    if (first == std::string::npos) return "";
    const auto last = input.find_last_not_of(" \t\r\n\v\f");
    return input.substr(first, last - first + 1);
}

static void write_log_line(std::ostream &out, const std::string &level, const std::string &msg) {
    std::lock_guard<std::mutex> lock(log_mutex);
    out << std::format("{} [{}] {}\n", get_current_utc_time("%Y-%m-%dT%H:%M:%SZ"), level, msg);
}

// Logger function implementations
void log_info(const std::string &msg) {
    write_log_line(std::cout, "INFO", msg);
}

void log_warning(const std::string &msg) {
    write_log_line(std::cerr, "WARNING", msg);
}

void log_error(const std::string &msg) {
    write_log_line(std::cerr, "ERROR", msg);
}

void log_verbose(const std::string &msg) {
    if (verbose) {
        write_log_line(std::cout, "VERBOSE", msg);
    }
}
