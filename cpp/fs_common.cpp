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

#include <cerrno>
#include <cstring>
#include <fstream>
#include <format>

#include "fs_common.h"
#include "utilities.h"

namespace fs = std::filesystem;

// Function to read the entire content of a file into a string
std::string read_file(const fs::path& file_path) {
    std::ifstream in_file(file_path, std::ios::binary);
    if (in_file) return std::string((std::istreambuf_iterator<char>(in_file)),
                                    std::istreambuf_iterator<char>());
    return "";
}

std::expected<fs::path, std::string> create_unique_file(const fs::path& dir,
                                                        const std::string& prefix,
                                                        const std::string& content) {
    constexpr int max_attempts = 8;
    for (int attempt = 0; attempt < max_attempts; ++attempt) {
        const fs::path candidate = dir / (prefix + generate_random_string(16));

        errno = 0;
        std::ofstream out_file(candidate, std::ios::binary | std::ios::noreplace);
        if (!out_file) {
            if (errno == EEXIST) continue;
            return std::unexpected(std::format("{}: {}", candidate.string(),
                                               errno ? std::strerror(errno) : "could not open for writing"));
        }

        out_file << content;
        out_file.close();
        if (!out_file) {
            std::error_code ec;
            fs::remove(candidate, ec);
            return std::unexpected(std::format("{}: write failed", candidate.string()));
        }
        return candidate;
    }
    return std::unexpected(std::format("no free file name under {}", dir.string()));
}
