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

#pragma once

#include <expected>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Function to read the entire content of a file into a string
std::string read_file(const std::filesystem::path& file_path);

// Function to create a file with a fresh random name under dir and write content into it.
// Never reuses an existing path; returns the reason on failure.
std::expected<std::filesystem::path, std::string> create_unique_file(const std::filesystem::path& dir,
                                                                     const std::string& prefix,
                                                                     const std::string& content);
