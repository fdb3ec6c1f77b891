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

#ifndef COMMON_H
#define COMMON_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

using HostList = std::vector<std::string>;

// host -> counter name -> value, as printed in the PLAY RECAP block
using PlaySummary = std::map<std::string, std::map<std::string, std::int64_t>>;

enum class PingErrorKind {
    Validation,
    NotFound,
    Io,
    BinaryMissing,
    Timeout
};

struct PingError {
    PingErrorKind kind;
    std::string message;
};

std::string to_string(PingErrorKind kind);

// Outcome of a process that ran to completion, whatever its exit code
struct ExecutionResult {
    int exit_code = 0;
    std::string standard_output;
    std::string standard_error;
};

#endif // COMMON_H
