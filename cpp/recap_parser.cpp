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

#include "recap_parser.h"
#include "utilities.h"

#include <algorithm>
#include <charconv>
#include <regex>
#include <sstream>

namespace {
const std::regex RE_PLAY_RECAP_START(R"(^\s*PLAY RECAP\b.*$)");
const std::regex RE_SEPARATOR_LINE(R"(^\s*[*=#~_+\-]+\s*$)");
const std::regex RE_COUNTER(R"(([A-Za-z_]\w*)=(\d+))");
const std::regex RE_ANSI_ESCAPE(R"(\x1B\[[0-9;]*[A-Za-z])");
} // anonymous namespace

[[nodiscard]] PlaySummary parse_play_recap(const std::string &output) {
    PlaySummary summary;
    if (output.empty()) return summary;

    std::istringstream stream(std::regex_replace(output, RE_ANSI_ESCAPE, ""));
    std::string line;

    bool in_play_recap = false;
    bool expect_separator = false;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (!in_play_recap) {
            if (std::regex_match(line, RE_PLAY_RECAP_START)) {
                in_play_recap = true;
                expect_separator = true;
            }
            continue;
        }

        if (expect_separator) {
            expect_separator = false;
            if (std::regex_match(line, RE_SEPARATOR_LINE)) continue;
        }

        // The recap body ends at the first blank line
        if (trim(line).empty()) break;

        const auto colon = line.find(':');
        if (colon == std::string::npos) continue;

        const std::string host = trim(line.substr(0, colon));
        if (host.empty()) continue;

        const std::string counters = line.substr(colon + 1);
        auto &host_counters = summary[host];
        for (auto it = std::sregex_iterator(counters.begin(), counters.end(), RE_COUNTER);
             it != std::sregex_iterator(); ++it) {
            const std::string digits = (*it)[2].str();
            std::int64_t value = 0;
            const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
            if (ec != std::errc{}) {
                log_warning("Ignoring out of range counter for " + host + ": " + (*it)[0].str());
                continue;
            }
            host_counters[(*it)[1].str()] = value;
        }
    }

    return summary;
}
