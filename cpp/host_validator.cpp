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

#include "host_validator.h"
#include "utilities.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <ranges>

[[nodiscard]] bool is_valid_ipv4(const std::string &candidate) {
    const std::vector<std::string> octets = split_string(candidate, ".");
    if (octets.size() != 4) return false;

    return std::ranges::all_of(octets, [](const std::string &octet) {
        if (octet.empty()) return false;
        if (!std::ranges::all_of(octet, [](unsigned char c) { return std::isdigit(c); })) return false;

        unsigned int value = 0;
        const auto [ptr, ec] = std::from_chars(octet.data(), octet.data() + octet.size(), value);
        return ec == std::errc{} && ptr == octet.data() + octet.size() && value <= 255;
    });
}

[[nodiscard]] HostList filter_valid_hosts(const HostList &hosts) {
    HostList valid;
    for (const auto &host : hosts) {
        if (is_valid_ipv4(host)) valid.push_back(host);
        else log_verbose("Dropping invalid host: " + host);
    }
    return valid;
}
