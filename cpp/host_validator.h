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

#ifndef HOST_VALIDATOR_H
#define HOST_VALIDATOR_H

#include "common.h"

#include <string>

// True iff candidate is four dot-separated decimal octets, each in [0,255].
// Leading zeros are accepted ("010" is 10); signs and whitespace are not.
[[nodiscard]] bool is_valid_ipv4(const std::string &candidate);

// Keeps only the valid entries, preserving order and duplicates
[[nodiscard]] HostList filter_valid_hosts(const HostList &hosts);

#endif // HOST_VALIDATOR_H
