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

#ifndef RECAP_PARSER_H
#define RECAP_PARSER_H

#include "common.h"

#include <string>

/**
 * Extracts the per-host counters from the PLAY RECAP block of
 * ansible-playbook console output.
 *
 * The block starts at the first line beginning with "PLAY RECAP" (an
 * optional line made only of separator symbols may follow it) and ends at
 * the first blank line or at end of input. Each body line looks like
 *
 *     10.0.0.1 : ok=2 changed=1 unreachable=0 failed=0 ...
 *
 * Every name=integer pair after the first colon is kept, so counters that
 * newer Ansible releases add show up without changes here. Lines without a
 * colon are skipped. Output without a recap yields an empty summary.
 */
[[nodiscard]] PlaySummary parse_play_recap(const std::string &output);

#endif // RECAP_PARSER_H
