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

#ifndef PROCESS_RUNNER_H
#define PROCESS_RUNNER_H

#include "common.h"
#include "playbook_command.h"

#include <chrono>
#include <expected>

// Runs cmd to completion and captures its output. A nonzero exit code is a
// normal result; only a missing binary or an expired timeout are errors.
// On timeout the child is killed and reaped before returning.
// Milliseconds for QProcess::waitForFinished, clamped so it never turns negative (unbounded)
[[nodiscard]] int wait_timeout_ms(std::chrono::seconds timeout);

[[nodiscard]] std::expected<ExecutionResult, PingError> run_process(const CommandSpec &cmd,
                                                                    std::chrono::seconds timeout);

#endif // PROCESS_RUNNER_H
