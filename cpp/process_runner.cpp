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

#include "process_runner.h"
#include "utilities.h"

#include <algorithm>
#include <format>
#include <limits>

#include <QProcess>
#include <QProcessEnvironment>
#include <QStringList>

[[nodiscard]] int wait_timeout_ms(std::chrono::seconds timeout) {
    const auto timeout_ms = std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count();
    return static_cast<int>(std::clamp<std::chrono::milliseconds::rep>(timeout_ms, 0, std::numeric_limits<int>::max()));
}

[[nodiscard]] std::expected<ExecutionResult, PingError> run_process(const CommandSpec &cmd,
                                                                    std::chrono::seconds timeout) {
    QProcess process;

    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    for (const auto &[key, value] : cmd.environment) {
        env.insert(QString::fromStdString(key), QString::fromStdString(value));
    }
    process.setProcessEnvironment(env);

    QStringList arguments;
    for (const auto &argument : cmd.arguments) {
        arguments << QString::fromStdString(argument);
    }

    process.start(QString::fromStdString(cmd.program), arguments);
    if (!process.waitForStarted()) {
        log_error("Failed to start " + cmd.program + ": " + process.errorString().toStdString());
        return std::unexpected(PingError{PingErrorKind::BinaryMissing, "Binary not found: " + cmd.program});
    }

    if (!process.waitForFinished(wait_timeout_ms(timeout)) && process.state() != QProcess::NotRunning) {
        process.kill();
        process.waitForFinished();
        log_error(std::format("{} killed after {} seconds", cmd.program, timeout.count()));
        return std::unexpected(PingError{PingErrorKind::Timeout,
                                         std::format("Command timed out after {} seconds", timeout.count())});
    }

    ExecutionResult result;
    result.exit_code = process.exitStatus() == QProcess::NormalExit ? process.exitCode() : -1;
    result.standard_output = process.readAllStandardOutput().toStdString();
    result.standard_error = process.readAllStandardError().toStdString();
    return result;
}
