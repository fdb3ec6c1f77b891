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

#ifndef PING_SERVICE_H
#define PING_SERVICE_H

#include "common.h"
#include "config.h"

#include <optional>
#include <string>

#include <QJsonObject>

struct InvocationOutcome {
    bool success = false;
    std::optional<int> return_code;
    std::string standard_output;
    std::string standard_error;
    std::string command_line;
    PlaySummary play_summary;
    std::optional<PingError> error;

    // {success, returncode, stdout, stderr, cmd, play_summary} or {success, error, error_kind[, cmd]}
    [[nodiscard]] QJsonObject to_json() const;
};

[[nodiscard]] QJsonObject play_summary_to_json(const PlaySummary &summary);

/**
 * Validates the requested hosts, writes an inventory for them, runs the
 * ping playbook once and parses its recap.
 *
 * Holds no mutable state, so concurrent requests may share one instance.
 */
class PingService {
public:
    explicit PingService(AnsibleConfig ansible, HostList default_hosts);

    // An absent or empty host list pings the default hosts through the static inventory
    [[nodiscard]] InvocationOutcome ping(const std::optional<HostList> &requested_hosts) const;

private:
    AnsibleConfig ansible_;
    HostList default_hosts_;
};

#endif // PING_SERVICE_H
