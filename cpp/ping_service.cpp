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

#include "ping_service.h"
#include "host_validator.h"
#include "inventory.h"
#include "playbook_command.h"
#include "process_runner.h"
#include "recap_parser.h"
#include "utilities.h"

#include <format>
#include <utility>

#include <QJsonValue>

static InvocationOutcome failed_outcome(PingError error, std::string command_line = "") {
    InvocationOutcome outcome;
    outcome.success = false;
    outcome.command_line = std::move(command_line);
    outcome.error = std::move(error);
    return outcome;
}

[[nodiscard]] QJsonObject play_summary_to_json(const PlaySummary &summary) {
    QJsonObject hosts;
    for (const auto &[host, counters] : summary) {
        QJsonObject host_counters;
        for (const auto &[name, value] : counters) {
            host_counters.insert(QString::fromStdString(name), static_cast<qint64>(value));
        }
        hosts.insert(QString::fromStdString(host), host_counters);
    }
    return hosts;
}

[[nodiscard]] QJsonObject InvocationOutcome::to_json() const {
    QJsonObject json;
    json["success"] = success;

    if (error) {
        json["error"] = QString::fromStdString(error->message);
        json["error_kind"] = QString::fromStdString(::to_string(error->kind));
        if (!command_line.empty()) json["cmd"] = QString::fromStdString(command_line);
        return json;
    }

    if (return_code) json["returncode"] = *return_code;
    json["stdout"] = QString::fromStdString(standard_output);
    json["stderr"] = QString::fromStdString(standard_error);
    json["cmd"] = QString::fromStdString(command_line);
    json["play_summary"] = play_summary_to_json(play_summary);
    return json;
}

PingService::PingService(AnsibleConfig ansible, HostList default_hosts)
    : ansible_(std::move(ansible)), default_hosts_(std::move(default_hosts)) {}

[[nodiscard]] InvocationOutcome PingService::ping(const std::optional<HostList> &requested_hosts) const {
    const bool custom_requested = requested_hosts && !requested_hosts->empty();
    const HostList &candidates = custom_requested ? *requested_hosts : default_hosts_;

    const HostList hosts = filter_valid_hosts(candidates);
    if (hosts.empty()) {
        log_warning(std::format("Rejected ping request: none of {} host(s) is a valid IPv4 address", candidates.size()));
        return failed_outcome({PingErrorKind::Validation, "No valid IPv4 hosts provided"});
    }
    log_verbose(std::format("{} of {} host(s) passed validation", hosts.size(), candidates.size()));

    if (auto playbook_ok = check_playbook(ansible_.playbook); !playbook_ok) {
        log_error(playbook_ok.error().message);
        return failed_outcome(playbook_ok.error());
    }

    // A temporary inventory is removed when this goes out of scope, on every return below
    auto inventory = build_inventory(hosts, custom_requested, ansible_.inventory);
    if (!inventory) {
        log_error(inventory.error().message);
        return failed_outcome(inventory.error());
    }

    auto cmd = build_playbook_command(*inventory, ansible_);
    if (!cmd) {
        log_error(cmd.error().message);
        return failed_outcome(cmd.error());
    }

    const std::string command_line = cmd->to_string();
    log_info("Running: " + command_line);

    auto result = run_process(*cmd, std::chrono::seconds(ansible_.timeout_seconds));
    if (!result) return failed_outcome(result.error(), command_line);

    log_info(std::format("ansible-playbook exited with code {}", result->exit_code));

    InvocationOutcome outcome;
    outcome.success = result->exit_code == 0;
    outcome.return_code = result->exit_code;
    outcome.command_line = command_line;
    outcome.play_summary = parse_play_recap(result->standard_output);
    outcome.standard_output = std::move(result->standard_output);
    outcome.standard_error = std::move(result->standard_error);
    return outcome;
}
