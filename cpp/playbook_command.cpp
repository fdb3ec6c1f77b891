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

#include "playbook_command.h"

[[nodiscard]] std::string CommandSpec::to_string() const {
    std::string joined = program;
    for (const auto &argument : arguments) {
        joined += ' ';
        joined += argument;
    }
    return joined;
}

[[nodiscard]] std::expected<void, PingError> check_playbook(const fs::path &playbook) {
    std::error_code ec;
    if (!fs::is_regular_file(playbook, ec)) {
        return std::unexpected(PingError{PingErrorKind::NotFound, "Playbook not found: " + playbook.string()});
    }
    return {};
}

[[nodiscard]] std::expected<CommandSpec, PingError> build_playbook_command(const InventorySource &inventory,
                                                                           const AnsibleConfig &config) {
    if (auto playbook_ok = check_playbook(config.playbook); !playbook_ok) {
        return std::unexpected(playbook_ok.error());
    }

    CommandSpec cmd;
    cmd.program = config.binary;
    cmd.arguments = {
        "-i", inventory.path().string(),
        config.playbook.string(),
        "--user", config.remote_user,
        "--private-key", config.private_key.string(),
        "--ssh-extra-args", config.ssh_extra_args,
    };
    // Keep the recap free of colour escapes
    cmd.environment["ANSIBLE_NOCOLOR"] = "1";
    return cmd;
}
