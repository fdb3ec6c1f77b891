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

#ifndef PLAYBOOK_COMMAND_H
#define PLAYBOOK_COMMAND_H

#include "common.h"
#include "config.h"
#include "inventory.h"

#include <expected>
#include <map>
#include <string>
#include <vector>

// A fully resolved external command. Arguments are passed to the program
// directly, never through a shell.
struct CommandSpec {
    std::string program;
    std::vector<std::string> arguments;
    // Added on top of the inherited environment
    std::map<std::string, std::string> environment;

    // Program and arguments joined by single spaces, for display only
    [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] std::expected<void, PingError> check_playbook(const fs::path &playbook);

// ansible-playbook -i <inventory> <playbook> --user <u> --private-key <k> --ssh-extra-args <args>
[[nodiscard]] std::expected<CommandSpec, PingError> build_playbook_command(const InventorySource &inventory,
                                                                           const AnsibleConfig &config);

#endif // PLAYBOOK_COMMAND_H
