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

#ifndef CONFIG_H
#define CONFIG_H

#include "common.h"

#include <filesystem>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

// Fixed settings for the ansible-playbook invocation. None of these may come from a request.
struct AnsibleConfig {
    std::string binary = "ansible-playbook";
    fs::path playbook = "ansible/ping.yml";
    fs::path inventory = "ansible/inventory.ini";
    std::string remote_user = "ec2-user";
    fs::path private_key = "/etc/platform-api/ssh/id_rsa";
    std::string ssh_extra_args = "-o StrictHostKeyChecking=no -o UserKnownHostsFile=/dev/null";
    int timeout_seconds = 120;
};

// Demo credential for the login page
struct LoginConfig {
    std::string username = "admin";
    std::string password = "admin";
};

struct AppConfig {
    int listen_port = 8080;
    AnsibleConfig ansible;
    HostList default_hosts = {"127.0.0.1"};
    LoginConfig login;
};

// Largest timeout whose millisecond value still fits the int that QProcess waits on
constexpr int max_timeout_seconds = std::numeric_limits<int>::max() / 1000;

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

AppConfig default_config();

// A decimal port number in [1,65535] with nothing after it
[[nodiscard]] std::optional<int> parse_port(std::string_view text);

// Load a YAML config; keys that are absent keep their defaults.
// Relative playbook/inventory paths are taken relative to the config file.
AppConfig load_config(const fs::path &config_path);

#endif // CONFIG_H
