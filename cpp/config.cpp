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

#include "config.h"
#include "utilities.h"

#include <yaml-cpp/yaml.h>

#include <charconv>

[[nodiscard]] std::optional<int> parse_port(std::string_view text) {
    int port = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    if (port < 1 || port > 65535) return std::nullopt;
    return port;
}

AppConfig default_config() {
    return AppConfig{};
}

template <typename T>
static void read_scalar(const YAML::Node &node, const std::string &key, T &target) {
    if (!node[key]) return;
    try {
        target = node[key].as<T>();
    } catch (const YAML::Exception &e) {
        throw ConfigError("Invalid value for '" + key + "': " + e.what());
    }
}

static void read_path(const YAML::Node &node, const std::string &key, const fs::path &base_dir, fs::path &target) {
    std::string value;
    read_scalar(node, key, value);
    if (value.empty()) return;

    fs::path path(value);
    target = path.is_relative() ? (base_dir / path).lexically_normal() : path;
}

AppConfig load_config(const fs::path &config_path) {
    std::error_code ec;
    const bool config_exists = fs::exists(config_path, ec);
    if (ec) {
        throw ConfigError("Cannot access config file " + config_path.string() + ": " + ec.message());
    }
    if (!config_exists) {
        throw ConfigError("Config file does not exist: " + config_path.string());
    }

    YAML::Node config;
    try {
        config = YAML::LoadFile(config_path.string());
    } catch (const YAML::BadFile &) {
        throw ConfigError("Unable to open config file: " + config_path.string());
    } catch (const YAML::ParserException &e) {
        throw ConfigError("Failed to parse config file " + config_path.string() + ": " + e.what());
    }

    AppConfig app_config = default_config();
    const fs::path base_dir = fs::absolute(config_path).parent_path();

    // The default relative paths are resolved against the config directory too
    app_config.ansible.playbook = (base_dir / app_config.ansible.playbook).lexically_normal();
    app_config.ansible.inventory = (base_dir / app_config.ansible.inventory).lexically_normal();

    if (config.IsNull()) {
        log_warning("Config file " + config_path.string() + " is empty, using defaults");
        return app_config;
    }
    if (!config.IsMap()) {
        throw ConfigError("Config file " + config_path.string() + " must contain a mapping");
    }

    read_scalar(config, "listen_port", app_config.listen_port);

    AnsibleConfig &ansible = app_config.ansible;
    read_scalar(config, "ansible_binary", ansible.binary);
    read_path(config, "playbook", base_dir, ansible.playbook);
    read_path(config, "inventory", base_dir, ansible.inventory);
    read_scalar(config, "remote_user", ansible.remote_user);
    read_path(config, "private_key", base_dir, ansible.private_key);
    read_scalar(config, "ssh_extra_args", ansible.ssh_extra_args);
    read_scalar(config, "timeout_seconds", ansible.timeout_seconds);

    if (config["default_hosts"]) {
        if (!config["default_hosts"].IsSequence()) {
            throw ConfigError("'default_hosts' must be a list");
        }
        app_config.default_hosts.clear();
        try {
            for (const auto &host : config["default_hosts"]) {
                app_config.default_hosts.push_back(host.as<std::string>());
            }
        } catch (const YAML::Exception &e) {
            throw ConfigError(std::string("Invalid entry in 'default_hosts': ") + e.what());
        }
    }

    if (const YAML::Node login = config["login"]) {
        if (!login.IsMap()) throw ConfigError("'login' must be a mapping");
        read_scalar(login, "username", app_config.login.username);
        read_scalar(login, "password", app_config.login.password);
    }

    if (app_config.listen_port < 1 || app_config.listen_port > 65535) {
        throw ConfigError("'listen_port' must be between 1 and 65535");
    }
    if (ansible.timeout_seconds <= 0) {
        throw ConfigError("'timeout_seconds' must be positive");
    }
    if (ansible.timeout_seconds > max_timeout_seconds) {
        throw ConfigError("'timeout_seconds' must not exceed " + std::to_string(max_timeout_seconds));
    }
    if (ansible.binary.empty()) {
        throw ConfigError("'ansible_binary' must not be empty");
    }

    log_verbose("Loaded config from " + config_path.string());
    return app_config;
}
