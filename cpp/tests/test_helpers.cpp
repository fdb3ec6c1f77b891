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

#include "test_helpers.h"
#include "utilities.h"

#include <fstream>
#include <stdexcept>

TempDir::TempDir() {
    path_ = fs::temp_directory_path() / ("platform-api-test-" + generate_random_string(16));
    fs::create_directory(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

void write_text(const fs::path &path, const std::string &content) {
    std::ofstream out_file(path, std::ios::binary);
    if (!out_file) throw std::runtime_error("Could not write " + path.string());
    out_file << content;
}

fs::path write_script(const fs::path &dir, const std::string &name, const std::string &body) {
    const fs::path script = dir / name;
    write_text(script, "#!/bin/sh\n" + body);
    fs::permissions(script, fs::perms::owner_all, fs::perm_options::add);
    return script;
}

AnsibleConfig fake_ansible_config(const fs::path &dir, const std::string &script_body) {
    AnsibleConfig config;
    config.binary = write_script(dir, "ansible-playbook", script_body).string();
    config.playbook = dir / "ping.yml";
    config.inventory = dir / "inventory.ini";
    config.private_key = dir / "id_rsa";
    config.timeout_seconds = 10;

    write_text(config.playbook, "- hosts: all\n  gather_facts: false\n  tasks:\n    - ansible.builtin.ping:\n");
    write_text(config.inventory, "127.0.0.1\n");
    return config;
}
