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

#include "inventory.h"
#include "fs_common.h"
#include "utilities.h"

#include <utility>

InventorySource::InventorySource(Kind kind, fs::path path)
    : kind_(kind), path_(std::move(path)), owns_file_(kind == Kind::Ephemeral) {}

InventorySource InventorySource::make_static(fs::path path) {
    return InventorySource(Kind::Static, std::move(path));
}

std::expected<InventorySource, PingError> InventorySource::make_ephemeral(const HostList &hosts,
                                                                          const fs::path &directory) {
    std::string content;
    for (const auto &host : hosts) {
        content += host;
        content += '\n';
    }

    fs::path target_directory = directory;
    if (target_directory.empty()) {
        std::error_code ec;
        target_directory = fs::temp_directory_path(ec);
        if (ec) {
            return std::unexpected(PingError{PingErrorKind::Io,
                                             "Failed to create temporary inventory: " + ec.message()});
        }
    }

    auto created = create_unique_file(target_directory, "platform-api-inventory-", content);
    if (!created) {
        return std::unexpected(PingError{PingErrorKind::Io,
                                         "Failed to create temporary inventory: " + created.error()});
    }
    log_verbose("Wrote " + std::to_string(hosts.size()) + " host(s) to " + created->string());
    return InventorySource(Kind::Ephemeral, std::move(*created));
}

InventorySource::InventorySource(InventorySource &&other) noexcept
    : kind_(other.kind_), path_(std::move(other.path_)), owns_file_(std::exchange(other.owns_file_, false)) {}

InventorySource &InventorySource::operator=(InventorySource &&other) noexcept {
    if (this != &other) {
        release();
        kind_ = other.kind_;
        path_ = std::move(other.path_);
        owns_file_ = std::exchange(other.owns_file_, false);
    }
    return *this;
}

InventorySource::~InventorySource() {
    release();
}

void InventorySource::release() {
    if (!owns_file_) return;
    owns_file_ = false;

    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) log_warning("Could not remove temporary inventory " + path_.string() + ": " + ec.message());
}

[[nodiscard]] std::expected<InventorySource, PingError> build_inventory(const HostList &hosts,
                                                                        bool custom_requested,
                                                                        const fs::path &static_path) {
    if (custom_requested) return InventorySource::make_ephemeral(hosts);

    std::error_code ec;
    if (!fs::exists(static_path, ec)) {
        return std::unexpected(PingError{PingErrorKind::NotFound, "Inventory not found: " + static_path.string()});
    }
    return InventorySource::make_static(static_path);
}
