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

#ifndef INVENTORY_H
#define INVENTORY_H

#include "common.h"

#include <expected>
#include <filesystem>

namespace fs = std::filesystem;

/**
 * The inventory handed to ansible-playbook for one run.
 *
 * A Static inventory points at a pre-existing file that is left alone.
 * An Ephemeral inventory owns a temporary file holding one host per line;
 * the file is removed when the owning object is destroyed, so it never
 * outlives the request that created it. Removal failures are only logged.
 */
class InventorySource {
public:
    enum class Kind { Static, Ephemeral };

    static InventorySource make_static(fs::path path);
    static std::expected<InventorySource, PingError> make_ephemeral(const HostList &hosts,
                                                                    const fs::path &directory = {});

    InventorySource(InventorySource &&other) noexcept;
    InventorySource &operator=(InventorySource &&other) noexcept;
    InventorySource(const InventorySource &) = delete;
    InventorySource &operator=(const InventorySource &) = delete;
    ~InventorySource();

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] const fs::path &path() const { return path_; }

private:
    InventorySource(Kind kind, fs::path path);
    void release();

    Kind kind_;
    fs::path path_;
    bool owns_file_ = false;
};

// Ephemeral inventory of hosts when custom_requested, otherwise static_path (which must exist)
[[nodiscard]] std::expected<InventorySource, PingError> build_inventory(const HostList &hosts,
                                                                        bool custom_requested,
                                                                        const fs::path &static_path);

#endif // INVENTORY_H
