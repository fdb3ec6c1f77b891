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

#include <QCoreApplication>
#include <getopt.h>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

#include "config.h"
#include "utilities.h"
#include "web_server.h"

static void print_help(const char *program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "Options:\n"
              << "  -c, --config <file>   YAML configuration file\n"
              << "  -p, --port <port>     Port to listen on (overrides the config)\n"
              << "  -v, --verbose         Enable verbose logging\n"
              << "  -h, --help            Show this help message\n";
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    std::optional<std::string> config_file_path;
    std::optional<int> port_override;
    bool show_help = false;

    static struct option long_options[] = {
        {"config",  required_argument, 0, 'c'},
        {"port",    required_argument, 0, 'p'},
        {"verbose", no_argument,       0, 'v'},
        {"help",    no_argument,       0, 'h'},
        {0,         0,                 0,  0 }
    };

    int opt;
    while (true) {
        int option_index = 0;
        opt = getopt_long(argc, argv, "c:p:vh", long_options, &option_index);

        if (opt == -1)
            break;

        switch (opt) {
            case 'c':
                config_file_path = optarg;
                break;
            case 'p':
                port_override = parse_port(optarg);
                if (!port_override) {
                    std::cerr << "[ERROR] Invalid port: " << optarg << "\n";
                    return 1;
                }
                break;
            case 'v':
                verbose = true;
                break;
            case 'h':
                show_help = true;
                break;
            default:
                // Unknown option
                print_help(argv[0]);
                return 1;
        }
    }

    if (show_help) {
        print_help(argv[0]);
        return 0;
    }

    AppConfig config;
    try {
        config = config_file_path ? load_config(*config_file_path) : default_config();
    } catch (const ConfigError &e) {
        log_error(e.what());
        return 1;
    }

    if (port_override) config.listen_port = *port_override;

    const quint16 port = static_cast<quint16>(config.listen_port);
    WebServer server(std::move(config));
    if (!server.start_server(port)) {
        log_error("Failed to start server on port " + std::to_string(port));
        return 1;
    }

    return app.exec();
}
