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

#ifndef WEB_SERVER_H
#define WEB_SERVER_H

#include "config.h"
#include "ping_service.h"

#include <optional>

#include <QByteArray>
#include <QHttpServer>
#include <QHttpServerResponse>
#include <QObject>
#include <QString>
#include <QTcpServer>
#include <QUrlQuery>

// Parses the body of POST /ping. An empty body or a missing "hosts" key
// yields an empty optional; a malformed body yields an error message.
struct PingRequest {
    std::optional<HostList> hosts;
    std::optional<QString> error;
};
[[nodiscard]] PingRequest parse_ping_body(const QByteArray &body);

// Reads the comma-separated "hosts" item of GET /ping. Absent key gives an
// empty optional, "hosts=" gives an empty list.
[[nodiscard]] std::optional<HostList> parse_ping_query(const QUrlQuery &query);

// 200 when the playbook ran, 400 for rejected input, 500 for any other failure
[[nodiscard]] QHttpServerResponder::StatusCode status_for(const InvocationOutcome &outcome);

class WebServer : public QObject {
    Q_OBJECT
public:
    explicit WebServer(AppConfig config, QObject *parent = nullptr);
    bool start_server(quint16 port);

private:
    [[nodiscard]] QHttpServerResponse login_page(const QString &error,
                                                 QHttpServerResponder::StatusCode status = QHttpServerResponder::StatusCode::Ok) const;
    [[nodiscard]] QHttpServerResponse dashboard_page() const;
    [[nodiscard]] QHttpServerResponse ping_response(const std::optional<HostList> &hosts) const;

    AppConfig config_;
    PingService ping_service_;
    QHttpServer http_server_;
    QTcpServer tcp_server_;
};

#endif // WEB_SERVER_H
