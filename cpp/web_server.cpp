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

#include "web_server.h"
#include "utilities.h"

// Qt includes
#include <QtHttpServer/QHttpServer>
#include <QtHttpServer/QHttpServerRequest>
#include <QtHttpServer/QHttpServerResponse>
#include <QtConcurrent/QtConcurrent>
#include <QFuture>
#include <QHostAddress>
#include <QHttpHeaders>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QUrlQuery>

// C++ includes
#include <exception>
#include <string>

constexpr QHttpServerResponder::StatusCode StatusCodeFound = QHttpServerResponder::StatusCode::Found;

static const QStringList known_endpoints = {"/", "/login", "/health", "/ping"};

[[nodiscard]] std::optional<HostList> parse_ping_query(const QUrlQuery &query) {
    if (!query.hasQueryItem("hosts")) return std::nullopt;

    HostList host_list;
    for (const QString &host : query.queryItemValue("hosts", QUrl::FullyDecoded).split(',', Qt::SkipEmptyParts)) {
        host_list.push_back(host.trimmed().toStdString());
    }
    return host_list;
}

[[nodiscard]] PingRequest parse_ping_body(const QByteArray &body) {
    PingRequest request;
    if (body.trimmed().isEmpty()) return request;

    QJsonParseError parse_error;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        request.error = "Invalid request body";
        return request;
    }

    const QJsonValue hosts = doc.object().value("hosts");
    if (hosts.isUndefined() || hosts.isNull()) return request;
    if (!hosts.isArray()) {
        request.error = "Invalid request body";
        return request;
    }

    // Non-string entries become empty strings, which fail validation like any other bad host
    HostList host_list;
    for (const QJsonValue &host : hosts.toArray()) {
        host_list.push_back(host.isString() ? host.toString().toStdString() : std::string());
    }
    request.hosts = std::move(host_list);
    return request;
}

[[nodiscard]] QHttpServerResponder::StatusCode status_for(const InvocationOutcome &outcome) {
    if (!outcome.error) return QHttpServerResponder::StatusCode::Ok;
    if (outcome.error->kind == PingErrorKind::Validation) return QHttpServerResponder::StatusCode::BadRequest;
    return QHttpServerResponder::StatusCode::InternalServerError;
}

WebServer::WebServer(AppConfig config, QObject *parent)
    : QObject(parent),
      config_(std::move(config)),
      ping_service_(config_.ansible, config_.default_hosts) {}

[[nodiscard]] QHttpServerResponse WebServer::login_page(const QString &error,
                                                        QHttpServerResponder::StatusCode status) const {
    const QString error_html = error.isEmpty() ? QString() : QString("<p class=\"error\">%1</p>").arg(error.toHtmlEscaped());
    QString html = QString(R"(
        <!DOCTYPE html>
        <html lang="en">
        <head>
            <meta charset="UTF-8">
            <title>Platform API - Login</title>
        </head>
        <body>
            <h1>Platform API</h1>
            %1
            <form action="/login" method="POST">
                <label>Username <input type="text" name="username" /></label>
                <label>Password <input type="password" name="password" /></label>
                <button type="submit">Log in</button>
            </form>
        </body>
        </html>
    )").arg(error_html);
    return QHttpServerResponse("text/html", html.toUtf8(), status);
}

[[nodiscard]] QHttpServerResponse WebServer::dashboard_page() const {
    QString endpoint_items;
    for (const QString &endpoint : known_endpoints) {
        endpoint_items += QString("<li><code>%1</code></li>").arg(endpoint);
    }

    QString html = QString(R"(
        <!DOCTYPE html>
        <html lang="en">
        <head>
            <meta charset="UTF-8">
            <title>Platform API</title>
        </head>
        <body>
            <h1>Platform API</h1>
            <p>Service health: <a href="%1">%1</a></p>
            <h2>Endpoints</h2>
            <ul>%2</ul>
        </body>
        </html>
    )").arg(QStringLiteral("/health"), endpoint_items);
    return QHttpServerResponse("text/html", html.toUtf8());
}

[[nodiscard]] QHttpServerResponse WebServer::ping_response(const std::optional<HostList> &hosts) const {
    try {
        const InvocationOutcome outcome = ping_service_.ping(hosts);
        return QHttpServerResponse(outcome.to_json(), status_for(outcome));
    } catch (const std::exception &e) {
        log_error(std::string("Unhandled error while handling /ping: ") + e.what());
        QJsonObject body{{"success", false}, {"error", QString::fromStdString(e.what())}};
        return QHttpServerResponse(body, QHttpServerResponder::StatusCode::InternalServerError);
    }
}

bool WebServer::start_server(quint16 port) {
    /////////
    // /
    /////////
    http_server_.route("/", QHttpServerRequest::Method::Get, [this](const QHttpServerRequest &) {
        return login_page(QString());
    });

    //////////////
    // /login
    //////////////
    http_server_.route("/login", QHttpServerRequest::Method::Post, [this](const QHttpServerRequest &req) -> QHttpServerResponse {
        // Form bodies encode spaces as '+', which QUrlQuery leaves alone
        QUrlQuery form(QString::fromUtf8(req.body()).replace('+', ' '));
        const std::string username = form.queryItemValue("username", QUrl::FullyDecoded).toStdString();
        const std::string password = form.queryItemValue("password", QUrl::FullyDecoded).toStdString();

        if (username == config_.login.username && password == config_.login.password) {
            QHttpServerResponse redirect(StatusCodeFound);
            QHttpHeaders redirect_headers;
            redirect_headers.replaceOrAppend(QHttpHeaders::WellKnownHeader::Location, "/app");
            redirect.setHeaders(redirect_headers);
            return redirect;
        }

        log_warning("Failed login attempt for user '" + username + "'");
        return login_page("Invalid credentials", QHttpServerResponder::StatusCode::Unauthorized);
    });

    //////////////
    // /health
    //////////////
    http_server_.route("/health", QHttpServerRequest::Method::Get, [](const QHttpServerRequest &) {
        return QHttpServerResponse(QJsonObject{{"status", "ok"}});
    });

    //////////////
    // /app
    //////////////
    http_server_.route("/app", QHttpServerRequest::Method::Get, [this](const QHttpServerRequest &) {
        return dashboard_page();
    });

    ////////////////////////////////
    // /ping  {"hosts": ["10.0.0.1"]}
    ////////////////////////////////
    http_server_.route("/ping", QHttpServerRequest::Method::Post, [this](const QHttpServerRequest &req) -> QFuture<QHttpServerResponse> {
        // Extract data up front
        const QByteArray body = req.body();

        return QtConcurrent::run([this, body]() -> QHttpServerResponse {
            const PingRequest request = parse_ping_body(body);
            if (request.error) {
                QJsonObject error_body{{"success", false}, {"error", *request.error}};
                return QHttpServerResponse(error_body, QHttpServerResponder::StatusCode::BadRequest);
            }
            return ping_response(request.hosts);
        });
    });

    ////////////////////////////////
    // /ping?hosts=10.0.0.1,10.0.0.2
    ////////////////////////////////
    http_server_.route("/ping", QHttpServerRequest::Method::Get, [this](const QHttpServerRequest &req) -> QFuture<QHttpServerResponse> {
        const std::optional<HostList> hosts = parse_ping_query(req.query());
        return QtConcurrent::run([this, hosts]() -> QHttpServerResponse {
            return ping_response(hosts);
        });
    });

    // Attempt to listen on `port`
    if (!tcp_server_.listen(QHostAddress::Any, port) || !http_server_.bind(&tcp_server_)) {
        log_error("Could not bind to port " + std::to_string(port));
        return false;
    }

    log_info("Web server running on port " + std::to_string(tcp_server_.serverPort()));
    return true;
}
