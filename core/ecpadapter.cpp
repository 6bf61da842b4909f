/* Copyright (C) 2021 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "ecpadapter.h"

#include <QDebug>
#include <QThread>

#include "httpclient.h"

EcpAdapter::EcpAdapter(int httpTimeout, int launchDelay) :
    timeout{httpTimeout},
    launchDelay{launchDelay}
{
}

Protocol EcpAdapter::protocol() const
{
    return Protocol::ECP;
}

QUrl EcpAdapter::makeUrl(const ControlTarget &target, const QString &path)
{
    return QUrl{QStringLiteral("%1://%2:%3%4").arg(target.useTLS ? "https" : "http", target.host)
                .arg(target.port).arg(path)};
}

QByteArray EcpAdapter::inputBody(const QString &uri)
{
    return "mediaType=audio&url=" + QUrl::toPercentEncoding(uri) + "&loop=true";
}

ControlResult EcpAdapter::post(const ControlTarget &target, const QString &action,
                               const QString &path, const QByteArray &body, bool form)
{
    HttpClient client;
    client.setTimeout(timeout);

    std::vector<HttpClient::header> headers;
    if (form)
        headers.emplace_back("Content-Type", "application/x-www-form-urlencoded");

    auto url = makeUrl(target, path);
    qDebug() << "ECP call:" << url.toString();

    auto reply = client.post(url, body, headers);

    if (reply.transportError())
        return ControlResult::failed(action, Protocol::ECP, ErrorType::Transport,
                                     reply.errorString);

    if (reply.status != 200)
        return ControlResult::failed(action, Protocol::ECP, ErrorType::ProtocolFault,
                                     QStringLiteral("ECP %1 failed with status %2")
                                     .arg(path).arg(reply.status));

    return ControlResult::ok(action, Protocol::ECP);
}

ControlResult EcpAdapter::play(const ControlTarget &target)
{
    return post(target, "play", "/keypress/Play");
}

ControlResult EcpAdapter::pause(const ControlTarget &target)
{
    return post(target, "pause", "/keypress/PlayPause");
}

ControlResult EcpAdapter::stop(const ControlTarget &target)
{
    return post(target, "stop", "/keypress/Home");
}

ControlResult EcpAdapter::setUri(const ControlTarget &target, const QString &uri, const QString &)
{
    auto launch = post(target, "set_uri",
                       target.info.controlUrls.value("launch", "/launch/2213"));
    if (!launch.success())
        return launch;

    // media player needs a moment to start
    if (launchDelay > 0)
        QThread::msleep(static_cast<unsigned long>(launchDelay));

    auto result = post(target, "set_uri", target.info.controlUrls.value("input", "/input"),
                       inputBody(uri), true);
    if (result.success())
        result.values.insert("uri", uri);

    return result;
}
