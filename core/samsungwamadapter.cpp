/* Copyright (C) 2021 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "samsungwamadapter.h"

#include <QDebug>

#include "httpclient.h"
#include "xmltools.h"

SamsungWamAdapter::SamsungWamAdapter(int httpTimeout) :
    timeout{httpTimeout}
{
}

Protocol SamsungWamAdapter::protocol() const
{
    return Protocol::SamsungWAM;
}

QString SamsungWamAdapter::playbackCommand(const QString &state)
{
    return QStringLiteral("<n>SetPlaybackControl</n><p type=\"str\" name=\"playback\" val=\"%1\"/>")
            .arg(state);
}

QString SamsungWamAdapter::urlPlaybackCommand(const QString &uri)
{
    return QStringLiteral("<n>SetUrlPlayback</n>"
                          "<p type=\"cdata\" name=\"url\" val=\"empty\"><![CDATA[%1]]></p>"
                          "<p type=\"dec\" name=\"buffersize\" val=\"0\"/>"
                          "<p type=\"dec\" name=\"seektime\" val=\"0\"/>"
                          "<p type=\"dec\" name=\"resume\" val=\"1\"/>").arg(uri);
}

QString SamsungWamAdapter::volumeCommand(int level)
{
    return QStringLiteral("<n>SetVolume</n><p type=\"dec\" name=\"volume\" val=\"%1\"/>").arg(level);
}

QUrl SamsungWamAdapter::commandUrl(const ControlTarget &target, const QString &cmd)
{
    auto endpoint = target.info.controlUrls.value("setUrlPlayback", "/UIC?cmd={CMD_ENCODED}");
    if (!endpoint.contains("{CMD_ENCODED}"))
        endpoint = "/UIC?cmd={CMD_ENCODED}";

    auto path = endpoint.toUtf8().replace("{CMD_ENCODED}", QUrl::toPercentEncoding(cmd));

    return QUrl::fromEncoded(QStringLiteral("http://%1:%2").arg(target.host).arg(target.port).toUtf8()
                             + path);
}

ControlResult SamsungWamAdapter::sendCommand(const ControlTarget &target, const QString &action,
                                             const QString &cmd)
{
    HttpClient client;
    client.setTimeout(timeout);

    auto url = commandUrl(target, cmd);
    qDebug() << "WAM call:" << action << url.toString();

    auto reply = client.get(url);

    if (reply.transportError())
        return ControlResult::failed(action, Protocol::SamsungWAM, ErrorType::Transport,
                                     reply.errorString);

    if (reply.status != 200)
        return ControlResult::failed(action, Protocol::SamsungWAM, ErrorType::ProtocolFault,
                                     QStringLiteral("Samsung WAM command failed with status %1")
                                     .arg(reply.status));

    return ControlResult::ok(action, Protocol::SamsungWAM,
                             {{"response", QString::fromUtf8(reply.data)}});
}

ControlResult SamsungWamAdapter::play(const ControlTarget &)
{
    // playback starts with SetUrlPlayback
    return ControlResult::ok("play", Protocol::SamsungWAM,
                             {{"note", "Use set_uri to start playback"}});
}

ControlResult SamsungWamAdapter::pause(const ControlTarget &target)
{
    return sendCommand(target, "pause", playbackCommand("pause"));
}

ControlResult SamsungWamAdapter::stop(const ControlTarget &target)
{
    return sendCommand(target, "stop", playbackCommand("stop"));
}

ControlResult SamsungWamAdapter::setUri(const ControlTarget &target, const QString &uri,
                                        const QString &)
{
    auto result = sendCommand(target, "set_uri", urlPlaybackCommand(uri));
    if (result.success())
        result.values.insert("uri", uri);
    return result;
}

ControlResult SamsungWamAdapter::getVolume(const ControlTarget &target)
{
    auto result = sendCommand(target, "get_volume", "<n>GetVolume</n>");
    if (!result.success())
        return result;

    auto data = result.values.value("response").toString().toUtf8();
    if (auto root = xmltools::parseWithFallbacks(data)) {
        if (auto volume = root->find("volume")) {
            bool ok = false;
            auto level = volume->text.toInt(&ok);
            if (ok)
                result.values.insert("volume", level);
        }
    }

    return result;
}

ControlResult SamsungWamAdapter::setVolume(const ControlTarget &target, int level)
{
    auto result = sendCommand(target, "set_volume", volumeCommand(level));
    if (result.success())
        result.values.insert("volume", level);
    return result;
}
