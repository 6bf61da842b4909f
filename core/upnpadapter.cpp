/* Copyright (C) 2017 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "upnpadapter.h"

#include <QDebug>
#include <QRegularExpression>

#include "soapclient.h"

UpnpAdapter::UpnpAdapter(std::shared_ptr<SoapClient> soap) :
    soap{std::move(soap)}
{
}

Protocol UpnpAdapter::protocol() const
{
    return Protocol::UPnP;
}

std::pair<QString, QString> UpnpAdapter::service(const ControlTarget &target, ServiceKind kind)
{
    if (kind == ServiceKind::AVTransport)
        return {target.info.serviceTypes.value("avtransport", avTransportType),
                target.info.controlUrls.value("avtransport", defaultAvTransportUrl)};

    return {target.info.serviceTypes.value("rendering", renderingControlType),
            target.info.controlUrls.value("rendering", defaultRenderingUrl)};
}

ControlResult UpnpAdapter::call(const ControlTarget &target, ServiceKind kind,
                                const QString &resultAction, const QString &soapAction,
                                const std::vector<std::pair<QString, QString>> &args,
                                QMap<QString, QString> *out)
{
    if (!soap)
        return ControlResult::failed(resultAction, Protocol::UPnP, ErrorType::Transport,
                                     "No SOAP client");

    const auto [serviceType, controlUrl] = service(target, kind);

    auto response = soap->send(target.host, target.port, controlUrl, serviceType,
                               soapAction, args, target.useTLS);

    if (!response.ok()) {
        return ControlResult::failed(resultAction, Protocol::UPnP, response.errorType,
                                     response.error,
                                     response.fault ? response.fault->errorCode : 0);
    }

    if (out)
        *out = response.values;

    return ControlResult::ok(resultAction, Protocol::UPnP);
}

ControlResult UpnpAdapter::play(const ControlTarget &target)
{
    return call(target, ServiceKind::AVTransport, "play", "Play",
                {{"InstanceID", "0"}, {"Speed", "1"}});
}

ControlResult UpnpAdapter::pause(const ControlTarget &target)
{
    return call(target, ServiceKind::AVTransport, "pause", "Pause", {{"InstanceID", "0"}});
}

ControlResult UpnpAdapter::stop(const ControlTarget &target)
{
    return call(target, ServiceKind::AVTransport, "stop", "Stop", {{"InstanceID", "0"}});
}

ControlResult UpnpAdapter::next(const ControlTarget &target)
{
    return call(target, ServiceKind::AVTransport, "next", "Next", {{"InstanceID", "0"}});
}

ControlResult UpnpAdapter::previous(const ControlTarget &target)
{
    return call(target, ServiceKind::AVTransport, "previous", "Previous", {{"InstanceID", "0"}});
}

QString UpnpAdapter::seekTarget(const QString &position)
{
    static const QRegularExpression secondsRx{"^\\d+$"};

    auto p = position.trimmed();
    if (!secondsRx.match(p).hasMatch())
        return p;

    auto total = p.toLongLong();
    return QStringLiteral("%1:%2:%3")
            .arg(total / 3600, 2, 10, QChar('0'))
            .arg((total % 3600) / 60, 2, 10, QChar('0'))
            .arg(total % 60, 2, 10, QChar('0'));
}

ControlResult UpnpAdapter::seek(const ControlTarget &target, const QString &position)
{
    auto seekPosition = seekTarget(position);
    auto result = call(target, ServiceKind::AVTransport, "seek", "Seek",
                       {{"InstanceID", "0"}, {"Unit", "REL_TIME"}, {"Target", seekPosition}});
    if (result.success())
        result.values.insert("position", seekPosition);
    return result;
}

QString UpnpAdapter::didlMetadata(const QString &uri)
{
    return QStringLiteral(
        "<DIDL-Lite xmlns=\"urn:schemas-upnp-org:metadata-1-0/DIDL-Lite/\" "
        "xmlns:dc=\"http://purl.org/dc/elements/1.1/\" "
        "xmlns:upnp=\"urn:schemas-upnp-org:metadata-1-0/upnp/\">"
        "<item id=\"1\" parentID=\"0\" restricted=\"1\">"
        "<dc:title>Audio Stream</dc:title>"
        "<dc:creator>Unknown</dc:creator>"
        "<upnp:class>object.item.audioItem.musicTrack</upnp:class>"
        "<res protocolInfo=\"http-get:*:audio/mpeg:*\">%1</res>"
        "</item>"
        "</DIDL-Lite>").arg(uri.toHtmlEscaped());
}

ControlResult UpnpAdapter::setUri(const ControlTarget &target, const QString &uri,
                                  const QString &metadata)
{
    auto result = call(target, ServiceKind::AVTransport, "set_uri", "SetAVTransportURI",
                       {{"InstanceID", "0"}, {"CurrentURI", uri},
                        {"CurrentURIMetaData", metadata.isEmpty() ? didlMetadata(uri) : metadata}});
    if (result.success())
        result.values.insert("uri", uri);
    return result;
}

ControlResult UpnpAdapter::getVolume(const ControlTarget &target)
{
    QMap<QString, QString> out;
    auto result = call(target, ServiceKind::RenderingControl, "get_volume", "GetVolume",
                       {{"InstanceID", "0"}, {"Channel", "Master"}}, &out);
    if (result.success())
        result.values.insert("volume", out.value("CurrentVolume", "0").toInt());
    return result;
}

ControlResult UpnpAdapter::setVolume(const ControlTarget &target, int level)
{
    auto result = call(target, ServiceKind::RenderingControl, "set_volume", "SetVolume",
                       {{"InstanceID", "0"}, {"Channel", "Master"},
                        {"DesiredVolume", QString::number(level)}});
    if (result.success())
        result.values.insert("volume", level);
    return result;
}

ControlResult UpnpAdapter::getMute(const ControlTarget &target)
{
    QMap<QString, QString> out;
    auto result = call(target, ServiceKind::RenderingControl, "get_mute", "GetMute",
                       {{"InstanceID", "0"}, {"Channel", "Master"}}, &out);
    if (result.success()) {
        auto mute = out.value("CurrentMute").trimmed().toLower();
        result.values.insert("muted", mute == "1" || mute == "true");
    }
    return result;
}

ControlResult UpnpAdapter::setMute(const ControlTarget &target, bool muted)
{
    auto result = call(target, ServiceKind::RenderingControl, "set_mute", "SetMute",
                       {{"InstanceID", "0"}, {"Channel", "Master"},
                        {"DesiredMute", muted ? "1" : "0"}});
    if (result.success())
        result.values.insert("muted", muted);
    return result;
}
