/* Copyright (C) 2017 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef UPNPADAPTER_H
#define UPNPADAPTER_H

#include <QString>
#include <QVariantMap>
#include <memory>
#include <vector>
#include <utility>

#include "protocoladapter.h"

class SoapClient;

class UpnpAdapter : public ProtocolAdapter
{
public:
    static constexpr const char* avTransportType = "urn:schemas-upnp-org:service:AVTransport:1";
    static constexpr const char* renderingControlType = "urn:schemas-upnp-org:service:RenderingControl:1";
    static constexpr const char* defaultAvTransportUrl = "/MediaRenderer/AVTransport/Control";
    static constexpr const char* defaultRenderingUrl = "/MediaRenderer/RenderingControl/Control";

    enum class ServiceKind { AVTransport, RenderingControl };

    explicit UpnpAdapter(std::shared_ptr<SoapClient> soap);

    Protocol protocol() const override;
    ControlResult play(const ControlTarget &target) override;
    ControlResult pause(const ControlTarget &target) override;
    ControlResult stop(const ControlTarget &target) override;
    ControlResult next(const ControlTarget &target) override;
    ControlResult previous(const ControlTarget &target) override;
    ControlResult seek(const ControlTarget &target, const QString &position) override;
    ControlResult setUri(const ControlTarget &target, const QString &uri,
                         const QString &metadata = {}) override;
    ControlResult getVolume(const ControlTarget &target) override;
    ControlResult setVolume(const ControlTarget &target, int level) override;
    ControlResult getMute(const ControlTarget &target) override;
    ControlResult setMute(const ControlTarget &target, bool muted) override;

    static QString seekTarget(const QString &position);
    static QString didlMetadata(const QString &uri);
    // Service type and control path the device advertises, version 1 defaults otherwise
    static std::pair<QString, QString> service(const ControlTarget &target, ServiceKind kind);

private:
    std::shared_ptr<SoapClient> soap;

    ControlResult call(const ControlTarget &target, ServiceKind kind, const QString &resultAction,
                       const QString &soapAction, const std::vector<std::pair<QString, QString>> &args,
                       QMap<QString, QString> *out = nullptr);
};

#endif // UPNPADAPTER_H
