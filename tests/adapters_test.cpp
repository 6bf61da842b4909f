/* Copyright (C) 2023 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "devicedescription.h"
#include "ecpadapter.h"
#include "profilestore.h"
#include "protocoladapter.h"
#include "samsungwamadapter.h"
#include "soapclient.h"
#include "upnpadapter.h"
#include "xmltools.h"

#include <QString>
#include <QUrl>
#include <QUrlQuery>
#include <catch2/catch_test_macros.hpp>
#include <memory>

static ControlTarget target(const QString &host, int port, Protocol protocol)
{
    ControlTarget t;
    t.host = host;
    t.port = port;
    t.info.protocol = protocol;
    t.info.port = port;
    return t;
}

TEST_CASE("UPnP adapter helpers", "[adapters]") {
    SECTION("seek target") {
        REQUIRE(UpnpAdapter::seekTarget("0") == QStringLiteral("00:00:00"));
        REQUIRE(UpnpAdapter::seekTarget("75") == QStringLiteral("00:01:15"));
        REQUIRE(UpnpAdapter::seekTarget("3725") == QStringLiteral("01:02:05"));
        REQUIRE(UpnpAdapter::seekTarget(" 00:10:00 ") == QStringLiteral("00:10:00"));
    }

    SECTION("didl metadata") {
        auto didl = UpnpAdapter::didlMetadata("http://10.0.0.2:8000/a.mp3?x=1&y=2");
        auto root = xmltools::parseWithFallbacks(didl.toUtf8());
        REQUIRE(root);
        REQUIRE(root->is("DIDL-Lite"));
        auto res = root->find("res");
        REQUIRE(res != nullptr);
        REQUIRE(res->text == QStringLiteral("http://10.0.0.2:8000/a.mp3?x=1&y=2"));
        REQUIRE(res->attribute("protocolInfo") == QStringLiteral("http-get:*:audio/mpeg:*"));
        REQUIRE(root->find("class")->text == QStringLiteral("object.item.audioItem.musicTrack"));
    }

    SECTION("advertised service versions are used") {
        Device device;
        device.ip = "10.0.0.8";
        device.port = 49152;
        Service avt;
        avt.serviceType = "urn:schemas-upnp-org:service:AVTransport:2";
        avt.controlURL = "/upnp/control/avt2";
        Service rc;
        rc.serviceType = "urn:schemas-upnp-org:service:RenderingControl:3";
        rc.controlURL = "/upnp/control/rc3";
        device.services = {avt, rc};

        ControlTarget t;
        t.host = device.ip;
        t.port = device.port;
        t.info = ProfileStore::controlInfo(device, nullptr);

        auto [avtType, avtUrl] = UpnpAdapter::service(t, UpnpAdapter::ServiceKind::AVTransport);
        REQUIRE(avtType == QStringLiteral("urn:schemas-upnp-org:service:AVTransport:2"));
        REQUIRE(avtUrl == QStringLiteral("/upnp/control/avt2"));

        auto [rcType, rcUrl] = UpnpAdapter::service(t, UpnpAdapter::ServiceKind::RenderingControl);
        REQUIRE(rcType == QStringLiteral("urn:schemas-upnp-org:service:RenderingControl:3"));
        REQUIRE(rcUrl == QStringLiteral("/upnp/control/rc3"));
    }

    SECTION("version 1 defaults without a description") {
        auto t = target("10.0.0.8", 1400, Protocol::UPnP);
        auto [avtType, avtUrl] = UpnpAdapter::service(t, UpnpAdapter::ServiceKind::AVTransport);
        REQUIRE(avtType == QLatin1String(UpnpAdapter::avTransportType));
        REQUIRE(avtUrl == QLatin1String(UpnpAdapter::defaultAvTransportUrl));
    }
}

TEST_CASE("Roku ECP adapter", "[adapters]") {
    EcpAdapter adapter{1000, 0};
    auto t = target("10.0.0.4", 8060, Protocol::ECP);

    SECTION("urls") {
        REQUIRE(EcpAdapter::makeUrl(t, "/keypress/Play").toString() ==
                QStringLiteral("http://10.0.0.4:8060/keypress/Play"));
    }

    SECTION("input body") {
        auto body = EcpAdapter::inputBody("http://10.0.0.2:8000/a b.mp3");
        QUrlQuery query{QString::fromUtf8(body)};
        REQUIRE(query.queryItemValue("mediaType") == QStringLiteral("audio"));
        REQUIRE(query.queryItemValue("loop") == QStringLiteral("true"));
        REQUIRE(query.queryItemValue("url", QUrl::FullyDecoded) ==
                QStringLiteral("http://10.0.0.2:8000/a b.mp3"));
    }

    SECTION("unsupported actions") {
        REQUIRE(adapter.next(t).status == ControlResult::Status::NotSupported);
        REQUIRE(adapter.seek(t, "10").status == ControlResult::Status::NotSupported);
        REQUIRE(adapter.setVolume(t, 10).status == ControlResult::Status::NotSupported);
        REQUIRE(adapter.getMute(t).toVariantMap().value("status").toString() ==
                QStringLiteral("not_supported"));
    }
}

TEST_CASE("Samsung WAM adapter", "[adapters]") {
    auto t = target("10.0.0.8", 55001, Protocol::SamsungWAM);

    SECTION("commands") {
        REQUIRE(SamsungWamAdapter::playbackCommand("pause") ==
                QStringLiteral("<n>SetPlaybackControl</n><p type=\"str\" name=\"playback\" val=\"pause\"/>"));
        REQUIRE(SamsungWamAdapter::volumeCommand(30) ==
                QStringLiteral("<n>SetVolume</n><p type=\"dec\" name=\"volume\" val=\"30\"/>"));

        auto cmd = SamsungWamAdapter::urlPlaybackCommand("http://10.0.0.2/a.mp3");
        REQUIRE(cmd.startsWith("<n>SetUrlPlayback</n>"));
        REQUIRE(cmd.contains("<![CDATA[http://10.0.0.2/a.mp3]]>"));
        REQUIRE(cmd.contains("name=\"resume\" val=\"1\""));
    }

    SECTION("command url") {
        auto url = SamsungWamAdapter::commandUrl(t, SamsungWamAdapter::volumeCommand(5));
        REQUIRE(url.host() == QStringLiteral("10.0.0.8"));
        REQUIRE(url.port() == 55001);
        REQUIRE(url.path() == QStringLiteral("/UIC"));
        REQUIRE(QUrlQuery{url}.queryItemValue("cmd", QUrl::FullyDecoded) ==
                SamsungWamAdapter::volumeCommand(5));
    }

    SECTION("play needs set_uri") {
        SamsungWamAdapter adapter{1000};
        auto result = adapter.play(t);
        REQUIRE(result.success());
        REQUIRE(result.values.contains("note"));
    }
}

TEST_CASE("Adapter registry", "[adapters]") {
    auto registry = AdapterRegistry::make_default(std::make_shared<SoapClient>(1000), 1000);
    auto t = target("10.0.0.9", 8008, Protocol::Cast);

    REQUIRE(registry->adapter(Protocol::UPnP)->protocol() == Protocol::UPnP);
    REQUIRE(registry->adapter(Protocol::Generic)->protocol() == Protocol::UPnP);
    REQUIRE(registry->adapter(Protocol::ECP)->protocol() == Protocol::ECP);
    REQUIRE(registry->adapter(Protocol::SamsungWAM)->protocol() == Protocol::SamsungWAM);

    for (auto p : protocol::profileProtocols())
        REQUIRE(registry->adapter(p) != nullptr);

    auto cast = registry->adapter(Protocol::Cast)->play(t);
    REQUIRE(cast.status == ControlResult::Status::NotImplemented);
    REQUIRE(cast.values.value("note").toString() == QStringLiteral("Cast protocol requires WebSocket client"));

    auto heos = registry->adapter(Protocol::HeosApi)->setVolume(t, 10);
    REQUIRE(heos.status == ControlResult::Status::NotImplemented);
    REQUIRE(heos.toVariantMap().value("status").toString() == QStringLiteral("not_implemented"));
}
