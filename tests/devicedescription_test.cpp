/* Copyright (C) 2023 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "devicedescription.h"

#include <QByteArray>
#include <QString>
#include <QUrl>
#include <catch2/catch_test_macros.hpp>

static const auto sonosDescription = QByteArrayLiteral(
    "<?xml version=\"1.0\" encoding=\"utf-8\" ?>"
    "<root xmlns=\"urn:schemas-upnp-org:device-1-0\">"
    "<specVersion><major>1</major><minor>0</minor></specVersion>"
    "<device>"
    "<deviceType>urn:schemas-upnp-org:device:ZonePlayer:1</deviceType>"
    "<friendlyName>192.168.1.50 - Sonos One</friendlyName>"
    "<manufacturer>Sonos, Inc.</manufacturer>"
    "<modelName>Sonos One</modelName>"
    "<modelNumber>S18</modelNumber>"
    "<serialNumber>00-0E-58-AA-BB-CC:1</serialNumber>"
    "<UDN>uuid:RINCON_000E58AABBCC01400</UDN>"
    "<iconList><icon><mimetype>image/png</mimetype><width>48</width><height>48</height>"
    "<depth>24</depth><url>/img/icon-S18.png</url></icon></iconList>"
    "<serviceList>"
    "<service><serviceType>urn:schemas-upnp-org:service:AlarmClock:1</serviceType>"
    "<serviceId>urn:upnp-org:serviceId:AlarmClock</serviceId>"
    "<controlURL>/AlarmClock/Control</controlURL><eventSubURL>/AlarmClock/Event</eventSubURL>"
    "<SCPDURL>/xml/AlarmClock1.xml</SCPDURL></service>"
    "</serviceList>"
    "<deviceList><device>"
    "<deviceType>urn:schemas-upnp-org:device:MediaRenderer:1</deviceType>"
    "<friendlyName>Sonos One Media Renderer</friendlyName>"
    "<UDN>uuid:RINCON_000E58AABBCC01400_MR</UDN>"
    "<serviceList>"
    "<service><serviceType>urn:schemas-upnp-org:service:RenderingControl:1</serviceType>"
    "<serviceId>urn:upnp-org:serviceId:RenderingControl</serviceId>"
    "<controlURL>/MediaRenderer/RenderingControl/Control</controlURL>"
    "<eventSubURL>/MediaRenderer/RenderingControl/Event</eventSubURL>"
    "<SCPDURL>/xml/RenderingControl1.xml</SCPDURL></service>"
    "<service><serviceType>urn:schemas-upnp-org:service:AVTransport:1</serviceType>"
    "<serviceId>urn:upnp-org:serviceId:AVTransport</serviceId>"
    "<controlURL>/MediaRenderer/AVTransport/Control</controlURL>"
    "<eventSubURL>/MediaRenderer/AVTransport/Event</eventSubURL>"
    "<SCPDURL>/xml/AVTransport1.xml</SCPDURL></service>"
    "</serviceList>"
    "</device></deviceList>"
    "</device>"
    "</root>");

static const QUrl sonosLocation{"http://192.168.1.50:1400/xml/device_description.xml"};

TEST_CASE("Device description parsing", "[description]") {
    QString error;
    auto device = description::parseDeviceDescription(sonosDescription, sonosLocation, &error);
    REQUIRE(device);

    SECTION("root fields") {
        REQUIRE(device->ip == QStringLiteral("192.168.1.50"));
        REQUIRE(device->port == 1400);
        REQUIRE(!device->useTLS);
        REQUIRE(device->urlBase == QStringLiteral("http://192.168.1.50:1400"));
        REQUIRE(device->manufacturer == QStringLiteral("Sonos, Inc."));
        REQUIRE(device->modelName == QStringLiteral("Sonos One"));
        REQUIRE(device->udn == QStringLiteral("uuid:RINCON_000E58AABBCC01400"));
        REQUIRE(device->icons.size() == 1);
        REQUIRE(device->icons.front().width == 48);
    }

    SECTION("embedded services are flattened") {
        REQUIRE(device->embeddedDevices.size() == 1);
        REQUIRE(device->services.size() == 3);

        auto avt = device->serviceByType(":AVTransport:");
        REQUIRE(avt != nullptr);
        REQUIRE(avt->controlURL == QStringLiteral("/MediaRenderer/AVTransport/Control"));
        REQUIRE(device->serviceTypes().contains(
                    QStringLiteral("urn:schemas-upnp-org:service:RenderingControl:1")));
    }

    SECTION("url resolving") {
        REQUIRE(device->resolveUrl("/xml/AVTransport1.xml").toString() ==
                QStringLiteral("http://192.168.1.50:1400/xml/AVTransport1.xml"));
        REQUIRE(device->endpoint() == QStringLiteral("192.168.1.50:1400"));
    }

    SECTION("description regenerated from parsed device parses to the same device") {
        auto again = description::parseDeviceDescription(description::toDescriptionXml(*device),
                                                         sonosLocation);
        REQUIRE(again);
        REQUIRE(again->friendlyName == device->friendlyName);
        REQUIRE(again->udn == device->udn);
        REQUIRE(again->urlBase == device->urlBase);
        REQUIRE(again->services.size() == device->services.size());
        for (size_t i = 0; i < device->services.size(); ++i) {
            REQUIRE(again->services[i].serviceType == device->services[i].serviceType);
            REQUIRE(again->services[i].controlURL == device->services[i].controlURL);
            REQUIRE(again->services[i].scpdURL == device->services[i].scpdURL);
        }
    }

    SECTION("json") {
        auto copy = Device::fromJson(device->toJson());
        REQUIRE(copy);
        REQUIRE(copy->ip == device->ip);
        REQUIRE(copy->services.size() == device->services.size());
        REQUIRE(copy->embeddedDevices.size() == 1);
        REQUIRE(copy->embeddedDevices.front().udn ==
                QStringLiteral("uuid:RINCON_000E58AABBCC01400_MR"));
        REQUIRE(!Device::fromJson(QJsonObject{{"port", 80}}));
    }
}

TEST_CASE("Device description edge cases", "[description]") {
    SECTION("no device element") {
        QString error;
        auto device = description::parseDeviceDescription(
                    QByteArrayLiteral("<root><specVersion><major>1</major></specVersion></root>"),
                    sonosLocation, &error);
        REQUIRE(!device);
        REQUIRE(error == QStringLiteral("No device element found in description"));
    }

    SECTION("device-like element without device tag") {
        auto device = description::parseDeviceDescription(
                    QByteArrayLiteral("<root><info><friendlyName>TV</friendlyName>"
                                      "<manufacturer>LG</manufacturer></info></root>"),
                    QUrl{"http://10.0.0.7:8080/desc.xml"});
        REQUIRE(device);
        REQUIRE(device->friendlyName == QStringLiteral("TV"));
        REQUIRE(device->port == 8080);
        REQUIRE(device->services.empty());
    }

    SECTION("url base decides address without location") {
        auto device = description::parseDeviceDescription(
                    QByteArrayLiteral("<root><URLBase>https://10.0.0.9:1443/</URLBase>"
                                      "<device><friendlyName>X</friendlyName></device></root>"));
        REQUIRE(device);
        REQUIRE(device->ip == QStringLiteral("10.0.0.9"));
        REQUIRE(device->port == 1443);
        REQUIRE(device->useTLS);
        REQUIRE(device->baseUrl() == QStringLiteral("https://10.0.0.9:1443"));
    }

    SECTION("malformed entity") {
        auto device = description::parseDeviceDescription(
                    QByteArrayLiteral("<root><device><friendlyName>Tom & Jerry</friendlyName>"
                                      "</device></root>"), sonosLocation);
        REQUIRE(device);
        REQUIRE(device->friendlyName == QStringLiteral("Tom & Jerry"));
    }
}
