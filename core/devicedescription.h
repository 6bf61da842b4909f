/* Copyright (C) 2017 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef DEVICEDESCRIPTION_H
#define DEVICEDESCRIPTION_H

#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <optional>
#include <vector>

class XmlNode;

struct Service
{
    QString serviceType;
    QString serviceId;
    QString controlURL;
    QString eventSubURL;
    QString scpdURL;

    QJsonObject toJson() const;
    static Service fromJson(const QJsonObject &json);
};

struct Icon
{
    QString mimeType;
    int width = 0;
    int height = 0;
    int depth = 0;
    QString url;
};

struct Device
{
    QString ip;
    int port = 0;
    bool useTLS = false;
    QString location;
    QString urlBase;
    QString deviceType;
    QString friendlyName;
    QString manufacturer;
    QString manufacturerURL;
    QString modelDescription;
    QString modelName;
    QString modelNumber;
    QString modelURL;
    QString serialNumber;
    QString udn;
    QString presentationURL;
    QString ssdpServerHeader;
    QString ssdpSt;
    QString ssdpUsn;
    QString discoveryMethod;
    std::vector<Icon> icons;
    // Root services followed by the services of all embedded devices
    std::vector<Service> services;
    std::vector<Device> embeddedDevices;

    QStringList serviceTypes() const;
    // Match is a case-insensitive substring of the service type
    const Service* serviceByType(const QString &fragment) const;
    QString baseUrl() const;
    QUrl resolveUrl(const QString &path) const;
    QString endpoint() const;

    QJsonObject toJson() const;
    static std::optional<Device> fromJson(const QJsonObject &json);
};

namespace description
{
const XmlNode* findDeviceElement(const XmlNode &root);
std::optional<Device> parseDeviceDescription(const QByteArray &data, const QUrl &location = {},
                                             QString *error = nullptr);
std::optional<Device> fetchDeviceDescription(const QUrl &location, int timeout,
                                             QString *error = nullptr);
// Description document of a device with its effective (flattened) service set
QByteArray toDescriptionXml(const Device &device);
}

#endif // DEVICEDESCRIPTION_H
