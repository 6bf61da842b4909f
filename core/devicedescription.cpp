/* Copyright (C) 2017 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "devicedescription.h"

#include <QDebug>
#include <QJsonArray>
#include <QSet>
#include <QXmlStreamWriter>

#include "httpclient.h"
#include "xmltools.h"

QJsonObject Service::toJson() const
{
    return {
        {"serviceType", serviceType},
        {"serviceId", serviceId},
        {"controlURL", controlURL},
        {"eventSubURL", eventSubURL},
        {"SCPDURL", scpdURL}
    };
}

Service Service::fromJson(const QJsonObject &json)
{
    Service s;
    s.serviceType = json.value("serviceType").toString();
    s.serviceId = json.value("serviceId").toString();
    s.controlURL = json.value("controlURL").toString();
    s.eventSubURL = json.value("eventSubURL").toString();
    s.scpdURL = json.value("SCPDURL").toString();
    return s;
}

QStringList Device::serviceTypes() const
{
    QStringList types;
    for (const auto &s : services)
        types.push_back(s.serviceType);
    return types;
}

const Service* Device::serviceByType(const QString &fragment) const
{
    for (const auto &s : services) {
        if (s.serviceType.contains(fragment, Qt::CaseInsensitive))
            return &s;
    }
    return nullptr;
}

QString Device::baseUrl() const
{
    if (!urlBase.isEmpty())
        return urlBase.endsWith('/') ? urlBase.left(urlBase.size() - 1) : urlBase;
    return QStringLiteral("%1://%2:%3").arg(useTLS ? "https" : "http", ip).arg(port);
}

QUrl Device::resolveUrl(const QString &path) const
{
    QUrl url{path};
    if (url.isRelative()) {
        auto base = QUrl{baseUrl() + "/"};
        return base.resolved(QUrl{path.startsWith('/') ? path : "/" + path});
    }
    return url;
}

QString Device::endpoint() const
{
    return QStringLiteral("%1:%2").arg(ip).arg(port);
}

static QJsonObject iconToJson(const Icon &icon)
{
    return {
        {"mimetype", icon.mimeType},
        {"width", icon.width},
        {"height", icon.height},
        {"depth", icon.depth},
        {"url", icon.url}
    };
}

QJsonObject Device::toJson() const
{
    QJsonArray iconArray;
    for (const auto &icon : icons)
        iconArray.append(iconToJson(icon));

    QJsonArray serviceArray;
    for (const auto &s : services)
        serviceArray.append(s.toJson());

    QJsonArray deviceArray;
    for (const auto &d : embeddedDevices)
        deviceArray.append(d.toJson());

    return {
        {"ip", ip},
        {"port", port},
        {"useTLS", useTLS},
        {"location", location},
        {"urlBase", urlBase},
        {"deviceType", deviceType},
        {"friendlyName", friendlyName},
        {"manufacturer", manufacturer},
        {"manufacturerURL", manufacturerURL},
        {"modelDescription", modelDescription},
        {"modelName", modelName},
        {"modelNumber", modelNumber},
        {"modelURL", modelURL},
        {"serialNumber", serialNumber},
        {"UDN", udn},
        {"presentationURL", presentationURL},
        {"server", ssdpServerHeader},
        {"st", ssdpSt},
        {"usn", ssdpUsn},
        {"discovery_method", discoveryMethod},
        {"icons", iconArray},
        {"services", serviceArray},
        {"devices", deviceArray}
    };
}

static Device deviceFromJson(const QJsonObject &json)
{
    Device d;
    d.ip = json.value("ip").toString();
    d.port = json.value("port").toInt();
    d.useTLS = json.value("useTLS").toBool();
    d.location = json.value("location").toString();
    d.urlBase = json.value("urlBase").toString();
    d.deviceType = json.value("deviceType").toString();
    d.friendlyName = json.value("friendlyName").toString();
    d.manufacturer = json.value("manufacturer").toString();
    d.manufacturerURL = json.value("manufacturerURL").toString();
    d.modelDescription = json.value("modelDescription").toString();
    d.modelName = json.value("modelName").toString();
    d.modelNumber = json.value("modelNumber").toString();
    d.modelURL = json.value("modelURL").toString();
    d.serialNumber = json.value("serialNumber").toString();
    d.udn = json.value("UDN").toString();
    d.presentationURL = json.value("presentationURL").toString();
    d.ssdpServerHeader = json.value("server").toString();
    d.ssdpSt = json.value("st").toString();
    d.ssdpUsn = json.value("usn").toString();
    d.discoveryMethod = json.value("discovery_method").toString();

    for (const auto &v : json.value("icons").toArray()) {
        auto o = v.toObject();
        Icon icon;
        icon.mimeType = o.value("mimetype").toString();
        icon.width = o.value("width").toInt();
        icon.height = o.value("height").toInt();
        icon.depth = o.value("depth").toInt();
        icon.url = o.value("url").toString();
        d.icons.push_back(icon);
    }

    for (const auto &v : json.value("services").toArray())
        d.services.push_back(Service::fromJson(v.toObject()));

    for (const auto &v : json.value("devices").toArray())
        d.embeddedDevices.push_back(deviceFromJson(v.toObject()));

    return d;
}

std::optional<Device> Device::fromJson(const QJsonObject &json)
{
    auto d = deviceFromJson(json);
    if (d.ip.isEmpty()) {
        qWarning() << "Device record without ip";
        return std::nullopt;
    }
    return d;
}

namespace description {

static bool looksLikeDevice(const XmlNode &node)
{
    static const QStringList markers{"friendlyName", "manufacturer", "modelName", "deviceType"};
    for (const auto &m : markers) {
        if (node.child(m))
            return true;
    }
    return false;
}

static const XmlNode* findDeviceLike(const XmlNode &node)
{
    if (looksLikeDevice(node))
        return &node;
    for (const auto &c : node.children) {
        if (auto n = findDeviceLike(c))
            return n;
    }
    return nullptr;
}

const XmlNode* findDeviceElement(const XmlNode &root)
{
    if (auto d = root.child("device"))
        return d;
    if (auto d = root.find("device"))
        return d;
    return findDeviceLike(root);
}

static void parseDevice(const XmlNode &node, Device *device)
{
    device->deviceType = node.childText("deviceType");
    device->friendlyName = node.childText("friendlyName");
    device->manufacturer = node.childText("manufacturer");
    device->manufacturerURL = node.childText("manufacturerURL");
    device->modelDescription = node.childText("modelDescription");
    device->modelName = node.childText("modelName");
    device->modelNumber = node.childText("modelNumber");
    device->modelURL = node.childText("modelURL");
    device->serialNumber = node.childText("serialNumber");
    device->udn = node.childText("UDN");
    device->presentationURL = node.childText("presentationURL");

    if (auto iconList = node.child("iconList")) {
        for (auto i : iconList->childrenNamed("icon")) {
            Icon icon;
            icon.mimeType = i->childText("mimetype");
            icon.width = i->childText("width").toInt();
            icon.height = i->childText("height").toInt();
            icon.depth = i->childText("depth").toInt();
            icon.url = i->childText("url");
            device->icons.push_back(icon);
        }
    }

    if (auto serviceList = node.child("serviceList")) {
        for (auto s : serviceList->childrenNamed("service")) {
            Service service;
            service.serviceType = s->childText("serviceType");
            service.serviceId = s->childText("serviceId");
            service.controlURL = s->childText("controlURL");
            service.eventSubURL = s->childText("eventSubURL");
            service.scpdURL = s->childText("SCPDURL");
            device->services.push_back(service);
        }
    }

    if (auto deviceList = node.child("deviceList")) {
        for (auto d : deviceList->childrenNamed("device")) {
            Device embedded;
            embedded.ip = device->ip;
            embedded.port = device->port;
            embedded.useTLS = device->useTLS;
            embedded.location = device->location;
            embedded.urlBase = device->urlBase;
            parseDevice(*d, &embedded);
            device->embeddedDevices.push_back(std::move(embedded));
        }
    }
}

static void flattenServices(const Device &device, QSet<QString> *seen, std::vector<Service> *out)
{
    for (const auto &s : device.services) {
        auto key = s.serviceType + '|' + s.controlURL;
        if (seen->contains(key))
            continue;
        seen->insert(key);
        out->push_back(s);
    }
    for (const auto &d : device.embeddedDevices)
        flattenServices(d, seen, out);
}

std::optional<Device> parseDeviceDescription(const QByteArray &data, const QUrl &location,
                                             QString *error)
{
    QString parseError;
    auto root = xmltools::parseWithFallbacks(data, &parseError);
    if (!root) {
        if (error)
            *error = parseError;
        return std::nullopt;
    }

    auto deviceNode = findDeviceElement(*root);
    if (!deviceNode) {
        qWarning() << "No device element in description:" << location;
        if (error)
            *error = "No device element found in description";
        return std::nullopt;
    }

    Device device;
    device.location = location.toString();
    device.urlBase = root->childText("URLBase");

    QUrl addressUrl = location;
    if (addressUrl.host().isEmpty() && !device.urlBase.isEmpty())
        addressUrl = QUrl{device.urlBase};

    device.ip = addressUrl.host();
    device.useTLS = addressUrl.scheme() == "https";
    device.port = addressUrl.port(device.useTLS ? 443 : 80);

    if (device.ip.isEmpty()) {
        if (error)
            *error = "Device address is unknown";
        return std::nullopt;
    }

    if (device.urlBase.isEmpty()) {
        device.urlBase = QStringLiteral("%1://%2:%3").arg(addressUrl.scheme().isEmpty() ?
                                                           QStringLiteral("http") : addressUrl.scheme(),
                                                           device.ip).arg(device.port);
    }

    parseDevice(*deviceNode, &device);

    std::vector<Service> flat;
    QSet<QString> seen;
    flattenServices(device, &seen, &flat);
    device.services = std::move(flat);

    return device;
}

std::optional<Device> fetchDeviceDescription(const QUrl &location, int timeout, QString *error)
{
    HttpClient client;
    client.setTimeout(timeout);

    auto reply = client.get(location);
    if (!reply.ok()) {
        if (error)
            *error = reply.transportError() ? reply.errorString :
                                              QStringLiteral("HTTP %1").arg(reply.status);
        return std::nullopt;
    }

    return parseDeviceDescription(reply.data, location, error);
}

QByteArray toDescriptionXml(const Device &device)
{
    QByteArray data;
    QXmlStreamWriter w{&data};
    w.writeStartDocument();
    w.writeStartElement("root");
    w.writeDefaultNamespace("urn:schemas-upnp-org:device-1-0");
    w.writeStartElement("specVersion");
    w.writeTextElement("major", "1");
    w.writeTextElement("minor", "0");
    w.writeEndElement();
    if (!device.urlBase.isEmpty())
        w.writeTextElement("URLBase", device.urlBase);

    w.writeStartElement("device");
    w.writeTextElement("deviceType", device.deviceType);
    w.writeTextElement("friendlyName", device.friendlyName);
    w.writeTextElement("manufacturer", device.manufacturer);
    w.writeTextElement("manufacturerURL", device.manufacturerURL);
    w.writeTextElement("modelDescription", device.modelDescription);
    w.writeTextElement("modelName", device.modelName);
    w.writeTextElement("modelNumber", device.modelNumber);
    w.writeTextElement("modelURL", device.modelURL);
    w.writeTextElement("serialNumber", device.serialNumber);
    w.writeTextElement("UDN", device.udn);
    w.writeTextElement("presentationURL", device.presentationURL);

    if (!device.icons.empty()) {
        w.writeStartElement("iconList");
        for (const auto &icon : device.icons) {
            w.writeStartElement("icon");
            w.writeTextElement("mimetype", icon.mimeType);
            w.writeTextElement("width", QString::number(icon.width));
            w.writeTextElement("height", QString::number(icon.height));
            w.writeTextElement("depth", QString::number(icon.depth));
            w.writeTextElement("url", icon.url);
            w.writeEndElement();
        }
        w.writeEndElement();
    }

    w.writeStartElement("serviceList");
    for (const auto &s : device.services) {
        w.writeStartElement("service");
        w.writeTextElement("serviceType", s.serviceType);
        w.writeTextElement("serviceId", s.serviceId);
        w.writeTextElement("controlURL", s.controlURL);
        w.writeTextElement("eventSubURL", s.eventSubURL);
        w.writeTextElement("SCPDURL", s.scpdURL);
        w.writeEndElement();
    }
    w.writeEndElement();

    w.writeEndElement(); // device
    w.writeEndElement(); // root
    w.writeEndDocument();

    return data;
}
}
