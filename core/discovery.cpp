/* Copyright (C) 2017-2021 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <QDebug>
#include <QDateTime>
#include <QElapsedTimer>
#include <QHostAddress>
#include <QNetworkDatagram>
#include <QNetworkInterface>
#include <QRegExp>
#include <QSet>
#include <QTcpSocket>
#include <QUdpSocket>
#include <QUrl>
#include <algorithm>
#include <iterator>

#include "discovery.h"
#include "devicecache.h"
#include "info.h"
#include "taskexecutor.h"

const QString Discovery::multicastAddress{"239.255.255.250"};

const QStringList Discovery::defaultSearchTargets{
    "upnp:rootdevice",
    "urn:schemas-upnp-org:device:MediaRenderer:1",
    "urn:schemas-upnp-org:device:MediaServer:1",
    "urn:dial-multiscreen-org:service:dial:1",
    "ssdp:all"
};

const QList<int> Discovery::mediaPorts{
    80, 443, 1400, 1443, 7000, 8008, 8009, 8060, 8080, 8090,
    8200, 8443, 9000, 9080, 9090, 49152, 49200, 55001, 56001
};

const QStringList Discovery::descriptionPaths{
    "/xml/device_description.xml",
    "/description.xml",
    "/dmr/description.xml",
    "/upnp/description.xml"
};

Discovery::Discovery(std::shared_ptr<DeviceCache> cache) :
    cache(std::move(cache)),
    portProbe(isPortOpen),
    descriptionFetch(description::fetchDeviceDescription)
{
}

void Discovery::setPortProbe(PortProbe probe)
{
    portProbe = std::move(probe);
}

void Discovery::setDescriptionFetch(DescriptionFetch fetch)
{
    descriptionFetch = std::move(fetch);
}

QByteArray Discovery::mSearchRequest(const QString &searchTarget, int mx)
{
    QByteArray req;
    req.append("M-SEARCH * HTTP/1.1\r\n");
    req.append("HOST: " + multicastAddress.toUtf8() + ":" +
               QByteArray::number(multicastPort) + "\r\n");
    req.append("MAN: \"ssdp:discover\"\r\n");
    req.append("MX: " + QByteArray::number(mx) + "\r\n");
    req.append("ST: " + searchTarget.toUtf8() + "\r\n");
    req.append("USER-AGENT: " + QByteArray(Upnpc::USER_AGENT) + "\r\n");
    req.append("\r\n");
    return req;
}

std::optional<SsdpResponse> Discovery::parseSsdpResponse(const QByteArray &datagram,
                                                         const QString &address)
{
    const auto lines = QString::fromUtf8(datagram).split(QRegExp("\r?\n"));
    if (lines.isEmpty())
        return std::nullopt;

    // Search responses and NOTIFY announcements both carry LOCATION
    const auto status = lines.first().trimmed();
    if (!status.startsWith("HTTP/", Qt::CaseInsensitive) &&
        !status.startsWith("NOTIFY", Qt::CaseInsensitive))
        return std::nullopt;

    SsdpResponse resp;
    resp.address = address;

    for (int i = 1; i < lines.size(); ++i) {
        const auto &line = lines.at(i);
        int colon = line.indexOf(':');
        if (colon <= 0)
            continue;
        resp.headers.insert(line.left(colon).trimmed().toUpper(),
                            line.mid(colon + 1).trimmed());
    }

    resp.location = resp.headers.value("LOCATION");
    if (resp.location.isEmpty())
        return std::nullopt;

    resp.server = resp.headers.value("SERVER");
    resp.st = resp.headers.value("ST", resp.headers.value("NT"));
    resp.usn = resp.headers.value("USN");

    if (resp.address.isEmpty())
        resp.address = QUrl{resp.location}.host();

    return resp;
}

std::vector<SsdpResponse> Discovery::uniqueLocations(const std::vector<SsdpResponse> &responses)
{
    std::vector<SsdpResponse> unique;
    QSet<QString> seen;
    for (const auto &resp : responses) {
        if (seen.contains(resp.location))
            continue;
        seen.insert(resp.location);
        unique.push_back(resp);
    }
    return unique;
}

int Discovery::remainingWait(qint64 timeout, qint64 elapsed)
{
    return static_cast<int>(std::max<qint64>(0, timeout - elapsed));
}

std::vector<SsdpResponse> Discovery::ssdpSearch(int timeout,
                                                const QStringList &searchTargets) const
{
    std::vector<SsdpResponse> responses;

    QUdpSocket socket;
    if (!socket.bind(QHostAddress{QHostAddress::AnyIPv4}, 0)) {
        qWarning() << "cannot bind ssdp socket:" << socket.errorString();
        return responses;
    }
    socket.setSocketOption(QAbstractSocket::MulticastTtlOption, 2);

    const auto &targets = searchTargets.isEmpty() ? defaultSearchTargets : searchTargets;
    const int mx = std::max(1, std::min(3, timeout / 1000));
    const QHostAddress group{multicastAddress};

    for (const auto &st : targets) {
        if (socket.writeDatagram(mSearchRequest(st, mx), group, multicastPort) < 0)
            qWarning() << "cannot send m-search for" << st << ":" << socket.errorString();
    }

    QElapsedTimer timer;
    timer.start();

    while (true) {
        // Negative wait means no timeout in Qt
        const int remaining = remainingWait(timeout, timer.elapsed());
        if (remaining <= 0)
            break;
        if (!socket.waitForReadyRead(remaining))
            continue;

        while (socket.hasPendingDatagrams()) {
            auto datagram = socket.receiveDatagram();
            auto resp = parseSsdpResponse(datagram.data(),
                                          datagram.senderAddress().toString());
            if (resp) {
                qDebug() << "ssdp response:" << resp->address << resp->location;
                responses.push_back(std::move(*resp));
            }
        }
    }

    qDebug() << "ssdp search done:" << responses.size() << "responses";

    return responses;
}

std::vector<Device> Discovery::fetchDescriptions(const std::vector<SsdpResponse> &responses,
                                                 int httpTimeout, int concurrency) const
{
    auto unique = uniqueLocations(responses);

    TaskExecutor executor{nullptr, concurrency};
    std::function<std::optional<Device>(const SsdpResponse&)> fetch =
            [this, httpTimeout](const SsdpResponse &resp) -> std::optional<Device> {
        QString error;
        auto device = descriptionFetch(QUrl{resp.location}, httpTimeout, &error);
        if (!device) {
            qDebug() << "description fetch failed:" << resp.location << error;
            return std::nullopt;
        }
        device->ssdpServerHeader = resp.server;
        device->ssdpSt = resp.st;
        device->ssdpUsn = resp.usn;
        device->discoveryMethod = QStringLiteral("ssdp");
        return device;
    };

    std::vector<Device> devices;
    for (auto &device : executor.map(unique, fetch)) {
        if (device)
            devices.push_back(std::move(*device));
    }

    // Several ssdp targets of one device point to different locations
    return mergeDevices(devices, {});
}

std::vector<Device> Discovery::probeHost(const QString &host, const QList<int> &ports,
                                         int probeTimeout, int httpTimeout,
                                         const QDeadlineTimer &deadline) const
{
    std::vector<Device> devices;

    for (int port : ports) {
        if (deadline.hasExpired())
            break;
        if (!portProbe(host, port, probeTimeout))
            continue;

        const QString scheme = port == 443 || port == 1443 || port == 8443 ?
                    QStringLiteral("https") : QStringLiteral("http");

        for (const auto &path : descriptionPaths) {
            QUrl location{QStringLiteral("%1://%2:%3%4").arg(scheme, host).arg(port).arg(path)};
            auto device = descriptionFetch(location, httpTimeout, nullptr);
            if (device) {
                qDebug() << "device found by scan:" << location;
                device->discoveryMethod = QStringLiteral("port_scan");
                devices.push_back(std::move(*device));
                break;
            }
        }
    }

    // Probes that finished after the deadline are dropped
    if (deadline.hasExpired()) {
        if (!devices.empty())
            qDebug() << "scan deadline passed, dropping devices of" << host;
        devices.clear();
    }

    return devices;
}

std::vector<Device> Discovery::scanNetwork(const QString &cidr, const QList<int> &ports,
                                           int probeTimeout, int httpTimeout,
                                           int concurrency, int scanTimeout) const
{
    const auto hosts = expandNetworkRange(cidr);
    if (hosts.isEmpty())
        return {};

    const auto &scanPorts = ports.isEmpty() ? mediaPorts : ports;

    qDebug() << "scanning" << hosts.size() << "hosts in" << cidr;

    std::vector<QString> items(hosts.cbegin(), hosts.cend());

    const QDeadlineTimer deadline = scanTimeout > 0 ?
                QDeadlineTimer{scanTimeout} : QDeadlineTimer{QDeadlineTimer::Forever};

    TaskExecutor executor{nullptr, concurrency};
    std::function<std::vector<Device>(const QString&)> probe =
            [&](const QString &host) {
        return probeHost(host, scanPorts, probeTimeout, httpTimeout, deadline);
    };

    std::vector<Device> found;
    for (auto &list : executor.map(items, probe))
        std::move(list.begin(), list.end(), std::back_inserter(found));

    if (deadline.hasExpired())
        qWarning() << "network scan deadline passed:" << cidr;

    // Embedded endpoints of one device answer on several ports
    return mergeDevices({}, found);
}

std::vector<Device> Discovery::discover(const DiscoveryOptions &options) const
{
    std::vector<Device> ssdpDevices;
    std::vector<Device> scannedDevices;

    if (options.ssdp) {
        auto responses = ssdpSearch(options.ssdpTimeout, options.searchTargets);
        ssdpDevices = fetchDescriptions(responses, options.httpTimeout, options.concurrency);
    }

    auto network = options.network == QLatin1String("auto") ? localNetwork() : options.network;
    if (!network.isEmpty()) {
        scannedDevices = scanNetwork(network, options.ports, options.probeTimeout,
                                     options.httpTimeout, options.concurrency,
                                     options.scanTimeout);
    }

    auto devices = mergeDevices(ssdpDevices, scannedDevices);

    if (options.maxDevices > 0 && static_cast<int>(devices.size()) > options.maxDevices)
        devices.resize(static_cast<size_t>(options.maxDevices));

    if (cache && cache->ok()) {
        for (const auto &device : devices) {
            if (!cache->upsert(device))
                qWarning() << "cannot cache device:" << device.endpoint();
        }
        cache->setMetadata(QStringLiteral("last_scan_time"),
                           QString::number(QDateTime::currentSecsSinceEpoch()));
        if (!network.isEmpty())
            cache->setMetadata(QStringLiteral("last_network"), network);
    }

    qDebug() << "discovery done:" << devices.size() << "devices";

    return devices;
}

QStringList Discovery::expandNetworkRange(const QString &cidr)
{
    QStringList hosts;

    auto subnet = QHostAddress::parseSubnet(cidr.trimmed());
    if (subnet.first.isNull() || subnet.first.protocol() != QAbstractSocket::IPv4Protocol) {
        qWarning() << "invalid network range:" << cidr;
        return hosts;
    }

    const int prefix = subnet.second;
    if (prefix < 16) {
        qWarning() << "network range too large, at most /16 is scanned:" << cidr;
        return hosts;
    }

    const quint32 mask = prefix == 0 ? 0 : 0xFFFFFFFFu << (32 - prefix);
    const quint32 network = subnet.first.toIPv4Address() & mask;
    const quint64 size = quint64{1} << (32 - prefix);

    quint64 first = 0;
    quint64 last = size - 1;

    // Network and broadcast addresses are not hosts, /31 and /32 have neither
    if (prefix < 31) {
        first = 1;
        last = size - 2;
    }

    hosts.reserve(static_cast<int>(last - first + 1));
    for (quint64 i = first; i <= last; ++i)
        hosts << QHostAddress{static_cast<quint32>(network + i)}.toString();

    return hosts;
}

QString Discovery::localNetwork()
{
    foreach (const auto &interface, QNetworkInterface::allInterfaces()) {
        if (!interface.flags().testFlag(QNetworkInterface::IsUp) ||
            !interface.flags().testFlag(QNetworkInterface::IsRunning) ||
            interface.flags().testFlag(QNetworkInterface::IsLoopBack))
            continue;

        foreach (const auto &entry, interface.addressEntries()) {
            const auto ip = entry.ip();
            if (ip.protocol() != QAbstractSocket::IPv4Protocol || ip.isLoopback())
                continue;
            int prefix = entry.prefixLength();
            if (prefix < 0 || prefix > 32)
                prefix = 24;
            const quint32 mask = prefix == 0 ? 0 : 0xFFFFFFFFu << (32 - prefix);
            return QStringLiteral("%1/%2")
                    .arg(QHostAddress{ip.toIPv4Address() & mask}.toString())
                    .arg(prefix);
        }
    }

    qWarning() << "no active ipv4 interface";
    return {};
}

bool Discovery::isPortOpen(const QString &host, int port, int timeout)
{
    QTcpSocket socket;
    socket.connectToHost(host, static_cast<quint16>(port));
    bool open = socket.waitForConnected(timeout);
    socket.abort();
    return open;
}

QString Discovery::deviceIdentifier(const Device &device)
{
    auto udn = device.udn.trimmed();
    if (!udn.isEmpty())
        return "udn:" + udn;

    if (!device.ip.isEmpty() && device.port > 0)
        return QStringLiteral("endpoint:%1:%2").arg(device.ip).arg(device.port);

    auto name = device.friendlyName.trimmed();
    auto manufacturer = device.manufacturer.trimmed();
    auto model = device.modelName.trimmed();
    if (!name.isEmpty() || !manufacturer.isEmpty() || !model.isEmpty())
        return QStringLiteral("device:%1:%2:%3").arg(name, manufacturer, model)
                .toLower().replace(' ', '_');

    return "location:" + device.location;
}

std::vector<Device> Discovery::mergeDevices(const std::vector<Device> &ssdpDevices,
                                            const std::vector<Device> &scannedDevices)
{
    std::vector<Device> merged;
    QMap<QString, size_t> index;

    auto add = [&](const Device &device) {
        const auto id = deviceIdentifier(device);
        auto it = index.find(id);
        if (it == index.end()) {
            index.insert(id, merged.size());
            merged.push_back(device);
            return;
        }

        auto &existing = merged[it.value()];
        if (existing.discoveryMethod != QLatin1String("ssdp") &&
            device.discoveryMethod == QLatin1String("ssdp")) {
            existing = device;
            return;
        }

        if (existing.ssdpServerHeader.isEmpty())
            existing.ssdpServerHeader = device.ssdpServerHeader;
        if (existing.ssdpSt.isEmpty())
            existing.ssdpSt = device.ssdpSt;
        if (existing.ssdpUsn.isEmpty())
            existing.ssdpUsn = device.ssdpUsn;
    };

    for (const auto &device : ssdpDevices)
        add(device);
    for (const auto &device : scannedDevices)
        add(device);

    return merged;
}

bool Discovery::isMediaDevice(const Device &device)
{
    static const QStringList keywords{
        "mediarenderer", "mediaserver", "sonos", "roku", "chromecast",
        "samsung", "lg", "sony", "philips", "panasonic", "soundbar",
        "speaker", "tv", "audio", "video", "dlna"
    };

    auto mentions = [](const QString &value) {
        auto lower = value.toLower();
        return std::any_of(keywords.cbegin(), keywords.cend(),
                           [&lower](const QString &k) { return lower.contains(k); });
    };

    auto type = device.deviceType.toLower();
    if (type.contains("mediarenderer") || type.contains("mediaserver"))
        return true;

    if (mentions(device.manufacturer) || mentions(device.modelName) ||
        mentions(device.friendlyName))
        return true;

    return std::any_of(device.services.cbegin(), device.services.cend(),
                       [](const Service &s) {
        auto st = s.serviceType.toLower();
        return st.contains("avtransport") || st.contains("renderingcontrol") ||
               st.contains("connectionmanager");
    });
}

std::vector<Device> Discovery::filterMediaDevices(const std::vector<Device> &devices)
{
    std::vector<Device> media;
    std::copy_if(devices.cbegin(), devices.cend(), std::back_inserter(media), isMediaDevice);
    qDebug() << "media devices:" << media.size() << "of" << devices.size();
    return media;
}
