/* Copyright (C) 2017-2021 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef DISCOVERY_H
#define DISCOVERY_H

#include <QByteArray>
#include <QDeadlineTimer>
#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "devicedescription.h"

class DeviceCache;

struct SsdpResponse
{
    QString address;
    QString location;
    QString server;
    QString st;
    QString usn;
    // Header names are upper-cased
    QMap<QString, QString> headers;
};

struct DiscoveryOptions
{
    int ssdpTimeout = 5000; // ms
    int httpTimeout = 10000; // ms
    int probeTimeout = 1000; // ms, TCP connect during network scan
    // Deadline of the whole network scan in ms, zero means no deadline
    int scanTimeout = 0;
    int concurrency = 50;
    // Zero means no limit
    int maxDevices = 0;
    bool ssdp = true;
    QStringList searchTargets;
    // CIDR range to scan in addition to SSDP, e.g. 192.168.1.0/24,
    // "auto" scans the subnet of the first active interface
    QString network;
    QList<int> ports;
};

class Discovery
{
public:
    static const QString multicastAddress;
    static const quint16 multicastPort = 1900;
    static const QStringList defaultSearchTargets;
    static const QList<int> mediaPorts;
    static const QStringList descriptionPaths;
    // Largest range accepted by expandNetworkRange (a /16)
    static constexpr int maxScanHosts = 65534;

    using PortProbe = std::function<bool(const QString &host, int port, int timeout)>;
    using DescriptionFetch = std::function<std::optional<Device>(const QUrl &location,
                                                                 int timeout, QString *error)>;

    explicit Discovery(std::shared_ptr<DeviceCache> cache = {});

    // Replaces the TCP port check and the description download
    void setPortProbe(PortProbe probe);
    void setDescriptionFetch(DescriptionFetch fetch);

    static QByteArray mSearchRequest(const QString &searchTarget, int mx = 3);
    static std::optional<SsdpResponse> parseSsdpResponse(const QByteArray &datagram,
                                                         const QString &address = {});
    static std::vector<SsdpResponse> uniqueLocations(const std::vector<SsdpResponse> &responses);
    // Time left for a socket wait, never negative
    static int remainingWait(qint64 timeout, qint64 elapsed);

    // SSDP only, descriptions are not fetched
    std::vector<SsdpResponse> ssdpSearch(int timeout,
                                         const QStringList &searchTargets = {}) const;
    std::vector<Device> fetchDescriptions(const std::vector<SsdpResponse> &responses,
                                          int httpTimeout, int concurrency) const;
    std::vector<Device> scanNetwork(const QString &cidr, const QList<int> &ports,
                                    int probeTimeout, int httpTimeout, int concurrency,
                                    int scanTimeout = 0) const;
    // SSDP plus optional network scan, merged, deduplicated and written to the cache
    std::vector<Device> discover(const DiscoveryOptions &options) const;

    static QStringList expandNetworkRange(const QString &cidr);
    static QString localNetwork();
    static bool isPortOpen(const QString &host, int port, int timeout);
    static QString deviceIdentifier(const Device &device);
    static std::vector<Device> mergeDevices(const std::vector<Device> &ssdpDevices,
                                            const std::vector<Device> &scannedDevices);
    static bool isMediaDevice(const Device &device);
    static std::vector<Device> filterMediaDevices(const std::vector<Device> &devices);

private:
    std::shared_ptr<DeviceCache> cache;
    PortProbe portProbe;
    DescriptionFetch descriptionFetch;

    // One device per open port that serves a description
    std::vector<Device> probeHost(const QString &host, const QList<int> &ports,
                                  int probeTimeout, int httpTimeout,
                                  const QDeadlineTimer &deadline) const;
};

#endif // DISCOVERY_H
