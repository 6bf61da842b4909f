/* Copyright (C) 2023 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef DEVICECACHE_H
#define DEVICECACHE_H

#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <functional>
#include <optional>
#include <vector>

struct Device;

/*
 * Persistent device cache in a SQLite file. Every call opens its own
 * short-lived connection, so instances can be used from any worker thread.
 */
class DeviceCache
{
public:
    // Unix time in seconds
    using Clock = std::function<double()>;

    struct Record
    {
        QString ip;
        int port = 0;
        double lastSeen = 0.0;
        QJsonObject deviceData;
        bool compressed = false;
    };

    struct Stats
    {
        int totalDevices = 0;
        int validDevices = 0;
        int expiredDevices = 0;
        int compressedEntries = 0;
        qint64 fileSize = 0;
        double ttlHours = 0.0;
        QString path;
    };

    static const int compressionThreshold = 1024;

    DeviceCache(const QString &path, double ttlHours = 24.0, int maxEntries = 10000,
                Clock clock = {});

    bool ok() const;
    QString path() const;
    double ttlHours() const;

    bool upsert(const QString &ip, int port, const QJsonObject &deviceData);
    bool upsert(const Device &device);
    std::optional<Record> get(const QString &ip) const;
    std::vector<Record> list(std::optional<double> maxAgeHours = std::nullopt) const;
    bool remove(const QString &ip);
    int cleanupExpired();
    bool clear();
    std::optional<Stats> stats() const;
    bool setMetadata(const QString &key, const QString &value);
    std::optional<QString> metadata(const QString &key) const;

    static QByteArray gzipCompress(const QByteArray &data);
    static std::optional<QByteArray> gzipDecompress(const QByteArray &data);

private:
    QString m_path;
    double m_ttlHours;
    int m_maxEntries;
    Clock m_clock;
    bool m_ok = false;

    bool init();
    double now() const;
    double cutoff(double hours) const;
    void pruneExcess();
};

#endif // DEVICECACHE_H
