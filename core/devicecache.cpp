/* Copyright (C) 2023 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "devicecache.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSqlDatabase>
#include <QSqlError>
#include <QSqlQuery>
#include <QVariant>
#include <atomic>
#include <zlib.h>

#include "devicedescription.h"

namespace {

class Connection
{
public:
    explicit Connection(const QString &path) :
        name{QStringLiteral("upnpc-cache-%1").arg(counter.fetch_add(1))}
    {
        auto db = QSqlDatabase::addDatabase("QSQLITE", name);
        db.setDatabaseName(path);
        db.setConnectOptions("QSQLITE_BUSY_TIMEOUT=5000");
        m_open = db.open();
        if (!m_open)
            qWarning() << "Cannot open cache db:" << path << db.lastError().text();
    }

    ~Connection()
    {
        {
            auto db = QSqlDatabase::database(name, false);
            if (db.isOpen())
                db.close();
        }
        QSqlDatabase::removeDatabase(name);
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    bool open() const { return m_open; }
    QSqlDatabase db() const { return QSqlDatabase::database(name, false); }

private:
    static std::atomic<quint64> counter;
    QString name;
    bool m_open = false;
};

std::atomic<quint64> Connection::counter{0};

bool exec(QSqlQuery &query)
{
    if (!query.exec()) {
        qWarning() << "Cache query failed:" << query.lastQuery() << query.lastError().text();
        return false;
    }
    return true;
}

bool exec(QSqlQuery &query, const QString &sql)
{
    if (!query.exec(sql)) {
        qWarning() << "Cache query failed:" << sql << query.lastError().text();
        return false;
    }
    return true;
}
}

DeviceCache::DeviceCache(const QString &path, double ttlHours, int maxEntries, Clock clock) :
    m_path{path},
    m_ttlHours{ttlHours},
    m_maxEntries{maxEntries},
    m_clock{std::move(clock)}
{
    m_ok = init();
}

bool DeviceCache::ok() const
{
    return m_ok;
}

QString DeviceCache::path() const
{
    return m_path;
}

double DeviceCache::ttlHours() const
{
    return m_ttlHours;
}

double DeviceCache::now() const
{
    if (m_clock)
        return m_clock();
    return double(QDateTime::currentMSecsSinceEpoch()) / 1000.0;
}

double DeviceCache::cutoff(double hours) const
{
    return now() - hours * 3600.0;
}

bool DeviceCache::init()
{
    QFileInfo fi{m_path};
    if (!QDir{}.mkpath(fi.absolutePath())) {
        qWarning() << "Cannot create cache dir:" << fi.absolutePath();
        return false;
    }

    Connection con{m_path};
    if (!con.open())
        return false;

    QSqlQuery query{con.db()};
    if (!exec(query, "CREATE TABLE IF NOT EXISTS devices ("
                     "ip TEXT PRIMARY KEY, "
                     "port INTEGER NOT NULL, "
                     "last_seen REAL NOT NULL, "
                     "device_data BLOB NOT NULL, "
                     "compressed INTEGER DEFAULT 0)"))
        return false;
    if (!exec(query, "CREATE TABLE IF NOT EXISTS cache_metadata ("
                     "key TEXT PRIMARY KEY, "
                     "value TEXT, "
                     "updated REAL)"))
        return false;
    if (!exec(query, "CREATE INDEX IF NOT EXISTS idx_devices_last_seen ON devices(last_seen)"))
        return false;
    if (!exec(query, "CREATE INDEX IF NOT EXISTS idx_devices_port ON devices(port)"))
        return false;

    qDebug() << "Device cache ready:" << m_path;

    return true;
}

QByteArray DeviceCache::gzipCompress(const QByteArray &data)
{
    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        qWarning() << "deflateInit2 failed";
        return {};
    }

    QByteArray out;
    out.resize(int(deflateBound(&zs, uLong(data.size()))) + 32);

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.constData()));
    zs.avail_in = uInt(data.size());
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = uInt(out.size());

    auto ret = deflate(&zs, Z_FINISH);
    deflateEnd(&zs);

    if (ret != Z_STREAM_END) {
        qWarning() << "deflate failed:" << ret;
        return {};
    }

    out.resize(int(zs.total_out));
    return out;
}

std::optional<QByteArray> DeviceCache::gzipDecompress(const QByteArray &data)
{
    z_stream zs{};
    if (inflateInit2(&zs, 15 + 16) != Z_OK) {
        qWarning() << "inflateInit2 failed";
        return std::nullopt;
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.constData()));
    zs.avail_in = uInt(data.size());

    QByteArray out;
    char buf[16384];
    int ret = Z_OK;

    while (ret != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof buf;

        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&zs);
            return std::nullopt;
        }

        out.append(buf, int(sizeof buf - zs.avail_out));

        if (ret == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
            // truncated stream
            inflateEnd(&zs);
            return std::nullopt;
        }
    }

    inflateEnd(&zs);
    return out;
}

bool DeviceCache::upsert(const QString &ip, int port, const QJsonObject &deviceData)
{
    if (ip.isEmpty()) {
        qWarning() << "Cannot cache device without ip";
        return false;
    }

    auto json = QJsonDocument{deviceData}.toJson(QJsonDocument::Compact);
    bool compressed = false;

    if (json.size() > compressionThreshold) {
        auto gz = gzipCompress(json);
        if (!gz.isEmpty()) {
            json = gz;
            compressed = true;
        }
    }

    {
        Connection con{m_path};
        if (!con.open())
            return false;

        QSqlQuery query{con.db()};
        query.prepare("INSERT OR REPLACE INTO devices (ip, port, last_seen, device_data, compressed) "
                      "VALUES (?, ?, ?, ?, ?)");
        query.addBindValue(ip);
        query.addBindValue(port);
        query.addBindValue(now());
        query.addBindValue(json);
        query.addBindValue(compressed ? 1 : 0);

        if (!exec(query))
            return false;
    }

    pruneExcess();

    return true;
}

bool DeviceCache::upsert(const Device &device)
{
    return upsert(device.ip, device.port, device.toJson());
}

static std::optional<DeviceCache::Record> readRecord(const QSqlQuery &query)
{
    DeviceCache::Record record;
    record.ip = query.value(0).toString();
    record.port = query.value(1).toInt();
    record.lastSeen = query.value(2).toDouble();
    record.compressed = query.value(4).toInt() != 0;

    auto data = query.value(3).toByteArray();

    if (record.compressed) {
        auto raw = DeviceCache::gzipDecompress(data);
        if (!raw) {
            qWarning() << "Corrupt cache entry, cannot decompress:" << record.ip;
            return std::nullopt;
        }
        data = *raw;
    }

    QJsonParseError err;
    auto doc = QJsonDocument::fromJson(data, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "Corrupt cache entry, invalid JSON:" << record.ip << err.errorString();
        return std::nullopt;
    }

    record.deviceData = doc.object();
    return record;
}

std::optional<DeviceCache::Record> DeviceCache::get(const QString &ip) const
{
    Connection con{m_path};
    if (!con.open())
        return std::nullopt;

    QSqlQuery query{con.db()};
    query.prepare("SELECT ip, port, last_seen, device_data, compressed FROM devices "
                  "WHERE ip = ? AND last_seen > ?");
    query.addBindValue(ip);
    query.addBindValue(cutoff(m_ttlHours));

    if (!exec(query) || !query.next())
        return std::nullopt;

    return readRecord(query);
}

std::vector<DeviceCache::Record> DeviceCache::list(std::optional<double> maxAgeHours) const
{
    std::vector<Record> records;

    Connection con{m_path};
    if (!con.open())
        return records;

    QSqlQuery query{con.db()};
    query.prepare("SELECT ip, port, last_seen, device_data, compressed FROM devices "
                  "WHERE last_seen > ? ORDER BY last_seen DESC");
    query.addBindValue(cutoff(maxAgeHours ? *maxAgeHours : m_ttlHours));

    if (!exec(query))
        return records;

    while (query.next()) {
        if (auto record = readRecord(query))
            records.push_back(std::move(*record));
    }

    return records;
}

bool DeviceCache::remove(const QString &ip)
{
    Connection con{m_path};
    if (!con.open())
        return false;

    QSqlQuery query{con.db()};
    query.prepare("DELETE FROM devices WHERE ip = ?");
    query.addBindValue(ip);

    return exec(query) && query.numRowsAffected() > 0;
}

int DeviceCache::cleanupExpired()
{
    Connection con{m_path};
    if (!con.open())
        return 0;

    QSqlQuery query{con.db()};
    query.prepare("DELETE FROM devices WHERE last_seen <= ?");
    query.addBindValue(cutoff(m_ttlHours));

    if (!exec(query))
        return 0;

    auto removed = query.numRowsAffected();
    if (removed > 0)
        qDebug() << "Expired cache entries removed:" << removed;

    return removed;
}

bool DeviceCache::clear()
{
    Connection con{m_path};
    if (!con.open())
        return false;

    QSqlQuery query{con.db()};
    return exec(query, "DELETE FROM devices") && exec(query, "DELETE FROM cache_metadata");
}

void DeviceCache::pruneExcess()
{
    if (m_maxEntries <= 0)
        return;

    Connection con{m_path};
    if (!con.open())
        return;

    QSqlQuery query{con.db()};
    query.prepare("DELETE FROM devices WHERE ip NOT IN "
                  "(SELECT ip FROM devices ORDER BY last_seen DESC LIMIT ?)");
    query.addBindValue(m_maxEntries);
    exec(query);
}

std::optional<DeviceCache::Stats> DeviceCache::stats() const
{
    Connection con{m_path};
    if (!con.open())
        return std::nullopt;

    Stats s;
    s.ttlHours = m_ttlHours;
    s.path = m_path;
    s.fileSize = QFileInfo{m_path}.size();

    QSqlQuery query{con.db()};
    query.prepare("SELECT COUNT(*), "
                  "SUM(CASE WHEN last_seen > ? THEN 1 ELSE 0 END), "
                  "SUM(CASE WHEN compressed = 1 THEN 1 ELSE 0 END) FROM devices");
    query.addBindValue(cutoff(m_ttlHours));

    if (!exec(query) || !query.next())
        return std::nullopt;

    s.totalDevices = query.value(0).toInt();
    s.validDevices = query.value(1).toInt();
    s.compressedEntries = query.value(2).toInt();
    s.expiredDevices = s.totalDevices - s.validDevices;

    return s;
}

bool DeviceCache::setMetadata(const QString &key, const QString &value)
{
    Connection con{m_path};
    if (!con.open())
        return false;

    QSqlQuery query{con.db()};
    query.prepare("INSERT OR REPLACE INTO cache_metadata (key, value, updated) VALUES (?, ?, ?)");
    query.addBindValue(key);
    query.addBindValue(value);
    query.addBindValue(now());

    return exec(query);
}

std::optional<QString> DeviceCache::metadata(const QString &key) const
{
    Connection con{m_path};
    if (!con.open())
        return std::nullopt;

    QSqlQuery query{con.db()};
    query.prepare("SELECT value FROM cache_metadata WHERE key = ?");
    query.addBindValue(key);

    if (!exec(query) || !query.next())
        return std::nullopt;

    return query.value(0).toString();
}
