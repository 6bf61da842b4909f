/* Copyright (C) 2023 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "devicecache.h"
#include "devicedescription.h"

#include <QJsonArray>
#include <QJsonObject>
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QTemporaryDir>
#include <catch2/catch_test_macros.hpp>
#include <memory>

static QJsonObject smallDevice(const QString &name)
{
    return QJsonObject{{"friendlyName", name}, {"manufacturer", "Sonos, Inc."}};
}

static QJsonObject largeDevice()
{
    QJsonArray services;
    for (int i = 0; i < 40; ++i) {
        services.append(QJsonObject{
            {"serviceType", QStringLiteral("urn:schemas-upnp-org:service:Service%1:1").arg(i)},
            {"controlURL", QStringLiteral("/Service%1/Control").arg(i)}
        });
    }
    return QJsonObject{{"friendlyName", "Big"}, {"services", services}};
}

static void corruptEntry(const QString &path, const QString &ip)
{
    {
        auto db = QSqlDatabase::addDatabase("QSQLITE", "corrupt-test");
        db.setDatabaseName(path);
        REQUIRE(db.open());
        QSqlQuery query{db};
        query.prepare("UPDATE devices SET device_data = ?, compressed = 1 WHERE ip = ?");
        query.addBindValue(QByteArray{"definitely not gzip"});
        query.addBindValue(ip);
        REQUIRE(query.exec());
        db.close();
    }
    QSqlDatabase::removeDatabase("corrupt-test");
}

TEST_CASE("Device cache", "[cache]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    double now = 1700000000.0;
    DeviceCache cache{dir.filePath("sub/devices_cache.db"), 24.0, 10000, [&now] { return now; }};
    REQUIRE(cache.ok());

    SECTION("upsert and get") {
        REQUIRE(cache.upsert("192.168.1.50", 1400, smallDevice("Kitchen")));

        auto record = cache.get("192.168.1.50");
        REQUIRE(record);
        REQUIRE(record->port == 1400);
        REQUIRE(!record->compressed);
        REQUIRE(record->lastSeen == now);
        REQUIRE(record->deviceData.value("friendlyName").toString() == QStringLiteral("Kitchen"));

        REQUIRE(cache.upsert("192.168.1.50", 1400, smallDevice("Living Room")));
        REQUIRE(cache.get("192.168.1.50")->deviceData.value("friendlyName").toString() ==
                QStringLiteral("Living Room"));

        REQUIRE(!cache.get("10.0.0.1"));
        REQUIRE(!cache.upsert("", 80, smallDevice("x")));
    }

    SECTION("large payloads are compressed") {
        REQUIRE(cache.upsert("192.168.1.60", 1400, largeDevice()));

        auto record = cache.get("192.168.1.60");
        REQUIRE(record);
        REQUIRE(record->compressed);
        REQUIRE(record->deviceData == largeDevice());
        REQUIRE(cache.stats()->compressedEntries == 1);
    }

    SECTION("ttl") {
        REQUIRE(cache.upsert("192.168.1.50", 1400, smallDevice("Old")));
        now += 3600.0;
        REQUIRE(cache.upsert("192.168.1.51", 1400, smallDevice("New")));

        now += 23.5 * 3600.0;
        REQUIRE(!cache.get("192.168.1.50"));
        REQUIRE(cache.get("192.168.1.51"));

        auto records = cache.list();
        REQUIRE(records.size() == 1);

        auto stats = cache.stats();
        REQUIRE(stats);
        REQUIRE(stats->totalDevices == 2);
        REQUIRE(stats->validDevices == 1);
        REQUIRE(stats->expiredDevices == 1);

        REQUIRE(cache.cleanupExpired() == 1);
        REQUIRE(cache.stats()->totalDevices == 1);
        REQUIRE(cache.cleanupExpired() == 0);
    }

    SECTION("list order and max age") {
        REQUIRE(cache.upsert("10.0.0.1", 80, smallDevice("A")));
        now += 60.0;
        REQUIRE(cache.upsert("10.0.0.2", 80, smallDevice("B")));
        now += 60.0;
        REQUIRE(cache.upsert("10.0.0.3", 80, smallDevice("C")));

        auto records = cache.list();
        REQUIRE(records.size() == 3);
        REQUIRE(records[0].ip == QStringLiteral("10.0.0.3"));
        REQUIRE(records[2].ip == QStringLiteral("10.0.0.1"));

        REQUIRE(cache.list(90.0 / 3600.0).size() == 2);
    }

    SECTION("corrupt entries are skipped") {
        REQUIRE(cache.upsert("10.0.0.1", 80, smallDevice("A")));
        REQUIRE(cache.upsert("10.0.0.2", 80, smallDevice("B")));
        corruptEntry(cache.path(), "10.0.0.1");

        auto records = cache.list();
        REQUIRE(records.size() == 1);
        REQUIRE(records.front().ip == QStringLiteral("10.0.0.2"));
        REQUIRE(!cache.get("10.0.0.1"));
    }

    SECTION("remove and clear") {
        REQUIRE(cache.upsert("10.0.0.1", 80, smallDevice("A")));
        REQUIRE(cache.setMetadata("last_network", "10.0.0.0/24"));

        REQUIRE(cache.remove("10.0.0.1"));
        REQUIRE(!cache.remove("10.0.0.1"));

        REQUIRE(cache.upsert("10.0.0.2", 80, smallDevice("B")));
        REQUIRE(cache.clear());
        REQUIRE(cache.list().empty());
        REQUIRE(!cache.metadata("last_network"));
    }

    SECTION("metadata") {
        REQUIRE(!cache.metadata("last_network"));
        REQUIRE(cache.setMetadata("last_network", "192.168.1.0/24"));
        REQUIRE(cache.setMetadata("last_network", "10.0.0.0/24"));
        REQUIRE(cache.metadata("last_network") == QStringLiteral("10.0.0.0/24"));
    }

    SECTION("device records") {
        Device device;
        device.ip = "192.168.1.70";
        device.port = 8060;
        device.manufacturer = "Roku";
        REQUIRE(cache.upsert(device));

        auto record = cache.get("192.168.1.70");
        REQUIRE(record);
        auto restored = Device::fromJson(record->deviceData);
        REQUIRE(restored);
        REQUIRE(restored->manufacturer == QStringLiteral("Roku"));
        REQUIRE(restored->port == 8060);
    }
}

TEST_CASE("Device cache entry limit", "[cache]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    double now = 1700000000.0;
    DeviceCache cache{dir.filePath("devices_cache.db"), 24.0, 2, [&now] { return now; }};

    for (int i = 1; i <= 3; ++i) {
        REQUIRE(cache.upsert(QStringLiteral("10.0.0.%1").arg(i), 80, smallDevice("x")));
        now += 1.0;
    }

    REQUIRE(cache.list().size() == 2);
    REQUIRE(!cache.get("10.0.0.1"));
}

TEST_CASE("Gzip helpers", "[cache]") {
    auto data = QByteArray(4096, 'a');
    auto gz = DeviceCache::gzipCompress(data);
    REQUIRE(gz.size() < data.size());
    REQUIRE(gz.startsWith("\x1f\x8b"));
    REQUIRE(DeviceCache::gzipDecompress(gz) == data);
    REQUIRE(!DeviceCache::gzipDecompress(gz.left(gz.size() / 2)));
    REQUIRE(!DeviceCache::gzipDecompress("plain"));
}
