/* Copyright (C) 2023 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "settings.h"

#include <QTemporaryDir>
#include <QtGlobal>
#include <catch2/catch_test_macros.hpp>

static const char* const overrides[] = {
    "UPNPC_CLI_CACHE_PATH", "UPNPC_CLI_HTTP_TIMEOUT", "UPNPC_CLI_SSDP_TIMEOUT",
    "UPNPC_CLI_STEALTH_MODE", "UPNPC_CLI_MAX_CONCURRENCY", "UPNPC_CLI_LOG_LEVEL",
    "UPNPC_CLI_CACHE_TTL_HOURS", "UPNPC_CLI_DEFAULT_PORT"
};

static void clearOverrides()
{
    for (auto name : overrides)
        qunsetenv(name);
}

TEST_CASE("Settings", "[settings]") {
    clearOverrides();

    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    Settings settings{dir.filePath("upnpc.ini")};

    SECTION("defaults") {
        REQUIRE(settings.cachePath().endsWith("/.upnp_cli/devices_cache.db"));
        REQUIRE(settings.profilesPath().endsWith("/.upnp_cli/profiles"));
        REQUIRE(settings.logLevel() == QStringLiteral("info"));
        REQUIRE(settings.logFilePath().isEmpty());
        REQUIRE(!settings.stealthMode());
        REQUIRE(!settings.sslVerify());
        REQUIRE(settings.httpTimeout() == 10);
        REQUIRE(settings.ssdpTimeout() == 5);
        REQUIRE(settings.networkScanTimeout() == 30);
        REQUIRE(settings.cacheTtlHours() == 24);
        REQUIRE(settings.cacheMaxEntries() == 10000);
        REQUIRE(settings.maxConcurrency() == 50);
        REQUIRE(settings.defaultPort() == 1400);
    }

    SECTION("stored values") {
        settings.setHttpTimeout(3);
        settings.setLogLevel("DEBUG");
        settings.setStealthMode(true);

        Settings reopened{dir.filePath("upnpc.ini")};
        REQUIRE(reopened.httpTimeout() == 3);
        REQUIRE(reopened.logLevel() == QStringLiteral("debug"));
        REQUIRE(reopened.stealthMode());
    }

    SECTION("environment wins over stored values") {
        settings.setHttpTimeout(3);
        qputenv("UPNPC_CLI_HTTP_TIMEOUT", "25");
        qputenv("UPNPC_CLI_STEALTH_MODE", "yes");
        qputenv("UPNPC_CLI_CACHE_PATH", "/tmp/other.db");

        REQUIRE(settings.httpTimeout() == 25);
        REQUIRE(settings.stealthMode());
        REQUIRE(settings.cachePath() == QStringLiteral("/tmp/other.db"));
    }

    SECTION("invalid environment values fall back to defaults") {
        qputenv("UPNPC_CLI_HTTP_TIMEOUT", "soon");
        qputenv("UPNPC_CLI_STEALTH_MODE", "maybe");
        qputenv("UPNPC_CLI_MAX_CONCURRENCY", "0");

        REQUIRE(settings.httpTimeout() == 10);
        REQUIRE(!settings.stealthMode());
        REQUIRE(settings.maxConcurrency() == 1);
    }

    clearOverrides();
}

TEST_CASE("Boolean parsing", "[settings]") {
    for (auto v : {"1", "true", "TRUE", "yes", " on "})
        REQUIRE(Settings::parseBool(v, false));
    for (auto v : {"0", "false", "No", "off"})
        REQUIRE(!Settings::parseBool(v, true));
    REQUIRE(Settings::parseBool("", true));
    REQUIRE(!Settings::parseBool("2", false));
}
