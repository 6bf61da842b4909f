/* Copyright (C) 2023 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "log.h"

#include <QFile>
#include <QMessageLogContext>
#include <QTemporaryDir>
#include <catch2/catch_test_macros.hpp>

TEST_CASE("Log level", "[log]") {
    setLogLevel("debug");
    REQUIRE(logLevel() == QtDebugMsg);
    setLogLevel(" WARN ");
    REQUIRE(logLevel() == QtWarningMsg);
    setLogLevel("error");
    REQUIRE(logLevel() == QtCriticalMsg);
    setLogLevel("bogus");
    REQUIRE(logLevel() == QtInfoMsg);
}

TEST_CASE("Log file", "[log]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    auto path = dir.filePath("logs/upnpc.log");

    setLogLevel("info");
    REQUIRE(setLogFilePath(path));
    REQUIRE(logFile != nullptr);

    QMessageLogContext context{"discovery.cpp", 42, "Discovery::discover", "default"};
    qtLog(QtDebugMsg, context, "hidden below threshold");
    qtLog(QtWarningMsg, context, "cache is not available");

    QFile file{path};
    REQUIRE(file.open(QIODevice::ReadOnly));
    auto content = QString::fromLocal8Bit(file.readAll());
    file.close();

    REQUIRE(content.startsWith("[W] "));
    REQUIRE(content.contains("Discovery::discover:42 - cache is not available"));
    REQUIRE(!content.contains("hidden below threshold"));

    removeLogFile();
    REQUIRE(logFile == nullptr);
    REQUIRE(!QFile::exists(path));

    REQUIRE(setLogFilePath({}));
}
