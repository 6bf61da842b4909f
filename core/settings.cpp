/* Copyright (C) 2017 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "settings.h"

#include <QDebug>
#include <QDir>
#include <QStandardPaths>
#include <QtGlobal>

#include "info.h"

Settings::Settings(const QString &file, QObject *parent) :
    QObject{parent},
    settings{file.isEmpty() ?
                 std::make_unique<QSettings>(Upnpc::ORG, Upnpc::APP_ID) :
                 std::make_unique<QSettings>(file, QSettings::IniFormat)}
{
}

QString Settings::configDir()
{
    QDir home(QStandardPaths::writableLocation(QStandardPaths::HomeLocation));
    return home.filePath(Upnpc::CONFIG_DIR);
}

QByteArray Settings::envName(const char *name)
{
    return QByteArray{Upnpc::ENV_PREFIX} + name;
}

bool Settings::parseBool(const QString &value, bool defaultValue)
{
    auto v = value.trimmed().toLower();
    if (v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    return defaultValue;
}

QString Settings::stringValue(const char *env, const QString &key, const QString &defaultValue) const
{
    auto name = envName(env);
    if (qEnvironmentVariableIsSet(name.constData()))
        return qEnvironmentVariable(name.constData());
    return settings->value(key, defaultValue).toString();
}

int Settings::intValue(const char *env, const QString &key, int defaultValue) const
{
    auto name = envName(env);
    if (qEnvironmentVariableIsSet(name.constData())) {
        bool ok = false;
        auto v = qEnvironmentVariable(name.constData()).trimmed().toInt(&ok);
        if (ok)
            return v;
        qWarning() << "Invalid integer in" << name << "- using default:" << defaultValue;
        return defaultValue;
    }
    return settings->value(key, defaultValue).toInt();
}

bool Settings::boolValue(const char *env, const QString &key, bool defaultValue) const
{
    auto name = envName(env);
    if (qEnvironmentVariableIsSet(name.constData()))
        return parseBool(qEnvironmentVariable(name.constData()), defaultValue);
    return settings->value(key, defaultValue).toBool();
}

void Settings::setCachePath(const QString &value)
{
    if (cachePath() != value) {
        settings->setValue("cachepath", value);
        emit cachePathChanged();
    }
}

QString Settings::cachePath() const
{
    return stringValue("CACHE_PATH", "cachepath",
                       QDir(configDir()).filePath("devices_cache.db"));
}

void Settings::setProfilesPath(const QString &value)
{
    if (profilesPath() != value) {
        settings->setValue("profilespath", value);
        emit profilesPathChanged();
    }
}

QString Settings::profilesPath() const
{
    return stringValue("PROFILES_PATH", "profilespath",
                       QDir(configDir()).filePath("profiles"));
}

void Settings::setLogLevel(const QString &value)
{
    if (logLevel() != value) {
        settings->setValue("loglevel", value);
        emit logLevelChanged();
    }
}

QString Settings::logLevel() const
{
    return stringValue("LOG_LEVEL", "loglevel", "info").toLower();
}

void Settings::setLogFilePath(const QString &value)
{
    if (logFilePath() != value) {
        settings->setValue("logfilepath", value);
        emit logFilePathChanged();
    }
}

QString Settings::logFilePath() const
{
    return stringValue("LOG_FILE_PATH", "logfilepath", {});
}

void Settings::setStealthMode(bool value)
{
    if (stealthMode() != value) {
        settings->setValue("stealthmode", value);
        emit stealthModeChanged();
    }
}

bool Settings::stealthMode() const
{
    return boolValue("STEALTH_MODE", "stealthmode", false);
}

void Settings::setSslVerify(bool value)
{
    if (sslVerify() != value) {
        settings->setValue("sslverify", value);
        emit sslVerifyChanged();
    }
}

bool Settings::sslVerify() const
{
    return boolValue("SSL_VERIFY", "sslverify", false);
}

void Settings::setHttpTimeout(int value)
{
    if (httpTimeout() != value) {
        settings->setValue("httptimeout", value);
        emit httpTimeoutChanged();
    }
}

int Settings::httpTimeout() const
{
    return intValue("HTTP_TIMEOUT", "httptimeout", 10);
}

void Settings::setSsdpTimeout(int value)
{
    if (ssdpTimeout() != value) {
        settings->setValue("ssdptimeout", value);
        emit ssdpTimeoutChanged();
    }
}

int Settings::ssdpTimeout() const
{
    return intValue("SSDP_TIMEOUT", "ssdptimeout", 5);
}

void Settings::setNetworkScanTimeout(int value)
{
    if (networkScanTimeout() != value) {
        settings->setValue("networkscantimeout", value);
        emit networkScanTimeoutChanged();
    }
}

int Settings::networkScanTimeout() const
{
    return intValue("NETWORK_SCAN_TIMEOUT", "networkscantimeout", 30);
}

void Settings::setCacheTtlHours(int value)
{
    if (cacheTtlHours() != value) {
        settings->setValue("cachettlhours", value);
        emit cacheTtlHoursChanged();
    }
}

int Settings::cacheTtlHours() const
{
    return intValue("CACHE_TTL_HOURS", "cachettlhours", 24);
}

void Settings::setCacheMaxEntries(int value)
{
    if (cacheMaxEntries() != value) {
        settings->setValue("cachemaxentries", value);
        emit cacheMaxEntriesChanged();
    }
}

int Settings::cacheMaxEntries() const
{
    return intValue("CACHE_MAX_ENTRIES", "cachemaxentries", 10000);
}

void Settings::setMaxConcurrency(int value)
{
    if (maxConcurrency() != value) {
        settings->setValue("maxconcurrency", value);
        emit maxConcurrencyChanged();
    }
}

int Settings::maxConcurrency() const
{
    return qMax(1, intValue("MAX_CONCURRENCY", "maxconcurrency", 50));
}

void Settings::setDefaultPort(int value)
{
    if (defaultPort() != value) {
        settings->setValue("defaultport", value);
        emit defaultPortChanged();
    }
}

int Settings::defaultPort() const
{
    return intValue("DEFAULT_PORT", "defaultport", 1400);
}
