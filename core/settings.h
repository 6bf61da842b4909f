/* Copyright (C) 2017 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef SETTINGS_H
#define SETTINGS_H

#include <QObject>
#include <QString>
#include <QVariant>
#include <QSettings>
#include <memory>

class Settings : public QObject
{
    Q_OBJECT
    Q_PROPERTY (QString cachePath READ cachePath WRITE setCachePath NOTIFY cachePathChanged)
    Q_PROPERTY (QString profilesPath READ profilesPath WRITE setProfilesPath NOTIFY profilesPathChanged)
    Q_PROPERTY (QString logLevel READ logLevel WRITE setLogLevel NOTIFY logLevelChanged)
    Q_PROPERTY (QString logFilePath READ logFilePath WRITE setLogFilePath NOTIFY logFilePathChanged)
    Q_PROPERTY (bool stealthMode READ stealthMode WRITE setStealthMode NOTIFY stealthModeChanged)
    Q_PROPERTY (bool sslVerify READ sslVerify WRITE setSslVerify NOTIFY sslVerifyChanged)
    Q_PROPERTY (int httpTimeout READ httpTimeout WRITE setHttpTimeout NOTIFY httpTimeoutChanged)
    Q_PROPERTY (int ssdpTimeout READ ssdpTimeout WRITE setSsdpTimeout NOTIFY ssdpTimeoutChanged)
    Q_PROPERTY (int networkScanTimeout READ networkScanTimeout WRITE setNetworkScanTimeout NOTIFY networkScanTimeoutChanged)
    Q_PROPERTY (int cacheTtlHours READ cacheTtlHours WRITE setCacheTtlHours NOTIFY cacheTtlHoursChanged)
    Q_PROPERTY (int cacheMaxEntries READ cacheMaxEntries WRITE setCacheMaxEntries NOTIFY cacheMaxEntriesChanged)
    Q_PROPERTY (int maxConcurrency READ maxConcurrency WRITE setMaxConcurrency NOTIFY maxConcurrencyChanged)
    Q_PROPERTY (int defaultPort READ defaultPort WRITE setDefaultPort NOTIFY defaultPortChanged)

public:
    // Settings file is optional, without it the per-user native store is used
    explicit Settings(const QString &file = {}, QObject *parent = nullptr);

    static QString configDir();

    void setCachePath(const QString &value);
    QString cachePath() const;
    void setProfilesPath(const QString &value);
    QString profilesPath() const;
    void setLogLevel(const QString &value);
    QString logLevel() const;
    void setLogFilePath(const QString &value);
    QString logFilePath() const;
    void setStealthMode(bool value);
    bool stealthMode() const;
    void setSslVerify(bool value);
    bool sslVerify() const;
    void setHttpTimeout(int value);
    int httpTimeout() const;
    void setSsdpTimeout(int value);
    int ssdpTimeout() const;
    void setNetworkScanTimeout(int value);
    int networkScanTimeout() const;
    void setCacheTtlHours(int value);
    int cacheTtlHours() const;
    void setCacheMaxEntries(int value);
    int cacheMaxEntries() const;
    void setMaxConcurrency(int value);
    int maxConcurrency() const;
    void setDefaultPort(int value);
    int defaultPort() const;

    static bool parseBool(const QString &value, bool defaultValue);

signals:
    void cachePathChanged();
    void profilesPathChanged();
    void logLevelChanged();
    void logFilePathChanged();
    void stealthModeChanged();
    void sslVerifyChanged();
    void httpTimeoutChanged();
    void ssdpTimeoutChanged();
    void networkScanTimeoutChanged();
    void cacheTtlHoursChanged();
    void cacheMaxEntriesChanged();
    void maxConcurrencyChanged();
    void defaultPortChanged();

private:
    std::unique_ptr<QSettings> settings;

    static QByteArray envName(const char *name);
    QString stringValue(const char *env, const QString &key, const QString &defaultValue) const;
    int intValue(const char *env, const QString &key, int defaultValue) const;
    bool boolValue(const char *env, const QString &key, bool defaultValue) const;
};

#endif // SETTINGS_H
