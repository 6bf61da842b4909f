/* Copyright (C) 2017-2021 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

#include "context.h"
#include "devicecache.h"
#include "info.h"
#include "log.h"
#include "mediacontroller.h"
#include "profilestore.h"
#include "protocoladapter.h"
#include "settings.h"
#include "soapclient.h"

Context::Context(const QString &settingsFile) :
    m_settings{std::make_unique<Settings>(settingsFile)},
    m_profiles{std::make_shared<ProfileStore>()}
{
}

Context::~Context()
{
    m_discovery.reset();
    m_controller.reset();
    m_adapters.reset();
    m_soap.reset();
    m_profiles.reset();
    m_cache.reset();

    if (m_inited)
        qInstallMessageHandler(nullptr);
}

bool Context::init()
{
    if (m_inited)
        return true;

    qInstallMessageHandler(qtLog);
    setLogLevel(m_settings->logLevel());

    auto logPath = m_settings->logFilePath();
    if (!logPath.isEmpty() && !setLogFilePath(logPath))
        qWarning() << "cannot open log file:" << logPath;

    qDebug() << Upnpc::APP_NAME << Upnpc::APP_VERSION << "starting";

    m_profiles->setFallbackPort(m_settings->defaultPort());
    reloadProfiles();

    auto cachePath = m_settings->cachePath();
    QDir{}.mkpath(QFileInfo{cachePath}.absolutePath());
    m_cache = std::make_shared<DeviceCache>(cachePath, m_settings->cacheTtlHours(),
                                            m_settings->cacheMaxEntries());
    if (!m_cache->ok())
        qWarning() << "device cache is not available:" << cachePath;

    m_soap = std::make_shared<SoapClient>(m_settings->httpTimeout() * 1000,
                                          m_settings->stealthMode(),
                                          m_settings->sslVerify());
    m_adapters = AdapterRegistry::make_default(m_soap, m_settings->httpTimeout() * 1000);

    m_controller = std::make_unique<MediaController>(m_profiles, m_adapters);
    m_controller->setConcurrency(m_settings->maxConcurrency());

    m_discovery = std::make_unique<Discovery>(m_cache);

    m_inited = true;

    return m_cache->ok();
}

bool Context::inited() const
{
    return m_inited;
}

QStringList Context::profileSearchPaths() const
{
    const auto bundled = QStringLiteral("%1/profiles").arg(QLatin1String{Upnpc::APP_ID});
    auto paths = QStandardPaths::locateAll(QStandardPaths::GenericDataLocation, bundled,
                                           QStandardPaths::LocateDirectory);
    paths << m_settings->profilesPath() << QDir::current().filePath("profiles");

    QStringList unique;
    for (const auto &path : paths) {
        QFileInfo fi{path};
        auto key = fi.exists() ? fi.canonicalFilePath() : QDir::cleanPath(fi.absoluteFilePath());
        if (!unique.contains(key))
            unique << key;
    }

    return unique;
}

int Context::reloadProfiles()
{
    const auto paths = profileSearchPaths();
    auto count = m_profiles->load(paths);
    if (count == 0)
        qWarning() << "no device profiles loaded from:" << paths;
    else
        qDebug() << "device profiles loaded:" << count;
    return count;
}

DiscoveryOptions Context::discoveryOptions() const
{
    DiscoveryOptions opts;
    opts.ssdpTimeout = m_settings->ssdpTimeout() * 1000;
    opts.httpTimeout = m_settings->httpTimeout() * 1000;
    opts.concurrency = m_settings->maxConcurrency();
    opts.scanTimeout = m_settings->networkScanTimeout() * 1000;
    return opts;
}

Settings* Context::settings() const
{
    return m_settings.get();
}

std::shared_ptr<DeviceCache> Context::cache() const
{
    return m_cache;
}

std::shared_ptr<ProfileStore> Context::profiles() const
{
    return m_profiles;
}

std::shared_ptr<SoapClient> Context::soap() const
{
    return m_soap;
}

std::shared_ptr<AdapterRegistry> Context::adapters() const
{
    return m_adapters;
}

MediaController* Context::controller() const
{
    return m_controller.get();
}

Discovery* Context::discovery() const
{
    return m_discovery.get();
}
