/* Copyright (C) 2017-2021 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef CONTEXT_H
#define CONTEXT_H

#include <QString>
#include <QStringList>
#include <memory>

#include "discovery.h"

class AdapterRegistry;
class DeviceCache;
class MediaController;
class ProfileStore;
class Settings;
class SoapClient;

class Context
{
public:
    explicit Context(const QString &settingsFile = {});
    ~Context();
    Context(const Context&) = delete;
    Context& operator= (const Context&) = delete;

    // Installs log handler, loads profiles and opens the cache
    bool init();
    bool inited() const;

    Settings* settings() const;
    std::shared_ptr<DeviceCache> cache() const;
    std::shared_ptr<ProfileStore> profiles() const;
    std::shared_ptr<SoapClient> soap() const;
    std::shared_ptr<AdapterRegistry> adapters() const;
    MediaController* controller() const;
    Discovery* discovery() const;

    DiscoveryOptions discoveryOptions() const;
    // Bundled data dirs first, then the user dir, then ./profiles
    QStringList profileSearchPaths() const;
    int reloadProfiles();

private:
    // Declaration order is construction order, members go down in reverse
    std::unique_ptr<Settings> m_settings;
    std::shared_ptr<DeviceCache> m_cache;
    std::shared_ptr<ProfileStore> m_profiles;
    std::shared_ptr<SoapClient> m_soap;
    std::shared_ptr<AdapterRegistry> m_adapters;
    std::unique_ptr<MediaController> m_controller;
    std::unique_ptr<Discovery> m_discovery;
    bool m_inited = false;
};

#endif // CONTEXT_H
