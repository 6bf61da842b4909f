/* Copyright (C) 2023 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef PROFILESTORE_H
#define PROFILESTORE_H

#include <QJsonObject>
#include <QMap>
#include <QReadWriteLock>
#include <QString>
#include <QStringList>
#include <memory>
#include <optional>
#include <vector>

#include "protocol.h"

struct Device;

struct DeviceProfile
{
    QString name;
    // Field name -> patterns, fields: manufacturer, deviceType, modelName,
    // server_header, friendlyName, services
    QMap<QString, QStringList> match;
    QString notes;
    QJsonObject json;

    bool hasProtocol(Protocol protocol) const;
    QJsonObject protocolBlock(Protocol protocol) const;
    std::vector<Protocol> protocols() const;

    static std::optional<DeviceProfile> fromJson(const QJsonObject &json,
                                                 QStringList *errors = nullptr);
};

struct ControlInfo
{
    QString profileName;
    Protocol protocol = Protocol::UPnP;
    int port = 1400;
    QMap<QString, QString> controlUrls;
    // UPnP service types advertised by the device, same keys as controlUrls
    QMap<QString, QString> serviceTypes;
    QStringList capabilities;
    QString notes;

    QJsonObject toJson() const;
};

struct ProfileMatch
{
    std::shared_ptr<const DeviceProfile> profile;
    double score = 0.0;
};

class ProfileStore
{
public:
    static constexpr double defaultThreshold = 0.1;

    ProfileStore() = default;

    // Replaces the loaded set, returns number of loaded profiles
    int load(const QStringList &paths);
    void setProfiles(const std::vector<DeviceProfile> &profiles);
    std::vector<std::shared_ptr<const DeviceProfile>> profiles() const;
    std::shared_ptr<const DeviceProfile> profileByName(const QString &name) const;
    int count() const;
    // Port of a device without a profile and without a port of its own
    void setFallbackPort(int port);
    int fallbackPort() const;

    static QStringList validateProfile(const QJsonObject &json);
    static double score(const Device &device, const DeviceProfile &profile);
    std::vector<ProfileMatch> matches(const Device &device,
                                      double threshold = defaultThreshold) const;
    std::shared_ptr<const DeviceProfile> best(const Device &device,
                                              double threshold = defaultThreshold) const;

    static Protocol primaryProtocol(const DeviceProfile &profile);
    static QMap<QString, QString> controlUrls(const DeviceProfile &profile, Protocol protocol);
    static int defaultPort(const DeviceProfile &profile, Protocol protocol);
    ControlInfo controlInfo(const Device &device) const;
    static ControlInfo controlInfo(const Device &device, const DeviceProfile *profile,
                                   int fallbackPort = 0);

private:
    mutable QReadWriteLock lock;
    std::vector<std::shared_ptr<const DeviceProfile>> m_profiles;
    int m_fallbackPort = 0;

    static std::vector<DeviceProfile> loadFile(const QString &file, bool collection);
};

#endif // PROFILESTORE_H
