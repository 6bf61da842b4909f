/* Copyright (C) 2023 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "profilestore.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QReadLocker>
#include <QWriteLocker>
#include <algorithm>
#include <iterator>

#include "devicedescription.h"

static QStringList toStringList(const QJsonValue &value)
{
    QStringList list;
    if (value.isArray()) {
        for (const auto &v : value.toArray()) {
            if (v.isString())
                list.push_back(v.toString());
        }
    } else if (value.isString()) {
        list.push_back(value.toString());
    }
    return list;
}

bool DeviceProfile::hasProtocol(Protocol protocol) const
{
    auto v = json.value(protocol::id(protocol));
    return v.isObject() && !v.toObject().isEmpty();
}

QJsonObject DeviceProfile::protocolBlock(Protocol protocol) const
{
    return json.value(protocol::id(protocol)).toObject();
}

std::vector<Protocol> DeviceProfile::protocols() const
{
    std::vector<Protocol> list;
    for (auto p : protocol::profileProtocols()) {
        if (hasProtocol(p))
            list.push_back(p);
    }
    return list;
}

std::optional<DeviceProfile> DeviceProfile::fromJson(const QJsonObject &json, QStringList *errors)
{
    auto problems = ProfileStore::validateProfile(json);
    if (!problems.isEmpty()) {
        if (errors)
            *errors = problems;
        return std::nullopt;
    }

    DeviceProfile profile;
    profile.name = json.value("name").toString();
    profile.notes = json.value("notes").toString();
    profile.json = json;

    auto match = json.value("match").toObject();
    for (auto it = match.constBegin(); it != match.constEnd(); ++it)
        profile.match.insert(it.key(), toStringList(it.value()));

    return profile;
}

QJsonObject ControlInfo::toJson() const
{
    QJsonObject urls;
    for (auto it = controlUrls.cbegin(); it != controlUrls.cend(); ++it)
        urls.insert(it.key(), it.value());

    QJsonObject json{
        {"profile_name", profileName},
        {"protocol", protocol::id(protocol)},
        {"port", port},
        {"control_urls", urls},
        {"capabilities", QJsonArray::fromStringList(capabilities)}
    };

    if (!serviceTypes.isEmpty()) {
        QJsonObject types;
        for (auto it = serviceTypes.cbegin(); it != serviceTypes.cend(); ++it)
            types.insert(it.key(), it.value());
        json.insert("service_types", types);
    }

    if (!notes.isEmpty())
        json.insert("notes", notes);

    return json;
}

QStringList ProfileStore::validateProfile(const QJsonObject &json)
{
    QStringList errors;

    if (!json.contains("name"))
        errors.push_back("Missing required field: name");
    else if (!json.value("name").isString() || json.value("name").toString().isEmpty())
        errors.push_back("Field name must be a non-empty string");

    if (!json.contains("match"))
        errors.push_back("Missing required field: match");
    else if (!json.value("match").isObject())
        errors.push_back("Field match must be an object");

    bool hasBlock = false;
    for (auto p : protocol::profileProtocols()) {
        if (json.contains(protocol::id(p))) {
            hasBlock = true;
            break;
        }
    }

    if (!hasBlock)
        errors.push_back("At least one protocol must be defined");

    return errors;
}

std::vector<DeviceProfile> ProfileStore::loadFile(const QString &file, bool collection)
{
    std::vector<DeviceProfile> list;

    QFile f{file};
    if (!f.open(QIODevice::ReadOnly)) {
        qWarning() << "Cannot open profile file:" << file << f.errorString();
        return list;
    }

    QJsonParseError err;
    auto doc = QJsonDocument::fromJson(f.readAll(), &err);
    if (err.error != QJsonParseError::NoError) {
        qWarning() << "Invalid profile file:" << file << err.errorString();
        return list;
    }

    QJsonArray entries;
    if (doc.isArray()) {
        entries = doc.array();
    } else if (doc.isObject() && doc.object().contains("device_profiles")) {
        entries = doc.object().value("device_profiles").toArray();
    } else if (doc.isObject() && !collection) {
        entries.append(doc.object());
    } else {
        qWarning() << "Unexpected profile collection format:" << file;
        return list;
    }

    for (const auto &entry : entries) {
        QStringList errors;
        auto profile = DeviceProfile::fromJson(entry.toObject(), &errors);
        if (profile)
            list.push_back(std::move(*profile));
        else
            qWarning() << "Skipping invalid profile in" << file << errors;
    }

    return list;
}

int ProfileStore::load(const QStringList &paths)
{
    std::vector<DeviceProfile> loaded;

    for (const auto &path : paths) {
        QFileInfo fi{path};
        if (!fi.exists()) {
            qDebug() << "Profile path does not exist:" << path;
            continue;
        }

        if (fi.isFile()) {
            auto list = loadFile(fi.absoluteFilePath(), false);
            std::move(list.begin(), list.end(), std::back_inserter(loaded));
            continue;
        }

        QDir dir{path};
        if (dir.exists("profiles.json")) {
            auto list = loadFile(dir.filePath("profiles.json"), true);
            std::move(list.begin(), list.end(), std::back_inserter(loaded));
        }

        const auto files = dir.entryList({"*.json"}, QDir::Files, QDir::Name);
        for (const auto &name : files) {
            if (name == "profiles.json")
                continue;
            auto list = loadFile(dir.filePath(name), false);
            std::move(list.begin(), list.end(), std::back_inserter(loaded));
        }
    }

    setProfiles(loaded);

    qDebug() << "Profiles loaded:" << loaded.size();

    return int(loaded.size());
}

void ProfileStore::setProfiles(const std::vector<DeviceProfile> &profiles)
{
    std::vector<std::shared_ptr<const DeviceProfile>> list;
    list.reserve(profiles.size());
    for (const auto &p : profiles)
        list.push_back(std::make_shared<const DeviceProfile>(p));

    QWriteLocker locker{&lock};
    m_profiles = std::move(list);
}

std::vector<std::shared_ptr<const DeviceProfile>> ProfileStore::profiles() const
{
    QReadLocker locker{&lock};
    return m_profiles;
}

std::shared_ptr<const DeviceProfile> ProfileStore::profileByName(const QString &name) const
{
    QReadLocker locker{&lock};
    for (const auto &p : m_profiles) {
        if (p->name == name)
            return p;
    }
    return {};
}

int ProfileStore::count() const
{
    QReadLocker locker{&lock};
    return int(m_profiles.size());
}

static bool anyPatternIn(const QStringList &patterns, const QString &value)
{
    for (const auto &pattern : patterns) {
        if (!pattern.isEmpty() && value.contains(pattern, Qt::CaseInsensitive))
            return true;
    }
    return false;
}

double ProfileStore::score(const Device &device, const DeviceProfile &profile)
{
    int total = 0;
    int matched = 0;

    auto check = [&](const QString &field, const QString &value) {
        auto it = profile.match.constFind(field);
        if (it == profile.match.cend())
            return;
        ++total;
        if (anyPatternIn(*it, value))
            ++matched;
    };

    check("manufacturer", device.manufacturer);
    check("deviceType", device.deviceType);
    check("modelName", device.modelName);
    check("server_header", device.ssdpServerHeader);
    check("friendlyName", device.friendlyName);

    auto services = profile.match.constFind("services");
    if (services != profile.match.cend()) {
        const auto types = device.serviceTypes();
        for (const auto &required : *services) {
            ++total;
            for (const auto &type : types) {
                if (type.contains(required, Qt::CaseInsensitive)) {
                    ++matched;
                    break;
                }
            }
        }
    }

    return total > 0 ? double(matched) / double(total) : 0.0;
}

std::vector<ProfileMatch> ProfileStore::matches(const Device &device, double threshold) const
{
    std::vector<ProfileMatch> list;

    for (const auto &p : profiles()) {
        auto s = score(device, *p);
        if (s > 0.0 && s >= threshold)
            list.push_back({p, s});
    }

    // stable: equal scores keep load order
    std::stable_sort(list.begin(), list.end(), [](const auto &a, const auto &b) {
        return a.score > b.score;
    });

    return list;
}

std::shared_ptr<const DeviceProfile> ProfileStore::best(const Device &device, double threshold) const
{
    auto list = matches(device, threshold);
    if (list.empty())
        return {};

    qDebug() << "Best profile for" << device.friendlyName << ":"
             << list.front().profile->name << list.front().score;

    return list.front().profile;
}

Protocol ProfileStore::primaryProtocol(const DeviceProfile &profile)
{
    for (auto p : protocol::precedence()) {
        if (p != Protocol::Generic && profile.hasProtocol(p))
            return p;
    }
    return Protocol::Generic;
}

QMap<QString, QString> ProfileStore::controlUrls(const DeviceProfile &profile, Protocol protocol)
{
    QMap<QString, QString> urls;

    if (!profile.hasProtocol(protocol))
        return urls;

    auto block = profile.protocolBlock(protocol);

    switch (protocol) {
    case Protocol::UPnP:
        for (auto it = block.constBegin(); it != block.constEnd(); ++it) {
            auto service = it.value().toObject();
            if (service.contains("controlURL"))
                urls.insert(it.key(), service.value("controlURL").toString());
        }
        break;
    case Protocol::ECP:
        urls.insert("launch", block.value("launchURL").toString("/launch/2213"));
        urls.insert("input", block.value("inputURL").toString("/input"));
        break;
    case Protocol::SamsungWAM:
        urls.insert("setUrlPlayback", block.value("setUrlPlayback").toObject()
                    .value("endpoint").toString("/UIC?cmd={CMD_ENCODED}"));
        break;
    default:
        break;
    }

    return urls;
}

int ProfileStore::defaultPort(const DeviceProfile &profile, Protocol protocol)
{
    auto block = profile.protocolBlock(protocol);
    if (block.contains("port")) {
        auto port = block.value("port").toInt();
        if (port > 0)
            return port;
    }
    return protocol::defaultPort(protocol);
}

// UPnP service names used by the adapters
static void addUpnpService(const QString &key, const Service &service, ControlInfo *info)
{
    info->controlUrls.insert(key, service.controlURL);
    info->serviceTypes.insert(key, service.serviceType);
}

static void addUpnpServiceUrls(const Device &device, const DeviceProfile *profile,
                               ControlInfo *info)
{
    if (profile) {
        auto block = profile->protocolBlock(Protocol::UPnP);
        for (auto it = block.constBegin(); it != block.constEnd(); ++it) {
            auto type = it.value().toObject().value("serviceType").toString();
            if (type.isEmpty())
                continue;
            for (const auto &s : device.services) {
                if (s.serviceType == type && !s.controlURL.isEmpty()) {
                    addUpnpService(it.key(), s, info);
                    break;
                }
            }
        }
    }

    if (!info->controlUrls.contains("avtransport")) {
        auto s = device.serviceByType(":AVTransport:");
        if (s && !s->controlURL.isEmpty())
            addUpnpService("avtransport", *s, info);
    }
    if (!info->controlUrls.contains("rendering")) {
        auto s = device.serviceByType(":RenderingControl:");
        if (s && !s->controlURL.isEmpty())
            addUpnpService("rendering", *s, info);
    }
}

ControlInfo ProfileStore::controlInfo(const Device &device, const DeviceProfile *profile,
                                      int fallbackPort)
{
    ControlInfo info;

    if (!profile) {
        info.profileName = "Generic UPnP";
        info.protocol = Protocol::UPnP;
        if (device.port > 0)
            info.port = device.port;
        else
            info.port = fallbackPort > 0 ? fallbackPort : protocol::defaultPort(Protocol::UPnP);
        info.capabilities = QStringList{"basic_upnp"};
        addUpnpServiceUrls(device, nullptr, &info);
        return info;
    }

    info.profileName = profile->name;
    info.protocol = primaryProtocol(*profile);
    info.controlUrls = controlUrls(*profile, info.protocol);
    info.port = device.port > 0 ? device.port : defaultPort(*profile, info.protocol);
    info.capabilities = QStringList{protocol::id(info.protocol)};
    info.notes = profile->notes;

    if (info.protocol == Protocol::UPnP)
        addUpnpServiceUrls(device, profile, &info);

    return info;
}

ControlInfo ProfileStore::controlInfo(const Device &device) const
{
    auto profile = best(device);
    return controlInfo(device, profile.get(), fallbackPort());
}

void ProfileStore::setFallbackPort(int port)
{
    QWriteLocker locker{&lock};
    m_fallbackPort = port;
}

int ProfileStore::fallbackPort() const
{
    QReadLocker locker{&lock};
    return m_fallbackPort;
}
