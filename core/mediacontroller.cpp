/* Copyright (C) 2017-2021 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <QDebug>
#include <algorithm>

#include "mediacontroller.h"
#include "profilestore.h"
#include "taskexecutor.h"

MediaController::MediaController(std::shared_ptr<ProfileStore> profiles,
                                 std::shared_ptr<AdapterRegistry> adapters) :
    profiles(std::move(profiles)),
    adapters(std::move(adapters))
{
}

void MediaController::setConcurrency(int value)
{
    m_concurrency = std::max(1, value);
}

int MediaController::concurrency() const
{
    return m_concurrency;
}

bool MediaController::validVolume(int level)
{
    return level >= 0 && level <= 100;
}

ControlTarget MediaController::target(const Device &device) const
{
    ControlTarget target;
    target.host = device.ip;
    target.useTLS = device.useTLS;
    target.info = profiles ? profiles->controlInfo(device) :
                             ProfileStore::controlInfo(device, nullptr);
    target.port = target.info.port;
    return target;
}

ControlResult MediaController::dispatch(const Device &device, const QString &action,
                                        const std::function<ControlResult(ProtocolAdapter&,
                                                                          const ControlTarget&)> &call)
{
    auto t = target(device);

    auto adapter = adapters ? adapters->adapter(t.info.protocol) : nullptr;
    if (!adapter) {
        qWarning() << "no adapter for" << device.endpoint() << protocol::id(t.info.protocol);
        return ControlResult::notImplemented(action, t.info.protocol);
    }

    qDebug() << action << "on" << t.host << t.port << "via" << protocol::id(t.info.protocol)
             << "profile:" << t.info.profileName;

    auto result = call(*adapter, t);
    if (result.isError())
        qWarning() << action << "failed on" << device.endpoint() << ":" << result.error;
    return result;
}

ControlResult MediaController::play(const Device &device)
{
    return dispatch(device, "play", [](ProtocolAdapter &a, const ControlTarget &t) {
        return a.play(t);
    });
}

ControlResult MediaController::pause(const Device &device)
{
    return dispatch(device, "pause", [](ProtocolAdapter &a, const ControlTarget &t) {
        return a.pause(t);
    });
}

ControlResult MediaController::stop(const Device &device)
{
    return dispatch(device, "stop", [](ProtocolAdapter &a, const ControlTarget &t) {
        return a.stop(t);
    });
}

ControlResult MediaController::next(const Device &device)
{
    return dispatch(device, "next", [](ProtocolAdapter &a, const ControlTarget &t) {
        return a.next(t);
    });
}

ControlResult MediaController::previous(const Device &device)
{
    return dispatch(device, "previous", [](ProtocolAdapter &a, const ControlTarget &t) {
        return a.previous(t);
    });
}

ControlResult MediaController::seek(const Device &device, const QString &position)
{
    return dispatch(device, "seek", [&position](ProtocolAdapter &a, const ControlTarget &t) {
        return a.seek(t, position);
    });
}

ControlResult MediaController::setUri(const Device &device, const QString &uri,
                                      const QString &metadata)
{
    if (uri.trimmed().isEmpty()) {
        auto t = target(device);
        return ControlResult::failed("set_uri", t.info.protocol, ErrorType::Validation,
                                     "Empty URI");
    }

    return dispatch(device, "set_uri", [&](ProtocolAdapter &a, const ControlTarget &t) {
        return a.setUri(t, uri, metadata);
    });
}

ControlResult MediaController::getVolume(const Device &device)
{
    return dispatch(device, "get_volume", [](ProtocolAdapter &a, const ControlTarget &t) {
        return a.getVolume(t);
    });
}

ControlResult MediaController::setVolume(const Device &device, int level)
{
    // Rejected before any adapter is touched
    if (!validVolume(level)) {
        auto t = target(device);
        qWarning() << "invalid volume:" << level;
        return ControlResult::failed("set_volume", t.info.protocol, ErrorType::Validation,
                                     QStringLiteral("Volume must be between 0 and 100, got %1")
                                     .arg(level));
    }

    return dispatch(device, "set_volume", [level](ProtocolAdapter &a, const ControlTarget &t) {
        return a.setVolume(t, level);
    });
}

ControlResult MediaController::getMute(const Device &device)
{
    return dispatch(device, "get_mute", [](ProtocolAdapter &a, const ControlTarget &t) {
        return a.getMute(t);
    });
}

ControlResult MediaController::setMute(const Device &device, bool muted)
{
    return dispatch(device, "set_mute", [muted](ProtocolAdapter &a, const ControlTarget &t) {
        return a.setMute(t, muted);
    });
}

QMap<QString, ControlResult> MediaController::massOperation(const std::vector<Device> &devices,
                                                            const Operation &operation)
{
    TaskExecutor executor{nullptr, std::min<int>(m_concurrency,
                                                 std::max<int>(1, static_cast<int>(devices.size())))};

    std::function<ControlResult(const Device&)> run = [this, &operation](const Device &device) {
        return operation(*this, device);
    };

    auto results = executor.map(devices, run);

    QMap<QString, ControlResult> map;
    int failed = 0;
    for (size_t i = 0; i < devices.size(); ++i) {
        if (results[i].isError())
            ++failed;
        map.insert(devices[i].endpoint(), results[i]);
    }

    qDebug() << "mass operation done:" << devices.size() << "devices," << failed << "failed";

    return map;
}

std::vector<ControlResult> MediaController::playSequence(const Device &device, const QString &uri,
                                                         int volume, const QString &metadata)
{
    std::vector<ControlResult> results;

    auto step = [&results](ControlResult result) {
        results.push_back(std::move(result));
        return !results.back().isError();
    };

    // Stop is allowed to be unsupported, nothing may be playing
    if (!step(stop(device)))
        return results;
    if (!step(setVolume(device, volume)))
        return results;
    if (!step(setUri(device, uri, metadata)))
        return results;
    step(play(device));

    return results;
}
