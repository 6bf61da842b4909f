/* Copyright (C) 2017-2021 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef MEDIACONTROLLER_H
#define MEDIACONTROLLER_H

#include <QMap>
#include <QString>
#include <functional>
#include <memory>
#include <vector>

#include "controlresult.h"
#include "devicedescription.h"
#include "protocoladapter.h"

class ProfileStore;

class MediaController
{
public:
    using Operation = std::function<ControlResult(MediaController&, const Device&)>;

    static const int defaultConcurrency = 50;

    MediaController(std::shared_ptr<ProfileStore> profiles,
                    std::shared_ptr<AdapterRegistry> adapters);

    void setConcurrency(int value);
    int concurrency() const;

    // Resolves profile, protocol, port and control URLs of the device
    ControlTarget target(const Device &device) const;

    ControlResult play(const Device &device);
    ControlResult pause(const Device &device);
    ControlResult stop(const Device &device);
    ControlResult next(const Device &device);
    ControlResult previous(const Device &device);
    ControlResult seek(const Device &device, const QString &position);
    ControlResult setUri(const Device &device, const QString &uri, const QString &metadata = {});
    ControlResult getVolume(const Device &device);
    ControlResult setVolume(const Device &device, int level);
    ControlResult getMute(const Device &device);
    ControlResult setMute(const Device &device, bool muted);

    // One result per device keyed by "ip:port", a failing device does not stop the others
    QMap<QString, ControlResult> massOperation(const std::vector<Device> &devices,
                                               const Operation &operation);

    // stop, set-volume, set-uri and play, stops at the first error
    std::vector<ControlResult> playSequence(const Device &device, const QString &uri,
                                            int volume, const QString &metadata = {});

    static bool validVolume(int level);

private:
    std::shared_ptr<ProfileStore> profiles;
    std::shared_ptr<AdapterRegistry> adapters;
    int m_concurrency = defaultConcurrency;

    ControlResult dispatch(const Device &device, const QString &action,
                           const std::function<ControlResult(ProtocolAdapter&,
                                                             const ControlTarget&)> &call);
};

#endif // MEDIACONTROLLER_H
