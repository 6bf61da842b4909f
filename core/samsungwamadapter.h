/* Copyright (C) 2021 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef SAMSUNGWAMADAPTER_H
#define SAMSUNGWAMADAPTER_H

#include <QString>
#include <QUrl>

#include "protocoladapter.h"

// Samsung Wireless Audio Multiroom speakers, commands are XML in the query string
class SamsungWamAdapter : public ProtocolAdapter
{
public:
    explicit SamsungWamAdapter(int httpTimeout);

    Protocol protocol() const override;
    ControlResult play(const ControlTarget &target) override;
    ControlResult pause(const ControlTarget &target) override;
    ControlResult stop(const ControlTarget &target) override;
    ControlResult setUri(const ControlTarget &target, const QString &uri,
                         const QString &metadata = {}) override;
    ControlResult getVolume(const ControlTarget &target) override;
    ControlResult setVolume(const ControlTarget &target, int level) override;

    static QString playbackCommand(const QString &state);
    static QString urlPlaybackCommand(const QString &uri);
    static QString volumeCommand(int level);
    static QUrl commandUrl(const ControlTarget &target, const QString &cmd);

private:
    int timeout;

    ControlResult sendCommand(const ControlTarget &target, const QString &action,
                              const QString &cmd);
};

#endif // SAMSUNGWAMADAPTER_H
