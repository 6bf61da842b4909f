/* Copyright (C) 2021 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef ECPADAPTER_H
#define ECPADAPTER_H

#include <QByteArray>
#include <QString>
#include <QUrl>

#include "protocoladapter.h"

// Roku External Control Protocol
class EcpAdapter : public ProtocolAdapter
{
public:
    explicit EcpAdapter(int httpTimeout, int launchDelay = 2000);

    Protocol protocol() const override;
    ControlResult play(const ControlTarget &target) override;
    ControlResult pause(const ControlTarget &target) override;
    ControlResult stop(const ControlTarget &target) override;
    ControlResult setUri(const ControlTarget &target, const QString &uri,
                         const QString &metadata = {}) override;

    static QUrl makeUrl(const ControlTarget &target, const QString &path);
    static QByteArray inputBody(const QString &uri);

private:
    int timeout;
    int launchDelay;

    ControlResult post(const ControlTarget &target, const QString &action, const QString &path,
                       const QByteArray &body = {}, bool form = false);
};

#endif // ECPADAPTER_H
