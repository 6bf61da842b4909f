/* Copyright (C) 2023 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef PROTOCOL_H
#define PROTOCOL_H

#include <QString>
#include <optional>
#include <vector>

enum class Protocol {
    UPnP,
    ECP,
    SamsungWAM,
    Cast,
    HeosApi,
    MusicCastApi,
    SoundTouchApi,
    DenonApi,
    OnkyoApi,
    PioneerApi,
    SqueezeboxApi,
    PlexApi,
    JsonRpcApi,
    HttpInterface,
    OpenWebNetApi,
    BluesoundApi,
    Generic
};

namespace protocol
{
// Identifier used in profile documents, e.g. "samsung_wam"
QString id(Protocol protocol);
std::optional<Protocol> fromId(const QString &id);
// Protocols that can appear as a profile block (everything except Generic)
const std::vector<Protocol>& profileProtocols();
// Highest precedence first
const std::vector<Protocol>& precedence();
int defaultPort(Protocol protocol);
}

#endif // PROTOCOL_H
