/* Copyright (C) 2023 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "protocol.h"

namespace protocol {

QString id(Protocol protocol)
{
    switch (protocol) {
    case Protocol::UPnP: return "upnp";
    case Protocol::ECP: return "ecp";
    case Protocol::SamsungWAM: return "samsung_wam";
    case Protocol::Cast: return "cast";
    case Protocol::HeosApi: return "heos_api";
    case Protocol::MusicCastApi: return "musiccast_api";
    case Protocol::SoundTouchApi: return "soundtouch_api";
    case Protocol::DenonApi: return "denon_api";
    case Protocol::OnkyoApi: return "onkyo_api";
    case Protocol::PioneerApi: return "pioneer_api";
    case Protocol::SqueezeboxApi: return "squeezebox_api";
    case Protocol::PlexApi: return "plex_api";
    case Protocol::JsonRpcApi: return "jsonrpc_api";
    case Protocol::HttpInterface: return "http_interface";
    case Protocol::OpenWebNetApi: return "openwebnet_api";
    case Protocol::BluesoundApi: return "bluesound_api";
    case Protocol::Generic: return "generic";
    }
    return "generic";
}

std::optional<Protocol> fromId(const QString &id)
{
    for (auto p : precedence()) {
        if (protocol::id(p) == id)
            return p;
    }
    return std::nullopt;
}

const std::vector<Protocol>& profileProtocols()
{
    static const std::vector<Protocol> list{
        Protocol::UPnP, Protocol::ECP, Protocol::SamsungWAM, Protocol::Cast,
        Protocol::HeosApi, Protocol::MusicCastApi, Protocol::SoundTouchApi,
        Protocol::DenonApi, Protocol::OnkyoApi, Protocol::PioneerApi,
        Protocol::SqueezeboxApi, Protocol::PlexApi, Protocol::JsonRpcApi,
        Protocol::HttpInterface, Protocol::OpenWebNetApi, Protocol::BluesoundApi};
    return list;
}

const std::vector<Protocol>& precedence()
{
    static const std::vector<Protocol> list{
        Protocol::Cast, Protocol::ECP, Protocol::SamsungWAM,
        Protocol::HeosApi, Protocol::MusicCastApi, Protocol::SoundTouchApi,
        Protocol::DenonApi, Protocol::OnkyoApi, Protocol::PioneerApi,
        Protocol::SqueezeboxApi, Protocol::PlexApi, Protocol::JsonRpcApi,
        Protocol::HttpInterface, Protocol::OpenWebNetApi, Protocol::BluesoundApi,
        Protocol::UPnP, Protocol::Generic};
    return list;
}

int defaultPort(Protocol protocol)
{
    switch (protocol) {
    case Protocol::UPnP: return 1400;
    case Protocol::ECP: return 8060;
    case Protocol::SamsungWAM: return 55001;
    case Protocol::Cast: return 8008;
    case Protocol::HeosApi: return 1255;
    case Protocol::MusicCastApi: return 5005;
    case Protocol::SoundTouchApi: return 8090;
    case Protocol::DenonApi: return 80;
    case Protocol::OnkyoApi: return 60128;
    case Protocol::PioneerApi: return 8102;
    case Protocol::SqueezeboxApi: return 9000;
    case Protocol::PlexApi: return 32400;
    case Protocol::JsonRpcApi: return 8080;
    case Protocol::HttpInterface: return 8080;
    case Protocol::OpenWebNetApi: return 20000;
    case Protocol::BluesoundApi: return 11000;
    case Protocol::Generic: return 1400;
    }
    return 1400;
}
}
