/* Copyright (C) 2021 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "protocoladapter.h"

#include <QDebug>

#include "ecpadapter.h"
#include "samsungwamadapter.h"
#include "soapclient.h"
#include "upnpadapter.h"

ControlResult ProtocolAdapter::next(const ControlTarget &)
{
    return ControlResult::notSupported("next", protocol());
}

ControlResult ProtocolAdapter::previous(const ControlTarget &)
{
    return ControlResult::notSupported("previous", protocol());
}

ControlResult ProtocolAdapter::seek(const ControlTarget &, const QString &)
{
    return ControlResult::notSupported("seek", protocol());
}

ControlResult ProtocolAdapter::setUri(const ControlTarget &, const QString &, const QString &)
{
    return ControlResult::notSupported("set_uri", protocol());
}

ControlResult ProtocolAdapter::getVolume(const ControlTarget &)
{
    return ControlResult::notSupported("get_volume", protocol());
}

ControlResult ProtocolAdapter::setVolume(const ControlTarget &, int)
{
    return ControlResult::notSupported("set_volume", protocol());
}

ControlResult ProtocolAdapter::getMute(const ControlTarget &)
{
    return ControlResult::notSupported("get_mute", protocol());
}

ControlResult ProtocolAdapter::setMute(const ControlTarget &, bool)
{
    return ControlResult::notSupported("set_mute", protocol());
}

NotImplementedAdapter::NotImplementedAdapter(Protocol protocol, const QString &note) :
    m_protocol{protocol},
    m_note{note.isEmpty() ? QStringLiteral("%1 control is not implemented")
                            .arg(protocol::id(protocol)) : note}
{
}

Protocol NotImplementedAdapter::protocol() const
{
    return m_protocol;
}

ControlResult NotImplementedAdapter::result(const QString &action) const
{
    return ControlResult::notImplemented(action, m_protocol, m_note);
}

ControlResult NotImplementedAdapter::play(const ControlTarget &)
{
    return result("play");
}

ControlResult NotImplementedAdapter::pause(const ControlTarget &)
{
    return result("pause");
}

ControlResult NotImplementedAdapter::stop(const ControlTarget &)
{
    return result("stop");
}

ControlResult NotImplementedAdapter::next(const ControlTarget &)
{
    return result("next");
}

ControlResult NotImplementedAdapter::previous(const ControlTarget &)
{
    return result("previous");
}

ControlResult NotImplementedAdapter::seek(const ControlTarget &, const QString &)
{
    return result("seek");
}

ControlResult NotImplementedAdapter::setUri(const ControlTarget &, const QString &, const QString &)
{
    return result("set_uri");
}

ControlResult NotImplementedAdapter::getVolume(const ControlTarget &)
{
    return result("get_volume");
}

ControlResult NotImplementedAdapter::setVolume(const ControlTarget &, int)
{
    return result("set_volume");
}

ControlResult NotImplementedAdapter::getMute(const ControlTarget &)
{
    return result("get_mute");
}

ControlResult NotImplementedAdapter::setMute(const ControlTarget &, bool)
{
    return result("set_mute");
}

std::shared_ptr<AdapterRegistry> AdapterRegistry::make_default(std::shared_ptr<SoapClient> soap,
                                                               int httpTimeout)
{
    auto registry = std::make_shared<AdapterRegistry>();

    registry->registerAdapter(std::make_shared<UpnpAdapter>(soap));
    registry->registerAdapter(std::make_shared<EcpAdapter>(httpTimeout));
    registry->registerAdapter(std::make_shared<SamsungWamAdapter>(httpTimeout));
    registry->registerAdapter(std::make_shared<NotImplementedAdapter>(
                                  Protocol::Cast, "Cast protocol requires WebSocket client"));

    for (auto p : {Protocol::HeosApi, Protocol::MusicCastApi, Protocol::SoundTouchApi,
                   Protocol::DenonApi, Protocol::OnkyoApi, Protocol::PioneerApi,
                   Protocol::SqueezeboxApi, Protocol::PlexApi, Protocol::JsonRpcApi,
                   Protocol::HttpInterface, Protocol::OpenWebNetApi, Protocol::BluesoundApi}) {
        registry->registerAdapter(std::make_shared<NotImplementedAdapter>(p));
    }

    return registry;
}

void AdapterRegistry::registerAdapter(std::shared_ptr<ProtocolAdapter> adapter)
{
    if (!adapter)
        return;
    m_adapters[adapter->protocol()] = std::move(adapter);
}

std::shared_ptr<ProtocolAdapter> AdapterRegistry::adapter(Protocol protocol) const
{
    auto it = m_adapters.find(protocol == Protocol::Generic ? Protocol::UPnP : protocol);
    if (it == m_adapters.end()) {
        qWarning() << "No adapter for protocol:" << protocol::id(protocol);
        return {};
    }
    return it->second;
}

bool AdapterRegistry::contains(Protocol protocol) const
{
    return m_adapters.find(protocol) != m_adapters.end();
}
