/* Copyright (C) 2021 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef PROTOCOLADAPTER_H
#define PROTOCOLADAPTER_H

#include <QString>
#include <map>
#include <memory>

#include "controlresult.h"
#include "profilestore.h"
#include "protocol.h"

class SoapClient;

struct ControlTarget
{
    QString host;
    int port = 0;
    bool useTLS = false;
    ControlInfo info;
};

class ProtocolAdapter
{
public:
    virtual ~ProtocolAdapter() = default;

    virtual Protocol protocol() const = 0;
    virtual ControlResult play(const ControlTarget &target) = 0;
    virtual ControlResult pause(const ControlTarget &target) = 0;
    virtual ControlResult stop(const ControlTarget &target) = 0;
    virtual ControlResult next(const ControlTarget &target);
    virtual ControlResult previous(const ControlTarget &target);
    // Position is "HH:MM:SS" or a number of seconds
    virtual ControlResult seek(const ControlTarget &target, const QString &position);
    virtual ControlResult setUri(const ControlTarget &target, const QString &uri,
                                 const QString &metadata = {});
    virtual ControlResult getVolume(const ControlTarget &target);
    virtual ControlResult setVolume(const ControlTarget &target, int level);
    virtual ControlResult getMute(const ControlTarget &target);
    virtual ControlResult setMute(const ControlTarget &target, bool muted);
};

// Vendor protocols declared in profiles without a control implementation
class NotImplementedAdapter : public ProtocolAdapter
{
public:
    explicit NotImplementedAdapter(Protocol protocol, const QString &note = {});

    Protocol protocol() const override;
    ControlResult play(const ControlTarget &target) override;
    ControlResult pause(const ControlTarget &target) override;
    ControlResult stop(const ControlTarget &target) override;
    ControlResult next(const ControlTarget &target) override;
    ControlResult previous(const ControlTarget &target) override;
    ControlResult seek(const ControlTarget &target, const QString &position) override;
    ControlResult setUri(const ControlTarget &target, const QString &uri,
                         const QString &metadata = {}) override;
    ControlResult getVolume(const ControlTarget &target) override;
    ControlResult setVolume(const ControlTarget &target, int level) override;
    ControlResult getMute(const ControlTarget &target) override;
    ControlResult setMute(const ControlTarget &target, bool muted) override;

private:
    Protocol m_protocol;
    QString m_note;

    ControlResult result(const QString &action) const;
};

class AdapterRegistry
{
public:
    static std::shared_ptr<AdapterRegistry> make_default(std::shared_ptr<SoapClient> soap,
                                                         int httpTimeout);

    void registerAdapter(std::shared_ptr<ProtocolAdapter> adapter);
    // Generic resolves to the UPnP adapter
    std::shared_ptr<ProtocolAdapter> adapter(Protocol protocol) const;
    bool contains(Protocol protocol) const;

private:
    std::map<Protocol, std::shared_ptr<ProtocolAdapter>> m_adapters;
};

#endif // PROTOCOLADAPTER_H
