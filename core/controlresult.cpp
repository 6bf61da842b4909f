/* Copyright (C) 2023 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "controlresult.h"

QString errorTypeName(ErrorType type)
{
    switch (type) {
    case ErrorType::None:
        return {};
    case ErrorType::Transport:
        return "transport_error";
    case ErrorType::Parse:
        return "parse_error";
    case ErrorType::ProtocolFault:
        return "protocol_fault";
    case ErrorType::Validation:
        return "validation_error";
    }
    return {};
}

ControlResult ControlResult::ok(const QString &action, Protocol protocol, const QVariantMap &values)
{
    ControlResult r;
    r.status = Status::Success;
    r.action = action;
    r.protocol = protocol;
    r.values = values;
    return r;
}

ControlResult ControlResult::failed(const QString &action, Protocol protocol, ErrorType type,
                                    const QString &error, int errorCode)
{
    ControlResult r;
    r.status = Status::Error;
    r.action = action;
    r.protocol = protocol;
    r.errorType = type;
    r.error = error;
    r.errorCode = errorCode;
    return r;
}

ControlResult ControlResult::notSupported(const QString &action, Protocol protocol)
{
    ControlResult r;
    r.status = Status::NotSupported;
    r.action = action;
    r.protocol = protocol;
    return r;
}

ControlResult ControlResult::notImplemented(const QString &action, Protocol protocol, const QString &note)
{
    ControlResult r;
    r.status = Status::NotImplemented;
    r.action = action;
    r.protocol = protocol;
    if (!note.isEmpty())
        r.values.insert("note", note);
    return r;
}

QString ControlResult::statusName(Status status)
{
    switch (status) {
    case Status::Success:
        return "success";
    case Status::Error:
        return "error";
    case Status::NotSupported:
        return "not_supported";
    case Status::NotImplemented:
        return "not_implemented";
    }
    return "error";
}

QVariantMap ControlResult::toVariantMap() const
{
    auto map = values;
    map.insert("status", statusName(status));
    map.insert("action", action);
    map.insert("protocol", protocol::id(protocol));

    if (status == Status::Error) {
        map.insert("error", error);
        map.insert("error_type", errorTypeName(errorType));
        if (errorCode != 0)
            map.insert("error_code", errorCode);
    }

    return map;
}
