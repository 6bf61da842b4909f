/* Copyright (C) 2023 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef CONTROLRESULT_H
#define CONTROLRESULT_H

#include <QString>
#include <QVariant>
#include <QVariantMap>

#include "protocol.h"

enum class ErrorType {
    None,
    Transport,
    Parse,
    ProtocolFault,
    Validation
};

QString errorTypeName(ErrorType type);

/*
 * Outcome of one control call. NotSupported and NotImplemented are regular
 * outcomes, only Error carries an error type.
 */
struct ControlResult
{
    enum class Status {
        Success,
        Error,
        NotSupported,
        NotImplemented
    };

    Status status = Status::Success;
    QString action;
    Protocol protocol = Protocol::UPnP;
    ErrorType errorType = ErrorType::None;
    QString error;
    int errorCode = 0;
    QVariantMap values;

    bool success() const { return status == Status::Success; }
    bool isError() const { return status == Status::Error; }

    static ControlResult ok(const QString &action, Protocol protocol, const QVariantMap &values = {});
    static ControlResult failed(const QString &action, Protocol protocol, ErrorType type,
                                const QString &error, int errorCode = 0);
    static ControlResult notSupported(const QString &action, Protocol protocol);
    static ControlResult notImplemented(const QString &action, Protocol protocol, const QString &note = {});

    static QString statusName(Status status);
    // {status, action, protocol, error?, error_type?, error_code?, ...values}
    QVariantMap toVariantMap() const;
};

#endif // CONTROLRESULT_H
