/* Copyright (C) 2023 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef SCPDPARSER_H
#define SCPDPARSER_H

#include <QByteArray>
#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QStringList>
#include <vector>

struct Device;

struct StateVariable
{
    QString name;
    QString dataType;
    bool sendEvents = true;
    QStringList allowedValues;
    QString defaultValue;
    // Range values are kept as declared, empty when absent
    QString minimum;
    QString maximum;
    QString step;

    QJsonObject toJson() const;
};

struct ActionArgument
{
    QString name;
    QString direction;
    QString relatedStateVariable;

    // Resolved from the related state variable
    QString dataType;
    QStringList allowedValues;
    QString defaultValue;
    QString minimum;
    QString maximum;

    QJsonObject toJson() const;
};

struct SoapAction
{
    QString name;
    QString description;
    std::vector<ActionArgument> argumentsIn;
    std::vector<ActionArgument> argumentsOut;

    int argumentCount() const;
    QJsonObject toJson() const;
};

struct ScpdDocument
{
    QString serviceType;
    QString scpdUrl;
    int specVersionMajor = 1;
    int specVersionMinor = 0;
    QMap<QString, SoapAction> actions;
    QMap<QString, StateVariable> stateVariables;
    bool parsingSuccess = false;
    QStringList parsingErrors;

    int actionCount() const;
    std::vector<const SoapAction*> actionsWithArguments() const;
    QJsonObject toJson() const;
};

namespace scpd
{
QString joinUrl(const QString &baseUrl, const QString &path);
ScpdDocument parseScpd(const QByteArray &data, const QString &serviceType,
                       const QString &scpdUrl = {});
ScpdDocument fetchScpd(const QString &baseUrl, const QString &scpdPath,
                       const QString &serviceType, int timeout);
// One concurrent fetch per service of the device and its embedded devices
std::vector<ScpdDocument> fetchDeviceScpds(const Device &device, int timeout,
                                           int concurrency);
}

#endif // SCPDPARSER_H
