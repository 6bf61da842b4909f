/* Copyright (C) 2017-2021 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef PROFILEGENERATOR_H
#define PROFILEGENERATOR_H

#include <QDateTime>
#include <QJsonObject>
#include <QMap>
#include <QString>
#include <vector>

#include "scpdparser.h"

struct Device;

namespace profilegen
{
// "urn:schemas-upnp-org:service:AVTransport:1" -> "avtransport"
QString serviceName(const QString &serviceType);
QString complexity(const SoapAction &action);
QString category(const QString &actionName);
QJsonObject argumentValidation(const ActionArgument &argument,
                               const QMap<QString, StateVariable> &stateVariables);
QString soapTemplate(const SoapAction &action, const QString &serviceType);

QJsonObject generateProfile(const Device &device, const std::vector<ScpdDocument> &documents,
                            const QDateTime &generatedAt = QDateTime::currentDateTime());
// Fetches SCPDs of every device, devices without any action are left out
QJsonObject generateProfiles(const std::vector<Device> &devices, int timeout, int concurrency);
// Returns path of the collection file or empty string on failure
QString saveProfiles(const QJsonObject &collection, const QString &dir,
                     bool individualFiles = true);
}

#endif // PROFILEGENERATOR_H
