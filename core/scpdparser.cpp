/* Copyright (C) 2023 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "scpdparser.h"

#include <QDebug>
#include <QJsonArray>
#include <QUrl>
#include <functional>
#include <optional>

#include "devicedescription.h"
#include "httpclient.h"
#include "taskexecutor.h"
#include "xmltools.h"

QJsonObject StateVariable::toJson() const
{
    QJsonObject json{
        {"name", name},
        {"dataType", dataType},
        {"sendEvents", sendEvents}
    };

    if (!allowedValues.isEmpty())
        json.insert("allowedValues", QJsonArray::fromStringList(allowedValues));
    if (!defaultValue.isEmpty())
        json.insert("defaultValue", defaultValue);
    if (!minimum.isEmpty())
        json.insert("minimum", minimum);
    if (!maximum.isEmpty())
        json.insert("maximum", maximum);
    if (!step.isEmpty())
        json.insert("step", step);

    return json;
}

QJsonObject ActionArgument::toJson() const
{
    QJsonObject json{
        {"name", name},
        {"direction", direction},
        {"relatedStateVariable", relatedStateVariable},
        {"dataType", dataType}
    };

    if (!allowedValues.isEmpty())
        json.insert("allowedValues", QJsonArray::fromStringList(allowedValues));
    if (!defaultValue.isEmpty())
        json.insert("defaultValue", defaultValue);
    if (!minimum.isEmpty())
        json.insert("minimum", minimum);
    if (!maximum.isEmpty())
        json.insert("maximum", maximum);

    return json;
}

int SoapAction::argumentCount() const
{
    return int(argumentsIn.size() + argumentsOut.size());
}

QJsonObject SoapAction::toJson() const
{
    QJsonArray in, out;
    for (const auto &a : argumentsIn)
        in.append(a.toJson());
    for (const auto &a : argumentsOut)
        out.append(a.toJson());

    return {
        {"name", name},
        {"description", description},
        {"argumentsIn", in},
        {"argumentsOut", out}
    };
}

int ScpdDocument::actionCount() const
{
    return actions.size();
}

std::vector<const SoapAction*> ScpdDocument::actionsWithArguments() const
{
    std::vector<const SoapAction*> list;
    for (const auto &a : actions) {
        if (a.argumentCount() > 0)
            list.push_back(&a);
    }
    return list;
}

QJsonObject ScpdDocument::toJson() const
{
    QJsonObject actionsJson;
    for (auto it = actions.cbegin(); it != actions.cend(); ++it)
        actionsJson.insert(it.key(), it.value().toJson());

    QJsonObject varsJson;
    for (auto it = stateVariables.cbegin(); it != stateVariables.cend(); ++it)
        varsJson.insert(it.key(), it.value().toJson());

    return {
        {"serviceType", serviceType},
        {"scpdURL", scpdUrl},
        {"specVersion", QJsonObject{{"major", specVersionMajor}, {"minor", specVersionMinor}}},
        {"actions", actionsJson},
        {"stateVariables", varsJson},
        {"parsingSuccess", parsingSuccess},
        {"parsingErrors", QJsonArray::fromStringList(parsingErrors)}
    };
}

namespace scpd {

QString joinUrl(const QString &baseUrl, const QString &path)
{
    if (path.startsWith("http://", Qt::CaseInsensitive) ||
            path.startsWith("https://", Qt::CaseInsensitive))
        return path;

    auto base = baseUrl.endsWith('/') ? baseUrl.left(baseUrl.size() - 1) : baseUrl;
    return path.startsWith('/') ? base + path : base + '/' + path;
}

static std::optional<ActionArgument> parseArgument(const XmlNode &node, QString *error)
{
    ActionArgument arg;
    arg.name = node.childText("name");
    arg.direction = node.childText("direction").toLower();
    arg.relatedStateVariable = node.childText("relatedStateVariable");

    if (arg.name.isEmpty()) {
        *error = "argument without name";
        return std::nullopt;
    }

    if (arg.direction != "in" && arg.direction != "out") {
        *error = QStringLiteral("argument %1 has invalid direction '%2'").arg(arg.name, arg.direction);
        return std::nullopt;
    }

    return arg;
}

static std::optional<SoapAction> parseAction(const XmlNode &node, QStringList *errors)
{
    SoapAction action;
    action.name = node.childText("name");
    action.description = node.childText("description");

    if (action.name.isEmpty()) {
        errors->push_back("Action without name skipped");
        return std::nullopt;
    }

    if (auto argList = node.child("argumentList")) {
        for (auto argNode : argList->childrenNamed("argument")) {
            QString error;
            auto arg = parseArgument(*argNode, &error);
            if (!arg) {
                errors->push_back(QStringLiteral("Action %1: %2").arg(action.name, error));
                continue;
            }

            if (arg->direction == "in")
                action.argumentsIn.push_back(std::move(*arg));
            else
                action.argumentsOut.push_back(std::move(*arg));
        }
    }

    return action;
}

static std::optional<StateVariable> parseStateVariable(const XmlNode &node, QStringList *errors)
{
    StateVariable var;
    var.name = node.childText("name");
    var.dataType = node.childText("dataType");
    var.sendEvents = node.attribute("sendEvents", "yes").trimmed().toLower() == "yes";
    var.defaultValue = node.childText("defaultValue");

    if (var.name.isEmpty()) {
        errors->push_back("State variable without name skipped");
        return std::nullopt;
    }

    if (auto list = node.child("allowedValueList")) {
        for (auto v : list->childrenNamed("allowedValue"))
            var.allowedValues.push_back(v->text);
    }

    if (auto range = node.child("allowedValueRange")) {
        var.minimum = range->childText("minimum");
        var.maximum = range->childText("maximum");
        var.step = range->childText("step");
    }

    return var;
}

static void resolveArguments(ScpdDocument *doc)
{
    auto resolve = [doc](std::vector<ActionArgument> &args) {
        for (auto &arg : args) {
            auto it = doc->stateVariables.constFind(arg.relatedStateVariable);
            if (it == doc->stateVariables.cend())
                continue;
            arg.dataType = it->dataType;
            arg.allowedValues = it->allowedValues;
            arg.defaultValue = it->defaultValue;
            arg.minimum = it->minimum;
            arg.maximum = it->maximum;
        }
    };

    for (auto &action : doc->actions) {
        resolve(action.argumentsIn);
        resolve(action.argumentsOut);
    }
}

ScpdDocument parseScpd(const QByteArray &data, const QString &serviceType,
                       const QString &scpdUrl)
{
    ScpdDocument doc;
    doc.serviceType = serviceType;
    doc.scpdUrl = scpdUrl;

    QString error;
    auto root = xmltools::parseWithFallbacks(data, &error);
    if (!root) {
        qWarning() << "Cannot parse SCPD:" << scpdUrl << error;
        doc.parsingErrors.push_back(QStringLiteral("XML parse error: %1").arg(error));
        return doc;
    }

    doc.parsingSuccess = true;

    if (auto spec = root->child("specVersion")) {
        doc.specVersionMajor = spec->childText("major", "1").toInt();
        doc.specVersionMinor = spec->childText("minor", "0").toInt();
    }

    if (auto table = root->find("serviceStateTable")) {
        for (auto node : table->childrenNamed("stateVariable")) {
            if (auto var = parseStateVariable(*node, &doc.parsingErrors))
                doc.stateVariables.insert(var->name, *var);
        }
    }

    if (auto list = root->find("actionList")) {
        for (auto node : list->childrenNamed("action")) {
            auto action = parseAction(*node, &doc.parsingErrors);
            if (!action)
                continue;
            if (doc.actions.contains(action->name))
                doc.parsingErrors.push_back(QStringLiteral("Duplicate action %1 replaced").arg(action->name));
            doc.actions.insert(action->name, *action);
        }
    }

    resolveArguments(&doc);

    qDebug() << "SCPD parsed:" << serviceType << "actions:" << doc.actions.size()
             << "variables:" << doc.stateVariables.size() << "errors:" << doc.parsingErrors.size();

    return doc;
}

ScpdDocument fetchScpd(const QString &baseUrl, const QString &scpdPath,
                       const QString &serviceType, int timeout)
{
    auto url = joinUrl(baseUrl, scpdPath);

    HttpClient client;
    client.setTimeout(timeout);

    auto reply = client.get(QUrl{url});
    if (!reply.ok() || reply.data.isEmpty()) {
        ScpdDocument doc;
        doc.serviceType = serviceType;
        doc.scpdUrl = url;
        doc.parsingErrors.push_back(QStringLiteral("Failed to fetch SCPD content: %1")
                                    .arg(reply.errorString.isEmpty() ?
                                             QStringLiteral("HTTP %1").arg(reply.status) :
                                             reply.errorString));
        return doc;
    }

    return parseScpd(reply.data, serviceType, url);
}

static void collectServices(const Device &device, std::vector<Service> *services)
{
    for (const auto &s : device.services) {
        bool dup = false;
        for (const auto &e : *services) {
            if (e.serviceType == s.serviceType && e.scpdURL == s.scpdURL) {
                dup = true;
                break;
            }
        }
        if (!dup && !s.scpdURL.isEmpty())
            services->push_back(s);
    }
    for (const auto &d : device.embeddedDevices)
        collectServices(d, services);
}

std::vector<ScpdDocument> fetchDeviceScpds(const Device &device, int timeout, int concurrency)
{
    std::vector<Service> services;
    collectServices(device, &services);

    qDebug() << "Fetching SCPDs:" << device.friendlyName << "services:" << services.size();

    auto base = device.baseUrl();

    TaskExecutor executor{nullptr, concurrency};
    return executor.map<Service, ScpdDocument>(services,
        [&base, timeout](const Service &s) {
            return fetchScpd(base, s.scpdURL, s.serviceType, timeout);
        });
}
}
