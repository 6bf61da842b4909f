/* Copyright (C) 2017-2021 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QStringList>
#include <algorithm>

#include "profilegenerator.h"
#include "devicedescription.h"

namespace profilegen
{
static const QStringList capabilityCategories{
    "media_control", "volume_control", "information_retrieval", "configuration", "security"
};

static bool containsAny(const QString &value, const QStringList &keywords)
{
    return std::any_of(keywords.cbegin(), keywords.cend(),
                       [&value](const QString &k) { return value.contains(k); });
}

static QJsonArray toJsonArray(const QStringList &list)
{
    return QJsonArray::fromStringList(list);
}

static QString timestamp(const QDateTime &dt)
{
    return dt.toString("yyyy-MM-dd hh:mm:ss");
}

QString serviceName(const QString &serviceType)
{
    auto parts = serviceType.split(':');
    if (parts.size() >= 2)
        return parts.at(parts.size() - 2).toLower();
    return serviceType.toLower();
}

QString complexity(const SoapAction &action)
{
    auto count = action.argumentCount();
    if (count == 0)
        return "easy";
    if (count <= 2)
        return "medium";
    return "complex";
}

QString category(const QString &actionName)
{
    auto name = actionName.toLower();

    if (containsAny(name, {"play", "pause", "stop", "next", "previous", "seek"}))
        return "media_control";
    if (containsAny(name, {"volume", "mute", "bass", "treble"}))
        return "volume_control";
    if (containsAny(name, {"get", "info", "status", "current", "list"}))
        return "information_retrieval";
    if (containsAny(name, {"set", "config", "update", "add", "remove"}))
        return "configuration";
    if (containsAny(name, {"auth", "security", "login", "password"}))
        return "security";
    return "other";
}

QJsonObject argumentValidation(const ActionArgument &argument,
                               const QMap<QString, StateVariable> &stateVariables)
{
    QJsonObject validation;

    if (argument.relatedStateVariable.isEmpty())
        return validation;

    auto it = stateVariables.find(argument.relatedStateVariable);
    if (it == stateVariables.end())
        return validation;

    const auto &var = it.value();
    if (!var.allowedValues.isEmpty())
        validation.insert("allowed_values", toJsonArray(var.allowedValues));
    if (!var.minimum.isEmpty())
        validation.insert("minimum", var.minimum);
    if (!var.maximum.isEmpty())
        validation.insert("maximum", var.maximum);
    if (!var.dataType.isEmpty())
        validation.insert("data_type", var.dataType);

    return validation;
}

QString soapTemplate(const SoapAction &action, const QString &serviceType)
{
    QStringList args;
    for (const auto &arg : action.argumentsIn)
        args << QStringLiteral("      <%1>{%2}</%1>").arg(arg.name, arg.name.toUpper());

    QString body = QStringLiteral("<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
                                  "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" "
                                  "s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">\n"
                                  "  <s:Body>\n"
                                  "    <u:%1 xmlns:u=\"%2\">\n").arg(action.name, serviceType);
    if (!args.isEmpty())
        body += args.join('\n') + '\n';
    body += QStringLiteral("    </u:%1>\n"
                           "  </s:Body>\n"
                           "</s:Envelope>").arg(action.name);
    return body;
}

static QString controlUrl(const Device &device, const QString &serviceType)
{
    for (const auto &s : device.services) {
        if (s.serviceType == serviceType)
            return s.controlURL;
    }
    return {};
}

static QJsonObject argumentJson(const ActionArgument &arg)
{
    return QJsonObject{
        {"name", arg.name},
        {"direction", arg.direction},
        {"data_type", arg.dataType},
        {"related_state_variable", arg.relatedStateVariable}
    };
}

QJsonObject generateProfile(const Device &device, const std::vector<ScpdDocument> &documents,
                            const QDateTime &generatedAt)
{
    auto orUnknown = [](const QString &v) { return v.isEmpty() ? QStringLiteral("Unknown") : v; };

    QJsonObject services;
    QJsonObject inventory;
    QJsonObject stateVariables;
    QMap<QString, QStringList> capabilities;
    QJsonArray parsingErrors;
    int successful = 0;
    int totalActions = 0;

    for (const auto &doc : documents) {
        totalActions += doc.actionCount();

        if (!doc.parsingSuccess) {
            for (const auto &e : doc.parsingErrors)
                parsingErrors.append(e);
            continue;
        }

        ++successful;
        const auto name = serviceName(doc.serviceType);

        services.insert(name, QJsonObject{
            {"serviceType", doc.serviceType},
            {"scpdURL", doc.scpdUrl},
            {"controlURL", controlUrl(device, doc.serviceType)},
            {"action_count", doc.actionCount()},
            {"parsing_success", true}
        });

        QJsonObject actions;
        for (auto it = doc.actions.cbegin(); it != doc.actions.cend(); ++it) {
            const auto &action = it.value();

            QJsonArray in;
            for (const auto &arg : action.argumentsIn) {
                auto json = argumentJson(arg);
                json.insert("required", true);
                json.insert("validation", argumentValidation(arg, doc.stateVariables));
                in.append(json);
            }

            QJsonArray out;
            for (const auto &arg : action.argumentsOut)
                out.append(argumentJson(arg));

            const auto cat = category(action.name);
            actions.insert(it.key(), QJsonObject{
                {"name", action.name},
                {"description", action.description},
                {"arguments_in", in},
                {"arguments_out", out},
                {"complexity", complexity(action)},
                {"category", cat},
                {"soap_template", soapTemplate(action, doc.serviceType)}
            });

            if (cat != QLatin1String("other") && !capabilities[cat].contains(it.key()))
                capabilities[cat] << it.key();
        }
        inventory.insert(name, actions);

        QJsonObject vars;
        for (auto it = doc.stateVariables.cbegin(); it != doc.stateVariables.cend(); ++it) {
            const auto &var = it.value();
            vars.insert(it.key(), QJsonObject{
                {"name", var.name},
                {"data_type", var.dataType},
                {"send_events", var.sendEvents},
                {"default_value", var.defaultValue},
                {"allowed_values", toJsonArray(var.allowedValues)},
                {"minimum", var.minimum},
                {"maximum", var.maximum},
                {"step", var.step}
            });
        }
        stateVariables.insert(name, vars);
    }

    QJsonObject capsJson;
    int categorized = 0;
    for (const auto &cat : capabilityCategories) {
        capsJson.insert(cat, toJsonArray(capabilities.value(cat)));
        categorized += capabilities.value(cat).size();
    }

    QJsonObject profile;
    profile.insert("name", orUnknown(device.manufacturer) + ' ' + orUnknown(device.modelName));
    // An empty pattern would match every device
    QJsonObject match;
    if (!device.manufacturer.isEmpty())
        match.insert("manufacturer", QJsonArray{device.manufacturer});
    if (!device.modelName.isEmpty())
        match.insert("modelName", QJsonArray{device.modelName});
    if (!device.deviceType.isEmpty())
        match.insert("deviceType", QJsonArray{device.deviceType});
    profile.insert("match", match);
    profile.insert("metadata", QJsonObject{
        {"generated_at", timestamp(generatedAt)},
        {"scpd_analysis", QJsonObject{
             {"services_analyzed", static_cast<int>(documents.size())},
             {"successful_parses", successful},
             {"total_actions", totalActions},
             {"parsing_errors", parsingErrors}
         }}
    });
    profile.insert("upnp", QJsonObject{
        {"services", services},
        {"action_inventory", inventory},
        {"state_variables", stateVariables},
        {"capabilities", capsJson}
    });
    profile.insert("capabilities", QJsonObject{
        {"media_control_actions", capabilities.value("media_control").size()},
        {"volume_control_actions", capabilities.value("volume_control").size()},
        {"information_actions", capabilities.value("information_retrieval").size()},
        {"configuration_actions", capabilities.value("configuration").size()},
        {"security_actions", capabilities.value("security").size()},
        {"total_actions", categorized}
    });

    return profile;
}

QJsonObject generateProfiles(const std::vector<Device> &devices, int timeout, int concurrency)
{
    QJsonArray profiles;
    QJsonArray errors;
    int totalServices = 0;
    int totalActions = 0;
    int totalStateVariables = 0;

    for (const auto &device : devices) {
        auto docs = scpd::fetchDeviceScpds(device, timeout, concurrency);
        auto profile = generateProfile(device, docs);

        if (profile.value("capabilities").toObject().value("total_actions").toInt() == 0) {
            qWarning() << "no actionable profile for" << device.friendlyName << device.endpoint();
            continue;
        }

        auto analysis = profile.value("metadata").toObject().value("scpd_analysis").toObject();
        totalServices += analysis.value("services_analyzed").toInt();
        totalActions += analysis.value("total_actions").toInt();
        for (const auto &e : analysis.value("parsing_errors").toArray())
            errors.append(e);

        auto vars = profile.value("upnp").toObject().value("state_variables").toObject();
        for (const auto &service : vars)
            totalStateVariables += service.toObject().size();

        qDebug() << "profile generated:" << profile.value("name").toString();
        profiles.append(profile);
    }

    return QJsonObject{
        {"metadata", QJsonObject{
             {"generated_at", timestamp(QDateTime::currentDateTime())},
             {"generation_method", "enhanced_scpd_analysis"},
             {"total_devices", static_cast<int>(devices.size())},
             {"profiles_generated", profiles.size()}
         }},
        {"profiles", profiles},
        {"analysis_summary", QJsonObject{
             {"total_services", totalServices},
             {"total_actions", totalActions},
             {"total_state_variables", totalStateVariables},
             {"parsing_errors", errors}
         }}
    };
}

static bool writeJson(const QString &path, const QJsonObject &json)
{
    QFile file{path};
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "cannot open file for writing:" << path << file.errorString();
        return false;
    }
    if (file.write(QJsonDocument{json}.toJson(QJsonDocument::Indented)) < 0) {
        qWarning() << "cannot write file:" << path << file.errorString();
        return false;
    }
    return true;
}

QString saveProfiles(const QJsonObject &collection, const QString &dir, bool individualFiles)
{
    QDir outDir{dir};
    if (!outDir.mkpath(".")) {
        qWarning() << "cannot create dir:" << dir;
        return {};
    }

    auto stamp = QDateTime::currentDateTime().toString("yyyyMMdd_hhmmss");
    auto mainFile = outDir.filePath(QStringLiteral("enhanced_profiles_%1.json").arg(stamp));
    if (!writeJson(mainFile, collection))
        return {};

    auto profiles = collection.value("profiles").toArray();
    if (individualFiles && !profiles.isEmpty()) {
        auto subdir = QStringLiteral("enhanced_profiles_%1_individual").arg(stamp);
        if (!outDir.mkpath(subdir)) {
            qWarning() << "cannot create dir:" << outDir.filePath(subdir);
            return mainFile;
        }

        for (const auto &value : profiles) {
            auto profile = value.toObject();
            auto name = profile.value("name").toString().replace(' ', '_').replace('/', '_');
            auto actions = profile.value("capabilities").toObject().value("total_actions").toInt();
            writeJson(outDir.filePath(QStringLiteral("%1/%2_%3actions.json")
                                      .arg(subdir, name).arg(actions)), profile);
        }
    }

    qDebug() << "profiles saved:" << mainFile;

    return mainFile;
}
}
