/* Copyright (C) 2023 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "soapclient.h"

#include <QDebug>
#include <QHash>
#include <QRandomGenerator>
#include <QThread>
#include <QUrl>

#include "xmltools.h"

const QStringList SoapClient::userAgents{
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36",
    "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/605.1.15 (KHTML, like Gecko) Version/17.1 Safari/605.1.15",
    "Mozilla/5.0 (X11; Linux x86_64; rv:121.0) Gecko/20100101 Firefox/121.0",
    "Sonos/70.3-35220 (ACR_Android)",
    "VLC/3.0.20 LibVLC/3.0.20"
};

QString SoapFault::message() const
{
    if (errorCode != 0)
        return QStringLiteral("UPnP error %1: %2").arg(errorCode).arg(errorDescription);
    if (!faultString.isEmpty())
        return QStringLiteral("SOAP fault: %1").arg(faultString);
    return QStringLiteral("SOAP fault: %1").arg(faultCode);
}

SoapClient::SoapClient(int timeout, bool stealthMode, bool sslVerify) :
    m_timeout{timeout},
    m_stealthMode{stealthMode},
    m_sslVerify{sslVerify}
{
}

void SoapClient::setTimeout(int msecs)
{
    m_timeout = msecs;
}

int SoapClient::timeout() const
{
    return m_timeout;
}

void SoapClient::setStealthMode(bool value)
{
    m_stealthMode = value;
}

bool SoapClient::stealthMode() const
{
    return m_stealthMode;
}

void SoapClient::setSslVerify(bool value)
{
    m_sslVerify = value;
}

QString SoapClient::errorDescription(int code)
{
    static const QHash<int, QString> codes{
        {401, "Invalid Action"},
        {402, "Invalid Args"},
        {501, "Action Failed"},
        {600, "Argument Value Invalid"},
        {601, "Argument Value Out of Range"},
        {602, "Optional Action Not Implemented"},
        {603, "Out of Memory"},
        {604, "Human Intervention Required"},
        {605, "String Argument Too Long"},
        {701, "Transition not available"},
        {702, "No contents"},
        {703, "Read error"},
        {704, "Format not supported for recording"},
        {705, "Transport is locked"},
        {706, "Write error"},
        {707, "Media is protected or not writeable"},
        {708, "Format not supported"},
        {709, "Transport must be stopped"},
        {710, "Seek mode not supported"},
        {711, "Illegal seek target"},
        {712, "Play mode not supported"},
        {713, "Record quality not supported"},
        {714, "Illegal MIME-Type"},
        {715, "Content BUSY"},
        {716, "Resource Not found"},
        {717, "Play speed not supported"},
        {718, "Invalid InstanceID"}
    };

    return codes.value(code, QStringLiteral("Unknown error %1").arg(code));
}

QByteArray SoapClient::buildEnvelope(const QString &serviceType, const QString &action,
                                     const std::vector<param> &args)
{
    QString body;
    for (const auto& [name, value] : args)
        body.append(QStringLiteral("<%1>%2</%1>").arg(name, value.toHtmlEscaped()));

    return QStringLiteral(
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
        "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" "
        "s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">"
        "<s:Body>"
        "<u:%1 xmlns:u=\"%2\">%3</u:%1>"
        "</s:Body>"
        "</s:Envelope>").arg(action, serviceType, body).toUtf8();
}

std::vector<HttpClient::header> SoapClient::buildHeaders(const QString &serviceType,
                                                         const QString &action) const
{
    std::vector<HttpClient::header> headers{
        {"Content-Type", "text/xml; charset=\"utf-8\""},
        {"SOAPAction", QStringLiteral("\"%1#%2\"").arg(serviceType, action).toUtf8()},
        {"Connection", "close"}
    };

    if (m_stealthMode) {
        auto idx = QRandomGenerator::global()->bounded(userAgents.size());
        headers.emplace_back("User-Agent", userAgents.at(idx).toUtf8());
        headers.emplace_back("Accept", "text/xml,application/xml,*/*;q=0.8");
        headers.emplace_back("Accept-Language", "en-US,en;q=0.9");
        headers.emplace_back("Cache-Control", "no-cache");
    }

    return headers;
}

QString SoapClient::controlUrl(const QString &host, int port, const QString &controlPath,
                               bool useTLS)
{
    if (controlPath.startsWith("http://") || controlPath.startsWith("https://"))
        return controlPath;

    return QStringLiteral("%1://%2:%3%4").arg(useTLS ? "https" : "http", host)
            .arg(port).arg(controlPath.startsWith('/') ? controlPath : '/' + controlPath);
}

void SoapClient::randomDelay(int minMsecs, int maxMsecs)
{
    auto delay = QRandomGenerator::global()->bounded(minMsecs, maxMsecs + 1);
    QThread::msleep(static_cast<unsigned long>(delay));
}

std::optional<SoapFault> SoapClient::parseFault(const QByteArray &body)
{
    if (body.isEmpty())
        return std::nullopt;

    auto root = xmltools::parseWithFallbacks(body);
    if (!root)
        return std::nullopt;

    auto faultNode = root->find("Fault");
    if (!faultNode)
        return std::nullopt;

    SoapFault fault;
    fault.faultCode = faultNode->childText("faultcode");
    fault.faultString = faultNode->childText("faultstring");

    if (auto upnpError = faultNode->find("UPnPError")) {
        fault.errorCode = upnpError->childText("errorCode").toInt();
        fault.errorDescription = upnpError->childText("errorDescription");
        if (fault.errorDescription.isEmpty() && fault.errorCode != 0)
            fault.errorDescription = errorDescription(fault.errorCode);
    }

    return fault;
}

QMap<QString, QString> SoapClient::parseResponse(const QByteArray &body)
{
    QMap<QString, QString> values;

    auto root = xmltools::parseWithFallbacks(body);
    if (!root)
        return values;

    auto bodyNode = root->find("Body");
    if (!bodyNode || bodyNode->children.empty())
        return values;

    for (const auto &arg : bodyNode->children.front().children)
        values.insert(arg.name, arg.text);

    return values;
}

SoapResponse SoapClient::send(const QString &host, int port, const QString &controlPath,
                              const QString &serviceType, const QString &action,
                              const std::vector<param> &args, bool useTLS) const
{
    SoapResponse response;

    auto url = controlUrl(host, port, controlPath, useTLS);
    auto envelope = buildEnvelope(serviceType, action, args);

    qDebug() << "SOAP call:" << action << url;

    if (m_stealthMode)
        randomDelay();

    HttpClient client;
    client.setTimeout(m_timeout);
    client.setSslVerify(m_sslVerify);

    auto reply = client.post(QUrl{url}, envelope, buildHeaders(serviceType, action));
    response.status = reply.status;
    response.body = reply.data;

    if (reply.transportError()) {
        response.errorType = ErrorType::Transport;
        response.error = reply.errorString;
        return response;
    }

    // Some renderers return faults with status 200
    if (auto fault = parseFault(reply.data)) {
        response.errorType = ErrorType::ProtocolFault;
        response.error = fault->message();
        response.fault = fault;
        qWarning() << "SOAP fault:" << action << response.error;
        return response;
    }

    if (reply.status < 200 || reply.status >= 300) {
        response.errorType = ErrorType::ProtocolFault;
        response.error = QStringLiteral("HTTP %1").arg(reply.status);
        qWarning() << "SOAP call failed:" << action << response.error;
        return response;
    }

    response.values = parseResponse(reply.data);

    return response;
}
