/* Copyright (C) 2023 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef SOAPCLIENT_H
#define SOAPCLIENT_H

#include <QByteArray>
#include <QMap>
#include <QString>
#include <QStringList>
#include <optional>
#include <utility>
#include <vector>

#include "controlresult.h"
#include "httpclient.h"

struct SoapFault
{
    QString faultCode;
    QString faultString;
    int errorCode = 0;
    QString errorDescription;

    QString message() const;
};

struct SoapResponse
{
    int status = 0;
    QByteArray body;
    ErrorType errorType = ErrorType::None;
    QString error;
    std::optional<SoapFault> fault;
    // Out arguments of the action response
    QMap<QString, QString> values;

    bool ok() const { return errorType == ErrorType::None; }
};

class SoapClient
{
public:
    using param = std::pair<QString, QString>;

    static const QStringList userAgents;

    explicit SoapClient(int timeout = HttpClient::defaultTimeout, bool stealthMode = false,
                        bool sslVerify = false);

    void setTimeout(int msecs);
    int timeout() const;
    void setStealthMode(bool value);
    bool stealthMode() const;
    void setSslVerify(bool value);

    static QByteArray buildEnvelope(const QString &serviceType, const QString &action,
                                    const std::vector<param> &args = {});
    std::vector<HttpClient::header> buildHeaders(const QString &serviceType,
                                                 const QString &action) const;
    static QString controlUrl(const QString &host, int port, const QString &controlPath,
                              bool useTLS);

    SoapResponse send(const QString &host, int port, const QString &controlPath,
                      const QString &serviceType, const QString &action,
                      const std::vector<param> &args = {}, bool useTLS = false) const;

    static std::optional<SoapFault> parseFault(const QByteArray &body);
    static QMap<QString, QString> parseResponse(const QByteArray &body);
    static QString errorDescription(int code);

    static void randomDelay(int minMsecs = 100, int maxMsecs = 500);

private:
    int m_timeout;
    bool m_stealthMode;
    bool m_sslVerify;
};

#endif // SOAPCLIENT_H
