/* Copyright (C) 2021 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef HTTPCLIENT_H
#define HTTPCLIENT_H

#include <QObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QUrl>
#include <QByteArray>
#include <QString>
#include <utility>
#include <vector>

struct HttpReply
{
    int status = 0;
    QByteArray data;
    QNetworkReply::NetworkError error = QNetworkReply::NoError;
    QString errorString;
    bool timedOut = false;

    bool ok() const { return error == QNetworkReply::NoError && status >= 200 && status < 300; }
    // No HTTP status line was received
    bool transportError() const { return status == 0; }
};

class HttpClient : public QObject
{
     Q_OBJECT
public:
    using header = std::pair<QByteArray, QByteArray>;

    static constexpr int defaultTimeout = 10000;

    explicit HttpClient(QObject *parent = nullptr);

    void setTimeout(int msecs);
    int timeout() const;
    void setSslVerify(bool value);

    HttpReply get(const QUrl &url, const std::vector<header> &headers = {});
    HttpReply post(const QUrl &url, const QByteArray &body,
                   const std::vector<header> &headers = {});

private:
    enum class Method { Get, Post };

    int httpTimeout = defaultTimeout;
    bool sslVerify = false;

    HttpReply execute(Method method, const QUrl &url, const QByteArray &body,
                      const std::vector<header> &headers);
};

#endif // HTTPCLIENT_H
