/* Copyright (C) 2021 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "httpclient.h"

#include <QDebug>
#include <QTimer>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QEventLoop>
#include <QSslConfiguration>
#include <QSslSocket>

#include "info.h"

HttpClient::HttpClient(QObject *parent) :
    QObject(parent)
{
}

void HttpClient::setTimeout(int msecs)
{
    httpTimeout = msecs > 0 ? msecs : defaultTimeout;
}

int HttpClient::timeout() const
{
    return httpTimeout;
}

void HttpClient::setSslVerify(bool value)
{
    sslVerify = value;
}

HttpReply HttpClient::get(const QUrl &url, const std::vector<header> &headers)
{
    return execute(Method::Get, url, {}, headers);
}

HttpReply HttpClient::post(const QUrl &url, const QByteArray &body,
                           const std::vector<header> &headers)
{
    return execute(Method::Post, url, body, headers);
}

HttpReply HttpClient::execute(Method method, const QUrl &url, const QByteArray &body,
                              const std::vector<header> &headers)
{
#ifdef QT_DEBUG
    qDebug() << (method == Method::Get ? "GET" : "POST") << url;
#endif

    QNetworkRequest request;
    request.setUrl(url);
    request.setAttribute(QNetworkRequest::FollowRedirectsAttribute, true);
    request.setHeader(QNetworkRequest::UserAgentHeader, Upnpc::USER_AGENT);
    for (const auto& [name, value] : headers)
        request.setRawHeader(name, value);

    if (!sslVerify && url.scheme() == "https") {
        auto conf = QSslConfiguration::defaultConfiguration();
        conf.setPeerVerifyMode(QSslSocket::VerifyNone);
        request.setSslConfiguration(conf);
    }

    // Calls come from worker threads, a manager lives in the thread that uses it
    QNetworkAccessManager manager;

    QNetworkReply* reply;
    if (method == Method::Get)
        reply = manager.get(request);
    else
        reply = manager.post(request, body);

    bool timedOut = false;
    QTimer::singleShot(httpTimeout, reply, [reply, &timedOut] {
        timedOut = true;
        reply->abort();
    });

    QEventLoop loop;
    connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);

    if (!reply->isFinished())
        loop.exec();

    HttpReply result;
    result.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    result.error = reply->error();
    result.timedOut = timedOut;
    result.data = reply->readAll();

    if (result.error != QNetworkReply::NoError) {
        result.errorString = timedOut ? QStringLiteral("Timeout after %1 ms").arg(httpTimeout)
                                      : reply->errorString();
        if (result.transportError())
            qWarning() << "Transport error:" << result.error << result.errorString << url;
    }

    reply->deleteLater();

    return result;
}
