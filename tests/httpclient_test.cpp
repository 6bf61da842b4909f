/* Copyright (C) 2023 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "httpclient.h"
#include "taskexecutor.h"

#include <QElapsedTimer>
#include <QHostAddress>
#include <QTcpServer>
#include <QUrl>
#include <catch2/catch_test_macros.hpp>
#include <functional>
#include <vector>

TEST_CASE("HTTP client timeout", "[http]") {
    // Accepted by the kernel backlog, never answered
    QTcpServer silent;
    REQUIRE(silent.listen(QHostAddress::LocalHost));
    const QUrl url{QStringLiteral("http://127.0.0.1:%1/description.xml").arg(silent.serverPort())};

    SECTION("unanswered request times out") {
        HttpClient client;
        client.setTimeout(300);
        REQUIRE(client.timeout() == 300);

        QElapsedTimer timer;
        timer.start();
        auto reply = client.get(url);

        REQUIRE(timer.elapsed() < 2000);
        REQUIRE(reply.timedOut);
        REQUIRE(!reply.ok());
        REQUIRE(reply.transportError());
        REQUIRE(reply.errorString == QStringLiteral("Timeout after 300 ms"));
    }

    SECTION("clients in worker threads time out independently") {
        TaskExecutor executor{nullptr, 4};
        std::vector<int> timeouts{300, 300, 300, 300};
        std::function<int(const int&)> fetch = [&url](const int &msecs) {
            HttpClient client;
            client.setTimeout(msecs);
            return client.get(url).timedOut ? 1 : 0;
        };

        QElapsedTimer timer;
        timer.start();
        auto results = executor.map(timeouts, fetch);

        REQUIRE(timer.elapsed() < 1100);
        REQUIRE(results == (std::vector<int>{1, 1, 1, 1}));
    }

    SECTION("invalid timeout falls back to the default") {
        HttpClient client;
        client.setTimeout(0);
        REQUIRE(client.timeout() == HttpClient::defaultTimeout);
    }
}
