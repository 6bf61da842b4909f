/* Copyright (C) 2023 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "taskexecutor.h"

#include <QString>
#include <QThread>
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <vector>

TEST_CASE("Task executor", "[executor]") {
    TaskExecutor executor{nullptr, 4};
    REQUIRE(executor.threadCount() == 4);

    SECTION("map keeps input order") {
        std::vector<int> items;
        for (int i = 0; i < 40; ++i)
            items.push_back(i);

        auto results = executor.map<int, QString>(items, [](const int &i) {
            QThread::msleep(static_cast<unsigned long>((40 - i) % 5));
            return QString::number(i * i);
        });

        REQUIRE(results.size() == items.size());
        REQUIRE(results.front() == QStringLiteral("0"));
        REQUIRE(results[7] == QStringLiteral("49"));
        REQUIRE(results.back() == QStringLiteral("1521"));
    }

    SECTION("jobs beyond the thread count are queued") {
        std::atomic<int> done{0};
        std::vector<std::function<void()>> jobs(20, [&done] { ++done; });
        executor.runAll(jobs);
        REQUIRE(done.load() == 20);
        REQUIRE(!executor.taskActive());
    }

    SECTION("empty input") {
        auto results = executor.map<int, int>({}, [](const int &i) { return i; });
        REQUIRE(results.empty());
    }
}

TEST_CASE("Task executor thread count is at least one", "[executor]") {
    TaskExecutor executor{nullptr, 0};
    REQUIRE(executor.threadCount() == 1);
}
