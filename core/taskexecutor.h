/* Copyright (C) 2017 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef TASKEXECUTOR_H
#define TASKEXECUTOR_H

#include <QRunnable>
#include <QThreadPool>
#include <QObject>

#include <functional>
#include <vector>

class TaskExecutor
{
public:
    class Task : public QRunnable
    {
    public:
        Task(std::function<void()> job);

    private:
        std::function<void()> m_job;
        void run();
    };

    TaskExecutor(QObject* parent = nullptr, int threadCount = 1);

    // Jobs beyond the thread count are queued, not dropped
    void startTask(const std::function<void()> &job);
    void waitForDone(int msecs = -1);
    bool taskActive();
    int threadCount() const;

    // Fan-out: runs every job on the pool and blocks until all of them finished
    void runAll(const std::vector<std::function<void()>> &jobs);

    // Results keep the order of the input items
    template<typename T, typename R>
    std::vector<R> map(const std::vector<T> &items, const std::function<R(const T&)> &fun)
    {
        std::vector<R> results(items.size());
        std::vector<std::function<void()>> jobs;
        jobs.reserve(items.size());
        for (size_t i = 0; i < items.size(); ++i)
            jobs.push_back([&results, &items, &fun, i] { results[i] = fun(items[i]); });
        runAll(jobs);
        return results;
    }

private:
    QThreadPool m_pool;
};

#endif // TASKEXECUTOR_H
