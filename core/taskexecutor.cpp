/* Copyright (C) 2017 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <QDebug>
#include <QtGlobal>

#include "taskexecutor.h"

TaskExecutor::Task::Task(std::function<void()> job) : m_job(job)
{
}

void TaskExecutor::Task::run()
{
    m_job();
}

TaskExecutor::TaskExecutor(QObject* parent, int threadCount) :
    m_pool(parent)
{
    m_pool.setMaxThreadCount(qMax(1, threadCount));
}

void TaskExecutor::startTask(const std::function<void()> &job)
{
    if (m_pool.activeThreadCount() >= m_pool.maxThreadCount())
        qDebug() << "All workers busy, task queued";

    auto task = new Task(job);
    task->setAutoDelete(true);
    m_pool.start(task);
}

void TaskExecutor::waitForDone(int msecs)
{
    m_pool.waitForDone(msecs);
}

bool TaskExecutor::taskActive()
{
    return m_pool.activeThreadCount() > 0;
}

int TaskExecutor::threadCount() const
{
    return m_pool.maxThreadCount();
}

void TaskExecutor::runAll(const std::vector<std::function<void()>> &jobs)
{
    for (const auto &job : jobs)
        startTask(job);
    m_pool.waitForDone();
}
