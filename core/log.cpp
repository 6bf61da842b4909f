/* Copyright (C) 2019 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "log.h"

#include <QByteArray>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QThread>

FILE * logFile = nullptr;

static QString logFilePath;
static QtMsgType minLevel = QtInfoMsg;
static QMutex logMutex;

static int severity(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:
        return 0;
    case QtInfoMsg:
        return 1;
    case QtWarningMsg:
        return 2;
    case QtCriticalMsg:
        return 3;
    case QtFatalMsg:
        return 4;
    }
    return 0;
}

void setLogLevel(const QString &level)
{
    auto l = level.trimmed().toLower();

    QMutexLocker locker(&logMutex);
    if (l == "debug")
        minLevel = QtDebugMsg;
    else if (l == "info")
        minLevel = QtInfoMsg;
    else if (l == "warning" || l == "warn")
        minLevel = QtWarningMsg;
    else if (l == "error" || l == "critical")
        minLevel = QtCriticalMsg;
    else
        minLevel = QtInfoMsg;
}

QtMsgType logLevel()
{
    QMutexLocker locker(&logMutex);
    return minLevel;
}

bool setLogFilePath(const QString &path)
{
    QMutexLocker locker(&logMutex);

    if (logFile) {
        fclose(logFile);
        logFile = nullptr;
    }

    logFilePath = path;

    if (path.isEmpty())
        return true;

    QFileInfo fi(path);
    if (!QDir().mkpath(fi.absolutePath()))
        return false;

    logFile = fopen(QFile::encodeName(path).constData(), "a");
    return logFile != nullptr;
}

void removeLogFile()
{
    QMutexLocker locker(&logMutex);

    if (logFile) {
        fclose(logFile);
        logFile = nullptr;
    }

    if (!logFilePath.isEmpty())
        QFile::remove(logFilePath);
}

void qtLog(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    QMutexLocker locker(&logMutex);

    if (severity(type) < severity(minLevel) && type != QtFatalMsg)
        return;

    QByteArray localMsg = msg.toLocal8Bit();
    const char *function = context.function ? context.function : "";

    char t = '-';
    switch (type) {
    case QtDebugMsg:
        t = 'D';
        break;
    case QtInfoMsg:
        t = 'I';
        break;
    case QtWarningMsg:
        t = 'W';
        break;
    case QtCriticalMsg:
        t = 'C';
        break;
    case QtFatalMsg:
        t = 'F';
        break;
    }

    auto out = logFile ? logFile : stderr;
    fprintf(out, "[%c] %s %p %s:%u - %s\n", t,
            QDateTime::currentDateTime().toString("hh:mm:ss.zzz").toLatin1().constData(),
            static_cast<void*>(QThread::currentThread()),
            function, context.line, localMsg.constData());
    fflush(out);
}
