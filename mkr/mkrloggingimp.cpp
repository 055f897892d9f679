/* Logging
*
* This file is part of the mkrelay project.
*
* Copyright (C) Mark Kendall 2012-18
*
* This program is free software; you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation; either version 2 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program; if not, write to the Free Software
* Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301,
* USA.
*/

// Std
#include <stdlib.h>
#include <stdio.h>
#include <string.h>
#include <time.h>
#include <sys/time.h>
#include <unistd.h>
#include <sys/syscall.h>
#include <iostream>

// Qt
#include <QtGlobal>
#include <QMutex>
#include <QList>
#include <QRegExp>
#include <QHash>
#include <QMap>
#include <QQueue>
#include <QByteArray>
#include <QStringList>
#include <QElapsedTimer>
#include <QWaitCondition>

// Mkr
#include "mkrexitcodes.h"
#include "mkrlogging.h"
#include "mkrloggingimp.h"

using namespace std;

QMutex                   gLoggerListLock;
QList<LoggerBase *>      gLoggerList;
QMutex                   gLogQueueLock;
QQueue<LogItem *>        gLogQueue;
QMutex                   gLogThreadLock;
QHash<quint64, char *>   gLogThreadHash;
QMutex                   gLogThreadTidLock;
QHash<quint64, int64_t>  gLogThreadtidHash;
LoggingThread           *gLogThread = nullptr;
bool                     gLogThreadFinished = false;

typedef enum {
    kMessage       = 0x01,
    kRegistering   = 0x02,
    kDeregistering = 0x04,
    kFlush         = 0x08,
    kStandardIO    = 0x10,
} LoggingType;

static const char* GetThreadName(LogItem *Item);
static int64_t     GetThreadTid(LogItem *Item);

class LogItem
{
  public:
    static LogItem* Create(const char* File, const char* Function,
                           int Line, LogLevel Level, int Type)
    {
        return new LogItem(File, Function, Line, Level, Type);
    }

    static void Delete(LogItem *Item)
    {
        if (Item && !Item->refCount.deref())
        {
            if (Item->threadName)
                free(Item->threadName);
            delete Item;
        }
    }

    LogItem(const char *File, const char *Function,
            int Line, LogLevel Level, int Type)
      : refCount(),
        threadId((quint64)(QThread::currentThreadId())),
        usec(0),
        line(Line),
        type(Type),
        level(Level),
        tm(),
        file(File),
        function(Function),
        threadName(nullptr)
    {
        SetTime();
        SetThreadTid();

        message[0]='\0';
        message[LOGLINE_MAX]='\0';

        refCount.ref();
    }

    void SetTime(void)
    {
        struct timeval tv;
        gettimeofday(&tv, nullptr);
        time_t epoch = tv.tv_sec;
        usec = tv.tv_usec;
        localtime_r(&epoch, &tm);
    }

    void SetThreadTid(void)
    {
        QMutexLocker locker(&gLogThreadTidLock);
        if (!gLogThreadtidHash.contains(threadId))
            gLogThreadtidHash[threadId] = (int64_t)syscall(SYS_gettid);
    }

    QAtomicInt          refCount;
    quint64             threadId;
    uint32_t            usec;
    int                 line;
    int                 type;
    LogLevel            level;
    struct tm           tm;
    const char         *file;
    const char         *function;
    char               *threadName;
    char                message[LOGLINE_MAX+1];
};

/*! \class LoggingThread
 *  \brief Drains the global log queue and hands each item to the registered loggers.
 *
 * Log lines are generated on every thread but only ever written from here, so a slow
 * log file never holds up discovery or HTTP handling.
*/
LoggingThread::LoggingThread()
  : MkrQThread(QStringLiteral("Logger")),
    m_waitNotEmpty(),
    m_waitEmpty(),
    m_aborted(false)
{
}

LoggingThread::~LoggingThread()
{
    Stop();
    quit();
    wait();
}

void LoggingThread::run(void)
{
    Initialise();

    gLogThreadFinished = false;

    QMutexLocker lock(&gLogQueueLock);

    while (!m_aborted || !gLogQueue.isEmpty())
    {
        if (gLogQueue.isEmpty())
        {
            m_waitEmpty.wakeAll();
            m_waitNotEmpty.wait(lock.mutex(), 100);
            continue;
        }

        LogItem *item = gLogQueue.dequeue();
        lock.unlock();

        HandleItem(item);
        LogItem::Delete(item);

        lock.relock();
    }

    gLogThreadFinished = true;

    lock.unlock();

    Deinitialise();
}

void LoggingThread::Start(void)
{
}

void LoggingThread::Finish(void)
{
}

void LoggingThread::Stop(void)
{
    if (m_aborted)
        return;

    {
        QMutexLocker lock(&gLogQueueLock);
        Flush(1000);
        m_aborted = true;
    }
    m_waitNotEmpty.wakeAll();
}

/// \note gLogQueueLock must be held by the caller.
bool LoggingThread::Flush(int TimeoutMS)
{
    QElapsedTimer timer;
    timer.start();
    while (!m_aborted && !gLogQueue.isEmpty() && timer.elapsed() < TimeoutMS)
    {
        m_waitNotEmpty.wakeAll();
        int left = TimeoutMS - timer.elapsed();
        if (left > 0)
            m_waitEmpty.wait(&gLogQueueLock, left);
    }
    return gLogQueue.isEmpty();
}

void LoggingThread::HandleItem(LogItem *Item)
{
    if (Item->type & kRegistering)
    {
        QMutexLocker locker(&gLogThreadLock);
        if (gLogThreadHash.contains(Item->threadId))
            free(gLogThreadHash.take(Item->threadId));
        gLogThreadHash[Item->threadId] = strdup(Item->threadName);
    }
    else if (Item->type & kDeregistering)
    {
        {
            QMutexLocker locker(&gLogThreadTidLock);
            gLogThreadtidHash.remove(Item->threadId);
        }

        QMutexLocker locker(&gLogThreadLock);
        if (gLogThreadHash.contains(Item->threadId))
            free(gLogThreadHash.take(Item->threadId));
    }

    if (Item->message[0] != '\0')
    {
        QMutexLocker locker(&gLoggerListLock);
        foreach (LoggerBase *logger, gLoggerList)
            logger->Logmsg(Item);
    }
}

#define TIMESTAMP_MAX 30
#define MAX_STRING_LENGTH (LOGLINE_MAX+120)

LogLevel gLogLevel = (LogLevel)LOG_INFO;

typedef struct {
    uint64_t mask      { 0 };
    QString  name      { QString("") };
    bool     additive  { false };
    QString  helpText  { QString("") };
} VerboseDef;

typedef QMap<QString, VerboseDef> VerboseMap;

typedef struct {
    int         value     { 0 };
    QString     name      { QString("") };
    char        shortname { '?' };
} LoglevelDef;

typedef QMap<int, LoglevelDef> LoglevelMap;

VerboseMap     gVerboseMap;
QMutex         gVerboseMapLock;
LoglevelMap    gLoglevelMap;
QMutex         gLoglevelMapLock;

bool           gVerboseInitialised    = false;
const uint64_t gVerboseDefaultInt     = VB_GENERAL;
const char    *gVerboseDefaultStr     = " general";
uint64_t       gVerboseMask           = gVerboseDefaultInt;
QString        gVerboseString         = QString(gVerboseDefaultStr);

static void AddVerbose(uint64_t Mask, QString Name, bool Additive, const QString &Helptext);
static void AddLogLevel(int Value, QString Name, char Shortname);
static void InitVerbose(void);
static void VerboseHelp(void);

LoggerBase::LoggerBase(const QString &FileName)
  : m_fileName(FileName)
{
    QMutexLocker locker(&gLoggerListLock);
    gLoggerList.append(this);
}

QByteArray LoggerBase::GetLine(LogItem *Item)
{
    if (!Item)
        return QByteArray();

    Item->refCount.ref();

    QByteArray line(MAX_STRING_LENGTH, ' ');
    char timestamp[TIMESTAMP_MAX];
    char usPart[9];
    strftime(timestamp, TIMESTAMP_MAX-8, "%Y-%m-%d %H:%M:%S", (const struct tm *)&Item->tm);
    snprintf(usPart, 9, ".%03d", (int)(Item->usec / 1000));
    strcat(timestamp, usPart);
    char shortname = '-';

    {
        QMutexLocker locker(&gLoglevelMapLock);
        LoglevelMap::const_iterator it = gLoglevelMap.constFind(Item->level);
        if (it != gLoglevelMap.constEnd())
            shortname = (*it).shortname;
    }

    if (Item->type & kStandardIO)
    {
        snprintf(line.data(), MAX_STRING_LENGTH, "%s", Item->message);
    }
    else
    {
        char fileline[50];
        snprintf(fileline, 50, "%s (%s:%d)", Item->function, Item->file, Item->line);

        snprintf(line.data(), MAX_STRING_LENGTH, "%s %c [%6d/%6d] %-11s %-50s - %s\n",
                 timestamp, shortname, (int)getpid(), (int)GetThreadTid(Item), GetThreadName(Item),
                 fileline, Item->message);
    }

    Item->refCount.deref();
    return QByteArray(line.constData()).trimmed() + '\n';
}

FileLogger::FileLogger(const QString &Filename)
  : LoggerBase(Filename),
    m_opened(false),
    m_file()
{
    if (m_fileName.isEmpty())
    {
        m_opened = true;
        LOG(VB_GENERAL, LOG_INFO, "Logging to the console");
    }
    else
    {
        if (QFile::exists(m_fileName))
        {
            QString old = m_fileName + ".old";

            LOG(VB_GENERAL, LOG_INFO, QString("Moving '%1' to '%2'").arg(m_fileName, old));

            QFile::remove(old);
            QFile::rename(m_fileName, old);
        }

        m_file.setFileName(m_fileName);
        m_opened = m_file.open(QIODevice::WriteOnly | QIODevice::Truncate |
                               QIODevice::Text | QIODevice::Unbuffered);
        if (m_opened)
            LOG(VB_GENERAL, LOG_INFO, QString("Logging to '%1'").arg(m_fileName));
        else
            LOG(VB_GENERAL, LOG_ERR, QString("Failed to open '%1' for logging").arg(m_fileName));
    }
}

FileLogger::~FileLogger()
{
    if (m_opened)
    {
        LogItem *item = LogItem::Create(__FILE__, __FUNCTION__, __LINE__, LOG_INFO, kMessage);
        strcpy(item->message, m_file.isOpen() ? "Closing file logger." : "Closing console logger.");
        Logmsg(item);
        LogItem::Delete(item);
        m_file.close();
    }
}

bool FileLogger::Logmsg(LogItem *Item)
{
    if (!m_opened)
        return false;

    Item->refCount.ref();
    QByteArray line = GetLine(Item);
    LogItem::Delete(Item);
    return PrintLine(line);
}

bool FileLogger::PrintLine(QByteArray &Line)
{
    qint64 result = m_file.isOpen() ? m_file.write(Line) : write(1, Line.constData(), Line.size());
    if (result == -1)
    {
        m_opened = false;
        return false;
    }

    return true;
}

static const char* GetThreadName(LogItem *Item)
{
    static const char *unknown = "QRunnable";

    if (!Item)
        return unknown;

    if (Item->threadName)
        return Item->threadName;

    QMutexLocker locker(&gLogThreadLock);
    QHash<quint64, char *>::const_iterator it = gLogThreadHash.constFind(Item->threadId);
    if (it != gLogThreadHash.constEnd())
        return it.value();
    return unknown;
}

static int64_t GetThreadTid(LogItem *Item)
{
    if (!Item)
        return 0;

    QMutexLocker locker(&gLogThreadTidLock);
    return gLogThreadtidHash.value(Item->threadId, 0);
}

void PrintLogLine(uint64_t Mask, LogLevel Level, const char *File, int Line,
                  const char *Function, const char *Message)
{
    int type = kMessage;
    type |= (Mask & VB_FLUSH) ? kFlush : 0;
    type |= (Mask & VB_STDIO) ? kStandardIO : 0;
    LogItem *item = LogItem::Create(File, Function, Line, Level, type);
    if (!item)
        return;

    qstrncpy(item->message, Message, LOGLINE_MAX);

    QMutexLocker lock(&gLogQueueLock);

    gLogQueue.enqueue(item);

    // no logging thread (yet or any more) - process inline
    if (gLogThread && gLogThreadFinished && !gLogThread->isRunning())
    {
        while (!gLogQueue.isEmpty())
        {
            item = gLogQueue.dequeue();
            lock.unlock();
            gLogThread->HandleItem(item);
            LogItem::Delete(item);
            lock.relock();
        }
    }
    else if (gLogThread && !gLogThreadFinished && (type & kFlush))
    {
        gLogThread->Flush();
    }
}

void StartLogging(const QString &Logfile, const QString &Level)
{
    RegisterLoggingThread();

    LogLevel level = GetLogLevel(Level);
    if (level == LOG_UNKNOWN)
        level = LOG_INFO;

    {
        QMutexLocker lock(&gLogQueueLock);
        if (!gLogThread)
            gLogThread = new LoggingThread();
    }

    if (gLogThread->isRunning())
        return;

    gLogLevel = level;
    LOG(VB_GENERAL, LOG_NOTICE, QString("Setting level to LOG_%1").arg(GetLogLevelName(gLogLevel).toUpper()));

    new FileLogger(QString(""));
    if (!Logfile.isEmpty())
        new FileLogger(Logfile);

    gLogThread->start();
}

void StopLogging(void)
{
    if (gLogThread)
    {
        gLogThread->Stop();
        gLogThread->quit();
        gLogThread->wait();
    }

    {
        QMutexLocker lock(&gLogQueueLock);
        delete gLogThread;
        gLogThread = nullptr;
        gLogThreadFinished = false;
    }

    {
        QMutexLocker locker(&gLoggerListLock);
        qDeleteAll(gLoggerList);
        gLoggerList.clear();
    }

    // this cleans up the last thread name - the logging thread itself - which is deregistered
    // after the logging thread runloop has finished...
    {
        QMutexLocker locker(&gLogThreadLock);
        foreach (char *name, gLogThreadHash)
            free(name);
        gLogThreadHash.clear();
    }
}

void RegisterLoggingThread(void)
{
    if (gLogThreadFinished)
        return;

    QMutexLocker lock(&gLogQueueLock);

    LogItem *item = LogItem::Create(__FILE__, __FUNCTION__, __LINE__, (LogLevel)LOG_DEBUG, kRegistering);
    if (item)
    {
        item->threadName = strdup(QThread::currentThread()->objectName().toLocal8Bit().constData());
        gLogQueue.enqueue(item);
    }
}

void DeregisterLoggingThread(void)
{
    if (gLogThreadFinished)
        return;

    QMutexLocker lock(&gLogQueueLock);

    LogItem *item = LogItem::Create(__FILE__, __FUNCTION__, __LINE__, (LogLevel)LOG_DEBUG, kDeregistering);
    if (item)
        gLogQueue.enqueue(item);
}

LogLevel GetLogLevel(const QString &Level)
{
    QMutexLocker locker(&gLoglevelMapLock);
    if (!gVerboseInitialised)
    {
        locker.unlock();
        InitVerbose();
        locker.relock();
    }

    for (LoglevelMap::const_iterator it = gLoglevelMap.constBegin(); it != gLoglevelMap.constEnd(); ++it)
        if ((*it).name == Level.toLower())
            return (LogLevel)(*it).value;

    return LOG_UNKNOWN;
}

QString GetLogLevelName(LogLevel Level)
{
    QMutexLocker locker(&gLoglevelMapLock);
    if (!gVerboseInitialised)
    {
        locker.unlock();
        InitVerbose();
        locker.relock();
    }

    LoglevelMap::const_iterator it = gLoglevelMap.constFind((int)Level);
    if (it == gLoglevelMap.constEnd())
        return QString("unknown");
    return (*it).name;
}

static void AddVerbose(uint64_t Mask, QString Name, bool Additive, const QString &Helptext)
{
    VerboseDef item;

    item.mask = Mask;
    // VB_GENERAL -> general
    Name.remove(0, 3);
    item.name     = Name.toLower();
    item.additive = Additive;
    item.helpText = Helptext;

    gVerboseMap.insert(item.name, item);
}

static void AddLogLevel(int Value, QString Name, char Shortname)
{
    LoglevelDef item;

    item.value = Value;
    // LOG_CRIT -> crit
    Name.remove(0, 4);
    item.name      = Name.toLower();
    item.shortname = Shortname;

    gLoglevelMap.insert(Value, item);
}

static void InitVerbose(void)
{
    QMutexLocker locker(&gVerboseMapLock);
    QMutexLocker locker2(&gLoglevelMapLock);
    gVerboseMap.clear();
    gLoglevelMap.clear();

#undef MKRLOGGINGDEFS_H_
#define _IMPLEMENT_VERBOSE
#include "mkrloggingdefs.h"

    gVerboseInitialised = true;
}

static void VerboseHelp(void)
{
    cerr << "Verbose debug levels.\n"
            "Accepts any combination (separated by comma) of:\n\n";

    for (VerboseMap::const_iterator it = gVerboseMap.constBegin(); it != gVerboseMap.constEnd(); ++it)
    {
        if (it.value().helpText.isEmpty())
            continue;
        QString name = QString("  %1").arg(it.value().name, -15, ' ');
        cerr << name.toLocal8Bit().constData() << " - " <<
                it.value().helpText.toLocal8Bit().constData() << endl;
    }

    cerr << endl <<
      "The default is '-v general'.\n"
      "Most options are additive except for 'none' and 'all'.\n"
      "Additive options may also be subtracted from 'all' by\n"
      "prefixing them with 'no', e.g. '-v all,nohttp'.\n\n";
}

int ParseVerboseArgument(const QString &Arg)
{
    if (!gVerboseInitialised)
        InitVerbose();

    QMutexLocker locker(&gVerboseMapLock);

    gVerboseMask   = gVerboseDefaultInt;
    gVerboseString = QString(gVerboseDefaultStr);

    if (Arg.isEmpty())
        return MKR_EXIT_OK;

    if (Arg.startsWith('-'))
    {
        cerr << "Invalid or missing argument to -v/--verbose option\n";
        return MKR_EXIT_INVALID_CMDLINE;
    }

    QStringList verboseOpts = Arg.split(QRegExp("\\W+"), QString::SkipEmptyParts);
    foreach (const QString &opt, verboseOpts)
    {
        QString option = opt.toLower();
        bool reverseOption = false;

        if (option != "none" && option.left(2) == "no")
        {
            reverseOption = true;
            option = option.mid(2);
        }

        if (option == "help")
        {
            VerboseHelp();
            return MKR_EXIT_INVALID_CMDLINE;
        }
        else if (option == "default")
        {
            gVerboseMask   = gVerboseDefaultInt;
            gVerboseString = QString(gVerboseDefaultStr);
        }
        else if (gVerboseMap.contains(option))
        {
            VerboseDef item = gVerboseMap.value(option);
            if (reverseOption)
            {
                gVerboseMask &= ~(item.mask);
                gVerboseString = gVerboseString.remove(' ' + item.name);
                gVerboseString += " no" + item.name;
            }
            else if (item.additive)
            {
                if (!(gVerboseMask & item.mask))
                {
                    gVerboseMask |= item.mask;
                    gVerboseString += ' ' + item.name;
                }
            }
            else
            {
                gVerboseMask   = item.mask;
                gVerboseString = item.name;
            }
        }
        else
        {
            cerr << "Unknown argument for -v/--verbose: " << option.toLocal8Bit().constData() << endl;
            return MKR_EXIT_INVALID_CMDLINE;
        }
    }

    return MKR_EXIT_OK;
}
