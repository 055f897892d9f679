/* Class MkrLocalContext
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
#include <signal.h>
#include <iostream>

// Qt
#include <QMetaEnum>
#include <QCoreApplication>

// Mkr
#include "mkrlogging.h"
#include "mkrexitcodes.h"
#include "mkrevent.h"
#include "mkrregistry.h"
#include "mkrservicemonitor.h"
#include "mkrhttpserver.h"
#include "mkrservicehandler.h"
#include "mkrlocalcontext.h"

MkrLocalContext *gLocalContext = nullptr;

static void ExitHandler(int Sig)
{
    if (SIGPIPE == Sig)
    {
        LOG(VB_GENERAL, LOG_WARNING, QStringLiteral("Received SIGPIPE interrupt - ignoring"));
        return;
    }

    LOG(VB_GENERAL, LOG_INFO, QStringLiteral("Received %1").arg(Sig == SIGINT ? "SIGINT" : "SIGTERM"));

    signal(SIGINT, SIG_DFL);
    MkrLocalContext::NotifyEvent(Mkr::Stop);
}

/// Return the string describing the given action.
QString Mkr::ActionToString(Actions Action)
{
    const QMetaObject &mo = Mkr::staticMetaObject;
    int enum_index        = mo.indexOfEnumerator("Actions");
    QMetaEnum metaEnum    = mo.enumerator(enum_index);
    return metaEnum.valueToKey(Action);
}

int MkrLocalContext::Create(MkrCommandLine *CommandLine)
{
    if (gLocalContext)
        return MKR_EXIT_OK;

    if (!CommandLine)
        return MKR_EXIT_NO_CONTEXT;

    gLocalContext = new MkrLocalContext(CommandLine);
    int result = gLocalContext->Init(CommandLine);
    if (result == MKR_EXIT_OK)
        return MKR_EXIT_OK;

    TearDown();
    return result;
}

void MkrLocalContext::TearDown(void)
{
    delete gLocalContext;
    gLocalContext = nullptr;
}

void MkrLocalContext::NotifyEvent(int Event)
{
    if (gLocalContext)
        QCoreApplication::postEvent(gLocalContext, new MkrEvent(Event));
}

/// Route Qt's own warnings into the log.
void MkrLocalContext::QtMessage(QtMsgType Type, const QMessageLogContext &Context, const QString &Message)
{
    const char *function = Context.function ? Context.function : __FUNCTION__;
    const char *file     = Context.file ? Context.file : __FILE__;
    int         line     = Context.line ? Context.line : __LINE__;

    int level = LOG_UNKNOWN;
    switch (Type)
    {
        case QtFatalMsg: level = LOG_CRIT; break;
        case QtDebugMsg: level = LOG_INFO; break;
        default: level = LOG_ERR;
    }

    if (VERBOSE_LEVEL_CHECK(VB_GENERAL, level))
    {
        PrintLogLine(VB_GENERAL | (level == LOG_CRIT ? VB_FLUSH : 0), (LogLevel)level,
                     file, line, function,
                     Message.toLocal8Bit().constData());
    }
}

/*! \class MkrLocalContext
 *  \brief The core application object.
 *
 * MkrLocalContext starts logging, loads the configuration and then creates the registry,
 * the service monitor (and hence discovery) and the HTTP server, in that order. Destruction
 * happens in reverse. A Mkr::Stop event (sent on SIGINT or SIGTERM) quits the main event loop.
*/
MkrLocalContext::MkrLocalContext(MkrCommandLine *CommandLine)
  : QObject(),
    m_config(),
    m_registry(nullptr),
    m_serviceMonitor(nullptr),
    m_httpServer(nullptr),
    m_serviceHandler(nullptr)
{
    // install our message handler
    qInstallMessageHandler(&MkrLocalContext::QtMessage);

    setObjectName(QStringLiteral("LocalContext"));

    // Handle signals gracefully
    signal(SIGINT,  ExitHandler);
    signal(SIGTERM, ExitHandler);
    signal(SIGPIPE, ExitHandler);

    // Start logging at the first opportunity
    StartLogging(CommandLine->GetValue(QStringLiteral("logfile")).toString(),
                 CommandLine->GetValue(QStringLiteral("l")).toString());

    // Version info
    LOG(VB_GENERAL, LOG_INFO, QStringLiteral("%1 version %2").arg(MKR_MKRELAY, MKR_VERSION));
    LOG(VB_GENERAL, LOG_NOTICE, QStringLiteral("Enabled verbose msgs: %1").arg(gVerboseString));
    LOG(VB_GENERAL, LOG_INFO, QStringLiteral("Qt runtime version '%1' (compiled with '%2')")
        .arg(qVersion()).arg(QT_VERSION_STR));
}

MkrLocalContext::~MkrLocalContext()
{
    // stop answering queries and wait for open connections
    if (m_httpServer)
    {
        m_httpServer->DeregisterHandler(m_serviceHandler);
        m_httpServer->Close();
    }
    delete m_httpServer;
    m_httpServer = nullptr;
    delete m_serviceHandler;
    m_serviceHandler = nullptr;

    // stop discovery
    delete m_serviceMonitor;
    m_serviceMonitor = nullptr;

    delete m_registry;
    m_registry = nullptr;

    // revert to the default message handler
    qInstallMessageHandler(0);

    StopLogging();
}

int MkrLocalContext::Init(MkrCommandLine *CommandLine)
{
    // load configuration
    QString path = MkrConfig::ResolvePath(CommandLine->GetValue(QStringLiteral("ini")).toString());
    int result = m_config.Load(path);

    if (result == MKR_EXIT_OK)
    {
        // apply command line overrides
        QString uuid = CommandLine->GetValue(QStringLiteral("uuid")).toString();
        if (!uuid.isEmpty())
            m_config.SetUuid(uuid);

        int port = CommandLine->GetValue(QStringLiteral("port")).toInt();
        if (port > 0)
            m_config.SetPort(port);

        m_config.AddBrowseTypes(CommandLine->GetValue(QStringLiteral("browse")).toString());

        result = m_config.Validate();
    }

    if (result != MKR_EXIT_OK)
    {
        std::cerr << m_config.GetErrorString().toLocal8Bit().constData() << std::endl;
        LOG(VB_GENERAL, LOG_ERR, m_config.GetErrorString());
        return result;
    }

    LOG(VB_GENERAL, LOG_INFO, QStringLiteral("UUID: %1").arg(m_config.GetUuid()));

    m_registry = new MkrRegistry(m_config.GetUuid());

    m_serviceMonitor = new MkrServiceMonitor(m_registry);
    m_serviceMonitor->Start(m_config.GetBrowseTypes());

    m_httpServer     = new MkrHTTPServer(m_config.GetPort());
    m_serviceHandler = new MkrServiceHandler(m_registry);
    m_httpServer->RegisterHandler(m_serviceHandler);
    if (!m_httpServer->Open())
    {
        std::cerr << "Failed to listen on port " << m_config.GetPort() << std::endl;
        return MKR_EXIT_NO_CONTEXT;
    }

    return MKR_EXIT_OK;
}

bool MkrLocalContext::event(QEvent *Event)
{
    if (Event && Event->type() == MkrEvent::MkrEventType)
    {
        MkrEvent *mkrevent = static_cast<MkrEvent*>(Event);
        if (mkrevent->GetEvent() == Mkr::Stop)
        {
            LOG(VB_GENERAL, LOG_INFO, QStringLiteral("Stopping"));
            QCoreApplication::quit();
            return true;
        }
    }

    return QObject::event(Event);
}
