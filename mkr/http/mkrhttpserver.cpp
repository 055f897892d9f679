/* Class MkrHTTPServer
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

// Qt
#include <QSysInfo>
#include <QCoreApplication>

// Mkr
#include "mkrlogging.h"
#include "mkrlocaldefs.h"
#include "mkrhttphandler.h"
#include "mkrhttpconnection.h"
#include "mkrhttpserverlistener.h"
#include "mkrhttpserver.h"

/*! \class MkrHTTPServer
 *  \brief A read only HTTP server.
 *
 * MkrHTTPServer listens for incoming TCP connections on the configured port (8088 by default).
 * Each new connection is handed to a MkrHTTPConnection running on the server's thread pool.
 *
 * Register content handlers with RegisterHandler and remove them with DeregisterHandler.
 * Handlers are matched against the request path exactly - anything unmatched is answered with
 * '404 Not Found'.
 *
 * \sa MkrHTTPRequest
 * \sa MkrHTTPHandler
*/

QString MkrHTTPServer::PlatformName(void)
{
    static QString platform = QStringLiteral("%1, Version: %2 (%3 %4)")
                                .arg(MKR_MKRELAY, MKR_VERSION, QSysInfo::kernelType(), QSysInfo::kernelVersion());
    return platform;
}

MkrHTTPServer::MkrHTTPServer(int Port)
  : QObject(),
    m_port(Port),
    m_listener(nullptr),
    m_pool(),
    m_abort(0),
    m_handlersLock(QReadWriteLock::Recursive),
    m_handlers()
{
    // one thread per connection - do not let slow or idle clients block each other
    m_pool.setMaxThreadCount(qMax(m_pool.maxThreadCount(), MKR_HTTP_MAX_THREADS));
}

MkrHTTPServer::~MkrHTTPServer()
{
    Close();
}

bool MkrHTTPServer::Open(void)
{
    if (m_listener)
    {
        LOG(VB_GENERAL, LOG_ERR, QStringLiteral("HTTP server already listening - closing"));
        Close();
    }

    LOG(VB_GENERAL, LOG_INFO, QStringLiteral("Attempting to listen on port %1").arg(m_port));

    m_listener = new MkrHTTPServerListener(this, QHostAddress::Any, m_port);
    if (!m_listener->isListening() && !m_listener->Listen(QHostAddress::AnyIPv4, m_port))
    {
        LOG(VB_GENERAL, LOG_ERR, QStringLiteral("Failed to open web server port %1").arg(m_port));
        Close();
        return false;
    }

    LOG(VB_GENERAL, LOG_INFO, QStringLiteral("Web server listening on port %1").arg(m_listener->serverPort()));
    return true;
}

void MkrHTTPServer::Close(void)
{
    if (!m_listener)
        return;

    // stop accepting new connections
    delete m_listener;
    m_listener = nullptr;

    // close existing connections
    m_abort = 1;
    m_pool.waitForDone();
    m_abort = 0;

    LOG(VB_GENERAL, LOG_INFO, QStringLiteral("Webserver closed"));
}

bool MkrHTTPServer::IsListening(void) const
{
    return m_listener && m_listener->isListening();
}

int MkrHTTPServer::GetPort(void) const
{
    if (m_listener && m_listener->isListening())
        return m_listener->serverPort();
    return m_port;
}

void MkrHTTPServer::RegisterHandler(MkrHTTPHandler *Handler)
{
    if (!Handler)
        return;

    QWriteLocker locker(&m_handlersLock);

    foreach (const QString &signature, Handler->Signature().split(','))
    {
        if (m_handlers.contains(signature))
        {
            LOG(VB_GENERAL, LOG_ERR, QStringLiteral("Handler '%1' for '%2' already registered - ignoring").arg(Handler->Name(), signature));
        }
        else if (!signature.isEmpty())
        {
            LOG(VB_GENERAL, LOG_DEBUG, QStringLiteral("Added handler '%1' for %2").arg(Handler->Name(), signature));
            m_handlers.insert(signature, Handler);
        }
    }
}

void MkrHTTPServer::DeregisterHandler(MkrHTTPHandler *Handler)
{
    if (!Handler)
        return;

    QWriteLocker locker(&m_handlersLock);

    foreach (const QString &signature, Handler->Signature().split(','))
    {
        QMap<QString,MkrHTTPHandler*>::iterator it = m_handlers.find(signature);
        if (it != m_handlers.end() && it.value() == Handler)
        {
            LOG(VB_GENERAL, LOG_DEBUG, QStringLiteral("Removing handler '%1'").arg(it.key()));
            m_handlers.erase(it);
        }
    }
}

void MkrHTTPServer::HandleRequest(const QString &PeerAddress, int PeerPort, const QString &LocalAddress, int LocalPort, MkrHTTPRequest &Request)
{
    QReadLocker locker(&m_handlersLock);

    QMap<QString,MkrHTTPHandler*>::const_iterator it = m_handlers.constFind(Request.GetPath());
    if (it != m_handlers.constEnd())
        (*it)->ProcessHTTPRequest(PeerAddress, PeerPort, LocalAddress, LocalPort, Request);
}

void MkrHTTPServer::NewConnection(qintptr SocketDescriptor)
{
    if (m_pool.activeThreadCount() >= m_pool.maxThreadCount())
        LOG(VB_GENERAL, LOG_WARNING, QStringLiteral("All %1 connection threads busy - new connection queued").arg(m_pool.maxThreadCount()));
    m_pool.start(new MkrHTTPConnection(this, SocketDescriptor, &m_abort));
}
