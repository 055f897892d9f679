/* Class MkrHTTPConnection
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
#include <QThread>
#include <QScopedPointer>

// Mkr
#include "mkrlogging.h"
#include "mkrlocaldefs.h"
#include "mkrhttpreader.h"
#include "mkrhttprequest.h"
#include "mkrhttpserver.h"
#include "mkrhttpconnection.h"

/*! \class MkrHTTPConnection
 *  \brief A handler for an HTTP client connection.
 *
 * MkrHTTPConnection encapsulates a current TCP connection from an HTTP client.
 * It processes incoming data and prepares complete request data to be passed
 * to MkrHTTPRequest. When a complete and valid request has been processed, it
 * is passed back to the parent MkrHTTPServer for processing.
 *
 * The connection is closed after 5 seconds without activity, on a malformed request,
 * when the server aborts or when the client asks for it.
 *
 * \sa MkrHTTPServer
 * \sa MkrHTTPHandler
 * \sa MkrHTTPRequest
*/

MkrHTTPConnection::MkrHTTPConnection(MkrHTTPServer *Parent, qintptr SocketDescriptor, int *Abort)
  : QRunnable(),
    m_abort(Abort),
    m_server(Parent),
    m_socketDescriptor(SocketDescriptor)
{
}

void MkrHTTPConnection::run(void)
{
    if (!m_socketDescriptor || !m_abort)
        return;

    // create socket
    QScopedPointer<QTcpSocket> socket(new QTcpSocket());
    if (!socket->setSocketDescriptor(m_socketDescriptor))
    {
        LOG(VB_GENERAL, LOG_INFO, QStringLiteral("Failed to set socket descriptor"));
        return;
    }

    QString peeraddress  = socket->peerAddress().toString();
    int     peerport     = socket->peerPort();
    QString localaddress = socket->localAddress().toString();
    int     localport    = socket->localPort();

    LOG(VB_NETWORK, LOG_INFO, QStringLiteral("New connection from %1:%2 on %3:%4")
        .arg(peeraddress).arg(peerport).arg(localaddress).arg(localport));

    static const int maxpolls = MKR_HTTP_IDLE_MS / MKR_HTTP_POLL_MS;
    MkrHTTPReader reader;

    while (m_server && !(*m_abort) && socket->state() == QAbstractSocket::ConnectedState)
    {
        // wait for data
        int count = 0;
        while (socket->state() == QAbstractSocket::ConnectedState && !(*m_abort) &&
               count++ < maxpolls && socket->bytesAvailable() < 1 && !socket->waitForReadyRead(MKR_HTTP_POLL_MS))
        {
        }

        // ensure we have a complete line if still waiting for complete headers.
        while (!reader.HeadersComplete() &&
               socket->state() == QAbstractSocket::ConnectedState && !(*m_abort) &&
               count++ < maxpolls && !socket->canReadLine())
        {
            if (!socket->waitForReadyRead(MKR_HTTP_POLL_MS))
                QThread::msleep(10);
        }

        // timed out
        if (count >= maxpolls)
        {
            LOG(VB_NETWORK, LOG_INFO, QStringLiteral("No socket activity for %1 seconds").arg(MKR_HTTP_IDLE_MS / 1000));
            break;
        }

        if (*m_abort)
            break;

        // read data
        if (!reader.Read(socket.data()))
            break;

        if (!reader.IsReady())
            continue;

        // sanity check
        if (socket->bytesAvailable() > 0)
            LOG(VB_NETWORK, LOG_DEBUG, QStringLiteral("%1 unread bytes from %2").arg(socket->bytesAvailable()).arg(peeraddress));

        // have headers and content - process request
        MkrHTTPRequest request(&reader);

        if (request.GetHTTPType() == HTTPResponse)
        {
            LOG(VB_NETWORK, LOG_ERR, QStringLiteral("Received unexpected HTTP response"));
            break;
        }

        m_server->HandleRequest(peeraddress, peerport, localaddress, localport, request);
        request.Respond(socket.data());

        if (request.GetConnection() == HTTPConnectionClose)
            break;

        // reset
        reader.Reset();
    }

    if (*m_abort)
        LOG(VB_NETWORK, LOG_INFO, QStringLiteral("Socket closed at server's request"));

    if (socket->state() != QAbstractSocket::ConnectedState)
        LOG(VB_NETWORK, LOG_INFO, QStringLiteral("Socket was disconnected by remote host"));

    socket->disconnectFromHost();
    if (socket->state() != QAbstractSocket::UnconnectedState)
        socket->waitForDisconnected(1000);

    LOG(VB_NETWORK, LOG_INFO, QStringLiteral("Connection from %1 closed").arg(peeraddress));
}
