/* Class MkrHTTPServerListener
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

// Mkr
#include "mkrlogging.h"
#include "mkrhttpserver.h"
#include "mkrhttpserverlistener.h"

MkrHTTPServerListener::MkrHTTPServerListener(MkrHTTPServer *Parent, const QHostAddress &Address, int Port)
  : QTcpServer()
{
    if (!Parent)
        return;

    connect(this, SIGNAL(NewConnection(qintptr)), Parent, SLOT(NewConnection(qintptr)));

    (void)Listen(Address, Port);
}

MkrHTTPServerListener::~MkrHTTPServerListener()
{
    close();
}

bool MkrHTTPServerListener::Listen(const QHostAddress &Address, int Port)
{
    if (!listen(Address, Port))
    {
        LOG(VB_GENERAL, LOG_ERR, QStringLiteral("Failed to listen on port %1 (%2)").arg(Port).arg(errorString()));
        return false;
    }

    if (QHostAddress::AnyIPv4 == Address)
        LOG(VB_GENERAL, LOG_INFO, QStringLiteral("Listening on port %1 (IPv4 addresses only)").arg(serverPort()));
    else if (QHostAddress::Any == Address)
        LOG(VB_GENERAL, LOG_INFO, QStringLiteral("Listening on port %1 (IPv4 and IPv6 addresses)").arg(serverPort()));
    else
        LOG(VB_GENERAL, LOG_INFO, QStringLiteral("Listening on %1:%2").arg(Address.toString()).arg(serverPort()));
    return true;
}

void MkrHTTPServerListener::incomingConnection(qintptr SocketDescriptor)
{
    emit NewConnection(SocketDescriptor);
}
