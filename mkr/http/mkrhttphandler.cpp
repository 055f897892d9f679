/* Class MkrHTTPHandler
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
#include "mkrhttphandler.h"

/*! \class MkrHTTPHandler
 *  \brief Base HTTP response handler class.
 *
 * A MkrHTTPHandler object will be passed MkrHTTPRequest objects to process.
 * Handlers are registered with the HTTP server using MkrHTTPServer::RegisterHandler and
 * are removed with MkrHTTPServer::DeregisterHandler. The handler's signature tells the server
 * which path the handler is expecting to process (e.g. /).
 *
 * Concrete subclasses must implement ProcessHTTPRequest.
 *
 * \sa MkrHTTPServer
 * \sa MkrHTTPRequest
*/

MkrHTTPHandler::MkrHTTPHandler(const QString &Signature, const QString &Name)
  : m_signature(Signature),
    m_name(Name)
{
    if (!m_signature.endsWith('/'))
        m_signature += '/';
}

QString MkrHTTPHandler::Signature(void) const
{
    return m_signature;
}

QString MkrHTTPHandler::Name(void) const
{
    return m_name;
}

void MkrHTTPHandler::HandleOptions(MkrHTTPRequest &Request, int Allowed)
{
    Request.SetAllowed(Allowed);
    Request.SetStatus(HTTP_OK);
    Request.SetResponseType(HTTPResponseJSON);
    Request.SetResponseContent(QByteArray("{}\n"));
}

void MkrHTTPHandler::HandleNotAllowed(MkrHTTPRequest &Request, int Allowed)
{
    LOG(VB_HTTP, LOG_INFO, QStringLiteral("'%1' not allowed for '%2'")
        .arg(MkrHTTPRequest::RequestTypeToString(Request.GetHTTPRequestType()), Request.GetUrl()));
    Request.SetAllowed(Allowed);
    Request.SetStatus(HTTP_MethodNotAllowed);
    Request.SetResponseType(HTTPResponseJSON);
    Request.SetResponseContent(QByteArray("{}\n"));
}
