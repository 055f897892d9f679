/* Class MkrHTTPRequest
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
#include <QScopedPointer>
#include <QTcpSocket>
#include <QTextStream>
#include <QStringList>
#include <QDateTime>
#include <QLocale>
#include <QRegExp>
#include <QUrl>

// Mkr
#include "mkrlogging.h"
#include "mkrhttpserver.h"
#include "mkrhttprequest.h"

/*! \class MkrHTTPRequest
 *  \brief A class to encapsulate an incoming HTTP request.
 *
 * MkrHTTPRequest validates an incoming HTTP request and prepares the appropriate
 * headers for the response.
 *
 * The request path is split at the last '/' into a path (which selects the handler)
 * and a method (the lookup key) - so '/machinekit' has path '/' and method 'machinekit'.
 *
 * \sa MkrHTTPServer
 * \sa MkrHTTPHandler
*/

QRegExp gRegExp = QRegExp("[ \r\n][ \r\n]*");
char MkrHTTPRequest::DateFormat[] = "ddd, dd MMM yyyy HH:mm:ss 'GMT'";

MkrHTTPRequest::MkrHTTPRequest(MkrHTTPReader *Reader)
  : m_fullUrl(),
    m_path(),
    m_method(),
    m_type(HTTPRequest),
    m_requestType(HTTPUnknownType),
    m_protocol(HTTPUnknownProtocol),
    m_connection(HTTPConnectionClose),
    m_headers(),
    m_allowed(0),
    m_responseType(HTTPResponseUnknown),
    m_responseStatus(HTTP_NotFound),
    m_responseContent(),
    m_responseHeaders()
{
    if (Reader)
    {
        Reader->TakeRequest(m_headers);
        Initialise(Reader->GetMethod());
    }
    else
    {
        LOG(VB_GENERAL, LOG_ERR, QStringLiteral("NULL Reader"));
    }
}

MkrHTTPRequest::MkrHTTPRequest(const QString &Method, const QMap<QString,QString> &Headers)
  : m_fullUrl(),
    m_path(),
    m_method(),
    m_type(HTTPRequest),
    m_requestType(HTTPUnknownType),
    m_protocol(HTTPUnknownProtocol),
    m_connection(HTTPConnectionClose),
    m_headers(Headers),
    m_allowed(0),
    m_responseType(HTTPResponseUnknown),
    m_responseStatus(HTTP_NotFound),
    m_responseContent(),
    m_responseHeaders()
{
    Initialise(Method);
}

void MkrHTTPRequest::Initialise(const QString &Method)
{
    QStringList items = Method.split(gRegExp, QString::SkipEmptyParts);
    QString item;

    if (!items.isEmpty())
    {
        item = items.takeFirst();

        // response of type 'HTTP/1.1 200 OK'
        if (item.startsWith(QStringLiteral("HTTP")))
        {
            m_type = HTTPResponse;
            m_protocol = ProtocolFromString(item.trimmed());
        }
        // request of type 'GET /method HTTP/1.1'
        else
        {
            m_type = HTTPRequest;

            // GET
            m_requestType = RequestTypeFromString(item.trimmed());

            if (!items.isEmpty())
            {
                // /method
                QUrl url  = QUrl::fromEncoded(items.takeFirst().toUtf8());
                m_path    = url.path();
                m_fullUrl = url.toString();

                int index = m_path.lastIndexOf('/');
                if (index > -1)
                {
                    m_method = m_path.mid(index + 1).trimmed();
                    m_path   = m_path.left(index + 1).trimmed();
                }
            }

            // HTTP/1.1
            if (!items.isEmpty())
                m_protocol = ProtocolFromString(items.takeFirst());
        }
    }

    if (m_protocol > HTTPOneDotZero)
        m_connection = HTTPConnectionKeepAlive;

    // header names are case insensitive
    QString connection;
    QMap<QString,QString>::const_iterator it = m_headers.constBegin();
    for ( ; it != m_headers.constEnd(); ++it)
    {
        if (it.key().compare(QStringLiteral("Connection"), Qt::CaseInsensitive) == 0)
        {
            connection = it.value().trimmed().toLower();
            break;
        }
    }

    if (connection == QStringLiteral("keep-alive"))
        m_connection = HTTPConnectionKeepAlive;
    else if (connection == QStringLiteral("close"))
        m_connection = HTTPConnectionClose;

    LOG(VB_HTTP, LOG_DEBUG, QStringLiteral("HTTP request: path '%1' method '%2'").arg(m_path, m_method));
}

void MkrHTTPRequest::SetConnection(HTTPConnection Connection)
{
    m_connection = Connection;
}

void MkrHTTPRequest::SetStatus(HTTPStatus Status)
{
    m_responseStatus = Status;
}

void MkrHTTPRequest::SetResponseType(HTTPResponseType Type)
{
    m_responseType = Type;
}

void MkrHTTPRequest::SetResponseContent(const QByteArray &Content)
{
    m_responseContent = Content;
}

void MkrHTTPRequest::SetResponseHeader(const QString &Header, const QString &Value)
{
    m_responseHeaders.insert(Header, Value);
}

void MkrHTTPRequest::SetAllowed(int Allowed)
{
    m_allowed = Allowed;
}

HTTPStatus MkrHTTPRequest::GetHTTPStatus(void) const
{
    return m_responseStatus;
}

HTTPType MkrHTTPRequest::GetHTTPType(void) const
{
    return m_type;
}

HTTPRequestType MkrHTTPRequest::GetHTTPRequestType(void) const
{
    return m_requestType;
}

HTTPConnection MkrHTTPRequest::GetConnection(void) const
{
    return m_connection;
}

HTTPResponseType MkrHTTPRequest::GetResponseType(void) const
{
    return m_responseType;
}

QString MkrHTTPRequest::GetUrl(void) const
{
    return m_fullUrl;
}

QString MkrHTTPRequest::GetPath(void) const
{
    return m_path;
}

QString MkrHTTPRequest::GetMethod(void) const
{
    return m_method;
}

const QByteArray& MkrHTTPRequest::GetResponseContent(void) const
{
    return m_responseContent;
}

/*! \brief Format the status line and headers for the response.
 *
 * A request that nothing has responded to is turned into a '404 Not Found' with an empty
 * JSON object. Content-Length always reflects the content, including for HEAD requests
 * where the content itself is never sent.
*/
QByteArray MkrHTTPRequest::GetResponseHeaders(void)
{
    // this is not the file you are looking for...
    if (m_responseType == HTTPResponseUnknown)
    {
        LOG(VB_HTTP, LOG_INFO, QStringLiteral("'%1' not found").arg(m_fullUrl));
        m_responseStatus  = HTTP_NotFound;
        m_responseType    = HTTPResponseJSON;
        m_responseContent = QByteArray("{}\n");
    }

    QByteArray headers;
    QTextStream response(&headers);

    // always respond as HTTP/1.1 unless the client is known to be older
    HTTPProtocol protocol = m_protocol == HTTPOneDotZero ? HTTPOneDotZero : HTTPOneDotOne;

    response << ProtocolToString(protocol) << " " << StatusToString(m_responseStatus) << "\r\n";
    response << "Date: " << QLocale::c().toString(QDateTime::currentDateTimeUtc(), DateFormat) << "\r\n";
    response << "Server: " << MkrHTTPServer::PlatformName() << "\r\n";
    response << "Connection: " << ConnectionToString(m_connection) << "\r\n";
    response << "Cache-Control: private, no-cache, no-store, must-revalidate\r\nExpires: 0\r\nPragma: no-cache\r\n";

    if (m_responseType != HTTPResponseNone)
        response << "Content-Type: " << ResponseTypeToString(m_responseType) << "\r\n";

    if (m_allowed)
        response << "Allow: " << AllowedToString(m_allowed) << "\r\n";
    response << "Content-Length: " << QString::number(m_responseContent.size()) << "\r\n";

    // process any custom headers
    QMap<QString,QString>::const_iterator it = m_responseHeaders.constBegin();
    for ( ; it != m_responseHeaders.constEnd(); ++it)
        response << it.key() << ": " << it.value() << "\r\n";

    response << "\r\n";
    response.flush();
    return headers;
}

void MkrHTTPRequest::Respond(QTcpSocket *Socket)
{
    if (!Socket)
        return;

    QByteArray headers = GetResponseHeaders();

    // send headers
    qint64 headersize = headers.size();
    qint64 sent = Socket->write(headers.constData(), headersize);
    if (headersize != sent)
        LOG(VB_NETWORK, LOG_WARNING, QStringLiteral("Buffer size %1 - but sent %2").arg(headersize).arg(sent));
    else
        LOG(VB_NETWORK, LOG_DEBUG, QStringLiteral("Sent %1 header bytes").arg(sent));

    // send content
    if (!m_responseContent.isEmpty() && m_requestType != HTTPHead)
    {
        qint64 size = m_responseContent.size();
        sent = Socket->write(m_responseContent.constData(), size);
        if (size != sent)
            LOG(VB_NETWORK, LOG_WARNING, QStringLiteral("Buffer size %1 - but sent %2").arg(size).arg(sent));
        else
            LOG(VB_NETWORK, LOG_DEBUG, QStringLiteral("Sent %1 content bytes").arg(sent));
    }

    Socket->flush();
    while (Socket->bytesToWrite() > 0 && Socket->state() == QAbstractSocket::ConnectedState)
        if (!Socket->waitForBytesWritten(1000))
            break;

    LOG(VB_HTTP, LOG_INFO, QStringLiteral("%1 %2 - %3").arg(RequestTypeToString(m_requestType), m_fullUrl,
                                                            StatusToString(m_responseStatus)));

    if (m_connection == HTTPConnectionClose)
        Socket->disconnectFromHost();
}

HTTPRequestType MkrHTTPRequest::RequestTypeFromString(const QString &Type)
{
    if (Type == QStringLiteral("GET"))     return HTTPGet;
    if (Type == QStringLiteral("HEAD"))    return HTTPHead;
    if (Type == QStringLiteral("POST"))    return HTTPPost;
    if (Type == QStringLiteral("PUT"))     return HTTPPut;
    if (Type == QStringLiteral("OPTIONS")) return HTTPOptions;
    if (Type == QStringLiteral("DELETE"))  return HTTPDelete;

    return HTTPUnknownType;
}

QString MkrHTTPRequest::RequestTypeToString(HTTPRequestType Type)
{
    switch (Type)
    {
        case HTTPHead:     return QStringLiteral("HEAD");
        case HTTPGet:      return QStringLiteral("GET");
        case HTTPPost:     return QStringLiteral("POST");
        case HTTPPut:      return QStringLiteral("PUT");
        case HTTPDelete:   return QStringLiteral("DELETE");
        case HTTPOptions:  return QStringLiteral("OPTIONS");
        default:
            break;
    }

    return QStringLiteral("UNKNOWN");
}

HTTPProtocol MkrHTTPRequest::ProtocolFromString(const QString &Protocol)
{
    if (Protocol.startsWith(QStringLiteral("HTTP")))
    {
        if (Protocol.endsWith(QStringLiteral("1.1"))) return HTTPOneDotOne;
        if (Protocol.endsWith(QStringLiteral("1.0"))) return HTTPOneDotZero;
        if (Protocol.endsWith(QStringLiteral("0.9"))) return HTTPZeroDotNine;
    }

    return HTTPUnknownProtocol;
}

QString MkrHTTPRequest::ProtocolToString(HTTPProtocol Protocol)
{
    switch (Protocol)
    {
        case HTTPOneDotOne:       return QStringLiteral("HTTP/1.1");
        case HTTPOneDotZero:      return QStringLiteral("HTTP/1.0");
        case HTTPZeroDotNine:     return QStringLiteral("HTTP/0.9");
        case HTTPUnknownProtocol: return QStringLiteral("Error");
    }

    return QStringLiteral("Error");
}

QString MkrHTTPRequest::StatusToString(HTTPStatus Status)
{
    switch (Status)
    {
        case HTTP_OK:                  return QStringLiteral("200 OK");
        case HTTP_BadRequest:          return QStringLiteral("400 Bad Request");
        case HTTP_NotFound:            return QStringLiteral("404 Not Found");
        case HTTP_MethodNotAllowed:    return QStringLiteral("405 Method Not Allowed");
    }

    return QStringLiteral("Error");
}

QString MkrHTTPRequest::ResponseTypeToString(HTTPResponseType Response)
{
    switch (Response)
    {
        case HTTPResponseNone:             return QStringLiteral("");
        case HTTPResponseJSON:             return QStringLiteral("application/json");
        default: break;
    }

    return QStringLiteral("text/plain");
}

QString MkrHTTPRequest::AllowedToString(int Allowed)
{
    QStringList result;

    if (Allowed & HTTPGet)     result << QStringLiteral("GET");
    if (Allowed & HTTPHead)    result << QStringLiteral("HEAD");
    if (Allowed & HTTPPost)    result << QStringLiteral("POST");
    if (Allowed & HTTPPut)     result << QStringLiteral("PUT");
    if (Allowed & HTTPDelete)  result << QStringLiteral("DELETE");
    if (Allowed & HTTPOptions) result << QStringLiteral("OPTIONS");

    return result.join(QStringLiteral(", "));
}

QString MkrHTTPRequest::ConnectionToString(HTTPConnection Connection)
{
    switch (Connection)
    {
        case HTTPConnectionClose:     return QStringLiteral("close");
        case HTTPConnectionKeepAlive: return QStringLiteral("keep-alive");
    }

    return QString();
}
