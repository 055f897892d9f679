/* Class MkrHTTPReader
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
#include "mkrhttpreader.h"

/*! \class MkrHTTPReader
 *  \brief A convenience class to read HTTP requests from a QTcpSocket
 *
 * The request line and headers are kept. Any request body is read (so the next request on a
 * persistent connection starts at the right place) and thrown away - no lookup takes a body.
*/
MkrHTTPReader::MkrHTTPReader()
  : m_ready(false),
    m_requestStarted(false),
    m_headersComplete(false),
    m_headersRead(0),
    m_contentLength(0),
    m_contentReceived(0),
    m_method(),
    m_headers()
{
}

void MkrHTTPReader::TakeRequest(QMap<QString,QString> &Headers)
{
    Headers   = m_headers;
    m_headers = QMap<QString,QString>();
}

bool MkrHTTPReader::IsReady(void) const
{
    return m_ready;
}

QString MkrHTTPReader::GetMethod(void) const
{
    return m_method;
}

bool MkrHTTPReader::HeadersComplete(void) const
{
    return m_headersComplete;
}

///\brief Reset the read state
void MkrHTTPReader::Reset(void)
{
    m_ready           = false;
    m_requestStarted  = false;
    m_headersComplete = false;
    m_headersRead     = 0;
    m_contentLength   = 0;
    m_contentReceived = 0;
    m_method          = QString();
    m_headers         = QMap<QString,QString>();
}

/*! \brief Read and parse data from the given socket.
 *
 * The request line (e.g. GET /machinekit HTTP/1.1) and headers will be split out
 * for further processing.
 *
 * \returns false if the connection should be dropped.
 */
bool MkrHTTPReader::Read(QTcpSocket *Socket)
{
    if (!Socket)
        return false;

    if (Socket->state() != QAbstractSocket::ConnectedState)
        return false;

    // sanity check
    if (m_headersRead >= MKR_HTTP_MAX_HEADERS)
    {
        LOG(VB_NETWORK, LOG_ERR, QString("Read %1 lines of headers - aborting").arg(MKR_HTTP_MAX_HEADERS));
        return false;
    }

    // read headers
    if (!m_headersComplete)
    {
        // filter out invalid HTTP early
        if (!m_requestStarted && Socket->bytesAvailable() >= 7 /*OPTIONS is longest valid type*/)
        {
            QByteArray buf(7, ' ');
            (void)Socket->peek(buf.data(), 7);
            if (!buf.startsWith("GET"))
                if (!buf.startsWith("HEAD"))
                    if (!buf.startsWith("OPTIONS"))
                        if (!buf.startsWith("PUT"))
                            if(!buf.startsWith("POST"))
                                if (!buf.startsWith("DELETE"))
                                {
                                    LOG(VB_NETWORK, LOG_ERR, QString("Invalid HTTP start ('%1')- aborting").arg(buf.constData()));
                                    return false;
                                }
        }

        // a line this long without a line ending will never be valid
        if (!Socket->canReadLine() && Socket->bytesAvailable() > MKR_HTTP_MAX_HEADER_SIZE)
        {
            LOG(VB_NETWORK, LOG_ERR, "Header is too long - aborting");
            return false;
        }

        while (Socket->canReadLine() && m_headersRead < MKR_HTTP_MAX_HEADERS)
        {
            QByteArray line = Socket->readLine().trimmed();

            // an unusually long header is likely to mean this is not a valid HTTP message
            if (line.size() > MKR_HTTP_MAX_HEADER_SIZE)
            {
                LOG(VB_NETWORK, LOG_ERR, "Header is too long - aborting");
                return false;
            }

            if (line.isEmpty())
            {
                // tolerate blank lines before the request line
                if (!m_requestStarted)
                    continue;

                m_headersRead = 0;
                m_headersComplete = true;
                break;
            }

            if (!m_requestStarted)
            {
                LOG(VB_NETWORK, LOG_DEBUG, line);
                m_method = line;
            }
            else
            {
                m_headersRead++;
                int index = line.indexOf(":");

                if (index > 0)
                {
                    QByteArray key   = line.left(index).trimmed();
                    QByteArray value = line.mid(index + 1).trimmed();

                    if (qstricmp(key.constData(), "Content-Length") == 0)
                        m_contentLength = value.toULongLong();

                    LOG(VB_NETWORK, LOG_DEBUG, QString("%1: %2").arg(key.data()).arg(value.data()));

                    m_headers.insert(key, value);
                }
            }

            m_requestStarted = true;
        }
    }

    // loop if we need more header data
    if (!m_headersComplete)
        return m_headersRead < MKR_HTTP_MAX_HEADERS;

    // abort early if needed
    if (Socket->state() != QAbstractSocket::ConnectedState)
        return false;

    // skip content
    while ((m_contentReceived < m_contentLength) && Socket->bytesAvailable() &&
           Socket->state() == QAbstractSocket::ConnectedState)
    {
        static quint64 MAX_CHUNK = 32 * 1024;
        QByteArray discard = Socket->read(qMin(m_contentLength - m_contentReceived, MAX_CHUNK));
        if (discard.isEmpty())
            break;
        m_contentReceived += discard.size();
    }

    // loop if we need more data
    if (m_contentReceived < m_contentLength)
        return true;

    if (m_contentLength)
        LOG(VB_NETWORK, LOG_DEBUG, QString("Ignored %1 bytes of request content").arg(m_contentLength));

    m_ready = true;
    return true;
}
