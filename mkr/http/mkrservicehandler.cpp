/* Class MkrServiceHandler
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
#include "mkrlocaldefs.h"
#include "mkrregistry.h"
#include "mkrjsonserialiser.h"
#include "mkrservicehandler.h"

#define MKR_SERVICE_ALLOWED (HTTPGet | HTTPHead | HTTPOptions)

/*! \class MkrServiceHandler
 *  \brief Answers service lookups from the registry.
 *
 * Registered for '/', so '/X' arrives with an empty path remainder and method 'X'. The key
 * 'machinekit' returns every known service. Any other key is tried as a serviceId and then
 * as an instance or owner UUID. Results are a JSON object keyed by serviceId.
*/
MkrServiceHandler::MkrServiceHandler(MkrRegistry *Registry)
  : MkrHTTPHandler(QStringLiteral("/"), QStringLiteral("services")),
    m_registry(Registry)
{
}

QVariantMap MkrServiceHandler::Lookup(const QString &Key) const
{
    QVariantMap result;
    if (!m_registry)
        return result;

    QMap<QString,MkrServiceDescriptor> found;
    MkrServiceDescriptor descriptor;

    if (Key == MKR_AGGREGATE_PATH)
        found = m_registry->LookupAll();
    else if (m_registry->LookupByServiceId(Key, descriptor))
        found.insert(descriptor.GetServiceId(), descriptor);
    else
        found = m_registry->LookupByOwnerKey(Key);

    QMap<QString,MkrServiceDescriptor>::const_iterator it = found.constBegin();
    for ( ; it != found.constEnd(); ++it)
        result.insert(it.key(), it.value().ToVariant());
    return result;
}

void MkrServiceHandler::ProcessHTTPRequest(const QString &PeerAddress, int PeerPort, const QString &LocalAddress, int LocalPort, MkrHTTPRequest &Request)
{
    (void)LocalAddress;
    (void)LocalPort;

    HTTPRequestType type = Request.GetHTTPRequestType();

    if (type == HTTPOptions)
    {
        HandleOptions(Request, MKR_SERVICE_ALLOWED);
        return;
    }

    if (type != HTTPGet && type != HTTPHead)
    {
        HandleNotAllowed(Request, MKR_SERVICE_ALLOWED);
        return;
    }

    QVariantMap result = Lookup(Request.GetMethod());
    LOG(VB_HTTP, LOG_DEBUG, QStringLiteral("Lookup '%1' from %2:%3 matched %4")
        .arg(Request.GetMethod(), PeerAddress).arg(PeerPort).arg(result.size()));

    MkrJSONSerialiser serialiser;
    QByteArray content;
    serialiser.Serialise(content, result);

    Request.SetStatus(result.isEmpty() ? HTTP_NotFound : HTTP_OK);
    Request.SetResponseType(serialiser.ResponseType());
    Request.SetResponseContent(content);
}
