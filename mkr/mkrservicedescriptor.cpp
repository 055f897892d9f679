/* Class MkrServiceDescriptor
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
#include "mkrlocaldefs.h"
#include "mkrservicedescriptor.h"

/*! \class MkrServiceDescriptor
 *  \brief The fixed shape of one resolved machinekit service advertisement.
 *
 * A descriptor is built once from the text record attributes of an advertisement (with the
 * raw service name re-attached as 'name') and never modified afterwards. The four attributes
 * 'service', 'instance', 'uuid' and 'dsn' must be present and non-empty for the descriptor
 * to be valid. Anything else in the text record is kept as is and handed back by ToVariant.
*/
MkrServiceDescriptor::MkrServiceDescriptor()
  : m_valid(false),
    m_hasName(false),
    m_name(),
    m_serviceId(),
    m_instanceId(),
    m_ownerUuid(),
    m_connectionUri(),
    m_extras()
{
}

MkrServiceDescriptor::MkrServiceDescriptor(const QVariantMap &Attributes)
  : m_valid(false),
    m_hasName(Attributes.contains(MKR_TXT_NAME)),
    m_name(Attributes.value(MKR_TXT_NAME).toString()),
    m_serviceId(Attributes.value(MKR_TXT_SERVICE).toString()),
    m_instanceId(Attributes.value(MKR_TXT_INSTANCE).toString()),
    m_ownerUuid(Attributes.value(MKR_TXT_UUID).toString()),
    m_connectionUri(Attributes.value(MKR_TXT_DSN).toString()),
    m_extras(Attributes)
{
    m_extras.remove(MKR_TXT_NAME);
    m_extras.remove(MKR_TXT_SERVICE);
    m_extras.remove(MKR_TXT_INSTANCE);
    m_extras.remove(MKR_TXT_UUID);
    m_extras.remove(MKR_TXT_DSN);

    m_valid = !m_serviceId.isEmpty() && !m_instanceId.isEmpty() &&
              !m_ownerUuid.isEmpty() && !m_connectionUri.isEmpty();
}

bool MkrServiceDescriptor::IsValid(void) const
{
    return m_valid;
}

QString MkrServiceDescriptor::GetName(void) const
{
    return m_name;
}

QString MkrServiceDescriptor::GetServiceId(void) const
{
    return m_serviceId;
}

QString MkrServiceDescriptor::GetInstanceId(void) const
{
    return m_instanceId;
}

QString MkrServiceDescriptor::GetOwnerUuid(void) const
{
    return m_ownerUuid;
}

QString MkrServiceDescriptor::GetConnectionUri(void) const
{
    return m_connectionUri;
}

QVariantMap MkrServiceDescriptor::GetExtras(void) const
{
    return m_extras;
}

/// Return the attributes with exactly the keys that were received, all values as strings.
QVariantMap MkrServiceDescriptor::ToVariant(void) const
{
    QVariantMap result;
    QVariantMap::const_iterator it = m_extras.constBegin();
    for ( ; it != m_extras.constEnd(); ++it)
        result.insert(it.key(), it.value().toString());

    if (m_hasName)
        result.insert(MKR_TXT_NAME, m_name);
    if (!m_serviceId.isEmpty())
        result.insert(MKR_TXT_SERVICE, m_serviceId);
    if (!m_instanceId.isEmpty())
        result.insert(MKR_TXT_INSTANCE, m_instanceId);
    if (!m_ownerUuid.isEmpty())
        result.insert(MKR_TXT_UUID, m_ownerUuid);
    if (!m_connectionUri.isEmpty())
        result.insert(MKR_TXT_DSN, m_connectionUri);
    return result;
}
